// SPDX-License-Identifier: LGPL-2.0-or-later
// Copyright © EDF R&D / TELECOM ParisTech (ENST-TSI)

#pragma once

//Local
#include "GenericSampleSet.h"

//STL
#include <vector>

namespace GeoStatsCoreLib
{
	//! A set of spatial samples with an unlimited number of attribute columns
	class GS_CORE_LIB_API SampleSet : public GenericSampleSet
	{
	public:

		//! Default constructor
		/** \param dimension dimension of the locations (1, 2 or 3)
		**/
		explicit SampleSet(unsigned dimension = 3);

		//! Builds a set from raw coordinates
		/** \param coordinates N x dimension coordinates (sample-major)
			\param dimension dimension of the locations (1, 2 or 3)
			\return success
		**/
		bool setCoordinates(const std::vector<double>& coordinates, unsigned dimension);

		// Inherited from GenericSampleSet
		inline unsigned size() const override { return static_cast<unsigned>(m_points.size()); }
		inline unsigned dimension() const override { return m_dimension; }
		inline const GSVector3d& getPoint(unsigned index) const override { return m_points[index]; }
		inline unsigned getRootIndex(unsigned index) const override { return index; }
		inline unsigned getNumberOfScalarFields() const override { return static_cast<unsigned>(m_scalarFields.size()); }
		const ScalarField* getScalarField(int index) const override;
		int getScalarFieldIndexByName(const std::string& name) const override;

		//! Reserves memory for the locations
		/** \return success
		**/
		bool reserve(unsigned count);

		//! Adds a sample location
		/** Attribute columns must then be (re)filled.
			\warning Coordinates beyond the set dimension are ignored (set to 0)
		**/
		void addPoint(const GSVector3d& P);

		//! Non-const access to an attribute column
		ScalarField* getScalarField(int index);

		//! Adds a numerical attribute column
		/** \param name column name (must be unique)
			\param values one value per sample (NaN = missing)
			\return the column index (or -1 if an error occurred)
		**/
		int addScalarField(const std::string& name, const std::vector<ScalarType>& values);

		//! Adds a categorical attribute column
		/** Levels are the distinct labels, sorted in lexicographic order.
			\param name column name (must be unique)
			\param labels one label per sample (empty = missing)
			\return the column index (or -1 if an error occurred)
		**/
		int addCategoricalField(const std::string& name, const std::vector<std::string>& labels);

		//! Adds a categorical attribute column from level codes
		/** \param name column name (must be unique)
			\param codes one level code per sample (negative = missing)
			\param levels level labels
			\return the column index (or -1 if an error occurred)
		**/
		int addCategoricalField(const std::string& name, const std::vector<int>& codes, const std::vector<std::string>& levels);

		//! Expands a categorical column into indicator columns (one per level)
		/** Indicator columns are named 'column:level'. Missing values stay missing.
			\param fieldIndex categorical column index
			\param[out] indicatorIndexes indexes of the new columns
			\return false if the column is not categorical or if an error occurred
		**/
		bool computeIndicators(int fieldIndex, std::vector<int>& indicatorIndexes);

		//! Deletes all attribute columns
		inline void deleteAllScalarFields() { m_scalarFields.clear(); }

	protected:

		//! Checks a new column (size and name)
		bool checkNewField(const std::string& name, size_t count) const;

		//! Dimension of the locations
		unsigned m_dimension;

		//! Sample locations
		std::vector<GSVector3d> m_points;

		//! Attribute columns
		std::vector<ScalarField> m_scalarFields;
	};
}
