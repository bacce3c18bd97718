// SPDX-License-Identifier: LGPL-2.0-or-later
// Copyright © EDF R&D / TELECOM ParisTech (ENST-TSI)

#pragma once

//Local
#include "GSConst.h"

//System
#include <vector>
#include <string>

namespace GeoStatsCoreLib
{
	//! An attribute column (to be associated to a sample set)
	/** A monodimensional array of scalar values.

		Missing values are represented by GeoStatsCoreLib::NAN_VALUE (so that
		they are distinguishable from a valid zero).

		A categorical column stores the (0-based) level code of each sample
		and the labels of its levels.
	**/
	class ScalarField : protected std::vector<ScalarType>
	{
	public:

		//! Shortcut to the (protected) std::vector::size() method
		using std::vector<ScalarType>::size;
		//! Shortcut to the (protected) std::vector::reserve() method
		using std::vector<ScalarType>::reserve;
		//! Shortcut to the (protected) std::vector::empty() method
		using std::vector<ScalarType>::empty;
		//! Shortcut to the (protected) std::vector::data() method
		using std::vector<ScalarType>::data;

		//! Default constructor
		/** \param name scalar field name
		**/
		GS_CORE_LIB_API explicit ScalarField(const std::string& name = std::string());

		//! Constructor from values
		/** \param name scalar field name
			\param values values (NaN = missing)
			\warning May throw a std::bad_alloc exception
		**/
		GS_CORE_LIB_API ScalarField(const std::string& name, const std::vector<ScalarType>& values);

		//! Sets scalar field name
		GS_CORE_LIB_API void setName(const std::string& name);

		//! Returns scalar field name
		inline const std::string& getName() const { return m_name; }

		//! Returns the specific NaN value
		static inline ScalarType NaN() { return NAN_VALUE; }

		//! Clears the scalar field
		inline void clear()
		{
			std::vector<ScalarType>::clear();
			m_levels.clear();
		}

		//! Computes the mean value (and optionally the variance value) of the scalar field
		/** Missing values are ignored.
			\param mean a field to store the mean value
			\param variance if not void, the variance will be computed and stored here
		**/
		GS_CORE_LIB_API void computeMeanAndVariance(ScalarType& mean, ScalarType* variance = nullptr) const;

		//! Determines the min and max values
		GS_CORE_LIB_API void computeMinAndMax();

		//! Returns whether a scalar value is valid or not
		static inline bool ValidValue(ScalarType value) { return std::isfinite(value); }

		//! Sets the value as 'missing' (i.e. GeoStatsCoreLib::NAN_VALUE)
		inline void flagValueAsInvalid(std::size_t index) { (*this)[index] = NAN_VALUE; }

		//! Returns the number of valid values in this scalar field
		GS_CORE_LIB_API std::size_t countValidValues() const;

		//! Returns the minimum value
		inline ScalarType getMin() const { return m_minVal; }
		//! Returns the maximum value
		inline ScalarType getMax() const { return m_maxVal; }

		//! Reserves memory (no exception thrown)
		GS_CORE_LIB_API bool reserveSafe(std::size_t count);
		//! Resizes memory (no exception thrown)
		GS_CORE_LIB_API bool resizeSafe(std::size_t count, bool initNewElements = false, ScalarType valueForNewElements = 0);

		inline ScalarType getValue(std::size_t index) const { return (*this)[index]; }
		inline void setValue(std::size_t index, ScalarType value) { (*this)[index] = value; }
		inline void addElement(ScalarType value) { push_back(value); }

		//! Returns whether this column is categorical
		inline bool isCategorical() const { return !m_levels.empty(); }

		//! Returns the labels of the levels (categorical column only)
		inline const std::vector<std::string>& getLevels() const { return m_levels; }

		//! Sets the labels of the levels (turns this column into a categorical one)
		/** Values must then be valid level codes (0 to levels.size()-1) or NaN.
		**/
		inline void setLevels(const std::vector<std::string>& levels) { m_levels = levels; }

		//! Returns the level code of a given sample (or -1 if missing or not a valid code)
		GS_CORE_LIB_API int getLevelCode(std::size_t index) const;

	protected: //members

		//! Scalar field name
		std::string m_name;

		//! Level labels (categorical column only)
		std::vector<std::string> m_levels;

	private:
		//! Minimum value
		ScalarType m_minVal;
		//! Maximum value
		ScalarType m_maxVal;
	};
}
