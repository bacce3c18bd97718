// SPDX-License-Identifier: LGPL-2.0-or-later
// Copyright © EDF R&D / TELECOM ParisTech (ENST-TSI)

#pragma once

//Local
#include "GenericSampleSet.h"

//STL
#include <vector>

namespace GeoStatsCoreLib
{
	//! A very simple sample set (no point coordinates nor attribute duplication)
	/** Implements the GenericSampleSet interface by storing references to
		the samples of an associated set. Used to represent the subsets of
		spatial partitions.
	**/
	class GS_CORE_LIB_API ReferenceSampleSet : public GenericSampleSet
	{
	public:

		//! Default constructor
		/** \param associatedSet the associated set (must outlive this subset)
		**/
		explicit ReferenceSampleSet(const GenericSampleSet* associatedSet);

		//! Copy constructor
		ReferenceSampleSet(const ReferenceSampleSet& refSet) = default;

		//! Subset with all the samples of the associated set
		/** \return success (false if not enough memory)
		**/
		bool addAllPoints();

		// Inherited from GenericSampleSet
		inline unsigned size() const override { return static_cast<unsigned>(m_theIndexes.size()); }
		inline unsigned dimension() const override { return m_theAssociatedSet->dimension(); }
		inline const GSVector3d& getPoint(unsigned index) const override { return m_theAssociatedSet->getPoint(m_theIndexes[index]); }
		inline unsigned getRootIndex(unsigned index) const override { return m_theAssociatedSet->getRootIndex(m_theIndexes[index]); }
		inline unsigned getNumberOfScalarFields() const override { return m_theAssociatedSet->getNumberOfScalarFields(); }
		inline const ScalarField* getScalarField(int index) const override { return m_theAssociatedSet->getScalarField(index); }
		inline int getScalarFieldIndexByName(const std::string& name) const override { return m_theAssociatedSet->getScalarFieldIndexByName(name); }

		//! Clears the subset
		inline void clear() { m_theIndexes.clear(); }

		//! Reserves memory
		/** \return success
		**/
		bool reserve(unsigned n);

		//! Adds a sample (index of the associated set)
		/** \return success (false if not enough memory)
		**/
		bool addPointIndex(unsigned globalIndex);

		//! Returns the index of the ith sample in the associated set
		inline unsigned getPointGlobalIndex(unsigned localIndex) const { return m_theIndexes[localIndex]; }

		//! Returns the associated set
		inline const GenericSampleSet* getAssociatedSet() const { return m_theAssociatedSet; }

	protected:

		//! Indexes of the samples (in the associated set)
		std::vector<unsigned> m_theIndexes;

		//! Associated set
		const GenericSampleSet* m_theAssociatedSet;
	};
}
