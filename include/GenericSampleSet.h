// SPDX-License-Identifier: LGPL-2.0-or-later
// Copyright © EDF R&D / TELECOM ParisTech (ENST-TSI)

#pragma once

//Local
#include "GSGeom.h"
#include "ScalarField.h"

//System
#include <algorithm>
#include <string>

namespace GeoStatsCoreLib
{
	//! A generic set of spatial samples with index-based access
	/** Samples are located in 1D, 2D or 3D (unused coordinates are 0)
		and carry the attribute columns of the root SampleSet.
	**/
	class GS_CORE_LIB_API GenericSampleSet
	{
	public:

		//! Default constructor
		GenericSampleSet() = default;

		//! Default destructor
		virtual ~GenericSampleSet() = default;

		//! Returns the number of samples
		virtual unsigned size() const = 0;

		//! Returns the dimension of the locations (1, 2 or 3)
		virtual unsigned dimension() const = 0;

		//! Returns the location of the ith sample
		/** \param index of the requested sample (between 0 and the set size minus 1)
		**/
		virtual const GSVector3d& getPoint(unsigned index) const = 0;

		//! Returns the index of the ith sample in the root SampleSet
		virtual unsigned getRootIndex(unsigned index) const = 0;

		//! Returns the number of attribute columns
		virtual unsigned getNumberOfScalarFields() const = 0;

		//! Returns an attribute column (of the root SampleSet)
		/** \warning Column values are indexed by root indexes (see getRootIndex)
			\return nullptr if the index is invalid
		**/
		virtual const ScalarField* getScalarField(int index) const = 0;

		//! Returns the index of an attribute column by its name (or -1 if not found)
		virtual int getScalarFieldIndexByName(const std::string& name) const = 0;

		//! Returns the value of a given column for the ith sample
		inline ScalarType getValue(int fieldIndex, unsigned index) const
		{
			return getScalarField(fieldIndex)->getValue(getRootIndex(index));
		}

		//! Computes the bounding box of the sample locations
		/** \return false if the set is empty
		**/
		inline bool getBoundingBox(GSVector3d& bbMin, GSVector3d& bbMax) const
		{
			unsigned count = size();
			if (count == 0)
			{
				bbMin = bbMax = GSVector3d();
				return false;
			}

			bbMin = bbMax = getPoint(0);
			for (unsigned i = 1; i < count; ++i)
			{
				const GSVector3d& P = getPoint(i);
				for (unsigned d = 0; d < 3; ++d)
				{
					bbMin.u[d] = std::min(bbMin.u[d], P.u[d]);
					bbMax.u[d] = std::max(bbMax.u[d], P.u[d]);
				}
			}

			return true;
		}
	};
}
