// SPDX-License-Identifier: LGPL-2.0-or-later
// Copyright © EDF R&D / TELECOM ParisTech (ENST-TSI)

#pragma once

//Local
#include "EmpiricalFunctionTools.h"

//STL
#include <vector>

namespace GeoStatsCoreLib
{
	//! Anisotropy sweep parameters
	struct SweepParams
	{
		SweepParams()
			: normal(0, 0, 1)
			, nangs(DEFAULT_ANGLE_COUNT)
			, ptol(0.5)
			, dtol(0.5)
		{}

		//! Normal of the plane of variation (3D samples only)
		GSVector3d normal;
		//! Number of angles (> 1)
		unsigned nangs;
		//! Tolerance of the plane partition (3D samples only)
		double ptol;
		//! Tolerance of the direction partitions
		double dtol;
	};

	//! Empirical functions along all the directions of a plane
	/** Varioplane (half circle, variograms are symmetric) or transioplane
		(full circle). All the functions share the same bins and the lags of
		the first direction are used as the common polar radii.
	**/
	class GS_CORE_LIB_API AnisotropySweep
	{
	public:

		//! Default constructor (empty sweep)
		AnisotropySweep() = default;

		//! Computes the varioplane of one or two variables
		/** \param set samples (2D, or 3D with a plane of variation)
			\param field1 first column
			\param field2 second column (same as the first for a simple variogram)
			\param sweepParams sweep parameters
			\param params empirical variogram parameters
			\param[out] sweep output
			\return error code
		**/
		static ErrorCode ComputeVarioplane(	const GenericSampleSet& set,
											int field1,
											int field2,
											const SweepParams& sweepParams,
											const EmpiricalParams& params,
											AnisotropySweep& sweep);

		//! Computes the transioplane of a categorical variable
		static ErrorCode ComputeTransioplane(	const GenericSampleSet& set,
												int field,
												const SweepParams& sweepParams,
												const EmpiricalParams& params,
												AnisotropySweep& sweep);

		//! Returns the kind of the swept functions
		inline EmpiricalFunction::Kind kind() const { return m_kind; }
		//! Returns the number of angles
		inline unsigned angleCount() const { return static_cast<unsigned>(m_angles.size()); }
		//! Returns the angles (radians)
		inline const std::vector<double>& angles() const { return m_angles; }
		//! Returns the common lags (polar radii)
		inline const std::vector<double>& lags() const { return m_lags; }
		//! Returns the functions (one per angle)
		inline const std::vector<EmpiricalFunction>& functions() const { return m_functions; }
		//! Returns the ordinates of a given channel along a given angle
		inline const std::vector<double>& ordinates(unsigned angleIndex, unsigned channel = 0) const { return m_functions[angleIndex].ordinates(channel); }

	protected:

		//! Common part of the varioplane and transioplane computations
		static ErrorCode Compute(	const GenericSampleSet& set,
									EmpiricalFunction::Kind kind,
									int field1,
									int field2,
									const SweepParams& sweepParams,
									const EmpiricalParams& params,
									AnisotropySweep& sweep);

		//! Kind of the functions
		EmpiricalFunction::Kind m_kind = EmpiricalFunction::VARIOGRAM;
		//! Angles
		std::vector<double> m_angles;
		//! Common lags
		std::vector<double> m_lags;
		//! Functions
		std::vector<EmpiricalFunction> m_functions;
	};
}
