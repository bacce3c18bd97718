// SPDX-License-Identifier: LGPL-2.0-or-later
// Copyright © EDF R&D / TELECOM ParisTech (ENST-TSI)

#pragma once

//Local
#include "EmpiricalAccumulator.h"
#include "EmpiricalFunction.h"
#include "PartitionTools.h"

//STL
#include <string>
#include <utility>
#include <vector>

namespace GeoStatsCoreLib
{
	//! Empirical functions computation parameters
	struct EmpiricalParams
	{
		EmpiricalParams()
			: nlags(DEFAULT_LAG_COUNT)
			, maxlag(NAN_VALUE)
			, estimator(INVALID_ESTIMATOR)
			, algorithm(BALL_SEARCH)
		{}

		//! Number of lags
		unsigned nlags;
		//! Maximum lag (NaN = default, see EmpiricalFunctionTools::DefaultMaxLag)
		double maxlag;
		//! Distance function
		DistanceFunction distance;
		//! Estimator (INVALID_ESTIMATOR = MATHERON for variograms, CARLE for transiograms)
		ESTIMATOR_TYPE estimator;
		//! Pair search algorithm
		SEARCH_ALGORITHM algorithm;
		//! Unit of the lags (tag carried by the output function)
		std::string lagUnit;
		//! Unit of the ordinates (tag carried by the output function)
		std::string valueUnit;
	};

	//! Empirical variograms and transiograms
	class GS_CORE_LIB_API EmpiricalFunctionTools : public GSToolbox
	{
	public:

		//! Returns the default maximum lag of a sample set
		/** One tenth (variograms) or one half (transiograms) of the smallest
			positive side of the bounding box.
			\return 0 if all samples are coincident
		**/
		static double DefaultMaxLag(const GenericSampleSet& set, EmpiricalFunction::Kind kind);

		//! Resolves the defaulted parameters (maximum lag, estimator)
		/** \param set samples (used to compute the default maximum lag)
			\param kind function kind
			\param params input parameters
			\param[out] resolved parameters with every default replaced
			\return SUCCESS or ERROR_UNKNOWN_ESTIMATOR if the estimator doesn't suit the function kind
		**/
		static ErrorCode ResolveParams(	const GenericSampleSet& set,
										EmpiricalFunction::Kind kind,
										const EmpiricalParams& params,
										EmpiricalParams& resolved);

		//! Computes the empirical variogram of a variable
		static ErrorCode ComputeVariogram(	const GenericSampleSet& set,
											int field,
											const EmpiricalParams& params,
											EmpiricalFunction& variogram);

		//! Computes the empirical cross-variogram of two variables
		static ErrorCode ComputeCrossVariogram(	const GenericSampleSet& set,
												int field1,
												int field2,
												const EmpiricalParams& params,
												EmpiricalFunction& variogram);

		//! Computes several (cross-)variograms in a single pass over the pairs
		/** \param set samples
			\param pairs pairs of columns
			\param params parameters
			\param[out] variograms one variogram per pair of columns
			\return error code
		**/
		static ErrorCode ComputeVariograms(	const GenericSampleSet& set,
											const std::vector< std::pair<int, int> >& pairs,
											const EmpiricalParams& params,
											std::vector<EmpiricalFunction>& variograms);

		//! Computes the empirical transiogram of a categorical variable
		/** Ordinates are given for each ordered pair of levels (k x k channels).
		**/
		static ErrorCode ComputeTransiogram(const GenericSampleSet& set,
											int field,
											const EmpiricalParams& params,
											EmpiricalFunction& transiogram);

		//! Computes a (cross-)variogram along a direction
		/** The samples are grouped along lines parallel to the direction
			(PartitionTools::DirectionPartition), then the per-line functions are merged.
			\param set samples
			\param field1 first column
			\param field2 second column (same as the first for a simple variogram)
			\param direction direction
			\param tolerance radius of the cylinders around the lines
			\param params parameters
			\param[out] variogram output
			\return error code
		**/
		static ErrorCode ComputeDirectionalVariogram(	const GenericSampleSet& set,
														int field1,
														int field2,
														const GSVector3d& direction,
														double tolerance,
														const EmpiricalParams& params,
														EmpiricalFunction& variogram);

		//! Computes a (cross-)variogram inside planes
		/** The samples are grouped in slabs orthogonal to the normal
			(PartitionTools::PlanePartition), then the per-slab functions are merged.
		**/
		static ErrorCode ComputePlanarVariogram(const GenericSampleSet& set,
												int field1,
												int field2,
												const GSVector3d& normal,
												double tolerance,
												const EmpiricalParams& params,
												EmpiricalFunction& variogram);

		//! Computes a transiogram along a direction
		/** Pairs are oriented along the direction.
		**/
		static ErrorCode ComputeDirectionalTransiogram(	const GenericSampleSet& set,
														int field,
														const GSVector3d& direction,
														double tolerance,
														const EmpiricalParams& params,
														EmpiricalFunction& transiogram);

		//! Computes a transiogram inside planes
		static ErrorCode ComputePlanarTransiogram(	const GenericSampleSet& set,
													int field,
													const GSVector3d& normal,
													double tolerance,
													const EmpiricalParams& params,
													EmpiricalFunction& transiogram);

		//! Computes a function from a partition of a sample set
		/** Each subset is processed independently (in parallel if TBB is
			available), then the per-subset functions are merged in the order of
			the partition. Subsets with less than two samples are ignored.
			\param set samples (used to resolve the default maximum lag)
			\param parts partition of the set
			\param kind function kind
			\param field1 first column
			\param field2 second column (ignored for transiograms)
			\param params parameters
			\param orientation orientation of the pairs (null vector = unoriented)
			\param[out] function output
			\return error code
		**/
		static ErrorCode ComputeFromPartition(	const GenericSampleSet& set,
												const PartitionTools::Partition& parts,
												EmpiricalFunction::Kind kind,
												int field1,
												int field2,
												const EmpiricalParams& params,
												const GSVector3d& orientation,
												EmpiricalFunction& function);

		//! Computes the empirical variogram of raw coordinates and values
		/** \param coordinates coordinates (dimension values per sample)
			\param dimension dimension of the coordinates (1, 2 or 3)
			\param values one value per sample (NaN = missing)
			\param params parameters
			\param[out] variogram output
			\return error code
		**/
		static ErrorCode ComputeVariogramFromArrays(const std::vector<double>& coordinates,
													unsigned dimension,
													const std::vector<double>& values,
													const EmpiricalParams& params,
													EmpiricalFunction& variogram);

	protected:

		//! Computes a function on a single set with already resolved parameters
		static ErrorCode ComputeResolved(	const GenericSampleSet& set,
											EmpiricalFunction::Kind kind,
											int field1,
											int field2,
											const EmpiricalParams& resolved,
											const GSVector3d& orientation,
											EmpiricalFunction& function);

		//! Builds the variable pairs (channels) of a function
		static ErrorCode GetVariablePairs(	const GenericSampleSet& set,
											EmpiricalFunction::Kind kind,
											int field1,
											int field2,
											std::vector<EmpiricalAccumulator::VariablePair>& pairs,
											unsigned& levelCount);

		//! Builds a function from accumulated sums
		static ErrorCode BuildFunction(	EmpiricalFunction::Kind kind,
										const EmpiricalParams& resolved,
										unsigned levelCount,
										const std::vector<EmpiricalAccumulator::ChannelSums>& sums,
										std::size_t firstChannel,
										EmpiricalFunction& function);
	};
}
