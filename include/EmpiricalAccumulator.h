// SPDX-License-Identifier: LGPL-2.0-or-later
// Copyright © EDF R&D / TELECOM ParisTech (ENST-TSI)

#pragma once

//Local
#include "DistanceFunction.h"
#include "EmpiricalEstimators.h"
#include "GenericSampleSet.h"
#include "GSToolbox.h"

//STL
#include <string>
#include <vector>

namespace GeoStatsCoreLib
{
	//! Pair search algorithms
	enum SEARCH_ALGORITHM
	{
		FULL_SEARCH = 0,	//!< Exhaustive search (all pairs)
		BALL_SEARCH,		//!< Neighbors inside the maximum lag ball (kd-tree)
		INVALID_SEARCH
	};

	//! Accumulation of pairwise statistics in lag bins
	/** Both search algorithms give exactly the same bins: the ball search
		is only faster when the maximum lag is small compared to the extent
		of the samples.
	**/
	class GS_CORE_LIB_API EmpiricalAccumulator : public GSToolbox
	{
	public:

		//! Variable pair (channel) to accumulate
		/** A variable with a valid level index is replaced by the indicator
			of this level (categorical column). Missing values are NaN.
		**/
		struct VariablePair
		{
			VariablePair(int _field1 = -1, int _field2 = -1, int _level1 = -1, int _level2 = -1)
				: field1(_field1)
				, field2(_field2)
				, level1(_level1)
				, level2(_level2)
			{}

			//! First column index
			int field1;
			//! Second column index
			int field2;
			//! Level of the first column (indicator) or -1
			int level1;
			//! Level of the second column (indicator) or -1
			int level2;
		};

		//! Accumulation parameters
		struct Params
		{
			Params()
				: nlags(20)
				, maxlag(0.0)
				, estimator(MATHERON)
				, algorithm(BALL_SEARCH)
				, orientation(0, 0, 0)
			{}

			//! Number of lags
			unsigned nlags;
			//! Maximum lag
			double maxlag;
			//! Distance function
			DistanceFunction distance;
			//! Estimator
			ESTIMATOR_TYPE estimator;
			//! Pair search algorithm
			SEARCH_ALGORITHM algorithm;
			//! Orientation of the pairs (null vector = unoriented)
			/** Oriented pairs go from the sample with the lowest projection on
				this direction (tail) to the other one (head).
			**/
			GSVector3d orientation;
		};

		//! Accumulated sums of a channel
		struct ChannelSums
		{
			//! Pair counts per bin
			std::vector<std::size_t> counts;
			//! Sum of lags per bin
			std::vector<double> lagSums;
			//! Sum of term values per bin
			std::vector<double> valueSums;
			//! Sum of term weights per bin
			std::vector<double> weightSums;
		};

		//! Returns the search algorithm corresponding to a name ("full" or "ball")
		/** \param name algorithm name (case insensitive)
			\param[out] algorithm algorithm
			\return SUCCESS or ERROR_UNKNOWN_ALGORITHM
		**/
		static ErrorCode AlgorithmFromName(const std::string& name, SEARCH_ALGORITHM& algorithm);

		//! Returns the name of a search algorithm
		static const char* AlgorithmName(SEARCH_ALGORITHM algorithm);

		//! Checks the accumulation parameters
		/** \return SUCCESS or the violated precondition
		**/
		static ErrorCode CheckParams(const GenericSampleSet& set, const Params& params);

		//! Accumulates the pairs of a sample set
		/** \param set samples
			\param pairs variable pairs (channels) accumulated in a single pass
			\param params accumulation parameters
			\param[out] sums accumulated sums (one per channel)
			\return error code
		**/
		static ErrorCode Accumulate(const GenericSampleSet& set,
									const std::vector<VariablePair>& pairs,
									const Params& params,
									std::vector<ChannelSums>& sums);
	};
}
