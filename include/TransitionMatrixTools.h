// SPDX-License-Identifier: LGPL-2.0-or-later
// Copyright © EDF R&D / TELECOM ParisTech (ENST-TSI)

#pragma once

//Local
#include "GenericSampleSet.h"
#include "GSConst.h"
#include "GSToolbox.h"
#include "SquareMatrix.h"

//STL
#include <vector>

namespace GeoStatsCoreLib
{
	//! Transition matrices of a categorical variable along an ordered trajectory
	/** Samples are visited in their index order (e.g. along a well log).
		Distances between consecutive samples are Euclidean.
	**/
	class GS_CORE_LIB_API TransitionMatrixTools : public GSToolbox
	{
	public:

		//! Returns the default minimum lag (half the smallest distance between consecutive samples)
		static double DefaultMinLag(const GenericSampleSet& set);

		//! Computes the transition count matrix
		/** Each step of length h between consecutive samples of categories c1 and c2
			adds ceil(h / (2 minlag)) to C[c1][c1] and C[c2][c2], and 1 to C[c1][c2].
			The head of the first sample and the tail of the last one are added too.
			Steps involving a missing value are ignored.
			\param set trajectory (at least two samples)
			\param field categorical column
			\param[out] counts k x k count matrix
			\param minlag minimum lag (NaN = DefaultMinLag)
			\return error code
		**/
		static ErrorCode CountMatrix(const GenericSampleSet& set, int field, SquareMatrixd& counts, double minlag = NAN_VALUE);

		//! Computes the transition probability matrix
		/** Counts are smoothed (Laplace, +1 for each transition) and normalized by row.
		**/
		static ErrorCode ProbabilityMatrix(const GenericSampleSet& set, int field, SquareMatrixd& probabilities, double minlag = NAN_VALUE);

		//! Computes the transition rate matrix
		/** R = log(P) / minlag where P is the transition probability matrix.
		**/
		static ErrorCode RateMatrix(const GenericSampleSet& set, int field, SquareMatrixd& rates, double minlag = NAN_VALUE);

		//! Builds the transition rate matrix of mean lengths and proportions
		/** Assumes random transitions based on relative proportions:
			R[i][i] = -1/l[i] and R[i][j] = (p[j] / (1 - p[i])) / l[i].
			\param lengths mean lengths (positive)
			\param proportions proportions (in [0, 1])
			\param[out] rates k x k rate matrix
			\return error code
		**/
		static ErrorCode BaseRateMatrix(const std::vector<double>& lengths, const std::vector<double>& proportions, SquareMatrixd& rates);
	};
}
