// SPDX-License-Identifier: LGPL-2.0-or-later
// Copyright © EDF R&D / TELECOM ParisTech (ENST-TSI)

#pragma once

//Local
#include "GSConst.h"
#include "GSToolbox.h"

//System
#include <cstddef>
#include <string>

namespace GeoStatsCoreLib
{
	//! Empirical estimators
	enum ESTIMATOR_TYPE
	{
		MATHERON = 0,		//!< Method of moments (squared differences)
		CRESSIE,			//!< Robust estimator of Cressie and Hawkins (4th power of mean square-root differences)
		CARLE,				//!< Transition probability estimator of Carle and Fogg (indicator ratios)
		INVALID_ESTIMATOR
	};

	//! Statistical rules of the empirical estimators
	/** Each estimator defines:
		- a per-pair accumulation term (value and weight)
		- a per-bin normalization of the accumulated sums
		- a combination rule of two normalized bins (exact partition merge)
	**/
	class GS_CORE_LIB_API EmpiricalEstimator : public GSToolbox
	{
	public:

		//! Accumulation term of a pair of samples
		struct Term
		{
			Term()
				: value(0.0)
				, weight(0.0)
			{}

			//! Accumulated value (numerator)
			double value;
			//! Accumulated weight (denominator of ratio estimators, 1 otherwise)
			double weight;
		};

		//! Returns the estimator name
		static const char* Name(ESTIMATOR_TYPE type);

		//! Returns the estimator corresponding to a name ("matheron", "cressie" or "carle")
		/** \param name estimator name (case insensitive)
			\param[out] type estimator
			\return SUCCESS or ERROR_UNKNOWN_ESTIMATOR
		**/
		static ErrorCode FromName(const std::string& name, ESTIMATOR_TYPE& type);

		//! Returns whether the estimator is a ratio (transiogram) estimator
		static inline bool IsRatioEstimator(ESTIMATOR_TYPE type) { return type == CARLE; }

		//! Computes the accumulation term of a pair of samples (tail i, head j)
		/** \param type estimator
			\param z1i first variable at the tail
			\param z1j first variable at the head
			\param z2i second variable at the tail
			\param z2j second variable at the head
			\param oriented whether the pair is oriented (tail to head) or not
			\param[out] term accumulation term
			\return false if the term is undefined (missing value)
		**/
		static bool AccumulateTerm(ESTIMATOR_TYPE type, double z1i, double z1j, double z2i, double z2j, bool oriented, Term& term);

		//! Converts accumulated sums into the bin ordinate
		/** \param type estimator
			\param valueSum sum of the term values
			\param weightSum sum of the term weights
			\param count number of pairs
			\return ordinate (0 for empty bins)
		**/
		static double Normalize(ESTIMATOR_TYPE type, double valueSum, double weightSum, std::size_t count);

		//! Combines two normalized bins
		/** Associative and commutative. Equivalent to a single pass over both sets of pairs.
			\param type estimator
			\param yA ordinate of the first bin
			\param wA weight of the first bin (sum of the term weights)
			\param nA pair count of the first bin
			\param yB ordinate of the second bin
			\param wB weight of the second bin (sum of the term weights)
			\param nB pair count of the second bin
			\return combined ordinate (0 if the combined bin is empty)
		**/
		static double Combine(ESTIMATOR_TYPE type, double yA, double wA, std::size_t nA, double yB, double wB, std::size_t nB);
	};
}
