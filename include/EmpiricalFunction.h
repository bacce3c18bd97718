// SPDX-License-Identifier: LGPL-2.0-or-later
// Copyright © EDF R&D / TELECOM ParisTech (ENST-TSI)

#pragma once

//Local
#include "DistanceFunction.h"
#include "EmpiricalEstimators.h"
#include "SquareMatrix.h"

//STL
#include <string>
#include <vector>

namespace GeoStatsCoreLib
{
	//! Empirical (binned) dependence function
	/** Variogram (one channel) or transiogram (one channel per ordered
		pair of categories) estimated from data.

		For each lag bin k (interval ](k-1).dh, k.dh] with dh = maxlag / nlags):
		- counts[k]: number of pairs
		- abscissas[k]: mean lag of the pairs (or bin center if the bin is empty)
		- ordinates[c][k]: estimate of channel c (0 if the bin is empty)
		- weights[c][k]: sum of the estimator term weights (used to merge bins)

		Functions are created by EmpiricalFunctionTools and are read-only
		afterwards. Merging returns a new function.
	**/
	class GS_CORE_LIB_API EmpiricalFunction
	{
	public:

		//! Function kind
		enum Kind
		{
			VARIOGRAM = 0,	//!< (cross-)variogram
			TRANSIOGRAM		//!< matrix of transition probabilities
		};

		//! Default constructor (invalid function)
		EmpiricalFunction();

		//! Constructor of a function with empty bins
		/** \param kind function kind
			\param distance distance function
			\param estimator estimator
			\param nlags number of lags
			\param maxlag maximum lag
			\param levelCount number of categories (transiogram only)
		**/
		EmpiricalFunction(	Kind kind,
							const DistanceFunction& distance,
							ESTIMATOR_TYPE estimator,
							unsigned nlags,
							double maxlag,
							unsigned levelCount = 1);

		//! Builds a function from raw bins
		/** The bin weights are the counts.
			\param kind function kind
			\param counts pair counts per bin
			\param abscissas mean lag per bin
			\param ordinates ordinates per channel and per bin (1 channel for variograms, k*k for transiograms)
			\param maxlag maximum lag (or NaN to use the last abscissa)
			\param[out] function output function
			\return error code
		**/
		static ErrorCode FromBins(	Kind kind,
									const std::vector<std::size_t>& counts,
									const std::vector<double>& abscissas,
									const std::vector< std::vector<double> >& ordinates,
									double maxlag,
									EmpiricalFunction& function);

		//! Merges two functions
		/** Both functions must share the same kind, distance, estimator and bins.
			\param A first function
			\param B second function
			\param[out] result merged function
			\return SUCCESS, ERROR_INVALID_INPUT or ERROR_INCOMPATIBLE_FUNCTIONS
		**/
		static ErrorCode Merge(const EmpiricalFunction& A, const EmpiricalFunction& B, EmpiricalFunction& result);

		//! Returns whether the function is valid
		inline bool isValid() const { return m_nlags != 0; }

		//! Returns whether two functions can be merged
		bool hasSameIdentity(const EmpiricalFunction& other) const;

		//! Returns the function kind
		inline Kind kind() const { return m_kind; }
		//! Returns the distance function
		inline const DistanceFunction& distance() const { return m_distance; }
		//! Returns the estimator
		inline ESTIMATOR_TYPE estimator() const { return m_estimator; }
		//! Returns the number of lags
		inline unsigned nlags() const { return m_nlags; }
		//! Returns the maximum lag
		inline double maxlag() const { return m_maxlag; }
		//! Returns the lag (bin) size
		inline double lagSize() const { return m_nlags != 0 ? m_maxlag / m_nlags : 0.0; }
		//! Returns the center of a given bin
		inline double nominalAbscissa(unsigned bin) const { return lagSize() / 2 + bin * lagSize(); }

		//! Returns the number of channels
		inline unsigned channelCount() const { return static_cast<unsigned>(m_ordinates.size()); }
		//! Returns the number of categories (1 for variograms)
		inline unsigned levelCount() const { return m_levelCount; }

		//! Returns the pair counts
		inline const std::vector<std::size_t>& counts() const { return m_counts; }
		//! Returns the total number of pairs
		std::size_t totalCount() const;
		//! Returns the abscissas (mean lags)
		inline const std::vector<double>& abscissas() const { return m_abscissas; }
		//! Returns the ordinates of a given channel
		inline const std::vector<double>& ordinates(unsigned channel = 0) const { return m_ordinates[channel]; }
		//! Returns the bin weights of a given channel
		inline const std::vector<double>& weights(unsigned channel = 0) const { return m_weights[channel]; }

		//! Returns the transition probabilities from category i to category j (transiogram)
		inline const std::vector<double>& transitionOrdinates(unsigned i, unsigned j) const { return m_ordinates[i * m_levelCount + j]; }

		//! Returns the matrix of ordinates of a given bin
		SquareMatrixd ordinateMatrix(unsigned bin) const;

		//! Returns the maximum ordinate (over all channels and non-empty bins)
		double maxOrdinate() const;

		//! Returns the category labels (transiogram)
		inline const std::vector<std::string>& levels() const { return m_levels; }
		//! Sets the category labels
		inline void setLevels(const std::vector<std::string>& levels) { m_levels = levels; }

		//! Returns the unit of the lags (e.g. "m")
		inline const std::string& lagUnit() const { return m_lagUnit; }
		//! Returns the unit of the ordinates (e.g. "K^2")
		inline const std::string& valueUnit() const { return m_valueUnit; }
		//! Sets the units
		inline void setUnits(const std::string& lagUnit, const std::string& valueUnit) { m_lagUnit = lagUnit; m_valueUnit = valueUnit; }

	protected:

		friend class EmpiricalFunctionTools;

		//! Sets a bin (common part)
		inline void setBin(unsigned bin, std::size_t count, double abscissa) { m_counts[bin] = count; m_abscissas[bin] = abscissa; }
		//! Sets a bin (channel part)
		inline void setChannelBin(unsigned channel, unsigned bin, double ordinate, double weight) { m_ordinates[channel][bin] = ordinate; m_weights[channel][bin] = weight; }

		//! Function kind
		Kind m_kind;
		//! Distance function
		DistanceFunction m_distance;
		//! Estimator
		ESTIMATOR_TYPE m_estimator;
		//! Number of lags
		unsigned m_nlags;
		//! Maximum lag
		double m_maxlag;
		//! Number of categories
		unsigned m_levelCount;

		//! Pair counts
		std::vector<std::size_t> m_counts;
		//! Mean lags
		std::vector<double> m_abscissas;
		//! Ordinates (per channel)
		std::vector< std::vector<double> > m_ordinates;
		//! Bin weights (per channel)
		std::vector< std::vector<double> > m_weights;

		//! Category labels
		std::vector<std::string> m_levels;
		//! Lag unit
		std::string m_lagUnit;
		//! Ordinate unit
		std::string m_valueUnit;
	};
}
