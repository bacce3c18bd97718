// SPDX-License-Identifier: LGPL-2.0-or-later
// Copyright © EDF R&D / TELECOM ParisTech (ENST-TSI)

#pragma once

//Local
#include "EmpiricalFunction.h"
#include "GSToolbox.h"
#include "TransiogramModel.h"
#include "VariogramModel.h"

//STL
#include <functional>
#include <vector>

namespace GeoStatsCoreLib
{
	//! Fitting parameters
	/** Parameters set to NaN are free (fitted) or use the default bounds.
		A fixed parameter is only allowed to move inside [value - FIXED_PARAMETER_TOLERANCE, value + FIXED_PARAMETER_TOLERANCE].
	**/
	struct FittingParams
	{
		FittingParams()
			: range(NAN_VALUE)
			, sill(NAN_VALUE)
			, nugget(NAN_VALUE)
			, maxrange(NAN_VALUE)
			, maxsill(NAN_VALUE)
			, maxnugget(NAN_VALUE)
			, scaling(NAN_VALUE)
			, exponent(NAN_VALUE)
			, maxscaling(NAN_VALUE)
			, maxexponent(NAN_VALUE)
			, order(1.0)
			, maxIterations(200)
		{}

		//! Fixed range (bounded variograms, range transiograms)
		double range;
		//! Fixed sill (bounded variograms)
		double sill;
		//! Fixed nugget (variograms)
		double nugget;
		//! Maximum range (default: maximum lag)
		/** Also the maximum mean length of the matrix exponential transiograms.
		**/
		double maxrange;
		//! Maximum sill (default: maximum ordinate)
		double maxsill;
		//! Maximum nugget (default: maximum ordinate)
		double maxnugget;

		//! Fixed scaling (power variogram)
		double scaling;
		//! Fixed exponent (power variogram)
		double exponent;
		//! Maximum scaling (default: maximum ordinate)
		double maxscaling;
		//! Maximum exponent (default: 2)
		double maxexponent;

		//! Order of the Matern variograms (not fitted)
		double order;

		//! Fixed proportions of the categories (transiograms, empty = fitted)
		std::vector<double> proportions;
		//! Fixed mean lengths of the categories (matrix exponential transiograms, empty = fitted)
		std::vector<double> lengths;

		//! Weight of a bin as a function of its lag (default: normalized pair counts)
		std::function<double(double)> weightFunction;

		//! Maximum number of iterations of the optimizer
		unsigned maxIterations;
	};

	//! Weighted least squares fitting of theoretical models to empirical functions
	/** Minimizes J(theta) + lambda L(theta) where J is the weighted sum of
		squared errors over the non-empty bins, L the (linear) violation of the
		constraints and lambda = sum of the squared ordinates. Parameters are
		bounded by box constraints (projected Levenberg-Marquardt).

		The constraints hold by construction whenever a parameter is free: a free
		nugget is capped by the sill, a fixed nugget bounds the sill from below,
		proportions are normalized and the power exponent stays in [0, 2]. Only
		a fixed sill below a fixed nugget leaves a penalty in the residual.
	**/
	class GS_CORE_LIB_API FittingTools : public GSToolbox
	{
	public:

		//! Fits a variogram model
		/** \param family model family
			\param variogram empirical variogram
			\param params fitting parameters
			\param[out] model fitted model
			\param[out] residual final objective value (optional)
			\return error code
		**/
		static ErrorCode FitVariogram(	VariogramModel::Family family,
										const EmpiricalFunction& variogram,
										const FittingParams& params,
										VariogramModel& model,
										double* residual = nullptr);

		//! Fits several variogram families and keeps the best one
		/** Candidates are fitted independently (in parallel if TBB is available).
			Ties are broken by the order of the list.
			\param families candidate families (e.g. VariogramModel::DefaultCandidates())
			\param variogram empirical variogram
			\param params fitting parameters
			\param[out] model fitted model with the lowest residual
			\param[out] residual its residual (optional)
			\return error code
		**/
		static ErrorCode FitVariogram(	const std::vector<VariogramModel::Family>& families,
										const EmpiricalFunction& variogram,
										const FittingParams& params,
										VariogramModel& model,
										double* residual = nullptr);

		//! Fits a transiogram model
		/** The piecewise linear model is built directly from the bins (zero residual).
		**/
		static ErrorCode FitTransiogram(TransiogramModel::Family family,
										const EmpiricalFunction& transiogram,
										const FittingParams& params,
										TransiogramModel& model,
										double* residual = nullptr);

		//! Fits several transiogram families and keeps the best one
		static ErrorCode FitTransiogram(const std::vector<TransiogramModel::Family>& families,
										const EmpiricalFunction& transiogram,
										const FittingParams& params,
										TransiogramModel& model,
										double* residual = nullptr);

	protected:

		//! Non-empty bins of an empirical function (units stripped)
		struct Bins
		{
			//! Lags
			std::vector<double> x;
			//! Ordinates (per channel)
			std::vector< std::vector<double> > y;
			//! Weights
			std::vector<double> w;
			//! Penalty multiplier (sum of the squared ordinates)
			double lambda = 0.0;
			//! Maximum lag
			double xmax = 0.0;
			//! Maximum ordinate
			double ymax = 0.0;
		};

		//! Extracts the usable bins of an empirical function
		static ErrorCode GetBins(const EmpiricalFunction& function, EmpiricalFunction::Kind kind, const FittingParams& params, Bins& bins);
	};
}
