// SPDX-License-Identifier: LGPL-2.0-or-later
// Copyright © EDF R&D / TELECOM ParisTech (ENST-TSI)

#pragma once

//Local
#include "GSConst.h"
#include "MetricBall.h"
#include "SquareMatrix.h"

//STL
#include <string>
#include <vector>

namespace GeoStatsCoreLib
{
	//! Theoretical transiogram model
	/** Evaluates to a k x k matrix of transition probabilities (rows sum to one)
		between k categories as a function of the lag.
	**/
	class GS_CORE_LIB_API TransiogramModel
	{
	public:

		//! Model families
		enum Family
		{
			LINEAR = 0,				//!< Linear (range + proportions)
			GAUSSIAN,				//!< Gaussian (range + proportions)
			SPHERICAL,				//!< Spherical (range + proportions)
			EXPONENTIAL,			//!< Exponential (range + proportions)
			MATRIX_EXPONENTIAL,		//!< Matrix exponential of a transition rate matrix
			PIECEWISE_LINEAR,		//!< Interpolation of empirical transition matrices
			CARLE,					//!< Direction dependent rates (one rate matrix per axis)
			INVALID_FAMILY
		};

		//! Default constructor (invalid model)
		TransiogramModel();

		//! Constructor of a model parameterized by a range and proportions
		/** \param family LINEAR, GAUSSIAN, SPHERICAL or EXPONENTIAL
			\param ball metric ball (range)
			\param proportions relative proportions of the categories (must sum to one)
		**/
		TransiogramModel(Family family, const MetricBall& ball, const std::vector<double>& proportions);

		//! Matrix exponential model of a transition rate matrix
		static TransiogramModel MatrixExponential(const SquareMatrixd& rates, const MetricBall& ball = MetricBall(1.0));

		//! Matrix exponential model of mean lengths and proportions
		/** The rate matrix assumes random transitions based on relative proportions
			(see TransitionMatrixTools::BaseRateMatrix).
		**/
		static TransiogramModel MatrixExponential(const std::vector<double>& lengths, const std::vector<double>& proportions, const MetricBall& ball = MetricBall(1.0));

		//! Piecewise linear model
		/** \param abscissas increasing lags
			\param ordinates transition matrices (one per lag)
			\param ball metric ball
		**/
		static TransiogramModel PiecewiseLinear(const std::vector<double>& abscissas, const std::vector<SquareMatrixd>& ordinates, const MetricBall& ball = MetricBall(1.0));

		//! Carle's model of transition rate matrices along the coordinate axes
		/** The rate matrix of a lag vector combines the rates of the axes
			(Carle et al. 1998, Eq. 20 to 22). Rates of a negative lag along an
			axis are the reversed rates, weighted by the proportions. The
			proportions are those of the first rate matrix.
			\param rates one rate matrix per axis (X, then Y, then Z)
		**/
		static TransiogramModel Carle(const std::vector<SquareMatrixd>& rates);

		//! Returns the name of a family
		static const char* FamilyName(Family family);

		//! Returns the family corresponding to a name (case insensitive)
		static ErrorCode FamilyFromName(const std::string& name, Family& family);

		//! Returns the default candidate families of transiogram fitting
		static std::vector<Family> DefaultCandidates();

		//! Returns whether the model is valid
		inline bool isValid() const { return m_family != INVALID_FAMILY; }

		//! Returns the family
		inline Family family() const { return m_family; }
		//! Returns the metric ball
		inline const MetricBall& ball() const { return m_ball; }
		//! Returns the range (main radius of the ball)
		inline double range() const { return m_ball.radius(); }
		//! Returns the number of categories
		unsigned levelCount() const;
		//! Returns the rate matrix (matrix exponential model)
		inline const SquareMatrixd& rateMatrix() const { return m_rates; }
		//! Returns the rate matrices of the axes (Carle's model)
		inline const std::vector<SquareMatrixd>& axisRateMatrices() const { return m_axisRates; }
		//! Returns the abscissas (piecewise linear model)
		inline const std::vector<double>& abscissas() const { return m_abscissas; }

		//! Returns the proportions of the categories
		std::vector<double> proportions() const;

		//! Returns the mean lengths of the categories
		std::vector<double> meanLengths() const;

		//! Sets the unit of the lags
		inline void setLagUnit(const std::string& unit) { m_ball.setUnit(unit); }

		//! Evaluates the transition matrix at a given lag
		/** For Carle's model, the lag is taken along the axis with the largest mean length.
		**/
		SquareMatrixd evaluate(double h) const;

		//! Evaluates the transition matrix between two points
		SquareMatrixd evaluate(const GSVector3d& p1, const GSVector3d& p2) const;

		//! Evaluates a family parameterized by a range and proportions
		/** No validity check (used while fitting).
			\param family LINEAR, GAUSSIAN, SPHERICAL or EXPONENTIAL
			\param h lag
			\param range range
			\param proportions proportions
			\param[out] T transition matrix
		**/
		static void EvaluateRangeFamily(Family family, double h, double range, const std::vector<double>& proportions, SquareMatrixd& T);

	protected:

		//! Transition matrix of Carle's model for a lag vector
		SquareMatrixd carleTransition(const GSVector3d& lag) const;

		//! Family
		Family m_family;
		//! Metric ball
		MetricBall m_ball;
		//! Proportions (range families)
		std::vector<double> m_proportions;
		//! Rate matrix (matrix exponential)
		SquareMatrixd m_rates;
		//! Rate matrices of the axes (Carle)
		std::vector<SquareMatrixd> m_axisRates;
		//! Abscissas (piecewise linear)
		std::vector<double> m_abscissas;
		//! Ordinates (piecewise linear)
		std::vector<SquareMatrixd> m_ordinates;
		//! Ordinate at infinity (piecewise linear)
		SquareMatrixd m_ordinateAtInfinity;
	};
}
