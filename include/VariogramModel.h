// SPDX-License-Identifier: LGPL-2.0-or-later
// Copyright © EDF R&D / TELECOM ParisTech (ENST-TSI)

#pragma once

//Local
#include "GSConst.h"
#include "MetricBall.h"

//STL
#include <string>
#include <utility>
#include <vector>

namespace GeoStatsCoreLib
{
	//! Theoretical variogram model
	/** Bounded families are parameterized by a metric ball (range), a sill and
		a nugget: gamma(0) = 0 and gamma(h) = nugget + (sill - nugget) f(h / range)
		for h > 0. The range is the practical range (f(1) ~ 1).
		The power family is parameterized by a scaling, a nugget and an exponent.
	**/
	class GS_CORE_LIB_API VariogramModel
	{
	public:

		//! Model families
		enum Family
		{
			NUGGET = 0,			//!< Pure nugget effect
			GAUSSIAN,			//!< Gaussian
			EXPONENTIAL,		//!< Exponential
			SPHERICAL,			//!< Spherical
			CUBIC,				//!< Cubic
			PENTASPHERICAL,		//!< Pentaspherical
			SINEHOLE,			//!< Sine hole (hole effect)
			CIRCULAR,			//!< Circular
			MATERN,				//!< Matern (with a given order)
			POWER,				//!< Power (unbounded)
			INVALID_FAMILY
		};

		//! Default constructor (invalid model)
		VariogramModel();

		//! Constructor of a bounded model
		/** \param family bounded family
			\param ball metric ball (range)
			\param sill sill
			\param nugget nugget
			\param order order of the Bessel function (Matern only)
		**/
		VariogramModel(Family family, const MetricBall& ball, double sill = 1.0, double nugget = 0.0, double order = 1.0);

		//! Constructor of an isotropic bounded model
		VariogramModel(Family family, double range, double sill = 1.0, double nugget = 0.0, double order = 1.0);

		//! Power model
		static VariogramModel Power(double scaling = 1.0, double nugget = 0.0, double exponent = 1.0);

		//! Pure nugget effect
		static VariogramModel NuggetEffect(double nugget = 1.0);

		//! Returns the name of a family
		static const char* FamilyName(Family family);

		//! Returns the family corresponding to a name (case insensitive)
		static ErrorCode FamilyFromName(const std::string& name, Family& family);

		//! Returns whether a family is bounded (stationary)
		static inline bool IsBounded(Family family) { return family != POWER && family != INVALID_FAMILY; }

		//! Returns the default candidate families of variogram fitting
		static std::vector<Family> DefaultCandidates();

		//! Returns whether the model is valid
		bool isValid() const;

		//! Returns the family
		inline Family family() const { return m_family; }
		//! Returns whether the model is bounded (i.e. has a sill)
		inline bool isBounded() const { return IsBounded(m_family); }
		//! Returns the metric ball
		inline const MetricBall& ball() const { return m_ball; }
		//! Returns the range (main radius of the ball, 0 for the nugget effect)
		inline double range() const { return m_family == NUGGET ? 0.0 : m_ball.radius(); }
		//! Returns the sill (the nugget for a pure nugget effect)
		inline double sill() const { return m_sill; }
		//! Returns the nugget
		inline double nugget() const { return m_nugget; }
		//! Returns the order (Matern)
		inline double order() const { return m_order; }
		//! Returns the scaling (power)
		inline double scaling() const { return m_scaling; }
		//! Returns the exponent (power)
		inline double exponent() const { return m_exponent; }

		//! Returns the unit of the values (e.g. "K^2")
		inline const std::string& valueUnit() const { return m_valueUnit; }
		//! Sets the unit of the values
		inline void setValueUnit(const std::string& unit) { m_valueUnit = unit; }
		//! Sets the unit of the lags
		inline void setLagUnit(const std::string& unit) { m_ball.setUnit(unit); }

		//! Evaluates the variogram at a given lag
		double evaluate(double h) const;

		//! Evaluates the variogram between two points
		/** The lag is measured with the metric ball (Euclidean for the power model).
		**/
		double evaluate(const GSVector3d& p1, const GSVector3d& p2) const;

		//! Evaluates the covariance (sill - variogram) at a given lag
		/** \warning Only defined for bounded models (NaN otherwise)
		**/
		double covariance(double h) const;

		//! Returns a copy with the metric ball scaled by a positive factor
		VariogramModel scaled(double factor) const;

		//! Evaluates the normalized structure f(h / range) of a bounded family
		/** gamma(h) = nugget + (sill - nugget) Structure(h / range) for h > 0.
			\param family bounded family (except NUGGET)
			\param q normalized lag (h / range)
			\param order Matern order
		**/
		static double Structure(Family family, double q, double order = 1.0);

	protected:

		//! Family
		Family m_family;
		//! Metric ball
		MetricBall m_ball;
		//! Sill
		double m_sill;
		//! Nugget
		double m_nugget;
		//! Matern order
		double m_order;
		//! Power scaling
		double m_scaling;
		//! Power exponent
		double m_exponent;
		//! Unit of the values
		std::string m_valueUnit;
	};

	//! Linear combination of variogram models (nested structures)
	class GS_CORE_LIB_API CompositeVariogram
	{
	public:

		//! Adds a structure
		/** \param coefficient positive coefficient
			\param model valid model
			\return false if the coefficient or the model is invalid
		**/
		bool add(double coefficient, const VariogramModel& model);

		//! Returns the structures
		inline const std::vector< std::pair<double, VariogramModel> >& structures() const { return m_structures; }

		//! Returns whether all structures are bounded
		bool isBounded() const;

		//! Returns the total sill
		double sill() const;
		//! Returns the total nugget
		double nugget() const;

		//! Evaluates the variogram at a given lag
		double evaluate(double h) const;
		//! Evaluates the variogram between two points
		double evaluate(const GSVector3d& p1, const GSVector3d& p2) const;
		//! Evaluates the covariance at a given lag
		double covariance(double h) const;

	protected:

		//! Structures (coefficient, model)
		std::vector< std::pair<double, VariogramModel> > m_structures;
	};
}
