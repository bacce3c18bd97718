// SPDX-License-Identifier: LGPL-2.0-or-later
// Copyright © EDF R&D / TELECOM ParisTech (ENST-TSI)

#pragma once

//Local
#include "GSGeom.h"

//System
#include <limits>
#include <string>

namespace GeoStatsCoreLib
{
	//! Distance function between two sample locations
	class GS_CORE_LIB_API DistanceFunction
	{
	public:

		//! Metric type
		enum Type
		{
			EUCLIDEAN = 0,	//!< L2 norm
			CITYBLOCK,		//!< L1 norm
			CHEBYSHEV,		//!< L-infinity norm
			MINKOWSKI,		//!< Lp norm (p >= 1)
			HAVERSINE		//!< Great-circle distance (x = longitude, y = latitude, in degrees)
		};

		//! Default constructor (Euclidean distance)
		DistanceFunction()
			: m_type(EUCLIDEAN)
			, m_parameter(2.0)
		{}

		//! Minkowski distance of order p
		static DistanceFunction Minkowski(double p);
		//! Haversine distance on a sphere of a given radius
		static DistanceFunction Haversine(double radius = 6371.0);

		//! Constructor from a type
		/** The parameter is the order of Minkowski distances and the radius of Haversine ones.
		**/
		explicit DistanceFunction(Type type, double parameter = std::numeric_limits<double>::quiet_NaN());

		//! Returns the metric type
		inline Type type() const { return m_type; }
		//! Returns the metric parameter (order or radius)
		inline double parameter() const { return m_parameter; }

		//! Returns the metric name
		std::string name() const;

		//! Returns whether the metric is valid (e.g. Minkowski order >= 1)
		bool isValid() const;

		//! Returns whether the metric belongs to the Minkowski family
		/** Ball (radius) queries in a kd-tree are only possible for these metrics.
		**/
		inline bool isMinkowskiFamily() const { return m_type != HAVERSINE; }

		//! Computes the distance between two locations
		double operator()(const GSVector3d& a, const GSVector3d& b) const;

		//! Factor k such that the Euclidean distance is lower than k times this distance
		/** \param dimension number of coordinates
		**/
		double euclideanBoundFactor(unsigned dimension) const;

		//! Comparison (same metric and same parameter)
		bool operator==(const DistanceFunction& other) const;
		inline bool operator!=(const DistanceFunction& other) const { return !(*this == other); }

	protected:

		//! Metric type
		Type m_type;
		//! Metric parameter (order of Minkowski distance, radius of Haversine distance)
		double m_parameter;
	};
}
