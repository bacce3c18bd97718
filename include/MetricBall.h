// SPDX-License-Identifier: LGPL-2.0-or-later
// Copyright © EDF R&D / TELECOM ParisTech (ENST-TSI)

#pragma once

//Local
#include "GeoStatsCoreLib.h"
#include "GSGeom.h"

//STL
#include <string>
#include <vector>

namespace GeoStatsCoreLib
{
	//! (Anisotropic) metric ball of the theoretical models
	/** Ellipsoid with up to 3 radii along orthonormal axes. The distance between
		two points is measured in the ellipsoid frame and scaled to the first radius,
		so that the distance to any point of the ball surface equals radius().
	**/
	class GS_CORE_LIB_API MetricBall
	{
	public:

		//! Isotropic ball
		explicit MetricBall(double radius = 1.0, const std::string& unit = std::string());

		//! Anisotropic ball
		/** \param radii 1 to 3 radii
			\param axes axes of the ellipsoid (one per radius, orthonormal) or empty for the canonical axes
			\param unit length unit
		**/
		MetricBall(const std::vector<double>& radii, const std::vector<GSVector3d>& axes = std::vector<GSVector3d>(), const std::string& unit = std::string());

		//! Anisotropic 2D ball rotated around Z
		/** \param majorRadius radius along the rotated X axis
			\param minorRadius radius along the rotated Y axis
			\param angle rotation angle (radians, counterclockwise)
		**/
		static MetricBall Rotated2D(double majorRadius, double minorRadius, double angle);

		//! Returns whether the ball is valid (positive radii)
		bool isValid() const;

		//! Returns whether all radii are equal
		bool isIsotropic() const;

		//! Returns the main radius (first one)
		inline double radius() const { return m_radii.front(); }
		//! Returns all the radii
		inline const std::vector<double>& radii() const { return m_radii; }
		//! Returns the axes
		inline const std::vector<GSVector3d>& axes() const { return m_axes; }

		//! Returns the length unit
		inline const std::string& unit() const { return m_unit; }
		//! Sets the length unit
		inline void setUnit(const std::string& unit) { m_unit = unit; }

		//! Returns a copy with the main radius set to a given value (radii ratios are kept)
		MetricBall withRadius(double radius) const;

		//! Returns a copy with all the radii scaled by a positive factor
		MetricBall scaled(double factor) const;

		//! Returns the (anisotropic) distance between two points
		double evaluate(const GSVector3d& p1, const GSVector3d& p2) const;

	protected:

		//! Radii
		std::vector<double> m_radii;
		//! Axes
		std::vector<GSVector3d> m_axes;
		//! Length unit
		std::string m_unit;
	};
}
