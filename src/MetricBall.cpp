// SPDX-License-Identifier: LGPL-2.0-or-later
// Copyright © EDF R&D / TELECOM ParisTech (ENST-TSI)

#include <MetricBall.h>

//System
#include <cmath>

using namespace GeoStatsCoreLib;

MetricBall::MetricBall(double radius/*=1.0*/, const std::string& unit/*=std::string()*/)
	: m_radii(1, radius)
	, m_axes(1, GSVector3d(1, 0, 0))
	, m_unit(unit)
{
}

MetricBall::MetricBall(const std::vector<double>& radii, const std::vector<GSVector3d>& axes/*=std::vector<GSVector3d>()*/, const std::string& unit/*=std::string()*/)
	: m_radii(radii)
	, m_axes(axes)
	, m_unit(unit)
{
	if (m_radii.empty())
	{
		m_radii.push_back(1.0);
	}
	else if (m_radii.size() > 3)
	{
		m_radii.resize(3);
	}

	if (m_axes.size() != m_radii.size())
	{
		//canonical axes
		m_axes.clear();
		for (size_t i = 0; i < m_radii.size(); ++i)
		{
			GSVector3d axis(0, 0, 0);
			axis.u[i] = 1.0;
			m_axes.push_back(axis);
		}
	}
	else
	{
		for (GSVector3d& axis : m_axes)
		{
			axis.normalize();
		}
	}
}

MetricBall MetricBall::Rotated2D(double majorRadius, double minorRadius, double angle)
{
	std::vector<GSVector3d> axes{	GSVector3d(std::cos(angle), std::sin(angle), 0),
									GSVector3d(-std::sin(angle), std::cos(angle), 0) };

	return MetricBall(std::vector<double>{ majorRadius, minorRadius }, axes);
}

bool MetricBall::isValid() const
{
	for (double r : m_radii)
	{
		if (!(r > 0) || !std::isfinite(r))
		{
			return false;
		}
	}
	return true;
}

bool MetricBall::isIsotropic() const
{
	for (double r : m_radii)
	{
		if (r != m_radii.front())
		{
			return false;
		}
	}
	return true;
}

MetricBall MetricBall::withRadius(double radius) const
{
	return scaled(radius / m_radii.front());
}

MetricBall MetricBall::scaled(double factor) const
{
	MetricBall ball(*this);
	for (double& r : ball.m_radii)
	{
		r *= factor;
	}
	return ball;
}

double MetricBall::evaluate(const GSVector3d& p1, const GSVector3d& p2) const
{
	GSVector3d delta = p2 - p1;

	if (m_radii.size() == 1)
	{
		return delta.norm();
	}

	//coordinates in the ellipsoid frame, scaled to the first radius
	double sum = 0.0;
	GSVector3d remainder = delta;
	for (size_t i = 0; i < m_radii.size(); ++i)
	{
		double c = delta.dot(m_axes[i]);
		remainder -= m_axes[i] * c;
		double s = c * (m_radii.front() / m_radii[i]);
		sum += s * s;
	}
	//components outside the axes (fewer radii than dimensions) are not scaled
	sum += remainder.norm2();

	return std::sqrt(sum);
}
