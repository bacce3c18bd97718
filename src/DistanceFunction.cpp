// SPDX-License-Identifier: LGPL-2.0-or-later
// Copyright © EDF R&D / TELECOM ParisTech (ENST-TSI)

#include <DistanceFunction.h>

//Local
#include <GSConst.h>

//System
#include <algorithm>
#include <cmath>

using namespace GeoStatsCoreLib;

DistanceFunction::DistanceFunction(Type type, double parameter)
	: m_type(type)
	, m_parameter(parameter)
{
	if (std::isnan(m_parameter))
	{
		switch (m_type)
		{
		case EUCLIDEAN:
			m_parameter = 2.0;
			break;
		case CITYBLOCK:
			m_parameter = 1.0;
			break;
		case CHEBYSHEV:
			m_parameter = std::numeric_limits<double>::infinity();
			break;
		case MINKOWSKI:
			m_parameter = 2.0;
			break;
		case HAVERSINE:
			m_parameter = 6371.0;
			break;
		}
	}
}

DistanceFunction DistanceFunction::Minkowski(double p)
{
	return DistanceFunction(MINKOWSKI, p);
}

DistanceFunction DistanceFunction::Haversine(double radius/*=6371.0*/)
{
	return DistanceFunction(HAVERSINE, radius);
}

std::string DistanceFunction::name() const
{
	switch (m_type)
	{
	case EUCLIDEAN:
		return "Euclidean";
	case CITYBLOCK:
		return "Cityblock";
	case CHEBYSHEV:
		return "Chebyshev";
	case MINKOWSKI:
		return "Minkowski";
	case HAVERSINE:
		return "Haversine";
	}

	return "Unknown";
}

bool DistanceFunction::isValid() const
{
	switch (m_type)
	{
	case MINKOWSKI:
		return m_parameter >= 1.0;
	case HAVERSINE:
		return std::isfinite(m_parameter) && m_parameter > 0.0;
	default:
		return true;
	}
}

double DistanceFunction::operator()(const GSVector3d& a, const GSVector3d& b) const
{
	switch (m_type)
	{
	case EUCLIDEAN:
		return (a - b).norm();

	case CITYBLOCK:
		return std::abs(a.x - b.x) + std::abs(a.y - b.y) + std::abs(a.z - b.z);

	case CHEBYSHEV:
		return std::max(std::abs(a.x - b.x), std::max(std::abs(a.y - b.y), std::abs(a.z - b.z)));

	case MINKOWSKI:
	{
		double sum = 0.0;
		for (unsigned d = 0; d < 3; ++d)
		{
			sum += std::pow(std::abs(a.u[d] - b.u[d]), m_parameter);
		}
		return std::pow(sum, 1.0 / m_parameter);
	}

	case HAVERSINE:
	{
		static const double DegToRad = M_PI / 180.0;
		double lat1 = a.y * DegToRad;
		double lat2 = b.y * DegToRad;
		double dLat = lat2 - lat1;
		double dLon = (b.x - a.x) * DegToRad;
		double s = std::sin(dLat / 2) * std::sin(dLat / 2) + std::cos(lat1) * std::cos(lat2) * std::sin(dLon / 2) * std::sin(dLon / 2);
		return 2.0 * m_parameter * std::asin(std::min(1.0, std::sqrt(s)));
	}
	}

	return std::numeric_limits<double>::quiet_NaN();
}

double DistanceFunction::euclideanBoundFactor(unsigned dimension) const
{
	switch (m_type)
	{
	case EUCLIDEAN:
	case CITYBLOCK:
		//L2 <= L1
		return 1.0;
	default:
		//L2 <= sqrt(d) Linf <= sqrt(d) Lp
		return std::sqrt(static_cast<double>(std::max(1u, dimension)));
	}
}

bool DistanceFunction::operator==(const DistanceFunction& other) const
{
	return m_type == other.m_type && m_parameter == other.m_parameter;
}
