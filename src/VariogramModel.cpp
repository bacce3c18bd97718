// SPDX-License-Identifier: LGPL-2.0-or-later
// Copyright © EDF R&D / TELECOM ParisTech (ENST-TSI)

#include <VariogramModel.h>

//Local
#include <DistanceFunction.h>

//System
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>

using namespace GeoStatsCoreLib;

VariogramModel::VariogramModel()
	: m_family(INVALID_FAMILY)
	, m_sill(0.0)
	, m_nugget(0.0)
	, m_order(1.0)
	, m_scaling(0.0)
	, m_exponent(0.0)
{
}

VariogramModel::VariogramModel(Family family, const MetricBall& ball, double sill/*=1.0*/, double nugget/*=0.0*/, double order/*=1.0*/)
	: m_family(family == POWER ? INVALID_FAMILY : family)
	, m_ball(ball)
	, m_sill(family == NUGGET ? nugget : sill)
	, m_nugget(nugget)
	, m_order(order)
	, m_scaling(0.0)
	, m_exponent(0.0)
{
}

VariogramModel::VariogramModel(Family family, double range, double sill/*=1.0*/, double nugget/*=0.0*/, double order/*=1.0*/)
	: VariogramModel(family, MetricBall(range), sill, nugget, order)
{
}

VariogramModel VariogramModel::Power(double scaling/*=1.0*/, double nugget/*=0.0*/, double exponent/*=1.0*/)
{
	VariogramModel model;
	model.m_family = POWER;
	model.m_scaling = scaling;
	model.m_nugget = nugget;
	model.m_exponent = exponent;
	model.m_sill = std::numeric_limits<double>::infinity();
	return model;
}

VariogramModel VariogramModel::NuggetEffect(double nugget/*=1.0*/)
{
	return VariogramModel(NUGGET, MetricBall(1.0), nugget, nugget);
}

const char* VariogramModel::FamilyName(Family family)
{
	switch (family)
	{
	case NUGGET:
		return "Nugget";
	case GAUSSIAN:
		return "Gaussian";
	case EXPONENTIAL:
		return "Exponential";
	case SPHERICAL:
		return "Spherical";
	case CUBIC:
		return "Cubic";
	case PENTASPHERICAL:
		return "PentaSpherical";
	case SINEHOLE:
		return "SineHole";
	case CIRCULAR:
		return "Circular";
	case MATERN:
		return "Matern";
	case POWER:
		return "Power";
	default:
		break;
	}

	return "Invalid";
}

ErrorCode VariogramModel::FamilyFromName(const std::string& name, Family& family)
{
	auto lower = [](std::string str)
	{
		std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
		return str;
	};

	std::string lowerName = lower(name);
	for (int f = NUGGET; f < INVALID_FAMILY; ++f)
	{
		if (lowerName == lower(FamilyName(static_cast<Family>(f))))
		{
			family = static_cast<Family>(f);
			return SUCCESS;
		}
	}

	family = INVALID_FAMILY;
	return ERROR_INVALID_PARAMETER;
}

std::vector<VariogramModel::Family> VariogramModel::DefaultCandidates()
{
	return { CIRCULAR, CUBIC, EXPONENTIAL, GAUSSIAN, MATERN, PENTASPHERICAL, SINEHOLE, SPHERICAL };
}

bool VariogramModel::isValid() const
{
	switch (m_family)
	{
	case INVALID_FAMILY:
		return false;

	case POWER:
		return std::isfinite(m_scaling)
			&& std::isfinite(m_nugget)
			&& m_exponent >= 0
			&& m_exponent <= 2 + FIXED_PARAMETER_TOLERANCE;

	case NUGGET:
		return std::isfinite(m_nugget);

	case MATERN:
		if (!(m_order > 0))
			return false;
		break;

	default:
		break;
	}

	return m_ball.isValid() && std::isfinite(m_sill) && std::isfinite(m_nugget);
}

double VariogramModel::Structure(Family family, double q, double order/*=1.0*/)
{
	switch (family)
	{
	case GAUSSIAN:
		return 1.0 - std::exp(-3.0 * q * q);

	case EXPONENTIAL:
		return 1.0 - std::exp(-3.0 * q);

	case SPHERICAL:
		return q < 1.0 ? 1.5 * q - 0.5 * q * q * q : 1.0;

	case CUBIC:
	{
		if (q >= 1.0)
			return 1.0;
		double q2 = q * q;
		double q3 = q2 * q;
		double q5 = q3 * q2;
		double q7 = q5 * q2;
		return 7.0 * q2 - (35.0 / 4.0) * q3 + (7.0 / 2.0) * q5 - (3.0 / 4.0) * q7;
	}

	case PENTASPHERICAL:
	{
		if (q >= 1.0)
			return 1.0;
		double q3 = q * q * q;
		double q5 = q3 * q * q;
		return (15.0 / 8.0) * q - (5.0 / 4.0) * q3 + (3.0 / 8.0) * q5;
	}

	case SINEHOLE:
	{
		//shift by machine precision to avoid the explosion at the origin
		double x = M_PI * (q + std::numeric_limits<double>::epsilon());
		return 1.0 - std::sin(x) / x;
	}

	case CIRCULAR:
		if (q > 1.0)
			return 1.0;
		return 1.0 - (2.0 / M_PI) * std::acos(q) + (2.0 * q / M_PI) * std::sqrt(1.0 - q * q);

	case MATERN:
	{
		double delta = std::sqrt(2.0 * order) * 3.0 * (q + std::numeric_limits<double>::epsilon());
		double besselK = std::cyl_bessel_k(order, delta);
		return 1.0 - std::pow(2.0, 1.0 - order) / std::tgamma(order) * std::pow(delta, order) * besselK;
	}

	default:
		break;
	}

	return 0.0;
}

double VariogramModel::evaluate(double h) const
{
	if (!(h > 0))
	{
		return 0.0;
	}

	switch (m_family)
	{
	case INVALID_FAMILY:
		return NAN_VALUE;

	case NUGGET:
		return m_nugget;

	case POWER:
		return m_scaling * std::pow(h, m_exponent) + m_nugget;

	case GAUSSIAN:
	{
		//small epsilon for numerical stability
		double n = m_nugget + 1.0e-6;
		return (m_sill - n) * Structure(m_family, h / m_ball.radius()) + n;
	}

	default:
		break;
	}

	return (m_sill - m_nugget) * Structure(m_family, h / m_ball.radius(), m_order) + m_nugget;
}

double VariogramModel::evaluate(const GSVector3d& p1, const GSVector3d& p2) const
{
	if (m_family == POWER)
	{
		return evaluate(DistanceFunction()(p1, p2));
	}

	return evaluate(m_ball.evaluate(p1, p2));
}

double VariogramModel::covariance(double h) const
{
	if (!isBounded())
	{
		return NAN_VALUE;
	}

	return m_sill - evaluate(h);
}

VariogramModel VariogramModel::scaled(double factor) const
{
	VariogramModel model(*this);
	if (m_family != POWER && m_family != NUGGET)
	{
		model.m_ball = m_ball.scaled(factor);
	}
	return model;
}

bool CompositeVariogram::add(double coefficient, const VariogramModel& model)
{
	if (!(coefficient > 0) || !model.isValid())
	{
		return false;
	}

	try
	{
		m_structures.emplace_back(coefficient, model);
	}
	catch (const std::bad_alloc&)
	{
		//not enough memory
		return false;
	}

	return true;
}

bool CompositeVariogram::isBounded() const
{
	for (const auto& structure : m_structures)
	{
		if (!structure.second.isBounded())
		{
			return false;
		}
	}
	return true;
}

double CompositeVariogram::sill() const
{
	double sill = 0.0;
	for (const auto& structure : m_structures)
	{
		sill += structure.first * structure.second.sill();
	}
	return sill;
}

double CompositeVariogram::nugget() const
{
	double nugget = 0.0;
	for (const auto& structure : m_structures)
	{
		nugget += structure.first * structure.second.nugget();
	}
	return nugget;
}

double CompositeVariogram::evaluate(double h) const
{
	double value = 0.0;
	for (const auto& structure : m_structures)
	{
		value += structure.first * structure.second.evaluate(h);
	}
	return value;
}

double CompositeVariogram::evaluate(const GSVector3d& p1, const GSVector3d& p2) const
{
	double value = 0.0;
	for (const auto& structure : m_structures)
	{
		value += structure.first * structure.second.evaluate(p1, p2);
	}
	return value;
}

double CompositeVariogram::covariance(double h) const
{
	if (!isBounded())
	{
		return NAN_VALUE;
	}

	return sill() - evaluate(h);
}
