// SPDX-License-Identifier: LGPL-2.0-or-later
// Copyright © EDF R&D / TELECOM ParisTech (ENST-TSI)

#include <TransiogramModel.h>

//Local
#include <TransitionMatrixTools.h>

//System
#include <algorithm>
#include <cassert>
#include <cctype>
#include <cmath>
#include <numeric>

using namespace GeoStatsCoreLib;

namespace
{
	//! Maximum deviation of the sum of the proportions from one
	constexpr double PROPORTIONS_SUM_TOLERANCE = 1.0e-6;

	//! Small shift of the Gaussian and spherical transiograms (numerical stability)
	constexpr double TRANSIOGRAM_EPSILON = 1.0e-6;

	//! Lag (in largest mean lengths) at which the transition matrix has converged to the proportions
	constexpr double FAR_LAG_FACTOR = 100.0;

	//! Maximum number of axes of Carle's model
	constexpr unsigned MAX_AXIS_COUNT = 3;

	bool ValidProportions(const std::vector<double>& proportions)
	{
		if (proportions.empty())
		{
			return false;
		}

		double sum = 0.0;
		for (double p : proportions)
		{
			if (!(p >= 0 && p <= 1))
			{
				return false;
			}
			sum += p;
		}

		return std::abs(sum - 1.0) <= PROPORTIONS_SUM_TOLERANCE;
	}
}

TransiogramModel::TransiogramModel()
	: m_family(INVALID_FAMILY)
{
}

TransiogramModel::TransiogramModel(Family family, const MetricBall& ball, const std::vector<double>& proportions)
	: m_family(family)
	, m_ball(ball)
	, m_proportions(proportions)
{
	bool rangeFamily = (family == LINEAR || family == GAUSSIAN || family == SPHERICAL || family == EXPONENTIAL);
	if (!rangeFamily || !ball.isValid() || !ValidProportions(proportions))
	{
		m_family = INVALID_FAMILY;
	}
}

TransiogramModel TransiogramModel::MatrixExponential(const SquareMatrixd& rates, const MetricBall& ball/*=MetricBall(1.0)*/)
{
	TransiogramModel model;
	if (rates.isValid() && ball.isValid())
	{
		model.m_family = MATRIX_EXPONENTIAL;
		model.m_ball = ball;
		model.m_rates = rates;
	}
	return model;
}

TransiogramModel TransiogramModel::MatrixExponential(const std::vector<double>& lengths, const std::vector<double>& proportions, const MetricBall& ball/*=MetricBall(1.0)*/)
{
	SquareMatrixd rates;
	if (TransitionMatrixTools::BaseRateMatrix(lengths, proportions, rates) != SUCCESS)
	{
		return TransiogramModel();
	}

	return MatrixExponential(rates, ball);
}

TransiogramModel TransiogramModel::PiecewiseLinear(const std::vector<double>& abscissas, const std::vector<SquareMatrixd>& ordinates, const MetricBall& ball/*=MetricBall(1.0)*/)
{
	TransiogramModel model;
	if (abscissas.empty() || abscissas.size() != ordinates.size() || !ball.isValid())
	{
		return model;
	}

	unsigned k = ordinates.front().size();
	for (size_t i = 0; i < ordinates.size(); ++i)
	{
		if (!ordinates[i].isValid() || ordinates[i].size() != k)
		{
			return model;
		}
		if (i != 0 && !(abscissas[i] > abscissas[i - 1]))
		{
			return model;
		}
	}
	if (!(abscissas.front() > 0))
	{
		return model;
	}

	//ordinate at infinity: each row equals the proportions
	const SquareMatrixd& last = ordinates.back();
	std::vector<double> p(k);
	double sum = 0.0;
	for (unsigned i = 0; i < k; ++i)
	{
		p[i] = std::abs(last.getValue(i, i));
		sum += p[i];
	}
	for (unsigned i = 0; i < k; ++i)
	{
		//corner case with uniform proportions
		p[i] = (sum != 0 ? p[i] / sum : 1.0 / k);
	}

	model.m_family = PIECEWISE_LINEAR;
	model.m_ball = ball;
	model.m_abscissas = abscissas;
	model.m_ordinates = ordinates;
	model.m_ordinateAtInfinity = SquareMatrixd(k);
	for (unsigned i = 0; i < k; ++i)
	{
		for (unsigned j = 0; j < k; ++j)
		{
			model.m_ordinateAtInfinity.setValue(i, j, p[j]);
		}
	}

	return model;
}

TransiogramModel TransiogramModel::Carle(const std::vector<SquareMatrixd>& rates)
{
	TransiogramModel model;
	if (rates.empty() || rates.size() > MAX_AXIS_COUNT)
	{
		return model;
	}

	unsigned k = rates.front().size();
	double largestLength = 0.0;
	for (const SquareMatrixd& R : rates)
	{
		if (!R.isValid() || R.size() != k)
		{
			return model;
		}
		for (unsigned i = 0; i < k; ++i)
		{
			double rii = R.getValue(i, i);
			if (!(rii < 0) || !std::isfinite(rii))
			{
				return model;
			}
		}
	}
	for (unsigned i = 0; i < k; ++i)
	{
		largestLength = std::max(largestLength, -1.0 / rates.front().getValue(i, i));
	}

	//proportions: diagonal of the transition matrix far away (first axis)
	SquareMatrixd far(rates.front());
	far.scale(FAR_LAG_FACTOR * largestLength);
	SquareMatrixd T = far.exp();
	if (!T.isValid())
	{
		return model;
	}

	std::vector<double> proportions(k);
	for (unsigned i = 0; i < k; ++i)
	{
		proportions[i] = T.getValue(i, i);
		if (!(proportions[i] > 0))
		{
			//the reversed rates need positive proportions
			return model;
		}
	}
	if (!ValidProportions(proportions))
	{
		return model;
	}
	double sum = std::accumulate(proportions.begin(), proportions.end(), 0.0);
	for (double& pi : proportions)
	{
		pi /= sum;
	}

	model.m_family = CARLE;
	model.m_ball = MetricBall(1.0);
	model.m_axisRates = rates;
	model.m_proportions = proportions;

	return model;
}

const char* TransiogramModel::FamilyName(Family family)
{
	switch (family)
	{
	case LINEAR:
		return "Linear";
	case GAUSSIAN:
		return "Gaussian";
	case SPHERICAL:
		return "Spherical";
	case EXPONENTIAL:
		return "Exponential";
	case MATRIX_EXPONENTIAL:
		return "MatrixExponential";
	case PIECEWISE_LINEAR:
		return "PiecewiseLinear";
	case CARLE:
		return "Carle";
	default:
		break;
	}

	return "Invalid";
}

ErrorCode TransiogramModel::FamilyFromName(const std::string& name, Family& family)
{
	auto lower = [](std::string str)
	{
		std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
		return str;
	};

	std::string lowerName = lower(name);
	for (int f = LINEAR; f < INVALID_FAMILY; ++f)
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

std::vector<TransiogramModel::Family> TransiogramModel::DefaultCandidates()
{
	return { EXPONENTIAL, GAUSSIAN, LINEAR, MATRIX_EXPONENTIAL, SPHERICAL };
}

unsigned TransiogramModel::levelCount() const
{
	switch (m_family)
	{
	case MATRIX_EXPONENTIAL:
		return m_rates.size();
	case PIECEWISE_LINEAR:
		return m_ordinateAtInfinity.size();
	case INVALID_FAMILY:
		return 0;
	default:
		break;
	}

	return static_cast<unsigned>(m_proportions.size());
}

std::vector<double> TransiogramModel::proportions() const
{
	switch (m_family)
	{
	case INVALID_FAMILY:
		return std::vector<double>();

	case PIECEWISE_LINEAR:
	{
		std::vector<double> p(levelCount());
		for (unsigned i = 0; i < p.size(); ++i)
		{
			p[i] = m_ordinateAtInfinity.getValue(i, i);
		}
		return p;
	}

	case MATRIX_EXPONENTIAL:
	{
		//diagonal of the transition matrix far away (normalized)
		std::vector<double> lengths = meanLengths();
		double farLag = 100 * *std::max_element(lengths.begin(), lengths.end());
		SquareMatrixd T = evaluate(farLag);
		std::vector<double> p(levelCount(), 0.0);
		if (!T.isValid())
		{
			return p;
		}
		double sum = 0.0;
		for (unsigned i = 0; i < p.size(); ++i)
		{
			p[i] = std::abs(T.getValue(i, i));
			sum += p[i];
		}
		for (double& pi : p)
		{
			pi = (sum != 0 ? pi / sum : 1.0 / p.size());
		}
		return p;
	}

	default:
		break;
	}

	return m_proportions;
}

std::vector<double> TransiogramModel::meanLengths() const
{
	std::vector<double> lengths(levelCount(), range());
	if (m_family == CARLE)
	{
		//largest length over the axes
		std::fill(lengths.begin(), lengths.end(), 0.0);
		for (const SquareMatrixd& R : m_axisRates)
		{
			for (unsigned i = 0; i < lengths.size(); ++i)
			{
				lengths[i] = std::max(lengths[i], -1.0 / R.getValue(i, i));
			}
		}
	}
	else if (m_family == MATRIX_EXPONENTIAL)
	{
		for (unsigned i = 0; i < lengths.size(); ++i)
		{
			lengths[i] = range() * (-1.0 / m_rates.getValue(i, i));
		}
	}

	return lengths;
}

void TransiogramModel::EvaluateRangeFamily(Family family, double h, double range, const std::vector<double>& proportions, SquareMatrixd& T)
{
	unsigned k = static_cast<unsigned>(proportions.size());
	if (T.size() != k)
	{
		T = SquareMatrixd(k);
	}

	double q = h / range;
	bool beyondRange = false;
	double v = 0.0;
	double epsilon = 0.0;
	switch (family)
	{
	case LINEAR:
		v = q;
		beyondRange = (q >= 1.0);
		break;
	case GAUSSIAN:
		v = 1.0 - std::exp(-3.0 * q * q);
		epsilon = TRANSIOGRAM_EPSILON;
		break;
	case SPHERICAL:
		v = 1.5 * q - 0.5 * q * q * q;
		beyondRange = (q >= 1.0);
		epsilon = TRANSIOGRAM_EPSILON;
		break;
	case EXPONENTIAL:
		v = 1.0 - std::exp(-3.0 * q);
		break;
	default:
		assert(false);
		T.clear();
		return;
	}

	for (unsigned i = 0; i < k; ++i)
	{
		for (unsigned j = 0; j < k; ++j)
		{
			double pj = proportions[j];
			double value = 0.0;
			if (beyondRange)
			{
				value = pj;
			}
			else
			{
				value = (i == j ? 1.0 - (1.0 - pj) * v : pj * v);
			}
			value += (i == j ? -epsilon * (k - 1) : epsilon);
			T.setValue(i, j, value);
		}
	}
}

SquareMatrixd TransiogramModel::evaluate(double h) const
{
	switch (m_family)
	{
	case INVALID_FAMILY:
		return SquareMatrixd();

	case MATRIX_EXPONENTIAL:
	{
		SquareMatrixd A(m_rates);
		A.scale(h / range());
		return A.exp();
	}

	case CARLE:
	{
		//along the axis with the largest mean length
		unsigned axis = 0;
		double largestLength = 0.0;
		for (unsigned d = 0; d < m_axisRates.size(); ++d)
		{
			for (unsigned i = 0; i < m_axisRates[d].size(); ++i)
			{
				double length = -1.0 / m_axisRates[d].getValue(i, i);
				if (length > largestLength)
				{
					largestLength = length;
					axis = d;
				}
			}
		}
		GSVector3d lag(0, 0, 0);
		lag.u[axis] = h;
		return carleTransition(lag);
	}

	case PIECEWISE_LINEAR:
	{
		unsigned k = levelCount();
		if (h <= m_abscissas.front())
		{
			//left extrapolation (towards the identity)
			double x0 = m_abscissas.front();
			SquareMatrixd T(m_ordinates.front());
			T.scale(h / x0);
			for (unsigned i = 0; i < k; ++i)
			{
				T.m_values[i][i] += (x0 - h) / x0;
			}
			return T;
		}
		if (h > m_abscissas.back())
		{
			//right extrapolation
			return m_ordinateAtInfinity;
		}

		//middle interpolation
		size_t b = std::lower_bound(m_abscissas.begin(), m_abscissas.end(), h) - m_abscissas.begin();
		size_t a = b - 1;
		double xa = m_abscissas[a];
		double xb = m_abscissas[b];
		SquareMatrixd Ta(m_ordinates[a]);
		Ta.scale((xb - h) / (xb - xa));
		SquareMatrixd Tb(m_ordinates[b]);
		Tb.scale((h - xa) / (xb - xa));
		return Ta + Tb;
	}

	default:
		break;
	}

	SquareMatrixd T;
	EvaluateRangeFamily(m_family, h, range(), m_proportions, T);
	return T;
}

SquareMatrixd TransiogramModel::evaluate(const GSVector3d& p1, const GSVector3d& p2) const
{
	if (m_family == CARLE)
	{
		return carleTransition(p2 - p1);
	}

	return evaluate(m_ball.evaluate(p1, p2));
}

SquareMatrixd TransiogramModel::carleTransition(const GSVector3d& lag) const
{
	const unsigned k = levelCount();
	const unsigned axisCount = static_cast<unsigned>(m_axisRates.size());
	const std::vector<double>& p = m_proportions;

	//only the components of the modeled axes
	double h = 0.0;
	for (unsigned d = 0; d < axisCount; ++d)
	{
		h += lag.u[d] * lag.u[d];
	}
	h = std::sqrt(h);

	SquareMatrixd T(k);
	if (h == 0)
	{
		T.toIdentity();
		return T;
	}

	//Eq. 22: rates of the lag direction
	auto rate = [&](unsigned i, unsigned j)
	{
		double sum = 0.0;
		for (unsigned d = 0; d < axisCount; ++d)
		{
			const SquareMatrixd& R = m_axisRates[d];
			double w = (lag.u[d] >= 0 ? R.getValue(i, j) : (p[j] / p[i]) * R.getValue(j, i));
			sum += (lag.u[d] * w) * (lag.u[d] * w);
		}
		return (i == j ? -1.0 : 1.0) * std::sqrt(sum);
	};

	//Eq. 20 and 21: the last row keeps the proportions stationary, the last column makes the rows sum to zero
	SquareMatrixd Rh(k);
	for (unsigned i = 0; i + 1 < k; ++i)
	{
		for (unsigned j = 0; j + 1 < k; ++j)
		{
			Rh.m_values[i][j] = rate(i, j) / h;
		}
	}
	for (unsigned j = 0; j + 1 < k; ++j)
	{
		double sum = 0.0;
		for (unsigned i = 0; i + 1 < k; ++i)
		{
			sum += p[i] * Rh.m_values[i][j];
		}
		Rh.m_values[k - 1][j] = -sum / p[k - 1];
	}
	for (unsigned i = 0; i < k; ++i)
	{
		double sum = 0.0;
		for (unsigned j = 0; j + 1 < k; ++j)
		{
			sum += Rh.m_values[i][j];
		}
		Rh.m_values[i][k - 1] = -sum;
	}

	Rh.scale(h);
	return Rh.exp();
}
