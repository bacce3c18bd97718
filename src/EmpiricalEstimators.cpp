// SPDX-License-Identifier: LGPL-2.0-or-later
// Copyright © EDF R&D / TELECOM ParisTech (ENST-TSI)

#include <EmpiricalEstimators.h>

//System
#include <algorithm>
#include <cctype>
#include <cmath>

using namespace GeoStatsCoreLib;

//! Bias correction term of the Cressie-Hawkins estimator
static inline double CressieDenominator(std::size_t count)
{
	return 2.0 * (0.457 + 0.494 / static_cast<double>(count));
}

const char* EmpiricalEstimator::Name(ESTIMATOR_TYPE type)
{
	switch (type)
	{
	case MATHERON:
		return "matheron";
	case CRESSIE:
		return "cressie";
	case CARLE:
		return "carle";
	default:
		break;
	}

	return "invalid";
}

ErrorCode EmpiricalEstimator::FromName(const std::string& name, ESTIMATOR_TYPE& type)
{
	std::string lowerName(name);
	std::transform(lowerName.begin(), lowerName.end(), lowerName.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

	for (int t = MATHERON; t < INVALID_ESTIMATOR; ++t)
	{
		if (lowerName == Name(static_cast<ESTIMATOR_TYPE>(t)))
		{
			type = static_cast<ESTIMATOR_TYPE>(t);
			return SUCCESS;
		}
	}

	type = INVALID_ESTIMATOR;
	return ERROR_UNKNOWN_ESTIMATOR;
}

bool EmpiricalEstimator::AccumulateTerm(ESTIMATOR_TYPE type, double z1i, double z1j, double z2i, double z2j, bool oriented, Term& term)
{
	if (std::isnan(z1i) || std::isnan(z1j) || std::isnan(z2i) || std::isnan(z2j))
	{
		//missing value
		return false;
	}

	switch (type)
	{
	case MATHERON:
		term.value = (z1i - z1j) * (z2i - z2j);
		term.weight = 1.0;
		return true;

	case CRESSIE:
		term.value = std::pow(std::abs((z1i - z1j) * (z2i - z2j)), 0.25);
		term.weight = 1.0;
		return true;

	case CARLE:
		if (oriented)
		{
			//transition from the tail to the head
			term.value = z1i * z2j;
			term.weight = z1i;
		}
		else
		{
			//both transitions
			term.value = z1i * z2j + z1j * z2i;
			term.weight = z1i + z1j;
		}
		return true;

	default:
		break;
	}

	return false;
}

double EmpiricalEstimator::Normalize(ESTIMATOR_TYPE type, double valueSum, double weightSum, std::size_t count)
{
	if (count == 0)
	{
		return 0.0;
	}

	switch (type)
	{
	case MATHERON:
		return valueSum / (2.0 * count);

	case CRESSIE:
	{
		double mean = valueSum / count;
		double mean2 = mean * mean;
		return (mean2 * mean2) / CressieDenominator(count);
	}

	case CARLE:
		return (weightSum > 0 ? valueSum / weightSum : 0.0);

	default:
		break;
	}

	return 0.0;
}

double EmpiricalEstimator::Combine(ESTIMATOR_TYPE type, double yA, double wA, std::size_t nA, double yB, double wB, std::size_t nB)
{
	std::size_t n = nA + nB;
	if (n == 0)
	{
		return 0.0;
	}

	switch (type)
	{
	case MATHERON:
		return (yA * nA + yB * nB) / n;

	case CRESSIE:
	{
		//recover the mean of the square-root differences of each bin
		double mA = (nA != 0 ? std::pow(yA * CressieDenominator(nA), 0.25) : 0.0);
		double mB = (nB != 0 ? std::pow(yB * CressieDenominator(nB), 0.25) : 0.0);
		double mean = (mA * nA + mB * nB) / n;
		double mean2 = mean * mean;
		return (mean2 * mean2) / CressieDenominator(n);
	}

	case CARLE:
	{
		double w = wA + wB;
		return (w > 0 ? (yA * wA + yB * wB) / w : 0.0);
	}

	default:
		break;
	}

	return 0.0;
}
