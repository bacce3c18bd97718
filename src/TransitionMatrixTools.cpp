// SPDX-License-Identifier: LGPL-2.0-or-later
// Copyright © EDF R&D / TELECOM ParisTech (ENST-TSI)

#include <TransitionMatrixTools.h>

//Local
#include <DistanceFunction.h>
#include <Logger.h>

//System
#include <algorithm>
#include <cmath>

using namespace GeoStatsCoreLib;

double TransitionMatrixTools::DefaultMinLag(const GenericSampleSet& set)
{
	unsigned count = set.size();
	if (count < 2)
	{
		return 0.0;
	}

	DistanceFunction euclidean;
	double minDist = euclidean(set.getPoint(0), set.getPoint(1));
	for (unsigned i = 1; i + 1 < count; ++i)
	{
		minDist = std::min(minDist, euclidean(set.getPoint(i), set.getPoint(i + 1)));
	}

	return minDist / 2;
}

ErrorCode TransitionMatrixTools::CountMatrix(const GenericSampleSet& set, int field, SquareMatrixd& counts, double minlag/*=NAN_VALUE*/)
{
	unsigned n = set.size();
	if (n < 2)
	{
		Logger::Error("[TransitionMatrixTools] %s", ErrorCodeToString(ERROR_TOO_FEW_SAMPLES));
		return ERROR_TOO_FEW_SAMPLES;
	}

	const ScalarField* sf = set.getScalarField(field);
	if (!sf || !sf->isCategorical())
	{
		Logger::Error("[TransitionMatrixTools] Count matrix only defined for categorical variables");
		return ERROR_UNKNOWN_VARIABLE;
	}

	if (std::isnan(minlag))
	{
		minlag = DefaultMinLag(set);
	}
	if (!(minlag > 0))
	{
		Logger::Error("[TransitionMatrixTools] Invalid minimum lag (%g)", minlag);
		return ERROR_INVALID_MAX_LAG;
	}

	unsigned k = static_cast<unsigned>(sf->getLevels().size());
	counts = SquareMatrixd(k);
	if (!counts.isValid())
	{
		return ERROR_OUT_OF_MEMORY;
	}

	DistanceFunction euclidean;
	auto halfSteps = [&](unsigned i, unsigned j)
	{
		double h = euclidean(set.getPoint(i), set.getPoint(j));
		return std::ceil(h / (2 * minlag));
	};

	//update counts along the trajectory
	for (unsigned i = 0; i + 1 < n; ++i)
	{
		int c1 = sf->getLevelCode(set.getRootIndex(i));
		int c2 = sf->getLevelCode(set.getRootIndex(i + 1));
		if (c1 < 0 || c2 < 0)
		{
			continue;
		}

		double m = halfSteps(i, i + 1);
		counts.m_values[c1][c1] += m;
		counts.m_values[c2][c2] += m;
		counts.m_values[c1][c2] += 1;
	}

	//head of the first element
	int first = sf->getLevelCode(set.getRootIndex(0));
	if (first >= 0)
	{
		counts.m_values[first][first] += halfSteps(0, 1);
	}

	//tail of the last element
	int last = sf->getLevelCode(set.getRootIndex(n - 1));
	if (last >= 0)
	{
		counts.m_values[last][last] += halfSteps(n - 2, n - 1);
	}

	return SUCCESS;
}

ErrorCode TransitionMatrixTools::ProbabilityMatrix(const GenericSampleSet& set, int field, SquareMatrixd& probabilities, double minlag/*=NAN_VALUE*/)
{
	SquareMatrixd counts;
	ErrorCode result = CountMatrix(set, field, counts, minlag);
	if (result != SUCCESS)
	{
		return result;
	}

	unsigned k = counts.size();
	probabilities = SquareMatrixd(k);
	for (unsigned r = 0; r < k; ++r)
	{
		//Laplace smoothing
		double rowSum = counts.rowSum(r) + k;
		for (unsigned c = 0; c < k; ++c)
		{
			probabilities.m_values[r][c] = (counts.m_values[r][c] + 1) / rowSum;
		}
	}

	return SUCCESS;
}

ErrorCode TransitionMatrixTools::RateMatrix(const GenericSampleSet& set, int field, SquareMatrixd& rates, double minlag/*=NAN_VALUE*/)
{
	if (std::isnan(minlag))
	{
		minlag = DefaultMinLag(set);
	}

	SquareMatrixd probabilities;
	ErrorCode result = ProbabilityMatrix(set, field, probabilities, minlag);
	if (result != SUCCESS)
	{
		return result;
	}

	rates = probabilities.log();
	if (!rates.isValid())
	{
		Logger::Error("[TransitionMatrixTools] The logarithm of the transition probability matrix can't be computed");
		return ERROR_INVALID_INPUT;
	}
	rates.scale(1.0 / minlag);

	return SUCCESS;
}

ErrorCode TransitionMatrixTools::BaseRateMatrix(const std::vector<double>& lengths, const std::vector<double>& proportions, SquareMatrixd& rates)
{
	if (lengths.size() != proportions.size() || lengths.empty())
	{
		Logger::Error("[TransitionMatrixTools] Lengths and proportions must have the same size");
		return ERROR_INVALID_PARAMETER;
	}

	for (size_t i = 0; i < lengths.size(); ++i)
	{
		if (!(proportions[i] >= 0 && proportions[i] <= 1))
		{
			Logger::Error("[TransitionMatrixTools] Proportions must be in interval [0, 1]");
			return ERROR_INVALID_PARAMETER;
		}
		if (!(lengths[i] > 0))
		{
			Logger::Error("[TransitionMatrixTools] Mean lengths must be positive");
			return ERROR_INVALID_PARAMETER;
		}
	}

	unsigned k = static_cast<unsigned>(lengths.size());
	rates = SquareMatrixd(k);
	for (unsigned i = 0; i < k; ++i)
	{
		for (unsigned j = 0; j < k; ++j)
		{
			rates.m_values[i][j] = (i == j ? -1.0 / lengths[i] : (proportions[j] / (1 - proportions[i])) / lengths[i]);
		}
	}

	return SUCCESS;
}
