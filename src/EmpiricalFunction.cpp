// SPDX-License-Identifier: LGPL-2.0-or-later
// Copyright © EDF R&D / TELECOM ParisTech (ENST-TSI)

#include <EmpiricalFunction.h>

//Local
#include <Logger.h>

//System
#include <algorithm>
#include <cmath>
#include <numeric>

using namespace GeoStatsCoreLib;

EmpiricalFunction::EmpiricalFunction()
	: m_kind(VARIOGRAM)
	, m_estimator(INVALID_ESTIMATOR)
	, m_nlags(0)
	, m_maxlag(0.0)
	, m_levelCount(0)
{
}

EmpiricalFunction::EmpiricalFunction(	Kind kind,
										const DistanceFunction& distance,
										ESTIMATOR_TYPE estimator,
										unsigned nlags,
										double maxlag,
										unsigned levelCount/*=1*/)
	: m_kind(kind)
	, m_distance(distance)
	, m_estimator(estimator)
	, m_nlags(nlags)
	, m_maxlag(maxlag)
	, m_levelCount(kind == TRANSIOGRAM ? std::max(1u, levelCount) : 1u)
	, m_counts(nlags, 0)
	, m_abscissas(nlags)
{
	unsigned channelCount = m_levelCount * m_levelCount;
	m_ordinates.resize(channelCount, std::vector<double>(nlags, 0.0));
	m_weights.resize(channelCount, std::vector<double>(nlags, 0.0));

	for (unsigned k = 0; k < nlags; ++k)
	{
		m_abscissas[k] = nominalAbscissa(k);
	}
}

ErrorCode EmpiricalFunction::FromBins(	Kind kind,
										const std::vector<std::size_t>& counts,
										const std::vector<double>& abscissas,
										const std::vector< std::vector<double> >& ordinates,
										double maxlag,
										EmpiricalFunction& function)
{
	unsigned nlags = static_cast<unsigned>(counts.size());
	if (nlags == 0 || abscissas.size() != nlags || ordinates.empty())
	{
		Logger::Error("[EmpiricalFunction] Inconsistent bins");
		return ERROR_INVALID_INPUT;
	}

	unsigned levelCount = 1;
	if (kind == TRANSIOGRAM)
	{
		levelCount = static_cast<unsigned>(std::lround(std::sqrt(static_cast<double>(ordinates.size()))));
		if (levelCount * levelCount != ordinates.size())
		{
			Logger::Error("[EmpiricalFunction] Transiogram ordinates must be given for each pair of categories");
			return ERROR_INVALID_INPUT;
		}
	}
	else if (ordinates.size() != 1)
	{
		Logger::Error("[EmpiricalFunction] Variogram ordinates must have a single channel");
		return ERROR_INVALID_INPUT;
	}

	for (const std::vector<double>& channel : ordinates)
	{
		if (channel.size() != nlags)
		{
			Logger::Error("[EmpiricalFunction] Inconsistent bins");
			return ERROR_INVALID_INPUT;
		}
	}

	if (std::isnan(maxlag))
	{
		maxlag = abscissas.back();
	}
	if (!(maxlag > 0))
	{
		return ERROR_INVALID_MAX_LAG;
	}

	try
	{
		function = EmpiricalFunction(kind, DistanceFunction(), kind == TRANSIOGRAM ? CARLE : MATHERON, nlags, maxlag, levelCount);
		for (unsigned k = 0; k < nlags; ++k)
		{
			function.setBin(k, counts[k], counts[k] != 0 ? abscissas[k] : function.nominalAbscissa(k));
			for (unsigned c = 0; c < ordinates.size(); ++c)
			{
				if (counts[k] != 0)
				{
					function.setChannelBin(c, k, ordinates[c][k], static_cast<double>(counts[k]));
				}
			}
		}
	}
	catch (const std::bad_alloc&)
	{
		function = EmpiricalFunction();
		return ERROR_OUT_OF_MEMORY;
	}

	return SUCCESS;
}

bool EmpiricalFunction::hasSameIdentity(const EmpiricalFunction& other) const
{
	return m_kind == other.m_kind
		&& m_distance == other.m_distance
		&& m_estimator == other.m_estimator
		&& m_nlags == other.m_nlags
		&& m_maxlag == other.m_maxlag
		&& m_levelCount == other.m_levelCount
		&& m_ordinates.size() == other.m_ordinates.size();
}

ErrorCode EmpiricalFunction::Merge(const EmpiricalFunction& A, const EmpiricalFunction& B, EmpiricalFunction& result)
{
	if (!A.isValid() || !B.isValid())
	{
		return ERROR_INVALID_INPUT;
	}

	if (!A.hasSameIdentity(B))
	{
		Logger::Error("[EmpiricalFunction] Can't merge functions with different distances, estimators or bins");
		return ERROR_INCOMPATIBLE_FUNCTIONS;
	}

	try
	{
		EmpiricalFunction merged(A);

		for (unsigned k = 0; k < A.m_nlags; ++k)
		{
			std::size_t nA = A.m_counts[k];
			std::size_t nB = B.m_counts[k];
			std::size_t n = nA + nB;

			//count-weighted mean lag (empty bins keep the first abscissa)
			double x = (n != 0 ? (A.m_abscissas[k] * nA + B.m_abscissas[k] * nB) / n : A.m_abscissas[k]);
			merged.setBin(k, n, x);

			for (unsigned c = 0; c < A.channelCount(); ++c)
			{
				double wA = A.m_weights[c][k];
				double wB = B.m_weights[c][k];
				double y = (n != 0 ? EmpiricalEstimator::Combine(A.m_estimator, A.m_ordinates[c][k], wA, nA, B.m_ordinates[c][k], wB, nB) : 0.0);
				merged.setChannelBin(c, k, y, wA + wB);
			}
		}

		if (merged.m_levels.empty())
		{
			merged.m_levels = B.m_levels;
		}

		result = merged;
	}
	catch (const std::bad_alloc&)
	{
		return ERROR_OUT_OF_MEMORY;
	}

	return SUCCESS;
}

std::size_t EmpiricalFunction::totalCount() const
{
	return std::accumulate(m_counts.begin(), m_counts.end(), static_cast<std::size_t>(0));
}

SquareMatrixd EmpiricalFunction::ordinateMatrix(unsigned bin) const
{
	SquareMatrixd M(m_levelCount);
	for (unsigned i = 0; i < m_levelCount; ++i)
	{
		for (unsigned j = 0; j < m_levelCount; ++j)
		{
			M.setValue(i, j, m_ordinates[i * m_levelCount + j][bin]);
		}
	}

	return M;
}

double EmpiricalFunction::maxOrdinate() const
{
	double maxValue = 0.0;
	bool first = true;
	for (unsigned k = 0; k < m_nlags; ++k)
	{
		if (m_counts[k] == 0)
		{
			continue;
		}
		for (const std::vector<double>& channel : m_ordinates)
		{
			if (first || channel[k] > maxValue)
			{
				maxValue = channel[k];
				first = false;
			}
		}
	}

	return maxValue;
}
