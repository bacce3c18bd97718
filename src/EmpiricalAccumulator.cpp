// SPDX-License-Identifier: LGPL-2.0-or-later
// Copyright © EDF R&D / TELECOM ParisTech (ENST-TSI)

#include <EmpiricalAccumulator.h>

//Local
#include <Logger.h>

//System
#include <algorithm>
#include <cassert>
#include <cctype>
#include <cmath>
#include <map>
#include <memory>
#include <utility>

//nanoflann
#include <nanoflann.hpp>

using namespace GeoStatsCoreLib;

namespace
{
	//! Exhaustive search
	/** neighbors(j) = {j+1, ..., N-1}, no skip, exit beyond the maximum lag
	**/
	class FullSearch
	{
	public:

		FullSearch(const GenericSampleSet& set, double maxlag)
			: m_count(set.size())
			, m_maxlag(maxlag)
		{}

		bool neighbors(unsigned j, std::vector<unsigned>& indexes)
		{
			indexes.clear();
			for (unsigned i = j + 1; i < m_count; ++i)
			{
				indexes.push_back(i);
			}
			return true;
		}

		inline bool skip(unsigned /*i*/, unsigned /*j*/) const { return false; }

		inline bool exit(double h) const { return h > m_maxlag; }

	protected:

		unsigned m_count;
		double m_maxlag;
	};

	//! Ball search (kd-tree radius queries)
	/** neighbors(j) = samples inside the ball of radius maxlag centered on j,
		skip(i, j) = (i <= j) as the query is symmetric.
		Neighbors are sorted by index so that the pairs are visited in the
		same order as with the exhaustive search.
	**/
	class BallSearch
	{
	public:

		struct NFWrapper
		{
			NFWrapper(const GenericSampleSet& set)
				: setRef(set)
			{}

			// Must return the number of data points
			inline size_t kdtree_get_point_count() const { return setRef.size(); }

			// Returns the dim'th component of the idx'th point in the class
			inline double kdtree_get_pt(size_t idx, size_t dim) const
			{
				return setRef.getPoint(static_cast<unsigned>(idx)).u[dim];
			}

			// Optional bounding-box computation: return false to default to a standard
			// bbox computation loop.
			template <class BBOX>
			bool kdtree_get_bbox(BBOX& /*bb*/) const
			{
				return false;
			}

			const GenericSampleSet& setRef;
		};

		using KdTreeType = nanoflann::KDTreeSingleIndexAdaptor<
			nanoflann::L2_Simple_Adaptor<double, NFWrapper>,
			NFWrapper, /*dim=*/-1>;

		BallSearch(const GenericSampleSet& set, double maxlag, const DistanceFunction& distance)
			: m_nfWrapper(set)
			, m_maxlag(maxlag)
		{
			//the metric ball is included in the Euclidean ball of radius k.maxlag
			double radius = maxlag * distance.euclideanBoundFactor(set.dimension());
			//squared radius (L2_Simple_Adaptor), slightly enlarged so that no boundary point is missed
			m_searchRadius = radius * radius * (1.0 + 1.0e-9);

			m_kdTree.reset(new KdTreeType(static_cast<int>(set.dimension()), m_nfWrapper, { /*max leaf=*/10 }));
		}

		bool neighbors(unsigned j, std::vector<unsigned>& indexes)
		{
			indexes.clear();

			const GSVector3d& query = m_nfWrapper.setRef.getPoint(j);

			nanoflann::SearchParams searchParams;
			searchParams.sorted = false;
			m_matches.clear();
			m_kdTree->radiusSearch(query.u, m_searchRadius, m_matches, searchParams);

			for (const std::pair<size_t, double>& match : m_matches)
			{
				indexes.push_back(static_cast<unsigned>(match.first));
			}
			std::sort(indexes.begin(), indexes.end());

			return true;
		}

		inline bool skip(unsigned i, unsigned j) const { return i <= j; }

		//! The radius query may return a superset of the metric ball
		inline bool exit(double h) const { return h > m_maxlag; }

	protected:

		NFWrapper m_nfWrapper;
		std::unique_ptr<KdTreeType> m_kdTree;
		std::vector< std::pair<size_t, double> > m_matches;
		double m_maxlag;
		double m_searchRadius;
	};

	//! Values of a variable (or of the indicator of one of its levels) for each sample
	bool LoadVariable(const GenericSampleSet& set, int field, int level, std::vector<double>& values)
	{
		const ScalarField* sf = set.getScalarField(field);
		if (!sf)
		{
			return false;
		}

		unsigned count = set.size();
		values.resize(count);
		for (unsigned i = 0; i < count; ++i)
		{
			unsigned rootIndex = set.getRootIndex(i);
			if (level < 0)
			{
				values[i] = sf->getValue(rootIndex);
			}
			else
			{
				int code = sf->getLevelCode(rootIndex);
				values[i] = (code < 0 ? NAN_VALUE : (code == level ? 1.0 : 0.0));
			}
		}

		return true;
	}

	//! Main accumulation loop
	template <class SearchStrategy> void AccumulatePairs(	SearchStrategy& search,
															const GenericSampleSet& set,
															const EmpiricalAccumulator::Params& params,
															const std::vector<const std::vector<double>*>& z1,
															const std::vector<const std::vector<double>*>& z2,
															std::vector<EmpiricalAccumulator::ChannelSums>& sums,
															std::size_t& duplicateCount)
	{
		const double lagSize = params.maxlag / params.nlags;
		const bool oriented = (params.orientation.norm2() != 0);
		const size_t channelCount = sums.size();

		duplicateCount = 0;
		std::vector<unsigned> neighbors;

		for (unsigned j = 0; j < set.size(); ++j)
		{
			const GSVector3d& Pj = set.getPoint(j);

			search.neighbors(j, neighbors);

			for (unsigned i : neighbors)
			{
				// skip to avoid double counting
				if (search.skip(i, j))
				{
					continue;
				}

				const GSVector3d& Pi = set.getPoint(i);

				double h = params.distance(Pi, Pj);

				// out of range
				if (search.exit(h))
				{
					continue;
				}

				double lag = std::ceil(h / lagSize);
				if (lag == 0)
				{
					//coincident locations
					++duplicateCount;
					continue;
				}
				if (!(lag <= params.nlags))
				{
					continue;
				}
				unsigned bin = static_cast<unsigned>(lag) - 1;

				//tail and head of the pair (the tail has the lowest projection on the orientation)
				unsigned tail = j;
				unsigned head = i;
				if (oriented && params.orientation.dot(Pi - Pj) < 0)
				{
					std::swap(tail, head);
				}

				for (size_t c = 0; c < channelCount; ++c)
				{
					EmpiricalEstimator::Term term;
					if (EmpiricalEstimator::AccumulateTerm(	params.estimator,
															(*z1[c])[tail], (*z1[c])[head],
															(*z2[c])[tail], (*z2[c])[head],
															oriented,
															term))
					{
						EmpiricalAccumulator::ChannelSums& channel = sums[c];
						++channel.counts[bin];
						channel.lagSums[bin] += h;
						channel.valueSums[bin] += term.value;
						channel.weightSums[bin] += term.weight;
					}
				}
			}
		}
	}
}

const char* EmpiricalAccumulator::AlgorithmName(SEARCH_ALGORITHM algorithm)
{
	switch (algorithm)
	{
	case FULL_SEARCH:
		return "full";
	case BALL_SEARCH:
		return "ball";
	default:
		break;
	}

	return "invalid";
}

ErrorCode EmpiricalAccumulator::AlgorithmFromName(const std::string& name, SEARCH_ALGORITHM& algorithm)
{
	std::string lowerName(name);
	std::transform(lowerName.begin(), lowerName.end(), lowerName.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

	for (int a = FULL_SEARCH; a < INVALID_SEARCH; ++a)
	{
		if (lowerName == AlgorithmName(static_cast<SEARCH_ALGORITHM>(a)))
		{
			algorithm = static_cast<SEARCH_ALGORITHM>(a);
			return SUCCESS;
		}
	}

	algorithm = INVALID_SEARCH;
	return ERROR_UNKNOWN_ALGORITHM;
}

ErrorCode EmpiricalAccumulator::CheckParams(const GenericSampleSet& set, const Params& params)
{
	if (set.size() < 2)
	{
		Logger::Error("[EmpiricalAccumulator] %s (%u sample(s))", ErrorCodeToString(ERROR_TOO_FEW_SAMPLES), set.size());
		return ERROR_TOO_FEW_SAMPLES;
	}

	if (params.nlags == 0)
	{
		Logger::Error("[EmpiricalAccumulator] %s", ErrorCodeToString(ERROR_INVALID_LAG_COUNT));
		return ERROR_INVALID_LAG_COUNT;
	}

	if (!std::isfinite(params.maxlag) || params.maxlag <= 0)
	{
		Logger::Error("[EmpiricalAccumulator] %s (%g)", ErrorCodeToString(ERROR_INVALID_MAX_LAG), params.maxlag);
		return ERROR_INVALID_MAX_LAG;
	}

	if (params.estimator < MATHERON || params.estimator >= INVALID_ESTIMATOR)
	{
		Logger::Error("[EmpiricalAccumulator] %s", ErrorCodeToString(ERROR_UNKNOWN_ESTIMATOR));
		return ERROR_UNKNOWN_ESTIMATOR;
	}

	if (params.algorithm < FULL_SEARCH || params.algorithm >= INVALID_SEARCH)
	{
		Logger::Error("[EmpiricalAccumulator] %s", ErrorCodeToString(ERROR_UNKNOWN_ALGORITHM));
		return ERROR_UNKNOWN_ALGORITHM;
	}

	if (!params.distance.isValid())
	{
		Logger::Error("[EmpiricalAccumulator] Invalid %s distance", params.distance.name().c_str());
		return ERROR_INVALID_PARAMETER;
	}

	return SUCCESS;
}

ErrorCode EmpiricalAccumulator::Accumulate(	const GenericSampleSet& set,
											const std::vector<VariablePair>& pairs,
											const Params& params,
											std::vector<ChannelSums>& sums)
{
	sums.clear();

	ErrorCode result = CheckParams(set, params);
	if (result != SUCCESS)
	{
		return result;
	}

	if (pairs.empty())
	{
		Logger::Error("[EmpiricalAccumulator] No variable to accumulate");
		return ERROR_INVALID_INPUT;
	}

	//check the variables
	for (const VariablePair& pair : pairs)
	{
		const ScalarField* sf1 = set.getScalarField(pair.field1);
		const ScalarField* sf2 = set.getScalarField(pair.field2);
		if (!sf1 || !sf2)
		{
			Logger::Error("[EmpiricalAccumulator] %s", ErrorCodeToString(ERROR_UNKNOWN_VARIABLE));
			return ERROR_UNKNOWN_VARIABLE;
		}
		if (	(pair.level1 >= 0 && pair.level1 >= static_cast<int>(sf1->getLevels().size()))
			||	(pair.level2 >= 0 && pair.level2 >= static_cast<int>(sf2->getLevels().size())) )
		{
			Logger::Error("[EmpiricalAccumulator] Unknown level of categorical variable '%s'", sf1->getName().c_str());
			return ERROR_UNKNOWN_VARIABLE;
		}
	}

	//ball search requires a metric of the Minkowski family
	SEARCH_ALGORITHM algorithm = params.algorithm;
	if (algorithm == BALL_SEARCH && !params.distance.isMinkowskiFamily())
	{
		Logger::Warning("[EmpiricalAccumulator] Ball search requires a Minkowski metric (%s distance), falling back to full search", params.distance.name().c_str());
		algorithm = FULL_SEARCH;
	}

	std::size_t duplicateCount = 0;
	try
	{
		//load each distinct variable once
		std::map< std::pair<int, int>, std::vector<double> > variables;
		for (const VariablePair& pair : pairs)
		{
			std::pair<int, int> key1(pair.field1, pair.level1);
			if (variables.find(key1) == variables.end())
			{
				LoadVariable(set, pair.field1, pair.level1, variables[key1]);
			}
			std::pair<int, int> key2(pair.field2, pair.level2);
			if (variables.find(key2) == variables.end())
			{
				LoadVariable(set, pair.field2, pair.level2, variables[key2]);
			}
		}

		std::vector<const std::vector<double>*> z1, z2;
		z1.reserve(pairs.size());
		z2.reserve(pairs.size());
		for (const VariablePair& pair : pairs)
		{
			z1.push_back(&variables[std::make_pair(pair.field1, pair.level1)]);
			z2.push_back(&variables[std::make_pair(pair.field2, pair.level2)]);
		}

		sums.resize(pairs.size());
		for (ChannelSums& channel : sums)
		{
			channel.counts.assign(params.nlags, 0);
			channel.lagSums.assign(params.nlags, 0.0);
			channel.valueSums.assign(params.nlags, 0.0);
			channel.weightSums.assign(params.nlags, 0.0);
		}

		switch (algorithm)
		{
		case FULL_SEARCH:
		{
			FullSearch search(set, params.maxlag);
			AccumulatePairs(search, set, params, z1, z2, sums, duplicateCount);
		}
		break;

		case BALL_SEARCH:
		{
			BallSearch search(set, params.maxlag, params.distance);
			AccumulatePairs(search, set, params, z1, z2, sums, duplicateCount);
		}
		break;

		default:
			assert(false);
			return ERROR_UNKNOWN_ALGORITHM;
		}
	}
	catch (const std::bad_alloc&)
	{
		sums.clear();
		return ERROR_OUT_OF_MEMORY;
	}

	if (duplicateCount != 0)
	{
		Logger::Warning("[EmpiricalAccumulator] Duplicate coordinates found (%zu pair(s) ignored)", duplicateCount);
	}

	return SUCCESS;
}
