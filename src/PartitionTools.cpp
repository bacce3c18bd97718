// SPDX-License-Identifier: LGPL-2.0-or-later
// Copyright © EDF R&D / TELECOM ParisTech (ENST-TSI)

#include <PartitionTools.h>

//Local
#include <Logger.h>

//System
#include <algorithm>
#include <array>
#include <map>
#include <numeric>
#include <random>

using namespace GeoStatsCoreLib;

ErrorCode PartitionTools::PredicatePartition(const GenericSampleSet& set, const PairPredicate& predicate, Partition& parts)
{
	parts.clear();

	unsigned count = set.size();
	try
	{
		std::vector<bool> assigned(count, false);

		for (unsigned i = 0; i < count; ++i)
		{
			if (assigned[i])
			{
				continue;
			}

			ReferenceSampleSet subset(&set);
			if (!subset.addPointIndex(i))
			{
				return ERROR_OUT_OF_MEMORY;
			}
			assigned[i] = true;

			for (unsigned j = i + 1; j < count; ++j)
			{
				if (!assigned[j] && predicate(i, j))
				{
					if (!subset.addPointIndex(j))
					{
						return ERROR_OUT_OF_MEMORY;
					}
					assigned[j] = true;
				}
			}

			parts.push_back(subset);
		}
	}
	catch (const std::bad_alloc&)
	{
		parts.clear();
		return ERROR_OUT_OF_MEMORY;
	}

	return SUCCESS;
}

ErrorCode PartitionTools::DirectionPartition(const GenericSampleSet& set, const GSVector3d& direction, double tolerance, Partition& parts)
{
	GSVector3d d = direction;
	if (d.norm2() == 0 || !(tolerance > 0))
	{
		Logger::Error("[DirectionPartition] Invalid direction or tolerance");
		return ERROR_INVALID_PARAMETER;
	}
	d.normalize();

	return PredicatePartition(set, [&](unsigned i, unsigned j)
		{
			GSVector3d delta = set.getPoint(j) - set.getPoint(i);
			GSVector3d orthogonalPart = delta - d * delta.dot(d);
			return orthogonalPart.norm() < tolerance;
		}, parts);
}

ErrorCode PartitionTools::PlanePartition(const GenericSampleSet& set, const GSVector3d& normal, double tolerance, Partition& parts)
{
	GSVector3d n = normal;
	if (n.norm2() == 0 || !(tolerance > 0))
	{
		Logger::Error("[PlanePartition] Invalid normal or tolerance");
		return ERROR_INVALID_PARAMETER;
	}
	n.normalize();

	return PredicatePartition(set, [&](unsigned i, unsigned j)
		{
			GSVector3d delta = set.getPoint(j) - set.getPoint(i);
			return std::abs(delta.dot(n)) < tolerance;
		}, parts);
}

ErrorCode PartitionTools::BlockPartition(const GenericSampleSet& set, const GSVector3d& sides, Partition& parts)
{
	parts.clear();

	unsigned dim = set.dimension();
	for (unsigned d = 0; d < dim; ++d)
	{
		if (!(sides.u[d] > 0))
		{
			Logger::Error("[BlockPartition] Block sides must be positive");
			return ERROR_INVALID_PARAMETER;
		}
	}

	GSVector3d bbMin, bbMax;
	if (!set.getBoundingBox(bbMin, bbMax))
	{
		//empty set
		return SUCCESS;
	}

	try
	{
		std::map< std::array<long long, 3>, ReferenceSampleSet > blocks;
		for (unsigned i = 0; i < set.size(); ++i)
		{
			const GSVector3d& P = set.getPoint(i);
			std::array<long long, 3> key{ { 0, 0, 0 } };
			for (unsigned d = 0; d < dim; ++d)
			{
				key[d] = static_cast<long long>(std::floor((P.u[d] - bbMin.u[d]) / sides.u[d]));
			}

			auto it = blocks.find(key);
			if (it == blocks.end())
			{
				it = blocks.emplace(key, ReferenceSampleSet(&set)).first;
			}
			if (!it->second.addPointIndex(i))
			{
				return ERROR_OUT_OF_MEMORY;
			}
		}

		parts.reserve(blocks.size());
		for (auto& block : blocks)
		{
			parts.push_back(block.second);
		}
	}
	catch (const std::bad_alloc&)
	{
		parts.clear();
		return ERROR_OUT_OF_MEMORY;
	}

	return SUCCESS;
}

ErrorCode PartitionTools::RandomPartition(const GenericSampleSet& set, unsigned count, unsigned seed, Partition& parts)
{
	parts.clear();

	if (count == 0)
	{
		Logger::Error("[RandomPartition] Number of subsets must be positive");
		return ERROR_INVALID_PARAMETER;
	}

	try
	{
		std::vector<unsigned> indexes(set.size());
		std::iota(indexes.begin(), indexes.end(), 0u);

		std::mt19937 gen(seed);
		std::shuffle(indexes.begin(), indexes.end(), gen);

		unsigned subsetCount = std::min(count, std::max(1u, set.size()));
		parts.resize(subsetCount, ReferenceSampleSet(&set));

		for (size_t k = 0; k < indexes.size(); ++k)
		{
			if (!parts[k % subsetCount].addPointIndex(indexes[k]))
			{
				parts.clear();
				return ERROR_OUT_OF_MEMORY;
			}
		}
	}
	catch (const std::bad_alloc&)
	{
		parts.clear();
		return ERROR_OUT_OF_MEMORY;
	}

	return SUCCESS;
}

bool PartitionTools::HouseholderBasis(const GSVector3d& normal, GSVector3d& u, GSVector3d& v)
{
	GSVector3d n = normal;
	if (n.norm2() == 0)
	{
		return false;
	}
	n.normalize();

	//index of the largest component
	unsigned i = 0;
	for (unsigned d = 1; d < 3; ++d)
	{
		if (std::abs(n.u[d]) > std::abs(n.u[i]))
			i = d;
	}

	//Householder vector (reflects n onto the ith axis)
	GSVector3d w = n;
	w.u[i] += (n.u[i] < 0 ? -1.0 : 1.0);
	double w2 = w.norm2();

	//the two other columns of H = I - 2 w.w^T / w^T.w
	GSVector3d columns[2];
	unsigned c = 0;
	for (unsigned j = 0; j < 3; ++j)
	{
		if (j == i)
			continue;

		GSVector3d col;
		for (unsigned r = 0; r < 3; ++r)
		{
			col.u[r] = (r == j ? 1.0 : 0.0) - 2.0 * w.u[r] * w.u[j] / w2;
		}
		columns[c++] = col;
	}

	u = columns[0];
	v = columns[1];

	return true;
}
