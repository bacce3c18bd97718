// SPDX-License-Identifier: LGPL-2.0-or-later
// Copyright © EDF R&D / TELECOM ParisTech (ENST-TSI)

#include <EmpiricalFunctionTools.h>

//Local
#include <Logger.h>
#include <SampleSet.h>

//System
#include <algorithm>
#include <cassert>
#include <cmath>

#ifdef GS_CORE_LIB_USES_TBB
#include <tbb/parallel_for.h>
#endif

using namespace GeoStatsCoreLib;

double EmpiricalFunctionTools::DefaultMaxLag(const GenericSampleSet& set, EmpiricalFunction::Kind kind)
{
	GSVector3d bbMin;
	GSVector3d bbMax;
	if (!set.getBoundingBox(bbMin, bbMax))
	{
		return 0.0;
	}

	//smallest non-degenerate side
	double minSide = 0.0;
	for (unsigned d = 0; d < set.dimension(); ++d)
	{
		double side = bbMax.u[d] - bbMin.u[d];
		if (side > 0 && (minSide == 0 || side < minSide))
		{
			minSide = side;
		}
	}

	return (kind == EmpiricalFunction::TRANSIOGRAM ? minSide / 2 : minSide / 10);
}

ErrorCode EmpiricalFunctionTools::ResolveParams(const GenericSampleSet& set,
												EmpiricalFunction::Kind kind,
												const EmpiricalParams& params,
												EmpiricalParams& resolved)
{
	resolved = params;

	if (std::isnan(resolved.maxlag))
	{
		resolved.maxlag = DefaultMaxLag(set, kind);
	}

	if (resolved.estimator == INVALID_ESTIMATOR)
	{
		resolved.estimator = (kind == EmpiricalFunction::TRANSIOGRAM ? CARLE : MATHERON);
	}
	else if (EmpiricalEstimator::IsRatioEstimator(resolved.estimator) != (kind == EmpiricalFunction::TRANSIOGRAM))
	{
		Logger::Error("[EmpiricalFunctionTools] The %s estimator can't be used for %s",
			EmpiricalEstimator::Name(resolved.estimator),
			kind == EmpiricalFunction::TRANSIOGRAM ? "transiograms" : "variograms");
		return ERROR_UNKNOWN_ESTIMATOR;
	}

	return SUCCESS;
}

ErrorCode EmpiricalFunctionTools::GetVariablePairs(	const GenericSampleSet& set,
													EmpiricalFunction::Kind kind,
													int field1,
													int field2,
													std::vector<EmpiricalAccumulator::VariablePair>& pairs,
													unsigned& levelCount)
{
	pairs.clear();
	levelCount = 1;

	if (kind == EmpiricalFunction::VARIOGRAM)
	{
		pairs.emplace_back(field1, field2);
		return SUCCESS;
	}

	const ScalarField* sf = set.getScalarField(field1);
	if (!sf || !sf->isCategorical())
	{
		Logger::Error("[EmpiricalFunctionTools] Transiograms require a categorical variable");
		return ERROR_UNKNOWN_VARIABLE;
	}

	levelCount = static_cast<unsigned>(sf->getLevels().size());
	try
	{
		pairs.reserve(levelCount * levelCount);
		for (unsigned i = 0; i < levelCount; ++i)
		{
			for (unsigned j = 0; j < levelCount; ++j)
			{
				pairs.emplace_back(field1, field1, static_cast<int>(i), static_cast<int>(j));
			}
		}
	}
	catch (const std::bad_alloc&)
	{
		//not enough memory
		return ERROR_OUT_OF_MEMORY;
	}

	return SUCCESS;
}

ErrorCode EmpiricalFunctionTools::BuildFunction(EmpiricalFunction::Kind kind,
												const EmpiricalParams& resolved,
												unsigned levelCount,
												const std::vector<EmpiricalAccumulator::ChannelSums>& sums,
												std::size_t firstChannel,
												EmpiricalFunction& function)
{
	unsigned channelCount = (kind == EmpiricalFunction::TRANSIOGRAM ? levelCount * levelCount : 1);
	if (firstChannel + channelCount > sums.size())
	{
		assert(false);
		return ERROR_INVALID_INPUT;
	}

	try
	{
		function = EmpiricalFunction(kind, resolved.distance, resolved.estimator, resolved.nlags, resolved.maxlag, levelCount);
	}
	catch (const std::bad_alloc&)
	{
		//not enough memory
		return ERROR_OUT_OF_MEMORY;
	}

	//all the channels of a transiogram share the same pairs (same missing values)
	const EmpiricalAccumulator::ChannelSums& reference = sums[firstChannel];

	for (unsigned k = 0; k < resolved.nlags; ++k)
	{
		std::size_t n = reference.counts[k];
		function.setBin(k, n, n != 0 ? reference.lagSums[k] / n : function.nominalAbscissa(k));

		for (unsigned c = 0; c < channelCount; ++c)
		{
			const EmpiricalAccumulator::ChannelSums& channel = sums[firstChannel + c];
			double y = EmpiricalEstimator::Normalize(resolved.estimator, channel.valueSums[k], channel.weightSums[k], channel.counts[k]);
			function.setChannelBin(c, k, y, channel.weightSums[k]);
		}
	}

	function.setUnits(resolved.lagUnit, resolved.valueUnit);

	return SUCCESS;
}

ErrorCode EmpiricalFunctionTools::ComputeResolved(	const GenericSampleSet& set,
													EmpiricalFunction::Kind kind,
													int field1,
													int field2,
													const EmpiricalParams& resolved,
													const GSVector3d& orientation,
													EmpiricalFunction& function)
{
	std::vector<EmpiricalAccumulator::VariablePair> pairs;
	unsigned levelCount = 1;
	ErrorCode result = GetVariablePairs(set, kind, field1, field2, pairs, levelCount);
	if (result != SUCCESS)
	{
		return result;
	}

	EmpiricalAccumulator::Params accParams;
	accParams.nlags = resolved.nlags;
	accParams.maxlag = resolved.maxlag;
	accParams.distance = resolved.distance;
	accParams.estimator = resolved.estimator;
	accParams.algorithm = resolved.algorithm;
	accParams.orientation = orientation;

	std::vector<EmpiricalAccumulator::ChannelSums> sums;
	result = EmpiricalAccumulator::Accumulate(set, pairs, accParams, sums);
	if (result != SUCCESS)
	{
		return result;
	}

	result = BuildFunction(kind, resolved, levelCount, sums, 0, function);
	if (result == SUCCESS && kind == EmpiricalFunction::TRANSIOGRAM)
	{
		function.setLevels(set.getScalarField(field1)->getLevels());
	}

	return result;
}

ErrorCode EmpiricalFunctionTools::ComputeVariogram(	const GenericSampleSet& set,
													int field,
													const EmpiricalParams& params,
													EmpiricalFunction& variogram)
{
	return ComputeCrossVariogram(set, field, field, params, variogram);
}

ErrorCode EmpiricalFunctionTools::ComputeCrossVariogram(const GenericSampleSet& set,
														int field1,
														int field2,
														const EmpiricalParams& params,
														EmpiricalFunction& variogram)
{
	EmpiricalParams resolved;
	ErrorCode result = ResolveParams(set, EmpiricalFunction::VARIOGRAM, params, resolved);
	if (result != SUCCESS)
	{
		return result;
	}

	return ComputeResolved(set, EmpiricalFunction::VARIOGRAM, field1, field2, resolved, GSVector3d(0, 0, 0), variogram);
}

ErrorCode EmpiricalFunctionTools::ComputeVariograms(const GenericSampleSet& set,
													const std::vector< std::pair<int, int> >& pairs,
													const EmpiricalParams& params,
													std::vector<EmpiricalFunction>& variograms)
{
	variograms.clear();

	EmpiricalParams resolved;
	ErrorCode result = ResolveParams(set, EmpiricalFunction::VARIOGRAM, params, resolved);
	if (result != SUCCESS)
	{
		return result;
	}

	EmpiricalAccumulator::Params accParams;
	accParams.nlags = resolved.nlags;
	accParams.maxlag = resolved.maxlag;
	accParams.distance = resolved.distance;
	accParams.estimator = resolved.estimator;
	accParams.algorithm = resolved.algorithm;

	std::vector<EmpiricalAccumulator::VariablePair> variablePairs;
	std::vector<EmpiricalAccumulator::ChannelSums> sums;
	try
	{
		variablePairs.reserve(pairs.size());
		for (const std::pair<int, int>& pair : pairs)
		{
			variablePairs.emplace_back(pair.first, pair.second);
		}

		result = EmpiricalAccumulator::Accumulate(set, variablePairs, accParams, sums);
		if (result != SUCCESS)
		{
			return result;
		}

		variograms.resize(pairs.size());
	}
	catch (const std::bad_alloc&)
	{
		//not enough memory
		variograms.clear();
		return ERROR_OUT_OF_MEMORY;
	}

	for (std::size_t p = 0; p < pairs.size(); ++p)
	{
		result = BuildFunction(EmpiricalFunction::VARIOGRAM, resolved, 1, sums, p, variograms[p]);
		if (result != SUCCESS)
		{
			variograms.clear();
			return result;
		}
	}

	return SUCCESS;
}

ErrorCode EmpiricalFunctionTools::ComputeTransiogram(	const GenericSampleSet& set,
														int field,
														const EmpiricalParams& params,
														EmpiricalFunction& transiogram)
{
	EmpiricalParams resolved;
	ErrorCode result = ResolveParams(set, EmpiricalFunction::TRANSIOGRAM, params, resolved);
	if (result != SUCCESS)
	{
		return result;
	}

	return ComputeResolved(set, EmpiricalFunction::TRANSIOGRAM, field, field, resolved, GSVector3d(0, 0, 0), transiogram);
}

ErrorCode EmpiricalFunctionTools::ComputeFromPartition(	const GenericSampleSet& set,
														const PartitionTools::Partition& parts,
														EmpiricalFunction::Kind kind,
														int field1,
														int field2,
														const EmpiricalParams& params,
														const GSVector3d& orientation,
														EmpiricalFunction& function)
{
	if (set.size() < 2)
	{
		Logger::Error("[EmpiricalFunctionTools] %s", ErrorCodeToString(ERROR_TOO_FEW_SAMPLES));
		return ERROR_TOO_FEW_SAMPLES;
	}

	//the maximum lag is resolved once for all the subsets (same bins)
	EmpiricalParams resolved;
	ErrorCode result = ResolveParams(set, kind, params, resolved);
	if (result != SUCCESS)
	{
		return result;
	}

	std::vector<EmpiricalFunction> partials;
	std::vector<ErrorCode> partialResults;
	try
	{
		partials.resize(parts.size());
		partialResults.resize(parts.size(), ERROR_TOO_FEW_SAMPLES);
	}
	catch (const std::bad_alloc&)
	{
		//not enough memory
		return ERROR_OUT_OF_MEMORY;
	}

	auto computePartial = [&](std::size_t i)
	{
		if (parts[i].size() > 1)
		{
			partialResults[i] = ComputeResolved(parts[i], kind, field1, field2, resolved, orientation, partials[i]);
		}
	};

#ifdef GS_CORE_LIB_USES_TBB
	tbb::parallel_for(tbb::blocked_range<std::size_t>(0, parts.size()),
		[&](tbb::blocked_range<std::size_t> r) {
			for (auto i = r.begin(); i != r.end(); ++i) { computePartial(i); }
		}
	);
#else
	for (std::size_t i = 0; i < parts.size(); ++i)
	{
		computePartial(i);
	}
#endif

	//reduction (in the partition order)
	bool first = true;
	for (std::size_t i = 0; i < parts.size(); ++i)
	{
		if (partialResults[i] == ERROR_TOO_FEW_SAMPLES)
		{
			//subset ignored
			continue;
		}
		if (partialResults[i] != SUCCESS)
		{
			return partialResults[i];
		}

		if (first)
		{
			function = partials[i];
			first = false;
		}
		else
		{
			result = EmpiricalFunction::Merge(function, partials[i], function);
			if (result != SUCCESS)
			{
				return result;
			}
		}
	}

	if (first)
	{
		//no pair at all: empty bins
		std::vector<EmpiricalAccumulator::VariablePair> pairs;
		unsigned levelCount = 1;
		result = GetVariablePairs(set, kind, field1, field2, pairs, levelCount);
		if (result != SUCCESS)
		{
			return result;
		}
		if (resolved.nlags == 0)
		{
			return ERROR_INVALID_LAG_COUNT;
		}
		if (!(resolved.maxlag > 0))
		{
			return ERROR_INVALID_MAX_LAG;
		}

		try
		{
			function = EmpiricalFunction(kind, resolved.distance, resolved.estimator, resolved.nlags, resolved.maxlag, levelCount);
		}
		catch (const std::bad_alloc&)
		{
			//not enough memory
			return ERROR_OUT_OF_MEMORY;
		}
		function.setUnits(resolved.lagUnit, resolved.valueUnit);
		if (kind == EmpiricalFunction::TRANSIOGRAM)
		{
			function.setLevels(set.getScalarField(field1)->getLevels());
		}
	}

	return SUCCESS;
}

ErrorCode EmpiricalFunctionTools::ComputeDirectionalVariogram(	const GenericSampleSet& set,
																int field1,
																int field2,
																const GSVector3d& direction,
																double tolerance,
																const EmpiricalParams& params,
																EmpiricalFunction& variogram)
{
	PartitionTools::Partition parts;
	ErrorCode result = PartitionTools::DirectionPartition(set, direction, tolerance, parts);
	if (result != SUCCESS)
	{
		return result;
	}

	return ComputeFromPartition(set, parts, EmpiricalFunction::VARIOGRAM, field1, field2, params, GSVector3d(0, 0, 0), variogram);
}

ErrorCode EmpiricalFunctionTools::ComputePlanarVariogram(	const GenericSampleSet& set,
															int field1,
															int field2,
															const GSVector3d& normal,
															double tolerance,
															const EmpiricalParams& params,
															EmpiricalFunction& variogram)
{
	PartitionTools::Partition parts;
	ErrorCode result = PartitionTools::PlanePartition(set, normal, tolerance, parts);
	if (result != SUCCESS)
	{
		return result;
	}

	return ComputeFromPartition(set, parts, EmpiricalFunction::VARIOGRAM, field1, field2, params, GSVector3d(0, 0, 0), variogram);
}

ErrorCode EmpiricalFunctionTools::ComputeDirectionalTransiogram(const GenericSampleSet& set,
																int field,
																const GSVector3d& direction,
																double tolerance,
																const EmpiricalParams& params,
																EmpiricalFunction& transiogram)
{
	PartitionTools::Partition parts;
	ErrorCode result = PartitionTools::DirectionPartition(set, direction, tolerance, parts);
	if (result != SUCCESS)
	{
		return result;
	}

	return ComputeFromPartition(set, parts, EmpiricalFunction::TRANSIOGRAM, field, field, params, direction, transiogram);
}

ErrorCode EmpiricalFunctionTools::ComputePlanarTransiogram(	const GenericSampleSet& set,
															int field,
															const GSVector3d& normal,
															double tolerance,
															const EmpiricalParams& params,
															EmpiricalFunction& transiogram)
{
	PartitionTools::Partition parts;
	ErrorCode result = PartitionTools::PlanePartition(set, normal, tolerance, parts);
	if (result != SUCCESS)
	{
		return result;
	}

	return ComputeFromPartition(set, parts, EmpiricalFunction::TRANSIOGRAM, field, field, params, GSVector3d(0, 0, 0), transiogram);
}

ErrorCode EmpiricalFunctionTools::ComputeVariogramFromArrays(	const std::vector<double>& coordinates,
																unsigned dimension,
																const std::vector<double>& values,
																const EmpiricalParams& params,
																EmpiricalFunction& variogram)
{
	SampleSet set(dimension);
	if (!set.setCoordinates(coordinates, dimension))
	{
		return ERROR_INVALID_INPUT;
	}

	int field = set.addScalarField("values", values);
	if (field < 0)
	{
		return ERROR_INVALID_INPUT;
	}

	return ComputeVariogram(set, field, params, variogram);
}
