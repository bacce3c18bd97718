// SPDX-License-Identifier: LGPL-2.0-or-later
// Copyright © EDF R&D / TELECOM ParisTech (ENST-TSI)

#include <AnisotropySweep.h>

//Local
#include <Logger.h>

//System
#include <cmath>

#ifdef GS_CORE_LIB_USES_TBB
#include <tbb/parallel_for.h>
#endif

using namespace GeoStatsCoreLib;

ErrorCode AnisotropySweep::ComputeVarioplane(	const GenericSampleSet& set,
												int field1,
												int field2,
												const SweepParams& sweepParams,
												const EmpiricalParams& params,
												AnisotropySweep& sweep)
{
	return Compute(set, EmpiricalFunction::VARIOGRAM, field1, field2, sweepParams, params, sweep);
}

ErrorCode AnisotropySweep::ComputeTransioplane(	const GenericSampleSet& set,
												int field,
												const SweepParams& sweepParams,
												const EmpiricalParams& params,
												AnisotropySweep& sweep)
{
	return Compute(set, EmpiricalFunction::TRANSIOGRAM, field, field, sweepParams, params, sweep);
}

ErrorCode AnisotropySweep::Compute(	const GenericSampleSet& set,
									EmpiricalFunction::Kind kind,
									int field1,
									int field2,
									const SweepParams& sweepParams,
									const EmpiricalParams& params,
									AnisotropySweep& sweep)
{
	if (sweepParams.nangs < 2)
	{
		Logger::Error("[AnisotropySweep] The number of angles must be greater than one");
		return ERROR_INVALID_PARAMETER;
	}

	if (set.size() < 2)
	{
		Logger::Error("[AnisotropySweep] %s", ErrorCodeToString(ERROR_TOO_FEW_SAMPLES));
		return ERROR_TOO_FEW_SAMPLES;
	}

	//same bins for all the planes and all the angles
	EmpiricalParams resolved;
	ErrorCode result = EmpiricalFunctionTools::ResolveParams(set, kind, params, resolved);
	if (result != SUCCESS)
	{
		return result;
	}

	//basis of the plane of variation
	PartitionTools::Partition planes;
	GSVector3d u;
	GSVector3d v;
	switch (set.dimension())
	{
	case 2:
	{
		ReferenceSampleSet all(&set);
		if (!all.addAllPoints())
		{
			return ERROR_OUT_OF_MEMORY;
		}
		try
		{
			planes.push_back(all);
		}
		catch (const std::bad_alloc&)
		{
			//not enough memory
			return ERROR_OUT_OF_MEMORY;
		}
		u = GSVector3d(1, 0, 0);
		v = GSVector3d(0, 1, 0);
	}
	break;

	case 3:
	{
		result = PartitionTools::PlanePartition(set, sweepParams.normal, sweepParams.ptol, planes);
		if (result != SUCCESS)
		{
			return result;
		}
		if (!PartitionTools::HouseholderBasis(sweepParams.normal, u, v))
		{
			return ERROR_INVALID_PARAMETER;
		}
	}
	break;

	default:
		Logger::Error("[AnisotropySweep] Anisotropy sweeps are only supported in 2D or 3D");
		return ERROR_INVALID_INPUT;
	}

	//half circle for variograms (symmetric), full circle otherwise
	const double span = (kind == EmpiricalFunction::VARIOGRAM ? M_PI : 2 * M_PI);
	const unsigned nangs = sweepParams.nangs;

	std::vector<double> angles;
	std::vector<EmpiricalFunction> functions;
	std::vector<ErrorCode> results;
	try
	{
		angles.resize(nangs);
		functions.resize(nangs);
		results.resize(nangs, SUCCESS);
	}
	catch (const std::bad_alloc&)
	{
		//not enough memory
		return ERROR_OUT_OF_MEMORY;
	}
	for (unsigned a = 0; a < nangs; ++a)
	{
		angles[a] = (span * a) / (nangs - 1);
	}

	auto computeAngle = [&](unsigned a)
	{
		GSVector3d direction = u * std::cos(angles[a]) + v * std::sin(angles[a]);
		GSVector3d orientation = (kind == EmpiricalFunction::TRANSIOGRAM ? direction : GSVector3d(0, 0, 0));

		bool first = true;
		for (const ReferenceSampleSet& plane : planes)
		{
			if (plane.size() < 2)
			{
				continue;
			}

			PartitionTools::Partition lines;
			ErrorCode angleResult = PartitionTools::DirectionPartition(plane, direction, sweepParams.dtol, lines);
			if (angleResult != SUCCESS)
			{
				results[a] = angleResult;
				return;
			}

			EmpiricalFunction planeFunction;
			angleResult = EmpiricalFunctionTools::ComputeFromPartition(plane, lines, kind, field1, field2, resolved, orientation, planeFunction);
			if (angleResult != SUCCESS)
			{
				results[a] = angleResult;
				return;
			}

			if (first)
			{
				functions[a] = planeFunction;
				first = false;
			}
			else
			{
				angleResult = EmpiricalFunction::Merge(functions[a], planeFunction, functions[a]);
				if (angleResult != SUCCESS)
				{
					results[a] = angleResult;
					return;
				}
			}
		}

		if (first)
		{
			//no plane with at least two samples
			results[a] = ERROR_TOO_FEW_SAMPLES;
		}
	};

#ifdef GS_CORE_LIB_USES_TBB
	tbb::parallel_for(tbb::blocked_range<unsigned>(0, nangs),
		[&](tbb::blocked_range<unsigned> r) {
			for (auto a = r.begin(); a != r.end(); ++a) { computeAngle(a); }
		}
	);
#else
	for (unsigned a = 0; a < nangs; ++a)
	{
		computeAngle(a);
	}
#endif

	for (ErrorCode angleResult : results)
	{
		if (angleResult != SUCCESS)
		{
			return angleResult;
		}
	}

	sweep.m_kind = kind;
	sweep.m_angles = angles;
	sweep.m_lags = functions.front().abscissas();
	sweep.m_functions = functions;

	return SUCCESS;
}
