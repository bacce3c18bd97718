// SPDX-License-Identifier: LGPL-2.0-or-later
// Copyright © EDF R&D / TELECOM ParisTech (ENST-TSI)

#pragma once

//Local
#include "GSConst.h"
#include "GSToolbox.h"
#include "ReferenceSampleSet.h"

//STL
#include <functional>
#include <vector>

namespace GeoStatsCoreLib
{
	//! Spatial partitioning of sample sets
	/** All partitions are made of disjoint subsets covering the whole input set.
		They are deterministic (the random partition is seeded).
	**/
	class GS_CORE_LIB_API PartitionTools : public GSToolbox
	{
	public:

		//! Partition type
		using Partition = std::vector<ReferenceSampleSet>;

		//! Predicate telling whether two samples (indexes) belong to the same subset
		using PairPredicate = std::function<bool(unsigned, unsigned)>;

		//! Greedy partition based on a pairwise predicate
		/** Each subset is seeded by the first unassigned sample i and collects all
			the following unassigned samples j such that predicate(i, j) is true.
			\param set input set
			\param predicate pairwise predicate
			\param[out] parts subsets
			\return error code
		**/
		static ErrorCode PredicatePartition(const GenericSampleSet& set, const PairPredicate& predicate, Partition& parts);

		//! Groups samples lying on a common line of a given direction
		/** \param set input set
			\param direction line direction (doesn't need to be normalized)
			\param tolerance maximum distance of a sample to the line
			\param[out] parts subsets
			\return error code
		**/
		static ErrorCode DirectionPartition(const GenericSampleSet& set, const GSVector3d& direction, double tolerance, Partition& parts);

		//! Groups samples lying on a common plane of a given normal
		/** \param set input set
			\param normal plane normal (doesn't need to be normalized)
			\param tolerance maximum distance of a sample to the plane
			\param[out] parts subsets
			\return error code
		**/
		static ErrorCode PlanePartition(const GenericSampleSet& set, const GSVector3d& normal, double tolerance, Partition& parts);

		//! Groups samples lying in the same block of a regular grid
		/** The grid starts at the minimum corner of the set bounding box.
			\param set input set
			\param sides block sides (unused dimensions are ignored)
			\param[out] parts subsets (ordered by block index)
			\return error code
		**/
		static ErrorCode BlockPartition(const GenericSampleSet& set, const GSVector3d& sides, Partition& parts);

		//! Splits the (shuffled) samples into a given number of subsets of (almost) equal sizes
		/** \param set input set
			\param count number of subsets
			\param seed random generator seed
			\param[out] parts subsets
			\return error code
		**/
		static ErrorCode RandomPartition(const GenericSampleSet& set, unsigned count, unsigned seed, Partition& parts);

		//! Computes an orthonormal basis (u, v) of the plane orthogonal to a given normal
		/** Based on the Householder reflection of the normal. For the Z axis,
			the basis is (X, Y).
			\return false if the normal is null
		**/
		static bool HouseholderBasis(const GSVector3d& normal, GSVector3d& u, GSVector3d& v);
	};
}
