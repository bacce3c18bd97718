// SPDX-License-Identifier: LGPL-2.0-or-later
// Copyright © EDF R&D / TELECOM ParisTech (ENST-TSI)

#include "ReferenceSampleSet.h"

//System
#include <cassert>
#include <numeric>

using namespace GeoStatsCoreLib;

ReferenceSampleSet::ReferenceSampleSet(const GenericSampleSet* associatedSet)
	: m_theAssociatedSet(associatedSet)
{
	assert(m_theAssociatedSet);
}

bool ReferenceSampleSet::addAllPoints()
{
	try
	{
		m_theIndexes.resize(m_theAssociatedSet->size());
	}
	catch (const std::bad_alloc&)
	{
		return false;
	}

	std::iota(m_theIndexes.begin(), m_theIndexes.end(), 0u);
	return true;
}

bool ReferenceSampleSet::reserve(unsigned n)
{
	try
	{
		m_theIndexes.reserve(n);
	}
	catch (const std::bad_alloc&)
	{
		return false;
	}

	return true;
}

bool ReferenceSampleSet::addPointIndex(unsigned globalIndex)
{
	assert(globalIndex < m_theAssociatedSet->size());

	try
	{
		m_theIndexes.push_back(globalIndex);
	}
	catch (const std::bad_alloc&)
	{
		return false;
	}

	return true;
}
