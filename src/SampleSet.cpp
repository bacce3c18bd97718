// SPDX-License-Identifier: LGPL-2.0-or-later
// Copyright © EDF R&D / TELECOM ParisTech (ENST-TSI)

#include <SampleSet.h>

//Local
#include <Logger.h>

//System
#include <algorithm>
#include <map>

using namespace GeoStatsCoreLib;

SampleSet::SampleSet(unsigned dimension/*=3*/)
	: m_dimension(std::min(3u, std::max(1u, dimension)))
{
}

bool SampleSet::setCoordinates(const std::vector<double>& coordinates, unsigned dimension)
{
	if (dimension < 1 || dimension > 3 || coordinates.size() % dimension != 0)
	{
		Logger::Error("[SampleSet] Invalid coordinates (dimension %u, %zu values)", dimension, coordinates.size());
		return false;
	}

	size_t count = coordinates.size() / dimension;
	try
	{
		m_points.clear();
		m_points.reserve(count);
	}
	catch (const std::bad_alloc&)
	{
		//not enough memory
		return false;
	}

	m_dimension = dimension;
	m_scalarFields.clear();
	for (size_t i = 0; i < count; ++i)
	{
		GSVector3d P;
		for (unsigned d = 0; d < dimension; ++d)
		{
			P.u[d] = coordinates[i * dimension + d];
		}
		m_points.push_back(P);
	}

	return true;
}

bool SampleSet::reserve(unsigned count)
{
	try
	{
		m_points.reserve(count);
	}
	catch (const std::bad_alloc&)
	{
		//not enough memory
		return false;
	}
	return true;
}

void SampleSet::addPoint(const GSVector3d& P)
{
	GSVector3d Q;
	for (unsigned d = 0; d < m_dimension; ++d)
	{
		Q.u[d] = P.u[d];
	}
	m_points.push_back(Q);
}

const ScalarField* SampleSet::getScalarField(int index) const
{
	return (index >= 0 && index < static_cast<int>(m_scalarFields.size()) ? &m_scalarFields[index] : nullptr);
}

ScalarField* SampleSet::getScalarField(int index)
{
	return (index >= 0 && index < static_cast<int>(m_scalarFields.size()) ? &m_scalarFields[index] : nullptr);
}

int SampleSet::getScalarFieldIndexByName(const std::string& name) const
{
	for (size_t i = 0; i < m_scalarFields.size(); ++i)
	{
		if (m_scalarFields[i].getName() == name)
		{
			return static_cast<int>(i);
		}
	}

	return -1;
}

bool SampleSet::checkNewField(const std::string& name, size_t count) const
{
	if (count != m_points.size())
	{
		Logger::Error("[SampleSet] Column '%s' has %zu values (%zu samples)", name.c_str(), count, m_points.size());
		return false;
	}

	if (getScalarFieldIndexByName(name) >= 0)
	{
		Logger::Error("[SampleSet] Column '%s' already exists", name.c_str());
		return false;
	}

	return true;
}

int SampleSet::addScalarField(const std::string& name, const std::vector<ScalarType>& values)
{
	if (!checkNewField(name, values.size()))
	{
		return -1;
	}

	try
	{
		m_scalarFields.emplace_back(name, values);
	}
	catch (const std::bad_alloc&)
	{
		//not enough memory
		return -1;
	}

	return static_cast<int>(m_scalarFields.size()) - 1;
}

int SampleSet::addCategoricalField(const std::string& name, const std::vector<std::string>& labels)
{
	if (!checkNewField(name, labels.size()))
	{
		return -1;
	}

	std::vector<int> codes;
	std::vector<std::string> levels;
	try
	{
		std::map<std::string, int> levelCodes;
		for (const std::string& label : labels)
		{
			if (!label.empty())
			{
				levelCodes[label] = 0;
			}
		}

		levels.reserve(levelCodes.size());
		for (auto& it : levelCodes)
		{
			it.second = static_cast<int>(levels.size());
			levels.push_back(it.first);
		}

		codes.reserve(labels.size());
		for (const std::string& label : labels)
		{
			codes.push_back(label.empty() ? -1 : levelCodes[label]);
		}
	}
	catch (const std::bad_alloc&)
	{
		//not enough memory
		return -1;
	}

	return addCategoricalField(name, codes, levels);
}

int SampleSet::addCategoricalField(const std::string& name, const std::vector<int>& codes, const std::vector<std::string>& levels)
{
	if (!checkNewField(name, codes.size()))
	{
		return -1;
	}

	if (levels.empty())
	{
		Logger::Error("[SampleSet] Categorical column '%s' has no level", name.c_str());
		return -1;
	}

	std::vector<ScalarType> values;
	try
	{
		values.reserve(codes.size());
		for (int code : codes)
		{
			if (code >= static_cast<int>(levels.size()))
			{
				Logger::Error("[SampleSet] Invalid level code %d in column '%s'", code, name.c_str());
				return -1;
			}
			values.push_back(code < 0 ? NAN_VALUE : static_cast<ScalarType>(code));
		}

		m_scalarFields.emplace_back(name, values);
	}
	catch (const std::bad_alloc&)
	{
		//not enough memory
		return -1;
	}

	m_scalarFields.back().setLevels(levels);

	return static_cast<int>(m_scalarFields.size()) - 1;
}

bool SampleSet::computeIndicators(int fieldIndex, std::vector<int>& indicatorIndexes)
{
	indicatorIndexes.clear();

	const ScalarField* sf = getScalarField(fieldIndex);
	if (!sf || !sf->isCategorical())
	{
		Logger::Error("[SampleSet] Column #%d is not categorical", fieldIndex);
		return false;
	}

	//copy (the column container may be reallocated)
	std::string name = sf->getName();
	std::vector<std::string> levels = sf->getLevels();
	std::vector<int> codes;
	try
	{
		codes.reserve(m_points.size());
		for (size_t i = 0; i < m_points.size(); ++i)
		{
			codes.push_back(sf->getLevelCode(i));
		}
	}
	catch (const std::bad_alloc&)
	{
		//not enough memory
		return false;
	}

	for (size_t l = 0; l < levels.size(); ++l)
	{
		std::vector<ScalarType> indicator;
		try
		{
			indicator.reserve(codes.size());
		}
		catch (const std::bad_alloc&)
		{
			//not enough memory
			return false;
		}
		for (int code : codes)
		{
			indicator.push_back(code < 0 ? NAN_VALUE : (code == static_cast<int>(l) ? 1 : 0));
		}

		int index = addScalarField(name + ":" + levels[l], indicator);
		if (index < 0)
		{
			return false;
		}
		indicatorIndexes.push_back(index);
	}

	return true;
}
