// SPDX-License-Identifier: LGPL-2.0-or-later
// Copyright © EDF R&D / TELECOM ParisTech (ENST-TSI)

#include <ScalarField.h>

//System
#include <cassert>

using namespace GeoStatsCoreLib;

ScalarField::ScalarField(const std::string& name/*=std::string()*/)
	: m_name{ }
	, m_minVal{ 0.0 }
	, m_maxVal{ 0.0 }
{
	setName(name);
}

ScalarField::ScalarField(const std::string& name, const std::vector<ScalarType>& values)
	: std::vector<ScalarType>(values)
	, m_name{ }
	, m_minVal{ 0.0 }
	, m_maxVal{ 0.0 }
{
	setName(name);
	computeMinAndMax();
}

void ScalarField::setName(const std::string& name)
{
	if (name.empty())
	{
		m_name = "Undefined";
	}
	else
	{
		m_name = name;
	}
}

std::size_t ScalarField::countValidValues() const
{
	std::size_t count = 0;

	for (std::size_t i = 0; i < size(); ++i)
	{
		if (ValidValue(at(i)))
		{
			++count;
		}
	}

	return count;
}

void ScalarField::computeMeanAndVariance(ScalarType& mean, ScalarType* variance) const
{
	double _mean = 0.0;
	double _std2 = 0.0;
	std::size_t count = 0;

	for (std::size_t i = 0; i < size(); ++i)
	{
		ScalarType val = at(i);
		if (ValidValue(val))
		{
			_mean += val;
			_std2 += val * val;
			++count;
		}
	}

	if (count)
	{
		_mean /= count;
		mean = _mean;

		if (variance)
		{
			_std2 = std::abs(_std2 / count - _mean*_mean);
			*variance = static_cast<ScalarType>(_std2);
		}
	}
	else
	{
		mean = 0;
		if (variance)
		{
			*variance = 0;
		}
	}
}

void ScalarField::computeMinAndMax()
{
	ScalarType minVal = 0.0;
	ScalarType maxVal = 0.0;

	bool minMaxInitialized = false;
	for (std::size_t i = 0; i < size(); ++i)
	{
		ScalarType val = at(i);
		if (ValidValue(val))
		{
			if (minMaxInitialized)
			{
				if (val < minVal)
					minVal = val;
				else if (val > maxVal)
					maxVal = val;
			}
			else
			{
				//first valid value is used to init min and max
				minVal = maxVal = val;
				minMaxInitialized = true;
			}
		}
	}

	//particular case: zero valid values (min = max = 0)
	m_minVal = minVal;
	m_maxVal = maxVal;
}

int ScalarField::getLevelCode(std::size_t index) const
{
	ScalarType val = at(index);
	if (!ValidValue(val))
	{
		return -1;
	}

	int code = static_cast<int>(val);
	if (code < 0 || static_cast<std::size_t>(code) >= m_levels.size() || static_cast<ScalarType>(code) != val)
	{
		return -1;
	}

	return code;
}

bool ScalarField::reserveSafe(std::size_t count)
{
	try
	{
		reserve(count);
	}
	catch (const std::bad_alloc&)
	{
		//not enough memory
		return false;
	}
	return true;
}

bool ScalarField::resizeSafe(std::size_t count, bool initNewElements/*=false*/, ScalarType valueForNewElements/*=0*/)
{
	try
	{
		if (initNewElements)
		{
			resize(count, valueForNewElements);
		}
		else
		{
			resize(count);
		}
	}
	catch (const std::bad_alloc&)
	{
		//not enough memory
		return false;
	}
	return true;
}
