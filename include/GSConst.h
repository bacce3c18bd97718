// SPDX-License-Identifier: LGPL-2.0-or-later
// Copyright © EDF R&D / TELECOM ParisTech (ENST-TSI)

#pragma once

#include "GSTypes.h"

//system
#include <cmath>
#include <limits>

//! Pi - outside namespace because it's mostly-standard
#ifndef M_PI
constexpr double M_PI = 3.14159265358979323846;
#endif

//! Pi/2 - outside namespace because it's mostly-standard
#ifndef M_PI_2
constexpr double M_PI_2 = (M_PI / 2);
#endif

namespace GeoStatsCoreLib
{
	//! ZERO_TOLERANCE_D is used to set or compare a double variable to "close to zero".
	//! It is defined as std::numeric_limits<float>::epsilon() because using
	//! std::numeric_limits<double>::epsilon() results in numbers that are too small for our purposes.
	constexpr double ZERO_TOLERANCE_D = static_cast<double>(std::numeric_limits<float>::epsilon());

	//! NaN as a ScalarType value (= missing value)
	/** \warning: handle with care! **/
	constexpr ScalarType NAN_VALUE = std::numeric_limits<ScalarType>::quiet_NaN();

	//! Half-width of the box interval of a fixed parameter (fitting)
	constexpr double FIXED_PARAMETER_TOLERANCE = 1.0e-8;

	//! Default number of lags of empirical functions
	constexpr unsigned DEFAULT_LAG_COUNT = 20;

	//! Default number of angles of anisotropy sweeps
	constexpr unsigned DEFAULT_ANGLE_COUNT = 50;

	//! Default seed of the random number generators
	constexpr unsigned DEFAULT_RANDOM_SEED = 123;

	//! Error codes returned by the library toolboxes
	enum ErrorCode
	{
		ERROR_TOO_FEW_SAMPLES = -1000,
		ERROR_INVALID_LAG_COUNT,
		ERROR_INVALID_MAX_LAG,
		ERROR_UNKNOWN_ESTIMATOR,
		ERROR_UNKNOWN_ALGORITHM,
		ERROR_UNKNOWN_VARIABLE,
		ERROR_INCOMPATIBLE_FUNCTIONS,
		ERROR_EMPTY_CANDIDATE_LIST,
		ERROR_NO_USABLE_BIN,
		ERROR_INFEASIBLE_BOUNDS,
		ERROR_INVALID_PARAMETER,
		ERROR_INVALID_INPUT,
		ERROR_OUT_OF_MEMORY,
		SUCCESS = 1,
	};

	//! Returns a descriptive message for a given error code
	inline const char* ErrorCodeToString(ErrorCode code)
	{
		switch (code)
		{
		case ERROR_TOO_FEW_SAMPLES:
			return "at least two samples are required";
		case ERROR_INVALID_LAG_COUNT:
			return "number of lags must be positive";
		case ERROR_INVALID_MAX_LAG:
			return "maximum lag must be positive";
		case ERROR_UNKNOWN_ESTIMATOR:
			return "unknown or unsupported estimator";
		case ERROR_UNKNOWN_ALGORITHM:
			return "unknown accumulation algorithm";
		case ERROR_UNKNOWN_VARIABLE:
			return "unknown variable";
		case ERROR_INCOMPATIBLE_FUNCTIONS:
			return "empirical functions differ in distance, estimator or lag layout";
		case ERROR_EMPTY_CANDIDATE_LIST:
			return "no candidate model family";
		case ERROR_NO_USABLE_BIN:
			return "empirical function has no bin with a positive count";
		case ERROR_INFEASIBLE_BOUNDS:
			return "lower bound exceeds upper bound";
		case ERROR_INVALID_PARAMETER:
			return "invalid model parameter";
		case ERROR_INVALID_INPUT:
			return "invalid input";
		case ERROR_OUT_OF_MEMORY:
			return "not enough memory";
		case SUCCESS:
			return "success";
		}

		return "unknown error";
	}
}
