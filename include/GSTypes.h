// SPDX-License-Identifier: LGPL-2.0-or-later
// Copyright © EDF R&D / TELECOM ParisTech (ENST-TSI)

#pragma once

#include "GeoStatsCoreLib.h"

//STL
#include <cstddef>

//! Type of the coordinates of a sample location
/** Double precision: geostatistical coordinates are often projected (large) values
**/
using PointCoordinateType = double;

//! Type of a single attribute value
using ScalarType = double;
