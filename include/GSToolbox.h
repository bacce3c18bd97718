// SPDX-License-Identifier: LGPL-2.0-or-later
// Copyright © EDF R&D / TELECOM ParisTech (ENST-TSI)

#ifndef GS_TOOLBOX_HEADER
#define GS_TOOLBOX_HEADER

//Local
#include "GeoStatsCoreLib.h"

namespace GeoStatsCoreLib
{
	//! Empty class - for classification purpose only
	class GS_CORE_LIB_API GSToolbox	{};

} //namespace GeoStatsCoreLib

#endif //GS_TOOLBOX_HEADER
