// SPDX-License-Identifier: LGPL-2.0-or-later
// Copyright © EDF R&D / TELECOM ParisTech (ENST-TSI)

#pragma once

#include "GSPlatform.h"

//! Export/import macro of the library symbols
/** Only relevant when the library is built as a Windows DLL.
**/
#if defined(GS_WINDOWS) && defined(GS_CORE_LIB_SHARED)
	#if defined(GS_CORE_LIB_EXPORTS)
		#define GS_CORE_LIB_API __declspec(dllexport)
	#else
		#define GS_CORE_LIB_API __declspec(dllimport)
	#endif
#elif defined(GS_CORE_LIB_SHARED)
	#define GS_CORE_LIB_API __attribute__((visibility("default")))
#else
	#define GS_CORE_LIB_API
#endif
