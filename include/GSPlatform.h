// SPDX-License-Identifier: LGPL-2.0-or-later
// Copyright © EDF R&D / TELECOM ParisTech (ENST-TSI)

#pragma once

//Defines the following macros (depending on the compilation platform/settings)
//	- GS_WINDOWS / GS_MAC_OS / GS_LINUX
//	- GS_ENV_32 / GS_ENV_64
#if defined(_WIN32) || defined(_WIN64) || defined(WIN32)
	#define GS_WINDOWS
#if defined(_WIN64)
	#define GS_ENV_64
#else
	#define GS_ENV_32
#endif
#else
#if defined(__APPLE__)
	#define GS_MAC_OS
#else
	#define GS_LINUX
#endif
#if defined(__x86_64__) || defined(__ppc64__) || defined(__arm64__) || defined(__aarch64__)
	#define GS_ENV_64
#else
	#define GS_ENV_32
#endif
#endif
