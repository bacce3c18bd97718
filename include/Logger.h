// SPDX-License-Identifier: LGPL-2.0-or-later
// Copyright © EDF R&D / TELECOM ParisTech (ENST-TSI)

#pragma once

//Local
#include "GeoStatsCoreLib.h"

//System
#include <string>

namespace GeoStatsCoreLib
{
	//! Message logging
	/** The library doesn't display anything by itself: messages are forwarded
		to the registered handler (if any). Without handler, warnings and errors
		are printed on the standard error stream.
	**/
	class GS_CORE_LIB_API Logger
	{
	public:

		//! Message level
		enum MessageLevel
		{
			LOG_STANDARD = 0,	//!< Standard message
			LOG_DEBUG,			//!< Debug message (verbose)
			LOG_WARNING,		//!< Warning (data quality, fallback, etc.)
			LOG_ERROR			//!< Error (rejected input)
		};

		//! Message handler interface
		class Handler
		{
		public:
			virtual ~Handler() = default;

			//! Called for each message
			/** \warning May be called concurrently from several threads. The logger
				lock is not held during the call (the handler may log in turn).
			**/
			virtual void logMessage(const std::string& message, MessageLevel level) = 0;
		};

		//! Registers the message handler
		/** \param handler handler (the caller keeps ownership) or nullptr to restore the default behavior
		**/
		static void SetHandler(Handler* handler);

		//! Returns the current handler (if any)
		static Handler* GetHandler();

		//! Logs a standard message (printf-like)
		static void Message(const char* format, ...);
		//! Logs a debug message (printf-like)
		static void Debug(const char* format, ...);
		//! Logs a warning (printf-like)
		static void Warning(const char* format, ...);
		//! Logs an error (printf-like)
		static void Error(const char* format, ...);

	protected:

		//! Dispatches a formatted message
		static void Dispatch(const std::string& message, MessageLevel level);
	};
}
