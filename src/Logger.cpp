// SPDX-License-Identifier: LGPL-2.0-or-later
// Copyright © EDF R&D / TELECOM ParisTech (ENST-TSI)

#include <Logger.h>

//System
#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <vector>

using namespace GeoStatsCoreLib;

static Logger::Handler* s_handler = nullptr;
static std::mutex s_loggerMutex;

static std::string FormatLogMessage(const char* format, va_list args)
{
	va_list argsCopy;
	va_copy(argsCopy, args);
	int length = vsnprintf(nullptr, 0, format, argsCopy);
	va_end(argsCopy);

	if (length < 0)
	{
		return std::string(format);
	}

	std::vector<char> buffer(static_cast<size_t>(length) + 1);
	vsnprintf(buffer.data(), buffer.size(), format, args);

	return std::string(buffer.data(), static_cast<size_t>(length));
}

void Logger::SetHandler(Handler* handler)
{
	std::lock_guard<std::mutex> lock(s_loggerMutex);
	s_handler = handler;
}

Logger::Handler* Logger::GetHandler()
{
	std::lock_guard<std::mutex> lock(s_loggerMutex);
	return s_handler;
}

void Logger::Dispatch(const std::string& message, MessageLevel level)
{
	Handler* handler = GetHandler();
	if (handler)
	{
		//called without the lock (the handler may log or query the logger)
		handler->logMessage(message, level);
		return;
	}

	std::lock_guard<std::mutex> lock(s_loggerMutex);
	switch (level)
	{
	case LOG_WARNING:
		fprintf(stderr, "[GeoStatsCoreLib] Warning: %s\n", message.c_str());
		break;
	case LOG_ERROR:
		fprintf(stderr, "[GeoStatsCoreLib] Error: %s\n", message.c_str());
		break;
	default:
		//standard and debug messages are only forwarded to a handler
		break;
	}
}

void Logger::Message(const char* format, ...)
{
	va_list args;
	va_start(args, format);
	std::string message = FormatLogMessage(format, args);
	va_end(args);

	Dispatch(message, LOG_STANDARD);
}

void Logger::Debug(const char* format, ...)
{
	va_list args;
	va_start(args, format);
	std::string message = FormatLogMessage(format, args);
	va_end(args);

	Dispatch(message, LOG_DEBUG);
}

void Logger::Warning(const char* format, ...)
{
	va_list args;
	va_start(args, format);
	std::string message = FormatLogMessage(format, args);
	va_end(args);

	Dispatch(message, LOG_WARNING);
}

void Logger::Error(const char* format, ...)
{
	va_list args;
	va_start(args, format);
	std::string message = FormatLogMessage(format, args);
	va_end(args);

	Dispatch(message, LOG_ERROR);
}
