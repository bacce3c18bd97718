// SPDX-License-Identifier: LGPL-2.0-or-later
// Copyright © EDF R&D / TELECOM ParisTech (ENST-TSI)

#include <Logger.h>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace GeoStatsCoreLib;

namespace
{
	//! Records the messages and forwards the first one as a debug message
	class ForwardingHandler : public Logger::Handler
	{
	public:
		void logMessage(const std::string& message, Logger::MessageLevel level) override
		{
			messages.push_back(message);
			levels.push_back(level);
			sawItself = (Logger::GetHandler() == this);

			if (level != Logger::LOG_DEBUG)
			{
				Logger::Debug("forwarded: %s", message.c_str());
			}
		}

		std::vector<std::string> messages;
		std::vector<Logger::MessageLevel> levels;
		bool sawItself = false;
	};
}

TEST(Logger, FormatsAndForwardsToHandler)
{
	ForwardingHandler handler;
	Logger::SetHandler(&handler);
	EXPECT_EQ(&handler, Logger::GetHandler());

	Logger::Warning("%d skipped pairs at lag %g", 3, 0.5);
	Logger::SetHandler(nullptr);

	ASSERT_EQ(2u, handler.messages.size());
	EXPECT_EQ("3 skipped pairs at lag 0.5", handler.messages[0]);
	EXPECT_EQ(Logger::LOG_WARNING, handler.levels[0]);
	EXPECT_EQ("forwarded: 3 skipped pairs at lag 0.5", handler.messages[1]);
	EXPECT_EQ(Logger::LOG_DEBUG, handler.levels[1]);
	EXPECT_TRUE(handler.sawItself);
	EXPECT_EQ(nullptr, Logger::GetHandler());
}

TEST(Logger, HandlerCanLogEveryLevel)
{
	ForwardingHandler handler;
	Logger::SetHandler(&handler);
	Logger::Message("message");
	Logger::Error("error %s", "text");
	Logger::SetHandler(nullptr);

	ASSERT_EQ(4u, handler.messages.size());
	EXPECT_EQ(Logger::LOG_STANDARD, handler.levels[0]);
	EXPECT_EQ("error text", handler.messages[2]);
	EXPECT_EQ(Logger::LOG_ERROR, handler.levels[2]);
	EXPECT_EQ("forwarded: error text", handler.messages[3]);
}
