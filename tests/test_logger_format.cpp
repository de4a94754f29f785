//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_logger_format.cpp
// Purpose: GoogleTests for Logger placeholder formatting, level parsing and the file sink
//==========================================================================================================

#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <unistd.h>

#include "logging/Logger.h"

TEST(LoggerFormat, SubstitutesPlaceholdersInOrder) {
    EXPECT_EQ(Logger::format("a={} b={}", 1, std::string("two")), "a=1 b=two");
    EXPECT_EQ(Logger::format("no placeholders"), "no placeholders");
}

TEST(LoggerFormat, EscapedBracesAndSurplusPlaceholders) {
    EXPECT_EQ(Logger::format("{{literal}} {}", 7), "{literal} 7");
    EXPECT_EQ(Logger::format("{} and {}", "one"), "one and {}");
}

TEST(LoggerLevels, ParsesCommonSpellings) {
    EXPECT_EQ(Logger::levelFromString("warning"), Logger::Level::WARN);
    EXPECT_EQ(Logger::levelFromString("Error"), Logger::Level::ERROR);
    EXPECT_EQ(Logger::levelFromString("bogus"), Logger::Level::DEBUG);
}

TEST(LoggerSink, FilteredLevelsAreNotWritten) {
    const std::string path = "oauth2_logger_test_" + std::to_string(::getpid()) + ".log";
    Logger::setLogFile(path);
    Logger::setLogLevel(LogLevel::LOG_WARN_LEVEL);
    LOG_INFO("hidden {}", "info");
    LOG_WARN("visible {}", "warning");
    Logger::setLogLevel(LogLevel::LOG_INFO_LEVEL);

    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    const std::string text = ss.str();
    EXPECT_EQ(text.find("hidden info"), std::string::npos);
    EXPECT_NE(text.find("visible warning"), std::string::npos);
    EXPECT_NE(text.find("WARN"), std::string::npos);
    (void)std::remove(path.c_str());
}
