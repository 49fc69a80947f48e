//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_logger.cpp
// Purpose: Level parsing, formatting and log file output
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include "logging/Logger.h"

namespace fs = std::filesystem;

TEST(Logger, LevelFromString) {
    EXPECT_EQ(Logger::levelFromString("debug"), LogLevel::LOG_DEBUG_LEVEL);
    EXPECT_EQ(Logger::levelFromString("Trace"), LogLevel::LOG_DEBUG_LEVEL);
    EXPECT_EQ(Logger::levelFromString("warning"), LogLevel::LOG_WARN_LEVEL);
    EXPECT_EQ(Logger::levelFromString("ERROR"), LogLevel::LOG_ERROR_LEVEL);
    EXPECT_EQ(Logger::levelFromString("fatal"), LogLevel::LOG_FATAL_LEVEL);
    EXPECT_EQ(Logger::levelFromString("verbose"), LogLevel::LOG_INFO_LEVEL);
}

TEST(Logger, WritesFormattedLinesToFile) {
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path file = fs::temp_directory_path() / ("loginresp_log_" + std::to_string(stamp) + ".txt");
    LogLevel saved = Logger::sLogLevel;
    Logger::setLogLevel(LogLevel::LOG_INFO_LEVEL);
    Logger::setLogFile(file.string());

    LOG_INFO("dispatched {} to {}", "RenderedPage", std::string("/login.html"));
    LOG_DEBUG("filtered out {}", 1);
    LOG_WARN("bad format {", 7);
    Logger::setLogFile("");
    Logger::setLogLevel(saved);

    std::ifstream in(file);
    std::stringstream ss;
    ss << in.rdbuf();
    const std::string text = ss.str();
    EXPECT_NE(text.find("dispatched RenderedPage to /login.html"), std::string::npos);
    EXPECT_EQ(text.find("filtered out"), std::string::npos);
    EXPECT_NE(text.find("Format error"), std::string::npos);

    std::error_code ec;
    fs::remove(file, ec);
}
