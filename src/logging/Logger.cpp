//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.cpp
// Purpose: Definitions for Logger static members; initial level comes from LOGINRESP_LOG_LEVEL.
//==========================================================================================================

#include "logging/Logger.h"

LogLevel Logger::sLogLevel = Logger::levelFromString(GetEnvOrDefault("LOGINRESP_LOG_LEVEL", "INFO"));
std::ofstream Logger::sLogFile;
std::mutex Logger::sLogMutex;
