//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.cpp
// Purpose: Definitions for Logger static members. The initial level honours TOOLHOST_LOG_LEVEL.
//==========================================================================================================

#include "logging/Logger.h"

LogLevel Logger::sLogLevel = Logger::levelFromString(GetEnvOrDefault("TOOLHOST_LOG_LEVEL", "info"));
std::ofstream Logger::sLogFile;
std::mutex Logger::sLogMutex;
