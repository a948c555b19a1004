#pragma once

#include <string>

#include <spdlog/logger.h>

using Logger = spdlog::logger;

// Sets the default root log level, and for any logger subsequently created by logger_for.
// Call it before any Loggers are created (e.g. at the top of a test run or in main()).
void set_log_level(spdlog::level::level_enum level);
// Creates a named logger writing to the shared console sink. Nothing that could identify a person (raw emails, phone
// numbers) should ever be handed to one of these.
Logger logger_for(std::string name);
