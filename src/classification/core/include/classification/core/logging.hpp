#pragma once

#include "classification/core/config.hpp"

#include <spdlog/logger.h>

#include <memory>

namespace geolabel::classification::core {

//! (Re-)create the shared "geolabel" logger with a console sink and an optional file sink.
void initLogging(const LoggingConfig& config = LoggingConfig{});

//! Shared logger. Created with default settings on first use if initLogging() was not called.
std::shared_ptr<spdlog::logger> logger();

} // namespace geolabel::classification::core
