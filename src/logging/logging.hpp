/*
 * logging.hpp
 *
 * Copyright (C) 2024 The Lockbox Authors
 */

/**
 * @file logging.hpp
 * @brief spdlog setup shared by the lockbox executables
 *
 * stdout of the lockbox executables carries results, so every console sink
 * writes to stderr.
 */

#ifndef LOCKBOX_LOGGING_LOGGING_HPP
#define LOCKBOX_LOGGING_LOGGING_HPP

#include "config/sandbox_config.hpp"

#include <spdlog/spdlog.h>

#include <memory>
#include <string_view>

namespace lockbox::logging {

inline constexpr const char* DEFAULT_LOGGER_NAME = "lockbox";
inline constexpr const char* DEFAULT_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

/**
 * @brief Convert a level name to spdlog's level
 *
 * Unknown names map to info.
 */
[[nodiscard]] spdlog::level::level_enum parseLevel(std::string_view level);

/**
 * @brief Install the default logger from configuration
 * @param config Logging section of the sandbox configuration
 * @param loggerName Name shown in every line
 */
void init(const config::LoggingConfig& config,
          std::string_view loggerName = DEFAULT_LOGGER_NAME);

/**
 * @brief Install a stderr-only logger at the given level
 */
void initConsole(spdlog::level::level_enum level,
                 std::string_view loggerName = DEFAULT_LOGGER_NAME);

/**
 * @brief Flush and drop all loggers
 */
void shutdown();

}  // namespace lockbox::logging

#endif  // LOCKBOX_LOGGING_LOGGING_HPP
