/*
 * logging.cpp
 *
 * Copyright (C) 2024 The Lockbox Authors
 */

#include "logging.hpp"

#include <filesystem>
#include <string>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace lockbox::logging {

namespace {

spdlog::sink_ptr createConsoleSink(spdlog::level::level_enum level) {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    sink->set_level(level);
    sink->set_pattern(DEFAULT_PATTERN);
    return sink;
}

spdlog::sink_ptr createRotatingFileSink(const std::string& filePath,
                                        size_t maxSize, size_t maxFiles,
                                        spdlog::level::level_enum level) {
    std::filesystem::path path(filePath);
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }
    auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        filePath, maxSize, maxFiles);
    sink->set_level(level);
    sink->set_pattern(DEFAULT_PATTERN);
    return sink;
}

void installDefault(std::vector<spdlog::sink_ptr> sinks,
                    std::string_view loggerName) {
    auto logger = std::make_shared<spdlog::logger>(
        std::string(loggerName), sinks.begin(), sinks.end());

    // The logger passes everything; each sink filters on its own level
    logger->set_level(spdlog::level::trace);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(std::move(logger));
}

}  // namespace

spdlog::level::level_enum parseLevel(std::string_view level) {
    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "info") return spdlog::level::info;
    if (level == "warn" || level == "warning") return spdlog::level::warn;
    if (level == "error" || level == "err") return spdlog::level::err;
    if (level == "critical" || level == "fatal") return spdlog::level::critical;
    if (level == "off") return spdlog::level::off;
    return spdlog::level::info;
}

void init(const config::LoggingConfig& config, std::string_view loggerName) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(createConsoleSink(parseLevel(config.consoleLevel)));

    if (!config.file.empty()) {
        try {
            sinks.push_back(createRotatingFileSink(
                config.file, config.maxFileSize, config.maxFiles,
                parseLevel(config.fileLevel)));
        } catch (const std::exception& e) {
            // Keep console logging; report once the logger exists
            installDefault(sinks, loggerName);
            spdlog::warn("Failed to open log file '{}': {}", config.file,
                         e.what());
            return;
        }
    }

    installDefault(std::move(sinks), loggerName);
}

void initConsole(spdlog::level::level_enum level, std::string_view loggerName) {
    installDefault({createConsoleSink(level)}, loggerName);
}

void shutdown() {
    spdlog::shutdown();
}

}  // namespace lockbox::logging
