/*
 * harness_main.cpp
 *
 * Copyright (C) 2024 The Lockbox Authors
 */

#include "harness.hpp"
#include "logging/logging.hpp"

#include <spdlog/spdlog.h>

#include <charconv>
#include <cstdlib>
#include <exception>
#include <string>
#include <string_view>

namespace {

void printUsage() {
    spdlog::error("usage: lockbox-harness --config <harness.json> "
                  "[--report-fd <n>]");
}

}  // namespace

int main(int argc, char* argv[]) {
    using namespace lockbox;

    const char* envLevel = std::getenv("LOCKBOX_LOG_LEVEL");
    logging::initConsole(logging::parseLevel(envLevel ? envLevel : "warn"),
                         "lockbox-harness");

    std::string configPath;
    int reportFd = -1;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--report-fd" && i + 1 < argc) {
            std::string_view value = argv[++i];
            auto [ptr, ec] = std::from_chars(value.data(),
                                             value.data() + value.size(),
                                             reportFd);
            if (ec != std::errc() || ptr != value.data() + value.size()) {
                printUsage();
                return sandbox::ExitCodes::SETUP_FAILED;
            }
        } else {
            printUsage();
            return sandbox::ExitCodes::SETUP_FAILED;
        }
    }
    if (configPath.empty()) {
        printUsage();
        return sandbox::ExitCodes::SETUP_FAILED;
    }

    auto config = sandbox::HarnessConfig::load(configPath);
    if (!config) {
        sandbox::Harness failed({}, configPath, reportFd);
        return failed.setupFailed("config", config.error());
    }

    if (!envLevel) {
        logging::initConsole(logging::parseLevel(config->logLevel),
                             "lockbox-harness");
    }

    try {
        sandbox::Harness harness(std::move(*config), configPath, reportFd);
        return harness.run();
    } catch (const std::exception& e) {
        spdlog::critical("lockbox-harness: {}", e.what());
        return sandbox::ExitCodes::SETUP_FAILED;
    }
}
