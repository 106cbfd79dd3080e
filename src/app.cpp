#include <iostream>
#include <iterator>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

#include "config/sandbox_config.hpp"
#include "logging/logging.hpp"
#include "sandbox/request.hpp"
#include "sandbox/result_reporter.hpp"
#include "sandbox/runner.hpp"

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_BAD_REQUEST = 2;

struct CommandLine {
    std::string configFile;
    std::string logLevel;
    bool help{false};
};

void printUsage(std::ostream& out) {
    out << "usage: lockbox [--config <file>] [--log-level <level>]\n"
           "\n"
           "Reads one JSON request from stdin:\n"
           "  {\"code\": \"...\", \"time_limit_sec\": 3, \"cpu_limit_sec\": 3,\n"
           "   \"mem_limit_mb\": 256, \"fs_allowlist\": [\"/path\"]}\n"
           "and prints the JSON result on stdout.\n";
}

bool parseCommandLine(int argc, char* argv[], CommandLine& cmd) {
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            cmd.configFile = argv[++i];
        } else if ((arg == "--log-level" || arg == "-l") && i + 1 < argc) {
            cmd.logLevel = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            cmd.help = true;
        } else {
            std::cerr << "lockbox: unexpected argument '" << arg << "'\n";
            return false;
        }
    }
    return true;
}

int rejectRequest(const std::string& message) {
    spdlog::warn("Rejecting request: {}", message);
    std::cout << lockbox::sandbox::invalidRequestJson(message).dump() << '\n';
    return EXIT_BAD_REQUEST;
}

}  // namespace

/**
 * @brief lockbox entry point
 *
 * Exit status 0 whenever a result was produced, whatever its verdict.
 */
int main(int argc, char* argv[]) {
    using namespace lockbox;

    CommandLine cmd;
    if (!parseCommandLine(argc, argv, cmd)) {
        printUsage(std::cerr);
        return EXIT_BAD_REQUEST;
    }
    if (cmd.help) {
        printUsage(std::cout);
        return EXIT_OK;
    }

    config::SandboxConfig sandboxConfig;
    std::string configError;
    if (!cmd.configFile.empty()) {
        auto loaded = config::SandboxConfig::loadFromFile(cmd.configFile);
        if (loaded) {
            sandboxConfig = std::move(*loaded);
        } else {
            configError = loaded.error();
        }
    }
    sandboxConfig.applyEnvironment();
    if (!cmd.logLevel.empty()) {
        sandboxConfig.logging.consoleLevel = cmd.logLevel;
    }

    logging::init(sandboxConfig.logging);

    if (!configError.empty()) {
        spdlog::critical("Cannot load {}: {}", cmd.configFile, configError);
        logging::shutdown();
        return EXIT_BAD_REQUEST;
    }
    if (auto valid = sandboxConfig.validate(); !valid) {
        spdlog::critical("Invalid configuration: {}", valid.error());
        logging::shutdown();
        return EXIT_BAD_REQUEST;
    }

    std::string input{std::istreambuf_iterator<char>(std::cin),
                      std::istreambuf_iterator<char>()};
    auto request = sandbox::parseRequest(input);
    if (!request) {
        int code = rejectRequest(request.error());
        logging::shutdown();
        return code;
    }

    try {
        sandbox::SandboxRunner runner(sandboxConfig);
        auto result = runner.runCode(request->code, request->options);
        std::cout << sandbox::ResultReporter::toJson(result).dump() << '\n';
    } catch (const std::exception& e) {
        // runCode reports its own failures; this covers output errors
        spdlog::critical("lockbox: {}", e.what());
        logging::shutdown();
        return EXIT_BAD_REQUEST;
    }

    logging::shutdown();
    return EXIT_OK;
}
