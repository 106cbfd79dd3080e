/*
 * request.cpp
 *
 * Copyright (C) 2024 The Lockbox Authors
 */

#include "request.hpp"

#include <spdlog/spdlog.h>

#include <cstdint>
#include <limits>

namespace lockbox::sandbox {

using json = nlohmann::json;

namespace {

std::optional<int64_t> integerField(const json& request, const char* key) {
    auto it = request.find(key);
    if (it == request.end()) {
        return std::nullopt;
    }
    if (it->is_number_unsigned()) {
        // May exceed int64_t; the resolver clamps anyway
        auto value = it->get<uint64_t>();
        constexpr auto MAX = std::numeric_limits<int64_t>::max();
        return value > static_cast<uint64_t>(MAX) ? MAX
                                                  : static_cast<int64_t>(value);
    }
    if (it->is_number_integer()) {
        return it->get<int64_t>();
    }
    spdlog::debug("Ignoring '{}' of type {}", key, it->type_name());
    return std::nullopt;
}

}  // namespace

RunOptions parseRunOptions(const json& request) {
    RunOptions options;
    if (!request.is_object()) {
        return options;
    }
    options.timeLimitSec = integerField(request, "time_limit_sec");
    options.cpuLimitSec = integerField(request, "cpu_limit_sec");
    options.memLimitMb = integerField(request, "mem_limit_mb");

    auto it = request.find("fs_allowlist");
    if (it != request.end()) {
        if (it->is_array()) {
            std::vector<std::string> allowlist;
            for (const auto& entry : *it) {
                if (entry.is_string()) {
                    allowlist.push_back(entry.get<std::string>());
                }
            }
            options.fsAllowlist = std::move(allowlist);
        } else {
            spdlog::debug("Ignoring 'fs_allowlist' of type {}",
                          it->type_name());
        }
    }
    return options;
}

std::expected<RunRequest, std::string> parseRequest(std::string_view text) {
    json request = json::parse(text.begin(), text.end(), nullptr, false);
    if (request.is_discarded()) {
        return std::unexpected("request is not valid JSON");
    }
    if (!request.is_object()) {
        return std::unexpected("request must be a JSON object");
    }

    auto code = request.find("code");
    if (code == request.end() || !code->is_string()) {
        return std::unexpected("missing 'code'");
    }
    RunRequest parsed;
    parsed.code = code->get<std::string>();
    if (parsed.code.empty()) {
        return std::unexpected("'code' is empty");
    }
    parsed.options = parseRunOptions(request);
    return parsed;
}

json invalidRequestJson(const std::string& message) {
    return {{"status", "error"},
            {"error", "invalid_request"},
            {"message", message}};
}

}  // namespace lockbox::sandbox
