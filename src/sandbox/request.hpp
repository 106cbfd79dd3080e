/*
 * request.hpp
 *
 * Copyright (C) 2024 The Lockbox Authors
 */

#ifndef LOCKBOX_SANDBOX_REQUEST_HPP
#define LOCKBOX_SANDBOX_REQUEST_HPP

#include "types.hpp"

#include <nlohmann/json.hpp>

#include <expected>
#include <string>
#include <string_view>

namespace lockbox::sandbox {

/**
 * @brief One execution request as read by the lockbox CLI
 */
struct RunRequest {
    std::string code;
    RunOptions options;
};

/**
 * @brief Parse a JSON request
 *
 * Option keys of the wrong type are treated as absent. Fails when the text
 * is not a JSON object or "code" is missing or empty.
 */
[[nodiscard]] std::expected<RunRequest, std::string> parseRequest(
    std::string_view text);

/**
 * @brief Extract the options from a request object
 */
[[nodiscard]] RunOptions parseRunOptions(const nlohmann::json& request);

/**
 * @brief Wire body for a rejected request
 */
[[nodiscard]] nlohmann::json invalidRequestJson(const std::string& message);

}  // namespace lockbox::sandbox

#endif  // LOCKBOX_SANDBOX_REQUEST_HPP
