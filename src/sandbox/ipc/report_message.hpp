/*
 * report_message.hpp
 *
 * Copyright (C) 2024 The Lockbox Authors
 */

/**
 * @file report_message.hpp
 * @brief Framed messages from lockbox-harness to the supervisor
 * @date 2024
 * @version 1.0.0
 *
 * The harness reports its progress on a dedicated pipe:
 * - 16-byte big-endian header with magic number and version
 * - JSON payload
 * - A stream decoder that tolerates arbitrary fragmentation
 */

#ifndef LOCKBOX_SANDBOX_IPC_REPORT_MESSAGE_HPP
#define LOCKBOX_SANDBOX_IPC_REPORT_MESSAGE_HPP

#include "sandbox/types.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace lockbox::sandbox::ipc {

using json = nlohmann::json;

/**
 * @brief Report message types
 */
enum class ReportType : uint8_t {
    GuardsInstalled = 0x01,  ///< GuardReport
    ChildSpawned = 0x02,     ///< {pid}
    ChildExited = 0x03,      ///< {exitCode, signal, deadline}
    SetupFailed = 0x04       ///< {stage, message, errno}
};

[[nodiscard]] constexpr std::string_view reportTypeToString(
    ReportType type) noexcept {
    switch (type) {
        case ReportType::GuardsInstalled: return "GuardsInstalled";
        case ReportType::ChildSpawned: return "ChildSpawned";
        case ReportType::ChildExited: return "ChildExited";
        case ReportType::SetupFailed: return "SetupFailed";
    }
    return "Unknown";
}

/**
 * @brief Frame header
 */
struct ReportHeader {
    static constexpr uint32_t MAGIC = 0x4C4B4258;  // "LKBX"
    static constexpr uint8_t VERSION = 1;
    static constexpr size_t SIZE = 16;
    static constexpr uint32_t MAX_PAYLOAD = 1024 * 1024;

    uint32_t magic{MAGIC};
    uint8_t version{VERSION};
    ReportType type{ReportType::GuardsInstalled};
    uint32_t payloadSize{0};
    uint32_t sequenceId{0};
    uint8_t flags{0};
    uint8_t reserved{0};

    [[nodiscard]] std::vector<uint8_t> serialize() const;

    /**
     * @brief Parse a header
     * @return ReportDecodeFailed on short input, bad magic, bad version,
     * unknown type or oversized payload
     */
    [[nodiscard]] static Result<ReportHeader> deserialize(
        std::span<const uint8_t> data);
};

/**
 * @brief One decoded report
 */
struct ReportMessage {
    ReportHeader header;
    json payload;

    [[nodiscard]] static ReportMessage create(ReportType type,
                                              const json& payload,
                                              uint32_t sequenceId = 0);

    /**
     * @brief Header followed by the compact JSON payload
     */
    [[nodiscard]] std::vector<uint8_t> serialize() const;
};

/**
 * @brief Incremental decoder for a report stream
 *
 * Bytes may arrive split at any position. After the first error the decoder
 * stays failed and ignores further input.
 */
class ReportDecoder {
public:
    /**
     * @brief Append bytes and extract every complete message
     */
    [[nodiscard]] Result<std::vector<ReportMessage>> feed(
        std::span<const uint8_t> data);

    [[nodiscard]] bool failed() const noexcept { return failed_; }

    /**
     * @brief Bytes received but not yet part of a complete message
     */
    [[nodiscard]] size_t pending() const noexcept { return buffer_.size(); }

private:
    std::vector<uint8_t> buffer_;
    bool failed_{false};
};

/**
 * @brief Write one framed report to a descriptor
 *
 * Handles short writes and EINTR. Used by the harness only.
 */
[[nodiscard]] bool writeReport(int fd, ReportType type, const json& payload,
                               uint32_t sequenceId);

// Payload helpers

[[nodiscard]] json guardReportToJson(const GuardReport& report);
[[nodiscard]] GuardReport guardReportFromJson(const json& j);

/**
 * @brief Fold one message into a raw outcome
 */
void applyReport(const ReportMessage& message, RawOutcome& outcome);

}  // namespace lockbox::sandbox::ipc

#endif  // LOCKBOX_SANDBOX_IPC_REPORT_MESSAGE_HPP
