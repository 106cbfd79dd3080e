/*
 * report_message.cpp
 *
 * Copyright (C) 2024 The Lockbox Authors
 */

#include "report_message.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>

#include <unistd.h>

namespace lockbox::sandbox::ipc {

namespace {

void putUint32(std::vector<uint8_t>& data, size_t offset, uint32_t value) {
    data[offset] = static_cast<uint8_t>((value >> 24) & 0xFF);
    data[offset + 1] = static_cast<uint8_t>((value >> 16) & 0xFF);
    data[offset + 2] = static_cast<uint8_t>((value >> 8) & 0xFF);
    data[offset + 3] = static_cast<uint8_t>(value & 0xFF);
}

uint32_t getUint32(std::span<const uint8_t> data, size_t offset) {
    return (static_cast<uint32_t>(data[offset]) << 24) |
           (static_cast<uint32_t>(data[offset + 1]) << 16) |
           (static_cast<uint32_t>(data[offset + 2]) << 8) |
           static_cast<uint32_t>(data[offset + 3]);
}

bool isKnownType(uint8_t type) {
    return type >= static_cast<uint8_t>(ReportType::GuardsInstalled) &&
           type <= static_cast<uint8_t>(ReportType::SetupFailed);
}

}  // namespace

// ============================================================================
// ReportHeader
// ============================================================================

std::vector<uint8_t> ReportHeader::serialize() const {
    std::vector<uint8_t> data(SIZE);
    putUint32(data, 0, magic);
    data[4] = version;
    data[5] = static_cast<uint8_t>(type);
    putUint32(data, 6, payloadSize);
    putUint32(data, 10, sequenceId);
    data[14] = flags;
    data[15] = reserved;
    return data;
}

Result<ReportHeader> ReportHeader::deserialize(std::span<const uint8_t> data) {
    if (data.size() < SIZE) {
        return std::unexpected(SandboxError::ReportDecodeFailed);
    }

    ReportHeader header;
    header.magic = getUint32(data, 0);
    header.version = data[4];
    if (header.magic != MAGIC || header.version != VERSION) {
        return std::unexpected(SandboxError::ReportDecodeFailed);
    }
    if (!isKnownType(data[5])) {
        return std::unexpected(SandboxError::ReportDecodeFailed);
    }
    header.type = static_cast<ReportType>(data[5]);
    header.payloadSize = getUint32(data, 6);
    if (header.payloadSize > MAX_PAYLOAD) {
        return std::unexpected(SandboxError::ReportDecodeFailed);
    }
    header.sequenceId = getUint32(data, 10);
    header.flags = data[14];
    header.reserved = data[15];
    return header;
}

// ============================================================================
// ReportMessage
// ============================================================================

ReportMessage ReportMessage::create(ReportType type, const json& payload,
                                    uint32_t sequenceId) {
    ReportMessage msg;
    msg.header.type = type;
    msg.header.sequenceId = sequenceId;
    msg.payload = payload;
    return msg;
}

std::vector<uint8_t> ReportMessage::serialize() const {
    auto body = payload.dump(-1, ' ', false, json::error_handler_t::replace);
    auto head = header;
    head.payloadSize = static_cast<uint32_t>(body.size());

    auto data = head.serialize();
    data.insert(data.end(), body.begin(), body.end());
    return data;
}

// ============================================================================
// ReportDecoder
// ============================================================================

Result<std::vector<ReportMessage>> ReportDecoder::feed(
    std::span<const uint8_t> data) {
    if (failed_) {
        return std::unexpected(SandboxError::ReportDecodeFailed);
    }
    buffer_.insert(buffer_.end(), data.begin(), data.end());

    std::vector<ReportMessage> messages;
    size_t offset = 0;
    while (buffer_.size() - offset >= ReportHeader::SIZE) {
        std::span<const uint8_t> view(buffer_.data() + offset,
                                      buffer_.size() - offset);
        auto header = ReportHeader::deserialize(view);
        if (!header) {
            failed_ = true;
            buffer_.clear();
            return std::unexpected(header.error());
        }
        size_t frameSize = ReportHeader::SIZE + header->payloadSize;
        if (view.size() < frameSize) {
            break;
        }

        ReportMessage msg;
        msg.header = *header;
        auto body = view.subspan(ReportHeader::SIZE, header->payloadSize);
        msg.payload = json::parse(body.begin(), body.end(), nullptr, false);
        if (msg.payload.is_discarded()) {
            failed_ = true;
            buffer_.clear();
            return std::unexpected(SandboxError::ReportDecodeFailed);
        }
        messages.push_back(std::move(msg));
        offset += frameSize;
    }

    buffer_.erase(buffer_.begin(),
                  buffer_.begin() + static_cast<std::ptrdiff_t>(offset));
    return messages;
}

// ============================================================================
// Writer and payload helpers
// ============================================================================

bool writeReport(int fd, ReportType type, const json& payload,
                 uint32_t sequenceId) {
    if (fd < 0) {
        return false;
    }
    auto data = ReportMessage::create(type, payload, sequenceId).serialize();
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        written += static_cast<size_t>(n);
    }
    return true;
}

json guardReportToJson(const GuardReport& report) {
    return {{"rlimits", report.rlimits},
            {"deadline", report.deadline},
            {"network", report.network},
            {"filesystem", report.filesystem},
            {"landlock_abi", report.landlockAbi},
            {"address_space_mb", report.addressSpaceMb},
            {"degraded", report.degraded}};
}

GuardReport guardReportFromJson(const json& j) {
    GuardReport report;
    if (!j.is_object()) {
        return report;
    }
    report.received = true;
    report.rlimits = j.value("rlimits", false);
    report.deadline = j.value("deadline", false);
    report.network = j.value("network", std::string("unavailable"));
    report.filesystem = j.value("filesystem", std::string("unavailable"));
    report.landlockAbi = j.value("landlock_abi", 0);
    report.addressSpaceMb = j.value("address_space_mb", uint64_t{0});
    report.degraded = j.value("degraded", true);
    return report;
}

void applyReport(const ReportMessage& message, RawOutcome& outcome) {
    const auto& p = message.payload;
    try {
        switch (message.header.type) {
            case ReportType::GuardsInstalled:
                outcome.guards = guardReportFromJson(p);
                break;
            case ReportType::ChildSpawned:
                if (p.contains("pid") && p["pid"].is_number_integer()) {
                    outcome.childPid = p["pid"].get<int>();
                }
                break;
            case ReportType::ChildExited:
                if (p.contains("signal") && p["signal"].is_number_integer()) {
                    outcome.childSignal = p["signal"].get<int>();
                }
                outcome.harnessDeadline = p.value("deadline", false);
                break;
            case ReportType::SetupFailed:
                outcome.setupFailure = p.value("stage", std::string("setup")) +
                                       ": " +
                                       p.value("message", std::string());
                break;
        }
    } catch (const json::exception& e) {
        spdlog::warn("Ignoring malformed {} report: {}",
                     reportTypeToString(message.header.type), e.what());
    }
}

}  // namespace lockbox::sandbox::ipc
