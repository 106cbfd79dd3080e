/*
 * test_report_message.cpp
 *
 * Copyright (C) 2024 The Lockbox Authors
 */

/**
 * @file test_report_message.cpp
 * @brief Tests for report framing, stream decoding and outcome folding
 */

#include <gtest/gtest.h>
#include "sandbox/ipc/report_message.hpp"

#include <cstring>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

using namespace lockbox::sandbox;
using namespace lockbox::sandbox::ipc;

// =============================================================================
// ReportHeader Tests
// =============================================================================

class ReportHeaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        header_.type = ReportType::ChildExited;
        header_.payloadSize = 100;
        header_.sequenceId = 42;
    }

    ReportHeader header_;
};

TEST_F(ReportHeaderTest, DefaultConstruction) {
    ReportHeader h;
    EXPECT_EQ(h.magic, ReportHeader::MAGIC);
    EXPECT_EQ(h.version, ReportHeader::VERSION);
    EXPECT_EQ(h.payloadSize, 0u);
    EXPECT_EQ(h.sequenceId, 0u);
}

TEST_F(ReportHeaderTest, SerializedLayoutIsBigEndian) {
    auto data = header_.serialize();
    ASSERT_EQ(data.size(), ReportHeader::SIZE);
    EXPECT_EQ(std::memcmp(data.data(), "LKBX", 4), 0);
    EXPECT_EQ(data[4], ReportHeader::VERSION);
    EXPECT_EQ(data[5], static_cast<uint8_t>(ReportType::ChildExited));
    EXPECT_EQ(data[9], 100);
    EXPECT_EQ(data[13], 42);
}

TEST_F(ReportHeaderTest, DeserializeRestoresFields) {
    auto result = ReportHeader::deserialize(header_.serialize());
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->type, ReportType::ChildExited);
    EXPECT_EQ(result->payloadSize, 100u);
    EXPECT_EQ(result->sequenceId, 42u);
}

TEST_F(ReportHeaderTest, DeserializeFailsWithTooSmallData) {
    std::vector<uint8_t> data(ReportHeader::SIZE - 1, 0);
    auto result = ReportHeader::deserialize(data);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), SandboxError::ReportDecodeFailed);
}

TEST_F(ReportHeaderTest, DeserializeFailsWithWrongMagic) {
    auto data = header_.serialize();
    data[0] = 'X';
    EXPECT_FALSE(ReportHeader::deserialize(data).has_value());
}

TEST_F(ReportHeaderTest, DeserializeFailsWithWrongVersion) {
    auto data = header_.serialize();
    data[4] = 2;
    EXPECT_FALSE(ReportHeader::deserialize(data).has_value());
}

TEST_F(ReportHeaderTest, DeserializeFailsWithUnknownType) {
    auto data = header_.serialize();
    data[5] = 0x7F;
    EXPECT_FALSE(ReportHeader::deserialize(data).has_value());
}

TEST_F(ReportHeaderTest, DeserializeFailsWithOversizedPayload) {
    header_.payloadSize = ReportHeader::MAX_PAYLOAD + 1;
    EXPECT_FALSE(ReportHeader::deserialize(header_.serialize()).has_value());
}

// =============================================================================
// ReportDecoder Tests
// =============================================================================

class ReportDecoderTest : public ::testing::Test {
protected:
    std::vector<uint8_t> stream() {
        std::vector<uint8_t> data;
        for (const auto& msg :
             {ReportMessage::create(ReportType::GuardsInstalled,
                                    guardReportToJson(GuardReport{}), 1),
              ReportMessage::create(ReportType::ChildSpawned, {{"pid", 1234}}, 2),
              ReportMessage::create(ReportType::ChildExited,
                                    {{"exitCode", 0}, {"deadline", false}}, 3)}) {
            auto bytes = msg.serialize();
            data.insert(data.end(), bytes.begin(), bytes.end());
        }
        return data;
    }

    ReportDecoder decoder_;
};

TEST_F(ReportDecoderTest, DecodesWholeStream) {
    auto result = decoder_.feed(stream());
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->size(), 3u);
    EXPECT_EQ((*result)[1].header.type, ReportType::ChildSpawned);
    EXPECT_EQ((*result)[1].payload["pid"], 1234);
    EXPECT_EQ(decoder_.pending(), 0u);
}

TEST_F(ReportDecoderTest, ByteByByteFragmentation) {
    auto data = stream();
    std::vector<ReportMessage> messages;
    for (uint8_t byte : data) {
        auto result = decoder_.feed(std::span<const uint8_t>(&byte, 1));
        ASSERT_TRUE(result.has_value());
        for (auto& msg : *result) {
            messages.push_back(std::move(msg));
        }
    }
    ASSERT_EQ(messages.size(), 3u);
    EXPECT_EQ(messages[0].header.sequenceId, 1u);
    EXPECT_EQ(messages[2].header.type, ReportType::ChildExited);
}

TEST_F(ReportDecoderTest, SplitAcrossHeaderBoundary) {
    auto data = stream();
    std::span<const uint8_t> all(data);
    auto first = decoder_.feed(all.first(10));
    ASSERT_TRUE(first.has_value());
    EXPECT_TRUE(first->empty());
    EXPECT_EQ(decoder_.pending(), 10u);

    auto rest = decoder_.feed(all.subspan(10));
    ASSERT_TRUE(rest.has_value());
    EXPECT_EQ(rest->size(), 3u);
}

TEST_F(ReportDecoderTest, CorruptMagicFailsAndStaysFailed) {
    auto data = stream();
    data[0] ^= 0xFF;
    auto result = decoder_.feed(data);
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(decoder_.failed());

    auto good = ReportMessage::create(ReportType::ChildSpawned, {{"pid", 1}})
                    .serialize();
    EXPECT_FALSE(decoder_.feed(good).has_value());
}

TEST_F(ReportDecoderTest, MalformedPayloadFails) {
    ReportHeader header;
    header.type = ReportType::SetupFailed;
    header.payloadSize = 5;
    auto data = header.serialize();
    for (char c : std::string("{bad}")) {
        data.push_back(static_cast<uint8_t>(c));
    }
    EXPECT_FALSE(decoder_.feed(data).has_value());
}

TEST_F(ReportDecoderTest, OversizedPayloadRejectedBeforeBuffering) {
    ReportHeader header;
    header.payloadSize = ReportHeader::MAX_PAYLOAD + 1;
    EXPECT_FALSE(decoder_.feed(header.serialize()).has_value());
}

// =============================================================================
// Writer
// =============================================================================

TEST(ReportWriterTest, WritesFrameToPipe) {
    int fds[2];
    ASSERT_EQ(pipe(fds), 0);
    ASSERT_TRUE(writeReport(fds[1], ReportType::ChildSpawned, {{"pid", 77}}, 5));
    close(fds[1]);

    std::vector<uint8_t> data(256);
    ssize_t n = read(fds[0], data.data(), data.size());
    close(fds[0]);
    ASSERT_GT(n, 0);
    data.resize(static_cast<size_t>(n));

    ReportDecoder decoder;
    auto result = decoder.feed(data);
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->size(), 1u);
    EXPECT_EQ(result->front().header.sequenceId, 5u);
    EXPECT_EQ(result->front().payload["pid"], 77);
}

TEST(ReportWriterTest, InvalidDescriptorFails) {
    EXPECT_FALSE(writeReport(-1, ReportType::ChildSpawned, {{"pid", 1}}, 0));
}

// =============================================================================
// Payload helpers
// =============================================================================

TEST(GuardReportJsonTest, WireKeys) {
    GuardReport report;
    report.rlimits = true;
    report.deadline = true;
    report.network = "seccomp";
    report.filesystem = "landlock";
    report.landlockAbi = 3;
    report.addressSpaceMb = 80;
    report.degraded = false;

    auto j = guardReportToJson(report);
    EXPECT_EQ(j["rlimits"], true);
    EXPECT_EQ(j["network"], "seccomp");
    EXPECT_EQ(j["filesystem"], "landlock");
    EXPECT_EQ(j["landlock_abi"], 3);
    EXPECT_EQ(j["address_space_mb"], 80);
    EXPECT_EQ(j["degraded"], false);

    auto back = guardReportFromJson(j);
    EXPECT_TRUE(back.received);
    EXPECT_EQ(back.network, "seccomp");
    EXPECT_EQ(back.landlockAbi, 3);
    EXPECT_EQ(back.addressSpaceMb, 80u);
    EXPECT_FALSE(back.degraded);
}

TEST(GuardReportJsonTest, NonObjectLeavesReportUnreceived) {
    auto report = guardReportFromJson(json::array());
    EXPECT_FALSE(report.received);
    EXPECT_TRUE(report.degraded);
}

TEST(ApplyReportTest, FoldsEveryType) {
    RawOutcome outcome;
    applyReport(ReportMessage::create(ReportType::ChildSpawned, {{"pid", 99}}),
                outcome);
    EXPECT_EQ(outcome.childPid, 99);

    applyReport(ReportMessage::create(ReportType::ChildExited,
                                      {{"exitCode", 124},
                                       {"signal", 9},
                                       {"deadline", true}}),
                outcome);
    EXPECT_EQ(outcome.childSignal, 9);
    EXPECT_TRUE(outcome.harnessDeadline);

    applyReport(ReportMessage::create(ReportType::SetupFailed,
                                      {{"stage", "landlock"},
                                       {"message", "not supported"},
                                       {"errno", 95}}),
                outcome);
    ASSERT_TRUE(outcome.setupFailure.has_value());
    EXPECT_EQ(*outcome.setupFailure, "landlock: not supported");
}

TEST(ApplyReportTest, WrongFieldTypesIgnored) {
    RawOutcome outcome;
    applyReport(ReportMessage::create(ReportType::ChildSpawned,
                                      {{"pid", "not a number"}}),
                outcome);
    EXPECT_FALSE(outcome.childPid.has_value());

    applyReport(ReportMessage::create(ReportType::ChildExited,
                                      {{"deadline", "yes"}}),
                outcome);
    EXPECT_FALSE(outcome.harnessDeadline);
}
