#include "session_stats.hpp"

#include <gtest/gtest.h>
#include <chrono>
#include <string>

using namespace std::chrono;

TEST(SessionAccounting, SummarisesStageTimings) {
    SessionAccounting acc("sender");
    acc.start();
    acc.record_stage(Stage::Encode, milliseconds(10));
    acc.record_stage(Stage::Encode, milliseconds(30));
    acc.record_stage(Stage::Send, milliseconds(5));

    SessionReport r = acc.snapshot();
    const TimingSummary& enc = r.stage(Stage::Encode);
    EXPECT_EQ(enc.count, 2u);
    EXPECT_NEAR(enc.total_s, 0.040, 1e-9);
    EXPECT_NEAR(enc.min_s, 0.010, 1e-9);
    EXPECT_NEAR(enc.max_s, 0.030, 1e-9);
    EXPECT_NEAR(enc.average_s(), 0.020, 1e-9);
    EXPECT_EQ(r.stage(Stage::Send).count, 1u);
    EXPECT_EQ(r.stage(Stage::Decode).count, 0u);
}

TEST(SessionAccounting, CountsPacketsAndBytes) {
    SessionAccounting acc("receiver");
    acc.record_packet(100);
    acc.record_packet(300);
    acc.record_bytes(20);
    acc.chunk_queued();
    acc.chunk_queued();
    acc.chunk_processed();
    acc.chunk_skipped();
    acc.malformed_message();

    SessionReport r = acc.snapshot();
    EXPECT_EQ(r.role, "receiver");
    EXPECT_EQ(r.packets, 2u);
    EXPECT_EQ(acc.packets(), 2u);
    EXPECT_EQ(r.bytes_transferred, 420u);
    EXPECT_EQ(r.packet_sizes.min, 100u);
    EXPECT_EQ(r.packet_sizes.max, 300u);
    EXPECT_DOUBLE_EQ(r.packet_sizes.average(), 200.0);
    EXPECT_EQ(r.chunks_queued, 2u);
    EXPECT_EQ(r.chunks_processed, 1u);
    EXPECT_EQ(r.chunks_skipped, 1u);
    EXPECT_EQ(r.malformed_messages, 1u);
}

TEST(SessionAccounting, KeepsTheFirstErrorAndStaysFailed) {
    SessionAccounting acc("sender");
    acc.start();
    acc.fail("connection closed");
    acc.fail("cancelled");
    acc.complete();

    SessionReport r = acc.snapshot();
    EXPECT_FALSE(r.completed);
    EXPECT_EQ(r.error, "connection closed");
    EXPECT_TRUE(acc.failed());
}

TEST(SessionAccounting, SnapshotIsDetachedFromLaterUpdates) {
    SessionAccounting acc("sender");
    acc.start();
    acc.record_packet(10);
    acc.complete();
    SessionReport before = acc.snapshot();
    acc.record_packet(10);

    EXPECT_TRUE(before.completed);
    EXPECT_EQ(before.packets, 1u);
    EXPECT_EQ(acc.snapshot().packets, 2u);
    EXPECT_GE(before.total_time_s, 0.0);
}

TEST(SessionAccounting, ReportMentionsRateLimitAndStages) {
    SessionAccounting acc("sender");
    acc.start();
    acc.record_stage(Stage::Encode, milliseconds(2));
    acc.record_packet(64);
    acc.set_rate_limit(375, milliseconds(500));
    acc.complete();

    SessionReport r = acc.snapshot();
    EXPECT_TRUE(r.rate_limited);
    EXPECT_EQ(r.rate_limit_bps, 375u);
    EXPECT_NEAR(r.rate_limit_wait_s, 0.5, 1e-9);

    std::string text = format_report(r);
    EXPECT_NE(text.find("Rate limiting: ENABLED - 375 bytes/second (3.0 kbps)"), std::string::npos);
    EXPECT_NE(text.find("encoding"), std::string::npos);
    EXPECT_NE(text.find("Packet Size Statistics"), std::string::npos);
    EXPECT_NE(text.find("completed"), std::string::npos);
}

TEST(SessionAccounting, ReportOfAnAbortedSessionCarriesTheError) {
    SessionAccounting acc("receiver");
    acc.start();
    acc.fail("connection closed by 127.0.0.1:4000");

    std::string text = format_report(acc.snapshot());
    EXPECT_NE(text.find("aborted (connection closed by 127.0.0.1:4000)"), std::string::npos);
    EXPECT_NE(text.find("Rate limiting: DISABLED"), std::string::npos);
}
