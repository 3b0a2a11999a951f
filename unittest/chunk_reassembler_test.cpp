// ============================================================================
// CHUNK REASSEMBLER UNIT TESTS
// ============================================================================
// GELF chunk parsing, reassembly, staleness and protocol violations
// ============================================================================

#include <gtest/gtest.h>
#include <gelfbridge/core/gelf/chunk_header.hpp>
#include <gelfbridge/core/gelf/decoder.hpp>
#include <gelfbridge/core/gelf/reassembler.hpp>
#include <gelfbridge/core/errors.hpp>

#include <algorithm>
#include <chrono>

using namespace GelfBridge;
using namespace std::chrono_literals;

namespace {

MessageId makeId(uint8_t seed) {
    MessageId id{};
    for (size_t i = 0; i < id.size(); ++i) id[i] = static_cast<uint8_t>(seed + i);
    return id;
}

std::vector<uint8_t> makeChunk(const MessageId& id, uint8_t seq, uint8_t count, const std::string& payload) {
    std::vector<uint8_t> out = {Gelf::CHUNK_MAGIC_0, Gelf::CHUNK_MAGIC_1};
    out.insert(out.end(), id.begin(), id.end());
    out.push_back(seq);
    out.push_back(count);
    out.insert(out.end(), payload.begin(), payload.end());
    return out;
}

AppConfig::ReassemblyConfig testConfig() {
    AppConfig::ReassemblyConfig cfg;
    cfg.staleTimeoutMs = 5000;
    cfg.maxPendingMessages = 16;
    return cfg;
}

class ChunkReassemblerTest : public ::testing::Test {
protected:
    PipelineMetrics metrics;
    ChunkReassembler reassembler{testConfig(), metrics};
    Clock::SteadyPoint t0 = Clock::steady();

    std::optional<std::string> feed(const std::vector<uint8_t>& bytes, Clock::SteadyPoint at) {
        return reassembler.admit(bytes.data(), bytes.size(), at);
    }
};

} // anonymous namespace

// ============================================================================
// HEADER PARSING TESTS
// ============================================================================

TEST(ChunkHeader, ParsesValidHeader) {
    auto id = makeId(0x10);
    auto bytes = makeChunk(id, 2, 5, "abc");

    ChunkHeader h = parseChunkHeader(bytes.data(), bytes.size());
    EXPECT_EQ(h.messageId, id);
    EXPECT_EQ(h.sequenceNumber, 2);
    EXPECT_EQ(h.sequenceCount, 5);
    EXPECT_EQ(toHex(id), "1011121314151617");
}

TEST(ChunkHeader, RejectsInvalidHeaders) {
    auto id = makeId(0);
    auto zeroCount = makeChunk(id, 0, 0, "x");
    auto seqOutOfRange = makeChunk(id, 3, 3, "x");
    auto tooMany = makeChunk(id, 0, 129, "x");
    std::vector<uint8_t> truncated = {0x1e, 0x0f, 1, 2, 3};

    EXPECT_THROW(parseChunkHeader(zeroCount.data(), zeroCount.size()), MalformedChunkError);
    EXPECT_THROW(parseChunkHeader(seqOutOfRange.data(), seqOutOfRange.size()), MalformedChunkError);
    EXPECT_THROW(parseChunkHeader(tooMany.data(), tooMany.size()), MalformedChunkError);
    EXPECT_THROW(parseChunkHeader(truncated.data(), truncated.size()), MalformedChunkError);
}

// ============================================================================
// REASSEMBLY TESTS
// ============================================================================

TEST_F(ChunkReassemblerTest, UnchunkedDatagramPassesThrough) {
    std::string json = R"({"version":"1.1","host":"h","short_message":"m"})";
    std::vector<uint8_t> bytes(json.begin(), json.end());

    auto out = feed(bytes, t0);
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(*out, json);
    EXPECT_EQ(reassembler.pendingCount(), 0u);
    EXPECT_EQ(metrics.messages_unchunked.load(), 1u);
}

TEST_F(ChunkReassemblerTest, SingleChunkMessageCompletesImmediately) {
    auto out = feed(makeChunk(makeId(1), 0, 1, "whole"), t0);
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(*out, "whole");
    EXPECT_EQ(reassembler.pendingCount(), 0u);
}

TEST_F(ChunkReassemblerTest, InOrderChunksAssemble) {
    auto id = makeId(2);
    EXPECT_FALSE(feed(makeChunk(id, 0, 3, "AAA"), t0).has_value());
    EXPECT_FALSE(feed(makeChunk(id, 1, 3, "BBB"), t0).has_value());
    EXPECT_EQ(reassembler.pendingCount(), 1u);

    auto out = feed(makeChunk(id, 2, 3, "CC"), t0);
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(*out, "AAABBBCC");
    EXPECT_EQ(reassembler.pendingCount(), 0u);
    EXPECT_EQ(metrics.partials_completed.load(), 1u);
}

TEST_F(ChunkReassemblerTest, ArrivalOrderDoesNotMatter) {
    const std::vector<std::string> parts = {"one-", "two-", "three"};
    std::vector<int> order = {0, 1, 2};
    uint8_t seed = 50;

    do {
        auto id = makeId(seed++);
        std::optional<std::string> out;
        for (int seq : order) {
            out = feed(makeChunk(id, static_cast<uint8_t>(seq), 3, parts[seq]), t0);
        }
        ASSERT_TRUE(out.has_value());
        EXPECT_EQ(*out, "one-two-three");
    } while (std::next_permutation(order.begin(), order.end()));

    EXPECT_EQ(reassembler.pendingCount(), 0u);
}

TEST_F(ChunkReassemblerTest, InterleavedMessagesStaySeparate) {
    auto a = makeId(3);
    auto b = makeId(4);
    EXPECT_FALSE(feed(makeChunk(a, 0, 2, "a0"), t0).has_value());
    EXPECT_FALSE(feed(makeChunk(b, 1, 2, "b1"), t0).has_value());

    auto outB = feed(makeChunk(b, 0, 2, "b0"), t0);
    auto outA = feed(makeChunk(a, 1, 2, "a1"), t0);
    ASSERT_TRUE(outA.has_value());
    ASSERT_TRUE(outB.has_value());
    EXPECT_EQ(*outA, "a0a1");
    EXPECT_EQ(*outB, "b0b1");
}

TEST_F(ChunkReassemblerTest, DuplicateChunkDoesNotComplete) {
    auto id = makeId(5);
    EXPECT_FALSE(feed(makeChunk(id, 0, 2, "x"), t0).has_value());
    EXPECT_FALSE(feed(makeChunk(id, 0, 2, "x"), t0).has_value());
    EXPECT_EQ(metrics.chunks_duplicate.load(), 1u);

    auto out = feed(makeChunk(id, 1, 2, "y"), t0);
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(*out, "xy");
}

TEST_F(ChunkReassemblerTest, ResendAfterCompletionIsNewMessage) {
    auto id = makeId(6);
    feed(makeChunk(id, 0, 2, "he"), t0);
    auto first = feed(makeChunk(id, 1, 2, "llo"), t0);

    feed(makeChunk(id, 0, 2, "he"), t0);
    auto second = feed(makeChunk(id, 1, 2, "llo"), t0);

    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*first, *second);
    EXPECT_EQ(metrics.partials_completed.load(), 2u);
}

// ============================================================================
// STALENESS TESTS
// ============================================================================

TEST_F(ChunkReassemblerTest, SweepEvictsStalePartials) {
    auto id = makeId(7);
    feed(makeChunk(id, 0, 3, "a"), t0);
    feed(makeChunk(id, 1, 3, "b"), t0);

    EXPECT_EQ(reassembler.sweep(t0 + 4s), 0u);
    EXPECT_EQ(reassembler.pendingCount(), 1u);

    EXPECT_EQ(reassembler.sweep(t0 + 6s), 1u);
    EXPECT_EQ(reassembler.pendingCount(), 0u);
    EXPECT_EQ(metrics.partials_evicted_stale.load(), 1u);

    // The last chunk now opens a fresh, incomplete entry
    EXPECT_FALSE(feed(makeChunk(id, 2, 3, "c"), t0 + 6s).has_value());
    EXPECT_EQ(reassembler.pendingCount(), 1u);
}

TEST_F(ChunkReassemblerTest, LateChunkWithoutSweepStartsFresh) {
    auto id = makeId(8);
    feed(makeChunk(id, 0, 2, "a"), t0);

    EXPECT_FALSE(feed(makeChunk(id, 1, 2, "b"), t0 + 10s).has_value());
    EXPECT_EQ(reassembler.pendingCount(), 1u);
    EXPECT_EQ(metrics.partials_evicted_stale.load(), 1u);
}

// ============================================================================
// PROTOCOL VIOLATION TESTS
// ============================================================================

TEST_F(ChunkReassemblerTest, CountMismatchDiscardsEntry) {
    auto id = makeId(9);
    feed(makeChunk(id, 0, 3, "a"), t0);
    EXPECT_FALSE(feed(makeChunk(id, 1, 4, "b"), t0).has_value());

    EXPECT_EQ(reassembler.pendingCount(), 0u);
    EXPECT_EQ(metrics.partials_discarded_conflict.load(), 1u);
}

TEST_F(ChunkReassemblerTest, MalformedChunkIsCountedNotThrown) {
    auto bad = makeChunk(makeId(10), 5, 2, "x");
    std::optional<std::string> out;
    EXPECT_NO_THROW(out = feed(bad, t0));
    EXPECT_FALSE(out.has_value());
    EXPECT_EQ(metrics.chunks_malformed.load(), 1u);
}

TEST(ChunkReassembler, FullTableRejectsNewMessages) {
    AppConfig::ReassemblyConfig cfg;
    cfg.maxPendingMessages = 2;
    PipelineMetrics metrics;
    ChunkReassembler reassembler(cfg, metrics);
    auto now = Clock::steady();

    for (uint8_t i = 0; i < 3; ++i) {
        auto bytes = makeChunk(makeId(i * 10), 0, 2, "p");
        reassembler.admit(bytes.data(), bytes.size(), now);
    }
    EXPECT_EQ(reassembler.pendingCount(), 2u);
    EXPECT_EQ(metrics.chunks_rejected_table_full.load(), 1u);

    // Chunks of already-tracked messages are still accepted
    auto second = makeChunk(makeId(0), 1, 2, "q");
    auto out = reassembler.admit(second.data(), second.size(), now);
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(*out, "pq");
}

// ============================================================================
// END-TO-END GELF TEST
// ============================================================================

TEST_F(ChunkReassemblerTest, ThreeChunkGelfMessageDecodes) {
    const std::string json = R"({"version":"1.1","host":"h","short_message":"ok"})";
    auto id = makeId(42);
    const size_t third = json.size() / 3;

    feed(makeChunk(id, 0, 3, json.substr(0, third)), t0);
    feed(makeChunk(id, 2, 3, json.substr(2 * third)), t0);
    auto out = feed(makeChunk(id, 1, 3, json.substr(third, third)), t0);
    ASSERT_TRUE(out.has_value());

    MessageDecoder decoder;
    LogRecord record = decoder.decode(*out, 1700000000.0);
    EXPECT_EQ(record.version(), "1.1");
    EXPECT_EQ(record.host(), "h");
    EXPECT_EQ(record.shortMessage(), "ok");
}
