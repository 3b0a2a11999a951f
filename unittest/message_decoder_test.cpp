// ============================================================================
// MESSAGE DECODER UNIT TESTS
// ============================================================================
// GELF JSON validation, compressed payload rejection, timestamp defaulting
// ============================================================================

#include <gtest/gtest.h>
#include <gelfbridge/core/gelf/decoder.hpp>
#include <gelfbridge/core/errors.hpp>

using namespace GelfBridge;

namespace {

DecodeError::Reason decodeFailure(const std::string& payload) {
    MessageDecoder decoder;
    try {
        decoder.decode(payload, 0.0);
    } catch (const DecodeError& e) {
        return e.reason();
    }
    ADD_FAILURE() << "expected DecodeError for: " << payload;
    return DecodeError::Reason::INVALID_JSON;
}

} // anonymous namespace

// ============================================================================
// SUCCESSFUL DECODING TESTS
// ============================================================================

TEST(MessageDecoder, DecodesMinimalMessage) {
    MessageDecoder decoder;
    const std::string payload = R"({"version":"1.1","host":"web-1","short_message":"started","timestamp":1700000000.5,"level":6,"_user":"alice"})";

    LogRecord record = decoder.decode(payload, 1.0);
    EXPECT_EQ(record.version(), "1.1");
    EXPECT_EQ(record.host(), "web-1");
    EXPECT_EQ(record.shortMessage(), "started");
    EXPECT_DOUBLE_EQ(record.timestamp(), 1700000000.5);
    ASSERT_TRUE(record.level().has_value());
    EXPECT_EQ(*record.level(), 6);
    ASSERT_NE(record.field("_user"), nullptr);
    EXPECT_EQ(record.field("_user")->get<std::string>(), "alice");
    EXPECT_EQ(record.field("_missing"), nullptr);
    EXPECT_EQ(record.rawPayload(), payload);
}

TEST(MessageDecoder, MissingTimestampUsesReceiveTime) {
    MessageDecoder decoder;
    LogRecord record = decoder.decode(R"({"version":"1.1","host":"h","short_message":"m"})", 1234.5);
    EXPECT_DOUBLE_EQ(record.timestamp(), 1234.5);
}

TEST(MessageDecoder, AcceptsVersion10) {
    MessageDecoder decoder;
    EXPECT_NO_THROW(decoder.decode(R"({"version":"1.0","host":"h","short_message":"m"})", 0.0));
}

TEST(MessageDecoder, CanonicalJsonSortsKeys) {
    MessageDecoder decoder;
    LogRecord record = decoder.decode(
        R"({"short_message":"m","version":"1.1","host":"h","timestamp":2})", 0.0);
    EXPECT_EQ(record.toCanonicalJson(), R"({"host":"h","short_message":"m","timestamp":2,"version":"1.1"})");
}

// ============================================================================
// REJECTION TESTS
// ============================================================================

TEST(MessageDecoder, RejectsGzipPayload) {
    std::string gzip = {'\x1f', '\x8b', '\x08', '\x00', 'x', 'y'};
    EXPECT_EQ(decodeFailure(gzip), DecodeError::Reason::COMPRESSED);
    EXPECT_TRUE(MessageDecoder::isCompressed(gzip));
}

TEST(MessageDecoder, RejectsZlibPayload) {
    std::string zlib = {'\x78', '\x9c', '\x01', '\x02'};
    EXPECT_EQ(decodeFailure(zlib), DecodeError::Reason::COMPRESSED);
}

TEST(MessageDecoder, RejectsInvalidJson) {
    EXPECT_EQ(decodeFailure("{\"version\":"), DecodeError::Reason::INVALID_JSON);
    EXPECT_EQ(decodeFailure(""), DecodeError::Reason::INVALID_JSON);
}

TEST(MessageDecoder, RejectsNonObject) {
    EXPECT_EQ(decodeFailure("[1,2,3]"), DecodeError::Reason::NOT_AN_OBJECT);
}

TEST(MessageDecoder, RejectsMissingRequiredFields) {
    EXPECT_EQ(decodeFailure(R"({"host":"h","short_message":"m"})"), DecodeError::Reason::MISSING_FIELD);
    EXPECT_EQ(decodeFailure(R"({"version":"1.1","short_message":"m"})"), DecodeError::Reason::MISSING_FIELD);
    EXPECT_EQ(decodeFailure(R"({"version":"1.1","host":"h"})"), DecodeError::Reason::MISSING_FIELD);
    EXPECT_EQ(decodeFailure(R"({"version":"1.1","host":null,"short_message":"m"})"), DecodeError::Reason::MISSING_FIELD);
}

TEST(MessageDecoder, RejectsUnknownVersion) {
    EXPECT_EQ(decodeFailure(R"({"version":"2.0","host":"h","short_message":"m"})"),
              DecodeError::Reason::UNSUPPORTED_VERSION);
}

TEST(MessageDecoder, LevelMustBeWholeNumberInRange) {
    EXPECT_EQ(decodeFailure(R"({"version":"1.1","host":"h","short_message":"m","level":1e300})"),
              DecodeError::Reason::INVALID_FIELD);
    EXPECT_EQ(decodeFailure(R"({"version":"1.1","host":"h","short_message":"m","level":2.5})"),
              DecodeError::Reason::INVALID_FIELD);
    EXPECT_EQ(decodeFailure(R"({"version":"1.1","host":"h","short_message":"m","level":9223372036854775808})"),
              DecodeError::Reason::INVALID_FIELD);

    MessageDecoder decoder;
    auto whole = decoder.decode(R"({"version":"1.1","host":"h","short_message":"m","level":3.0})", 0.0);
    ASSERT_TRUE(whole.level().has_value());
    EXPECT_EQ(*whole.level(), 3);

    auto negative = decoder.decode(R"({"version":"1.1","host":"h","short_message":"m","level":-1})", 0.0);
    EXPECT_EQ(negative.level().value_or(0), -1);

    auto absent = decoder.decode(R"({"version":"1.1","host":"h","short_message":"m"})", 0.0);
    EXPECT_FALSE(absent.level().has_value());
}

TEST(MessageDecoder, RejectsInvalidFields) {
    EXPECT_EQ(decodeFailure(R"({"version":"1.1","host":"h","short_message":"m","level":"high"})"),
              DecodeError::Reason::INVALID_FIELD);
    EXPECT_EQ(decodeFailure(R"({"version":"1.1","host":"h","short_message":"m","_id":"x"})"),
              DecodeError::Reason::INVALID_FIELD);
    EXPECT_EQ(decodeFailure(R"({"version":"1.1","host":"h","short_message":"m","_ctx":{"a":1}})"),
              DecodeError::Reason::INVALID_FIELD);
    EXPECT_EQ(decodeFailure(R"({"version":"1.1","host":"h","short_message":"m","timestamp":"now"})"),
              DecodeError::Reason::INVALID_FIELD);
}
