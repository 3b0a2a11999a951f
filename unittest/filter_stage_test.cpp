// ============================================================================
// FILTER STAGE UNIT TESTS
// ============================================================================
// Mode selection, arity and LogRecord -> bound values
// ============================================================================

#include <gtest/gtest.h>
#include <gelfbridge/core/filter/filter_stage.hpp>
#include <gelfbridge/core/gelf/decoder.hpp>
#include <gelfbridge/core/errors.hpp>

using namespace GelfBridge;

namespace {

const std::string kPayload =
    R"({"version":"1.1","host":"db-2","short_message":"slow query","level":4,"_ms":812.5,"_ok":true})";

LogRecord sampleRecord() {
    MessageDecoder decoder;
    return decoder.decode(kPayload, 0.0);
}

AppConfig::FilterConfig filterConfig(const std::string& mode) {
    AppConfig::FilterConfig cfg;
    cfg.mode = mode;
    return cfg;
}

} // anonymous namespace

// ============================================================================
// CONFIGURATION TESTS
// ============================================================================

TEST(FilterStage, ParsesKnownModes) {
    EXPECT_EQ(parseFilterMode("json"), FilterMode::JSON);
    EXPECT_EQ(parseFilterMode("raw"), FilterMode::RAW);
    EXPECT_EQ(parseFilterMode("field"), FilterMode::FIELD);
    EXPECT_EQ(parseFilterMode("fields"), FilterMode::FIELDS);
    EXPECT_STREQ(toString(FilterMode::FIELDS), "fields");
}

TEST(FilterStage, UnknownModeIsConfigError) {
    EXPECT_THROW(FilterStage::fromConfig(filterConfig("xml")), ConfigError);
    EXPECT_THROW(FilterStage::fromConfig(filterConfig("JSON")), ConfigError);
}

TEST(FilterStage, FieldModesRequireFieldNames) {
    EXPECT_THROW(FilterStage::fromConfig(filterConfig("field")), ConfigError);
    EXPECT_THROW(FilterStage::fromConfig(filterConfig("fields")), ConfigError);
}

// ============================================================================
// TRANSFORM TESTS
// ============================================================================

TEST(FilterStage, JsonModeProducesCanonicalRecord) {
    auto stage = FilterStage::fromConfig(filterConfig("json"));
    auto record = sampleRecord();

    FilteredPayload out = stage.apply(record);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(stage.arity(), 1u);
    EXPECT_EQ(std::get<std::string>(out[0]), record.toCanonicalJson());
}

TEST(FilterStage, RawModeKeepsPayloadText) {
    auto stage = FilterStage::fromConfig(filterConfig("raw"));
    FilteredPayload out = stage.apply(sampleRecord());
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(std::get<std::string>(out[0]), kPayload);
}

TEST(FilterStage, FieldModeExtractsScalar) {
    auto cfg = filterConfig("field");
    cfg.field = "short_message";
    auto stage = FilterStage::fromConfig(cfg);

    FilteredPayload out = stage.apply(sampleRecord());
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(std::get<std::string>(out[0]), "slow query");
}

TEST(FilterStage, FieldsModeKeepsOrderAndTypes) {
    auto cfg = filterConfig("fields");
    cfg.fields = {"level", "host", "_ms", "_ok", "_absent"};
    auto stage = FilterStage::fromConfig(cfg);
    EXPECT_EQ(stage.arity(), 5u);

    FilteredPayload out = stage.apply(sampleRecord());
    ASSERT_EQ(out.size(), 5u);
    EXPECT_EQ(std::get<int64_t>(out[0]), 4);
    EXPECT_EQ(std::get<std::string>(out[1]), "db-2");
    EXPECT_DOUBLE_EQ(std::get<double>(out[2]), 812.5);
    EXPECT_EQ(std::get<int64_t>(out[3]), 1);
    EXPECT_TRUE(isNull(out[4]));
}
