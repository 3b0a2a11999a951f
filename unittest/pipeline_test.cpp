// ============================================================================
// PIPELINE UNIT TESTS
// ============================================================================
// Datagram -> reassembly -> decode -> filter -> write, with a fake database
// ============================================================================

#include <gtest/gtest.h>
#include <gelfbridge/core/pipeline/pipeline.hpp>
#include "fake_connection.hpp"

#include <chrono>
#include <thread>

using namespace GelfBridge;
using namespace GelfBridge::Testing;
using namespace std::chrono_literals;

namespace {

RawDatagram datagramOf(const std::string& text) {
    return RawDatagram::fromBytes(std::vector<uint8_t>(text.begin(), text.end()), "127.0.0.1:5000");
}

RawDatagram chunkOf(uint8_t idSeed, uint8_t seq, uint8_t count, const std::string& part) {
    std::vector<uint8_t> bytes = {Gelf::CHUNK_MAGIC_0, Gelf::CHUNK_MAGIC_1};
    for (uint8_t i = 0; i < 8; ++i) bytes.push_back(static_cast<uint8_t>(idSeed + i));
    bytes.push_back(seq);
    bytes.push_back(count);
    bytes.insert(bytes.end(), part.begin(), part.end());
    return RawDatagram::fromBytes(std::move(bytes));
}

class PipelineTest : public ::testing::Test {
protected:
    FakeDatabase db;
    PipelineMetrics metrics;
    ConnectionPool pool{fakeFactory(db), 2};
    AppConfig::WriterConfig writerCfg = makeWriterConfig();
    AppConfig::DatabaseConfig dbCfg = makeDatabaseConfig();
    WriteCoordinator writer{writerCfg, dbCfg, pool, metrics};
    ChunkReassembler reassembler{AppConfig::ReassemblyConfig{}, metrics};
    MessageDecoder decoder;
    FilterStage filter{FilterMode::JSON, {}};
    BoundedQueue<RawDatagram> intake{64};
    Pipeline pipeline{intake, reassembler, decoder, filter, writer, metrics};

    static AppConfig::WriterConfig makeWriterConfig() {
        AppConfig::WriterConfig cfg;
        cfg.workers = 2;
        cfg.initialBackoffMs = 1;
        cfg.maxBackoffMs = 5;
        return cfg;
    }

    static AppConfig::DatabaseConfig makeDatabaseConfig() {
        AppConfig::DatabaseConfig cfg;
        cfg.url = "sqlite://unused.db";
        cfg.sql = "INSERT INTO logs(entry) VALUES (?)";
        return cfg;
    }

    void SetUp() override {
        writer.start();
    }
};

} // anonymous namespace

// ============================================================================
// END-TO-END TESTS
// ============================================================================

TEST_F(PipelineTest, ValidMessageIsWritten) {
    EXPECT_TRUE(pipeline.handleDatagram(
        datagramOf(R"({"version":"1.1","host":"h","short_message":"ok","timestamp":5})")));
    writer.stop();

    ASSERT_EQ(db.rowCount(), 1u);
    EXPECT_EQ(std::get<std::string>(db.rows[0][0]),
              R"({"host":"h","short_message":"ok","timestamp":5,"version":"1.1"})");
    EXPECT_EQ(metrics.records_decoded.load(), 1u);
    EXPECT_EQ(metrics.writes_enqueued.load(), 1u);
}

TEST_F(PipelineTest, GzipDatagramIsRejectedWithoutWrite) {
    std::string gzip = {'\x1f', '\x8b', '\x08', '\x00', '\x00', '\x00'};
    EXPECT_FALSE(pipeline.handleDatagram(datagramOf(gzip)));
    writer.stop();

    EXPECT_EQ(db.rowCount(), 0u);
    EXPECT_EQ(metrics.decode_failures.load(), 1u);
    EXPECT_EQ(metrics.decode_compressed.load(), 1u);
    EXPECT_EQ(metrics.writes_enqueued.load(), 0u);
}

TEST_F(PipelineTest, InvalidJsonIsCountedAndDropped) {
    EXPECT_FALSE(pipeline.handleDatagram(datagramOf("not json at all")));
    EXPECT_FALSE(pipeline.handleDatagram(datagramOf(R"({"version":"1.1","host":"h"})")));
    writer.stop();

    EXPECT_EQ(db.rowCount(), 0u);
    EXPECT_EQ(metrics.decode_failures.load(), 2u);
    EXPECT_EQ(metrics.decode_compressed.load(), 0u);
}

TEST_F(PipelineTest, ChunkedMessageWrittenOnce) {
    const std::string json = R"({"version":"1.1","host":"h","short_message":"ok"})";
    EXPECT_FALSE(pipeline.handleDatagram(chunkOf(7, 1, 3, json.substr(10, 10))));
    EXPECT_FALSE(pipeline.handleDatagram(chunkOf(7, 0, 3, json.substr(0, 10))));
    EXPECT_TRUE(pipeline.handleDatagram(chunkOf(7, 2, 3, json.substr(20))));
    writer.stop();

    EXPECT_EQ(db.rowCount(), 1u);
    EXPECT_EQ(metrics.partials_completed.load(), 1u);
}

TEST_F(PipelineTest, BackgroundThreadDrainsIntakeOnStop) {
    pipeline.start();
    for (int i = 0; i < 10; ++i) {
        intake.push(datagramOf(R"({"version":"1.1","host":"h","short_message":"m)" +
                               std::to_string(i) + R"("})"));
    }
    pipeline.stop();
    writer.stop();

    EXPECT_EQ(db.rowCount(), 10u);
    EXPECT_TRUE(intake.isClosed());
}
