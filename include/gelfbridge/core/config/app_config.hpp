#pragma once

#include <gelfbridge/core/queues/bounded_queue.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace AppConfig {

struct IngestConfig {
    std::string host = "127.0.0.1";
    uint16_t port = 0;
    size_t maxDatagramBytes = 65507;
    int socketBufferBytes = 4 * 1024 * 1024;
    GelfBridge::OverflowPolicy overflowPolicy = GelfBridge::OverflowPolicy::BLOCK_PRODUCER;
    size_t queueCapacity = 4096;
};

struct ReassemblyConfig {
    uint32_t staleTimeoutMs = 5000;
    uint32_t sweepIntervalMs = 1000;
    size_t maxPendingMessages = 16384;
};

struct FilterConfig {
    std::string mode = "json";
    std::string field;                  // mode "field"
    std::vector<std::string> fields;    // mode "fields"
};

struct DatabaseConfig {
    std::string url;
    std::string sql;
    size_t maxConnections = 4;
    uint32_t acquireTimeoutMs = 1000;
    uint32_t writeTimeoutMs = 5000;
};

struct WriterConfig {
    size_t workers = 4;
    size_t queueCapacity = 1024;
    size_t batchSize = 1;
    uint32_t maxAttempts = 5;
    uint32_t initialBackoffMs = 50;
    uint32_t maxBackoffMs = 2000;
    uint32_t drainTimeoutMs = 5000;
};

struct LoggingConfig {
    std::string level = "info";
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
};

struct MetricsConfig {
    uint32_t reportIntervalMs = 10000;   // 0 disables periodic reports
};

struct AppConfiguration {
    std::string app_name;
    std::string version;

    IngestConfig ingest;
    ReassemblyConfig reassembly;
    FilterConfig filter;
    DatabaseConfig database;
    WriterConfig writer;
    LoggingConfig logging;
    MetricsConfig metrics;
};

} // namespace AppConfig
