#include <gelfbridge/core/config/loader.hpp>
#include <gelfbridge/core/errors.hpp>
#include <gelfbridge/core/filter/filter_stage.hpp>
#include <gelfbridge/core/storage/connection_factory.hpp>

#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <limits>

using GelfBridge::ConfigError;

namespace {

// ============================================================================
// Typed accessors
// ============================================================================

template <typename T>
T readAs(const YAML::Node& node, const std::string& path) {
    try {
        return node.as<T>();
    } catch (const YAML::Exception&) {
        throw ConfigError("Invalid type for config key '" + path + "'");
    }
}

YAML::Node child(const YAML::Node& parent, const std::string& key) {
    if (!parent || !parent.IsMap()) return YAML::Node();
    return parent[key];
}

template <typename T>
T required(const YAML::Node& parent, const std::string& key, const std::string& path) {
    YAML::Node node = child(parent, key);
    if (!node || node.IsNull()) {
        throw ConfigError("Missing required config key '" + path + "'");
    }
    return readAs<T>(node, path);
}

template <typename T>
T optional(const YAML::Node& parent, const std::string& key, const std::string& path, T fallback) {
    YAML::Node node = child(parent, key);
    if (!node || node.IsNull()) return fallback;
    return readAs<T>(node, path);
}

// Unsigned integer in [minValue, maxValue]
template <typename T>
T boundedUnsigned(const YAML::Node& parent, const std::string& key, const std::string& path,
                  T fallback, uint64_t minValue, uint64_t maxValue) {
    YAML::Node node = child(parent, key);
    if (!node || node.IsNull()) return fallback;

    auto value = readAs<int64_t>(node, path);
    if (value < 0 || static_cast<uint64_t>(value) < minValue || static_cast<uint64_t>(value) > maxValue) {
        throw ConfigError("Value " + std::to_string(value) + " out of range for config key '" + path +
                          "' (expected " + std::to_string(minValue) + ".." + std::to_string(maxValue) + ")");
    }
    return static_cast<T>(value);
}

GelfBridge::OverflowPolicy parseOverflowPolicy(const std::string& value) {
    if (value == "block") return GelfBridge::OverflowPolicy::BLOCK_PRODUCER;
    if (value == "drop") return GelfBridge::OverflowPolicy::DROP_NEW;
    throw ConfigError("Unknown ingest.overflow_policy '" + value + "' (expected 'block' or 'drop')");
}

// ============================================================================
// Sections
// ============================================================================

void loadIngest(const YAML::Node& root, AppConfig::IngestConfig& cfg) {
    YAML::Node n = child(root, "ingest");
    if (!n) throw ConfigError("Missing required config section 'ingest'");

    cfg.host = optional<std::string>(n, "host", "ingest.host", cfg.host);
    if (!child(n, "port")) throw ConfigError("Missing required config key 'ingest.port'");
    cfg.port = boundedUnsigned<uint16_t>(n, "port", "ingest.port", 0, 0, 65535);
    cfg.maxDatagramBytes = boundedUnsigned<size_t>(n, "max_datagram_bytes", "ingest.max_datagram_bytes",
                                                   cfg.maxDatagramBytes, 12, 65535);
    cfg.socketBufferBytes = boundedUnsigned<int>(n, "socket_buffer_bytes", "ingest.socket_buffer_bytes",
                                                 cfg.socketBufferBytes, 0, std::numeric_limits<int>::max());
    cfg.overflowPolicy = parseOverflowPolicy(
        optional<std::string>(n, "overflow_policy", "ingest.overflow_policy", "block"));
    cfg.queueCapacity = boundedUnsigned<size_t>(n, "queue_capacity", "ingest.queue_capacity",
                                                cfg.queueCapacity, 1, 1u << 24);
}

void loadReassembly(const YAML::Node& root, AppConfig::ReassemblyConfig& cfg) {
    YAML::Node n = child(root, "reassembly");
    cfg.staleTimeoutMs = boundedUnsigned<uint32_t>(n, "stale_timeout_ms", "reassembly.stale_timeout_ms",
                                                   cfg.staleTimeoutMs, 1, 3600000);
    cfg.sweepIntervalMs = boundedUnsigned<uint32_t>(n, "sweep_interval_ms", "reassembly.sweep_interval_ms",
                                                    cfg.sweepIntervalMs, 1, 3600000);
    cfg.maxPendingMessages = boundedUnsigned<size_t>(n, "max_pending_messages", "reassembly.max_pending_messages",
                                                     cfg.maxPendingMessages, 1, 1u << 24);
}

void loadFilter(const YAML::Node& root, AppConfig::FilterConfig& cfg) {
    YAML::Node n = child(root, "filter");
    cfg.mode = optional<std::string>(n, "mode", "filter.mode", cfg.mode);
    cfg.field = optional<std::string>(n, "field", "filter.field", "");
    cfg.fields = optional<std::vector<std::string>>(n, "fields", "filter.fields", {});

    // Rejects unknown modes and modes missing their field list
    GelfBridge::FilterStage::fromConfig(cfg);
}

void loadDatabase(const YAML::Node& root, AppConfig::DatabaseConfig& cfg) {
    YAML::Node n = child(root, "database");
    if (!n) throw ConfigError("Missing required config section 'database'");

    cfg.url = required<std::string>(n, "url", "database.url");
    cfg.sql = required<std::string>(n, "sql", "database.sql");
    if (cfg.sql.empty()) throw ConfigError("Config key 'database.sql' must not be empty");

    GelfBridge::backendForUrl(cfg.url);  // throws on unsupported scheme

    cfg.maxConnections = boundedUnsigned<size_t>(n, "max_connections", "database.max_connections",
                                                 cfg.maxConnections, 1, 1024);
    cfg.acquireTimeoutMs = boundedUnsigned<uint32_t>(n, "acquire_timeout_ms", "database.acquire_timeout_ms",
                                                     cfg.acquireTimeoutMs, 0, 3600000);
    cfg.writeTimeoutMs = boundedUnsigned<uint32_t>(n, "write_timeout_ms", "database.write_timeout_ms",
                                                   cfg.writeTimeoutMs, 1, 3600000);
}

void loadWriter(const YAML::Node& root, AppConfig::WriterConfig& cfg) {
    YAML::Node n = child(root, "writer");
    cfg.workers = boundedUnsigned<size_t>(n, "workers", "writer.workers", cfg.workers, 1, 256);
    cfg.queueCapacity = boundedUnsigned<size_t>(n, "queue_capacity", "writer.queue_capacity",
                                                cfg.queueCapacity, 1, 1u << 24);
    cfg.batchSize = boundedUnsigned<size_t>(n, "batch_size", "writer.batch_size", cfg.batchSize, 1, 10000);
    cfg.maxAttempts = boundedUnsigned<uint32_t>(n, "max_attempts", "writer.max_attempts", cfg.maxAttempts, 1, 100);
    cfg.initialBackoffMs = boundedUnsigned<uint32_t>(n, "initial_backoff_ms", "writer.initial_backoff_ms",
                                                     cfg.initialBackoffMs, 0, 600000);
    cfg.maxBackoffMs = boundedUnsigned<uint32_t>(n, "max_backoff_ms", "writer.max_backoff_ms",
                                                 cfg.maxBackoffMs, 0, 600000);
    cfg.drainTimeoutMs = boundedUnsigned<uint32_t>(n, "drain_timeout_ms", "writer.drain_timeout_ms",
                                                   cfg.drainTimeoutMs, 0, 3600000);

    if (cfg.maxBackoffMs < cfg.initialBackoffMs) {
        throw ConfigError("writer.max_backoff_ms must be >= writer.initial_backoff_ms");
    }
}

void loadLogging(const YAML::Node& root, AppConfig::LoggingConfig& cfg) {
    YAML::Node n = child(root, "logging");
    cfg.level = optional<std::string>(n, "level", "logging.level", cfg.level);
    cfg.pattern = optional<std::string>(n, "pattern", "logging.pattern", cfg.pattern);

    if (spdlog::level::from_str(cfg.level) == spdlog::level::off && cfg.level != "off") {
        throw ConfigError("Unknown logging.level '" + cfg.level + "'");
    }
}

void loadMetrics(const YAML::Node& root, AppConfig::MetricsConfig& cfg) {
    YAML::Node n = child(root, "metrics");
    cfg.reportIntervalMs = boundedUnsigned<uint32_t>(n, "report_interval_ms", "metrics.report_interval_ms",
                                                     cfg.reportIntervalMs, 0, 86400000);
}

AppConfig::AppConfiguration loadFromNode(const YAML::Node& root) {
    if (!root || !root.IsMap()) {
        throw ConfigError("Configuration root must be a mapping");
    }

    AppConfig::AppConfiguration config;
    config.app_name = required<std::string>(root, "app_name", "app_name");
    config.version = required<std::string>(root, "version", "version");

    loadIngest(root, config.ingest);
    loadReassembly(root, config.reassembly);
    loadFilter(root, config.filter);
    loadDatabase(root, config.database);
    loadWriter(root, config.writer);
    loadLogging(root, config.logging);
    loadMetrics(root, config.metrics);
    return config;
}

} // anonymous namespace

AppConfig::AppConfiguration ConfigLoader::loadConfig(const std::string& filepath) {
    if (!std::filesystem::exists(filepath)) {
        throw ConfigError("Config file not found: " + filepath);
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(filepath);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Failed to parse config file " + filepath + ": " + e.what());
    }
    return loadFromNode(root);
}

AppConfig::AppConfiguration ConfigLoader::loadFromString(const std::string& yaml) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml);
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Failed to parse config: ") + e.what());
    }
    return loadFromNode(root);
}
