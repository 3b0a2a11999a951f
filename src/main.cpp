#include <spdlog/spdlog.h>
#include <csignal>
#include <cstdlib>
#include <atomic>
#include <thread>
#include <chrono>
#include <memory>

#include <gelfbridge/core/config/loader.hpp>
#include <gelfbridge/core/filter/filter_stage.hpp>
#include <gelfbridge/core/gelf/decoder.hpp>
#include <gelfbridge/core/gelf/reassembler.hpp>
#include <gelfbridge/core/gelf/sweeper.hpp>
#include <gelfbridge/core/ingest/udp_server.hpp>
#include <gelfbridge/core/metrics/pipeline_metrics.hpp>
#include <gelfbridge/core/metrics/reporter.hpp>
#include <gelfbridge/core/pipeline/pipeline.hpp>
#include <gelfbridge/core/storage/connection_factory.hpp>
#include <gelfbridge/core/storage/connection_pool.hpp>
#include <gelfbridge/core/writer/write_coordinator.hpp>

using namespace GelfBridge;

// ============================================================================
// Global State
// ============================================================================

static std::atomic<bool> g_running{true};

static void signalHandler(int) {
    g_running.store(false, std::memory_order_release);
}

// ============================================================================
// Initialization Functions
// ============================================================================

static void setupLogging() {
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::info("GelfBridge v1.0.0 starting...");
    spdlog::info("Build: {} {}", __DATE__, __TIME__);
}

static void applyLoggingConfig(const AppConfig::LoggingConfig& logging) {
    spdlog::set_pattern(logging.pattern);
    spdlog::set_level(spdlog::level::from_str(logging.level));
}

static void setupSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
}

static AppConfig::AppConfiguration loadConfiguration(int argc, char* argv[]) {
    const char* configPath = (argc > 1) ? argv[1] : "config/config.yaml";
    spdlog::info("Loading configuration from: {}", configPath);
    return ConfigLoader::loadConfig(configPath);
}

// ============================================================================
// Component Lifecycle
// ============================================================================

struct Components {
    // Order matters for destruction: later members depend on earlier ones
    std::unique_ptr<PipelineMetrics> metrics;
    std::unique_ptr<ConnectionPool> pool;
    std::unique_ptr<WriteCoordinator> writer;
    std::unique_ptr<FilterStage> filter;
    std::unique_ptr<MessageDecoder> decoder;
    std::unique_ptr<ChunkReassembler> reassembler;
    std::unique_ptr<BoundedQueue<RawDatagram>> intake;
    std::unique_ptr<Pipeline> pipeline;
    std::unique_ptr<UdpReceiver> receiver;

    // Background timers
    std::unique_ptr<ReassemblySweeper> sweeper;
    std::unique_ptr<MetricsReporter> reporter;
};

static Components initializeComponents(const AppConfig::AppConfiguration& config) {
    Components c;
    c.metrics = std::make_unique<PipelineMetrics>();

    // Storage & writer; the statement is checked before anything listens
    c.pool = std::make_unique<ConnectionPool>(makeConnectionFactory(config.database),
                                              config.database.maxConnections);
    c.filter = std::make_unique<FilterStage>(FilterStage::fromConfig(config.filter));
    c.writer = std::make_unique<WriteCoordinator>(config.writer, config.database, *c.pool, *c.metrics);
    c.writer->validateStatement(c.filter->arity());

    // Processing
    c.decoder = std::make_unique<MessageDecoder>();
    c.reassembler = std::make_unique<ChunkReassembler>(config.reassembly, *c.metrics);
    c.intake = std::make_unique<BoundedQueue<RawDatagram>>(config.ingest.queueCapacity,
                                                           config.ingest.overflowPolicy);
    c.pipeline = std::make_unique<Pipeline>(*c.intake, *c.reassembler, *c.decoder, *c.filter,
                                            *c.writer, *c.metrics);

    // Ingest; bind failure aborts startup here
    c.receiver = std::make_unique<UdpReceiver>(config.ingest, *c.intake, *c.metrics);

    c.sweeper = std::make_unique<ReassemblySweeper>(
        *c.reassembler, std::chrono::milliseconds(config.reassembly.sweepIntervalMs));
    c.reporter = std::make_unique<MetricsReporter>(
        *c.metrics, std::chrono::milliseconds(config.metrics.reportIntervalMs));

    return c;
}

static void startComponents(Components& c) {
    spdlog::info("Starting components...");

    c.writer->start();
    c.pipeline->start();
    c.sweeper->start();
    c.reporter->start();
    c.receiver->start();

    spdlog::info("All components started successfully");
}

static void stopComponents(Components& c) {
    spdlog::info("=== SHUTDOWN SEQUENCE ===");

    // Upstream first so every stage drains into one that is still running
    if (c.receiver) c.receiver->stop();
    if (c.pipeline) c.pipeline->stop();
    if (c.sweeper) c.sweeper->stop();
    if (c.writer) c.writer->stop();
    if (c.pool) c.pool->shutdown();
    if (c.reporter) c.reporter->stop();

    spdlog::info("=== SHUTDOWN COMPLETE ===");
}

int main(int argc, char* argv[]) {
    setupLogging();
    setupSignalHandlers();

    try {
        // Load configuration
        auto config = loadConfiguration(argc, argv);
        applyLoggingConfig(config.logging);
        spdlog::info("Configuration loaded successfully ({} {})", config.app_name, config.version);

        // Initialize all components
        auto components = initializeComponents(config);

        // Start all components
        startComponents(components);

        spdlog::info("GelfBridge listening on udp://{}:{}. Press Ctrl+C to shutdown.",
                     config.ingest.host, components.receiver->boundPort());

        // Main loop
        while (g_running.load(std::memory_order_acquire) && !components.receiver->failed()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(500));
        }

        const bool ingestFailed = components.receiver->failed();
        if (ingestFailed) {
            spdlog::error("UDP receiver failed, shutting down");
        } else {
            spdlog::info("Shutdown signal received");
        }

        // Graceful shutdown
        stopComponents(components);

        if (ingestFailed) {
            spdlog::error("GelfBridge stopped after a transport failure");
            return EXIT_FAILURE;
        }

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return EXIT_FAILURE;
    }

    spdlog::info("GelfBridge terminated gracefully");
    return EXIT_SUCCESS;
}
