#include <spdlog/spdlog.h>
#include <csignal>
#include <cstdlib>
#include <atomic>
#include <thread>
#include <chrono>
#include <memory>

#include <healthstream/core/config/loader.hpp>
#include <healthstream/core/metrics/rolling_metric.hpp>
#include <healthstream/core/state/health_state.hpp>

using namespace HealthStream;

// ============================================================================
// Global State
// ============================================================================

static std::atomic<bool> g_running{true};

static void signalHandler(int signum) {
    (void)signum;
    g_running.store(false, std::memory_order_release);
}

// ============================================================================
// Initialization Functions
// ============================================================================

static void setupLogging(const AppConfig::AppConfiguration& config) {
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::from_str(config.logging.level));
    spdlog::info("{} v{} starting...", config.app_name, config.version);
    spdlog::info("Build: {} {}", __DATE__, __TIME__);
}

static void setupSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
}

static AppConfig::AppConfiguration loadConfiguration(int argc, char* argv[]) {
    const char* configPath = (argc > 1) ? argv[1] : "config/config.yaml";
    spdlog::info("Loading configuration from: {}", configPath);
    auto config = ConfigLoader::loadConfig(configPath);
    ConfigLoader::applyEnvironment(config);
    return config;
}

// ============================================================================
// Main Loop
// ============================================================================

static void runLoop(HealthState& state, std::chrono::seconds dumpEvery) {
    constexpr auto TICK = std::chrono::milliseconds(500);
    RollingMetric latency(20);
    auto lastDump = std::chrono::steady_clock::now();

    while (g_running.load(std::memory_order_acquire)) {
        auto tickStart = std::chrono::steady_clock::now();
        std::this_thread::sleep_for(TICK);

        auto elapsed = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - tickStart).count();
        state.incrComponentMetric("daemon", "heartbeat");
        state.addComponentMetric("daemon", "loop_ms", elapsed);
        state.addComponentMetric("daemon", "loop_ms_rolling", latency.add(elapsed));

        if (std::chrono::steady_clock::now() - lastDump >= dumpEvery) {
            spdlog::info("Current window:\n{}", state.dump());
            lastDump = std::chrono::steady_clock::now();
        }
    }
}

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    setupSignalHandlers();

    try {
        auto config = loadConfiguration(argc, argv);
        setupLogging(config);
        spdlog::info("Configuration loaded successfully");

        HealthState state(config);
        spdlog::info("{} running as '{}'. Press Ctrl+C to shutdown.", config.app_name, state.identity());

        runLoop(state, std::chrono::seconds(config.sample_rate_seconds));

        spdlog::info("=== SHUTDOWN SEQUENCE ===");
        state.close();
        spdlog::info("=== SHUTDOWN COMPLETE ===");
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return EXIT_FAILURE;
    }

    spdlog::info("HealthStream terminated gracefully");
    return EXIT_SUCCESS;
}
