#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vaultstream/core/config/loader.hpp>
#include <vaultstream/core/connector/connection_manager.hpp>
#include <vaultstream/core/events/json_lines_sink.hpp>
#include <vaultstream/core/metrics/reporter.hpp>

#include <iostream>
#include <csignal>
#include <cstdlib>
#include <atomic>
#include <thread>
#include <chrono>

// Global flag for graceful shutdown
static std::atomic<bool> g_running{true};
static std::atomic<int> g_signal{0};

void signal_handler(int signum) {
    g_signal.store(signum, std::memory_order_relaxed);
    g_running.store(false, std::memory_order_release);
}

int main(int argc, char* argv[]) {
    // stdout carries the event stream, logs go to stderr
    auto logger = spdlog::stderr_color_mt("vaultstream");
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::info("VaultStream starting up...");
    spdlog::info("Build date: {} {}", __DATE__, __TIME__);

    const std::string configPath = argc > 1 ? argv[1] : "config/config.yaml";
    spdlog::info("Config file: {}", configPath);

    // Load configuration
    AppConfig::AppConfiguration config;
    try {
        config = ConfigLoader::loadConfig(configPath);
    }
    catch (const std::exception& e) {
        spdlog::error("Failed to load configuration: {}", e.what());
        return EXIT_FAILURE;
    }
    spdlog::set_level(spdlog::level::from_str(config.logging.level));
    spdlog::set_pattern(config.logging.pattern);
    spdlog::info("{} version {} configured for {}", config.app_name, config.version, config.connector.endpoint);

    // Setup signal handlers for graceful shutdown
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    VaultStream::JsonLinesSink sink(std::cout);
    VaultStream::ConnectionManager manager(sink);

    VaultStream::RunHandle run;
    std::unique_ptr<MetricsReporter> reporter;
    int exitCode = EXIT_SUCCESS;

    try {
        spdlog::info("Starting connector...");
        run = manager.start(config.connector);

        reporter = std::make_unique<MetricsReporter>(run->metrics(), config.metrics.report_interval);
        reporter->start();

        spdlog::info("Initialization complete. Streaming events to stdout");
        spdlog::info("Press Ctrl+C to shutdown");

        // Main loop - keep application running
        while (g_running.load(std::memory_order_acquire)) {
            if (auto fatal = run->fatalError()) {
                spdlog::error("Fatal connector error: {}", *fatal);
                exitCode = EXIT_FAILURE;
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(500));
        }
        if (int signum = g_signal.load(std::memory_order_relaxed)) {
            spdlog::info("Signal {} received, shutting down...", signum);
        }

    } catch (const std::exception& e) {
        spdlog::error("Application error: {}", e.what());
        exitCode = EXIT_FAILURE;
    }

    spdlog::info("Shutting down services...");

    // Graceful shutdown in reverse order
    if (reporter) {
        reporter->stop();
        reporter->reportOnce();
        spdlog::info("Metrics reporter stopped");
    }

    bool abandoned = false;
    if (run) {
        auto report = manager.stop(run);
        spdlog::info("Connector stopped ({} session(s) stopped, {} abandoned, {} event(s) written)",
                     report.stopped, report.abandoned, sink.written());
        if (report.abandoned > 0 || report.drain_abandoned) {
            spdlog::warn("{} session thread(s) and {} dispatcher thread(s) still running at exit",
                         report.abandoned, report.drain_abandoned ? 1 : 0);
            abandoned = true;
        }
    }

    if (abandoned) {
        // Detached threads may still log or write: skip logger teardown and static destructors
        spdlog::default_logger()->flush();
        std::quick_exit(exitCode);
    }

    spdlog::info("VaultStream shutdown complete");
    spdlog::shutdown();
    return exitCode;
}
