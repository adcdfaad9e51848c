// Runtime
#include "runtime/Context.hpp"
#include "runtime/Options.hpp"

// Components
#include "feed/FtpReader.hpp"
#include "fetch/HttpFetcher.hpp"
#include "sync/Reconciler.hpp"
#include "report/ChangeReporter.hpp"
#include "services/Monitor.hpp"

// Misc
#include "config/Config.hpp"
#include "logging/LogRegistry.hpp"

// Libraries
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <thread>

using namespace cw;

namespace {
std::atomic<bool> shouldExit = false;

void signalHandler(const int) {
    shouldExit = true;
}
}

int main(int argc, char** argv) {
    runtime::Options opts;
    try {
        opts = runtime::parseArgs({argv + 1, argv + argc});
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n\n" << runtime::usage(argv[0]);
        return 2;
    }

    if (opts.help) {
        std::cout << runtime::usage(argv[0]);
        return EXIT_SUCCESS;
    }

    std::shared_ptr<runtime::Context> ctx;
    try {
        auto cfg = config::loadConfig(opts.config_path);
        auto logs = std::make_shared<logging::LogRegistry>(cfg.logging);
        ctx = std::make_shared<runtime::Context>(std::move(cfg), std::move(logs));
    } catch (const std::exception& e) {
        std::cerr << "[-] Failed to load configuration from " << opts.config_path.string() << ": " << e.what() << "\n";
        return EXIT_FAILURE;
    }

    const auto log = ctx->logs->cuewatch();

    try {
        log->info("[*] Initializing Cuewatch ({} feeds, remote {})...", ctx->config.monitors.size(), ctx->config.remote.host);

        auto reader = std::make_shared<feed::FtpReader>(ctx);
        auto fetcher = std::make_shared<fetch::HttpFetcher>(ctx);
        auto reconciler = std::make_shared<sync::Reconciler>(ctx, fetcher);
        reconciler->load();
        auto reporter = std::make_shared<report::ChangeReporter>(ctx);

        services::Monitor monitor(ctx, reader, reconciler, reporter);

        if (!reader->connect()) log->warn("[!] Initial connection to {} failed, retrying every round", ctx->config.remote.host);

        if (opts.once) {
            const auto r = monitor.runOnce();
            reader->disconnect();
            log->info("[✓] Single round done: {} polled, {} changes", r.polled, r.changes);
            ctx->logs->flush();
            return EXIT_SUCCESS;
        }

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        monitor.start();
        log->info("[✓] Cuewatch started.");

        while (!shouldExit && monitor.isRunning()) std::this_thread::sleep_for(std::chrono::milliseconds(200));

        if (shouldExit) log->info("[!] Signal received. Shutting down gracefully...");
        monitor.stop();

        log->info("[✓] Cuewatch shut down cleanly.");
        ctx->logs->flush();
        return EXIT_SUCCESS;
    } catch (const std::exception& e) {
        log->error("[-] Failed to initialize Cuewatch: {}", e.what());
        ctx->logs->flush();
        return EXIT_FAILURE;
    }
}
