#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "common/Config.hpp"
#include "common/Logger.hpp"
#include "core/ExpirySweeper.hpp"
#include "dal/ConnectionPool.hpp"
#include "dal/SessionRepository.hpp"

#include <pthread.h>

// Session store maintenance daemon: keeps the session tables free of expired
// rows until SIGINT or SIGTERM.

int main() {
  try {
    // Block termination signals before any thread starts so only sigwait sees them
    sigset_t sigs;
    sigemptyset(&sigs);
    sigaddset(&sigs, SIGINT);
    sigaddset(&sigs, SIGTERM);
    if (pthread_sigmask(SIG_BLOCK, &sigs, nullptr) != 0) {
      throw std::runtime_error("Failed to block termination signals");
    }

    // ── Step 1: Load and validate configuration ──────────────────────────
    auto cfgApp = sessiondb::common::Config::load();

    sessiondb::common::Logger::init(cfgApp.sLogLevel);
    auto spLog = sessiondb::common::Logger::get();
    spLog->info("Step 1: Configuration loaded (table={})", cfgApp.sTableName);

    // ── Step 2: Initialize ConnectionPool ────────────────────────────────
    auto cpPool = std::make_unique<sessiondb::dal::ConnectionPool>(
        cfgApp.sDbUrl, cfgApp.iDbPoolSize,
        std::chrono::seconds(cfgApp.iDbCheckoutTimeoutSeconds));
    spLog->info("Step 2: ConnectionPool initialized (size={})", cfgApp.iDbPoolSize);

    // ── Step 3: Configure SessionRepository ──────────────────────────────
    auto srRepo = std::make_unique<sessiondb::dal::SessionRepository>(*cpPool);
    srRepo->setTableName(cfgApp.sTableName);
    if (cfgApp.oDefaultMaxInactiveIntervalSeconds.has_value()) {
      srRepo->setDefaultMaxInactiveInterval(
          std::chrono::seconds(*cfgApp.oDefaultMaxInactiveIntervalSeconds));
    }
    spLog->info("Step 3: SessionRepository ready");

    // ── Step 4: Start ExpirySweeper ──────────────────────────────────────
    auto esSweeper = std::make_unique<sessiondb::core::ExpirySweeper>(
        [&srRepo]() { return srRepo->cleanUpExpiredSessions(); },
        std::chrono::seconds(cfgApp.iCleanupIntervalSeconds));
    esSweeper->start();
    spLog->info("Step 4: ExpirySweeper started (every {}s)", cfgApp.iCleanupIntervalSeconds);

    int iSignal = 0;
    if (sigwait(&sigs, &iSignal) != 0) {
      throw std::runtime_error("sigwait failed");
    }
    spLog->info("Received signal {}, shutting down", iSignal);

    // Graceful shutdown
    esSweeper->stop();
    spLog->info("ExpirySweeper stopped ({} sessions removed in total)",
                esSweeper->totalDeleted());

    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    std::cerr << "[fatal] sessiondb failed: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
}
