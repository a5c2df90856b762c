#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <pthread.h>

#include "api/HealthServer.hpp"
#include "common/Config.hpp"
#include "common/Logger.hpp"
#include "core/ChangeDetector.hpp"
#include "core/JsonLinesEventSink.hpp"
#include "core/WatchService.hpp"
#include "kube/KubeApiClient.hpp"

#include <openssl/crypto.h>

// Startup sequence:
//   config → logger → API client → change stream → health → watch → wait for signal

int main() {
  try {
    // Block SIGINT/SIGTERM before any thread starts so only sigwait() sees them
    sigset_t sigShutdown;
    sigemptyset(&sigShutdown);
    sigaddset(&sigShutdown, SIGINT);
    sigaddset(&sigShutdown, SIGTERM);
    if (pthread_sigmask(SIG_BLOCK, &sigShutdown, nullptr) != 0) {
      throw std::runtime_error("Failed to block shutdown signals");
    }

    // ── Step 1: Load and validate configuration ──────────────────────────
    auto cfgApp = kes::common::Config::load();

    kes::common::Logger::init(cfgApp.sLogLevel);
    auto spLog = kes::common::Logger::get();
    spLog->info("Step 1: Configuration loaded successfully");

    // ── Step 2: Construct Kubernetes API client ──────────────────────────
    kes::kube::KubeClientOptions kcoOptions;
    kcoOptions.sApiUrl = cfgApp.sKubeApiUrl;
    kcoOptions.oBearerToken = cfgApp.oKubeToken;
    kcoOptions.oCaFile = cfgApp.oKubeCaFile;
    kcoOptions.bInsecureSkipTlsVerify = cfgApp.bKubeInsecureSkipTlsVerify;
    kcoOptions.iTimeoutSeconds = cfgApp.iHttpTimeoutSeconds;
    auto upClient = std::make_unique<kes::kube::KubeApiClient>(std::move(kcoOptions));
    const bool bHasToken = cfgApp.oKubeToken.has_value();

    // Zero the token copies left in Config after handoff
    if (cfgApp.oKubeToken) {
      OPENSSL_cleanse(cfgApp.oKubeToken->data(), cfgApp.oKubeToken->size());
      cfgApp.oKubeToken.reset();
    }

    spLog->info("Step 2: Kubernetes API client constructed (url={}, auth={})",
                cfgApp.sKubeApiUrl, bHasToken ? "bearer" : "none");
    if (cfgApp.bKubeInsecureSkipTlsVerify) {
      spLog->warn("TLS server certificate verification is disabled");
    }

    // ── Step 3: Open change stream ───────────────────────────────────────
    kes::common::ResourceDescriptor rdDescriptor{
        cfgApp.sCrdGroup, cfgApp.sCrdVersion, cfgApp.sCrdPlural, cfgApp.oWatchNamespace};
    auto upStream = kes::core::ChangeDetector::openChangeStream(
        *upClient, rdDescriptor, std::chrono::milliseconds(cfgApp.iPollerIntervalMs), spLog);
    spLog->info("Step 3: Change stream opened for {}.{}/{} (interval={}ms)",
                cfgApp.sCrdPlural, cfgApp.sCrdGroup, cfgApp.sCrdVersion,
                cfgApp.iPollerIntervalMs);

    // ── Step 4: Health endpoint ──────────────────────────────────────────
    std::unique_ptr<kes::api::HealthServer> upHealth;
    if (cfgApp.iHealthPort > 0) {
      upHealth = std::make_unique<kes::api::HealthServer>(*upStream);
      upHealth->start(cfgApp.iHealthPort);
      spLog->info("Step 4: Health endpoint started");
    } else {
      spLog->info("Step 4: Health endpoint disabled (KES_HEALTH_PORT=0)");
    }

    // ── Step 5: Watch service ────────────────────────────────────────────
    kes::core::JsonLinesEventSink jlesSink(std::cout);
    kes::core::WatchService wsService(*upStream, jlesSink);
    wsService.start();
    spLog->info("Step 5: Watch service started, events are written to stdout");

    // ── Wait for shutdown ────────────────────────────────────────────────
    int iSignal = 0;
    if (sigwait(&sigShutdown, &iSignal) != 0) {
      throw std::runtime_error("sigwait failed");
    }
    spLog->info("Received signal {}, shutting down", iSignal);

    wsService.stop();
    spLog->info("Watch service stopped");
    if (upHealth) {
      upHealth->stop();
      spLog->info("Health endpoint stopped");
    }

    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    std::cerr << "[fatal] startup failed: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
}
