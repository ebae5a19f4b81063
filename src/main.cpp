#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "api/ApiServer.hpp"
#include "api/AuthMiddleware.hpp"
#include "api/routes/AuthRoutes.hpp"
#include "api/routes/HealthRoutes.hpp"
#include "api/routes/UserRoutes.hpp"
#include "common/Config.hpp"
#include "common/Logger.hpp"
#include "core/ISessionStore.hpp"
#include "core/InMemorySessionStore.hpp"
#include "core/SessionSweeper.hpp"
#include "dal/ConnectionPool.hpp"
#include "dal/SessionRepository.hpp"
#include "dal/UserRepository.hpp"
#include "security/Argon2PasswordHasher.hpp"
#include "security/HmacJwtSigner.hpp"
#include "security/IJwtSigner.hpp"
#include "security/SessionService.hpp"
#include "security/TokenCodec.hpp"

#include <openssl/crypto.h>

int main() {
  try {
    // ── Step 1: Load and validate configuration ──────────────────────────
    auto cfgApp = sso::common::Config::load();

    sso::common::Logger::init(cfgApp.sLogLevel);
    auto spLog = sso::common::Logger::get();
    spLog->info("Step 1: Configuration loaded");

    // ── Step 2: Construct IJwtSigner and TokenCodec ──────────────────────
    std::unique_ptr<sso::security::IJwtSigner> upSigner;
    if (cfgApp.sJwtAlgorithm == "HS256") {
      upSigner = std::make_unique<sso::security::HmacJwtSigner>(cfgApp.sJwtSecret);
    } else {
      throw std::runtime_error("Unsupported JWT algorithm: " + cfgApp.sJwtAlgorithm +
                               " (only HS256 is implemented)");
    }

    // Zero JWT secret from Config after handoff
    OPENSSL_cleanse(cfgApp.sJwtSecret.data(), cfgApp.sJwtSecret.size());
    cfgApp.sJwtSecret.clear();

    auto tcCodec = std::make_unique<sso::security::TokenCodec>(*upSigner);
    spLog->info("Step 2: Token codec ready (algorithm={}, ttl={}s)", cfgApp.sJwtAlgorithm,
                cfgApp.iTokenTtlSeconds);

    // ── Step 3: Initialize ConnectionPool and UserRepository ─────────────
    auto cpPool = std::make_unique<sso::dal::ConnectionPool>(cfgApp.sDbUrl, cfgApp.iDbPoolSize);
    auto urRepo = std::make_unique<sso::dal::UserRepository>(*cpPool);
    spLog->info("Step 3: ConnectionPool initialized (size={})", cfgApp.iDbPoolSize);

    // ── Step 4: Session store backend ────────────────────────────────────
    std::unique_ptr<sso::core::ISessionStore> upStore;
    if (cfgApp.sSessionBackend == "postgres") {
      upStore = std::make_unique<sso::dal::SessionRepository>(*cpPool);
    } else {
      upStore = std::make_unique<sso::core::InMemorySessionStore>();
      spLog->warn("Step 4: In-memory session store: all sessions are lost on restart");
    }
    spLog->info("Step 4: Session store ready (backend={})", cfgApp.sSessionBackend);

    // ── Step 5: Start SessionSweeper ─────────────────────────────────────
    auto swSweeper = std::make_unique<sso::core::SessionSweeper>(
        *upStore, std::chrono::seconds(cfgApp.iSessionSweepIntervalSeconds),
        std::chrono::seconds(cfgApp.iTokenTtlSeconds),
        std::chrono::seconds(cfgApp.iRevokedRetentionSeconds));
    swSweeper->start();
    spLog->info("Step 5: SessionSweeper started (every {}s)",
                cfgApp.iSessionSweepIntervalSeconds);

    // ── Step 6: Services and middleware ──────────────────────────────────
    auto phHasher = std::make_unique<sso::security::Argon2PasswordHasher>();
    if (!sso::security::Argon2PasswordHasher::isAvailable()) {
      spLog->warn("Step 6: OpenSSL has no ARGON2ID KDF; register and login will fail");
    }
    auto ssService = std::make_unique<sso::security::SessionService>(
        *urRepo, *phHasher, *upStore, *tcCodec, std::chrono::seconds(cfgApp.iTokenTtlSeconds));
    auto amMiddleware = std::make_unique<sso::api::AuthMiddleware>(*tcCodec, *upStore);
    spLog->info("Step 6: SessionService and AuthMiddleware ready");

    // ── Step 7: Routes and HTTP server ───────────────────────────────────
    auto arRoutes = std::make_unique<sso::api::routes::AuthRoutes>(*ssService, *amMiddleware);
    auto urRoutes = std::make_unique<sso::api::routes::UserRoutes>(*ssService, *amMiddleware);
    auto hrRoutes = std::make_unique<sso::api::routes::HealthRoutes>();

    sso::api::ApiServer apiServer(*arRoutes, *urRoutes, *hrRoutes);
    apiServer.registerRoutes();
    spLog->info("Step 7: device-sso ready");

    apiServer.start(cfgApp.iHttpPort, cfgApp.iHttpThreads);

    // Graceful shutdown
    swSweeper->stop();
    spLog->info("SessionSweeper stopped");
    sso::common::Logger::shutdown();

    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    std::cerr << "[fatal] startup failed: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
}
