//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: OAuth2 authorization server example
//==========================================================================================================

#include "logging/Logger.h"
#include "env/EnvVars.h"
#include "oauth2/Config.hpp"
#include "oauth2/Directory.hpp"
#include "oauth2/GrantEngine.hpp"
#include "oauth2/HTTPServer.hpp"
#include "oauth2/JSON.h"
#include "oauth2/auth/BearerValidator.hpp"
#include "oauth2/version.h"
#include "oauth2/store/InMemoryCredentialStore.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstddef>
#include <optional>
#include <thread>

using namespace oauth2;

namespace {
    std::atomic<bool> gStopRequested{false};

    void onSignal(int) {
        gStopRequested.store(true);
    }
}

//==========================================================================================================
// Parses simple key=value style command-line options.
// Args:
//   argc: Argument count
//   argv: Argument values
//   key: Option name including leading dashes (e.g., "--listen")
// Returns:
//   Optional value string when present; empty optional otherwise
//==========================================================================================================
static std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (std::size_t i = 1; i < static_cast<std::size_t>(argc); ++i) {
        const char* arg = argv[i];
        if (arg == nullptr) {
            continue;
        }
        std::string a = arg;
        std::size_t eq = a.find('=');
        if (eq != std::string::npos && a.substr(0, eq) == key) {
            return a.substr(eq + 1);
        }
    }
    return std::nullopt;
}

int main(int argc, char** argv) {
    FUNC_SCOPE();
    Logger::setLogLevelFromString(GetEnvOrDefault("OAUTH2_LOG_LEVEL", "INFO"));

    ServerOptions options = LoadOptionsFromEnv();
    if (options.secret.empty()) {
        // Demo only: a real deployment must configure OAUTH2_SECRET
        LOG_WARN("OAUTH2_SECRET not set; using the demo signing secret");
        options.secret = "demo-signing-secret-change-me";
    }
    if (options.allowedScope.Empty()) {
        options.allowedScope = ScopeSet::Parse("foo bar");
    }

    auto directory = std::make_shared<InMemoryDirectory>();
    directory->AddClient(Client{
        GetEnvOrDefault("OAUTH2_DEMO_CLIENT_ID", "client1"),
        GetEnvOrDefault("OAUTH2_DEMO_CLIENT_SECRET", "foo"),
        GetEnvOrDefault("OAUTH2_DEMO_REDIRECT_URI", "http://localhost/callback")});
    directory->AddResourceOwner(ResourceOwner{
        GetEnvOrDefault("OAUTH2_DEMO_USERNAME", "user1"),
        GetEnvOrDefault("OAUTH2_DEMO_PASSWORD", "bar")});

    std::shared_ptr<GrantEngine> engine;
    try {
        engine = std::make_shared<GrantEngine>(options,
                                               std::make_shared<store::InMemoryCredentialStore>(),
                                               directory,
                                               std::make_shared<ConstantTimeSecretVerifier>());
    } catch (const std::exception& e) {
        LOG_ERROR("Invalid server configuration: {}", e.what());
        return 1;
    }

    std::string listen = getArgValue(argc, argv, "--listen").value_or("http://127.0.0.1:9443/oauth2");
    HTTPServer::Options httpOpts = ParseListenURI(listen);

    std::unique_ptr<HTTPServer> server;
    try {
        server = std::make_unique<HTTPServer>(httpOpts, engine);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to create HTTP server: {}", e.what());
        return 1;
    }
    server->SetErrorHandler([](const std::string& err) {
        LOG_ERROR("Server error: {}", err);
    });

    // Demo resource guarded by the "foo" scope
    server->AddProtectedResource("/api/protected", ScopeSet{"foo"}, [](const Request& req) {
        (void)req;
        Response res;
        JSONValue::Object body;
        const store::Credential* cred = auth::CurrentCredential();
        body["client_id"] = std::make_shared<JSONValue>(cred != nullptr ? cred->clientID : std::string());
        body["username"] = std::make_shared<JSONValue>(cred != nullptr ? cred->resourceOwnerID : std::string());
        WriteJSON(res, JSONValue{body}, 200);
        return res;
    });

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    server->Start().get();
    LOG_INFO("{} ready at {} (client={}, owner={})", getServerBanner(), listen,
             GetEnvOrDefault("OAUTH2_DEMO_CLIENT_ID", "client1"), GetEnvOrDefault("OAUTH2_DEMO_USERNAME", "user1"));

    // Reclaim expired credentials once a minute until asked to stop
    auto nextSweep = std::chrono::steady_clock::now() + std::chrono::minutes(1);
    while (!gStopRequested.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        if (std::chrono::steady_clock::now() >= nextSweep) {
            std::size_t removed = engine->SweepExpired();
            if (removed > 0) {
                LOG_DEBUG("Swept {} expired credentials", removed);
            }
            nextSweep = std::chrono::steady_clock::now() + std::chrono::minutes(1);
        }
    }

    LOG_INFO("Shutting down");
    server->Stop().get();
    return 0;
}
