//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/TestSupport.hpp
// Purpose: Shared fixtures for engine tests: demo directory, request builders and response readers
//==========================================================================================================
#pragma once

#include <gtest/gtest.h>

#include <chrono>
#include <map>
#include <memory>
#include <string>

#include "oauth2/Config.hpp"
#include "oauth2/Directory.hpp"
#include "oauth2/Encoding.hpp"
#include "oauth2/GrantEngine.hpp"
#include "oauth2/JSON.h"
#include "oauth2/Request.hpp"
#include "oauth2/Response.hpp"
#include "oauth2/store/InMemoryCredentialStore.hpp"

namespace testsupport {

inline constexpr const char* kSecret = "0123456789abcdef0123456789abcdef";
inline constexpr const char* kClientID = "client1";
inline constexpr const char* kClientSecret = "foo";
inline constexpr const char* kPublicClientID = "public1";
inline constexpr const char* kRedirectURI = "http://example.com/callback";
inline constexpr const char* kUsername = "user1";
inline constexpr const char* kPassword = "bar";

//==========================================================================================================
// Engine
// Purpose: Engine wired to an in-memory store and a directory holding one confidential client,
//          one public client and one resource owner.
//==========================================================================================================
struct Engine {
    std::shared_ptr<oauth2::store::InMemoryCredentialStore> store;
    std::shared_ptr<oauth2::InMemoryDirectory> directory;
    std::shared_ptr<oauth2::GrantEngine> engine;
};

inline oauth2::ServerOptions DefaultTestOptions() {
    return oauth2::DefaultOptions(kSecret, oauth2::ScopeSet{"foo", "bar"});
}

inline Engine MakeEngine(const oauth2::ServerOptions& opts = DefaultTestOptions()) {
    Engine e;
    e.store = std::make_shared<oauth2::store::InMemoryCredentialStore>();
    e.directory = std::make_shared<oauth2::InMemoryDirectory>();
    e.directory->AddClient(oauth2::Client{kClientID, std::string(kClientSecret), kRedirectURI});
    e.directory->AddClient(oauth2::Client{kPublicClientID, std::nullopt, kRedirectURI});
    e.directory->AddResourceOwner(oauth2::ResourceOwner{kUsername, kPassword});
    e.engine = std::make_shared<oauth2::GrantEngine>(opts, e.store, e.directory,
                                                     std::make_shared<oauth2::ConstantTimeSecretVerifier>());
    return e;
}

inline std::string BasicHeader(const std::string& user, const std::string& pass) {
    return "Basic " + oauth2::Base64Encode(user + ":" + pass);
}

// POST form request, authenticated as the confidential test client unless basic is empty.
inline oauth2::Request PostForm(const std::map<std::string, std::string>& form,
                                const std::string& basic = BasicHeader(kClientID, kClientSecret)) {
    oauth2::Request req;
    req.method = "POST";
    req.form = form;
    if (!basic.empty()) {
        req.headers["Authorization"] = basic;
    }
    return req;
}

inline oauth2::JSONValue Body(const oauth2::Response& res) {
    return oauth2::ParseJSON(res.body);
}

// String member of a JSON object body, or empty when absent or not a string.
inline std::string Field(const oauth2::Response& res, const std::string& key) {
    oauth2::JSONValue doc = Body(res);
    const oauth2::JSONValue* v = doc.Find(key);
    if (v == nullptr || !std::holds_alternative<std::string>(v->value)) {
        return std::string();
    }
    return std::get<std::string>(v->value);
}

inline bool HasField(const oauth2::Response& res, const std::string& key) {
    oauth2::JSONValue doc = Body(res);
    return doc.Find(key) != nullptr;
}

// Parameters carried by a redirect Location, from the fragment or the query.
inline std::map<std::string, std::string> RedirectParams(const oauth2::Response& res, bool fragment) {
    const std::string location = res.Header("Location");
    if (fragment) {
        auto hash = location.find('#');
        return (hash == std::string::npos) ? std::map<std::string, std::string>{}
                                           : oauth2::ParseQueryString(location.substr(hash + 1));
    }
    std::string base = location.substr(0, location.find('#'));
    auto qm = base.find('?');
    return (qm == std::string::npos) ? std::map<std::string, std::string>{}
                                     : oauth2::ParseQueryString(base.substr(qm + 1));
}

// Issues tokens through the password grant and returns the JSON response.
inline oauth2::Response PasswordGrant(oauth2::GrantEngine& engine, const std::string& scope = "foo") {
    return engine.HandleToken(PostForm({{"grant_type", "password"},
                                        {"username", kUsername},
                                        {"password", kPassword},
                                        {"scope", scope}}));
}

// Runs the code flow's authorization step and returns the issued code.
inline std::string AuthorizeCode(oauth2::GrantEngine& engine, const std::string& scope = "foo") {
    oauth2::Request req;
    req.method = "POST";
    req.form = {{"response_type", "code"},
                {"client_id", kClientID},
                {"redirect_uri", kRedirectURI},
                {"scope", scope},
                {"state", "xyz"},
                {"username", kUsername},
                {"password", kPassword}};
    oauth2::Response res = engine.HandleAuthorization(req);
    return RedirectParams(res, false)["code"];
}

inline oauth2::Response RedeemCode(oauth2::GrantEngine& engine, const std::string& code,
                                   const std::string& redirectURI = kRedirectURI) {
    return engine.HandleToken(PostForm({{"grant_type", "authorization_code"},
                                        {"code", code},
                                        {"redirect_uri", redirectURI}}));
}

// Signature (store key) of a token string issued by the test engine.
inline std::string SignatureOf(const oauth2::GrantEngine& engine, const std::string& token) {
    auto parsed = engine.Codec().Parse(token);
    return parsed.has_value() ? parsed->SignatureString() : std::string();
}

} // namespace testsupport
