//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/oauth2/Response.cpp
// Purpose: Response writers for JSON, redirect and error delivery
//==========================================================================================================

#include "oauth2/Response.hpp"

#include <cctype>
#include <memory>
#include <stdexcept>

#include "logging/Logger.h"
#include "oauth2/Encoding.hpp"
#include "oauth2/errors/Errors.h"

namespace oauth2 {

namespace {
    static std::shared_ptr<JSONValue> str(const std::string& s) {
        return std::make_shared<JSONValue>(s);
    }

    static JSONValue mapToJSON(const std::map<std::string, std::string>& m) {
        JSONValue::Object obj;
        for (const auto& [key, val] : m) {
            obj[key] = str(val);
        }
        return JSONValue(std::move(obj));
    }

    static void mergeHeaders(Response& res, const std::map<std::string, std::string>& extra) {
        for (const auto& [key, val] : extra) {
            res.headers[key] = val;
        }
    }
}

std::string Response::Header(const std::string& name) const {
    for (const auto& [key, val] : headers) {
        if (key.size() != name.size()) {
            continue;
        }
        bool same = true;
        for (std::size_t i = 0; i < key.size() && same; ++i) {
            same = std::tolower(static_cast<unsigned char>(key[i])) == std::tolower(static_cast<unsigned char>(name[i]));
        }
        if (same) {
            return val;
        }
    }
    return std::string();
}

void WriteJSON(Response& res, const JSONValue& doc, int status) {
    res.status = status;
    res.headers["Content-Type"] = "application/json;charset=UTF-8";
    res.headers["Cache-Control"] = "no-store";
    res.headers["Pragma"] = "no-cache";
    res.body = SerializeJSON(doc);
}

void WriteRedirect(Response& res, const std::string& uri, const std::map<std::string, std::string>& params,
                   bool useFragment) {
    if (uri.empty()) {
        throw std::invalid_argument("empty redirect uri");
    }

    std::string base = uri;
    std::string fragment;
    auto hash = base.find('#');
    if (hash != std::string::npos) {
        fragment = base.substr(hash + 1);
        base.erase(hash);
    }

    std::string location;
    if (useFragment) {
        location = base + "#" + EncodeQueryString(params);
    } else {
        std::string path = base;
        std::map<std::string, std::string> query;
        auto qm = base.find('?');
        if (qm != std::string::npos) {
            path = base.substr(0, qm);
            query = ParseQueryString(base.substr(qm + 1));
        }
        for (const auto& [key, val] : params) {
            query[key] = val;
        }
        location = path;
        if (!query.empty()) {
            location += "?" + EncodeQueryString(query);
        }
        if (!fragment.empty()) {
            location += "#" + fragment;
        }
    }

    res.status = 302;
    res.headers["Location"] = location;
    res.body.clear();
}

void WriteError(Response& res, const std::exception& err) {
    const auto* oe = dynamic_cast<const errors::OAuthError*>(&err);
    if (oe == nullptr) {
        LOG_ERROR("Unclassified failure rendered as server_error: {}", err.what());
        errors::OAuthError se = errors::ServerError("");
        WriteJSON(res, mapToJSON(se.Map()), se.Status());
        return;
    }

    if (oe->IsRedirect()) {
        WriteRedirect(res, oe->redirectURI, oe->Map(), oe->useFragment);
        return;
    }

    WriteJSON(res, mapToJSON(oe->Map()), oe->Status());
    mergeHeaders(res, oe->headers);
}

void RedirectError(Response& res, const std::string& uri, const std::string& state, bool useFragment,
                   const std::exception& err) {
    const auto* oe = dynamic_cast<const errors::OAuthError*>(&err);
    errors::OAuthError e = (oe != nullptr) ? *oe : errors::ServerError("");
    if (oe == nullptr) {
        LOG_ERROR("Unclassified failure redirected as server_error: {}", err.what());
    }
    e.SetRedirect(uri, state, useFragment);
    WriteRedirect(res, e.redirectURI, e.Map(), e.useFragment);
}

std::map<std::string, std::string> TokenResponse::Map() const {
    std::map<std::string, std::string> m;
    m["token_type"] = tokenType;
    m["access_token"] = accessToken;
    m["expires_in"] = std::to_string(expiresIn);
    if (!refreshToken.empty()) {
        m["refresh_token"] = refreshToken;
    }
    if (!scope.Empty()) {
        m["scope"] = scope.String();
    }
    if (!state.empty()) {
        m["state"] = state;
    }
    return m;
}

JSONValue TokenResponse::ToJSON() const {
    JSONValue::Object obj;
    obj["token_type"] = str(tokenType);
    obj["access_token"] = str(accessToken);
    obj["expires_in"] = std::make_shared<JSONValue>(static_cast<int64_t>(expiresIn));
    if (!refreshToken.empty()) {
        obj["refresh_token"] = str(refreshToken);
    }
    if (!scope.Empty()) {
        obj["scope"] = str(scope.String());
    }
    if (!state.empty()) {
        obj["state"] = str(state);
    }
    return JSONValue(std::move(obj));
}

void WriteTokenResponse(Response& res, const TokenResponse& tr) {
    if (!tr.redirectURI.empty()) {
        WriteRedirect(res, tr.redirectURI, tr.Map(), tr.useFragment);
        return;
    }
    WriteJSON(res, tr.ToJSON(), 200);
}

std::map<std::string, std::string> CodeResponse::Map() const {
    std::map<std::string, std::string> m;
    m["code"] = code;
    if (!state.empty()) {
        m["state"] = state;
    }
    return m;
}

void WriteCodeResponse(Response& res, const CodeResponse& cr) {
    WriteRedirect(res, cr.redirectURI, cr.Map(), false);
}

JSONValue IntrospectionResponse::ToJSON() const {
    JSONValue::Object obj;
    obj["active"] = std::make_shared<JSONValue>(active);
    if (!active) {
        return JSONValue(std::move(obj));
    }
    if (!scope.empty()) obj["scope"] = str(scope);
    if (!clientID.empty()) obj["client_id"] = str(clientID);
    if (!username.empty()) obj["username"] = str(username);
    if (!tokenType.empty()) obj["token_type"] = str(tokenType);
    if (expiresAt != 0) obj["exp"] = std::make_shared<JSONValue>(static_cast<int64_t>(expiresAt));
    return JSONValue(std::move(obj));
}

void WriteIntrospectionResponse(Response& res, const IntrospectionResponse& ir) {
    WriteJSON(res, ir.ToJSON(), 200);
}

} // namespace oauth2
