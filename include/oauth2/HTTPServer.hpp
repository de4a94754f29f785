//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HTTPServer.hpp
// Purpose: Coroutine-based HTTP/HTTPS front end for the grant engine using Boost.Beast (TLS 1.3 only for HTTPS)
//==========================================================================================================

#pragma once

#include <functional>
#include <future>
#include <memory>
#include <string>

#include "oauth2/GrantEngine.hpp"
#include "oauth2/Request.hpp"
#include "oauth2/Response.hpp"
#include "oauth2/Scope.hpp"

namespace oauth2 {

class HTTPServer {
public:
    //==========================================================================================================
    // Options
    // Purpose: Configuration for bind address/port, endpoint base path, and TLS files.
    // Fields:
    //   address: Bind address (default: 0.0.0.0)
    //   port: Listen port (default: 9443)
    //   basePath: Prefix of the authorize, token, introspect and revoke endpoints
    //   scheme: "http" or "https" (TLS 1.3 only for https)
    //   certFile/keyFile: PEM files required when scheme == https
    //==========================================================================================================
    struct Options {
        std::string address{"0.0.0.0"};
        std::string port{"9443"};
        std::string basePath{"/oauth2"};
        std::string scheme{"https"};
        std::string certFile;
        std::string keyFile;
    };

    using ResourceHandler = std::function<Response(const Request&)>;
    using ErrorHandler = std::function<void(const std::string&)>;

    HTTPServer(const Options& opts, std::shared_ptr<GrantEngine> engine);
    ~HTTPServer();

    //==========================================================================================================
    // Starts the server accept loop on a background I/O thread.
    // Returns:
    //   Future that becomes ready once the I/O context is running.
    //==========================================================================================================
    std::future<void> Start();

    //==========================================================================================================
    // Stops the server: closes acceptor, stops I/O context, and joins background thread.
    //==========================================================================================================
    std::future<void> Stop();

    //==========================================================================================================
    // AddProtectedResource
    // Purpose: Serve path through handler once the request's bearer token is validated.
    // Notes:
    //   - Failures answer with the bearer challenge (401/403/400) and never reach the handler.
    //   - The validated credential is available inside the handler via oauth2::auth::CurrentCredential().
    // Args:
    //   path: Exact request path (query excluded).
    //   requiredScope: Scope the token must include; empty means any live token.
    //==========================================================================================================
    void AddProtectedResource(const std::string& path, const ScopeSet& requiredScope, ResourceHandler handler);

    // Sets the error handler for transport/server errors.
    void SetErrorHandler(ErrorHandler handler);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

//==========================================================================================================
// ParseListenURI
// Purpose: Build server options from a listen URI:
//            - "http://<address>:<port>" (e.g., http://127.0.0.1:0)
//            - "https://<address>:<port>?cert=<pem>&key=<pem>"
//          A path component, when present, becomes basePath. If scheme is omitted, defaults to http.
//==========================================================================================================
HTTPServer::Options ParseListenURI(const std::string& uri);

} // namespace oauth2
