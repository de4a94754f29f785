//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/oauth2/HTTPServer.cpp
// Purpose: HTTP/HTTPS authorization server front end using Boost.Beast (TLS 1.3 only for HTTPS)
//==========================================================================================================

#include <algorithm>
#include <atomic>
#include <cctype>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <thread>
#include <unordered_map>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <openssl/ssl.h>

#include "logging/Logger.h"
#include "oauth2/Encoding.hpp"
#include "oauth2/HTTPServer.hpp"
#include "oauth2/auth/BearerValidator.hpp"
#include "oauth2/version.h"

namespace oauth2 {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace {
    struct ResourceRoute {
        ScopeSet requiredScope;
        HTTPServer::ResourceHandler handler;
    };

    static Request toRequest(const http::request<http::string_body>& req) {
        Request out;
        out.method = std::string(req.method_string());

        const std::string target = std::string(req.target());
        auto qm = target.find('?');
        if (qm != std::string::npos) {
            out.query = ParseQueryString(target.substr(qm + 1));
        }

        for (const auto& field : req) {
            out.headers[std::string(field.name_string())] = std::string(field.value());
        }

        const std::string contentType = std::string(req[http::field::content_type]);
        if (req.method() == http::verb::post &&
            contentType.find("application/x-www-form-urlencoded") != std::string::npos) {
            out.form = ParseQueryString(req.body());
        }
        return out;
    }

    static std::string pathOf(const http::request<http::string_body>& req) {
        std::string target = std::string(req.target());
        auto qm = target.find('?');
        return (qm == std::string::npos) ? target : target.substr(0, qm);
    }
}

class HTTPServer::Impl {
public:
    HTTPServer::Options opts;
    std::shared_ptr<GrantEngine> engine;
    auth::BearerValidator validator;
    std::atomic<bool> running{false};

    net::io_context ioc;
    std::unique_ptr<tcp::acceptor> acceptor;
    std::unique_ptr<ssl::context> sslCtx; // present when scheme==https
    std::thread ioThread;

    std::mutex resourcesMutex;
    std::unordered_map<std::string, ResourceRoute> resources;
    HTTPServer::ErrorHandler errorHandler;

    Impl(const HTTPServer::Options& o, std::shared_ptr<GrantEngine> e)
        : opts(o), engine(std::move(e)), validator(engine->Codec(), engine->Store()) {
        if (opts.scheme == "https") {
            sslCtx = std::make_unique<ssl::context>(ssl::context::tls_server);
            // TLS 1.3 only
            ::SSL_CTX_set_min_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            ::SSL_CTX_set_max_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            try {
                sslCtx->use_certificate_chain_file(opts.certFile);
                sslCtx->use_private_key_file(opts.keyFile, ssl::context::file_format::pem);
            } catch (const std::exception& ex) {
                LOG_ERROR("HTTPServer: failed to load certificate/key: {}", ex.what());
                throw;
            }
            sslCtx->set_options(
                ssl::context::default_workarounds | ssl::context::no_sslv2 | ssl::context::no_sslv3 |
                ssl::context::no_tlsv1 | ssl::context::no_tlsv1_1 | ssl::context::no_tlsv1_2);
        }
    }

    ~Impl() {
        if (ioThread.joinable()) {
            ioc.stop();
            ioThread.join();
        }
    }

    void setError(const std::string& msg) {
        if (errorHandler) { errorHandler(msg); }
    }

    void sessionFailed(const char* kind, const std::exception& e) {
        if (!running.load()) {
            // Suppress shutdown-related errors; log at DEBUG only in debug builds
#ifdef _DEBUG
            LOG_DEBUG("HTTPServer {} session suppressed during shutdown: {}", kind, e.what());
#endif
        } else {
            setError(std::string("HTTPServer ") + kind + " session error: " + e.what());
        }
    }

    net::awaitable<void> session_plain(tcp::socket socket) {
        try {
            boost::beast::tcp_stream stream(std::move(socket));
            boost::beast::flat_buffer buffer;
            http::request<http::string_body> req;
            co_await http::async_read(stream, buffer, req, net::use_awaitable);
            auto res = makeResponse(req);
            co_await http::async_write(stream, res, net::use_awaitable);
            boost::system::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_send, ec);
        } catch (const std::exception& e) {
            sessionFailed("plain", e);
        }
        co_return;
    }

    net::awaitable<void> session_tls(tcp::socket socket) {
        try {
            ssl::stream<tcp::socket> tls(std::move(socket), *sslCtx);
            co_await tls.async_handshake(ssl::stream_base::server, net::use_awaitable);
            boost::beast::flat_buffer buffer;
            http::request<http::string_body> req;
            co_await http::async_read(tls, buffer, req, net::use_awaitable);
            auto res = makeResponse(req);
            co_await http::async_write(tls, res, net::use_awaitable);
            boost::system::error_code ec;
            tls.shutdown(ec);
        } catch (const std::exception& e) {
            sessionFailed("TLS", e);
        }
        co_return;
    }

    Response serveProtected(const Request& request, const ResourceRoute& resource) {
        Response out;
        auto check = validator.Check(request, resource.requiredScope);
        if (!check.ok) {
            auth::WriteBearerError(out, check.error);
            return out;
        }
        auth::CredentialScope scope(&check.credential.value());
        try {
            return resource.handler(request);
        } catch (const std::exception& e) {
            LOG_ERROR("Protected resource handler failed: {}", e.what());
            auth::WriteBearerError(out, auth::ServerError());
            return out;
        }
    }

    Response dispatch(const http::request<http::string_body>& req) {
        const std::string path = pathOf(req);
        const Request request = toRequest(req);

        if (path == opts.basePath + "/authorize") {
            return engine->HandleAuthorization(request);
        }
        if (path == opts.basePath + "/token") {
            return engine->HandleToken(request);
        }
        if (path == opts.basePath + "/introspect") {
            return engine->HandleIntrospection(request);
        }
        if (path == opts.basePath + "/revoke") {
            return engine->HandleRevocation(request);
        }

        std::optional<ResourceRoute> resource;
        {
            std::lock_guard<std::mutex> lock(resourcesMutex);
            auto it = resources.find(path);
            if (it != resources.end()) {
                resource = it->second;
            }
        }
        if (resource.has_value()) {
            return serveProtected(request, resource.value());
        }

        Response notFound;
        notFound.status = 404;
        notFound.headers["Content-Type"] = "text/plain; charset=utf-8";
        notFound.body = "404 page not found";
        return notFound;
    }

    http::response<http::string_body> makeResponse(const http::request<http::string_body>& req) {
        Response out;
        try {
            out = dispatch(req);
        } catch (const EntropyError& e) {
            LOG_FATAL("Secure random source failed: {}", e.what());
        } catch (const std::exception& e) {
            LOG_ERROR("HTTPServer request failed: {}", e.what());
            out = Response();
            out.status = 500;
        }

        http::response<http::string_body> res{http::status::ok, req.version()};
        res.result(static_cast<unsigned>(out.status));
        for (const auto& [key, val] : out.headers) {
            res.set(key, val);
        }
        res.set(http::field::server, getServerBanner());
        res.keep_alive(false);
        res.body() = std::move(out.body);
        res.prepare_payload();
        return res;
    }

    net::awaitable<void> acceptLoop() {
        try {
            // Validate port strictly: numeric and within [0, 65535]
            if (opts.port.empty()) {
                setError("HTTPServer invalid port: empty");
                co_return;
            }
            bool allDigits = std::all_of(opts.port.begin(), opts.port.end(), [](unsigned char ch){ return std::isdigit(ch) != 0; });
            if (!allDigits || opts.port.size() > 5 || std::stoul(opts.port) > 65535ul) {
                setError(std::string("HTTPServer invalid port: ") + opts.port);
                co_return;
            }
            tcp::resolver resolver(co_await net::this_coro::executor);
            auto r = resolver.resolve(opts.address, opts.port);
            tcp::endpoint ep = *r.begin();

            acceptor = std::make_unique<tcp::acceptor>(ioc);
            acceptor->open(ep.protocol());
            acceptor->set_option(tcp::acceptor::reuse_address(true));
            acceptor->bind(ep);
            acceptor->listen();
            LOG_INFO("HTTPServer listening on {}://{}:{}{}", opts.scheme, opts.address, opts.port, opts.basePath);

            while (running.load()) {
                tcp::socket socket = co_await acceptor->async_accept(net::use_awaitable);
                if (opts.scheme == "https") {
                    net::co_spawn(ioc, session_tls(std::move(socket)), net::detached);
                } else {
                    net::co_spawn(ioc, session_plain(std::move(socket)), net::detached);
                }
            }
        } catch (const std::exception& e) {
            if (!running.load()) {
                // Suppress shutdown-related errors (e.g., operation_aborted when acceptor is closed)
#ifdef _DEBUG
                LOG_DEBUG("HTTPServer accept suppressed during shutdown: {}", e.what());
#endif
            } else {
                setError(std::string("HTTPServer accept error: ") + e.what());
            }
        }
        co_return;
    }
};

HTTPServer::HTTPServer(const Options& opts, std::shared_ptr<GrantEngine> engine) {
    if (!engine) {
        throw std::invalid_argument("HTTPServer requires a grant engine");
    }
    pImpl = std::make_unique<Impl>(opts, std::move(engine));
}

HTTPServer::~HTTPServer() = default;

std::future<void> HTTPServer::Start() {
    std::promise<void> ready; auto fut = ready.get_future();
    pImpl->running.store(true);
    pImpl->ioThread = std::thread([this, pr = std::move(ready)]() mutable {
        try {
            net::co_spawn(pImpl->ioc, pImpl->acceptLoop(), net::detached);
            pr.set_value();
            pImpl->ioc.run();
        } catch (const std::exception& e) {
            pImpl->setError(e.what());
        }
    });
    return fut;
}

std::future<void> HTTPServer::Stop() {
    std::promise<void> done; auto fut = done.get_future();
    pImpl->running.store(false);
    if (pImpl->acceptor) {
        boost::system::error_code ec;
        pImpl->acceptor->close(ec);
    }
    pImpl->ioc.stop();
    if (pImpl->ioThread.joinable()) {
        pImpl->ioThread.join();
    }
    done.set_value();
    return fut;
}

void HTTPServer::AddProtectedResource(const std::string& path, const ScopeSet& requiredScope, ResourceHandler handler) {
    std::lock_guard<std::mutex> lock(pImpl->resourcesMutex);
    pImpl->resources[path] = ResourceRoute{requiredScope, std::move(handler)};
}

void HTTPServer::SetErrorHandler(ErrorHandler handler) {
    pImpl->errorHandler = std::move(handler);
}

HTTPServer::Options ParseListenURI(const std::string& uri) {
    HTTPServer::Options opts;
    // default: http if scheme omitted
    opts.scheme = "http";

    std::string cfg = uri;
    auto trim = [](std::string& s){
        auto notSpace = [](unsigned char c){ return !std::isspace(c); };
        s.erase(s.begin(), std::find_if(s.begin(), s.end(), notSpace));
        s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
    };
    trim(cfg);

    auto startsWith = [](const std::string& s, const char* pfx){ return s.rfind(pfx, 0) == 0; };
    if (startsWith(cfg, "http://")) {
        cfg = cfg.substr(7);
    } else if (startsWith(cfg, "https://")) {
        opts.scheme = "https";
        cfg = cfg.substr(8);
    }

    std::string hostPortPath = cfg;
    std::string query;
    auto qpos = cfg.find('?');
    if (qpos != std::string::npos) {
        hostPortPath = cfg.substr(0, qpos);
        query = cfg.substr(qpos + 1);
    }

    std::string hostPort = hostPortPath;
    auto slash = hostPortPath.find('/');
    if (slash != std::string::npos) {
        hostPort = hostPortPath.substr(0, slash);
        std::string path = hostPortPath.substr(slash);
        while (path.size() > 1 && path.back() == '/') {
            path.pop_back();
        }
        if (path != "/") {
            opts.basePath = path;
        }
    }

    // host[:port], IPv6 as [addr]:port
    if (!hostPort.empty()) {
        if (hostPort.front() == '[') {
            auto rb = hostPort.find(']');
            if (rb != std::string::npos) {
                opts.address = hostPort.substr(1, rb - 1);
                if (rb + 1 < hostPort.size() && hostPort[rb + 1] == ':') {
                    opts.port = hostPort.substr(rb + 2);
                }
            }
        } else {
            auto colon = hostPort.rfind(':');
            if (colon != std::string::npos) {
                opts.address = hostPort.substr(0, colon);
                opts.port = hostPort.substr(colon + 1);
            } else {
                opts.address = hostPort;
            }
        }
        if (opts.port.empty()) opts.port = "9443";
    }

    for (const auto& [key, val] : ParseQueryString(query)) {
        if (key == "cert") opts.certFile = val;
        else if (key == "key") opts.keyFile = val;
    }
    return opts;
}

} // namespace oauth2
