//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/storemcp/HTTPServer.cpp
// Purpose: HTTP/HTTPS server for the MCP endpoint, health and discovery routes (TLS 1.3 only for HTTPS)
//==========================================================================================================

#include <utility>
#include <thread>
#include <atomic>
#include <mutex>
#include <vector>
#include <stdexcept>
#include <algorithm>
#include <cctype>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/http.hpp>

#include "logging/Logger.h"
#include "storemcp/HTTPServer.hpp"
#include "storemcp/EnvelopeCodec.h"
#include "storemcp/errors/Errors.h"

#include <openssl/ssl.h>

namespace storemcp {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace {

constexpr const char* kHealthBody = "{\"status\":\"ok\"}";
constexpr const char* kNotFoundBody = "{\"error\":\"Not found\"}";
constexpr const char* kDiscoveryPath = "/.well-known/oauth-authorization-server";

void setCorsHeaders(http::response<http::string_body>& res) {
    res.set(http::field::access_control_allow_origin, "*");
    res.set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
    res.set(http::field::access_control_allow_headers, "Content-Type, Authorization, Mcp-Session-Id");
}

} // namespace

class HTTPServer::Impl {
public:
    HTTPServer::Options opts;
    std::atomic<bool> running{false};

    std::unique_ptr<net::io_context> ioc; // replaced on every Start()
    std::unique_ptr<tcp::acceptor> acceptor;
    std::unique_ptr<ssl::context> sslCtx; // present when scheme==https
    std::vector<std::thread> ioThreads;

    ITransportAcceptor::RequestHandler requestHandler;
    ITransportAcceptor::ErrorHandler errorHandler;

    std::mutex discoveryMutex;
    std::string discoveryDocument;

    explicit Impl(const HTTPServer::Options& o) : opts(o) {
        if (opts.threads == 0) {
            opts.threads = 1;
        }
        if (opts.scheme == "https") {
            sslCtx = std::make_unique<ssl::context>(ssl::context::tls_server);
            // TLS 1.3 only
            ::SSL_CTX_set_min_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            ::SSL_CTX_set_max_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            try {
                sslCtx->use_certificate_chain_file(opts.certFile);
                sslCtx->use_private_key_file(opts.keyFile, ssl::context::file_format::pem);
            } catch (const std::exception& e) {
                LOG_ERROR("HTTPServer: failed to load certificate/key: {}", e.what());
                throw;
            }
            sslCtx->set_options(
                ssl::context::default_workarounds | ssl::context::no_sslv2 | ssl::context::no_sslv3 |
                ssl::context::no_tlsv1 | ssl::context::no_tlsv1_1 | ssl::context::no_tlsv1_2);
        }
    }

    ~Impl() {
        shutdown();
    }

    void shutdown() {
        running.store(false);
        if (acceptor) {
            boost::system::error_code ec; acceptor->close(ec);
        }
        if (ioc) { ioc->stop(); }
        for (auto& t : ioThreads) {
            if (t.joinable()) t.join();
        }
        ioThreads.clear();
    }

    void setError(const std::string& msg) {
        if (errorHandler) { errorHandler(msg); }
    }

    // Errors raised while the server is stopping are expected and only traced in debug builds
    void sessionError(const char* what, const std::exception& e) {
        if (!running.load()) {
#ifdef _DEBUG
            LOG_DEBUG("HTTPServer {} suppressed during shutdown: {}", what, e.what());
#endif
        } else {
            setError(std::string("HTTPServer ") + what + " error: " + e.what());
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
            // close after single request
            boost::system::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_send, ec);
        } catch (const std::exception& e) {
            sessionError("plain session", e);
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
            // close after single request
            boost::system::error_code ec;
            tls.shutdown(ec);
        } catch (const std::exception& e) {
            sessionError("TLS session", e);
        }
        co_return;
    }

    std::string handleRpc(const std::string& body, http::status& status) {
        std::optional<std::string> out;
        try {
            if (requestHandler) {
                out = requestHandler(body);
            } else {
                out = EncodeResponse(*errors::makeErrorResponse(
                    nullptr, errors::internalError("No request handler installed")));
            }
        } catch (const std::exception& e) {
            setError(std::string("Request handler error: ") + e.what());
            out = EncodeResponse(*errors::makeErrorResponse(nullptr, errors::internalError(e.what())));
        }
        if (!out.has_value()) {
            status = http::status::accepted;
            return std::string();
        }
        status = http::status::ok;
        return std::move(*out);
    }

    http::response<http::string_body> makeResponse(const http::request<http::string_body>& req) {
        http::response<http::string_body> res{http::status::ok, req.version()};
        res.keep_alive(false);
        setCorsHeaders(res);

        std::string target = std::string(req.target());
        auto q = target.find('?');
        if (q != std::string::npos) {
            target.erase(q);
        }
        LOG_DEBUG("HTTP {} {}", std::string(req.method_string()), target);

        if (req.method() == http::verb::options) {
            res.result(http::status::no_content);
            res.prepare_payload();
            return res;
        }

        if (target == opts.mcpPath) {
            if (req.method() != http::verb::post) {
                res.result(http::status::method_not_allowed);
                res.set(http::field::content_type, "text/plain; charset=utf-8");
                res.body() = "POST only";
                res.prepare_payload();
                return res;
            }
            http::status status = http::status::ok;
            res.body() = handleRpc(req.body(), status);
            res.result(status);
            if (status == http::status::ok) {
                res.set(http::field::content_type, "application/json");
            }
            res.prepare_payload();
            return res;
        }

        if (target == "/") {
            res.set(http::field::content_type, "text/plain; charset=utf-8");
            res.body() = opts.greeting;
            res.prepare_payload();
            return res;
        }

        if (target == "/health") {
            res.set(http::field::content_type, "application/json");
            res.body() = kHealthBody;
            res.prepare_payload();
            return res;
        }

        if (target == kDiscoveryPath) {
            std::lock_guard<std::mutex> lock(discoveryMutex);
            if (!discoveryDocument.empty()) {
                res.set(http::field::content_type, "application/json");
                res.body() = discoveryDocument;
                res.prepare_payload();
                return res;
            }
        }

        res.result(http::status::not_found);
        res.set(http::field::content_type, "application/json");
        res.body() = kNotFoundBody;
        res.prepare_payload();
        return res;
    }

    // Resolves and binds synchronously so the caller learns about bind failures from Start()
    void bind() {
        if (opts.port.empty() ||
            !std::all_of(opts.port.begin(), opts.port.end(), [](unsigned char ch){ return std::isdigit(ch) != 0; })) {
            throw std::invalid_argument("HTTPServer invalid port: '" + opts.port + "'");
        }
        if (std::stoul(opts.port) > 65535ul) {
            throw std::invalid_argument("HTTPServer invalid port (out of range): " + opts.port);
        }
        tcp::resolver resolver(*ioc);
        auto r = resolver.resolve(opts.address, opts.port);
        tcp::endpoint ep = *r.begin();

        acceptor = std::make_unique<tcp::acceptor>(*ioc);
        acceptor->open(ep.protocol());
        acceptor->set_option(tcp::acceptor::reuse_address(true));
        acceptor->bind(ep);
        acceptor->listen();
    }

    net::awaitable<void> acceptLoop() {
        try {
            while (running.load()) {
                tcp::socket socket = co_await acceptor->async_accept(net::use_awaitable);
                if (opts.scheme == "https") {
                    net::co_spawn(*ioc, session_tls(std::move(socket)), net::detached);
                } else {
                    net::co_spawn(*ioc, session_plain(std::move(socket)), net::detached);
                }
            }
        } catch (const std::exception& e) {
            // operation_aborted when the acceptor is closed by Stop()
            sessionError("accept", e);
        }
        co_return;
    }
};

HTTPServer::HTTPServer(const Options& opts)
    : pImpl(std::make_unique<Impl>(opts)) {}

HTTPServer::~HTTPServer() = default;

std::future<void> HTTPServer::Start() {
    std::promise<void> ready; auto fut = ready.get_future();
    if (pImpl->running.load()) {
        ready.set_exception(std::make_exception_ptr(std::logic_error("HTTPServer already running")));
        return fut;
    }
    // Each run gets a fresh io_context; a stopped one is never reused
    pImpl->acceptor.reset();
    pImpl->ioc = std::make_unique<net::io_context>();
    try {
        pImpl->bind();
    } catch (const std::exception& e) {
        pImpl->setError(std::string("HTTPServer bind error: ") + e.what());
        ready.set_exception(std::current_exception());
        return fut;
    }
    pImpl->running.store(true);
    net::co_spawn(*pImpl->ioc, pImpl->acceptLoop(), net::detached);
    for (unsigned int n = 0; n < pImpl->opts.threads; ++n) {
        pImpl->ioThreads.emplace_back([this]() {
            try {
                pImpl->ioc->run();
            } catch (const std::exception& e) {
                pImpl->setError(std::string("HTTPServer I/O thread error: ") + e.what());
            }
        });
    }
    LOG_DEBUG("HTTPServer listening on {}:{} with {} thread(s)", pImpl->opts.address, pImpl->opts.port,
              pImpl->opts.threads);
    ready.set_value();
    return fut;
}

std::future<void> HTTPServer::Stop() {
    std::promise<void> done; auto fut = done.get_future();
    pImpl->shutdown();
    done.set_value();
    return fut;
}

void HTTPServer::SetRequestHandler(ITransportAcceptor::RequestHandler handler) {
    pImpl->requestHandler = std::move(handler);
}

void HTTPServer::SetErrorHandler(ITransportAcceptor::ErrorHandler handler) {
    pImpl->errorHandler = std::move(handler);
}

void HTTPServer::SetAuthorizationServerMetadata(std::string json) {
    std::lock_guard<std::mutex> lock(pImpl->discoveryMutex);
    pImpl->discoveryDocument = std::move(json);
}

} // namespace storemcp
