//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/loginresp/HTTPServer.cpp
// Purpose: HTTP/HTTPS resource server using Boost.Beast (TLS 1.3 only for HTTPS)
//==========================================================================================================

#include <utility>
#include <thread>
#include <atomic>
#include <mutex>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <stdexcept>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/http.hpp>

#include <openssl/ssl.h>

#include "logging/Logger.h"
#include "loginresp/HTTPServer.hpp"
#include "loginresp/beast/BeastAdapters.hpp"
#include "loginresp/errors/Errors.h"
#include "loginresp/version.h"

namespace loginresp {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

class HTTPServer::Impl {
public:
    HTTPServer::Options opts;
    IResourceResolver& resolver;
    IContentResponder& contentResponder;
    IChallengeResponder& denialResponder;
    std::atomic<bool> running{false};
    std::atomic<unsigned short> boundPort{0};

    net::io_context ioc;
    std::unique_ptr<tcp::acceptor> acceptor;
    std::unique_ptr<ssl::context> sslCtx; // present when scheme==https
    std::thread ioThread;

    std::mutex handlerMutex;
    HTTPServer::AccessCheck accessCheck;
    HTTPServer::ErrorHandler errorHandler;

    Impl(const HTTPServer::Options& o, IResourceResolver& r, IContentResponder& c, IChallengeResponder& d)
        : opts(o), resolver(r), contentResponder(c), denialResponder(d) {
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
        if (ioThread.joinable()) {
            ioc.stop();
            ioThread.join();
        }
    }

    void setError(const std::string& msg) {
        HTTPServer::ErrorHandler handler;
        {
            std::lock_guard<std::mutex> lock(handlerMutex);
            handler = errorHandler;
        }
        if (handler) {
            handler(msg);
        } else {
            LOG_WARN("{}", msg);
        }
    }

    HTTPServer::AccessCheck currentAccessCheck() {
        std::lock_guard<std::mutex> lock(handlerMutex);
        return accessCheck;
    }

    template <typename Stream>
    net::awaitable<void> serveOne(Stream& stream) {
        boost::beast::flat_buffer buffer;
        http::request<http::string_body> req;
        co_await http::async_read(stream, buffer, req, net::use_awaitable);
        auto res = makeResponse(req);
        co_await http::async_write(stream, res, net::use_awaitable);
    }

    net::awaitable<void> session_plain(tcp::socket socket) {
        try {
            boost::beast::tcp_stream stream(std::move(socket));
            co_await serveOne(stream); // close after single request
            boost::system::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_send, ec);
        } catch (const std::exception& e) {
            if (running.load()) {
                setError(std::string("HTTPServer plain session error: ") + e.what());
            }
        }
        co_return;
    }

    net::awaitable<void> session_tls(tcp::socket socket) {
        try {
            ssl::stream<tcp::socket> tls(std::move(socket), *sslCtx);
            co_await tls.async_handshake(ssl::stream_base::server, net::use_awaitable);
            co_await serveOne(tls);
            boost::system::error_code ec;
            tls.shutdown(ec);
        } catch (const std::exception& e) {
            if (running.load()) {
                setError(std::string("HTTPServer TLS session error: ") + e.what());
            }
        }
        co_return;
    }

    static http::response<http::string_body> plainResponse(http::status status, unsigned version, const std::string& text) {
        http::response<http::string_body> res{status, version};
        res.set(http::field::server, std::string("loginresp/") + getVersionString());
        res.set(http::field::content_type, "text/plain");
        res.keep_alive(false);
        res.body() = text;
        res.prepare_payload();
        return res;
    }

    http::response<http::string_body> makeResponse(const http::request<http::string_body>& req) {
        http::response<http::string_body> res{http::status::ok, req.version()};
        res.set(http::field::server, std::string("loginresp/") + getVersionString());
        res.keep_alive(false);

        Request request = beast::makeRequest(req);
        try {
            std::shared_ptr<Resource> resource = resolver.Resolve(request.HostHeader(), request.AbsolutePath());
            if (!resource) {
                return plainResponse(http::status::not_found, req.version(), "Not found\n");
            }

            beast::BeastResponse out(res);
            auto check = currentAccessCheck();
            if (check && !check(*resource, request)) {
                LOG_INFO("Access denied: {} {}", std::string(req.method_string()), request.AbsolutePath());
                denialResponder.RespondUnauthorised(resource.get(), out, request);
                out.Commit();
                return res;
            }

            const ContentResource* content = resource->AsContent();
            const http::verb method = req.method();
            if (content == nullptr ||
                (method != http::verb::get && method != http::verb::head && method != http::verb::post)) {
                return plainResponse(http::status::method_not_allowed, req.version(), "Method not allowed\n");
            }

            std::optional<ByteRange> range;
            auto rangeIt = req.base().find(http::field::range);
            if (method == http::verb::get && rangeIt != req.base().end()) {
                range = beast::parseByteRange(std::string(rangeIt->value()));
            }
            contentResponder.RespondContent(*content, out, request, range);
            out.Commit();
            if (method == http::verb::head) {
                res.body().clear();
            }
            return res;
        } catch (const errors::LoginResponseError& e) {
            LOG_ERROR("Denial response failed for {}: {}", request.AbsolutePath(), errors::describeError(e));
            return plainResponse(http::status::internal_server_error, req.version(), "Internal server error\n");
        } catch (const errors::CollaboratorError& e) {
            LOG_WARN("Request for {} failed ({}): {}", request.AbsolutePath(),
                     errors::errorCategoryName(e.Category()), e.what());
            http::status status = errors::statusFromErrorCategory(e.Category());
            return plainResponse(status, req.version(), std::string(http::obsolete_reason(status)) + "\n");
        } catch (const std::exception& e) {
            LOG_ERROR("Request for {} failed: {}", request.AbsolutePath(), errors::describeError(e));
            return plainResponse(http::status::internal_server_error, req.version(), "Internal server error\n");
        }
    }

    void bindAndListen() {
        // Validate port strictly: numeric and within [0, 65535]
        if (opts.port.empty()) {
            throw std::invalid_argument("HTTPServer invalid port: empty");
        }
        bool allDigits = std::all_of(opts.port.begin(), opts.port.end(), [](unsigned char ch){ return std::isdigit(ch) != 0; });
        if (!allDigits || opts.port.size() > 5 || std::stoul(opts.port) > 65535ul) {
            throw std::invalid_argument(std::string("HTTPServer invalid port: ") + opts.port);
        }
        tcp::resolver resolverDns(ioc);
        auto r = resolverDns.resolve(opts.address, opts.port);
        tcp::endpoint ep = *r.begin();

        acceptor = std::make_unique<tcp::acceptor>(ioc);
        acceptor->open(ep.protocol());
        acceptor->set_option(tcp::acceptor::reuse_address(true));
        acceptor->bind(ep);
        acceptor->listen();
        boundPort.store(acceptor->local_endpoint().port());
        LOG_INFO("HTTPServer listening on {}://{}:{}", opts.scheme, opts.address, boundPort.load());
    }

    net::awaitable<void> acceptLoop() {
        try {
            while (running.load()) {
                tcp::socket socket = co_await acceptor->async_accept(net::use_awaitable);
                if (opts.scheme == "https") {
                    net::co_spawn(ioc, session_tls(std::move(socket)), net::detached);
                } else {
                    net::co_spawn(ioc, session_plain(std::move(socket)), net::detached);
                }
            }
        } catch (const std::exception& e) {
            if (running.load()) {
                setError(std::string("HTTPServer accept error: ") + e.what());
            }
        }
        co_return;
    }
};

HTTPServer::HTTPServer(const Options& opts,
                       IResourceResolver& resolver,
                       IContentResponder& contentResponder,
                       IChallengeResponder& denialResponder)
    : pImpl(std::make_unique<Impl>(opts, resolver, contentResponder, denialResponder)) {}

HTTPServer::~HTTPServer() {
    (void)Stop().get();
}

std::future<void> HTTPServer::Start() {
    pImpl->bindAndListen();
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

void HTTPServer::SetAccessCheck(AccessCheck check) {
    std::lock_guard<std::mutex> lock(pImpl->handlerMutex);
    pImpl->accessCheck = std::move(check);
}

void HTTPServer::SetErrorHandler(ErrorHandler handler) {
    std::lock_guard<std::mutex> lock(pImpl->handlerMutex);
    pImpl->errorHandler = std::move(handler);
}

unsigned short HTTPServer::LocalPort() const {
    return pImpl->boundPort.load();
}

http::response<http::string_body> HTTPServer::HandleRequest(const http::request<http::string_body>& req) {
    return pImpl->makeResponse(req);
}

HTTPServer::Options HTTPServerFactory::ParseOptions(const std::string& config) {
    HTTPServer::Options opts;

    std::string cfg = config;
    auto trim = [](std::string& s){
        auto notSpace = [](unsigned char c){ return !std::isspace(c); };
        s.erase(s.begin(), std::find_if(s.begin(), s.end(), notSpace));
        s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
    };
    trim(cfg);

    auto startsWith = [](const std::string& s, const char* pfx){ return s.rfind(pfx, 0) == 0; };
    if (startsWith(cfg, "http://")) {
        opts.scheme = "http";
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
    }
    trim(hostPort);

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
        trim(opts.address);
        trim(opts.port);
        if (opts.port.empty()) opts.port = "8080";
    }

    if (!query.empty()) {
        std::stringstream ss(query);
        std::string kv;
        while (std::getline(ss, kv, '&')) {
            auto eq = kv.find('=');
            std::string key = (eq == std::string::npos) ? kv : kv.substr(0, eq);
            std::string val = (eq == std::string::npos) ? std::string() : kv.substr(eq + 1);
            if (key == "cert") opts.certFile = val;
            else if (key == "key") opts.keyFile = val;
        }
    }
    return opts;
}

std::unique_ptr<HTTPServer> HTTPServerFactory::CreateServer(const std::string& config,
                                                            IResourceResolver& resolver,
                                                            IContentResponder& contentResponder,
                                                            IChallengeResponder& denialResponder) {
    return std::make_unique<HTTPServer>(ParseOptions(config), resolver, contentResponder, denialResponder);
}

} // namespace loginresp
