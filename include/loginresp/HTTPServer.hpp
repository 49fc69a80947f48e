//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HTTPServer.hpp
// Purpose: Coroutine-based HTTP/HTTPS resource server using Boost.Beast (TLS 1.3 only for HTTPS) that
//          routes access denials to an IChallengeResponder
//==========================================================================================================

#pragma once

#include <functional>
#include <future>
#include <memory>
#include <ostream>
#include <string>

#include <boost/beast/http.hpp>

#include "loginresp/Collaborators.hpp"

namespace loginresp {

class HTTPServer {
public:
    //==========================================================================================================
    // Options
    // Purpose: Bind address/port and TLS files.
    // Fields:
    //   address: Bind address (default: 0.0.0.0)
    //   port: Listen port (default: 8080; "0" picks a free port, see LocalPort())
    //   scheme: "http" or "https" (TLS 1.3 only for https)
    //   certFile/keyFile: PEM files required when scheme == https
    //==========================================================================================================
    struct Options {
        std::string address{"0.0.0.0"};
        std::string port{"8080"};
        std::string scheme{"http"};
        std::string certFile;
        std::string keyFile;
    };

    // Decides whether the request may see the resource. Returning false hands the request to the denial
    // responder. Without an access check every request is permitted.
    using AccessCheck = std::function<bool(const Resource& resource, const Request& request)>;
    using ErrorHandler = std::function<void(const std::string&)>;

    //==========================================================================================================
    // Args:
    //   resolver: Maps request host/path to resources.
    //   contentResponder: Writes permitted content.
    //   denialResponder: Receives every denied request (usually a LoginResponseDispatcher).
    // Notes:
    //   All three are non-owning and must outlive the server.
    //==========================================================================================================
    HTTPServer(const Options& opts,
               IResourceResolver& resolver,
               IContentResponder& contentResponder,
               IChallengeResponder& denialResponder);
    ~HTTPServer();

    //==========================================================================================================
    // Binds and listens synchronously, then runs the accept loop on a background I/O thread.
    // Returns:
    //   Future that becomes ready once the I/O context is running.
    // Throws:
    //   std::invalid_argument for a malformed port; boost::system::system_error when binding fails.
    //==========================================================================================================
    std::future<void> Start();

    //==========================================================================================================
    // Stops the server: closes acceptor, stops I/O context, and joins background thread.
    //==========================================================================================================
    std::future<void> Stop();

    void SetAccessCheck(AccessCheck check);
    void SetErrorHandler(ErrorHandler handler);

    // Bound port after Start(); 0 before.
    unsigned short LocalPort() const;

    //==========================================================================================================
    // HandleRequest
    // Purpose: Produce the response for one request without any socket I/O: 404 when nothing resolves,
    //          the denial responder when the access check refuses, content otherwise (405 for resources
    //          without content). Faults become 500 (or the collaborator's category status).
    //==========================================================================================================
    boost::beast::http::response<boost::beast::http::string_body>
    HandleRequest(const boost::beast::http::request<boost::beast::http::string_body>& req);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

//==========================================================================================================
// HTTPServerFactory
// Purpose: Create a server from "http://<address>:<port>" or "https://<address>:<port>?cert=<pem>&key=<pem>".
//          Unknown parameters are ignored. If scheme is omitted, defaults to http.
//==========================================================================================================
class HTTPServerFactory {
public:
    static HTTPServer::Options ParseOptions(const std::string& config);

    std::unique_ptr<HTTPServer> CreateServer(const std::string& config,
                                             IResourceResolver& resolver,
                                             IContentResponder& contentResponder,
                                             IChallengeResponder& denialResponder);
};

} // namespace loginresp
