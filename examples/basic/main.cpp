//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: Basic example showing the three responses to a denied request, without opening a socket
//==========================================================================================================

#include <iostream>
#include <memory>
#include <string>

#include "logging/Logger.h"
#include "loginresp/HTTPServer.hpp"
#include "loginresp/InMemoryResources.hpp"
#include "loginresp/LoginResponseDispatcher.hpp"
#include "loginresp/StandardResponder.hpp"
#include "loginresp/version.h"

using namespace loginresp;
namespace http = boost::beast::http;

static void show(HTTPServer& server, const std::string& label, const std::string& target, const char* accept) {
    http::request<http::string_body> req{http::verb::get, target, 11};
    req.set(http::field::host, "localhost");
    if (accept != nullptr) {
        req.set(http::field::accept, accept);
    }
    auto res = server.HandleRequest(req);
    std::cout << label << ": " << res.result_int() << " " << res[http::field::content_type];
    if (res.count(http::field::www_authenticate) > 0) {
        std::cout << " [" << res[http::field::www_authenticate] << "]";
    }
    std::cout << "\n  " << res.body() << std::endl;
}

int main() {
    FUNC_SCOPE();
    Logger::setLogLevel(LogLevel::LOG_DEBUG_LEVEL);

    auto v = getVersionString();
    std::cout << "loginresp version: " << v << std::endl;

    InMemoryResourceResolver resolver;
    resolver.Add("/login.html", std::make_shared<MemoryResource>(
        "login.html", "<html><body><form method=\"post\">Sign in</form></body></html>", std::string("text/html")));
    resolver.Add("/reports/summary.html", std::make_shared<MemoryResource>(
        "summary.html", "<html>secret</html>", std::string("text/html")));
    resolver.Add("/api/reports", std::make_shared<MemoryResource>(
        "reports", "[]", std::string("application/json")));
    resolver.Add("/files/report.bin", std::make_shared<MemoryResource>(
        "report.bin", "binary", std::nullopt));

    StandardResponder standard;
    LoginResponseOptions options;
    options.excludePaths = {"/files/"};
    LoginResponseDispatcher dispatcher(options, standard, standard, resolver);

    HTTPServer server(HTTPServer::Options{}, resolver, standard, dispatcher);
    server.SetAccessCheck([](const Resource&, const Request& request) {
        return request.AbsolutePath() == "/login.html";
    });

    show(server, "browser page", "/reports/summary.html", "text/html,application/xhtml+xml");
    show(server, "script call", "/api/reports", "application/json");
    show(server, "excluded download", "/files/report.bin", "*/*");

    LOG_INFO("Basic example finished. Version: {}", v);
    return 0;
}
