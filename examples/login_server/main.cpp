//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: Static file server that answers denied requests with a login page, a JSON payload or a
//          Basic challenge depending on what the client can use
//==========================================================================================================

#include <csignal>
#include <cstddef>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <openssl/evp.h>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "loginresp/FileResourceResolver.hpp"
#include "loginresp/HTTPServer.hpp"
#include "loginresp/LoginResponseDispatcher.hpp"
#include "loginresp/LoginResponseOptions.hpp"
#include "loginresp/StandardResponder.hpp"
#include "loginresp/version.h"

using namespace loginresp;

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

static bool hasFlag(int argc, char** argv, const std::string& flag) {
    for (int i = 1; i < argc; ++i) {
        if (argv[i] != nullptr && flag == argv[i]) {
            return true;
        }
    }
    return false;
}

// Credentials part of "Authorization: Basic <base64(user:password)>"
static std::string basicCredentials(const std::string& user, const std::string& password) {
    const std::string plain = user + ":" + password;
    std::vector<unsigned char> in(plain.begin(), plain.end());
    std::vector<unsigned char> out(4 * ((in.size() + 2) / 3) + 1);
    int n = ::EVP_EncodeBlock(out.data(), in.data(), static_cast<int>(in.size()));
    return std::string(out.begin(), out.begin() + n);
}

int main(int argc, char** argv) {
    FUNC_SCOPE();
    if (hasFlag(argc, argv, "--version")) {
        std::cout << "login_server " << getVersionString() << std::endl;
        return 0;
    }

    Logger::setLogLevelFromString(GetEnvOrDefault("LOGINRESP_LOG_LEVEL", "INFO"));
    {
        std::string logFile = GetEnvOrDefault("LOGINRESP_LOG_FILE", "");
        if (!logFile.empty()) {
            Logger::setLogFile(logFile);
        }
    }

    const std::string root = getArgValue(argc, argv, "--root").value_or(".");
    const std::string listen = getArgValue(argc, argv, "--listen").value_or("http://127.0.0.1:8080");
    const std::vector<std::string> protectedPrefixes =
        splitPathList(getArgValue(argc, argv, "--protect").value_or("/"));
    const std::string user = getArgValue(argc, argv, "--user").value_or("admin");
    const std::string password = getArgValue(argc, argv, "--password").value_or("admin");

    LoginResponseOptions options = applyLoginResponseEnv(
        parseLoginResponseOptions(getArgValue(argc, argv, "--config").value_or("")));
    LOG_INFO("Login responses {} (loginPage={}, {} excluded prefixes)",
             options.enabled ? "enabled" : "disabled", options.loginPage, options.excludePaths.size());

    FileResourceResolver resolver(root);
    StandardResponder standard("loginresp");
    LoginResponseDispatcher dispatcher(options, standard, standard, resolver);

    std::unique_ptr<HTTPServer> server;
    try {
        HTTPServerFactory factory;
        server = factory.CreateServer(listen, resolver, standard, dispatcher);
    } catch (const std::exception& e) {
        LOG_ERROR("Cannot create server for {}: {}", listen, e.what());
        return 2;
    }

    const std::string expected = basicCredentials(user, password);
    server->SetAccessCheck([&](const Resource& resource, const Request& request) {
        (void)resource;
        if (request.AbsolutePath() == options.loginPage) {
            return true;
        }
        bool guarded = false;
        for (const auto& prefix : protectedPrefixes) {
            if (request.AbsolutePath().rfind(prefix, 0) == 0) {
                guarded = true;
                break;
            }
        }
        if (!guarded) {
            return true;
        }
        const auto& auth = request.GetAuthorization();
        return auth.has_value() && auth->scheme == "Basic" && auth->credentials == expected;
    });

    boost::asio::io_context signals;
    boost::asio::signal_set stopSignals(signals, SIGINT, SIGTERM);
    stopSignals.async_wait([](const boost::system::error_code& ec, int signo) {
        if (!ec) {
            LOG_INFO("Received signal {}, shutting down", signo);
        }
    });
    server->SetErrorHandler([](const std::string& err) {
        LOG_WARN("HTTPServer: {}", err);
    });

    try {
        (void)server->Start().get();
    } catch (const std::exception& e) {
        LOG_ERROR("Cannot listen on {}: {}", listen, e.what());
        return 2;
    }
    LOG_INFO("Serving {} on port {} (version {})", root, server->LocalPort(), getVersionString());

    signals.run();
    (void)server->Stop().get();
    return 0;
}
