//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Request.hpp
// Purpose: Denied-request snapshot and its request-scoped attribute bag
//==========================================================================================================

#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <unordered_map>
#include <variant>

#include <boost/beast/http/verb.hpp>

namespace loginresp {

//==========================================================================================================
// Authorization
// Purpose: Credential presented with the request.
// Fields:
//   scheme: Scheme as sent (e.g. "Basic", "Bearer").
//   tag: Set by whoever inspected the credential; non-empty means an authentication attempt was made.
//        Whether that attempt succeeded is not recorded here.
//   credentials: Raw credential text following the scheme.
//==========================================================================================================
struct Authorization {
    std::string scheme;
    std::string tag;
    std::string credentials;

    bool Attempted() const { return !tag.empty(); }
};

//==========================================================================================================
// RequestAttributes
// Purpose: Mutable per-request key/value store shared between the denial handling and whatever renders
//          the response afterwards (typically the login page template).
// Key contract:
//   authReason  (string) written before a login page is rendered: "required" or "notPermitted".
//   loginResult (bool)   written by a login form handler earlier in the request; read for JSON replies.
//   userUrl     (string) written by a login form handler earlier in the request; read for JSON replies.
// Other keys are free for host use. A value of the wrong type for a contract key reads as absent.
//==========================================================================================================
class RequestAttributes {
public:
    using Value = std::variant<bool, std::string>;

    static constexpr const char* kAuthReason = "authReason";
    static constexpr const char* kLoginResult = "loginResult";
    static constexpr const char* kUserUrl = "userUrl";

    void Set(const std::string& key, Value value);
    void Erase(const std::string& key);
    bool Contains(const std::string& key) const;
    const Value* Find(const std::string& key) const;
    std::optional<bool> GetBool(const std::string& key) const;
    std::optional<std::string> GetString(const std::string& key) const;
    std::size_t Size() const { return values.size(); }

    std::optional<bool> LoginResult() const { return GetBool(kLoginResult); }
    void SetLoginResult(bool ok) { Set(kLoginResult, ok); }

    std::optional<std::string> UserUrl() const { return GetString(kUserUrl); }
    void SetUserUrl(const std::string& url) { Set(kUserUrl, url); }

    std::optional<std::string> AuthReasonText() const { return GetString(kAuthReason); }

private:
    std::unordered_map<std::string, Value> values;
};

//==========================================================================================================
// Request
// Purpose: Immutable view of a denied request. Only Attributes() may be modified, and only by the thread
//          handling this request.
//==========================================================================================================
class Request {
public:
    Request(boost::beast::http::verb method,
            std::string absolutePath,
            std::string hostHeader,
            std::optional<std::string> acceptHeader = std::nullopt,
            std::optional<Authorization> authorization = std::nullopt)
        : method(method),
          absolutePath(std::move(absolutePath)),
          hostHeader(std::move(hostHeader)),
          acceptHeader(std::move(acceptHeader)),
          authorization(std::move(authorization)) {}

    boost::beast::http::verb Method() const { return method; }
    const std::string& AbsolutePath() const { return absolutePath; }
    const std::string& HostHeader() const { return hostHeader; }
    const std::optional<std::string>& AcceptHeader() const { return acceptHeader; }
    const std::optional<Authorization>& GetAuthorization() const { return authorization; }

    RequestAttributes& Attributes() { return attributes; }
    const RequestAttributes& Attributes() const { return attributes; }

private:
    boost::beast::http::verb method;
    std::string absolutePath;
    std::string hostHeader;
    std::optional<std::string> acceptHeader;
    std::optional<Authorization> authorization;
    RequestAttributes attributes;
};

} // namespace loginresp
