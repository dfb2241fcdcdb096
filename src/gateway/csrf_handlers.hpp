/*
 * Copyright 2025 csrfguard Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// csrfguard CSRF Strategies - Header
// Pluggable rejection responses and whitelist predicates

#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "../http/http.hpp"

namespace csrfguard::gateway {

/// Builds the response for a rejected request
/// May read the posted data, but must not trust it.
class BlockedHandler {
public:
    virtual ~BlockedHandler() = default;

    virtual void handle(const http::Request& request, http::Response& response) const = 0;
};

/// Default: 403, text/plain, "CSRF detected"
class ForbiddenBlockedHandler final : public BlockedHandler {
public:
    static constexpr std::string_view BODY = "CSRF detected";

    void handle(const http::Request& request, http::Response& response) const override;
};

/// 302 to a fixed location
class RedirectBlockedHandler final : public BlockedHandler {
public:
    explicit RedirectBlockedHandler(std::string location) : location_(std::move(location)) {}

    void handle(const http::Request& request, http::Response& response) const override;

    [[nodiscard]] std::string_view location() const noexcept { return location_; }

private:
    std::string location_;
};

/// Host-supplied callable
class FunctionBlockedHandler final : public BlockedHandler {
public:
    using Func = std::function<void(const http::Request&, http::Response&)>;

    explicit FunctionBlockedHandler(Func func) : func_(std::move(func)) {}

    void handle(const http::Request& request, http::Response& response) const override {
        func_(request, response);
    }

private:
    Func func_;
};

/// Decides per request whether token validation is skipped
class WhitelistPredicate {
public:
    virtual ~WhitelistPredicate() = default;

    [[nodiscard]] virtual bool is_whitelisted(const http::Request& request) const = 0;
};

/// Default: nothing is whitelisted
class NeverWhitelisted final : public WhitelistPredicate {
public:
    [[nodiscard]] bool is_whitelisted(const http::Request&) const override { return false; }
};

/// Whitelists request paths under any of the prefixes.
/// "/api" covers "/api" and "/api/..." but not "/apix".
class PathPrefixWhitelist final : public WhitelistPredicate {
public:
    explicit PathPrefixWhitelist(std::vector<std::string> prefixes)
        : prefixes_(std::move(prefixes)) {}

    [[nodiscard]] bool is_whitelisted(const http::Request& request) const override;

    [[nodiscard]] const std::vector<std::string>& prefixes() const noexcept { return prefixes_; }

private:
    std::vector<std::string> prefixes_;
};

/// Host-supplied callable
class FunctionWhitelist final : public WhitelistPredicate {
public:
    using Func = std::function<bool(const http::Request&)>;

    explicit FunctionWhitelist(Func func) : func_(std::move(func)) {}

    [[nodiscard]] bool is_whitelisted(const http::Request& request) const override {
        return func_(request);
    }

private:
    Func func_;
};

}  // namespace csrfguard::gateway
