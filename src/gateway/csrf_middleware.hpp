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

// csrfguard CSRF Middleware - Header

#pragma once

#include <memory>
#include <string_view>

#include "../control/config.hpp"
#include "../core/token.hpp"
#include "csrf_handlers.hpp"
#include "csrf_validator.hpp"
#include "pipeline.hpp"

namespace csrfguard::gateway {

/// CSRF protection (two phases)
/// Request: validate POSTs, reject with the blocked handler.
/// Response: inject the session token into HTML bodies.
class CsrfMiddleware : public Middleware {
public:
    /// Metadata keys set in the request phase
    static constexpr std::string_view OUTCOME_KEY = "csrf.outcome";
    static constexpr std::string_view SOURCE_KEY = "csrf.source";

    /// Null handlers fall back to ForbiddenBlockedHandler / NeverWhitelisted
    CsrfMiddleware(control::CsrfConfig config, std::shared_ptr<const BlockedHandler> blocked,
                   std::shared_ptr<const WhitelistPredicate> whitelist);
    ~CsrfMiddleware() override = default;

    [[nodiscard]] MiddlewareResult process_request(RequestContext& ctx) override;

    [[nodiscard]] MiddlewareResult process_response(ResponseContext& ctx) override;

    [[nodiscard]] std::string_view name() const override { return "CsrfMiddleware"; }

    /// text/html or application/xhtml+xml (case-insensitive prefix)
    [[nodiscard]] static bool is_html_content_type(std::string_view content_type) noexcept;

    [[nodiscard]] const CsrfValidator& validator() const noexcept { return validator_; }

private:
    [[nodiscard]] MiddlewareResult send_500(RequestContext& ctx) const;

    CsrfValidator validator_;
    core::TokenGenerator generator_;
    std::shared_ptr<const BlockedHandler> blocked_;
};

}  // namespace csrfguard::gateway
