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

// csrfguard Request Validator - Header
// Accept/reject decision for incoming requests against the session token

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "../control/config.hpp"
#include "../http/http.hpp"
#include "../session/session.hpp"
#include "csrf_handlers.hpp"

namespace csrfguard::gateway {

enum class ValidationOutcome : uint8_t {
    Accept,
    Reject,
    NoSession  // Configuration error: the host did not provide a session
};

/// Where the accepted token came from
enum class TokenSource : uint8_t {
    None,
    Bypass,  // Not POST, or whitelisted: no token was read
    Header,
    Parameter
};

struct ValidationResult {
    ValidationOutcome outcome = ValidationOutcome::Reject;
    TokenSource source = TokenSource::None;

    [[nodiscard]] bool accepted() const noexcept { return outcome == ValidationOutcome::Accept; }
};

[[nodiscard]] std::string_view to_string(ValidationOutcome outcome) noexcept;
[[nodiscard]] std::string_view to_string(TokenSource source) noexcept;

/// Validates POST requests against the token stored in the session.
/// With onetime enabled, an accepted token is removed from the session.
class CsrfValidator {
public:
    CsrfValidator(control::CsrfConfig config, std::shared_ptr<const WhitelistPredicate> whitelist);

    [[nodiscard]] ValidationResult validate(const http::Request& request,
                                            session::Session* session) const;

    [[nodiscard]] const control::CsrfConfig& config() const noexcept { return config_; }

    /// Configured header name in CGI form ("X_CSRF_TOKEN")
    [[nodiscard]] std::string_view normalized_header_name() const noexcept {
        return normalized_header_name_;
    }

private:
    /// Value of the token header, matching names in CGI form
    [[nodiscard]] std::optional<std::string_view> find_header_token(
        const http::Request& request) const noexcept;

    control::CsrfConfig config_;
    std::string normalized_header_name_;
    std::shared_ptr<const WhitelistPredicate> whitelist_;
};

}  // namespace csrfguard::gateway
