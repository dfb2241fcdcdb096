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

// csrfguard Request Validator - Implementation

#include "csrf_validator.hpp"

#include "../core/logging.hpp"
#include "../core/string_utils.hpp"
#include "../core/token.hpp"
#include "../http/form.hpp"

namespace csrfguard::gateway {

namespace {

/// Compare a raw header name with a name already in CGI form
[[nodiscard]] bool cgi_name_equals(std::string_view raw, std::string_view normalized) noexcept {
    if (raw.size() != normalized.size()) {
        return false;
    }
    for (size_t i = 0; i < raw.size(); ++i) {
        const char c = raw[i] == '-' ? '_' : core::to_upper_ascii(raw[i]);
        if (c != normalized[i]) {
            return false;
        }
    }
    return true;
}

}  // namespace

std::string_view to_string(ValidationOutcome outcome) noexcept {
    switch (outcome) {
        case ValidationOutcome::Accept:
            return "accept";
        case ValidationOutcome::Reject:
            return "reject";
        case ValidationOutcome::NoSession:
            return "no_session";
    }
    return "unknown";
}

std::string_view to_string(TokenSource source) noexcept {
    switch (source) {
        case TokenSource::None:
            return "none";
        case TokenSource::Bypass:
            return "bypass";
        case TokenSource::Header:
            return "header";
        case TokenSource::Parameter:
            return "parameter";
    }
    return "unknown";
}

CsrfValidator::CsrfValidator(control::CsrfConfig config,
                             std::shared_ptr<const WhitelistPredicate> whitelist)
    : config_(std::move(config)),
      normalized_header_name_(core::normalize_header_key(config_.header_name)),
      whitelist_(std::move(whitelist)) {
    if (!whitelist_) {
        whitelist_ = std::make_shared<NeverWhitelisted>();
    }
}

std::optional<std::string_view> CsrfValidator::find_header_token(
    const http::Request& request) const noexcept {
    for (const auto& header : request.headers) {
        if (cgi_name_equals(header.name, normalized_header_name_)) {
            return header.value;
        }
    }
    return std::nullopt;
}

ValidationResult CsrfValidator::validate(const http::Request& request,
                                         session::Session* session) const {
    auto* logger = logging::get_current_logger();

    if (session == nullptr) {
        if (logger) {
            LOG_ERROR(logger, "CSRFBLOCK: No session found!");
        }
        return {ValidationOutcome::NoSession, TokenSource::None};
    }

    session::TokenStore store(*session, config_.session_key);
    const auto token = store.get();

    // The predicate sees every request, POST or not
    const bool whitelisted = whitelist_->is_whitelisted(request);
    if (request.method != http::Method::POST || whitelisted) {
        return {ValidationOutcome::Accept, TokenSource::Bypass};
    }

    if (logger) {
        LOG_INFO(logger, "CSRFBLOCK: Got POST Request: path={}, host={}", request.path,
                 request.host());
    }

    if (!token) {
        if (logger) {
            LOG_ERROR(logger, "CSRFBLOCK: Token not found, returning 403! path={}", request.path);
        }
        return {ValidationOutcome::Reject, TokenSource::None};
    }

    TokenSource source = TokenSource::None;

    const auto header_value = find_header_token(request);
    const bool in_header = header_value && core::tokens_equal(*header_value, *token);
    if (logger) {
        LOG_INFO(logger, "CSRFBLOCK: Found in Header? : {}", in_header ? 1 : 0);
    }

    if (in_header) {
        source = TokenSource::Header;
    } else {
        const auto params = http::form::parse_body_parameters(request);
        const auto value = params.get(config_.parameter_name);
        const bool in_params = value && core::tokens_equal(*value, *token);
        if (logger) {
            LOG_INFO(logger, "CSRFBLOCK: Found in parameters : {}", in_params ? 1 : 0);
        }
        if (in_params) {
            source = TokenSource::Parameter;
        }
    }

    if (source == TokenSource::None) {
        if (logger) {
            LOG_ERROR(logger, "CSRFBLOCK: Token not found, returning 403! path={}", request.path);
        }
        return {ValidationOutcome::Reject, TokenSource::None};
    }

    // Invalidated before the application runs; the next HTML response issues a new one
    if (config_.onetime) {
        store.remove();
    }

    return {ValidationOutcome::Accept, source};
}

}  // namespace csrfguard::gateway
