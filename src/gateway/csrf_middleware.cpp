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

// csrfguard CSRF Middleware - Implementation

#include "csrf_middleware.hpp"

#include "../core/logging.hpp"
#include "../core/string_utils.hpp"
#include "../html/rewriter.hpp"
#include "../session/session.hpp"

namespace csrfguard::gateway {

CsrfMiddleware::CsrfMiddleware(control::CsrfConfig config,
                               std::shared_ptr<const BlockedHandler> blocked,
                               std::shared_ptr<const WhitelistPredicate> whitelist)
    : validator_(std::move(config), std::move(whitelist)),
      generator_(validator_.config().token_length),
      blocked_(std::move(blocked)) {
    if (!blocked_) {
        blocked_ = std::make_shared<ForbiddenBlockedHandler>();
    }
}

bool CsrfMiddleware::is_html_content_type(std::string_view content_type) noexcept {
    return core::istarts_with(content_type, "text/html") ||
           core::istarts_with(content_type, "application/xhtml+xml");
}

MiddlewareResult CsrfMiddleware::process_request(RequestContext& ctx) {
    if (!ctx.request || !ctx.response) {
        return MiddlewareResult::Error;
    }

    const ValidationResult result = validator_.validate(*ctx.request, ctx.session);
    ctx.set_metadata(std::string(OUTCOME_KEY), std::string(to_string(result.outcome)));
    ctx.set_metadata(std::string(SOURCE_KEY), std::string(to_string(result.source)));

    switch (result.outcome) {
        case ValidationOutcome::Accept:
            return MiddlewareResult::Continue;

        case ValidationOutcome::Reject:
            blocked_->handle(*ctx.request, *ctx.response);
            return MiddlewareResult::Stop;

        case ValidationOutcome::NoSession:
            return send_500(ctx);
    }
    return MiddlewareResult::Error;
}

MiddlewareResult CsrfMiddleware::process_response(ResponseContext& ctx) {
    if (!ctx.response) {
        return MiddlewareResult::Error;
    }

    // Rejected or failed requests keep the response the blocked handler built
    if (ctx.get_metadata(OUTCOME_KEY) != to_string(ValidationOutcome::Accept)) {
        return MiddlewareResult::Continue;
    }

    if (!is_html_content_type(ctx.response->get_header("Content-Type"))) {
        return MiddlewareResult::Continue;
    }

    if (!ctx.session) {
        auto* logger = logging::get_current_logger();
        if (logger) {
            LOG_ERROR_CTX(logger, "CSRFBLOCK: session lost before response", ctx.correlation_id,
                          500, "no session in response phase");
        }
        return MiddlewareResult::Error;
    }

    const auto& config = validator_.config();
    session::TokenStore store(*ctx.session, config.session_key);

    html::RewriteOptions options;
    options.token = store.ensure(generator_);
    options.parameter_name = config.parameter_name;
    options.meta_name = config.meta_name;
    options.add_meta = config.add_meta;
    if (ctx.request) {
        // Hosts compare in canonical lowercase form
        options.request_host = core::to_lower(ctx.request->host());
    }

    // The rewritten body has a different length
    ctx.response->remove_header("Content-Length");
    ctx.response->add_body_filter(std::make_unique<html::HtmlRewriter>(std::move(options)));

    return MiddlewareResult::Continue;
}

MiddlewareResult CsrfMiddleware::send_500(RequestContext& ctx) const {
    static constexpr std::string_view body = "CSRFBlock needs Session.";

    ctx.response->status = http::StatusCode::InternalServerError;
    ctx.response->headers.clear();
    ctx.response->body_filters.clear();
    ctx.response->body = std::string(body);
    ctx.response->set_content_type("text/plain");
    ctx.response->set_content_length(body.size());
    ctx.set_error(std::string(body));

    return MiddlewareResult::Error;
}

}  // namespace csrfguard::gateway
