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

// csrfguard Gateway - Implementation

#include "gateway.hpp"

#include "../core/logging.hpp"

namespace csrfguard::gateway {

MiddlewareResult Gateway::handle(const http::Request& request, http::Response& response,
                                 session::Session* session) {
    RequestContext ctx;
    ctx.request = &request;
    ctx.response = &response;
    ctx.session = session;
    ctx.correlation_id = logging::generate_correlation_id();
    ctx.start_time = std::chrono::steady_clock::now();

    const MiddlewareResult request_result = pipeline_.execute_request(ctx);

    if (request_result == MiddlewareResult::Error) {
        if (auto* logger = logging::get_current_logger()) {
            LOG_ERROR_CTX(logger, "Request phase failed", ctx.correlation_id,
                          static_cast<uint16_t>(response.status), ctx.error_message);
        }
        return MiddlewareResult::Error;
    }

    if (request_result == MiddlewareResult::Continue && app_) {
        app_(request, response);
    }

    // Response phase also runs after Stop so blocked requests are logged
    ResponseContext response_ctx;
    response_ctx.request = &request;
    response_ctx.response = &response;
    response_ctx.session = session;
    response_ctx.correlation_id = std::move(ctx.correlation_id);
    response_ctx.metadata = std::move(ctx.metadata);
    response_ctx.start_time = ctx.start_time;

    const MiddlewareResult response_result = pipeline_.execute_response(response_ctx);
    if (response_result == MiddlewareResult::Error) {
        if (auto* logger = logging::get_current_logger()) {
            LOG_ERROR_CTX(logger, "Response phase failed", response_ctx.correlation_id,
                          static_cast<uint16_t>(response.status), "middleware error");
        }
        return MiddlewareResult::Error;
    }

    return request_result;
}

}  // namespace csrfguard::gateway
