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

// csrfguard Pipeline - Implementation

#include "pipeline.hpp"

#include "../core/logging.hpp"

namespace csrfguard::gateway {

// LoggingMiddleware implementation (Response phase - logs with timing)

MiddlewareResult LoggingMiddleware::process_response(ResponseContext& ctx) {
    if (!ctx.request || !ctx.response) {
        return MiddlewareResult::Error;
    }

    auto* logger = logging::get_current_logger();
    if (!logger) {
        return MiddlewareResult::Continue;
    }

    auto now = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(now - ctx.start_time);

    LOG_REQUEST(logger, http::to_string(ctx.request->method), ctx.request->path,
                static_cast<uint16_t>(ctx.response->status), duration.count(), ctx.correlation_id);

    return MiddlewareResult::Continue;
}

// Pipeline implementation

void Pipeline::use(std::unique_ptr<Middleware> middleware) {
    middleware_.push_back(std::move(middleware));
}

void Pipeline::use(MiddlewareFunc func, std::string_view name) {
    middleware_.push_back(std::make_unique<FunctionMiddleware>(std::move(func), std::string(name)));
}

Middleware* Pipeline::find(std::string_view name) const noexcept {
    for (const auto& middleware : middleware_) {
        if (middleware->name() == name) {
            return middleware.get();
        }
    }
    return nullptr;
}

MiddlewareResult Pipeline::execute_request(RequestContext& ctx) {
    for (auto& middleware : middleware_) {
        MiddlewareResult result = middleware->process_request(ctx);

        if (result == MiddlewareResult::Stop) {
            return MiddlewareResult::Stop;
        }

        if (result == MiddlewareResult::Error || ctx.has_error) {
            return MiddlewareResult::Error;
        }
    }

    return MiddlewareResult::Continue;
}

MiddlewareResult Pipeline::execute_response(ResponseContext& ctx) {
    for (auto& middleware : middleware_) {
        MiddlewareResult result = middleware->process_response(ctx);

        if (result == MiddlewareResult::Stop) {
            return MiddlewareResult::Stop;
        }

        if (result == MiddlewareResult::Error) {
            return MiddlewareResult::Error;
        }
    }

    return MiddlewareResult::Continue;
}

}  // namespace csrfguard::gateway
