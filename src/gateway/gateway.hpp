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

// csrfguard Gateway - Header
// Runs the pipeline around the wrapped application

#pragma once

#include <functional>

#include "../http/http.hpp"
#include "../session/session.hpp"
#include "pipeline.hpp"

namespace csrfguard::gateway {

/// The wrapped application: fills in the response for a request
using Application = std::function<void(const http::Request&, http::Response&)>;

class Gateway {
public:
    Gateway(Pipeline pipeline, Application app)
        : pipeline_(std::move(pipeline)), app_(std::move(app)) {}

    // Non-copyable, movable
    Gateway(const Gateway&) = delete;
    Gateway& operator=(const Gateway&) = delete;
    Gateway(Gateway&&) noexcept = default;
    Gateway& operator=(Gateway&&) noexcept = default;

    /// Handle one request. The application runs only if every request-phase
    /// middleware continues. The response body is produced afterwards through
    /// response.render_body() or write_chunk()/finish_body().
    [[nodiscard]] MiddlewareResult handle(const http::Request& request, http::Response& response,
                                          session::Session* session);

    [[nodiscard]] Pipeline& pipeline() noexcept { return pipeline_; }

private:
    Pipeline pipeline_;
    Application app_;
};

}  // namespace csrfguard::gateway
