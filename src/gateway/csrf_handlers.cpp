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

// csrfguard CSRF Strategies - Implementation

#include "csrf_handlers.hpp"

namespace csrfguard::gateway {

void ForbiddenBlockedHandler::handle(const http::Request& request,
                                     http::Response& response) const {
    (void)request;

    response.status = http::StatusCode::Forbidden;
    response.headers.clear();
    response.body_filters.clear();
    response.body = std::string(BODY);
    response.set_content_type("text/plain");
    response.set_content_length(response.body.size());
}

void RedirectBlockedHandler::handle(const http::Request& request, http::Response& response) const {
    (void)request;

    response.status = http::StatusCode::Found;
    response.headers.clear();
    response.body_filters.clear();
    response.body.clear();
    response.set_header("Location", location_);
    response.set_content_length(0);
}

bool PathPrefixWhitelist::is_whitelisted(const http::Request& request) const {
    const std::string_view path = request.path;

    for (const auto& prefix : prefixes_) {
        if (prefix.empty() || !path.starts_with(prefix)) {
            continue;
        }
        // Match whole path segments only
        if (path.size() == prefix.size() || prefix.back() == '/' || path[prefix.size()] == '/') {
            return true;
        }
    }
    return false;
}

}  // namespace csrfguard::gateway
