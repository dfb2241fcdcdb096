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

// csrfguard HTTP Protocol - Header
// Request views supplied by the host server, owned responses with streaming body filters

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace csrfguard::http {

/// HTTP methods
enum class Method : uint8_t {
    GET,
    POST,
    PUT,
    DELETE,
    HEAD,
    OPTIONS,
    PATCH,
    CONNECT,
    TRACE,
    UNKNOWN
};

/// HTTP status codes
enum class StatusCode : uint16_t {
    // 2xx Success
    OK = 200,
    Created = 201,
    NoContent = 204,

    // 3xx Redirection
    MovedPermanently = 301,
    Found = 302,
    SeeOther = 303,
    NotModified = 304,
    TemporaryRedirect = 307,

    // 4xx Client Error
    BadRequest = 400,
    Unauthorized = 401,
    Forbidden = 403,
    NotFound = 404,
    MethodNotAllowed = 405,

    // 5xx Server Error
    InternalServerError = 500,
    NotImplemented = 501,
    BadGateway = 502,
    ServiceUnavailable = 503,
};

/// HTTP header (name-value pair)
/// Both name and value are views into the request buffer (zero-copy)
struct Header {
    std::string_view name;
    std::string_view value;
};

/// HTTP request (zero-copy, all views into the host server's buffer)
struct Request {
    Method method = Method::UNKNOWN;

    std::string_view uri;
    std::string_view path;   // URI without query string
    std::string_view query;  // Query string (if present)

    std::vector<Header> headers;

    // Body (view into buffer). Never consumed by middleware, the application
    // can always read it again.
    std::span<const uint8_t> body;

    // Helper: Find header by name (case-insensitive)
    [[nodiscard]] const Header* find_header(std::string_view name) const noexcept;

    // Helper: Get header value or default
    [[nodiscard]] std::string_view get_header(std::string_view name,
                                              std::string_view default_value = {}) const noexcept;

    // Helper: Check if header exists
    [[nodiscard]] bool has_header(std::string_view name) const noexcept;

    // Content-Length helper
    [[nodiscard]] size_t content_length() const noexcept;

    // Content-Type helper (full value, parameters included)
    [[nodiscard]] std::string_view content_type() const noexcept;

    // Host of the request without port: Host header first, then the
    // authority of an absolute request URI
    [[nodiscard]] std::string_view host() const noexcept;

    // Body as text
    [[nodiscard]] std::string_view body_view() const noexcept {
        return {reinterpret_cast<const char*>(body.data()), body.size()};
    }
};

/// Streaming response body transform
/// One instance serves exactly one response body.
class BodyFilter {
public:
    virtual ~BodyFilter() = default;

    /// Transform the next chunk; std::nullopt signals end of stream.
    /// Returns the bytes to forward (possibly empty).
    [[nodiscard]] virtual std::string filter(std::optional<std::string_view> chunk) = 0;
};

/// HTTP response (owned, produced by the application or by middleware)
struct Response {
    StatusCode status = StatusCode::OK;

    // Owned headers, in insertion order
    std::vector<std::pair<std::string, std::string>> headers;

    // Buffered body as produced by the application
    std::string body;

    // Streaming filters applied to the body in installation order
    std::vector<std::unique_ptr<BodyFilter>> body_filters;

    // Helper: Get header value or default (case-insensitive)
    [[nodiscard]] std::string_view get_header(std::string_view name,
                                              std::string_view default_value = {}) const noexcept;

    // Helper: Check if header exists
    [[nodiscard]] bool has_header(std::string_view name) const noexcept;

    // Helper: Append a header (duplicates allowed)
    void add_header(std::string_view name, std::string_view value);

    // Helper: Replace the first header with this name, or append it
    void set_header(std::string_view name, std::string_view value);

    // Helper: Remove all headers with this name (case-insensitive)
    // Returns true if at least one header was removed
    bool remove_header(std::string_view name);

    // Helper: Set content length
    void set_content_length(size_t length);

    // Helper: Set content type
    void set_content_type(std::string_view content_type);

    // Install a streaming body filter (runs after the ones already installed)
    void add_body_filter(std::unique_ptr<BodyFilter> filter);

    // Push one body chunk through the filter chain
    [[nodiscard]] std::string write_chunk(std::string_view chunk);

    // Signal end of body to the filter chain and collect the trailing output
    [[nodiscard]] std::string finish_body();

    // Run the buffered body through the filter chain as a single chunk
    [[nodiscard]] std::string render_body();
};

// Conversion functions

/// Convert Method to string
[[nodiscard]] std::string_view to_string(Method method) noexcept;

/// Convert string to Method; ASCII case is ignored ("post" is POST)
[[nodiscard]] Method parse_method(std::string_view str) noexcept;

/// Convert StatusCode to reason phrase
[[nodiscard]] std::string_view to_reason_phrase(StatusCode code) noexcept;

/// Case-insensitive header name comparison
[[nodiscard]] bool header_name_equals(std::string_view a, std::string_view b) noexcept;

}  // namespace csrfguard::http
