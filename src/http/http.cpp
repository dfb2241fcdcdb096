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

// csrfguard HTTP Protocol - Implementation

#include "http.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <string>

#include "../core/string_utils.hpp"

namespace csrfguard::http {

namespace {

/// Strip the ":port" suffix from an authority ("[v6]:port" keeps the brackets)
[[nodiscard]] std::string_view strip_port(std::string_view authority) noexcept {
    if (!authority.empty() && authority.front() == '[') {
        auto close = authority.find(']');
        return close == std::string_view::npos ? authority : authority.substr(0, close + 1);
    }

    auto colon = authority.find(':');
    return colon == std::string_view::npos ? authority : authority.substr(0, colon);
}

}  // namespace

// Request helper methods

const Header* Request::find_header(std::string_view name) const noexcept {
    for (const auto& header : headers) {
        if (header_name_equals(header.name, name)) {
            return &header;
        }
    }
    return nullptr;
}

std::string_view Request::get_header(std::string_view name,
                                     std::string_view default_value) const noexcept {
    const Header* header = find_header(name);
    return header ? header->value : default_value;
}

bool Request::has_header(std::string_view name) const noexcept {
    return find_header(name) != nullptr;
}

size_t Request::content_length() const noexcept {
    auto value = get_header("Content-Length", "0");
    size_t length = 0;
    std::from_chars(value.data(), value.data() + value.size(), length);
    return length;
}

std::string_view Request::content_type() const noexcept {
    return get_header("Content-Type");
}

std::string_view Request::host() const noexcept {
    auto host_header = get_header("Host");
    if (!host_header.empty()) {
        return strip_port(host_header);
    }

    // Absolute-form request target: scheme://authority/path
    auto scheme_end = uri.find("://");
    if (scheme_end == std::string_view::npos) {
        return {};
    }

    auto authority = uri.substr(scheme_end + 3);
    auto authority_end = authority.find_first_of("/?#");
    if (authority_end != std::string_view::npos) {
        authority = authority.substr(0, authority_end);
    }

    // Drop userinfo
    auto at = authority.rfind('@');
    if (at != std::string_view::npos) {
        authority = authority.substr(at + 1);
    }

    return strip_port(authority);
}

// Response helper methods

std::string_view Response::get_header(std::string_view name,
                                      std::string_view default_value) const noexcept {
    for (const auto& [hdr_name, hdr_value] : headers) {
        if (header_name_equals(hdr_name, name)) {
            return hdr_value;
        }
    }
    return default_value;
}

bool Response::has_header(std::string_view name) const noexcept {
    return std::any_of(headers.begin(), headers.end(),
                       [name](const auto& pair) { return header_name_equals(pair.first, name); });
}

void Response::add_header(std::string_view name, std::string_view value) {
    headers.emplace_back(std::string(name), std::string(value));
}

void Response::set_header(std::string_view name, std::string_view value) {
    for (auto& [hdr_name, hdr_value] : headers) {
        if (header_name_equals(hdr_name, name)) {
            hdr_value = std::string(value);
            return;
        }
    }
    add_header(name, value);
}

bool Response::remove_header(std::string_view name) {
    auto it = std::remove_if(headers.begin(), headers.end(), [name](const auto& pair) {
        return header_name_equals(pair.first, name);
    });
    if (it == headers.end()) {
        return false;
    }
    headers.erase(it, headers.end());
    return true;
}

void Response::set_content_length(size_t length) {
    char buffer[32];
    auto result = std::to_chars(buffer, buffer + sizeof(buffer), length);
    set_header("Content-Length", std::string_view(buffer, result.ptr - buffer));
}

void Response::set_content_type(std::string_view content_type) {
    set_header("Content-Type", content_type);
}

void Response::add_body_filter(std::unique_ptr<BodyFilter> filter) {
    body_filters.push_back(std::move(filter));
}

std::string Response::write_chunk(std::string_view chunk) {
    std::string data(chunk);
    for (auto& filter : body_filters) {
        data = filter->filter(std::string_view(data));
    }
    return data;
}

std::string Response::finish_body() {
    // Trailing output of filter N is still a chunk for filter N+1
    std::string carry;
    for (auto& filter : body_filters) {
        std::string out;
        if (!carry.empty()) {
            out = filter->filter(std::string_view(carry));
        }
        out += filter->filter(std::nullopt);
        carry = std::move(out);
    }
    return carry;
}

std::string Response::render_body() {
    if (body_filters.empty()) {
        return body;
    }

    std::string out = write_chunk(body);
    out += finish_body();
    return out;
}

// Conversion functions

std::string_view to_string(Method method) noexcept {
    switch (method) {
        case Method::GET:
            return "GET";
        case Method::POST:
            return "POST";
        case Method::PUT:
            return "PUT";
        case Method::DELETE:
            return "DELETE";
        case Method::HEAD:
            return "HEAD";
        case Method::OPTIONS:
            return "OPTIONS";
        case Method::PATCH:
            return "PATCH";
        case Method::CONNECT:
            return "CONNECT";
        case Method::TRACE:
            return "TRACE";
        case Method::UNKNOWN:
            return "UNKNOWN";
    }
    return "UNKNOWN";
}

Method parse_method(std::string_view str) noexcept {
    if (core::iequals(str, "GET"))
        return Method::GET;
    if (core::iequals(str, "POST"))
        return Method::POST;
    if (core::iequals(str, "PUT"))
        return Method::PUT;
    if (core::iequals(str, "DELETE"))
        return Method::DELETE;
    if (core::iequals(str, "HEAD"))
        return Method::HEAD;
    if (core::iequals(str, "OPTIONS"))
        return Method::OPTIONS;
    if (core::iequals(str, "PATCH"))
        return Method::PATCH;
    if (core::iequals(str, "CONNECT"))
        return Method::CONNECT;
    if (core::iequals(str, "TRACE"))
        return Method::TRACE;
    return Method::UNKNOWN;
}

std::string_view to_reason_phrase(StatusCode code) noexcept {
    switch (code) {
        case StatusCode::OK:
            return "OK";
        case StatusCode::Created:
            return "Created";
        case StatusCode::NoContent:
            return "No Content";
        case StatusCode::MovedPermanently:
            return "Moved Permanently";
        case StatusCode::Found:
            return "Found";
        case StatusCode::SeeOther:
            return "See Other";
        case StatusCode::NotModified:
            return "Not Modified";
        case StatusCode::TemporaryRedirect:
            return "Temporary Redirect";
        case StatusCode::BadRequest:
            return "Bad Request";
        case StatusCode::Unauthorized:
            return "Unauthorized";
        case StatusCode::Forbidden:
            return "Forbidden";
        case StatusCode::NotFound:
            return "Not Found";
        case StatusCode::MethodNotAllowed:
            return "Method Not Allowed";
        case StatusCode::InternalServerError:
            return "Internal Server Error";
        case StatusCode::NotImplemented:
            return "Not Implemented";
        case StatusCode::BadGateway:
            return "Bad Gateway";
        case StatusCode::ServiceUnavailable:
            return "Service Unavailable";
    }
    return "Unknown";
}

bool header_name_equals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }

    return std::equal(a.begin(), a.end(), b.begin(), [](char ca, char cb) {
        return std::tolower(static_cast<unsigned char>(ca)) ==
               std::tolower(static_cast<unsigned char>(cb));
    });
}

}  // namespace csrfguard::http
