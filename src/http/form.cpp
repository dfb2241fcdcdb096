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

// csrfguard Form Body Parsing - Implementation

#include "form.hpp"

#include "../core/string_utils.hpp"
#include "http.hpp"
#include "regex.hpp"

namespace csrfguard::http::form {

namespace {

/// Value of a ';'-separated header parameter (quoted-string or token)
/// e.g. find_parameter("form-data; name=\"SEC\"", "name") -> "SEC"
std::optional<std::string> find_parameter(std::string_view header_value, std::string_view wanted) {
    size_t pos = header_value.find(';');

    while (pos != std::string_view::npos && pos < header_value.size()) {
        ++pos;  // ';'
        while (pos < header_value.size() && core::is_space_ascii(header_value[pos])) {
            ++pos;
        }

        const size_t name_start = pos;
        while (pos < header_value.size() && header_value[pos] != '=' && header_value[pos] != ';') {
            ++pos;
        }
        const auto name = core::trim(header_value.substr(name_start, pos - name_start));
        if (pos >= header_value.size()) {
            break;
        }
        if (header_value[pos] == ';') {
            continue;  // parameter without a value
        }

        ++pos;  // '='
        while (pos < header_value.size() && core::is_space_ascii(header_value[pos])) {
            ++pos;
        }

        std::string value;
        if (pos < header_value.size() && header_value[pos] == '"') {
            ++pos;
            while (pos < header_value.size() && header_value[pos] != '"') {
                if (header_value[pos] == '\\' && pos + 1 < header_value.size()) {
                    ++pos;
                }
                value += header_value[pos++];
            }
            pos = header_value.find(';', pos);
        } else {
            const size_t end = header_value.find(';', pos);
            value = std::string(core::trim(header_value.substr(pos, end - pos)));
            pos = end;
        }

        if (core::iequals(name, wanted)) {
            return value;
        }
    }

    return std::nullopt;
}

/// Media type without parameters, e.g. "multipart/form-data"
std::string_view media_type(std::string_view content_type) noexcept {
    return core::trim(content_type.substr(0, content_type.find(';')));
}

std::string decode_component(std::string_view raw) {
    auto decoded = url::decode(raw);
    return decoded ? std::move(*decoded) : std::string(raw);
}

}  // namespace

std::optional<std::string_view> FormParameters::get(std::string_view name) const noexcept {
    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
        if (it->first == name) {
            return std::string_view(it->second);
        }
    }
    return std::nullopt;
}

FormParameters parse_urlencoded(std::string_view body) {
    FormParameters params;

    while (!body.empty()) {
        const size_t separator = body.find_first_of("&;");
        const auto pair = body.substr(0, separator);
        body = separator == std::string_view::npos ? std::string_view{} : body.substr(separator + 1);

        if (pair.empty()) {
            continue;
        }

        const size_t equals = pair.find('=');
        if (equals == std::string_view::npos) {
            params.add(decode_component(pair), std::string());
        } else {
            params.add(decode_component(pair.substr(0, equals)),
                       decode_component(pair.substr(equals + 1)));
        }
    }

    return params;
}

FormParameters parse_multipart(std::string_view body, std::string_view boundary) {
    FormParameters params;
    if (boundary.empty()) {
        return params;
    }

    const std::string delimiter = "--" + std::string(boundary);
    const std::string next_delimiter = "\n" + delimiter;

    // Skip the preamble
    size_t pos = 0;
    if (!body.starts_with(delimiter)) {
        pos = body.find(next_delimiter);
        if (pos == std::string_view::npos) {
            return params;
        }
        ++pos;
    }

    while (true) {
        pos += delimiter.size();
        if (body.substr(pos, 2) == "--") {
            break;  // close delimiter
        }

        // Rest of the delimiter line (transport padding)
        size_t eol = body.find('\n', pos);
        if (eol == std::string_view::npos) {
            break;
        }
        pos = eol + 1;

        // Part headers, terminated by an empty line
        std::string_view disposition;
        bool headers_complete = false;
        while (!headers_complete) {
            const size_t line_end = body.find('\n', pos);
            if (line_end == std::string_view::npos) {
                return params;
            }
            auto line = body.substr(pos, line_end - pos);
            if (!line.empty() && line.back() == '\r') {
                line.remove_suffix(1);
            }
            pos = line_end + 1;

            if (line.empty()) {
                headers_complete = true;
                continue;
            }

            const size_t colon = line.find(':');
            if (colon != std::string_view::npos &&
                core::iequals(core::trim(line.substr(0, colon)), "Content-Disposition")) {
                disposition = core::trim(line.substr(colon + 1));
            }
        }

        // Part content runs up to the line break before the next delimiter
        const size_t next = body.find(next_delimiter, pos);
        if (next == std::string_view::npos) {
            break;  // truncated body: the part is incomplete
        }
        size_t content_end = next;
        if (content_end > pos && body[content_end - 1] == '\r') {
            --content_end;
        }

        if (core::istarts_with(disposition, "form-data")) {
            auto name = find_parameter(disposition, "name");
            auto filename = find_parameter(disposition, "filename");
            if (name && !filename) {
                params.add(std::move(*name), std::string(body.substr(pos, content_end - pos)));
            }
        }

        pos = next + 1;
    }

    return params;
}

std::optional<std::string> extract_boundary(std::string_view content_type) {
    auto boundary = find_parameter(content_type, "boundary");
    if (!boundary || boundary->empty()) {
        return std::nullopt;
    }
    return boundary;
}

FormParameters parse_body_parameters(const Request& request) {
    const auto content_type = request.content_type();
    const auto media = media_type(content_type);

    if (core::iequals(media, "application/x-www-form-urlencoded")) {
        return parse_urlencoded(request.body_view());
    }

    if (core::iequals(media, "multipart/form-data")) {
        if (auto boundary = extract_boundary(content_type)) {
            return parse_multipart(request.body_view(), *boundary);
        }
    }

    return {};
}

}  // namespace csrfguard::http::form
