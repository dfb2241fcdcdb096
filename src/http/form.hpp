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

// csrfguard Form Body Parsing - Header
// application/x-www-form-urlencoded and multipart/form-data parameters

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace csrfguard::http {
struct Request;
}

namespace csrfguard::http::form {

/// Decoded body parameters in body order
class FormParameters {
public:
    void add(std::string name, std::string value) {
        entries_.emplace_back(std::move(name), std::move(value));
    }

    /// Value of the parameter; the last one wins when repeated
    [[nodiscard]] std::optional<std::string_view> get(std::string_view name) const noexcept;

    [[nodiscard]] bool contains(std::string_view name) const noexcept { return get(name).has_value(); }

    [[nodiscard]] size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

    [[nodiscard]] const std::vector<std::pair<std::string, std::string>>& entries() const noexcept {
        return entries_;
    }

private:
    std::vector<std::pair<std::string, std::string>> entries_;
};

/// Parse "a=1&b=2" ('+' is a space; pairs with broken escapes keep their raw text)
[[nodiscard]] FormParameters parse_urlencoded(std::string_view body);

/// Parse a multipart/form-data body; file parts (with a filename) are skipped
[[nodiscard]] FormParameters parse_multipart(std::string_view body, std::string_view boundary);

/// The boundary parameter of a multipart Content-Type, quoted or bare
[[nodiscard]] std::optional<std::string> extract_boundary(std::string_view content_type);

/// Parameters of a POST body, chosen by Content-Type; unknown types yield none.
/// The request body is only read, never consumed.
[[nodiscard]] FormParameters parse_body_parameters(const Request& request);

}  // namespace csrfguard::http::form
