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

// csrfguard HTML Rewriter - Header
// Streaming body filter that injects the CSRF token into POST forms and <head>

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "../http/http.hpp"
#include "tokenizer.hpp"

namespace csrfguard::html {

/// Everything the rewriter needs, resolved before the first chunk
struct RewriteOptions {
    std::string token;
    std::string parameter_name = "SEC";
    std::string meta_name = "csrftoken";
    bool add_meta = false;
    std::string request_host;  // without port
};

/// One rewriter per response body; not reusable
class HtmlRewriter final : public http::BodyFilter {
public:
    explicit HtmlRewriter(RewriteOptions options);

    /// Rewrite the next chunk. Bytes of an unfinished tag are held back.
    [[nodiscard]] std::string write(std::string_view chunk);

    /// End of stream: flush held-back bytes and close
    [[nodiscard]] std::string finish();

    // BodyFilter
    [[nodiscard]] std::string filter(std::optional<std::string_view> chunk) override;

    [[nodiscard]] bool closed() const noexcept { return closed_; }
    [[nodiscard]] size_t forms_injected() const noexcept { return forms_injected_; }
    [[nodiscard]] bool meta_injected() const noexcept { return meta_injected_; }
    [[nodiscard]] const RewriteOptions& options() const noexcept { return options_; }

    /// True if action is an absolute http(s) URL whose host differs from request_host.
    /// Protocol-relative and bare-host URLs are not recognized.
    [[nodiscard]] static bool is_cross_origin_action(std::string_view action,
                                                     std::string_view request_host);

    /// The exact markup inserted after <head>
    [[nodiscard]] static std::string meta_fragment(std::string_view meta_name,
                                                   std::string_view token);

    /// The exact markup inserted after a POST <form> tag
    [[nodiscard]] static std::string hidden_input_fragment(std::string_view parameter_name,
                                                           std::string_view token);

private:
    // Output items of one chunk
    struct PassThrough {
        std::string bytes;
    };
    struct InsertMeta {};
    struct InsertHiddenInput {};
    using OutputItem = std::variant<PassThrough, InsertMeta, InsertHiddenInput>;

    void handle_token(HtmlToken& token);
    [[nodiscard]] bool wants_hidden_input(const HtmlToken& form) const;
    [[nodiscard]] std::string render();

    RewriteOptions options_;
    std::string meta_markup_;
    std::string input_markup_;

    HtmlTokenizer tokenizer_;
    std::vector<HtmlToken> tokens_;
    std::vector<OutputItem> items_;

    size_t forms_injected_ = 0;
    bool meta_injected_ = false;
    bool closed_ = false;
};

}  // namespace csrfguard::html
