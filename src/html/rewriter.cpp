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

// csrfguard HTML Rewriter - Implementation

#include "rewriter.hpp"

#include <fmt/format.h>

#include "../core/logging.hpp"
#include "../core/string_utils.hpp"
#include "../http/regex.hpp"

namespace csrfguard::html {

namespace {

// Host must be followed by '/' or ':'; "http://host" alone does not match
constexpr std::string_view ABSOLUTE_ACTION_PATTERN = "^https?://([^/:]+)[/:]";

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};

const http::Regex* absolute_action_regex() {
    static const std::optional<http::Regex> regex = http::Regex::compile(ABSOLUTE_ACTION_PATTERN);
    return regex ? &*regex : nullptr;
}

}  // namespace

HtmlRewriter::HtmlRewriter(RewriteOptions options)
    : options_(std::move(options)),
      meta_markup_(meta_fragment(options_.meta_name, options_.token)),
      input_markup_(hidden_input_fragment(options_.parameter_name, options_.token)) {}

std::string HtmlRewriter::meta_fragment(std::string_view meta_name, std::string_view token) {
    return fmt::format("<meta name=\"{}\" content=\"{}\"/>", meta_name, token);
}

std::string HtmlRewriter::hidden_input_fragment(std::string_view parameter_name,
                                                std::string_view token) {
    return fmt::format("<input type=\"hidden\" name=\"{}\" value=\"{}\" />", parameter_name, token);
}

bool HtmlRewriter::is_cross_origin_action(std::string_view action, std::string_view request_host) {
    const http::Regex* regex = absolute_action_regex();
    if (regex == nullptr) {
        if (auto* logger = logging::get_current_logger()) {
            LOG_ERROR(logger, "CSRF rewriter: failed to compile pattern {}",
                      ABSOLUTE_ACTION_PATTERN);
        }
        return false;
    }

    auto groups = regex->extract_groups(action);
    if (groups.size() < 2) {
        return false;  // relative, protocol-relative or otherwise unrecognized
    }
    return groups[1] != request_host;
}

std::string HtmlRewriter::filter(std::optional<std::string_view> chunk) {
    return chunk ? write(*chunk) : finish();
}

std::string HtmlRewriter::write(std::string_view chunk) {
    if (closed_) {
        return {};
    }

    tokens_.clear();
    tokenizer_.feed(chunk, tokens_);
    for (auto& token : tokens_) {
        handle_token(token);
    }
    return render();
}

std::string HtmlRewriter::finish() {
    if (closed_) {
        return {};
    }

    tokens_.clear();
    tokenizer_.finish(tokens_);
    for (auto& token : tokens_) {
        handle_token(token);
    }
    closed_ = true;

    if (auto* logger = logging::get_current_logger()) {
        LOG_DEBUG(logger, "CSRF rewrite finished: forms_injected={}, meta_injected={}",
                  forms_injected_, meta_injected_);
    }
    return render();
}

void HtmlRewriter::handle_token(HtmlToken& token) {
    const bool is_start_tag = token.type == HtmlTokenType::StartTag;

    // Original bytes first, insertions go right after the tag
    if (!items_.empty() && std::holds_alternative<PassThrough>(items_.back())) {
        std::get<PassThrough>(items_.back()).bytes.append(token.raw);
    } else {
        items_.emplace_back(PassThrough{std::move(token.raw)});
    }

    if (!is_start_tag) {
        return;
    }

    if (token.name == "head") {
        if (options_.add_meta && !meta_injected_) {
            items_.emplace_back(InsertMeta{});
            meta_injected_ = true;
        }
    } else if (token.name == "form") {
        if (wants_hidden_input(token)) {
            items_.emplace_back(InsertHiddenInput{});
            ++forms_injected_;
        }
    }
}

bool HtmlRewriter::wants_hidden_input(const HtmlToken& form) const {
    const HtmlAttribute* method = form.find_attribute("method");
    if (method == nullptr || !core::icontains(method->value, "post")) {
        return false;
    }

    const HtmlAttribute* action = form.find_attribute("action");
    if (action != nullptr && is_cross_origin_action(action->value, options_.request_host)) {
        if (auto* logger = logging::get_current_logger()) {
            LOG_DEBUG(logger, "CSRF rewrite: skipping cross-origin form action={}", action->value);
        }
        return false;
    }
    return true;
}

std::string HtmlRewriter::render() {
    size_t size = 0;
    for (const auto& item : items_) {
        size += std::visit(overloaded{
                               [](const PassThrough& pass) { return pass.bytes.size(); },
                               [this](const InsertMeta&) { return meta_markup_.size(); },
                               [this](const InsertHiddenInput&) { return input_markup_.size(); },
                           },
                           item);
    }

    std::string out;
    out.reserve(size);
    for (const auto& item : items_) {
        std::visit(overloaded{
                       [&out](const PassThrough& pass) { out += pass.bytes; },
                       [this, &out](const InsertMeta&) { out += meta_markup_; },
                       [this, &out](const InsertHiddenInput&) { out += input_markup_; },
                   },
                   item);
    }

    items_.clear();
    return out;
}

}  // namespace csrfguard::html
