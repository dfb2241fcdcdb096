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

// csrfguard HTML Tokenizer - Implementation

#include "tokenizer.hpp"

#include "../core/string_utils.hpp"

namespace csrfguard::html {

namespace {

[[nodiscard]] constexpr bool is_alpha_ascii(char c) noexcept {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

// Elements whose contents are never markup, up to the matching end tag
[[nodiscard]] bool is_raw_text_element(std::string_view name) noexcept {
    return name == "script" || name == "style" || name == "textarea" || name == "title" ||
           name == "xmp" || name == "iframe";
}

}  // namespace

const HtmlAttribute* HtmlToken::find_attribute(std::string_view attr_name) const noexcept {
    for (const auto& attr : attributes) {
        if (attr.name == attr_name) {
            return &attr;
        }
    }
    return nullptr;
}

void HtmlTokenizer::feed(std::string_view chunk, std::vector<HtmlToken>& out) {
    if (finished_) {
        return;
    }

    size_t i = 0;
    while (i < chunk.size()) {
        if (state_ == State::PlainText) {
            emit_text(chunk.substr(i), out);
            return;
        }

        if (state_ == State::Text || state_ == State::RawText) {
            // Fast path: everything up to the next '<' is text
            const auto lt = chunk.find('<', i);
            if (lt == std::string_view::npos) {
                emit_text(chunk.substr(i), out);
                return;
            }
            if (lt > i) {
                emit_text(chunk.substr(i, lt - i), out);
            }

            pending_.assign(1, '<');
            if (state_ == State::Text) {
                state_ = State::TagOpen;
            } else {
                state_ = State::RawTextEndTag;
                end_tag_match_ = 0;
            }
            i = lt + 1;
            continue;
        }

        if (consume(chunk[i], out)) {
            ++i;
        }

        if (pending_.size() > MAX_TAG_LENGTH) {
            if (state_ == State::Comment) {
                // Comments may be arbitrarily long: forward what we have, stay inside
                const unsigned dashes = dashes_;
                emit_markup(HtmlTokenType::Comment, out);
                state_ = State::Comment;
                dashes_ = dashes;
            } else {
                // Forward the bytes but stay inside the construct; a tag keeps its
                // name and attributes and is emitted with the remaining raw bytes
                emit_text(pending_, out);
                pending_.clear();
            }
        }
    }
}

void HtmlTokenizer::finish(std::vector<HtmlToken>& out) {
    if (finished_) {
        return;
    }

    if (!pending_.empty()) {
        flush_pending_as_text(out, State::Text);
    }
    state_ = State::Text;
    finished_ = true;
}

bool HtmlTokenizer::consume(char c, std::vector<HtmlToken>& out) {
    switch (state_) {
        case State::Text:
        case State::RawText:
        case State::PlainText:
            // Handled by the fast path in feed()
            return false;

        case State::TagOpen:
            if (is_alpha_ascii(c)) {
                begin_tag(HtmlTokenType::StartTag, c);
                return true;
            }
            if (c == '/') {
                pending_ += c;
                state_ = State::EndTagOpen;
                return true;
            }
            if (c == '!') {
                pending_ += c;
                dashes_ = 0;
                state_ = State::MarkupDeclaration;
                return true;
            }
            if (c == '?') {
                pending_ += c;
                state_ = State::ProcessingInstruction;
                return true;
            }
            // Lone '<'
            flush_pending_as_text(out, State::Text);
            return false;

        case State::EndTagOpen:
            if (is_alpha_ascii(c)) {
                begin_tag(HtmlTokenType::EndTag, c);
                return true;
            }
            flush_pending_as_text(out, State::Text);
            return false;

        case State::TagName:
            if (core::is_space_ascii(c)) {
                pending_ += c;
                state_ = State::BeforeAttrName;
                return true;
            }
            if (c == '/') {
                pending_ += c;
                state_ = State::SelfClosing;
                return true;
            }
            if (c == '>') {
                pending_ += c;
                emit_tag(out);
                return true;
            }
            if (tag_.name.size() >= MAX_NAME_LENGTH) {
                flush_pending_as_text(out, State::Text);
                return false;
            }
            tag_.name += core::to_lower_ascii(c);
            pending_ += c;
            return true;

        case State::BeforeAttrName:
            pending_ += c;
            if (core::is_space_ascii(c)) {
                return true;
            }
            if (c == '>') {
                emit_tag(out);
            } else if (c == '/') {
                state_ = State::SelfClosing;
            } else {
                attr_ = HtmlAttribute{};
                attr_.name += core::to_lower_ascii(c);
                state_ = State::AttrName;
            }
            return true;

        case State::AttrName:
            pending_ += c;
            if (core::is_space_ascii(c)) {
                state_ = State::AfterAttrName;
            } else if (c == '=') {
                state_ = State::BeforeAttrValue;
            } else if (c == '>') {
                commit_attribute();
                emit_tag(out);
            } else if (c == '/') {
                commit_attribute();
                state_ = State::SelfClosing;
            } else if (attr_.name.size() < MAX_NAME_LENGTH) {
                attr_.name += core::to_lower_ascii(c);
            }
            return true;

        case State::AfterAttrName:
            pending_ += c;
            if (core::is_space_ascii(c)) {
                return true;
            }
            if (c == '=') {
                state_ = State::BeforeAttrValue;
            } else if (c == '>') {
                commit_attribute();
                emit_tag(out);
            } else if (c == '/') {
                commit_attribute();
                state_ = State::SelfClosing;
            } else {
                // Valueless attribute followed by another one
                commit_attribute();
                attr_.name += core::to_lower_ascii(c);
                state_ = State::AttrName;
            }
            return true;

        case State::BeforeAttrValue:
            pending_ += c;
            if (core::is_space_ascii(c)) {
                return true;
            }
            attr_.has_value = true;
            if (c == '"' || c == '\'') {
                quote_ = c;
                state_ = State::AttrValueQuoted;
            } else if (c == '>') {
                commit_attribute();
                emit_tag(out);
            } else {
                attr_.value += c;
                state_ = State::AttrValueUnquoted;
            }
            return true;

        case State::AttrValueQuoted:
            pending_ += c;
            if (c == quote_) {
                commit_attribute();
                state_ = State::BeforeAttrName;
            } else if (attr_.value.size() < MAX_TAG_LENGTH) {
                attr_.value += c;
            }
            return true;

        case State::AttrValueUnquoted:
            pending_ += c;
            if (core::is_space_ascii(c)) {
                commit_attribute();
                state_ = State::BeforeAttrName;
            } else if (c == '>') {
                commit_attribute();
                emit_tag(out);
            } else if (attr_.value.size() < MAX_TAG_LENGTH) {
                attr_.value += c;
            }
            return true;

        case State::SelfClosing:
            if (c == '>') {
                pending_ += c;
                tag_.self_closing = true;
                emit_tag(out);
                return true;
            }
            // A stray '/' inside the tag
            state_ = State::BeforeAttrName;
            return false;

        case State::MarkupDeclaration:
            if (c == '-') {
                pending_ += c;
                if (++dashes_ == 2) {
                    dashes_ = 0;
                    state_ = State::Comment;
                }
                return true;
            }
            state_ = State::Declaration;
            return false;

        case State::Comment:
            pending_ += c;
            if (c == '-') {
                ++dashes_;
            } else if (c == '>' && dashes_ >= 2) {
                emit_markup(HtmlTokenType::Comment, out);
            } else {
                dashes_ = 0;
            }
            return true;

        case State::Declaration:
            pending_ += c;
            if (c == '>') {
                emit_markup(HtmlTokenType::Declaration, out);
            }
            return true;

        case State::ProcessingInstruction:
            pending_ += c;
            if (c == '>') {
                emit_markup(HtmlTokenType::ProcessingInstruction, out);
            }
            return true;

        case State::RawTextEndTag: {
            // pending_ holds '<' plus the matched part of "/name"
            const size_t expected = raw_text_element_.size() + 1;
            if (end_tag_match_ < expected) {
                const char want = end_tag_match_ == 0 ? '/' : raw_text_element_[end_tag_match_ - 1];
                if (core::to_lower_ascii(c) == want) {
                    pending_ += c;
                    ++end_tag_match_;
                    return true;
                }
                flush_pending_as_text(out, State::RawText);
                return false;
            }

            if (core::is_space_ascii(c) || c == '/' || c == '>') {
                // "</script" complete: continue as an ordinary end tag
                tag_ = HtmlToken{};
                tag_.type = HtmlTokenType::EndTag;
                tag_.name = raw_text_element_;
                raw_text_element_.clear();
                state_ = State::TagName;
                return false;
            }
            // "</scripts" and the like
            flush_pending_as_text(out, State::RawText);
            return false;
        }
    }
    return true;
}

void HtmlTokenizer::begin_tag(HtmlTokenType type, char first) {
    tag_ = HtmlToken{};
    tag_.type = type;
    tag_.name += core::to_lower_ascii(first);
    pending_ += first;
    state_ = State::TagName;
}

void HtmlTokenizer::commit_attribute() {
    if (!attr_.name.empty() && tag_.attributes.size() < MAX_ATTRIBUTES) {
        tag_.attributes.push_back(std::move(attr_));
    }
    attr_ = HtmlAttribute{};
    quote_ = 0;
}

void HtmlTokenizer::emit_tag(std::vector<HtmlToken>& out) {
    tag_.raw = std::move(pending_);
    pending_.clear();

    if (tag_.type == HtmlTokenType::StartTag && tag_.name == "plaintext") {
        state_ = State::PlainText;
    } else if (tag_.type == HtmlTokenType::StartTag && !tag_.self_closing &&
               is_raw_text_element(tag_.name)) {
        raw_text_element_ = tag_.name;
        state_ = State::RawText;
    } else {
        state_ = State::Text;
    }

    out.push_back(std::move(tag_));
    tag_ = HtmlToken{};
}

void HtmlTokenizer::emit_markup(HtmlTokenType type, std::vector<HtmlToken>& out) {
    HtmlToken token;
    token.type = type;
    token.raw = std::move(pending_);
    pending_.clear();
    out.push_back(std::move(token));

    dashes_ = 0;
    state_ = State::Text;
}

void HtmlTokenizer::flush_pending_as_text(std::vector<HtmlToken>& out, State next) {
    emit_text(pending_, out);
    pending_.clear();
    tag_ = HtmlToken{};
    attr_ = HtmlAttribute{};
    quote_ = 0;
    dashes_ = 0;
    end_tag_match_ = 0;
    state_ = next;
}

void HtmlTokenizer::emit_text(std::string_view text, std::vector<HtmlToken>& out) {
    if (text.empty()) {
        return;
    }
    // Adjacent text is merged into one token
    if (!out.empty() && out.back().type == HtmlTokenType::Text) {
        out.back().raw.append(text);
        return;
    }
    HtmlToken token;
    token.type = HtmlTokenType::Text;
    token.raw.assign(text);
    out.push_back(std::move(token));
}

}  // namespace csrfguard::html
