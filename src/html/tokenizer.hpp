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

// csrfguard HTML Tokenizer - Header
// Incremental, error-tolerant HTML tokenizer. Input may be split at any byte;
// the raw bytes of all emitted tokens always concatenate to the input.

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace csrfguard::html {

enum class HtmlTokenType : uint8_t {
    Text,
    StartTag,
    EndTag,
    Comment,
    Declaration,           // <!DOCTYPE ...>, <![CDATA[ ... ]>
    ProcessingInstruction  // <? ... >
};

struct HtmlAttribute {
    std::string name;   // lowercased
    std::string value;  // raw, without quotes
    bool has_value = false;
};

struct HtmlToken {
    HtmlTokenType type = HtmlTokenType::Text;

    // Exact input bytes of this token
    std::string raw;

    // Tags only
    std::string name;  // lowercased
    std::vector<HtmlAttribute> attributes;
    bool self_closing = false;

    /// First attribute with this (lowercase) name, as browsers resolve duplicates
    [[nodiscard]] const HtmlAttribute* find_attribute(std::string_view attr_name) const noexcept;
};

/// Push-driven tokenizer; one instance per document
class HtmlTokenizer {
public:
    /// Longer tag or attribute names are not markup
    static constexpr size_t MAX_NAME_LENGTH = 64;

    /// A construct still open after this many bytes has its buffered bytes
    /// forwarded as text while parsing continues; also caps attribute values
    static constexpr size_t MAX_TAG_LENGTH = 64 * 1024;

    /// Further attributes of a tag are parsed but not recorded
    static constexpr size_t MAX_ATTRIBUTES = 256;

    /// Tokenize the next chunk; completed tokens are appended to out.
    /// An incomplete construct at the end of the chunk is kept for the next call.
    void feed(std::string_view chunk, std::vector<HtmlToken>& out);

    /// End of input: anything still buffered is emitted as text.
    /// Later feed() calls are ignored.
    void finish(std::vector<HtmlToken>& out);

    [[nodiscard]] bool finished() const noexcept { return finished_; }

    /// Bytes held back waiting for the rest of a construct
    [[nodiscard]] size_t buffered() const noexcept { return pending_.size(); }

private:
    enum class State : uint8_t {
        Text,
        TagOpen,               // after '<'
        EndTagOpen,            // after "</"
        TagName,
        BeforeAttrName,        // inside the tag, between attributes
        AttrName,
        AfterAttrName,         // waiting for '='
        BeforeAttrValue,       // after '='
        AttrValueQuoted,
        AttrValueUnquoted,
        SelfClosing,           // found '/', waiting for '>'
        MarkupDeclaration,     // after "<!"
        Comment,
        Declaration,
        ProcessingInstruction,
        RawText,               // inside <script>, <style>, <textarea>, <title>, ...
        RawTextEndTag,         // '<' seen inside raw text
        PlainText,             // after <plaintext>: text until end of stream
    };

    /// Handle one byte in a markup state; false means "reprocess in the new state"
    bool consume(char c, std::vector<HtmlToken>& out);

    void begin_tag(HtmlTokenType type, char first);
    void commit_attribute();
    void emit_tag(std::vector<HtmlToken>& out);
    void emit_markup(HtmlTokenType type, std::vector<HtmlToken>& out);

    /// Give up on the current construct: its bytes become text
    void flush_pending_as_text(std::vector<HtmlToken>& out, State next);

    static void emit_text(std::string_view text, std::vector<HtmlToken>& out);

    State state_ = State::Text;
    bool finished_ = false;

    // Raw bytes of the construct being parsed
    std::string pending_;

    HtmlToken tag_;
    HtmlAttribute attr_;
    char quote_ = 0;

    // "<!-" prefix progress, then consecutive '-' inside a comment
    unsigned dashes_ = 0;

    // Element whose end tag terminates raw text, and match progress of "/name"
    std::string raw_text_element_;
    size_t end_tag_match_ = 0;
};

}  // namespace csrfguard::html
