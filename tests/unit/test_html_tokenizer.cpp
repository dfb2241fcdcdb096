// csrfguard HTML Tokenizer Unit Tests

#include <catch2/catch_test_macros.hpp>
#include <string>
#include <vector>

#include "../../src/html/tokenizer.hpp"

using namespace csrfguard::html;

namespace {

std::vector<HtmlToken> tokenize(std::string_view input, size_t chunk_size = 0) {
    HtmlTokenizer tokenizer;
    std::vector<HtmlToken> tokens;
    if (chunk_size == 0) {
        tokenizer.feed(input, tokens);
    } else {
        for (size_t i = 0; i < input.size(); i += chunk_size) {
            tokenizer.feed(input.substr(i, chunk_size), tokens);
        }
    }
    tokenizer.finish(tokens);
    return tokens;
}

std::string concat_raw(const std::vector<HtmlToken>& tokens) {
    std::string out;
    for (const auto& token : tokens) {
        out += token.raw;
    }
    return out;
}

std::vector<std::string> start_tag_names(const std::vector<HtmlToken>& tokens) {
    std::vector<std::string> names;
    for (const auto& token : tokens) {
        if (token.type == HtmlTokenType::StartTag) {
            names.push_back(token.name);
        }
    }
    return names;
}

}  // namespace

TEST_CASE("Tokenizer - Start tag with attributes", "[html][tokenizer]") {
    auto tokens = tokenize(R"(<FORM Method="POST" action='/save' data-x=1 disabled>)");

    REQUIRE(tokens.size() == 1);
    const auto& form = tokens[0];
    REQUIRE(form.type == HtmlTokenType::StartTag);
    REQUIRE(form.name == "form");
    REQUIRE(form.attributes.size() == 4);

    REQUIRE(form.find_attribute("method") != nullptr);
    REQUIRE(form.find_attribute("method")->value == "POST");
    REQUIRE(form.find_attribute("action")->value == "/save");
    REQUIRE(form.find_attribute("data-x")->value == "1");

    const auto* disabled = form.find_attribute("disabled");
    REQUIRE(disabled != nullptr);
    REQUIRE_FALSE(disabled->has_value);
    REQUIRE(form.find_attribute("missing") == nullptr);
}

TEST_CASE("Tokenizer - First duplicate attribute wins", "[html][tokenizer]") {
    auto tokens = tokenize(R"(<form method="get" method="post">)");

    REQUIRE(tokens.size() == 1);
    REQUIRE(tokens[0].find_attribute("method")->value == "get");
}

TEST_CASE("Tokenizer - Token kinds", "[html][tokenizer]") {
    auto tokens = tokenize("<!DOCTYPE html><!-- note --><?xml version=\"1.0\"?><br/></p>text");

    REQUIRE(tokens.size() == 6);
    REQUIRE(tokens[0].type == HtmlTokenType::Declaration);
    REQUIRE(tokens[1].type == HtmlTokenType::Comment);
    REQUIRE(tokens[1].raw == "<!-- note -->");
    REQUIRE(tokens[2].type == HtmlTokenType::ProcessingInstruction);
    REQUIRE(tokens[3].type == HtmlTokenType::StartTag);
    REQUIRE(tokens[3].name == "br");
    REQUIRE(tokens[3].self_closing);
    REQUIRE(tokens[4].type == HtmlTokenType::EndTag);
    REQUIRE(tokens[4].name == "p");
    REQUIRE(tokens[5].type == HtmlTokenType::Text);
    REQUIRE(tokens[5].raw == "text");
}

TEST_CASE("Tokenizer - Attribute values keep '>' inside quotes", "[html][tokenizer]") {
    auto tokens = tokenize(R"(<form action="/a>b" method=post>x)");

    REQUIRE(tokens.size() == 2);
    REQUIRE(tokens[0].name == "form");
    REQUIRE(tokens[0].find_attribute("action")->value == "/a>b");
    REQUIRE(tokens[0].find_attribute("method")->value == "post");
    REQUIRE(tokens[1].raw == "x");
}

TEST_CASE("Tokenizer - Forms inside comments are not tags", "[html][tokenizer]") {
    auto tokens = tokenize("<!-- <form method=post> --><p>");

    REQUIRE(start_tag_names(tokens) == std::vector<std::string>{"p"});
}

TEST_CASE("Tokenizer - Script and style contents are raw text", "[html][tokenizer]") {
    const std::string input =
        "<script>if (a < b) { document.write('<form method=post>'); }</script>"
        "<style>p > a { }</STYLE >"
        "<form method=post>";

    auto tokens = tokenize(input);

    REQUIRE(start_tag_names(tokens) == std::vector<std::string>{"script", "style", "form"});
    REQUIRE(concat_raw(tokens) == input);

    size_t end_tags = 0;
    for (const auto& token : tokens) {
        if (token.type == HtmlTokenType::EndTag) {
            ++end_tags;
        }
    }
    REQUIRE(end_tags == 2);
}

TEST_CASE("Tokenizer - Textarea, title, xmp and iframe contents are raw text", "[html][tokenizer]") {
    for (std::string element : {"textarea", "title", "xmp", "iframe", "TextArea"}) {
        const std::string input =
            "<" + element + "><form method=\"post\"><b>x</b></" + element + "><form method=post>";

        auto tokens = tokenize(input);
        REQUIRE(concat_raw(tokens) == input);

        const auto names = start_tag_names(tokens);
        REQUIRE(names.size() == 2);
        REQUIRE(names[1] == "form");
        REQUIRE(tokens[1].type == HtmlTokenType::Text);
        REQUIRE(tokens[1].raw == "<form method=\"post\"><b>x</b>");
    }
}

TEST_CASE("Tokenizer - Plaintext runs to end of stream", "[html][tokenizer]") {
    const std::string input = "<p><plaintext><form method=post></plaintext><b>";

    for (size_t chunk_size : {0u, 1u, 5u}) {
        auto tokens = tokenize(input, chunk_size);
        REQUIRE(start_tag_names(tokens) == std::vector<std::string>{"p", "plaintext"});
        REQUIRE(tokens.back().type == HtmlTokenType::Text);
        REQUIRE(tokens.back().raw == "<form method=post></plaintext><b>");
        REQUIRE(concat_raw(tokens) == input);
    }
}

TEST_CASE("Tokenizer - Near-miss end tag stays inside script", "[html][tokenizer]") {
    auto tokens = tokenize("<script>x = '</scripts>'; <form method=post></script><p>");

    REQUIRE(start_tag_names(tokens) == std::vector<std::string>{"script", "p"});
}

TEST_CASE("Tokenizer - Malformed markup becomes text", "[html][tokenizer]") {
    SECTION("Lone less-than") {
        auto tokens = tokenize("a < b and c <= d");
        REQUIRE(tokens.size() == 1);
        REQUIRE(tokens[0].type == HtmlTokenType::Text);
        REQUIRE(tokens[0].raw == "a < b and c <= d");
    }

    SECTION("End tag without a name") {
        auto tokens = tokenize("</ >x");
        REQUIRE(tokens.size() == 1);
        REQUIRE(tokens[0].type == HtmlTokenType::Text);
    }

    SECTION("Unterminated tag at end of input") {
        auto tokens = tokenize("<p>hello <form method=\"post");
        REQUIRE(start_tag_names(tokens) == std::vector<std::string>{"p"});
        REQUIRE(tokens.back().type == HtmlTokenType::Text);
        REQUIRE(tokens.back().raw == "hello <form method=\"post");
    }

    SECTION("Over-long tag name") {
        const std::string input = "<" + std::string(100, 'x') + ">";
        auto tokens = tokenize(input);
        REQUIRE(start_tag_names(tokens).empty());
        REQUIRE(concat_raw(tokens) == input);
    }
}

TEST_CASE("Tokenizer - Over-long tag keeps its state", "[html][tokenizer]") {
    const std::string filler(HtmlTokenizer::MAX_TAG_LENGTH + 10, 'a');

    SECTION("Long attribute value") {
        const std::string input = "<div title=\"" + filler + "\"><p>";
        auto tokens = tokenize(input);
        REQUIRE(start_tag_names(tokens) == std::vector<std::string>{"div", "p"});
        REQUIRE(concat_raw(tokens) == input);
    }

    SECTION("Markup inside a long attribute value is not a tag") {
        const std::string input = "<div data-x=\"" + filler + "<form method=post>\"><p>";
        for (size_t chunk_size : {0u, 1000u, 4096u}) {
            auto tokens = tokenize(input, chunk_size);
            REQUIRE(start_tag_names(tokens) == std::vector<std::string>{"div", "p"});
            REQUIRE(concat_raw(tokens) == input);
        }
    }

    SECTION("Attributes before the long value survive") {
        const std::string input = "<form method=\"post\" data-x=\"" + filler + "\" id=f>";
        auto tokens = tokenize(input);
        REQUIRE(concat_raw(tokens) == input);

        const HtmlToken& form = tokens.back();
        REQUIRE(form.type == HtmlTokenType::StartTag);
        REQUIRE(form.name == "form");
        REQUIRE(form.raw.size() < input.size());
        REQUIRE(form.raw.back() == '>');
        REQUIRE(form.find_attribute("method")->value == "post");
        REQUIRE(form.find_attribute("id")->value == "f");
        REQUIRE(form.find_attribute("data-x")->value.size() == HtmlTokenizer::MAX_TAG_LENGTH);
    }
}

TEST_CASE("Tokenizer - Raw bytes reproduce the input for any chunking", "[html][tokenizer]") {
    const std::string input =
        "<!DOCTYPE html>\n<HTML><Head><title>t</title></head>\n"
        "<body class=main>\n<!-- c -- x -->\n"
        "<form METHOD='Post' action=\"http://example.com/x\"><input name=a value=\"1\"></form>\n"
        "<script type=\"text/javascript\">var s = \"</div>\";</script>\n"
        "<p>1 < 2 & 3 > 2</p><br/><? pi ?></body></HTML>";

    const auto whole = tokenize(input);
    REQUIRE(concat_raw(whole) == input);

    for (size_t chunk_size : {1u, 2u, 3u, 7u, 16u, 64u}) {
        const auto chunked = tokenize(input, chunk_size);
        REQUIRE(concat_raw(chunked) == input);
        REQUIRE(start_tag_names(chunked) == start_tag_names(whole));
    }
}

TEST_CASE("Tokenizer - Partial tag is held back until complete", "[html][tokenizer]") {
    HtmlTokenizer tokenizer;
    std::vector<HtmlToken> tokens;

    tokenizer.feed("<p>abc<fo", tokens);
    REQUIRE(tokens.size() == 2);
    REQUIRE(tokenizer.buffered() == 3);

    tokens.clear();
    tokenizer.feed("rm method=post>", tokens);
    REQUIRE(tokens.size() == 1);
    REQUIRE(tokens[0].name == "form");
    REQUIRE(tokens[0].raw == "<form method=post>");
    REQUIRE(tokenizer.buffered() == 0);
}

TEST_CASE("Tokenizer - Input after finish is ignored", "[html][tokenizer]") {
    HtmlTokenizer tokenizer;
    std::vector<HtmlToken> tokens;

    tokenizer.feed("<p>", tokens);
    tokenizer.finish(tokens);
    REQUIRE(tokenizer.finished());

    tokenizer.feed("<form>", tokens);
    tokenizer.finish(tokens);
    REQUIRE(tokens.size() == 1);
}
