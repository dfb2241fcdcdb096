// csrfguard HTML Rewriter Unit Tests

#include <catch2/catch_test_macros.hpp>
#include <optional>
#include <string>

#include "../../src/html/rewriter.hpp"

using namespace csrfguard::html;

namespace {

constexpr std::string_view TOKEN = "0123456789abcdef";
constexpr std::string_view INPUT = R"(<input type="hidden" name="SEC" value="0123456789abcdef" />)";
constexpr std::string_view META = R"(<meta name="csrftoken" content="0123456789abcdef"/>)";

RewriteOptions make_options(bool add_meta = false) {
    RewriteOptions options;
    options.token = std::string(TOKEN);
    options.add_meta = add_meta;
    options.request_host = "example.com";
    return options;
}

std::string rewrite(std::string_view html, RewriteOptions options, size_t chunk_size = 0) {
    HtmlRewriter rewriter(std::move(options));
    std::string out;
    if (chunk_size == 0) {
        out += rewriter.write(html);
    } else {
        for (size_t i = 0; i < html.size(); i += chunk_size) {
            out += rewriter.write(html.substr(i, chunk_size));
        }
    }
    out += rewriter.finish();
    return out;
}

size_t count(std::string_view haystack, std::string_view needle) {
    size_t n = 0;
    for (size_t pos = haystack.find(needle); pos != std::string_view::npos;
         pos = haystack.find(needle, pos + needle.size())) {
        ++n;
    }
    return n;
}

}  // namespace

TEST_CASE("Rewriter - Injection fragments are exact", "[html][rewriter]") {
    REQUIRE(HtmlRewriter::hidden_input_fragment("SEC", TOKEN) == INPUT);
    REQUIRE(HtmlRewriter::meta_fragment("csrftoken", TOKEN) == META);
}

TEST_CASE("Rewriter - Hidden input follows each POST form tag", "[html][rewriter]") {
    const std::string html =
        "<html><body>"
        "<form method=\"post\" action=\"/a\"><input name=x></form>"
        "<form method=\"get\" action=\"/b\"></form>"
        "<FORM METHOD=POST></FORM>"
        "<form action=\"/c\"></form>"
        "<form method='Post' action='http://example.com/d'></form>"
        "</body></html>";

    const std::string expected =
        "<html><body>"
        "<form method=\"post\" action=\"/a\">" + std::string(INPUT) + "<input name=x></form>"
        "<form method=\"get\" action=\"/b\"></form>"
        "<FORM METHOD=POST>" + std::string(INPUT) + "</FORM>"
        "<form action=\"/c\"></form>"
        "<form method='Post' action='http://example.com/d'>" + std::string(INPUT) + "</form>"
        "</body></html>";

    HtmlRewriter rewriter(make_options());
    std::string out = rewriter.write(html);
    out += rewriter.finish();

    REQUIRE(out == expected);
    REQUIRE(rewriter.forms_injected() == 3);
    REQUIRE_FALSE(rewriter.meta_injected());
}

TEST_CASE("Rewriter - Method matches 'post' anywhere", "[html][rewriter]") {
    // Case-insensitive substring match
    auto out = rewrite("<form method=\"xPOSTx\"></form>", make_options());
    REQUIRE(count(out, INPUT) == 1);
}

TEST_CASE("Rewriter - Cross-origin forms are skipped", "[html][rewriter]") {
    SECTION("Different host") {
        auto out = rewrite(R"(<form method="post" action="http://evil.example/x"></form>)",
                           make_options());
        REQUIRE(count(out, INPUT) == 0);
    }

    SECTION("Different host with port") {
        auto out = rewrite(R"(<form method="post" action="https://evil.example:8443/x"></form>)",
                           make_options());
        REQUIRE(count(out, INPUT) == 0);
    }

    SECTION("Same host with port") {
        auto out = rewrite(R"(<form method="post" action="https://example.com:8443/x"></form>)",
                           make_options());
        REQUIRE(count(out, INPUT) == 1);
    }

    SECTION("Relative and missing actions are same-origin") {
        auto out = rewrite(R"(<form method="post" action="save"></form><form method="post">)",
                           make_options());
        REQUIRE(count(out, INPUT) == 2);
    }

    SECTION("Protocol-relative and bare-host URLs are not recognized") {
        auto out = rewrite(
            R"(<form method="post" action="//evil.example/x"></form>)"
            R"(<form method="post" action="http://evil.example"></form>)",
            make_options());
        REQUIRE(count(out, INPUT) == 2);
    }
}

TEST_CASE("Rewriter - Cross-origin action check", "[html][rewriter]") {
    REQUIRE(HtmlRewriter::is_cross_origin_action("http://evil.example/x", "example.com"));
    REQUIRE(HtmlRewriter::is_cross_origin_action("https://evil.example:1/", "example.com"));
    REQUIRE_FALSE(HtmlRewriter::is_cross_origin_action("http://example.com/x", "example.com"));
    REQUIRE_FALSE(HtmlRewriter::is_cross_origin_action("/x", "example.com"));
    REQUIRE_FALSE(HtmlRewriter::is_cross_origin_action("", "example.com"));
    // Scheme is matched case-sensitively
    REQUIRE_FALSE(HtmlRewriter::is_cross_origin_action("HTTP://evil.example/x", "example.com"));
}

TEST_CASE("Rewriter - Meta tag gating", "[html][rewriter]") {
    const std::string html = "<html><HEAD><title>x</title></head><head></head></html>";

    SECTION("add_meta disabled") {
        HtmlRewriter rewriter(make_options(false));
        std::string out = rewriter.write(html);
        out += rewriter.finish();
        REQUIRE(out == html);
        REQUIRE_FALSE(rewriter.meta_injected());
    }

    SECTION("add_meta enabled: once, right after the first head") {
        HtmlRewriter rewriter(make_options(true));
        std::string out = rewriter.write(html);
        out += rewriter.finish();
        REQUIRE(out ==
                "<html><HEAD>" + std::string(META) + "<title>x</title></head><head></head></html>");
        REQUIRE(rewriter.meta_injected());
    }
}

TEST_CASE("Rewriter - Custom names", "[html][rewriter]") {
    RewriteOptions options = make_options(true);
    options.parameter_name = "csrf_token";
    options.meta_name = "csrf-meta";

    auto out = rewrite("<head></head><form method=post>", options);

    REQUIRE(out == "<head><meta name=\"csrf-meta\" content=\"0123456789abcdef\"/></head>"
                   "<form method=post><input type=\"hidden\" name=\"csrf_token\" "
                   "value=\"0123456789abcdef\" />");
}

TEST_CASE("Rewriter - Output is independent of chunk boundaries", "[html][rewriter]") {
    const std::string html =
        "<!DOCTYPE html>\n<html><head><title>Login</title>\n"
        "<script>var f = '<form method=post>';</script></head>\n"
        "<body><!-- <form method=post> -->\n"
        "<form method=\"post\" action=\"/login\"><input name=\"user\"></form>\n"
        "<form method=\"post\" action=\"http://other.example/x\"></form>\n"
        "<p>1 < 2</p><form method=post action=http://example.com/y>\n"
        "</body></html>";

    const std::string whole = rewrite(html, make_options(true));
    REQUIRE(count(whole, INPUT) == 2);
    REQUIRE(count(whole, META) == 1);

    for (size_t chunk_size = 1; chunk_size <= 40; ++chunk_size) {
        REQUIRE(rewrite(html, make_options(true), chunk_size) == whole);
    }
}

TEST_CASE("Rewriter - Partial tag is emitted once complete", "[html][rewriter]") {
    HtmlRewriter rewriter(make_options());

    REQUIRE(rewriter.write("<p>hi</p><form meth") == "<p>hi</p>");
    REQUIRE(rewriter.write("od=post>") == "<form method=post>" + std::string(INPUT));
    REQUIRE(rewriter.finish().empty());
}

TEST_CASE("Rewriter - Trailing bytes are flushed at end of stream", "[html][rewriter]") {
    HtmlRewriter rewriter(make_options());

    REQUIRE(rewriter.write("text <form method=\"po") == "text ");
    REQUIRE(rewriter.finish() == "<form method=\"po");
    REQUIRE(rewriter.closed());
}

TEST_CASE("Rewriter - Calls after close are no-ops", "[html][rewriter]") {
    HtmlRewriter rewriter(make_options());

    REQUIRE(rewriter.filter(std::string_view("<p>")) == "<p>");
    REQUIRE(rewriter.filter(std::nullopt).empty());
    REQUIRE(rewriter.filter(std::string_view("<form method=post>")).empty());
    REQUIRE(rewriter.filter(std::nullopt).empty());
    REQUIRE(rewriter.forms_injected() == 0);
}

TEST_CASE("Rewriter - Non-form content passes through unchanged", "[html][rewriter]") {
    const std::string html =
        "<?xml version=\"1.0\"?><!DOCTYPE html><html lang=en><body>\n"
        "<p class='a'>&amp; &lt;form&gt;</p><img src=x.png/><br>\n"
        "<![CDATA[ raw ]]></body></html>\n";

    REQUIRE(rewrite(html, make_options(true)) == html);
}

TEST_CASE("Rewriter - Form markup inside raw text elements is left alone", "[html][rewriter]") {
    SECTION("Textarea and title") {
        const std::string html =
            "<html><head><title>Use <form method=\"post\"></title></head><body>"
            "<textarea name=\"snippet\"><form method=\"post\" action=\"/x\"></textarea>"
            "<xmp><form method=post></xmp><iframe><form method=post></iframe>"
            "</body></html>";

        REQUIRE(rewrite(html, make_options()) == html);
        for (size_t chunk_size : {1u, 3u, 17u}) {
            REQUIRE(rewrite(html, make_options(), chunk_size) == html);
        }
    }

    SECTION("A real form after the textarea still gets the token") {
        const std::string html = "<textarea><form method=post></textarea><form method=post>";
        REQUIRE(rewrite(html, make_options()) ==
                "<textarea><form method=post></textarea><form method=post>" + std::string(INPUT));
    }

    SECTION("Plaintext swallows the rest of the document") {
        const std::string html = "<plaintext><form method=post></plaintext><form method=post>";
        REQUIRE(rewrite(html, make_options()) == html);
    }
}

TEST_CASE("Rewriter - Tags with very long attributes", "[html][rewriter]") {
    const std::string filler(70 * 1024, 'x');

    SECTION("Form markup inside a long attribute value is not injected into") {
        const std::string html = "<div data-x=\"" + filler + "<form method=post>\"></div>";
        REQUIRE(rewrite(html, make_options()) == html);
        REQUIRE(rewrite(html, make_options(), 4096) == html);
    }

    SECTION("A POST form with a long attribute gets the token after its closing bracket") {
        const std::string tag = "<form method=\"post\" data-x=\"" + filler + "\">";
        const std::string html = tag + "<input name=a></form>";
        const std::string expected = tag + std::string(INPUT) + "<input name=a></form>";

        REQUIRE(rewrite(html, make_options()) == expected);
        REQUIRE(rewrite(html, make_options(), 4096) == expected);
    }
}
