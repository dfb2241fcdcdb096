// csrfguard Form Body Parsing Unit Tests

#include <catch2/catch_test_macros.hpp>
#include <cstdint>
#include <string>

#include "../../src/http/form.hpp"
#include "../../src/http/http.hpp"

using namespace csrfguard::http;
using namespace csrfguard::http::form;

namespace {

Request make_post(std::string_view content_type, const std::string& body) {
    Request req;
    req.method = Method::POST;
    req.headers.push_back({"Content-Type", content_type});
    req.body = std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(body.data()), body.size());
    return req;
}

}  // namespace

TEST_CASE("Urlencoded - Basic pairs", "[http][form][urlencoded]") {
    auto params = parse_urlencoded("SEC=abc123&name=John+Smith&city=New%20York");

    REQUIRE(params.size() == 3);
    REQUIRE(params.get("SEC") == "abc123");
    REQUIRE(params.get("name") == "John Smith");
    REQUIRE(params.get("city") == "New York");
    REQUIRE_FALSE(params.get("missing").has_value());
}

TEST_CASE("Urlencoded - Edge cases", "[http][form][urlencoded]") {
    SECTION("Last value wins") {
        auto params = parse_urlencoded("SEC=first&SEC=second");
        REQUIRE(params.size() == 2);
        REQUIRE(params.get("SEC") == "second");
    }

    SECTION("Empty pairs and valueless names") {
        auto params = parse_urlencoded("&&flag&empty=&;x=1");
        REQUIRE(params.size() == 3);
        REQUIRE(params.get("flag") == "");
        REQUIRE(params.get("empty") == "");
        REQUIRE(params.get("x") == "1");
    }

    SECTION("Encoded names") {
        auto params = parse_urlencoded("a%5Bb%5D=1");
        REQUIRE(params.get("a[b]") == "1");
    }

    SECTION("Broken escapes keep raw text") {
        auto params = parse_urlencoded("bad=%zz&ok=%41");
        REQUIRE(params.get("bad") == "%zz");
        REQUIRE(params.get("ok") == "A");
    }

    SECTION("Empty body") {
        REQUIRE(parse_urlencoded("").empty());
    }
}

TEST_CASE("Multipart - Boundary extraction", "[http][form][multipart]") {
    REQUIRE(extract_boundary("multipart/form-data; boundary=----abc") == "----abc");
    REQUIRE(extract_boundary("multipart/form-data; charset=utf-8; BOUNDARY=\"a;b c\"") == "a;b c");
    REQUIRE(extract_boundary("multipart/form-data;boundary=xyz ; charset=utf-8") == "xyz");
    REQUIRE_FALSE(extract_boundary("multipart/form-data").has_value());
    REQUIRE_FALSE(extract_boundary("multipart/form-data; boundary=").has_value());
}

TEST_CASE("Multipart - Fields", "[http][form][multipart]") {
    const std::string body =
        "preamble\r\n"
        "--XyZ\r\n"
        "Content-Disposition: form-data; name=\"SEC\"\r\n"
        "\r\n"
        "abc123\r\n"
        "--XyZ\r\n"
        "content-disposition: form-data; name=\"comment\"\r\n"
        "Content-Type: text/plain\r\n"
        "\r\n"
        "line one\r\nline two\r\n"
        "--XyZ\r\n"
        "Content-Disposition: form-data; name=\"upload\"; filename=\"SEC.txt\"\r\n"
        "Content-Type: application/octet-stream\r\n"
        "\r\n"
        "file bytes\r\n"
        "--XyZ\r\n"
        "Content-Disposition: form-data; name=\"empty\"\r\n"
        "\r\n"
        "\r\n"
        "--XyZ--\r\n"
        "epilogue";

    auto params = parse_multipart(body, "XyZ");

    REQUIRE(params.size() == 3);
    REQUIRE(params.get("SEC") == "abc123");
    REQUIRE(params.get("comment") == "line one\r\nline two");
    REQUIRE(params.get("empty") == "");
    REQUIRE_FALSE(params.contains("upload"));
}

TEST_CASE("Multipart - LF line endings", "[http][form][multipart]") {
    const std::string body =
        "--b\n"
        "Content-Disposition: form-data; name=SEC\n"
        "\n"
        "tok\n"
        "--b--\n";

    auto params = parse_multipart(body, "b");
    REQUIRE(params.get("SEC") == "tok");
}

TEST_CASE("Multipart - Truncated body", "[http][form][multipart]") {
    const std::string body =
        "--b\r\n"
        "Content-Disposition: form-data; name=\"a\"\r\n"
        "\r\n"
        "1\r\n"
        "--b\r\n"
        "Content-Disposition: form-data; name=\"SEC\"\r\n"
        "\r\n"
        "incomplete";

    auto params = parse_multipart(body, "b");
    REQUIRE(params.get("a") == "1");
    REQUIRE_FALSE(params.contains("SEC"));

    REQUIRE(parse_multipart(body, "").empty());
    REQUIRE(parse_multipart("no delimiter here", "b").empty());
}

TEST_CASE("Body parameters - Dispatch by content type", "[http][form]") {
    SECTION("Urlencoded with charset") {
        std::string body = "SEC=t1";
        auto req = make_post("Application/X-WWW-Form-Urlencoded; charset=UTF-8", body);
        REQUIRE(parse_body_parameters(req).get("SEC") == "t1");
    }

    SECTION("Multipart") {
        std::string body =
            "--q\r\nContent-Disposition: form-data; name=\"SEC\"\r\n\r\nt2\r\n--q--\r\n";
        auto req = make_post("multipart/form-data; boundary=q", body);
        REQUIRE(parse_body_parameters(req).get("SEC") == "t2");
    }

    SECTION("Multipart without boundary") {
        std::string body = "--q\r\n";
        auto req = make_post("multipart/form-data", body);
        REQUIRE(parse_body_parameters(req).empty());
    }

    SECTION("Other content types are not parsed") {
        std::string body = R"({"SEC":"t3"})";
        auto req = make_post("application/json", body);
        REQUIRE(parse_body_parameters(req).empty());
    }

    SECTION("Body stays readable") {
        std::string body = "SEC=t4";
        auto req = make_post("application/x-www-form-urlencoded", body);
        (void)parse_body_parameters(req);
        REQUIRE(req.body_view() == "SEC=t4");
    }
}
