// csrfguard Rewriter Benchmark
// Measures HTML rewriting and form parsing throughput

#include "../src/html/rewriter.hpp"
#include "../src/html/tokenizer.hpp"
#include "../src/http/form.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <random>
#include <string>
#include <vector>

using namespace csrfguard;

// Benchmark helper
template<typename Func>
double benchmark(Func&& func, size_t iterations) {
    auto start = std::chrono::high_resolution_clock::now();

    for (size_t i = 0; i < iterations; i++) {
        func();
    }

    auto end = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start);
    return static_cast<double>(duration.count()) / iterations;
}

// Generate a page with forms, attributes, comments and scripts
std::string generate_page(size_t target_size, std::mt19937& rng) {
    static const char* fragments[] = {
        "<p class=\"lead\">Lorem ipsum dolor sit amet, consectetur adipiscing elit.</p>\n",
        "<form method=\"post\" action=\"/comments\"><input name=\"body\"><button>Send</button></form>\n",
        "<form method=\"get\" action=\"/search\"><input name=\"q\" value=\"\"></form>\n",
        "<form method=\"post\" action=\"https://other.example/collect\"></form>\n",
        "<!-- sidebar: <form method=\"post\"> -->\n",
        "<script>if (a < b && c > d) { document.write('<form method=post>'); }</script>\n",
        "<ul><li><a href=\"/a?x=1&amp;y=2\">one</a></li><li><a href='/b'>two</a></li></ul>\n",
    };
    std::uniform_int_distribution<size_t> dist(0, std::size(fragments) - 1);

    std::string page = "<!DOCTYPE html>\n<html><head><title>bench</title></head><body>\n";
    while (page.size() < target_size) {
        page += fragments[dist(rng)];
    }
    page += "</body></html>\n";
    return page;
}

double throughput_mb_s(size_t bytes, double ns) {
    return (static_cast<double>(bytes) / (1024.0 * 1024.0)) / (ns / 1e9);
}

void benchmark_rewriter() {
    std::cout << "\n=== HtmlRewriter Benchmark ===\n";
    std::mt19937 rng(42);

    const std::string page = generate_page(64 * 1024, rng);
    const size_t iterations = 200;
    std::vector<size_t> chunk_sizes = {1 << 6, 1 << 10, 1 << 12, 1 << 14, page.size()};

    std::cout << std::setw(12) << "Chunk"
              << std::setw(15) << "Time (us)"
              << std::setw(15) << "MB/s" << "\n";
    std::cout << std::string(42, '-') << "\n";

    for (size_t chunk_size : chunk_sizes) {
        double ns = benchmark([&]() {
            html::RewriteOptions options;
            options.token = "0123456789abcdef";
            options.add_meta = true;
            options.request_host = "example.com";

            html::HtmlRewriter rewriter(std::move(options));
            size_t out = 0;
            for (size_t i = 0; i < page.size(); i += chunk_size) {
                out += rewriter.write(std::string_view(page).substr(i, chunk_size)).size();
            }
            out += rewriter.finish().size();
            volatile size_t result = out;
            (void)result;
        }, iterations);

        std::cout << std::setw(12) << chunk_size
                  << std::setw(15) << std::fixed << std::setprecision(2) << ns / 1000.0
                  << std::setw(15) << std::fixed << std::setprecision(2)
                  << throughput_mb_s(page.size(), ns) << "\n";
    }
}

void benchmark_tokenizer() {
    std::cout << "\n=== HtmlTokenizer Benchmark ===\n";
    std::mt19937 rng(7);

    const size_t iterations = 200;
    std::vector<size_t> sizes = {4 * 1024, 64 * 1024, 512 * 1024};

    std::cout << std::setw(12) << "Size"
              << std::setw(15) << "Time (us)"
              << std::setw(15) << "MB/s" << "\n";
    std::cout << std::string(42, '-') << "\n";

    for (size_t size : sizes) {
        const std::string page = generate_page(size, rng);

        double ns = benchmark([&]() {
            html::HtmlTokenizer tokenizer;
            std::vector<html::HtmlToken> tokens;
            tokenizer.feed(page, tokens);
            tokenizer.finish(tokens);
            volatile size_t result = tokens.size();
            (void)result;
        }, iterations);

        std::cout << std::setw(12) << page.size()
                  << std::setw(15) << std::fixed << std::setprecision(2) << ns / 1000.0
                  << std::setw(15) << std::fixed << std::setprecision(2)
                  << throughput_mb_s(page.size(), ns) << "\n";
    }
}

void benchmark_form_parsing() {
    std::cout << "\n=== Form Body Parsing Benchmark ===\n";

    const size_t iterations = 100000;

    std::string urlencoded;
    for (int i = 0; i < 32; ++i) {
        urlencoded += "field" + std::to_string(i) + "=some+value%20here&";
    }
    urlencoded += "SEC=0123456789abcdef";

    std::string multipart;
    for (int i = 0; i < 32; ++i) {
        multipart += "--BOUNDARY\r\nContent-Disposition: form-data; name=\"field" +
                     std::to_string(i) + "\"\r\n\r\nsome value here\r\n";
    }
    multipart += "--BOUNDARY\r\nContent-Disposition: form-data; name=\"SEC\"\r\n\r\n"
                 "0123456789abcdef\r\n--BOUNDARY--\r\n";

    std::cout << std::setw(20) << "Encoding"
              << std::setw(12) << "Bytes"
              << std::setw(15) << "Time (ns)" << "\n";
    std::cout << std::string(47, '-') << "\n";

    double urlencoded_ns = benchmark([&]() {
        auto params = http::form::parse_urlencoded(urlencoded);
        volatile bool found = params.contains("SEC");
        (void)found;
    }, iterations);

    double multipart_ns = benchmark([&]() {
        auto params = http::form::parse_multipart(multipart, "BOUNDARY");
        volatile bool found = params.contains("SEC");
        (void)found;
    }, iterations);

    std::cout << std::setw(20) << "urlencoded"
              << std::setw(12) << urlencoded.size()
              << std::setw(15) << std::fixed << std::setprecision(2) << urlencoded_ns << "\n";
    std::cout << std::setw(20) << "multipart"
              << std::setw(12) << multipart.size()
              << std::setw(15) << std::fixed << std::setprecision(2) << multipart_ns << "\n";
}

int main() {
    std::cout << "csrfguard Rewriter Performance Benchmark\n";
    std::cout << "========================================\n";

    benchmark_rewriter();
    benchmark_tokenizer();
    benchmark_form_parsing();

    std::cout << "\n";
    return 0;
}
