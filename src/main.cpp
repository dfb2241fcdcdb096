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

// csrfguard-rewrite - Main Entry Point
// Streams an HTML document from stdin to stdout through the CSRF pipeline
#include <array>
#include <cstdio>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>

#include "control/config.hpp"
#include "core/logging.hpp"
#include "gateway/factory.hpp"
#include "session/session.hpp"

namespace {

constexpr size_t CHUNK_SIZE = 4096;

void print_usage(const char* argv0) {
    fprintf(stderr, "Usage: %s --config <config.json> --host <host> [--token <token>] [--check]\n",
            argv0);
}

void print_report(const csrfguard::control::ValidationResult& report) {
    if (!report.errors.empty()) {
        fprintf(stderr, "Configuration validation errors:\n");
        for (const auto& error : report.errors) {
            fprintf(stderr, "  - %s\n", error.c_str());
        }
    }
    if (!report.warnings.empty()) {
        fprintf(stderr, "Configuration warnings:\n");
        for (const auto& warning : report.warnings) {
            fprintf(stderr, "  - %s\n", warning.c_str());
        }
    }
}

bool write_out(std::string_view data) {
    return data.empty() || std::fwrite(data.data(), 1, data.size(), stdout) == data.size();
}

}  // namespace

int main(int argc, char* argv[]) {
    std::optional<std::string> config_path;
    std::optional<std::string> host;
    std::optional<std::string> token;
    bool check_only = false;

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        if (arg == "--check") {
            check_only = true;
        } else if ((arg == "--config" || arg == "--host" || arg == "--token") && i + 1 < argc) {
            std::string value = argv[++i];
            if (arg == "--config") {
                config_path = std::move(value);
            } else if (arg == "--host") {
                host = std::move(value);
            } else {
                token = std::move(value);
            }
        } else {
            print_usage(argv[0]);
            return EXIT_FAILURE;
        }
    }

    if (!config_path || (!check_only && !host)) {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    csrfguard::control::ValidationResult report;
    auto config = csrfguard::control::ConfigLoader::load_from_file(*config_path, report);
    print_report(report);
    if (!config) {
        fprintf(stderr, "Failed to load configuration from %s\n", config_path->c_str());
        return EXIT_FAILURE;
    }

    if (check_only) {
        printf("Configuration OK: %s\n", config_path->c_str());
        return EXIT_SUCCESS;
    }

    csrfguard::logging::init_logging_system();
    csrfguard::logging::init_worker_logger(0, config->logging);

    // One in-memory session standing in for the host's session backend
    csrfguard::session::MemorySession session;
    if (token) {
        csrfguard::session::TokenStore(session, config->csrf.session_key).set(*token);
    }

    auto gateway = csrfguard::gateway::build_gateway(
        *config, [](const csrfguard::http::Request&, csrfguard::http::Response& response) {
            response.status = csrfguard::http::StatusCode::OK;
            response.set_content_type("text/html; charset=utf-8");
        });

    csrfguard::http::Request request;
    request.method = csrfguard::http::Method::GET;
    request.uri = "/";
    request.path = "/";
    request.headers.push_back({"Host", *host});

    csrfguard::http::Response response;
    auto result = gateway->handle(request, response, &session);
    if (result != csrfguard::gateway::MiddlewareResult::Continue) {
        const auto reason = csrfguard::http::to_reason_phrase(response.status);
        fprintf(stderr, "Request was not accepted (%u %.*s)\n",
                static_cast<unsigned>(response.status), static_cast<int>(reason.size()),
                reason.data());
        csrfguard::logging::shutdown_logging();
        return EXIT_FAILURE;
    }

    std::array<char, CHUNK_SIZE> buffer;
    bool ok = true;
    size_t n = 0;
    while (ok && (n = std::fread(buffer.data(), 1, buffer.size(), stdin)) > 0) {
        ok = write_out(response.write_chunk(std::string_view(buffer.data(), n)));
    }
    if (std::ferror(stdin)) {
        fprintf(stderr, "Error reading stdin\n");
        ok = false;
    }
    ok = write_out(response.finish_body()) && ok;
    std::fflush(stdout);

    if (auto stored = csrfguard::session::TokenStore(session, config->csrf.session_key).get()) {
        fprintf(stderr, "token=%s\n", stored->c_str());
    }

    csrfguard::logging::shutdown_logging();
    return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}
