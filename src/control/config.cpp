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

// csrfguard Configuration - Implementation

#include "config.hpp"

#include <algorithm>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

#include "../core/string_utils.hpp"

namespace csrfguard::control {

namespace {

const std::vector<std::string> kCsrfKeys = {
    "parameter_name", "header_name", "token_length",    "session_key",      "add_meta",
    "meta_name",      "onetime",     "whitelist_paths", "blocked_redirect"};

const std::vector<std::string> kLoggingKeys = {"level", "format", "output", "rotation"};

const std::vector<std::string> kTopLevelKeys = {"csrf", "logging", "version", "description"};

/// Warn about keys nobody reads (typos silently fall back to defaults otherwise)
void check_unknown_keys(const nlohmann::json& j, const std::vector<std::string>& known,
                        const std::string& context, ValidationResult& result) {
    if (!j.is_object()) {
        return;
    }

    for (const auto& [key, value] : j.items()) {
        if (std::find(known.begin(), known.end(), key) != known.end()) {
            continue;
        }

        std::string message = context + ": unknown key '" + key + "'";
        auto similar = core::find_similar_strings(key, known);
        if (!similar.empty()) {
            message += " (did you mean '" + similar.front() + "'?)";
        }
        result.add_warning(std::move(message));
    }
}

/// Names end up inside HTML attribute values: keep them free of markup characters
[[nodiscard]] bool is_markup_safe_name(std::string_view name) {
    for (char c : name) {
        if (c == '"' || c == '\'' || c == '<' || c == '>' || c == '&' || core::is_space_ascii(c) ||
            static_cast<unsigned char>(c) < 0x20) {
            return false;
        }
    }
    return true;
}

/// RFC 7230 token characters
[[nodiscard]] bool is_header_token(std::string_view name) {
    static constexpr std::string_view kExtra = "!#$%&'*+-.^_`|~";
    for (char c : name) {
        bool alnum = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
        if (!alnum && kExtra.find(c) == std::string_view::npos) {
            return false;
        }
    }
    return true;
}

}  // namespace

// ConfigLoader implementation

std::optional<Config> ConfigLoader::load_from_file(std::string_view path) {
    ValidationResult report;
    return load_from_file(path, report);
}

std::optional<Config> ConfigLoader::load_from_file(std::string_view path,
                                                   ValidationResult& report) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        report.add_error("Cannot open configuration file: " + path_str);
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string json = buffer.str();

    return load_from_json(json, report);
}

std::optional<Config> ConfigLoader::load_from_json(std::string_view json) {
    ValidationResult report;
    return load_from_json(json, report);
}

std::optional<Config> ConfigLoader::load_from_json(std::string_view json,
                                                   ValidationResult& report) {
    Config config;

    try {
        auto j = nlohmann::json::parse(json);
        config = j.get<Config>();

        check_unknown_keys(j, kTopLevelKeys, "config", report);
        if (j.contains("csrf")) {
            check_unknown_keys(j["csrf"], kCsrfKeys, "csrf", report);
        }
        if (j.contains("logging")) {
            check_unknown_keys(j["logging"], kLoggingKeys, "logging", report);
        }
    } catch (const nlohmann::json::exception& e) {
        report.add_error(std::string("JSON parsing error: ") + e.what());
        return std::nullopt;
    }

    auto validation = validate(config);
    for (auto& error : validation.errors) {
        report.add_error(std::move(error));
    }
    for (auto& warning : validation.warnings) {
        report.add_warning(std::move(warning));
    }

    if (report.has_errors()) {
        return std::nullopt;
    }

    return config;
}

ValidationResult ConfigLoader::validate(const Config& config) {
    ValidationResult result;
    const auto& csrf = config.csrf;

    // Token length: a SHA-1 hex digest is 40 characters
    if (csrf.token_length == 0) {
        result.add_error("csrf.token_length must be > 0");
    } else if (csrf.token_length > MAX_TOKEN_LENGTH) {
        result.add_error("csrf.token_length must be <= " + std::to_string(MAX_TOKEN_LENGTH) +
                         " (got " + std::to_string(csrf.token_length) + ")");
    } else if (csrf.token_length < RECOMMENDED_MIN_TOKEN_LENGTH) {
        result.add_warning("csrf.token_length " + std::to_string(csrf.token_length) +
                           " gives less than 64 bits of entropy (recommended >= " +
                           std::to_string(RECOMMENDED_MIN_TOKEN_LENGTH) + ")");
    }

    if (csrf.parameter_name.empty()) {
        result.add_error("csrf.parameter_name cannot be empty");
    } else if (!is_markup_safe_name(csrf.parameter_name)) {
        result.add_error("csrf.parameter_name contains quotes, angle brackets, '&' or whitespace");
    }

    if (csrf.meta_name.empty()) {
        result.add_error("csrf.meta_name cannot be empty");
    } else if (!is_markup_safe_name(csrf.meta_name)) {
        result.add_error("csrf.meta_name contains quotes, angle brackets, '&' or whitespace");
    }

    if (csrf.header_name.empty()) {
        result.add_error("csrf.header_name cannot be empty");
    } else if (!is_header_token(csrf.header_name)) {
        result.add_error("csrf.header_name '" + csrf.header_name +
                         "' is not a valid HTTP header name");
    }

    if (csrf.session_key.empty()) {
        result.add_error("csrf.session_key cannot be empty");
    }

    for (size_t i = 0; i < csrf.whitelist_paths.size(); ++i) {
        const auto& prefix = csrf.whitelist_paths[i];
        std::string context = "csrf.whitelist_paths[" + std::to_string(i) + "]";
        if (prefix.empty()) {
            result.add_error(context + ": prefix cannot be empty");
        } else if (prefix.front() != '/') {
            result.add_error(context + ": prefix must start with '/' (got '" + prefix + "')");
        } else if (prefix == "/") {
            result.add_warning(context + ": '/' whitelists every request, CSRF checks are off");
        }
    }

    if (csrf.blocked_redirect) {
        const auto& target = *csrf.blocked_redirect;
        if (target.find_first_of("\r\n") != std::string::npos) {
            result.add_error("csrf.blocked_redirect contains line breaks");
        } else if (target.empty() ||
                   (target.front() != '/' && !core::istarts_with(target, "http://") &&
                    !core::istarts_with(target, "https://"))) {
            result.add_error("csrf.blocked_redirect must be an absolute path or http(s) URL");
        }
    }

    if (csrf.onetime && csrf.add_meta) {
        result.add_warning(
            "csrf.onetime with csrf.add_meta: scripts reading the meta tag must reload it "
            "after every POST");
    }

    // Logging
    const auto level = core::to_lower(config.logging.level);
    if (level != "debug" && level != "info" && level != "warning" && level != "warn" &&
        level != "error") {
        result.add_warning("logging.level '" + config.logging.level +
                           "' is unknown, using 'info'");
    }

    const auto& format = config.logging.format;
    if (format != "json" && format != "text" && format != "console") {
        result.add_error("logging.format must be 'json', 'text' or 'console'");
    }

    return result;
}

bool ConfigLoader::save_to_file(const Config& config, std::string_view path) {
    std::string json = to_json(config);
    if (json.empty()) {
        return false;
    }

    std::string path_str{path};
    std::ofstream file{path_str};
    if (!file.is_open()) {
        return false;
    }

    file << json;
    return file.good();
}

std::string ConfigLoader::to_json(const Config& config) {
    try {
        nlohmann::json j = config;
        return j.dump(2);  // 2-space indentation
    } catch (const nlohmann::json::exception&) {
        return "";
    }
}

}  // namespace csrfguard::control
