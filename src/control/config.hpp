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

// csrfguard Configuration - Header
// JSON configuration schema using nlohmann/json for serialization

#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace csrfguard::control {

/// Hard upper bound for token_length (hex length of a SHA-1 digest)
inline constexpr uint32_t MAX_TOKEN_LENGTH = 40;

/// Below this length a token carries less than 64 bits
inline constexpr uint32_t RECOMMENDED_MIN_TOKEN_LENGTH = 16;

/// CSRF protection settings (immutable per middleware instance)
struct CsrfConfig {
    std::string parameter_name = "SEC";          // Hidden input / body parameter name
    std::string header_name = "X-CSRF-Token";    // Matched after uppercase + '-' -> '_'
    uint32_t token_length = 16;                  // Hex characters, max 40
    std::string session_key = "csrfblock.token"; // Session key holding the token
    bool add_meta = false;                       // Inject <meta> after <head>
    std::string meta_name = "csrftoken";
    bool onetime = false;                        // Invalidate token after each accepted POST

    // Requests whose path starts with one of these prefixes skip validation
    std::vector<std::string> whitelist_paths;

    // Redirect target for rejected requests (default: 403 "CSRF detected")
    std::optional<std::string> blocked_redirect;
};

/// Logging configuration
struct LogConfig {
    std::string level = "info";                // debug, info, warning, error
    std::string format = "text";               // json, text, console
    std::string output = "/var/log/csrfguard"; // Log directory (worker_N.log appended)

    struct RotationConfig {
        uint32_t max_size_mb = 100;
        uint32_t max_files = 10;
    } rotation;
};

/// Full csrfguard configuration
struct Config {
    CsrfConfig csrf;
    LogConfig logging;

    // Metadata
    std::string version = "1.0";
    std::optional<std::string> description;
};

// Custom from_json/to_json for all types (partial configs fall back to defaults)

inline void from_json(const nlohmann::json& j, CsrfConfig& c) {
    c.parameter_name = j.value("parameter_name", std::string("SEC"));
    c.header_name = j.value("header_name", std::string("X-CSRF-Token"));
    c.token_length = j.value("token_length", 16u);
    c.session_key = j.value("session_key", std::string("csrfblock.token"));
    c.add_meta = j.value("add_meta", false);
    c.meta_name = j.value("meta_name", std::string("csrftoken"));
    c.onetime = j.value("onetime", false);
    c.whitelist_paths = j.value("whitelist_paths", std::vector<std::string>{});

    // Optional fields must use contains() - value() cannot express "absent"
    if (j.contains("blocked_redirect") && !j["blocked_redirect"].is_null()) {
        c.blocked_redirect = j["blocked_redirect"].get<std::string>();
    } else {
        c.blocked_redirect.reset();
    }
}

inline void to_json(nlohmann::json& j, const CsrfConfig& c) {
    j = nlohmann::json{{"parameter_name", c.parameter_name},
                       {"header_name", c.header_name},
                       {"token_length", c.token_length},
                       {"session_key", c.session_key},
                       {"add_meta", c.add_meta},
                       {"meta_name", c.meta_name},
                       {"onetime", c.onetime},
                       {"whitelist_paths", c.whitelist_paths}};
    if (c.blocked_redirect) {
        j["blocked_redirect"] = *c.blocked_redirect;
    }
}

inline void from_json(const nlohmann::json& j, LogConfig::RotationConfig& r) {
    r.max_size_mb = j.value("max_size_mb", 100u);
    r.max_files = j.value("max_files", 10u);
}

inline void to_json(nlohmann::json& j, const LogConfig::RotationConfig& r) {
    j = nlohmann::json{{"max_size_mb", r.max_size_mb}, {"max_files", r.max_files}};
}

inline void from_json(const nlohmann::json& j, LogConfig& l) {
    l.level = j.value("level", std::string("info"));
    l.format = j.value("format", std::string("text"));
    l.output = j.value("output", std::string("/var/log/csrfguard"));
    if (j.contains("rotation")) {
        l.rotation = j["rotation"].get<LogConfig::RotationConfig>();
    }
}

inline void to_json(nlohmann::json& j, const LogConfig& l) {
    j = nlohmann::json{{"level", l.level},
                       {"format", l.format},
                       {"output", l.output},
                       {"rotation", l.rotation}};
}

inline void from_json(const nlohmann::json& j, Config& c) {
    if (j.contains("csrf")) {
        c.csrf = j["csrf"].get<CsrfConfig>();
    }
    if (j.contains("logging")) {
        c.logging = j["logging"].get<LogConfig>();
    }
    c.version = j.value("version", std::string("1.0"));
    if (j.contains("description") && !j["description"].is_null()) {
        c.description = j["description"].get<std::string>();
    }
}

inline void to_json(nlohmann::json& j, const Config& c) {
    j = nlohmann::json{{"csrf", c.csrf}, {"logging", c.logging}, {"version", c.version}};
    if (c.description) {
        j["description"] = *c.description;
    }
}

/// Configuration validation result
struct ValidationResult {
    bool valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    void add_error(std::string error) {
        valid = false;
        errors.push_back(std::move(error));
    }

    void add_warning(std::string warning) { warnings.push_back(std::move(warning)); }

    [[nodiscard]] bool has_errors() const noexcept { return !valid || !errors.empty(); }
};

/// Configuration loader
class ConfigLoader {
public:
    /// Load configuration from JSON file
    [[nodiscard]] static std::optional<Config> load_from_file(std::string_view path);

    /// Load configuration from JSON file, reporting errors and warnings
    [[nodiscard]] static std::optional<Config> load_from_file(std::string_view path,
                                                              ValidationResult& report);

    /// Load configuration from JSON string
    [[nodiscard]] static std::optional<Config> load_from_json(std::string_view json);

    /// Load configuration from JSON string, reporting errors and warnings
    [[nodiscard]] static std::optional<Config> load_from_json(std::string_view json,
                                                              ValidationResult& report);

    /// Validate configuration
    [[nodiscard]] static ValidationResult validate(const Config& config);

    /// Save configuration to JSON file
    [[nodiscard]] static bool save_to_file(const Config& config, std::string_view path);

    /// Serialize configuration to JSON string
    [[nodiscard]] static std::string to_json(const Config& config);
};

}  // namespace csrfguard::control
