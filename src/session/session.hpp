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

// csrfguard Session - Header
// External session mapping and the single-key token store on top of it

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "../core/containers.hpp"

namespace csrfguard::core {
class TokenGenerator;
}

namespace csrfguard::session {

/// Session mapping owned by the host's session backend
/// Locking and persistence are the backend's responsibility.
class Session {
public:
    virtual ~Session() = default;

    [[nodiscard]] virtual std::optional<std::string> get(std::string_view key) const = 0;
    virtual void set(std::string_view key, std::string value) = 0;
    virtual void erase(std::string_view key) = 0;
};

/// In-process session (tests, CLI, single-process hosts)
class MemorySession final : public Session {
public:
    MemorySession() = default;

    [[nodiscard]] std::optional<std::string> get(std::string_view key) const override;
    void set(std::string_view key, std::string value) override;
    void erase(std::string_view key) override;

    [[nodiscard]] size_t size() const noexcept { return values_.size(); }

private:
    core::fast_map<std::string, std::string> values_;
};

/// Token accessor bound to one session and the configured session key
class TokenStore {
public:
    TokenStore(Session& session, std::string_view key) : session_(session), key_(key) {}

    /// Stored token, or nullopt if absent or empty
    [[nodiscard]] std::optional<std::string> get() const;

    void set(std::string token);

    void remove();

    /// Stored token, generating and storing a new one if absent
    [[nodiscard]] std::string ensure(const core::TokenGenerator& generator);

private:
    Session& session_;
    std::string_view key_;
};

}  // namespace csrfguard::session
