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

// csrfguard Session - Implementation

#include "session.hpp"

#include "../core/token.hpp"

namespace csrfguard::session {

// MemorySession

std::optional<std::string> MemorySession::get(std::string_view key) const {
    auto it = values_.find(std::string(key));
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void MemorySession::set(std::string_view key, std::string value) {
    values_[std::string(key)] = std::move(value);
}

void MemorySession::erase(std::string_view key) {
    values_.erase(std::string(key));
}

// TokenStore

std::optional<std::string> TokenStore::get() const {
    auto token = session_.get(key_);
    // An empty value counts as "no token", like a missing key
    if (!token || token->empty()) {
        return std::nullopt;
    }
    return token;
}

void TokenStore::set(std::string token) {
    session_.set(key_, std::move(token));
}

void TokenStore::remove() {
    session_.erase(key_);
}

std::string TokenStore::ensure(const core::TokenGenerator& generator) {
    if (auto existing = get()) {
        return std::move(*existing);
    }

    std::string token = generator.generate();
    session_.set(key_, token);
    return token;
}

}  // namespace csrfguard::session
