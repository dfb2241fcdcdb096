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

// csrfguard Token Generator - Header
// Random hex tokens: truncated SHA-1 over OpenSSL randomness, process identity and time

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace csrfguard::core {

/// Length of a SHA-1 digest in hex characters
inline constexpr size_t SHA1_HEX_LENGTH = 40;

/// Generates session tokens of a fixed hex length
/// Thread-safe: generate() has no shared mutable state except an atomic counter.
class TokenGenerator {
public:
    /// Length is clamped to [1, 40]
    explicit TokenGenerator(size_t length);

    /// New token of exactly length() lowercase hex characters
    [[nodiscard]] std::string generate() const;

    [[nodiscard]] size_t length() const noexcept { return length_; }

private:
    size_t length_;
};

/// Lowercase hex encoding
[[nodiscard]] std::string hex_encode(const unsigned char* data, size_t size);

/// Exact comparison in constant time for equal lengths
[[nodiscard]] bool tokens_equal(std::string_view presented, std::string_view expected) noexcept;

}  // namespace csrfguard::core
