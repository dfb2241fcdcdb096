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

// csrfguard Token Generator - Implementation

#include "token.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <random>

#include "logging.hpp"

namespace csrfguard::core {

namespace {

std::atomic<uint64_t> g_token_counter{0};

/// Entropy block hashed into every token
struct TokenSeed {
    std::array<unsigned char, 32> random_bytes{};
    uint32_t device_random = 0;
    int64_t pid = 0;
    uint64_t counter = 0;
    uintptr_t instance = 0;
    int64_t wall_clock_ns = 0;
};

}  // namespace

TokenGenerator::TokenGenerator(size_t length)
    : length_(std::clamp<size_t>(length, 1, SHA1_HEX_LENGTH)) {}

std::string TokenGenerator::generate() const {
    TokenSeed seed;
    std::memset(&seed, 0, sizeof(seed));  // padding is hashed too

    if (RAND_bytes(seed.random_bytes.data(), static_cast<int>(seed.random_bytes.size())) != 1) {
        // Still hash the remaining sources rather than failing the response
        if (auto* logger = logging::get_current_logger()) {
            LOG_WARNING(logger, "CSRF token: RAND_bytes failed, falling back to std::random_device");
        }
        std::random_device device;
        for (auto& byte : seed.random_bytes) {
            byte = static_cast<unsigned char>(device());
        }
    }

    seed.device_random = std::random_device{}();
    seed.pid = static_cast<int64_t>(::getpid());
    seed.counter = g_token_counter.fetch_add(1, std::memory_order_relaxed);
    seed.instance = reinterpret_cast<uintptr_t>(this);
    seed.wall_clock_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
                             std::chrono::system_clock::now().time_since_epoch())
                             .count();

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_length = 0;
    if (EVP_Digest(&seed, sizeof(seed), digest, &digest_length, EVP_sha1(), nullptr) != 1) {
        // SHA-1 unavailable (FIPS provider): the seed's random bytes are already uniform
        return hex_encode(seed.random_bytes.data(), seed.random_bytes.size()).substr(0, length_);
    }

    std::string token = hex_encode(digest, digest_length);
    token.resize(length_);
    return token;
}

std::string hex_encode(const unsigned char* data, size_t size) {
    static constexpr char kHex[] = "0123456789abcdef";

    std::string out;
    out.reserve(size * 2);
    for (size_t i = 0; i < size; ++i) {
        out += kHex[data[i] >> 4];
        out += kHex[data[i] & 0x0F];
    }
    return out;
}

bool tokens_equal(std::string_view presented, std::string_view expected) noexcept {
    if (presented.size() != expected.size()) {
        return false;
    }
    if (expected.empty()) {
        return true;
    }
    return CRYPTO_memcmp(presented.data(), expected.data(), expected.size()) == 0;
}

}  // namespace csrfguard::core
