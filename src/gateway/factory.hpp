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

// Gateway Component Factory - Header
// Factory functions for building gateway components (strategies, Pipeline, Gateway)

#pragma once

#include <memory>

#include "../control/config.hpp"
#include "csrf_handlers.hpp"
#include "gateway.hpp"
#include "pipeline.hpp"

namespace csrfguard::gateway {

/// Blocked handler from configuration (redirect if blocked_redirect is set, else 403)
[[nodiscard]] std::shared_ptr<const BlockedHandler> build_blocked_handler(
    const control::CsrfConfig& config);

/// Whitelist from configuration (path prefixes, or nothing)
[[nodiscard]] std::shared_ptr<const WhitelistPredicate> build_whitelist(
    const control::CsrfConfig& config);

/// Build middleware pipeline from configuration
/// Explicit strategies take precedence over the configured ones.
[[nodiscard]] Pipeline build_pipeline(const control::Config& config,
                                      std::shared_ptr<const BlockedHandler> blocked = nullptr,
                                      std::shared_ptr<const WhitelistPredicate> whitelisted = nullptr);

/// Build a gateway wrapping the application
[[nodiscard]] std::unique_ptr<Gateway> build_gateway(
    const control::Config& config, Application app,
    std::shared_ptr<const BlockedHandler> blocked = nullptr,
    std::shared_ptr<const WhitelistPredicate> whitelisted = nullptr);

}  // namespace csrfguard::gateway
