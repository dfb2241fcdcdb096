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

// Gateway Component Factory - Implementation

#include "factory.hpp"

#include "../core/logging.hpp"
#include "csrf_middleware.hpp"

namespace csrfguard::gateway {

std::shared_ptr<const BlockedHandler> build_blocked_handler(const control::CsrfConfig& config) {
    if (config.blocked_redirect) {
        return std::make_shared<RedirectBlockedHandler>(*config.blocked_redirect);
    }
    return std::make_shared<ForbiddenBlockedHandler>();
}

std::shared_ptr<const WhitelistPredicate> build_whitelist(const control::CsrfConfig& config) {
    if (!config.whitelist_paths.empty()) {
        return std::make_shared<PathPrefixWhitelist>(config.whitelist_paths);
    }
    return std::make_shared<NeverWhitelisted>();
}

Pipeline build_pipeline(const control::Config& config,
                        std::shared_ptr<const BlockedHandler> blocked,
                        std::shared_ptr<const WhitelistPredicate> whitelisted) {
    auto* logger = logging::get_current_logger();

    if (!blocked) {
        blocked = build_blocked_handler(config.csrf);
    }
    if (!whitelisted) {
        whitelisted = build_whitelist(config.csrf);
    } else if (!config.csrf.whitelist_paths.empty() && logger) {
        LOG_WARNING(logger, "build_pipeline: explicit whitelist predicate overrides {} whitelist_paths",
                    config.csrf.whitelist_paths.size());
    }

    if (logger) {
        LOG_INFO(logger,
                 "build_pipeline: parameter_name={}, header_name={}, token_length={}, "
                 "add_meta={}, onetime={}, whitelist_paths={}",
                 config.csrf.parameter_name, config.csrf.header_name, config.csrf.token_length,
                 config.csrf.add_meta, config.csrf.onetime, config.csrf.whitelist_paths.size());
    }

    PipelineBuilder builder;
    builder
        .use(std::make_unique<CsrfMiddleware>(config.csrf, std::move(blocked),
                                              std::move(whitelisted)))
        .use(std::make_unique<LoggingMiddleware>());
    return std::move(builder).build();
}

std::unique_ptr<Gateway> build_gateway(const control::Config& config, Application app,
                                       std::shared_ptr<const BlockedHandler> blocked,
                                       std::shared_ptr<const WhitelistPredicate> whitelisted) {
    return std::make_unique<Gateway>(
        build_pipeline(config, std::move(blocked), std::move(whitelisted)), std::move(app));
}

}  // namespace csrfguard::gateway
