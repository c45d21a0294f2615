#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include "logging.hpp"

namespace stockguard {

/**
 * Runtime settings, read from STOCKGUARD_* environment variables.
 *
 * Production deployments configure the binary through the environment so the
 * same build runs everywhere. Every field has a default; a malformed value
 * fails startup with InvalidArgumentError instead of silently using the default.
 */
struct Config {
    std::string port = "51010";
    std::string db_path = "stockguard.db";
    std::size_t db_pool_size = 8;
    std::chrono::milliseconds db_busy_timeout{5000};

    std::chrono::seconds reservation_ttl{15 * 60};
    std::chrono::seconds expiry_sweep_interval{30};

    std::chrono::seconds webhook_retry_interval{60};
    std::size_t webhook_batch_size = 10;
    int webhook_max_retries = 5;
    std::chrono::seconds webhook_initial_backoff{60};
    std::chrono::seconds webhook_max_backoff{60 * 60};

    // Generic payment webhook secret, used when a provider has none of its own.
    std::string webhook_secret;
    // Keyed by lower-cased provider name.
    std::map<std::string, std::string> provider_secrets;

    LogLevel log_level = LogLevel::Info;

    using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

    /**
     * Build a Config from the process environment.
     */
    static Config from_env();

    /**
     * Build a Config from an arbitrary lookup. Provider secrets are read for
     * every name listed in STOCKGUARD_WEBHOOK_PROVIDERS (comma separated) as
     * STOCKGUARD_WEBHOOK_SECRET_<PROVIDER>.
     */
    static Config from_lookup(const EnvLookup& lookup);

    /**
     * Secret for a provider, falling back to the generic secret.
     */
    const std::string& secret_for(const std::string& provider) const;
};

}  // namespace stockguard
