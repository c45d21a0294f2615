#include "stockguard/config.hpp"
#include "stockguard/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>

namespace stockguard {

namespace {

std::string upper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

std::string lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string trim(const std::string& value) {
    auto begin = value.find_first_not_of(" \t");
    if (begin == std::string::npos) return "";
    auto end = value.find_last_not_of(" \t");
    return value.substr(begin, end - begin + 1);
}

int64_t parse_int(const std::string& name, const std::string& raw, int64_t min_value) {
    std::size_t consumed = 0;
    long long value = 0;
    try {
        value = std::stoll(raw, &consumed);
    } catch (const std::exception&) {
        throw InvalidArgumentError(name + " must be an integer, got '" + raw + "'");
    }
    if (consumed != raw.size()) {
        throw InvalidArgumentError(name + " must be an integer, got '" + raw + "'");
    }
    if (value < min_value) {
        throw InvalidArgumentError(name + " must be at least " + std::to_string(min_value));
    }
    return value;
}

}  // namespace

Config Config::from_env() {
    return from_lookup([](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (!value) return std::nullopt;
        return std::string(value);
    });
}

Config Config::from_lookup(const EnvLookup& lookup) {
    Config config;

    auto integer = [&](const std::string& name, int64_t min_value) -> std::optional<int64_t> {
        auto raw = lookup(name);
        if (!raw || raw->empty()) return std::nullopt;
        return parse_int(name, *raw, min_value);
    };

    if (auto port = lookup("STOCKGUARD_PORT"); port && !port->empty()) {
        parse_int("STOCKGUARD_PORT", *port, 1);
        config.port = *port;
    }
    if (auto path = lookup("STOCKGUARD_DB_PATH"); path && !path->empty()) {
        config.db_path = *path;
    }
    if (auto v = integer("STOCKGUARD_DB_POOL_SIZE", 1)) {
        config.db_pool_size = static_cast<std::size_t>(*v);
    }
    if (auto v = integer("STOCKGUARD_DB_BUSY_TIMEOUT_MS", 0)) {
        config.db_busy_timeout = std::chrono::milliseconds(*v);
    }
    if (auto v = integer("STOCKGUARD_RESERVATION_TTL_SECONDS", 1)) {
        config.reservation_ttl = std::chrono::seconds(*v);
    }
    if (auto v = integer("STOCKGUARD_EXPIRY_SWEEP_SECONDS", 1)) {
        config.expiry_sweep_interval = std::chrono::seconds(*v);
    }
    if (auto v = integer("STOCKGUARD_WEBHOOK_RETRY_SECONDS", 1)) {
        config.webhook_retry_interval = std::chrono::seconds(*v);
    }
    if (auto v = integer("STOCKGUARD_WEBHOOK_BATCH_SIZE", 1)) {
        config.webhook_batch_size = static_cast<std::size_t>(*v);
    }
    if (auto v = integer("STOCKGUARD_WEBHOOK_MAX_RETRIES", 1)) {
        config.webhook_max_retries = static_cast<int>(*v);
    }
    if (auto v = integer("STOCKGUARD_WEBHOOK_INITIAL_BACKOFF_SECONDS", 0)) {
        config.webhook_initial_backoff = std::chrono::seconds(*v);
    }
    if (auto v = integer("STOCKGUARD_WEBHOOK_MAX_BACKOFF_SECONDS", 0)) {
        config.webhook_max_backoff = std::chrono::seconds(*v);
    }
    if (config.webhook_max_backoff < config.webhook_initial_backoff) {
        throw InvalidArgumentError(
            "STOCKGUARD_WEBHOOK_MAX_BACKOFF_SECONDS must not be below the initial backoff");
    }

    if (auto level = lookup("STOCKGUARD_LOG_LEVEL"); level && !level->empty()) {
        config.log_level = parse_log_level(lower(*level));
    }

    if (auto secret = lookup("PAYMENT_WEBHOOK_SECRET")) {
        config.webhook_secret = *secret;
    }
    if (auto providers = lookup("STOCKGUARD_WEBHOOK_PROVIDERS")) {
        std::stringstream ss(*providers);
        std::string provider;
        while (std::getline(ss, provider, ',')) {
            provider = trim(provider);
            if (provider.empty()) continue;
            auto secret = lookup("STOCKGUARD_WEBHOOK_SECRET_" + upper(provider));
            if (secret && !secret->empty()) {
                config.provider_secrets[lower(provider)] = *secret;
            }
        }
    }

    return config;
}

const std::string& Config::secret_for(const std::string& provider) const {
    auto it = provider_secrets.find(lower(provider));
    return it != provider_secrets.end() ? it->second : webhook_secret;
}

}  // namespace stockguard
