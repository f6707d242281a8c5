#include "config.hpp"
#include "evm_chains.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

Config Config::from_env() {
    Config cfg;

    cfg.listen_addr = get_env("LISTEN_ADDR", "0.0.0.0");
    cfg.listen_port = get_env_int("LISTEN_PORT", 8000);

    cfg.service_name = get_env("SERVICE_NAME", "cryptoledger");
    cfg.log_level = get_env("LOG_LEVEL", "info");

    cfg.reporting_currency = util::to_upper(util::trim(get_env("REPORTING_CURRENCY", "EUR")));
    cfg.exchange = get_env("EXCHANGE_NAME", "binance");

    cfg.coingecko_base = get_env("COINGECKO_BASE", "https://api.coingecko.com/api/v3");
    cfg.coingecko_api_key = get_env("COINGECKO_API_KEY");
    cfg.blockstream_base = get_env("BLOCKSTREAM_BASE", "https://blockstream.info/api");
    for (const auto& chain : evm_chains()) {
        cfg.explorer_keys[chain.chain_id] = get_env(chain.api_key_env.c_str());
    }
    cfg.evm_page_size = get_env_int("EVM_PAGE_SIZE", 1000);
    cfg.chain_max_pages = get_env_int("CHAIN_MAX_PAGES", 20);
    cfg.request_timeout_ms = get_env_int("REQUEST_TIMEOUT_MS", 15000);

    cfg.job_ttl_seconds = get_env_int("JOB_TTL_SECONDS", 3600);
    cfg.job_log_limit = get_env_int("JOB_LOG_LIMIT", 100);
    cfg.max_history_points = get_env_int("MAX_HISTORY_POINTS", 365);
    cfg.max_sessions = get_env_int("MAX_SESSIONS", 50);

    cfg.pg_dsn = get_env("PG_DSN");
    cfg.redis_url = get_env("REDIS_URL");
    cfg.stream_audit = get_env("STREAM_AUDIT", "cryptoledger.audit");

    return cfg;
}

void Config::validate() const {
    if (reporting_currency.empty()) {
        throw std::runtime_error("REPORTING_CURRENCY must not be empty");
    }
    if (listen_port < 1 || listen_port > 65535) {
        throw std::runtime_error("LISTEN_PORT must be between 1 and 65535");
    }
    if (evm_page_size <= 0 || chain_max_pages <= 0 || request_timeout_ms <= 0) {
        throw std::runtime_error("EVM_PAGE_SIZE, CHAIN_MAX_PAGES and REQUEST_TIMEOUT_MS must be positive");
    }
    if (job_ttl_seconds <= 0 || job_log_limit <= 0 || max_history_points <= 1 || max_sessions < 0) {
        throw std::runtime_error("JOB_TTL_SECONDS, JOB_LOG_LIMIT, MAX_HISTORY_POINTS and MAX_SESSIONS out of range");
    }

    spdlog::info("Configuration validated successfully");
    spdlog::info("  Reporting currency: {}", reporting_currency);
    spdlog::info("  Session store: {}", pg_dsn.empty() ? "memory" : util::redact_dsn(pg_dsn));
    spdlog::info("  Audit events: {}", redis_url.empty() ? "disabled" : stream_audit);
}
