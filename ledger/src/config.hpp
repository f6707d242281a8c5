#pragma once

#include <map>
#include <string>
#include <cstdlib>

struct Config {
    // HTTP
    std::string listen_addr;
    int listen_port;

    // Service
    std::string service_name;
    std::string log_level;

    // Accounting
    std::string reporting_currency;
    std::string exchange;

    // Upstream APIs
    std::string coingecko_base;
    std::string coingecko_api_key;
    std::string blockstream_base;
    std::map<std::string, std::string> explorer_keys;   // chain id -> API key
    int evm_page_size;
    int chain_max_pages;
    int request_timeout_ms;

    // Jobs and sessions
    int job_ttl_seconds;
    int job_log_limit;
    int max_history_points;
    int max_sessions;

    // Optional backends
    std::string pg_dsn;
    std::string redis_url;
    std::string stream_audit;

    static Config from_env();
    void validate() const;

private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
};
