#include "api_server.hpp"
#include "btc_client.hpp"
#include "cg_client.hpp"
#include "config.hpp"
#include "evm_chains.hpp"
#include "evm_client.hpp"
#include "health.hpp"
#include "job.hpp"
#include "pipeline.hpp"
#include "postgres_store.hpp"
#include "price_resolver.hpp"
#include "redis_bus.hpp"
#include "session_store.hpp"
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <signal.h>
#include <atomic>
#include <thread>

std::atomic<bool> shutdown_requested{false};

void signal_handler(int signal) {
    spdlog::info("Received signal {}, initiating shutdown", signal);
    shutdown_requested = true;
}

void setup_logging(const std::string& log_level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("cryptoledger", console_sink);

    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

ChainClientFactory make_chain_factory(std::shared_ptr<Config> config) {
    return [config](const std::string& chain) -> std::unique_ptr<ChainClient> {
        if (chain == "bitcoin" || chain == "btc") {
            return std::make_unique<BtcClient>(config->blockstream_base, config->request_timeout_ms);
        }
        auto evm = find_evm_chain(chain);
        if (!evm) {
            return nullptr;
        }
        auto key = config->explorer_keys.find(evm->chain_id);
        return std::make_unique<EvmClient>(*evm,
                                           key != config->explorer_keys.end() ? key->second : "",
                                           config->evm_page_size,
                                           config->request_timeout_ms);
    };
}

int main(int argc, char* argv[]) {
    try {
        auto config = std::make_shared<Config>(Config::from_env());
        setup_logging(config->log_level);

        spdlog::info("==============================================");
        spdlog::info("CryptoLedger Analysis Service v1.0");
        spdlog::info("==============================================");

        config->validate();

        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);

        curl_global_init(CURL_GLOBAL_DEFAULT);

        // Optional backends
        std::shared_ptr<RedisBus> redis;
        if (!config->redis_url.empty()) {
            redis = std::make_shared<RedisBus>(config->redis_url, config->stream_audit);
        }

        std::shared_ptr<PostgresSessionStore> pg;
        std::shared_ptr<SessionStore> sessions;
        if (!config->pg_dsn.empty()) {
            pg = std::make_shared<PostgresSessionStore>(config->pg_dsn, config->max_sessions);
            pg->init_schema();
            sessions = pg;
        } else {
            sessions = std::make_shared<InMemorySessionStore>(config->max_sessions);
        }
        if (redis) {
            sessions->set_hooks(redis->session_hooks());
        }

        auto cg = std::make_shared<CoinGeckoClient>(config->coingecko_base, config->coingecko_api_key,
                                                    config->request_timeout_ms);
        PriceResolver resolver(cg, config->reporting_currency);
        JobRegistry jobs(config->job_ttl_seconds, config->job_log_limit);

        PipelineOptions options;
        options.exchange = config->exchange;
        options.max_pages = config->chain_max_pages;
        options.max_history_points = config->max_history_points;

        AnalysisPipeline pipeline(jobs, *sessions, resolver, make_chain_factory(config), options);
        HealthCheck health(config->service_name, redis, pg, *sessions, jobs);
        ApiServer server(*config, pipeline, jobs, *sessions, health);

        server.start();
        spdlog::info("CryptoLedger service started");

        // Main loop
        while (!shutdown_requested) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }

        // Shutdown
        spdlog::info("Stopping services...");
        server.stop();
        pipeline.wait_all();
        curl_global_cleanup();

        spdlog::info("Shutdown complete");
        return 0;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
