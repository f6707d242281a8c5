#pragma once

#include "chain_client.hpp"
#include "job.hpp"
#include "price_resolver.hpp"
#include "session_store.hpp"
#include "wallet_normalizer.hpp"
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct AnalysisRequest {
    std::optional<std::string> csv_content;
    std::string csv_name;
    std::vector<std::string> btc_addresses;
    std::vector<std::string> evm_addresses;
    std::vector<std::string> chains;

    bool empty() const;
    // EVM addresses without chains default to ethereum.
    std::vector<WalletSource> wallet_sources() const;
};

struct PipelineOptions {
    std::string exchange = "binance";
    int max_pages = 20;
    size_t max_history_points = 365;
};

// Runs the upload -> normalize -> compute -> pricing -> aggregate steps for
// each submitted request and stores the resulting session.
class AnalysisPipeline {
public:
    AnalysisPipeline(JobRegistry& jobs, SessionStore& sessions, PriceResolver& resolver,
                     ChainClientFactory factory, PipelineOptions options = {});
    ~AnalysisPipeline();

    AnalysisPipeline(const AnalysisPipeline&) = delete;
    AnalysisPipeline& operator=(const AnalysisPipeline&) = delete;

    // Returns the job id immediately; the work continues in the background.
    std::string submit(AnalysisRequest request);

    // Runs every step for an existing job on the calling thread. Never throws;
    // failures end up in the job.
    void run(const std::string& job_id, const AnalysisRequest& request);

    void wait_all();

private:
    JobRegistry& jobs_;
    SessionStore& sessions_;
    PriceResolver& resolver_;
    ChainClientFactory factory_;
    PipelineOptions options_;

    std::mutex runs_mutex_;
    std::vector<std::future<void>> runs_;

    void run_step(const std::string& job_id, const std::string& key, const std::function<void()>& fn);
    void sweep_finished();
};
