#pragma once

#include "config.hpp"
#include "health.hpp"
#include "job.hpp"
#include "pipeline.hpp"
#include "session_store.hpp"
#include <httplib.h>
#include <atomic>
#include <map>
#include <memory>
#include <string>
#include <thread>

class ApiServer {
public:
    ApiServer(const Config& config,
              AnalysisPipeline& pipeline,
              JobRegistry& jobs,
              SessionStore& sessions,
              const HealthCheck& health);

    void start();
    void stop();
    bool is_running() const { return running_; }

    // Multipart fields: file, btc_addresses, evm_addresses, chains.
    // Throws std::invalid_argument when there is nothing to analyze.
    static AnalysisRequest parse_analyze_request(const httplib::Request& req, bool csv_only);
    static std::map<std::string, std::string> query_params(const httplib::Request& req);

private:
    const Config& config_;
    AnalysisPipeline& pipeline_;
    JobRegistry& jobs_;
    SessionStore& sessions_;
    const HealthCheck& health_;

    std::unique_ptr<httplib::Server> server_;
    std::atomic<bool> running_{false};
    std::thread server_thread_;

    void setup_routes();
    void handle_analyze(const httplib::Request& req, httplib::Response& res, bool csv_only);
    void handle_job(const httplib::Request& req, httplib::Response& res);
    void handle_dashboard(const httplib::Request& req, httplib::Response& res);
    void handle_export(const httplib::Request& req, httplib::Response& res);
    void handle_delete_session(const httplib::Request& req, httplib::Response& res);
    void handle_health(const httplib::Request& req, httplib::Response& res);

    static void send_error(httplib::Response& res, int status, const std::string& detail);
};
