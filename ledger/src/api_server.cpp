#include "api_server.hpp"
#include "dashboard.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace {
    // Multipart text fields arrive as form parts, urlencoded ones as params.
    std::string form_field(const httplib::Request& req, const std::string& name) {
        if (req.has_file(name)) return req.get_file_value(name).content;
        if (req.has_param(name)) return req.get_param_value(name);
        return "";
    }

    std::string session_param(const httplib::Request& req) {
        std::string id = req.has_param("session_id") ? util::trim(req.get_param_value("session_id")) : "";
        if (id.empty()) {
            throw std::invalid_argument("session_id is required");
        }
        return id;
    }
}

ApiServer::ApiServer(const Config& config,
                     AnalysisPipeline& pipeline,
                     JobRegistry& jobs,
                     SessionStore& sessions,
                     const HealthCheck& health)
    : config_(config)
    , pipeline_(pipeline)
    , jobs_(jobs)
    , sessions_(sessions)
    , health_(health)
    , server_(std::make_unique<httplib::Server>())
{}

void ApiServer::start() {
    if (running_) return;

    setup_routes();
    running_ = true;

    server_thread_ = std::thread([this]() {
        spdlog::info("Starting HTTP server on {}:{}",
                     config_.listen_addr, config_.listen_port);
        if (!server_->listen(config_.listen_addr.c_str(), config_.listen_port)) {
            spdlog::error("HTTP server could not listen on {}:{}", config_.listen_addr, config_.listen_port);
            running_ = false;
        }
    });

    spdlog::info("API server started");
}

void ApiServer::stop() {
    if (!running_ && !server_thread_.joinable()) return;

    running_ = false;
    server_->stop();

    if (server_thread_.joinable()) {
        server_thread_.join();
    }

    spdlog::info("API server stopped");
}

void ApiServer::setup_routes() {
    server_->set_default_headers({
        {"Access-Control-Allow-Origin", "*"},
        {"Access-Control-Allow-Methods", "GET, POST, DELETE, OPTIONS"},
        {"Access-Control-Allow-Headers", "Content-Type"}
    });

    server_->Options(R"(/api/.*)",
        [](const httplib::Request&, httplib::Response& res) {
            res.status = 204;
        });

    server_->Post("/api/analyze",
        [this](const httplib::Request& req, httplib::Response& res) {
            handle_analyze(req, res, false);
        });

    server_->Post("/api/upload/binance-csv",
        [this](const httplib::Request& req, httplib::Response& res) {
            handle_analyze(req, res, true);
        });

    server_->Get(R"(/api/jobs/([A-Za-z0-9\-]+))",
        [this](const httplib::Request& req, httplib::Response& res) {
            handle_job(req, res);
        });

    server_->Get("/api/dashboard",
        [this](const httplib::Request& req, httplib::Response& res) {
            handle_dashboard(req, res);
        });

    server_->Get("/api/export/operations",
        [this](const httplib::Request& req, httplib::Response& res) {
            handle_export(req, res);
        });

    server_->Delete(R"(/api/sessions/([A-Za-z0-9\-]+))",
        [this](const httplib::Request& req, httplib::Response& res) {
            handle_delete_session(req, res);
        });

    server_->Get("/health",
        [this](const httplib::Request& req, httplib::Response& res) {
            handle_health(req, res);
        });
}

void ApiServer::send_error(httplib::Response& res, int status, const std::string& detail) {
    nlohmann::json body = {{"detail", detail}};
    res.set_content(body.dump(), "application/json");
    res.status = status;
}

AnalysisRequest ApiServer::parse_analyze_request(const httplib::Request& req, bool csv_only) {
    AnalysisRequest request;

    if (req.has_file("file")) {
        const auto& file = req.get_file_value("file");
        if (!util::trim(file.content).empty()) {
            request.csv_content = file.content;
            request.csv_name = file.filename;
        }
    }

    if (csv_only) {
        if (!request.csv_content) {
            throw std::invalid_argument("A CSV file is required");
        }
        return request;
    }

    request.btc_addresses = util::split_list(form_field(req, "btc_addresses"));
    request.evm_addresses = util::split_list(form_field(req, "evm_addresses"));
    for (const auto& chain : util::split_list(form_field(req, "chains"))) {
        request.chains.push_back(util::to_lower(chain));
    }

    if (request.empty()) {
        throw std::invalid_argument("Provide a CSV file or at least one wallet address");
    }
    return request;
}

std::map<std::string, std::string> ApiServer::query_params(const httplib::Request& req) {
    std::map<std::string, std::string> params;
    for (const auto& [key, value] : req.params) {
        params.emplace(key, value);
    }
    return params;
}

void ApiServer::handle_analyze(const httplib::Request& req, httplib::Response& res, bool csv_only) {
    try {
        auto request = parse_analyze_request(req, csv_only);
        std::string job_id = pipeline_.submit(std::move(request));

        nlohmann::json body = {{"job_id", job_id}};
        res.set_content(body.dump(), "application/json");
        res.status = 202;

    } catch (const std::invalid_argument& e) {
        send_error(res, 400, e.what());
    } catch (const std::exception& e) {
        spdlog::error("Analyze handler error: {}", e.what());
        send_error(res, 500, e.what());
    }
}

void ApiServer::handle_job(const httplib::Request& req, httplib::Response& res) {
    try {
        Job job = jobs_.get(req.matches[1]);
        nlohmann::json body = job;
        res.set_content(body.dump(), "application/json");
        res.status = 200;

    } catch (const JobNotFound& e) {
        send_error(res, 404, e.what());
    } catch (const std::exception& e) {
        spdlog::error("Job handler error: {}", e.what());
        send_error(res, 500, e.what());
    }
}

void ApiServer::handle_dashboard(const httplib::Request& req, httplib::Response& res) {
    try {
        auto filters = DashboardFilters::from_params(query_params(req));
        auto session = sessions_.require(session_param(req));

        auto body = build_dashboard(*session, filters);
        res.set_content(body.dump(), "application/json");
        res.status = 200;

    } catch (const SessionNotFound& e) {
        send_error(res, 404, e.what());
    } catch (const std::invalid_argument& e) {
        send_error(res, 400, e.what());
    } catch (const std::exception& e) {
        spdlog::error("Dashboard handler error: {}", e.what());
        send_error(res, 500, e.what());
    }
}

void ApiServer::handle_export(const httplib::Request& req, httplib::Response& res) {
    try {
        auto filters = DashboardFilters::from_params(query_params(req));
        auto session = sessions_.require(session_param(req));

        res.set_content(export_operations_csv(*session, filters), "text/csv");
        res.set_header("Content-Disposition", "attachment; filename=\"operations.csv\"");
        res.status = 200;

    } catch (const SessionNotFound& e) {
        send_error(res, 404, e.what());
    } catch (const std::invalid_argument& e) {
        send_error(res, 400, e.what());
    } catch (const std::exception& e) {
        spdlog::error("Export handler error: {}", e.what());
        send_error(res, 500, e.what());
    }
}

void ApiServer::handle_delete_session(const httplib::Request& req, httplib::Response& res) {
    try {
        std::string id = req.matches[1];
        if (!sessions_.remove(id)) {
            throw SessionNotFound(id);
        }

        nlohmann::json body = {{"deleted", id}};
        res.set_content(body.dump(), "application/json");
        res.status = 200;

    } catch (const SessionNotFound& e) {
        send_error(res, 404, e.what());
    } catch (const std::exception& e) {
        spdlog::error("Delete session handler error: {}", e.what());
        send_error(res, 500, e.what());
    }
}

void ApiServer::handle_health(const httplib::Request&, httplib::Response& res) {
    auto status = health_.get_status();
    res.set_content(status.dump(), "application/json");
    res.status = status.value("ok", false) ? 200 : 503;
}
