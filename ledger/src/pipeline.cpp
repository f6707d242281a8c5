#include "pipeline.hpp"
#include "csv_normalizer.hpp"
#include "errors.hpp"
#include "fifo_engine.hpp"
#include "ledger.hpp"
#include "reporting.hpp"
#include "util.hpp"
#include <chrono>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

bool AnalysisRequest::empty() const {
    bool has_csv = csv_content.has_value() && !util::trim(*csv_content).empty();
    return !has_csv && btc_addresses.empty() && evm_addresses.empty();
}

std::vector<WalletSource> AnalysisRequest::wallet_sources() const {
    std::vector<WalletSource> sources;
    if (!btc_addresses.empty()) {
        sources.push_back({"bitcoin", btc_addresses});
    }
    if (!evm_addresses.empty()) {
        std::vector<std::string> targets = chains;
        if (targets.empty()) targets.push_back("ethereum");
        for (const auto& chain : targets) {
            sources.push_back({chain, evm_addresses});
        }
    }
    return sources;
}

AnalysisPipeline::AnalysisPipeline(JobRegistry& jobs, SessionStore& sessions, PriceResolver& resolver,
                                   ChainClientFactory factory, PipelineOptions options)
    : jobs_(jobs)
    , sessions_(sessions)
    , resolver_(resolver)
    , factory_(std::move(factory))
    , options_(std::move(options))
{}

AnalysisPipeline::~AnalysisPipeline() {
    wait_all();
}

std::string AnalysisPipeline::submit(AnalysisRequest request) {
    sweep_finished();

    Job job = jobs_.create();
    std::string job_id = job.id;
    spdlog::info("Submitted analysis job {}", job_id);

    auto future = std::async(std::launch::async, [this, job_id, request = std::move(request)]() {
        run(job_id, request);
    });

    std::lock_guard<std::mutex> lock(runs_mutex_);
    runs_.push_back(std::move(future));
    return job_id;
}

void AnalysisPipeline::sweep_finished() {
    std::lock_guard<std::mutex> lock(runs_mutex_);
    std::vector<std::future<void>> pending;
    for (auto& f : runs_) {
        if (f.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
            f.get();
        } else {
            pending.push_back(std::move(f));
        }
    }
    runs_ = std::move(pending);
}

void AnalysisPipeline::wait_all() {
    std::vector<std::future<void>> runs;
    {
        std::lock_guard<std::mutex> lock(runs_mutex_);
        runs = std::move(runs_);
        runs_.clear();
    }
    for (auto& f : runs) {
        f.get();
    }
}

void AnalysisPipeline::run_step(const std::string& job_id, const std::string& key,
                                const std::function<void()>& fn) {
    jobs_.start_step(job_id, key);
    std::async(std::launch::async, fn).get();
    jobs_.complete_step(job_id, key);
}

void AnalysisPipeline::run(const std::string& job_id, const AnalysisRequest& request) {
    std::vector<Transaction> csv_transactions;
    WalletImportResult wallet_result;
    Ledger ledger;
    AccountingResult accounting;
    PriceLookup prices(resolver_);
    Reporter reporter(prices, options_.max_history_points);
    Report report;
    std::string session_id;
    int64_t as_of = util::current_timestamp();

    try {
        run_step(job_id, "upload", [&]() {
            if (request.empty()) {
                throw MalformedInput(InputErrorCode::Empty, "Nothing to analyze: no CSV file and no addresses");
            }
            if (request.csv_content) {
                jobs_.log(job_id, fmt::format("Received {} ({} bytes)",
                    request.csv_name.empty() ? "CSV file" : request.csv_name, request.csv_content->size()));
            }
            size_t addresses = request.btc_addresses.size() + request.evm_addresses.size();
            if (addresses > 0) {
                jobs_.log(job_id, fmt::format("{} wallet addresses to import", addresses));
            }
        });

        run_step(job_id, "normalize", [&]() {
            if (request.csv_content && !util::trim(*request.csv_content).empty()) {
                CsvNormalizer normalizer(options_.exchange);
                csv_transactions = normalizer.normalize(*request.csv_content);
                jobs_.log(job_id, fmt::format("CSV: {} transactions", csv_transactions.size()));
            }

            auto sources = request.wallet_sources();
            if (!sources.empty()) {
                WalletNormalizer wallets(factory_, options_.max_pages);
                wallet_result = wallets.import(sources);
                jobs_.log(job_id, fmt::format("Wallets: {} transactions", wallet_result.transactions.size()));
                for (const auto& warning : wallet_result.warnings) {
                    jobs_.log(job_id, "Warning: " + warning);
                }
            }

            if (csv_transactions.empty() && wallet_result.transactions.empty()) {
                if (!wallet_result.warnings.empty() && !request.csv_content) {
                    throw LedgerError("No source could be read: " + wallet_result.warnings.front());
                }
                throw MalformedInput(InputErrorCode::Empty, "No transactions found in the provided sources");
            }
        });

        run_step(job_id, "compute", [&]() {
            LedgerBuilder builder;
            builder.add_source(options_.exchange + "_csv", std::move(csv_transactions));
            builder.add_source("wallets", std::move(wallet_result.transactions));
            ledger = builder.build();
            if (builder.internal_transfers() > 0) {
                jobs_.log(job_id, fmt::format("{} internal transfers matched", builder.internal_transfers() / 2));
            }

            FifoEngine engine(prices);
            accounting = engine.run(ledger);
            jobs_.log(job_id, fmt::format("{} ledger entries, {} realized gains",
                                          ledger.size(), accounting.gains.size()));
        });

        run_step(job_id, "pricing", [&]() {
            report.valued_at = as_of;
            report.holdings = reporter.value_holdings(accounting, as_of);
            report.history = reporter.build_history(accounting.timeline);
            if (!prices.missing().empty()) {
                jobs_.log(job_id, fmt::format("No {} price for {} assets",
                                              resolver_.reporting_currency(), prices.missing().size()));
            }
        });

        run_step(job_id, "aggregate", [&]() {
            report.summary = Reporter::summarize(accounting, report.holdings);
            report.missing_prices.assign(prices.missing().begin(), prices.missing().end());

            auto session = std::make_shared<Session>();
            session->id = util::generate_uuid();
            session->status = SessionStatus::Ready;
            session->reporting_currency = resolver_.reporting_currency();
            session->ledger = std::move(ledger);
            session->accounting = std::move(accounting);
            session->report = std::move(report);
            session->warnings = wallet_result.warnings;
            session->created_at = as_of;

            session_id = session->id;
            sessions_.put(std::move(session));
        });

        jobs_.finish(job_id, session_id);

        spdlog::info("Job {} completed", job_id);

    } catch (const MalformedInput& e) {
        spdlog::warn("Job {} rejected input: {}", job_id, e.what());
        jobs_.fail(job_id, e.what());
    } catch (const std::exception& e) {
        spdlog::error("Job {} failed: {}", job_id, e.what());
        jobs_.fail(job_id, e.what());
    }
}
