#pragma once

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

enum class StepStatus {
    Pending,
    Running,
    Completed,
    Error
};

enum class JobStatus {
    Pending,
    Running,
    Completed,
    Error
};

std::string step_status_string(StepStatus status);
std::string job_status_string(JobStatus status);

// (key, label) in execution order.
extern const std::vector<std::pair<std::string, std::string>> PIPELINE_STEPS;

struct JobStep {
    std::string key;
    std::string label;
    StepStatus status = StepStatus::Pending;
};

struct Job {
    std::string id;
    JobStatus status = JobStatus::Pending;
    std::vector<JobStep> steps;
    std::deque<std::string> messages;
    std::optional<std::string> session_id;
    std::optional<std::string> error;
    int64_t created_at = 0;
    int64_t updated_at = 0;
    std::optional<int64_t> finished_at;

    bool is_terminal() const { return status == JobStatus::Completed || status == JobStatus::Error; }
    const JobStep* step(const std::string& key) const;
};

void to_json(nlohmann::json& j, const Job& job);

class JobRegistry {
public:
    using Clock = std::function<int64_t()>;

    explicit JobRegistry(int ttl_seconds = 3600, size_t log_limit = 100, Clock clock = nullptr);

    // Also drops jobs whose TTL has run out.
    Job create();

    // Copy of the current state. Throws JobNotFound for unknown or expired ids.
    Job get(const std::string& id) const;

    // Steps must run in PIPELINE_STEPS order; throws std::logic_error otherwise.
    void start_step(const std::string& id, const std::string& key);
    void complete_step(const std::string& id, const std::string& key);
    // Marks the running step (if any) and the job as failed.
    void fail(const std::string& id, const std::string& error);
    void finish(const std::string& id, const std::string& session_id);

    void log(const std::string& id, const std::string& message);

    size_t purge_expired();
    size_t size() const;

private:
    int ttl_seconds_;
    size_t log_limit_;
    Clock clock_;
    mutable std::mutex mutex_;
    std::map<std::string, Job> jobs_;

    bool expired(const Job& job, int64_t now) const;
    Job& find(const std::string& id);
    void append_log(Job& job, const std::string& message);
};
