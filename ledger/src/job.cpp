#include "job.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

const std::vector<std::pair<std::string, std::string>> PIPELINE_STEPS = {
    {"upload", "Receiving sources"},
    {"normalize", "Normalizing transactions"},
    {"compute", "Computing FIFO accounting"},
    {"pricing", "Valuing holdings and history"},
    {"aggregate", "Aggregating report"},
};

std::string step_status_string(StepStatus status) {
    switch (status) {
        case StepStatus::Pending: return "pending";
        case StepStatus::Running: return "running";
        case StepStatus::Completed: return "completed";
        case StepStatus::Error: return "error";
        default: return "unknown";
    }
}

std::string job_status_string(JobStatus status) {
    switch (status) {
        case JobStatus::Pending: return "pending";
        case JobStatus::Running: return "running";
        case JobStatus::Completed: return "completed";
        case JobStatus::Error: return "error";
        default: return "unknown";
    }
}

const JobStep* Job::step(const std::string& key) const {
    for (const auto& s : steps) {
        if (s.key == key) return &s;
    }
    return nullptr;
}

void to_json(nlohmann::json& j, const Job& job) {
    nlohmann::json steps = nlohmann::json::array();
    for (const auto& s : job.steps) {
        steps.push_back({
            {"key", s.key},
            {"label", s.label},
            {"status", step_status_string(s.status)}
        });
    }

    j = nlohmann::json{
        {"job_id", job.id},
        {"status", job_status_string(job.status)},
        {"steps", steps},
        {"messages", job.messages},
        {"session_id", nullptr},
        {"error", nullptr},
        {"created_at", util::format_iso8601(job.created_at)},
        {"updated_at", util::format_iso8601(job.updated_at)}
    };
    if (job.session_id) j["session_id"] = *job.session_id;
    if (job.error) j["error"] = *job.error;
}

JobRegistry::JobRegistry(int ttl_seconds, size_t log_limit, Clock clock)
    : ttl_seconds_(ttl_seconds)
    , log_limit_(log_limit > 0 ? log_limit : 1)
    , clock_(clock ? std::move(clock) : Clock(util::current_timestamp))
{}

bool JobRegistry::expired(const Job& job, int64_t now) const {
    return job.finished_at.has_value() && now - *job.finished_at >= ttl_seconds_;
}

Job& JobRegistry::find(const std::string& id) {
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        throw JobNotFound(id);
    }
    return it->second;
}

void JobRegistry::append_log(Job& job, const std::string& message) {
    job.messages.push_back(message);
    while (job.messages.size() > log_limit_) {
        job.messages.pop_front();
    }
    job.updated_at = clock_();
}

Job JobRegistry::create() {
    purge_expired();

    Job job;
    job.id = util::generate_uuid();
    job.created_at = clock_();
    job.updated_at = job.created_at;
    for (const auto& [key, label] : PIPELINE_STEPS) {
        job.steps.push_back({key, label, StepStatus::Pending});
    }

    std::lock_guard<std::mutex> lock(mutex_);
    jobs_[job.id] = job;
    return job;
}

Job JobRegistry::get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end() || expired(it->second, clock_())) {
        throw JobNotFound(id);
    }
    return it->second;
}

void JobRegistry::start_step(const std::string& id, const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    Job& job = find(id);
    if (job.is_terminal()) {
        throw std::logic_error("Job " + id + " already finished");
    }

    bool found = false;
    for (auto& s : job.steps) {
        if (s.key == key) {
            if (s.status != StepStatus::Pending) {
                throw std::logic_error("Step " + key + " already started");
            }
            s.status = StepStatus::Running;
            found = true;
            break;
        }
        if (s.status != StepStatus::Completed) {
            throw std::logic_error("Step " + key + " started before " + s.key + " completed");
        }
    }
    if (!found) {
        throw std::logic_error("Unknown step " + key);
    }

    job.status = JobStatus::Running;
    append_log(job, job.step(key)->label + "...");
}

void JobRegistry::complete_step(const std::string& id, const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    Job& job = find(id);
    for (auto& s : job.steps) {
        if (s.key == key) {
            if (s.status != StepStatus::Running) {
                throw std::logic_error("Step " + key + " is not running");
            }
            s.status = StepStatus::Completed;
            job.updated_at = clock_();
            return;
        }
    }
    throw std::logic_error("Unknown step " + key);
}

void JobRegistry::fail(const std::string& id, const std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    Job& job = find(id);
    for (auto& s : job.steps) {
        if (s.status == StepStatus::Running) {
            s.status = StepStatus::Error;
        }
    }
    job.status = JobStatus::Error;
    job.error = error;
    append_log(job, "Error: " + error);
    job.finished_at = job.updated_at;
    spdlog::warn("Job {} failed: {}", id, error);
}

void JobRegistry::finish(const std::string& id, const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    Job& job = find(id);
    for (const auto& s : job.steps) {
        if (s.status != StepStatus::Completed) {
            throw std::logic_error("Job " + id + " finished with step " + s.key + " incomplete");
        }
    }
    job.status = JobStatus::Completed;
    job.session_id = session_id;
    append_log(job, "Analysis ready");
    job.finished_at = job.updated_at;
}

void JobRegistry::log(const std::string& id, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    append_log(find(id), message);
}

size_t JobRegistry::purge_expired() {
    std::lock_guard<std::mutex> lock(mutex_);
    int64_t now = clock_();
    size_t removed = 0;
    for (auto it = jobs_.begin(); it != jobs_.end();) {
        if (expired(it->second, now)) {
            it = jobs_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }
    if (removed > 0) {
        spdlog::debug("Purged {} expired jobs", removed);
    }
    return removed;
}

size_t JobRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
}
