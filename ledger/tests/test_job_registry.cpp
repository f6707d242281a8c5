#include <catch2/catch_test_macros.hpp>
#include "../src/errors.hpp"
#include "../src/job.hpp"

namespace {
    void run_all_steps(JobRegistry& jobs, const std::string& id) {
        for (const auto& [key, label] : PIPELINE_STEPS) {
            jobs.start_step(id, key);
            jobs.complete_step(id, key);
        }
    }
}

TEST_CASE("Job lifecycle", "[jobs]") {
    int64_t now = 1700000000;
    JobRegistry jobs(3600, 5, [&now]() { return now; });

    SECTION("New job has every step pending") {
        auto job = jobs.create();
        REQUIRE(job.status == JobStatus::Pending);
        REQUIRE(job.steps.size() == PIPELINE_STEPS.size());
        REQUIRE(job.steps[0].key == "upload");
        REQUIRE(job.steps.back().key == "aggregate");
        REQUIRE(job.created_at == now);
    }

    SECTION("Steps run in order") {
        auto job = jobs.create();
        REQUIRE_THROWS_AS(jobs.start_step(job.id, "compute"), std::logic_error);

        jobs.start_step(job.id, "upload");
        auto running = jobs.get(job.id);
        REQUIRE(running.status == JobStatus::Running);
        REQUIRE(running.step("upload")->status == StepStatus::Running);
        REQUIRE(running.messages.back() == "Receiving sources...");

        REQUIRE_THROWS_AS(jobs.complete_step(job.id, "normalize"), std::logic_error);
        jobs.complete_step(job.id, "upload");
        REQUIRE(jobs.get(job.id).step("upload")->status == StepStatus::Completed);
    }

    SECTION("Finish records the session") {
        auto job = jobs.create();
        REQUIRE_THROWS_AS(jobs.finish(job.id, "s1"), std::logic_error);

        run_all_steps(jobs, job.id);
        jobs.finish(job.id, "s1");

        auto done = jobs.get(job.id);
        REQUIRE(done.status == JobStatus::Completed);
        REQUIRE(done.is_terminal());
        REQUIRE(*done.session_id == "s1");
        REQUIRE(done.finished_at.has_value());
        REQUIRE_THROWS_AS(jobs.start_step(job.id, "upload"), std::logic_error);
    }

    SECTION("Failure marks the running step") {
        auto job = jobs.create();
        jobs.start_step(job.id, "upload");
        jobs.complete_step(job.id, "upload");
        jobs.start_step(job.id, "normalize");
        jobs.fail(job.id, "Line 3: Invalid side: 'HOLD'");

        auto failed = jobs.get(job.id);
        REQUIRE(failed.status == JobStatus::Error);
        REQUIRE(*failed.error == "Line 3: Invalid side: 'HOLD'");
        REQUIRE(failed.step("normalize")->status == StepStatus::Error);
        REQUIRE(failed.step("compute")->status == StepStatus::Pending);
        REQUIRE_FALSE(failed.session_id.has_value());
    }

    SECTION("Log is bounded") {
        auto job = jobs.create();
        for (int i = 0; i < 8; i++) {
            jobs.log(job.id, "message " + std::to_string(i));
        }
        auto logged = jobs.get(job.id);
        REQUIRE(logged.messages.size() == 5);
        REQUIRE(logged.messages.front() == "message 3");
        REQUIRE(logged.messages.back() == "message 7");
    }

    SECTION("Unknown ids") {
        REQUIRE_THROWS_AS(jobs.get("missing"), JobNotFound);
        REQUIRE_THROWS_AS(jobs.log("missing", "x"), JobNotFound);
    }

    SECTION("Finished jobs expire after the TTL") {
        auto finished = jobs.create();
        run_all_steps(jobs, finished.id);
        jobs.finish(finished.id, "s1");
        auto running = jobs.create();
        jobs.start_step(running.id, "upload");

        now += 3599;
        REQUIRE_NOTHROW(jobs.get(finished.id));

        now += 1;
        REQUIRE_THROWS_AS(jobs.get(finished.id), JobNotFound);
        REQUIRE(jobs.size() == 2);

        // Unfinished jobs never expire
        REQUIRE_NOTHROW(jobs.get(running.id));
        REQUIRE(jobs.purge_expired() == 1);
        REQUIRE(jobs.size() == 1);
    }

    SECTION("JSON shape") {
        auto job = jobs.create();
        nlohmann::json j = jobs.get(job.id);
        REQUIRE(j["job_id"] == job.id);
        REQUIRE(j["status"] == "pending");
        REQUIRE(j["steps"].size() == 5);
        REQUIRE(j["session_id"].is_null());
    }
}
