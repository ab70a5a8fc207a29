#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "vouchrun/strategy.h"
#include "vouchrun/types.h"

namespace vouchrun {

class Scheduler;

struct OrchestratorConfig {
    int max_parallel_tasks = 16;                       // Concurrent tasks per job
    ResourceLimits default_limits;
    VerificationMode default_mode = VerificationMode::HASH;
    std::chrono::seconds job_retention{5 * 60};        // Finished jobs are kept this long
};

struct JobRequest {
    std::string job_id;                                // Generated when empty
    std::string split_strategy;
    std::string merge_strategy;
    Bytes input;
    Bytes module;                                      // Sandbox bytecode run for every task
    std::optional<ResourceLimits> limits;              // Config defaults when unset
    std::optional<VerificationMode> verification;
    std::string expected_merkle_root;                  // Merkle mode only, optional
    std::vector<std::string> expected_digests;         // Output SHA256 per ordinal, optional
    bool redundancy_opt_out = false;
};

struct TaskSummary {
    std::string task_id;
    uint32_t ordinal = 0;
    TaskState state = TaskState::PENDING;
    std::string worker_id;
    int attempts = 0;
    VerificationRecord record;
};

// Inspection view of a job
struct JobDetails {
    std::string job_id;
    JobState state = JobState::CREATED;
    std::string split_strategy;
    std::string merge_strategy;
    VerificationMode mode = VerificationMode::HASH;
    std::string input_digest;
    size_t input_size = 0;
    std::vector<TaskSummary> tasks;                    // Ordinal order
    std::string merkle_root;
    bool reran_with_redundancy = false;
    JobFailure failure;
    std::chrono::system_clock::time_point created_at;
    std::chrono::system_clock::time_point completed_at;
};

// Accepts jobs, splits them into tasks, drives the tasks through the
// scheduler, verifies and merges their results. Each job runs on its own
// thread; destruction cancels and joins them.
class JobOrchestrator {
public:
    using StateListener = std::function<void(const std::string& job_id, JobState from, JobState to)>;

    JobOrchestrator(std::shared_ptr<Scheduler> scheduler,
                    const OrchestratorConfig& config = OrchestratorConfig());
    ~JobOrchestrator();

    JobOrchestrator(const JobOrchestrator&) = delete;
    JobOrchestrator& operator=(const JobOrchestrator&) = delete;

    // Throws std::invalid_argument for unknown strategies, an empty module
    // or a job ID that is already in use. Jobs finished longer ago than
    // job_retention are forgotten on every submit.
    std::string submit(const JobRequest& request);
    std::string submit(const std::string& split_strategy,
                       const std::string& merge_strategy,
                       const Bytes& input,
                       const Bytes& module);

    std::optional<JobStatus> poll_status(const std::string& job_id) const;

    // Merged output or failure; nullopt while running or for unknown jobs
    std::optional<JobResult> get_result(const std::string& job_id) const;

    std::optional<JobResult> wait_for_result(const std::string& job_id,
                                             std::chrono::milliseconds timeout) const;

    // Returns false if the job is unknown or already finished
    bool cancel(const std::string& job_id);

    std::optional<JobDetails> details(const std::string& job_id) const;
    std::vector<std::string> list_jobs() const;

    // Called on every job state transition, from the job's thread
    void set_state_listener(StateListener listener);

    StrategyRegistry& strategies();

private:
    class Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace vouchrun
