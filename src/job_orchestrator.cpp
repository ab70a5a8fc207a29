#include "vouchrun/job_orchestrator.h"
#include "hash_utils.h"
#include "scheduler.h"
#include "verification.h"
#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <ctime>
#include <iostream>
#include <map>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace vouchrun {

namespace {

struct Job {
    JobDetails details;
    VerificationMode mode = VerificationMode::HASH;
    std::string expected_root;
    std::vector<std::string> expected_digests;
    std::shared_ptr<CancelToken> cancel = std::make_shared<CancelToken>();
    Bytes output;
    std::thread thread;
};

JobProgress progress_of(const std::vector<TaskSummary>& tasks) {
    JobProgress progress;
    progress.total = tasks.size();
    for (const auto& task : tasks) {
        switch (task.state) {
            case TaskState::PENDING:
            case TaskState::ASSIGNED:
                progress.pending++;
                break;
            case TaskState::RUNNING:
            case TaskState::VERIFYING:
                progress.running++;
                break;
            case TaskState::VERIFIED:
                progress.verified++;
                break;
            case TaskState::FAILED:
            case TaskState::TIMED_OUT:
            case TaskState::CANCELLED:
                progress.failed++;
                break;
        }
    }
    return progress;
}

} // namespace

class JobOrchestrator::Impl {
public:
    OrchestratorConfig config_;
    std::shared_ptr<Scheduler> scheduler_;
    StrategyRegistry strategies_;
    VerificationEngine verifier_;

    mutable std::mutex mutex_;
    mutable std::condition_variable finished_cv_;
    std::map<std::string, std::shared_ptr<Job>> jobs_;
    StateListener listener_;
    bool shutting_down_ = false;
    uint64_t id_counter_ = 0;

    Impl(std::shared_ptr<Scheduler> scheduler, const OrchestratorConfig& config)
        : config_(config), scheduler_(std::move(scheduler)) {
        if (!scheduler_) {
            throw std::invalid_argument("orchestrator needs a scheduler");
        }
        register_builtin_strategies(strategies_);
    }

    ~Impl() {
        std::vector<std::shared_ptr<Job>> jobs;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            shutting_down_ = true;
            for (auto& entry : jobs_) {
                jobs.push_back(entry.second);
            }
        }
        for (auto& job : jobs) {
            job->cancel->cancel();
        }
        join_all(jobs);
    }

    std::string generate_job_id() {
        std::stringstream ss;
        ss << "job_" << std::time(nullptr) << "_" << (++id_counter_);
        return ss.str();
    }

    std::string submit(const JobRequest& request) {
        auto split = strategies_.find_split(request.split_strategy);
        if (!split) {
            throw std::invalid_argument("unknown split strategy '" + request.split_strategy + "'");
        }
        auto merge = strategies_.find_merge(request.merge_strategy);
        if (!merge) {
            throw std::invalid_argument("unknown merge strategy '" + request.merge_strategy + "'");
        }
        if (request.module.empty()) {
            throw std::invalid_argument("job module is empty");
        }

        auto job = std::make_shared<Job>();
        job->mode = request.verification.value_or(config_.default_mode);
        job->expected_root = request.expected_merkle_root;
        job->expected_digests = request.expected_digests;

        auto& details = job->details;
        details.split_strategy = request.split_strategy;
        details.merge_strategy = request.merge_strategy;
        details.mode = job->mode;
        details.input_digest = HashUtils::sha256(request.input);
        details.input_size = request.input.size();
        details.created_at = std::chrono::system_clock::now();

        ResourceLimits limits = request.limits.value_or(config_.default_limits);

        join_all(evict_finished());

        std::string job_id;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (shutting_down_) {
                throw std::runtime_error("orchestrator is shutting down");
            }
            job_id = request.job_id.empty() ? generate_job_id() : request.job_id;
            while (request.job_id.empty() && jobs_.count(job_id)) {
                job_id = generate_job_id();
            }
            if (jobs_.count(job_id)) {
                throw std::invalid_argument("job ID '" + job_id + "' already exists");
            }
            details.job_id = job_id;
            jobs_[job_id] = job;

            job->thread = std::thread(&Impl::run_job, this, job, request.input, request.module,
                                      limits, request.redundancy_opt_out, split, merge);
        }

        std::cout << "[Orchestrator] Submitted " << job_id << " (" << request.split_strategy
                  << " / " << request.merge_strategy << ", " << request.input.size()
                  << " bytes, " << to_string(job->mode) << ")" << std::endl;
        return job_id;
    }

    // Removes jobs that finished more than job_retention ago. Their threads
    // are returned so they can be joined outside the lock.
    std::vector<std::shared_ptr<Job>> evict_finished() {
        std::vector<std::shared_ptr<Job>> evicted;
        auto now = std::chrono::system_clock::now();
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = jobs_.begin(); it != jobs_.end();) {
            const auto& details = it->second->details;
            if (is_terminal(details.state) && now - details.completed_at >= config_.job_retention) {
                std::cout << "[Orchestrator] Forgetting finished job " << it->first << std::endl;
                evicted.push_back(it->second);
                it = jobs_.erase(it);
            } else {
                ++it;
            }
        }
        return evicted;
    }

    static void join_all(const std::vector<std::shared_ptr<Job>>& jobs) {
        for (const auto& job : jobs) {
            if (!job->thread.joinable()) {
                continue;
            }
            if (job->thread.get_id() == std::this_thread::get_id()) {
                job->thread.detach();  // Submitted from the job's own state listener
            } else {
                job->thread.join();
            }
        }
    }

    void transition(const std::shared_ptr<Job>& job, JobState to) {
        JobState from;
        StateListener listener;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            from = job->details.state;
            job->details.state = to;
            if (is_terminal(to)) {
                job->details.completed_at = std::chrono::system_clock::now();
            }
            listener = listener_;
        }

        std::cout << "[Orchestrator] " << job->details.job_id << ": "
                  << to_string(from) << " -> " << to_string(to) << std::endl;
        if (listener) {
            listener(job->details.job_id, from, to);
        }
        if (is_terminal(to)) {
            finished_cv_.notify_all();
        }
    }

    // First failure wins; later ones (usually cancellations it caused) are dropped
    void record_failure(const std::shared_ptr<Job>& job, ErrorKind kind, const std::string& message) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (job->details.failure.kind == ErrorKind::NONE) {
                job->details.failure.kind = kind;
                job->details.failure.message = message;
            }
        }
        job->cancel->cancel();
    }

    void fail(const std::shared_ptr<Job>& job, ErrorKind kind, const std::string& message) {
        record_failure(job, kind, message);
        finish_failed(job);
    }

    // Moves the job to FAILED with the failure already recorded
    void finish_failed(const std::shared_ptr<Job>& job) {
        JobFailure failure;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            failure = job->details.failure;
        }
        std::cerr << "[Orchestrator] " << job->details.job_id << " failed: "
                  << to_string(failure.kind) << " (" << failure.message << ")" << std::endl;
        transition(job, JobState::FAILED);
    }

    bool failed(const std::shared_ptr<Job>& job) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return job->details.failure.kind != ErrorKind::NONE;
    }

    // Runs every task; returns false once any task fails
    bool execute_tasks(const std::shared_ptr<Job>& job, std::vector<Task>& tasks,
                       std::vector<TaskOutcome>& outcomes, bool force_redundancy) {
        outcomes.assign(tasks.size(), TaskOutcome());
        std::atomic<size_t> next{0};

        auto worker = [&]() {
            for (;;) {
                size_t index = next.fetch_add(1);
                if (index >= tasks.size() || job->cancel->is_cancelled()) {
                    return;
                }

                auto on_change = [this, &job, index](const Task& task) {
                    std::lock_guard<std::mutex> lock(mutex_);
                    auto& summary = job->details.tasks[index];
                    summary.state = task.state;
                    summary.worker_id = task.assigned_worker;
                    summary.attempts = task.retry_count + 1;
                };

                const std::string expected = job->expected_digests.empty()
                    ? std::string() : job->expected_digests[index];
                TaskOutcome outcome = scheduler_->run_task(tasks[index], job->mode, *job->cancel,
                                                           expected, force_redundancy, on_change);
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    auto& summary = job->details.tasks[index];
                    summary.attempts = outcome.attempts;
                    summary.record = outcome.record;
                    if (outcome.ok) {
                        summary.worker_id = outcome.worker_id;
                    }
                }
                if (!outcome.ok) {
                    record_failure(job, outcome.error,
                                   "task " + tasks[index].task_id + ": " + outcome.message);
                    return;
                }
                outcomes[index] = std::move(outcome);
            }
        };

        size_t thread_count = std::min<size_t>(
            tasks.size(), static_cast<size_t>(std::max(1, config_.max_parallel_tasks)));
        std::vector<std::thread> threads;
        for (size_t i = 0; i < thread_count; ++i) {
            threads.emplace_back(worker);
        }
        for (auto& thread : threads) {
            thread.join();
        }

        if (job->cancel->is_cancelled() && !failed(job)) {
            record_failure(job, ErrorKind::CANCELLED, "job cancelled");
        }
        return !failed(job);
    }

    // Commits to the results with a Merkle tree; false on root mismatch
    bool commit_merkle(const std::shared_ptr<Job>& job, const std::vector<TaskOutcome>& outcomes,
                       std::string& message) {
        std::vector<std::string> digests;
        for (const auto& outcome : outcomes) {
            digests.push_back(outcome.digest);
        }
        auto verification = verifier_.verify_merkle(digests, job->expected_root);

        std::lock_guard<std::mutex> lock(mutex_);
        job->details.merkle_root = verification.root;
        for (size_t i = 0; i < verification.records.size(); ++i) {
            job->details.tasks[i].record = verification.records[i];
        }
        message = verification.message;
        return verification.accepted;
    }

    void run_job(std::shared_ptr<Job> job, Bytes input, Bytes module, ResourceLimits limits,
                 bool redundancy_opt_out, std::shared_ptr<const SplitStrategy> split,
                 std::shared_ptr<const MergeStrategy> merge) {
        const std::string job_id = job->details.job_id;

        transition(job, JobState::SPLITTING);
        std::vector<Bytes> chunks;
        try {
            chunks = split->split(input);
        } catch (const SplitError& e) {
            fail(job, ErrorKind::SPLIT_ERROR, e.what());
            return;
        } catch (const std::exception& e) {
            fail(job, ErrorKind::SPLIT_ERROR, std::string("split strategy failed: ") + e.what());
            return;
        }
        if (chunks.empty()) {
            fail(job, ErrorKind::SPLIT_ERROR, "split produced no chunks");
            return;
        }
        if (!job->expected_digests.empty() && job->expected_digests.size() != chunks.size()) {
            fail(job, ErrorKind::SPLIT_ERROR,
                 "split produced " + std::to_string(chunks.size()) + " task(s) but " +
                 std::to_string(job->expected_digests.size()) + " expected digest(s) were given");
            return;
        }
        Bytes().swap(input);  // Input is no longer needed

        transition(job, JobState::SCHEDULING);
        const std::string module_hash = HashUtils::sha256(module);
        std::vector<Task> tasks;
        tasks.reserve(chunks.size());
        for (size_t i = 0; i < chunks.size(); ++i) {
            Task task;
            task.job_id = job_id;
            task.ordinal = static_cast<uint32_t>(i);
            task.task_id = job_id + ":" + std::to_string(i);
            task.input = std::move(chunks[i]);
            task.module = module;
            task.module_hash = module_hash;
            task.limits = limits;
            task.redundancy_opt_out = redundancy_opt_out;
            tasks.push_back(std::move(task));
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& task : tasks) {
                TaskSummary summary;
                summary.task_id = task.task_id;
                summary.ordinal = task.ordinal;
                job->details.tasks.push_back(summary);
            }
        }
        std::cout << "[Orchestrator] " << job_id << " split into " << tasks.size() << " task(s)" << std::endl;

        if (job->cancel->is_cancelled()) {
            fail(job, ErrorKind::CANCELLED, "job cancelled");
            return;
        }

        transition(job, JobState::EXECUTING);
        std::vector<TaskOutcome> outcomes;
        if (!execute_tasks(job, tasks, outcomes, false)) {
            finish_failed(job);
            return;
        }

        if (job->mode == VerificationMode::MERKLE) {
            std::string message;
            if (!commit_merkle(job, outcomes, message)) {
                std::cout << "[Orchestrator] " << job_id << ": " << message
                          << ", re-executing with redundancy" << std::endl;
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    job->details.reran_with_redundancy = true;
                }
                if (!execute_tasks(job, tasks, outcomes, true)) {
                    finish_failed(job);
                    return;
                }
                if (!commit_merkle(job, outcomes, message)) {
                    fail(job, ErrorKind::VERIFICATION_MISMATCH, message);
                    return;
                }
            }
        }

        if (job->cancel->is_cancelled()) {
            fail(job, ErrorKind::CANCELLED, "job cancelled");
            return;
        }

        transition(job, JobState::MERGING);
        std::vector<Bytes> outputs;
        outputs.reserve(outcomes.size());
        for (auto& outcome : outcomes) {
            outputs.push_back(std::move(outcome.output));
        }

        Bytes merged;
        try {
            merged = merge->merge(outputs);
        } catch (const MergeError& e) {
            fail(job, ErrorKind::MERGE_ERROR, e.what());
            return;
        } catch (const std::exception& e) {
            fail(job, ErrorKind::MERGE_ERROR, std::string("merge strategy failed: ") + e.what());
            return;
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            job->output = std::move(merged);
        }
        transition(job, JobState::COMPLETED);
    }

    std::shared_ptr<Job> find(const std::string& job_id) const {
        auto it = jobs_.find(job_id);
        return it == jobs_.end() ? nullptr : it->second;
    }

    JobResult result_of(const Job& job) const {
        JobResult result;
        result.job_id = job.details.job_id;
        result.ok = job.details.state == JobState::COMPLETED;
        if (result.ok) {
            result.output = job.output;
        } else {
            result.failure = job.details.failure;
        }
        return result;
    }
};

JobOrchestrator::JobOrchestrator(std::shared_ptr<Scheduler> scheduler,
                                 const OrchestratorConfig& config)
    : impl(std::make_unique<Impl>(std::move(scheduler), config)) {}

JobOrchestrator::~JobOrchestrator() = default;

std::string JobOrchestrator::submit(const JobRequest& request) {
    return impl->submit(request);
}

std::string JobOrchestrator::submit(const std::string& split_strategy,
                                    const std::string& merge_strategy,
                                    const Bytes& input,
                                    const Bytes& module) {
    JobRequest request;
    request.split_strategy = split_strategy;
    request.merge_strategy = merge_strategy;
    request.input = input;
    request.module = module;
    return impl->submit(request);
}

std::optional<JobStatus> JobOrchestrator::poll_status(const std::string& job_id) const {
    std::lock_guard<std::mutex> lock(impl->mutex_);
    auto job = impl->find(job_id);
    if (!job) {
        return std::nullopt;
    }
    JobStatus status;
    status.job_id = job_id;
    status.state = job->details.state;
    status.progress = progress_of(job->details.tasks);
    status.failure = job->details.failure;
    return status;
}

std::optional<JobResult> JobOrchestrator::get_result(const std::string& job_id) const {
    std::lock_guard<std::mutex> lock(impl->mutex_);
    auto job = impl->find(job_id);
    if (!job || !is_terminal(job->details.state)) {
        return std::nullopt;
    }
    return impl->result_of(*job);
}

std::optional<JobResult> JobOrchestrator::wait_for_result(const std::string& job_id,
                                                          std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(impl->mutex_);
    auto job = impl->find(job_id);
    if (!job) {
        return std::nullopt;
    }
    bool done = impl->finished_cv_.wait_for(lock, timeout, [&job] {
        return is_terminal(job->details.state);
    });
    if (!done) {
        return std::nullopt;
    }
    return impl->result_of(*job);
}

bool JobOrchestrator::cancel(const std::string& job_id) {
    std::shared_ptr<Job> job;
    {
        std::lock_guard<std::mutex> lock(impl->mutex_);
        job = impl->find(job_id);
        if (!job || is_terminal(job->details.state)) {
            return false;
        }
    }
    std::cout << "[Orchestrator] Cancelling " << job_id << std::endl;
    impl->record_failure(job, ErrorKind::CANCELLED, "cancelled by caller");
    return true;
}

std::optional<JobDetails> JobOrchestrator::details(const std::string& job_id) const {
    std::lock_guard<std::mutex> lock(impl->mutex_);
    auto job = impl->find(job_id);
    if (!job) {
        return std::nullopt;
    }
    return job->details;
}

std::vector<std::string> JobOrchestrator::list_jobs() const {
    std::lock_guard<std::mutex> lock(impl->mutex_);
    std::vector<std::string> ids;
    for (const auto& entry : impl->jobs_) {
        ids.push_back(entry.first);
    }
    return ids;
}

void JobOrchestrator::set_state_listener(StateListener listener) {
    std::lock_guard<std::mutex> lock(impl->mutex_);
    impl->listener_ = std::move(listener);
}

StrategyRegistry& JobOrchestrator::strategies() {
    return impl->strategies_;
}

} // namespace vouchrun
