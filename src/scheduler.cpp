#include "scheduler.h"
#include "hash_utils.h"
#include "task_codec.h"
#include "task_hash.h"
#include "verification.h"
#include <algorithm>
#include <condition_variable>
#include <iostream>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <vector>

namespace vouchrun {

TrustPolicy SchedulerConfig::trust_policy() const {
    TrustPolicy policy;
    policy.initial_trust = initial_trust;
    policy.decay = trust_decay;
    policy.weight_success = trust_weight_success;
    policy.quarantine_threshold = quarantine_threshold;
    policy.score_trust_weight = score_trust_weight;
    policy.score_latency_weight = score_latency_weight;
    policy.latency_reference_ms = latency_reference_ms;
    return policy;
}

namespace {

using Clock = std::chrono::steady_clock;

// Slot a transport callback fills for one (task, worker) attempt
struct PendingAttempt {
    std::mutex mutex;
    std::condition_variable cv;
    bool done = false;
    Bytes payload;
};

enum class AttemptStatus {
    RESPONDED,
    NO_RESPONSE,   // Deadline passed
    REFUSED,       // Transport could not deliver the task
    MALFORMED,     // Undecodable or mislabeled result
    CANCELLED
};

struct Attempt {
    std::string worker_id;
    bool local = false;
    AttemptStatus status = AttemptStatus::NO_RESPONSE;
    ExecutionResult result;
    std::chrono::milliseconds elapsed{0};
    std::string error;
};

struct InFlight {
    std::string worker_id;
    std::shared_ptr<PendingAttempt> pending;
    bool sent = false;
    Clock::time_point started;
};

std::string pending_key(const std::string& task_id, const std::string& worker_id) {
    return task_id + "|" + worker_id;
}

ErrorKind error_for(OutcomeKind outcome) {
    switch (outcome) {
        case OutcomeKind::SUCCESS: return ErrorKind::NONE;
        case OutcomeKind::RESOURCE_EXCEEDED: return ErrorKind::RESOURCE_EXCEEDED;
        case OutcomeKind::TRAPPED: return ErrorKind::SANDBOX_TRAP;
        case OutcomeKind::TIMED_OUT: return ErrorKind::WORKER_TIMEOUT;
        case OutcomeKind::CANCELLED: return ErrorKind::CANCELLED;
    }
    return ErrorKind::SANDBOX_TRAP;
}

bool matches_expected(const std::string& digest, const std::string& expected) {
    return expected.empty() || digest == expected;
}

// Outcome of one redundancy round
struct RoundResult {
    bool ok = false;
    bool fatal = false;
    TaskOutcome outcome;
};

} // namespace

class Scheduler::Impl {
public:
    SchedulerConfig config_;
    std::shared_ptr<Transport> transport_;
    WorkerRegistry registry_;
    VerificationEngine engine_;
    SandboxExecutor local_;

    std::mutex pending_mutex_;
    std::map<std::string, std::shared_ptr<PendingAttempt>> pending_;

    Impl(const SchedulerConfig& config, std::shared_ptr<Transport> transport,
         const SandboxConfig& sandbox_config)
        : config_(config),
          transport_(std::move(transport)),
          registry_(config.trust_policy()),
          engine_(config.trust_threshold),
          local_(sandbox_config) {}

    Deadline attempt_deadline(const Task& task) const {
        return Deadline::after(task.limits.max_execution_time + config_.latency_margin);
    }

    static void set_state(Task& task, TaskState state, const TaskCallback& on_change) {
        task.state = state;
        if (on_change) {
            on_change(task);
        }
    }

    void refresh_workers() {
        if (!transport_) {
            return;
        }
        std::set<std::string> connected;
        for (const auto& peer : transport_->connected_workers()) {
            connected.insert(peer.worker_id);
            registry_.register_worker(peer.worker_id, peer.capacity,
                                      peer.latency_hint_ms, peer.public_key);
        }
        for (const auto& worker : registry_.snapshot()) {
            if (worker.status != WorkerStatus::REMOVED && !connected.count(worker.worker_id)) {
                registry_.mark_removed(worker.worker_id);
            }
        }
    }

    void on_result(const std::string& worker_id, const std::string& task_id, const Bytes& payload) {
        std::shared_ptr<PendingAttempt> pending;
        {
            std::lock_guard<std::mutex> lock(pending_mutex_);
            auto it = pending_.find(pending_key(task_id, worker_id));
            if (it == pending_.end()) {
                std::cout << "[Scheduler] Ignoring late result for " << task_id
                          << " from " << worker_id << std::endl;
                return;
            }
            pending = it->second;
        }

        std::lock_guard<std::mutex> lock(pending->mutex);
        if (!pending->done) {
            pending->payload = payload;
            pending->done = true;
            pending->cv.notify_all();
        }
    }

    InFlight send(const Task& task, const Bytes& payload, const std::string& worker_id) {
        InFlight flight;
        flight.worker_id = worker_id;
        flight.pending = std::make_shared<PendingAttempt>();
        flight.started = Clock::now();
        {
            std::lock_guard<std::mutex> lock(pending_mutex_);
            pending_[pending_key(task.task_id, worker_id)] = flight.pending;
        }
        flight.sent = transport_ && transport_->send_task(worker_id, payload);
        return flight;
    }

    Attempt await(const Task& task, InFlight& flight, Deadline deadline, const CancelToken& cancel) {
        Attempt attempt;
        attempt.worker_id = flight.worker_id;

        if (!flight.sent) {
            attempt.status = AttemptStatus::REFUSED;
            attempt.error = "transport refused task";
        } else {
            std::unique_lock<std::mutex> lock(flight.pending->mutex);
            for (;;) {
                if (flight.pending->cv.wait_for(lock,
                        std::chrono::milliseconds(RESULT_POLL_INTERVAL_MS),
                        [&flight] { return flight.pending->done; })) {
                    attempt.status = AttemptStatus::RESPONDED;
                    break;
                }
                if (cancel.is_cancelled()) {
                    attempt.status = AttemptStatus::CANCELLED;
                    break;
                }
                if (deadline.expired()) {
                    attempt.status = AttemptStatus::NO_RESPONSE;
                    attempt.error = "no result before deadline";
                    break;
                }
            }
        }
        attempt.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            Clock::now() - flight.started);

        {
            // Anything arriving after this point is a late result
            std::lock_guard<std::mutex> lock(pending_mutex_);
            pending_.erase(pending_key(task.task_id, flight.worker_id));
        }

        if (attempt.status == AttemptStatus::RESPONDED) {
            try {
                attempt.result = TaskCodec::decode_result(flight.pending->payload);
                if (attempt.result.task_id != task.task_id) {
                    attempt.status = AttemptStatus::MALFORMED;
                    attempt.error = "result names a different task";
                }
            } catch (const std::runtime_error& e) {
                attempt.status = AttemptStatus::MALFORMED;
                attempt.error = e.what();
            }
            attempt.result.worker_id = flight.worker_id;
        }
        return attempt;
    }

    Attempt run_local(const Task& task, Deadline deadline, const CancelToken& cancel) {
        Attempt attempt;
        attempt.worker_id = LOCAL_WORKER_ID;
        attempt.local = true;
        auto started = Clock::now();
        attempt.result = local_.execute(task, &cancel, deadline);
        attempt.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            Clock::now() - started);
        attempt.status = attempt.result.outcome == OutcomeKind::CANCELLED
            ? AttemptStatus::CANCELLED : AttemptStatus::RESPONDED;
        attempt.error = attempt.result.error;
        return attempt;
    }

    // Digest a remote voter contributes, empty if its result is unusable
    std::string candidate_digest(const Attempt& attempt, const std::string& expected_hash) {
        if (attempt.status != AttemptStatus::RESPONDED || !attempt.result.succeeded()) {
            return "";
        }
        if (attempt.local) {
            return HashUtils::sha256(attempt.result.output);
        }
        auto worker = registry_.get(attempt.worker_id);
        std::string key = worker ? worker->public_key : "";
        if (!engine_.verify_attestation(attempt.result, expected_hash, key).accepted) {
            return "";
        }
        auto hash_check = engine_.verify_hash(attempt.result);
        return hash_check.accepted ? hash_check.record.digest : "";
    }

    TaskOutcome succeed(Task& task, const ExecutionResult& result, VerificationRecord record,
                        int attempts, const TaskCallback& on_change) {
        TaskOutcome outcome;
        outcome.ok = true;
        outcome.output = result.output;
        outcome.digest = HashUtils::sha256(result.output);
        outcome.worker_id = result.worker_id;
        outcome.record = std::move(record);
        outcome.attempts = attempts;
        task.assigned_worker = result.worker_id;
        set_state(task, TaskState::VERIFIED, on_change);
        return outcome;
    }

    TaskOutcome fail(Task& task, ErrorKind error, const std::string& message,
                     int attempts, const TaskCallback& on_change) {
        TaskOutcome outcome;
        outcome.error = error;
        outcome.message = message;
        outcome.attempts = attempts;
        TaskState state = TaskState::FAILED;
        if (error == ErrorKind::WORKER_TIMEOUT) {
            state = TaskState::TIMED_OUT;
        } else if (error == ErrorKind::CANCELLED) {
            state = TaskState::CANCELLED;
        }
        std::cerr << "[Scheduler] Task " << task.task_id << " failed: "
                  << to_string(error) << " (" << message << ")" << std::endl;
        set_state(task, state, on_change);
        return outcome;
    }

    RoundResult redundancy_round(Task& task, std::set<std::string>& excluded,
                                 const std::string& expected_hash, const std::string& expected_digest,
                                 int attempt_number, const CancelToken& cancel,
                                 const TaskCallback& on_change) {
        RoundResult round;
        const auto k = static_cast<size_t>(std::max(2, config_.redundancy_factor));

        std::vector<std::string> voters = registry_.select_many(k, excluded);
        bool use_local = voters.size() < k && config_.local_fallback;
        size_t voter_count = voters.size() + (use_local ? 1 : 0);
        if (voter_count > 0 && voter_count < k) {
            // K is not lowered by configuration, only by who is left to ask
            std::cout << "[Scheduler] Task " << task.task_id << " has " << voter_count
                      << " of " << k << " voters available" << std::endl;
        }

        if (voter_count == 0) {
            round.fatal = true;
            round.outcome.error = ErrorKind::WORKER_UNAVAILABLE;
            round.outcome.message = "no executors for redundancy and local fallback disabled";
            return round;
        }
        if (voter_count == 1 && !use_local) {
            registry_.release(voters.front());
            round.outcome.error = ErrorKind::WORKER_UNAVAILABLE;
            round.outcome.message = "not enough executors for a redundancy quorum";
            return round;
        }

        std::set<std::string> busy = excluded;
        busy.insert(voters.begin(), voters.end());
        auto probation = registry_.select_probation(busy);

        std::cout << "[Scheduler] Task " << task.task_id << " redundancy round with "
                  << voter_count << " voter(s)"
                  << (probation ? " + probation " + *probation : std::string())
                  << std::endl;

        task.assigned_worker = voters.empty() ? LOCAL_WORKER_ID : voters.front();
        set_state(task, TaskState::RUNNING, on_change);

        Deadline deadline = attempt_deadline(task);
        Bytes payload = TaskCodec::encode_task(task);

        std::vector<InFlight> flights;
        for (const auto& worker_id : voters) {
            flights.push_back(send(task, payload, worker_id));
        }
        if (probation) {
            flights.push_back(send(task, payload, *probation));
        }

        std::vector<Attempt> attempts;
        if (use_local) {
            attempts.push_back(run_local(task, deadline, cancel));
        }
        for (auto& flight : flights) {
            attempts.push_back(await(task, flight, deadline, cancel));
            registry_.release(flight.worker_id);
        }

        set_state(task, TaskState::VERIFYING, on_change);

        if (cancel.is_cancelled()) {
            round.fatal = true;
            round.outcome.error = ErrorKind::CANCELLED;
            round.outcome.message = "job cancelled";
            return round;
        }

        // The local executor is trusted: a trap or breach there is conclusive
        if (use_local) {
            const auto& local = attempts.front();
            if (local.result.outcome == OutcomeKind::TRAPPED ||
                local.result.outcome == OutcomeKind::RESOURCE_EXCEEDED) {
                round.fatal = true;
                round.outcome.error = error_for(local.result.outcome);
                round.outcome.message = local.result.error;
                return round;
            }
        }

        std::vector<RedundancyCandidate> candidates;
        std::map<std::string, const Attempt*> by_worker;
        for (const auto& attempt : attempts) {
            by_worker[attempt.worker_id] = &attempt;
            if (probation && attempt.worker_id == *probation) {
                continue;
            }
            candidates.push_back({attempt.worker_id, candidate_digest(attempt, expected_hash)});
        }

        if (voter_count == 1) {
            // Only the local executor is available
            const auto& local = attempts.front();
            if (!local.result.succeeded()) {
                round.fatal = true;
                round.outcome.error = error_for(local.result.outcome);
                round.outcome.message = local.result.error;
                return round;
            }
            if (!matches_expected(candidates.front().digest, expected_digest)) {
                round.fatal = true;
                round.outcome.error = ErrorKind::VERIFICATION_MISMATCH;
                round.outcome.message = "local output does not match expected digest";
                return round;
            }
            VerificationRecord record;
            record.mode = VerificationMode::REDUNDANCY;
            record.accepted = true;
            record.candidates = candidates;
            record.digest = candidates.front().digest;
            record.winning_digest = record.digest;
            round.ok = true;
            round.outcome = succeed(task, local.result, record, attempt_number, on_change);
            return round;
        }

        auto verdict = engine_.verify_redundancy(candidates);
        if (!verdict.accepted) {
            // Nobody is provably wrong; try a fresh set of executors
            for (const auto& attempt : attempts) {
                if (!attempt.local) {
                    excluded.insert(attempt.worker_id);
                }
            }
            std::cout << "[Scheduler] Task " << task.task_id << " redundancy round: "
                      << verdict.message << std::endl;
            round.outcome.error = ErrorKind::VERIFICATION_MISMATCH;
            round.outcome.message = verdict.message;
            return round;
        }

        const std::string& winner = verdict.record.winning_digest;
        if (!matches_expected(winner, expected_digest)) {
            // The majority disagrees with the caller's reference
            for (const auto& candidate : candidates) {
                const Attempt* attempt = by_worker[candidate.worker_id];
                if (attempt->local) {
                    round.fatal = candidate.digest != expected_digest;
                } else if (attempt->status != AttemptStatus::REFUSED) {
                    registry_.record_verdict(candidate.worker_id, candidate.digest == expected_digest);
                }
                if (!attempt->local) {
                    excluded.insert(candidate.worker_id);
                }
            }
            std::cout << "[Scheduler] Task " << task.task_id
                      << " redundancy winner does not match expected digest" << std::endl;
            round.outcome.error = ErrorKind::VERIFICATION_MISMATCH;
            round.outcome.message = "majority output does not match expected digest";
            return round;
        }

        const Attempt* accepted = nullptr;
        for (const auto& candidate : candidates) {
            const Attempt* attempt = by_worker[candidate.worker_id];
            bool agreed = candidate.digest == winner;
            if (agreed && !accepted) {
                accepted = attempt;
            }
            if (attempt->status == AttemptStatus::REFUSED) {
                // Never delivered, so there is nothing to judge
                excluded.insert(candidate.worker_id);
            } else if (!attempt->local) {
                registry_.record_verdict(candidate.worker_id, agreed);
                if (agreed) {
                    registry_.record_latency(candidate.worker_id, attempt->elapsed);
                } else {
                    excluded.insert(candidate.worker_id);
                }
            }
        }
        if (probation) {
            const Attempt* attempt = by_worker[*probation];
            if (attempt->status != AttemptStatus::REFUSED) {
                bool agreed = candidate_digest(*attempt, expected_hash) == winner;
                registry_.record_verdict(*probation, agreed);
            }
        }

        for (const auto& dissenter : verdict.record.dissenting_workers) {
            std::cout << "[Scheduler] Task " << task.task_id << " dissent from "
                      << dissenter << std::endl;
        }

        round.ok = true;
        round.outcome = succeed(task, accepted->result, verdict.record, attempt_number, on_change);
        return round;
    }

    TaskOutcome run_task(Task& task, VerificationMode job_mode, const CancelToken& cancel,
                         const std::string& expected_digest, bool force_redundancy,
                         const TaskCallback& on_change) {
        const std::string expected_hash = task_hash(task);
        const bool can_vote = !task.redundancy_opt_out;

        std::set<std::string> excluded;   // Remote workers that failed this task
        std::set<std::string> breaches;   // Executors that reported a limit breach
        bool escalated = force_redundancy && can_vote;

        ErrorKind last_error = ErrorKind::WORKER_UNAVAILABLE;
        std::string last_message = "no executor available";
        int attempt_number = 0;

        for (int attempt = 0; attempt <= config_.max_retries; ++attempt) {
            if (cancel.is_cancelled()) {
                return fail(task, ErrorKind::CANCELLED, "job cancelled", attempt_number, on_change);
            }

            attempt_number = attempt + 1;
            task.retry_count = attempt;
            task.assigned_worker.clear();
            set_state(task, TaskState::PENDING, on_change);
            refresh_workers();

            bool redundancy = can_vote && (escalated || job_mode == VerificationMode::REDUNDANCY);
            std::optional<std::string> worker_id;
            if (!redundancy) {
                worker_id = registry_.select(excluded);
                if (worker_id && can_vote) {
                    auto worker = registry_.get(*worker_id);
                    double trust = worker ? worker->trust : 0.0;
                    if (engine_.select_mode(job_mode, trust, escalated) == VerificationMode::REDUNDANCY) {
                        std::cout << "[Scheduler] Worker " << *worker_id << " trust " << trust
                                  << " at or below threshold, using redundancy" << std::endl;
                        registry_.release(*worker_id);
                        worker_id.reset();
                        redundancy = true;
                    }
                }
            }

            if (redundancy) {
                auto round = redundancy_round(task, excluded, expected_hash, expected_digest,
                                              attempt_number, cancel, on_change);
                if (round.ok) {
                    return round.outcome;
                }
                if (round.fatal) {
                    return fail(task, round.outcome.error, round.outcome.message,
                                attempt_number, on_change);
                }
                last_error = round.outcome.error;
                last_message = round.outcome.message;
                continue;
            }

            Deadline deadline = attempt_deadline(task);

            if (!worker_id) {
                if (!config_.local_fallback) {
                    return fail(task, ErrorKind::WORKER_UNAVAILABLE,
                                "no eligible worker and local fallback disabled",
                                attempt_number, on_change);
                }
                std::cout << "[Scheduler] Task " << task.task_id
                          << " running locally (no eligible worker)" << std::endl;
                task.assigned_worker = LOCAL_WORKER_ID;
                set_state(task, TaskState::RUNNING, on_change);
                Attempt local = run_local(task, deadline, cancel);
                set_state(task, TaskState::VERIFYING, on_change);
                if (!local.result.succeeded()) {
                    return fail(task, error_for(local.result.outcome), local.result.error,
                                attempt_number, on_change);
                }
                VerificationRecord record;
                record.mode = job_mode;
                record.accepted = true;
                record.digest = HashUtils::sha256(local.result.output);
                if (!matches_expected(record.digest, expected_digest)) {
                    return fail(task, ErrorKind::VERIFICATION_MISMATCH,
                                "local output does not match expected digest",
                                attempt_number, on_change);
                }
                return succeed(task, local.result, record, attempt_number, on_change);
            }

            // Single remote execution
            task.assigned_worker = *worker_id;
            set_state(task, TaskState::ASSIGNED, on_change);
            std::cout << "[Scheduler] Task " << task.task_id << " -> " << *worker_id
                      << " (attempt " << attempt_number << ")" << std::endl;

            InFlight flight = send(task, TaskCodec::encode_task(task), *worker_id);
            set_state(task, TaskState::RUNNING, on_change);
            Attempt remote = await(task, flight, deadline, cancel);
            registry_.release(*worker_id);
            set_state(task, TaskState::VERIFYING, on_change);

            switch (remote.status) {
                case AttemptStatus::CANCELLED:
                    return fail(task, ErrorKind::CANCELLED, "job cancelled", attempt_number, on_change);
                case AttemptStatus::REFUSED:
                    excluded.insert(*worker_id);
                    last_error = ErrorKind::WORKER_UNAVAILABLE;
                    last_message = *worker_id + " refused the task";
                    continue;
                case AttemptStatus::NO_RESPONSE:
                    std::cout << "[Scheduler] Task " << task.task_id << " timed out on "
                              << *worker_id << std::endl;
                    registry_.record_verdict(*worker_id, false);
                    excluded.insert(*worker_id);
                    last_error = ErrorKind::WORKER_TIMEOUT;
                    last_message = *worker_id + " did not answer before the deadline";
                    continue;
                case AttemptStatus::MALFORMED:
                    registry_.record_verdict(*worker_id, false);
                    excluded.insert(*worker_id);
                    escalated = can_vote;
                    last_error = ErrorKind::VERIFICATION_MISMATCH;
                    last_message = "malformed result from " + *worker_id + ": " + remote.error;
                    continue;
                case AttemptStatus::RESPONDED:
                    break;
            }

            auto worker = registry_.get(*worker_id);
            auto attestation = engine_.verify_attestation(
                remote.result, expected_hash, worker ? worker->public_key : "");
            if (!attestation.accepted) {
                std::cout << "[Scheduler] Task " << task.task_id << " rejected result from "
                          << *worker_id << ": " << attestation.message << std::endl;
                registry_.record_verdict(*worker_id, false);
                excluded.insert(*worker_id);
                escalated = can_vote;
                last_error = ErrorKind::VERIFICATION_MISMATCH;
                last_message = attestation.message;
                continue;
            }

            const auto& result = remote.result;
            if (result.outcome == OutcomeKind::RESOURCE_EXCEEDED) {
                registry_.record_verdict(*worker_id, false);
                excluded.insert(*worker_id);
                breaches.insert(*worker_id);
                last_error = ErrorKind::RESOURCE_EXCEEDED;
                last_message = *worker_id + " exceeded " + to_string(result.exceeded) + " limit";
                std::cout << "[Scheduler] Task " << task.task_id << ": " << last_message << std::endl;
                if (breaches.size() >= static_cast<size_t>(config_.max_limit_breaches)) {
                    return fail(task, ErrorKind::RESOURCE_EXCEEDED,
                                "limit exceeded on " + std::to_string(breaches.size()) + " executors",
                                attempt_number, on_change);
                }
                continue;
            }
            if (!result.succeeded()) {
                registry_.record_verdict(*worker_id, false);
                excluded.insert(*worker_id);
                last_error = error_for(result.outcome);
                last_message = *worker_id + ": " + result.error;
                continue;
            }

            auto check = engine_.verify_hash(result, expected_digest);
            if (!check.accepted) {
                std::cout << "[Scheduler] Task " << task.task_id << " hash mismatch from "
                          << *worker_id << ", escalating" << std::endl;
                registry_.record_verdict(*worker_id, false);
                excluded.insert(*worker_id);
                escalated = can_vote;
                last_error = ErrorKind::VERIFICATION_MISMATCH;
                last_message = check.message;
                continue;
            }

            registry_.record_verdict(*worker_id, true);
            registry_.record_latency(*worker_id, remote.elapsed);
            check.record.mode = job_mode == VerificationMode::REDUNDANCY
                ? VerificationMode::HASH : job_mode;
            return succeed(task, result, check.record, attempt_number, on_change);
        }

        return fail(task, last_error, last_message + " (retries exhausted)", attempt_number, on_change);
    }
};

Scheduler::Scheduler(const SchedulerConfig& config,
                     std::shared_ptr<Transport> transport,
                     const SandboxConfig& sandbox_config)
    : impl(std::make_unique<Impl>(config, std::move(transport), sandbox_config)) {
    if (impl->transport_) {
        Impl* state = impl.get();
        impl->transport_->set_result_callback(
            [state](const std::string& worker_id, const std::string& task_id, const Bytes& payload) {
                state->on_result(worker_id, task_id, payload);
            });
    }
}

Scheduler::~Scheduler() {
    if (impl->transport_) {
        impl->transport_->set_result_callback(nullptr);
    }
}

TaskOutcome Scheduler::run_task(Task& task, VerificationMode job_mode, const CancelToken& cancel,
                                const std::string& expected_digest, bool force_redundancy,
                                TaskCallback on_change) {
    return impl->run_task(task, job_mode, cancel, expected_digest, force_redundancy, on_change);
}

void Scheduler::refresh_workers() {
    impl->refresh_workers();
}

void Scheduler::on_result(const std::string& worker_id, const std::string& task_id,
                          const Bytes& payload) {
    impl->on_result(worker_id, task_id, payload);
}

WorkerRegistry& Scheduler::registry() {
    return impl->registry_;
}

const SchedulerConfig& Scheduler::config() const {
    return impl->config_;
}

} // namespace vouchrun
