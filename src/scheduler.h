#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include "constants.h"
#include "sandbox.h"
#include "worker_registry.h"
#include "vouchrun/transport.h"
#include "vouchrun/types.h"

namespace vouchrun {

// Scheduler configuration
struct SchedulerConfig {
    double initial_trust = DEFAULT_INITIAL_TRUST;
    double trust_decay = DEFAULT_TRUST_DECAY;
    double trust_weight_success = DEFAULT_TRUST_WEIGHT_SUCCESS;
    double trust_threshold = DEFAULT_TRUST_THRESHOLD;          // At or below: forced redundancy
    double quarantine_threshold = DEFAULT_QUARANTINE_THRESHOLD;
    double score_trust_weight = DEFAULT_SCORE_TRUST_WEIGHT;
    double score_latency_weight = DEFAULT_SCORE_LATENCY_WEIGHT;
    double latency_reference_ms = DEFAULT_LATENCY_REFERENCE_MS;
    int max_retries = DEFAULT_MAX_RETRIES;                     // Attempts after the first
    int redundancy_factor = DEFAULT_REDUNDANCY_FACTOR;         // Voters per redundancy round
    int max_limit_breaches = DEFAULT_MAX_LIMIT_BREACHES;
    std::chrono::milliseconds latency_margin{DEFAULT_LATENCY_MARGIN_MS};
    bool local_fallback = true;

    TrustPolicy trust_policy() const;
};

// Final verdict for one task after all attempts
struct TaskOutcome {
    bool ok = false;
    Bytes output;
    std::string digest;              // SHA256 of output
    std::string worker_id;           // Executor whose output was accepted
    VerificationRecord record;
    ErrorKind error = ErrorKind::NONE;
    std::string message;
    int attempts = 0;
};

// Places tasks on workers, enforces attempt deadlines, verifies results,
// keeps trust scores current and retries elsewhere on failure.
class Scheduler {
public:
    // Called whenever the task's state or assigned worker changes
    using TaskCallback = std::function<void(const Task&)>;

    // transport may be null, in which case every task runs locally
    Scheduler(const SchedulerConfig& config,
              std::shared_ptr<Transport> transport,
              const SandboxConfig& sandbox_config = SandboxConfig{});
    ~Scheduler();

    // Runs a task to a verified result or a final failure. Blocks the
    // calling thread; safe to call concurrently for different tasks.
    // A non-empty expected_digest is the caller's reference for the output:
    // a remote result that differs escalates to redundancy, and a trusted
    // execution that differs fails the task.
    TaskOutcome run_task(Task& task,
                         VerificationMode job_mode,
                         const CancelToken& cancel,
                         const std::string& expected_digest = "",
                         bool force_redundancy = false,
                         TaskCallback on_change = nullptr);

    // Sync the registry with the transport's connected peers
    void refresh_workers();

    // Entry point for result payloads from the transport
    void on_result(const std::string& worker_id, const std::string& task_id, const Bytes& payload);

    WorkerRegistry& registry();
    const SchedulerConfig& config() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace vouchrun
