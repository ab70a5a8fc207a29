#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace vouchrun {

using Bytes = std::vector<uint8_t>;

// Resource ceilings for one task. Immutable once attached to a Task.
struct ResourceLimits {
    uint64_t max_memory_bytes = 64 * 1024 * 1024;
    uint64_t max_cpu_cycles = 1000ULL * 1000 * 1000;
    std::chrono::milliseconds max_execution_time{30 * 1000};
    uint64_t max_stack_bytes = 1024 * 1024;
};

enum class ResourceKind {
    NONE,
    CPU,
    MEMORY,
    TIME,
    STACK
};

enum class OutcomeKind {
    SUCCESS,
    RESOURCE_EXCEEDED,
    TRAPPED,
    TIMED_OUT,
    CANCELLED
};

enum class TaskState {
    PENDING,
    ASSIGNED,
    RUNNING,
    VERIFYING,
    VERIFIED,
    FAILED,
    TIMED_OUT,
    CANCELLED
};

enum class JobState {
    CREATED,
    SPLITTING,
    SCHEDULING,
    EXECUTING,
    MERGING,
    COMPLETED,
    FAILED
};

enum class ErrorKind {
    NONE,
    SPLIT_ERROR,
    SANDBOX_TRAP,
    RESOURCE_EXCEEDED,
    VERIFICATION_MISMATCH,
    WORKER_TIMEOUT,
    WORKER_UNAVAILABLE,
    MERGE_ERROR,
    CANCELLED
};

enum class VerificationMode {
    HASH,
    MERKLE,
    REDUNDANCY
};

enum class WorkerStatus {
    ACTIVE,
    QUARANTINED,
    REMOVED
};

const char* to_string(ResourceKind kind);
const char* to_string(OutcomeKind kind);
const char* to_string(TaskState state);
const char* to_string(JobState state);
const char* to_string(ErrorKind kind);
const char* to_string(VerificationMode mode);
const char* to_string(WorkerStatus status);

bool is_terminal(JobState state);

// Resources actually consumed by one execution
struct ResourceUsage {
    uint64_t cpu_cycles = 0;
    uint64_t peak_memory_bytes = 0;
    uint64_t peak_stack_bytes = 0;
    std::chrono::milliseconds wall_time{0};
};

struct Task {
    std::string task_id;            // <job_id>:<ordinal>
    std::string job_id;
    uint32_t ordinal = 0;           // Fixes merge order
    Bytes input;
    Bytes module;                   // Sandbox bytecode
    std::string module_hash;        // SHA256 of module
    ResourceLimits limits;
    TaskState state = TaskState::PENDING;
    std::string assigned_worker;    // Empty when unassigned
    int retry_count = 0;
    bool redundancy_opt_out = false;  // Output is not expected to be reproducible
};

struct ExecutionResult {
    std::string task_id;
    std::string worker_id;
    Bytes output;                   // Empty unless outcome is SUCCESS
    std::string output_digest;      // SHA256 of output (claimed, for remote results)
    OutcomeKind outcome = OutcomeKind::TRAPPED;
    ResourceKind exceeded = ResourceKind::NONE;  // Only meaningful for RESOURCE_EXCEEDED
    ResourceUsage usage;
    std::chrono::milliseconds duration{0};
    std::string error;
    std::string task_hash;          // Commitment to the task definition
    std::string signature;          // Base64 Ed25519 signature (remote workers)

    bool succeeded() const { return outcome == OutcomeKind::SUCCESS; }

    // Message a worker signs to attest this result
    std::string attestation() const;
};

// Snapshot of a worker record
struct Worker {
    std::string worker_id;
    double trust = 0.5;
    double latency_ms = 0.0;
    int capacity = 1;
    int in_flight = 0;
    WorkerStatus status = WorkerStatus::ACTIVE;
    std::string public_key;         // Base64 Ed25519 key, empty if unsigned
    uint64_t successes = 0;
    uint64_t failures = 0;
    std::chrono::steady_clock::time_point last_assigned{};
};

struct RedundancyCandidate {
    std::string worker_id;
    std::string digest;
};

struct VerificationRecord {
    VerificationMode mode = VerificationMode::HASH;
    bool accepted = false;

    // HASH
    std::string digest;

    // MERKLE
    std::string merkle_root;
    size_t leaf_index = 0;
    std::vector<std::string> proof_path;

    // REDUNDANCY
    std::vector<RedundancyCandidate> candidates;
    std::string winning_digest;     // Empty when there was no quorum
    bool no_quorum = false;
    std::vector<std::string> dissenting_workers;
};

struct JobFailure {
    ErrorKind kind = ErrorKind::NONE;
    std::string message;
};

struct JobProgress {
    size_t total = 0;
    size_t pending = 0;
    size_t running = 0;
    size_t verified = 0;
    size_t failed = 0;

    double fraction() const {
        return total == 0 ? 0.0 : static_cast<double>(verified) / total;
    }
};

struct JobStatus {
    std::string job_id;
    JobState state = JobState::CREATED;
    JobProgress progress;
    JobFailure failure;
};

// Outcome of GetResult: merged output or JobFailed(reason)
struct JobResult {
    std::string job_id;
    bool ok = false;
    Bytes output;
    JobFailure failure;
};

// Cooperative cancellation shared between a job and its in-flight tasks
class CancelToken {
public:
    void cancel() { cancelled_.store(true); }
    bool is_cancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

// Absolute point in time after which an attempt is abandoned
class Deadline {
public:
    using Clock = std::chrono::steady_clock;

    Deadline() : at_(Clock::time_point::max()) {}
    explicit Deadline(Clock::time_point at) : at_(at) {}

    static Deadline after(std::chrono::milliseconds budget) {
        return Deadline(Clock::now() + budget);
    }
    static Deadline never() { return Deadline(); }

    bool expired() const { return Clock::now() >= at_; }
    Clock::time_point at() const { return at_; }
    std::chrono::milliseconds remaining() const;

private:
    Clock::time_point at_;
};

// Bad input for a split strategy; fatal to the job
class SplitError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Strategy / result-set mismatch during merge; fatal to the job
class MergeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace vouchrun
