#include "vouchrun/types.h"
#include <sstream>

namespace vouchrun {

const char* to_string(ResourceKind kind) {
    switch (kind) {
        case ResourceKind::NONE: return "none";
        case ResourceKind::CPU: return "cpu";
        case ResourceKind::MEMORY: return "memory";
        case ResourceKind::TIME: return "time";
        case ResourceKind::STACK: return "stack";
    }
    return "unknown";
}

const char* to_string(OutcomeKind kind) {
    switch (kind) {
        case OutcomeKind::SUCCESS: return "success";
        case OutcomeKind::RESOURCE_EXCEEDED: return "resource_exceeded";
        case OutcomeKind::TRAPPED: return "trapped";
        case OutcomeKind::TIMED_OUT: return "timed_out";
        case OutcomeKind::CANCELLED: return "cancelled";
    }
    return "unknown";
}

const char* to_string(TaskState state) {
    switch (state) {
        case TaskState::PENDING: return "pending";
        case TaskState::ASSIGNED: return "assigned";
        case TaskState::RUNNING: return "running";
        case TaskState::VERIFYING: return "verifying";
        case TaskState::VERIFIED: return "verified";
        case TaskState::FAILED: return "failed";
        case TaskState::TIMED_OUT: return "timed_out";
        case TaskState::CANCELLED: return "cancelled";
    }
    return "unknown";
}

const char* to_string(JobState state) {
    switch (state) {
        case JobState::CREATED: return "created";
        case JobState::SPLITTING: return "splitting";
        case JobState::SCHEDULING: return "scheduling";
        case JobState::EXECUTING: return "executing";
        case JobState::MERGING: return "merging";
        case JobState::COMPLETED: return "completed";
        case JobState::FAILED: return "failed";
    }
    return "unknown";
}

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE: return "none";
        case ErrorKind::SPLIT_ERROR: return "SplitError";
        case ErrorKind::SANDBOX_TRAP: return "SandboxTrap";
        case ErrorKind::RESOURCE_EXCEEDED: return "ResourceExceeded";
        case ErrorKind::VERIFICATION_MISMATCH: return "VerificationMismatch";
        case ErrorKind::WORKER_TIMEOUT: return "WorkerTimeout";
        case ErrorKind::WORKER_UNAVAILABLE: return "WorkerUnavailable";
        case ErrorKind::MERGE_ERROR: return "MergeError";
        case ErrorKind::CANCELLED: return "Cancelled";
    }
    return "unknown";
}

const char* to_string(VerificationMode mode) {
    switch (mode) {
        case VerificationMode::HASH: return "hash";
        case VerificationMode::MERKLE: return "merkle";
        case VerificationMode::REDUNDANCY: return "redundancy";
    }
    return "unknown";
}

const char* to_string(WorkerStatus status) {
    switch (status) {
        case WorkerStatus::ACTIVE: return "active";
        case WorkerStatus::QUARANTINED: return "quarantined";
        case WorkerStatus::REMOVED: return "removed";
    }
    return "unknown";
}

bool is_terminal(JobState state) {
    return state == JobState::COMPLETED || state == JobState::FAILED;
}

std::string ExecutionResult::attestation() const {
    std::ostringstream message;
    message << task_id << "|"
            << task_hash << "|"
            << to_string(outcome) << "|"
            << to_string(exceeded) << "|"
            << output_digest;
    return message.str();
}

std::chrono::milliseconds Deadline::remaining() const {
    auto now = Clock::now();
    if (now >= at_) {
        return std::chrono::milliseconds(0);
    }
    if (at_ == Clock::time_point::max()) {
        return std::chrono::milliseconds::max();
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(at_ - now);
}

} // namespace vouchrun
