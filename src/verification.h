#pragma once

#include <string>
#include <vector>
#include "constants.h"
#include "vouchrun/types.h"

namespace vouchrun {

// Verdict for a single task
struct VerificationOutcome {
    bool accepted = false;
    ErrorKind error = ErrorKind::NONE;   // VERIFICATION_MISMATCH when rejected
    std::string message;
    VerificationRecord record;
};

// Verdict for a job-level Merkle commitment
struct MerkleVerification {
    bool accepted = false;
    std::string root;
    std::string message;
    std::vector<VerificationRecord> records;  // One per leaf, in ordinal order
};

// Decides whether results can be trusted
class VerificationEngine {
public:
    explicit VerificationEngine(double trust_threshold = DEFAULT_TRUST_THRESHOLD);

    // Recompute the output digest and compare it with the digest the worker
    // claimed and, when given, the caller's expected digest.
    VerificationOutcome verify_hash(const ExecutionResult& result,
                                    const std::string& expected_digest = "") const;

    // Build a tree over digests (ordinal order) and check every inclusion
    // proof. A non-empty expected_root must match the computed root.
    MerkleVerification verify_merkle(const std::vector<std::string>& digests,
                                     const std::string& expected_root = "") const;

    // Majority vote over K voters. A voter with an empty digest produced no
    // output; it counts toward K but agrees with nobody. Accepted only if
    // one digest is held by more than K/2 voters.
    VerificationOutcome verify_redundancy(const std::vector<RedundancyCandidate>& voters) const;

    // Task-hash commitment and, for workers with a registered key, the
    // result signature.
    VerificationOutcome verify_attestation(const ExecutionResult& result,
                                           const std::string& expected_task_hash,
                                           const std::string& public_key) const;

    // Mode a task should be verified with on its next attempt
    VerificationMode select_mode(VerificationMode job_mode, double worker_trust,
                                 bool escalated) const;

    double trust_threshold() const { return trust_threshold_; }

private:
    double trust_threshold_;
};

} // namespace vouchrun
