#include "verification.h"
#include "hash_utils.h"
#include "merkle.h"
#include "worker_identity.h"
#include <map>

namespace vouchrun {

namespace {

VerificationOutcome reject(VerificationOutcome outcome, const std::string& message) {
    outcome.accepted = false;
    outcome.record.accepted = false;
    outcome.error = ErrorKind::VERIFICATION_MISMATCH;
    outcome.message = message;
    return outcome;
}

} // namespace

VerificationEngine::VerificationEngine(double trust_threshold)
    : trust_threshold_(trust_threshold) {}

VerificationOutcome VerificationEngine::verify_hash(const ExecutionResult& result,
                                                    const std::string& expected_digest) const {
    VerificationOutcome outcome;
    outcome.record.mode = VerificationMode::HASH;

    std::string actual = HashUtils::sha256(result.output);
    outcome.record.digest = actual;

    if (!result.output_digest.empty() && result.output_digest != actual) {
        return reject(outcome, "claimed digest does not match output");
    }
    if (!expected_digest.empty() && expected_digest != actual) {
        return reject(outcome, "output digest does not match expected digest");
    }

    outcome.accepted = true;
    outcome.record.accepted = true;
    return outcome;
}

MerkleVerification VerificationEngine::verify_merkle(const std::vector<std::string>& digests,
                                                     const std::string& expected_root) const {
    MerkleVerification verification;
    if (digests.empty()) {
        verification.message = "no results to commit";
        return verification;
    }

    MerkleTree tree(digests);
    verification.root = tree.root();
    verification.accepted = true;

    for (size_t i = 0; i < digests.size(); ++i) {
        VerificationRecord record;
        record.mode = VerificationMode::MERKLE;
        record.digest = digests[i];
        record.merkle_root = tree.root();
        record.leaf_index = i;
        record.proof_path = tree.proof(i);
        record.accepted = MerkleTree::verify_proof(tree.root(), digests[i], i, record.proof_path);
        if (!record.accepted) {
            verification.accepted = false;
            verification.message = "inclusion proof failed for leaf " + std::to_string(i);
        }
        verification.records.push_back(std::move(record));
    }

    if (verification.accepted && !expected_root.empty() && expected_root != tree.root()) {
        verification.accepted = false;
        verification.message = "Merkle root does not match expected root";
    }
    if (!verification.accepted) {
        for (auto& record : verification.records) {
            record.accepted = false;
        }
    }
    return verification;
}

VerificationOutcome VerificationEngine::verify_redundancy(
    const std::vector<RedundancyCandidate>& voters) const {
    VerificationOutcome outcome;
    outcome.record.mode = VerificationMode::REDUNDANCY;
    outcome.record.candidates = voters;

    std::map<std::string, size_t> votes;
    for (const auto& voter : voters) {
        if (!voter.digest.empty()) {
            votes[voter.digest]++;
        }
    }

    // A strict majority is unique, so the verdict ignores candidate order
    std::string winner;
    for (const auto& entry : votes) {
        if (entry.second * 2 > voters.size()) {
            winner = entry.first;
        }
    }

    if (voters.size() < 2 || winner.empty()) {
        outcome.record.no_quorum = true;
        return reject(outcome, "no quorum among " + std::to_string(voters.size()) + " executors");
    }

    outcome.record.winning_digest = winner;
    outcome.record.digest = winner;
    for (const auto& voter : voters) {
        if (voter.digest != winner) {
            outcome.record.dissenting_workers.push_back(voter.worker_id);
        }
    }
    outcome.accepted = true;
    outcome.record.accepted = true;
    return outcome;
}

VerificationOutcome VerificationEngine::verify_attestation(const ExecutionResult& result,
                                                           const std::string& expected_task_hash,
                                                           const std::string& public_key) const {
    VerificationOutcome outcome;
    if (result.task_hash != expected_task_hash) {
        return reject(outcome, "result is bound to a different task definition");
    }
    if (!public_key.empty() && !WorkerIdentity::verify_attestation(result, public_key)) {
        return reject(outcome, "invalid result signature");
    }
    outcome.accepted = true;
    return outcome;
}

VerificationMode VerificationEngine::select_mode(VerificationMode job_mode, double worker_trust,
                                                 bool escalated) const {
    if (escalated || worker_trust <= trust_threshold_) {
        return VerificationMode::REDUNDANCY;
    }
    return job_mode;
}

} // namespace vouchrun
