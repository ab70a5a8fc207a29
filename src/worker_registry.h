#pragma once

#include <string>
#include <map>
#include <set>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <vector>
#include <chrono>
#include "constants.h"
#include "vouchrun/types.h"

namespace vouchrun {

// Trust bookkeeping and selection scoring parameters
struct TrustPolicy {
    double initial_trust = DEFAULT_INITIAL_TRUST;
    double decay = DEFAULT_TRUST_DECAY;
    double weight_success = DEFAULT_TRUST_WEIGHT_SUCCESS;
    double quarantine_threshold = DEFAULT_QUARANTINE_THRESHOLD;
    double score_trust_weight = DEFAULT_SCORE_TRUST_WEIGHT;
    double score_latency_weight = DEFAULT_SCORE_LATENCY_WEIGHT;
    double latency_reference_ms = DEFAULT_LATENCY_REFERENCE_MS;
};

// Owns every Worker record. The map is guarded by a shared mutex and each
// record by its own mutex, so updates to different workers do not contend.
class WorkerRegistry {
public:
    explicit WorkerRegistry(const TrustPolicy& policy = TrustPolicy());

    // Adds a worker at initial trust. A known worker keeps its trust and
    // history; its capacity and key are refreshed and a removed worker
    // comes back. Returns true if the worker was new.
    bool register_worker(const std::string& worker_id,
                         int capacity,
                         double latency_hint_ms = 0.0,
                         const std::string& public_key = "");

    void mark_removed(const std::string& worker_id);

    std::optional<Worker> get(const std::string& worker_id) const;
    std::vector<Worker> snapshot() const;
    size_t size() const;

    // Best Active worker with spare capacity that is not excluded. The
    // returned worker has one capacity slot reserved.
    std::optional<std::string> select(const std::set<std::string>& excluded);

    // Up to count distinct workers, best first, each with a reserved slot
    std::vector<std::string> select_many(size_t count, const std::set<std::string>& excluded);

    // Quarantined worker with spare capacity for a non-voting probation run
    std::optional<std::string> select_probation(const std::set<std::string>& excluded);

    void release(const std::string& worker_id);

    // Applies trust' = clamp(trust * decay + reward) and moves the worker in
    // or out of quarantine. A success never lowers trust. Returns the new trust (or -1 if unknown).
    double record_verdict(const std::string& worker_id, bool success);

    void record_latency(const std::string& worker_id, std::chrono::milliseconds observed);

    // trust_weight * trust + latency_weight / (1 + latency / reference)
    double score(const Worker& worker) const;

    const TrustPolicy& policy() const { return policy_; }

private:
    struct Record {
        mutable std::mutex mutex;
        Worker worker;
    };

    TrustPolicy policy_;
    mutable std::shared_mutex map_mutex_;
    std::map<std::string, std::unique_ptr<Record>> records_;

    Record* find(const std::string& worker_id) const;
    std::optional<std::string> select_with_status(const std::set<std::string>& excluded,
                                                  WorkerStatus status);
};

} // namespace vouchrun
