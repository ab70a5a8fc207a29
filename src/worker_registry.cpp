#include "worker_registry.h"
#include <algorithm>
#include <iostream>

namespace vouchrun {

WorkerRegistry::WorkerRegistry(const TrustPolicy& policy) : policy_(policy) {}

WorkerRegistry::Record* WorkerRegistry::find(const std::string& worker_id) const {
    auto it = records_.find(worker_id);
    return it == records_.end() ? nullptr : it->second.get();
}

bool WorkerRegistry::register_worker(const std::string& worker_id,
                                     int capacity,
                                     double latency_hint_ms,
                                     const std::string& public_key) {
    {
        std::shared_lock<std::shared_mutex> lock(map_mutex_);
        if (Record* record = find(worker_id)) {
            std::lock_guard<std::mutex> record_lock(record->mutex);
            auto& worker = record->worker;
            worker.capacity = std::max(1, capacity);
            if (!public_key.empty()) {
                worker.public_key = public_key;
            }
            if (worker.status == WorkerStatus::REMOVED) {
                worker.status = worker.trust < policy_.quarantine_threshold
                    ? WorkerStatus::QUARANTINED : WorkerStatus::ACTIVE;
                std::cout << "[Registry] Worker " << worker_id << " reconnected" << std::endl;
            }
            return false;
        }
    }

    std::unique_lock<std::shared_mutex> lock(map_mutex_);
    if (find(worker_id)) {
        return false;  // Registered concurrently
    }

    auto record = std::make_unique<Record>();
    auto& worker = record->worker;
    worker.worker_id = worker_id;
    worker.trust = std::clamp(policy_.initial_trust, 0.0, 1.0);
    worker.latency_ms = std::max(0.0, latency_hint_ms);
    worker.capacity = std::max(1, capacity);
    worker.public_key = public_key;
    worker.status = worker.trust < policy_.quarantine_threshold
        ? WorkerStatus::QUARANTINED : WorkerStatus::ACTIVE;
    records_[worker_id] = std::move(record);

    std::cout << "[Registry] Registered worker " << worker_id
              << " (capacity " << worker.capacity << ")" << std::endl;
    return true;
}

void WorkerRegistry::mark_removed(const std::string& worker_id) {
    std::shared_lock<std::shared_mutex> lock(map_mutex_);
    Record* record = find(worker_id);
    if (!record) {
        return;
    }
    std::lock_guard<std::mutex> record_lock(record->mutex);
    if (record->worker.status != WorkerStatus::REMOVED) {
        record->worker.status = WorkerStatus::REMOVED;
        std::cout << "[Registry] Worker " << worker_id << " disconnected" << std::endl;
    }
}

std::optional<Worker> WorkerRegistry::get(const std::string& worker_id) const {
    std::shared_lock<std::shared_mutex> lock(map_mutex_);
    Record* record = find(worker_id);
    if (!record) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> record_lock(record->mutex);
    return record->worker;
}

std::vector<Worker> WorkerRegistry::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(map_mutex_);
    std::vector<Worker> workers;
    workers.reserve(records_.size());
    for (const auto& entry : records_) {
        std::lock_guard<std::mutex> record_lock(entry.second->mutex);
        workers.push_back(entry.second->worker);
    }
    return workers;
}

size_t WorkerRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(map_mutex_);
    return records_.size();
}

double WorkerRegistry::score(const Worker& worker) const {
    double latency_term = 1.0 / (1.0 + worker.latency_ms / policy_.latency_reference_ms);
    return policy_.score_trust_weight * worker.trust +
           policy_.score_latency_weight * latency_term;
}

std::optional<std::string> WorkerRegistry::select_with_status(
    const std::set<std::string>& excluded, WorkerStatus status) {
    std::shared_lock<std::shared_mutex> lock(map_mutex_);

    std::set<std::string> skipped = excluded;
    for (;;) {
        Record* best = nullptr;
        Worker best_worker;
        double best_score = -1.0;

        for (const auto& entry : records_) {
            if (skipped.count(entry.first)) {
                continue;
            }
            Worker worker;
            {
                std::lock_guard<std::mutex> record_lock(entry.second->mutex);
                worker = entry.second->worker;
            }
            if (worker.status != status || worker.in_flight >= worker.capacity) {
                continue;
            }

            double s = score(worker);
            bool better = !best || s > best_score ||
                (s == best_score && (worker.last_assigned < best_worker.last_assigned ||
                    (worker.last_assigned == best_worker.last_assigned &&
                     worker.worker_id < best_worker.worker_id)));
            if (better) {
                best = entry.second.get();
                best_worker = worker;
                best_score = s;
            }
        }

        if (!best) {
            return std::nullopt;
        }

        // Re-check under the record lock; another thread may have taken the slot
        std::lock_guard<std::mutex> record_lock(best->mutex);
        auto& worker = best->worker;
        if (worker.status == status && worker.in_flight < worker.capacity) {
            worker.in_flight++;
            worker.last_assigned = std::chrono::steady_clock::now();
            return worker.worker_id;
        }
        skipped.insert(worker.worker_id);
    }
}

std::optional<std::string> WorkerRegistry::select(const std::set<std::string>& excluded) {
    return select_with_status(excluded, WorkerStatus::ACTIVE);
}

std::vector<std::string> WorkerRegistry::select_many(size_t count,
                                                     const std::set<std::string>& excluded) {
    std::vector<std::string> selected;
    std::set<std::string> skip = excluded;
    while (selected.size() < count) {
        auto worker_id = select(skip);
        if (!worker_id) {
            break;
        }
        skip.insert(*worker_id);
        selected.push_back(*worker_id);
    }
    return selected;
}

std::optional<std::string> WorkerRegistry::select_probation(const std::set<std::string>& excluded) {
    return select_with_status(excluded, WorkerStatus::QUARANTINED);
}

void WorkerRegistry::release(const std::string& worker_id) {
    std::shared_lock<std::shared_mutex> lock(map_mutex_);
    Record* record = find(worker_id);
    if (!record) {
        return;
    }
    std::lock_guard<std::mutex> record_lock(record->mutex);
    if (record->worker.in_flight > 0) {
        record->worker.in_flight--;
    }
}

double WorkerRegistry::record_verdict(const std::string& worker_id, bool success) {
    std::shared_lock<std::shared_mutex> lock(map_mutex_);
    Record* record = find(worker_id);
    if (!record) {
        return -1.0;
    }

    std::lock_guard<std::mutex> record_lock(record->mutex);
    auto& worker = record->worker;
    double updated = worker.trust * policy_.decay + (success ? policy_.weight_success : 0.0);
    if (success) {
        // A small reward must not decay trust that is already above its fixed point
        updated = std::max(worker.trust, updated);
    }
    worker.trust = std::clamp(updated, 0.0, 1.0);
    if (success) {
        worker.successes++;
    } else {
        worker.failures++;
    }

    if (worker.status == WorkerStatus::ACTIVE && worker.trust < policy_.quarantine_threshold) {
        worker.status = WorkerStatus::QUARANTINED;
        std::cout << "[Registry] Worker " << worker_id << " quarantined (trust "
                  << worker.trust << ")" << std::endl;
    } else if (worker.status == WorkerStatus::QUARANTINED &&
               worker.trust >= policy_.quarantine_threshold) {
        worker.status = WorkerStatus::ACTIVE;
        std::cout << "[Registry] Worker " << worker_id << " restored (trust "
                  << worker.trust << ")" << std::endl;
    }
    return worker.trust;
}

void WorkerRegistry::record_latency(const std::string& worker_id,
                                    std::chrono::milliseconds observed) {
    std::shared_lock<std::shared_mutex> lock(map_mutex_);
    Record* record = find(worker_id);
    if (!record) {
        return;
    }
    std::lock_guard<std::mutex> record_lock(record->mutex);
    auto& worker = record->worker;
    double sample = static_cast<double>(observed.count());
    worker.latency_ms = LATENCY_EWMA_ALPHA * sample + (1.0 - LATENCY_EWMA_ALPHA) * worker.latency_ms;
}

} // namespace vouchrun
