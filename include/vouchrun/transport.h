#pragma once

#include <functional>
#include <string>
#include <vector>
#include "vouchrun/types.h"

namespace vouchrun {

// A peer currently reachable through the transport
struct PeerInfo {
    std::string worker_id;
    int capacity = 1;
    double latency_hint_ms = 0.0;
    std::string public_key;   // Base64 Ed25519 key, empty if results are unsigned
};

// Peer connectivity consumed by the scheduler. Payloads are opaque bytes.
class Transport {
public:
    using ResultCallback = std::function<void(const std::string& worker_id,
                                              const std::string& task_id,
                                              const Bytes& payload)>;

    virtual ~Transport() = default;

    virtual std::vector<PeerInfo> connected_workers() = 0;

    // Returns false if the peer refused or could not be reached
    virtual bool send_task(const std::string& worker_id, const Bytes& payload) = 0;

    // Results may arrive on any thread, in any order, or never
    virtual void set_result_callback(ResultCallback callback) = 0;
};

} // namespace vouchrun
