#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "constants.h"
#include "worker_node.h"
#include "vouchrun/transport.h"

namespace vouchrun {

enum class PeerBehavior {
    HONEST,          // Executes and reports truthfully
    CORRUPT_OUTPUT,  // Output altered in transit; claimed digest left as computed
    WRONG_ANSWER,    // Consistent but wrong output, digest and signature
    SILENT,          // Accepts tasks and never answers
    EXCEED_MEMORY,   // Reports a memory limit breach for every task
    SLOW             // Answers truthfully after the configured delay
};

const char* to_string(PeerBehavior behavior);

struct LoopbackPeer {
    std::string worker_id;
    int capacity = DEFAULT_WORKER_CAPACITY;
    double latency_hint_ms = 0.0;
    PeerBehavior behavior = PeerBehavior::HONEST;
    std::chrono::milliseconds delay{0};   // Applied before answering (SLOW)
    bool sign_results = true;
};

// In-process transport hosting WorkerNode peers on their own threads
class LoopbackTransport : public Transport {
public:
    LoopbackTransport();
    ~LoopbackTransport() override;

    // Returns false if a peer with that ID already exists
    bool add_peer(const LoopbackPeer& peer);
    void remove_peer(const std::string& worker_id);
    void set_behavior(const std::string& worker_id, PeerBehavior behavior);

    // Tasks delivered to a peer so far
    size_t tasks_received(const std::string& worker_id) const;

    // Handler threads still running or not yet joined. Finished handlers
    // are joined on the next send.
    size_t handler_threads() const;

    std::vector<PeerInfo> connected_workers() override;
    bool send_task(const std::string& worker_id, const Bytes& payload) override;
    void set_result_callback(ResultCallback callback) override;

private:
    struct Peer {
        LoopbackPeer config;
        std::unique_ptr<WorkerNode> node;
        size_t received = 0;
    };

    mutable std::mutex peers_mutex_;
    std::map<std::string, std::shared_ptr<Peer>> peers_;

    std::mutex callback_mutex_;
    ResultCallback callback_;

    struct Handler {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done = std::make_shared<std::atomic<bool>>(false);
    };

    mutable std::mutex threads_mutex_;
    std::list<Handler> handlers_;

    std::mutex stop_mutex_;
    std::condition_variable stop_cv_;
    std::atomic<bool> stopping_{false};

    void serve(std::shared_ptr<Peer> peer, PeerBehavior behavior, Bytes payload);
    void reap_finished();
    void deliver(const std::string& worker_id, const std::string& task_id, const Bytes& payload);
};

} // namespace vouchrun
