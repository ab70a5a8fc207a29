#include "loopback_transport.h"
#include "hash_utils.h"
#include "task_codec.h"
#include <iostream>
#include <iterator>

namespace vouchrun {

const char* to_string(PeerBehavior behavior) {
    switch (behavior) {
        case PeerBehavior::HONEST: return "honest";
        case PeerBehavior::CORRUPT_OUTPUT: return "corrupt-output";
        case PeerBehavior::WRONG_ANSWER: return "wrong-answer";
        case PeerBehavior::SILENT: return "silent";
        case PeerBehavior::EXCEED_MEMORY: return "exceed-memory";
        case PeerBehavior::SLOW: return "slow";
    }
    return "unknown";
}

LoopbackTransport::LoopbackTransport() = default;

LoopbackTransport::~LoopbackTransport() {
    {
        std::lock_guard<std::mutex> lock(stop_mutex_);
        stopping_ = true;
    }
    stop_cv_.notify_all();

    std::list<Handler> handlers;
    {
        std::lock_guard<std::mutex> lock(threads_mutex_);
        handlers.swap(handlers_);
    }
    for (auto& handler : handlers) {
        if (handler.thread.joinable()) {
            handler.thread.join();
        }
    }
}

bool LoopbackTransport::add_peer(const LoopbackPeer& config) {
    auto peer = std::make_shared<Peer>();
    peer->config = config;

    std::unique_ptr<WorkerIdentity> identity;
    if (config.sign_results) {
        identity = WorkerIdentity::generate();
        if (!identity) {
            std::cerr << "[Loopback] Failed to generate identity for " << config.worker_id << std::endl;
            return false;
        }
    }
    peer->node = std::make_unique<WorkerNode>(config.worker_id, std::move(identity));

    std::lock_guard<std::mutex> lock(peers_mutex_);
    return peers_.emplace(config.worker_id, std::move(peer)).second;
}

void LoopbackTransport::remove_peer(const std::string& worker_id) {
    std::lock_guard<std::mutex> lock(peers_mutex_);
    peers_.erase(worker_id);
}

void LoopbackTransport::set_behavior(const std::string& worker_id, PeerBehavior behavior) {
    std::lock_guard<std::mutex> lock(peers_mutex_);
    auto it = peers_.find(worker_id);
    if (it != peers_.end()) {
        it->second->config.behavior = behavior;
    }
}

size_t LoopbackTransport::tasks_received(const std::string& worker_id) const {
    std::lock_guard<std::mutex> lock(peers_mutex_);
    auto it = peers_.find(worker_id);
    return it == peers_.end() ? 0 : it->second->received;
}

size_t LoopbackTransport::handler_threads() const {
    std::lock_guard<std::mutex> lock(threads_mutex_);
    return handlers_.size();
}

void LoopbackTransport::reap_finished() {
    std::list<Handler> finished;
    {
        std::lock_guard<std::mutex> lock(threads_mutex_);
        for (auto it = handlers_.begin(); it != handlers_.end();) {
            auto next = std::next(it);
            if (it->done->load()) {
                finished.splice(finished.end(), handlers_, it);
            }
            it = next;
        }
    }
    for (auto& handler : finished) {
        handler.thread.join();
    }
}

std::vector<PeerInfo> LoopbackTransport::connected_workers() {
    std::lock_guard<std::mutex> lock(peers_mutex_);
    std::vector<PeerInfo> workers;
    for (const auto& entry : peers_) {
        PeerInfo info;
        info.worker_id = entry.first;
        info.capacity = entry.second->config.capacity;
        info.latency_hint_ms = entry.second->config.latency_hint_ms;
        info.public_key = entry.second->node->public_key();
        workers.push_back(info);
    }
    return workers;
}

bool LoopbackTransport::send_task(const std::string& worker_id, const Bytes& payload) {
    if (stopping_) {
        return false;
    }

    std::shared_ptr<Peer> peer;
    PeerBehavior behavior;
    {
        std::lock_guard<std::mutex> lock(peers_mutex_);
        auto it = peers_.find(worker_id);
        if (it == peers_.end()) {
            return false;
        }
        peer = it->second;
        peer->received++;
        behavior = peer->config.behavior;
    }

    if (behavior == PeerBehavior::SILENT) {
        return true;
    }

    reap_finished();

    Handler handler;
    auto done = handler.done;
    handler.thread = std::thread([this, peer, behavior, payload, done] {
        serve(peer, behavior, payload);
        done->store(true);
    });
    std::lock_guard<std::mutex> lock(threads_mutex_);
    handlers_.push_back(std::move(handler));
    return true;
}

void LoopbackTransport::set_result_callback(ResultCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    callback_ = std::move(callback);
}

void LoopbackTransport::serve(std::shared_ptr<Peer> peer, PeerBehavior behavior, Bytes payload) {
    Task task;
    try {
        task = TaskCodec::decode_task(payload);
    } catch (const std::runtime_error& e) {
        std::cerr << "[Loopback] " << peer->config.worker_id
                  << " dropped malformed task: " << e.what() << std::endl;
        return;
    }

    if (peer->config.delay.count() > 0) {
        std::unique_lock<std::mutex> lock(stop_mutex_);
        if (stop_cv_.wait_for(lock, peer->config.delay, [this] { return stopping_.load(); })) {
            return;
        }
    }

    ExecutionResult result = peer->node->execute(task);

    switch (behavior) {
        case PeerBehavior::CORRUPT_OUTPUT:
            if (result.output.empty()) {
                result.output.push_back(0xff);
            } else {
                result.output[0] ^= 0xff;
            }
            break;
        case PeerBehavior::WRONG_ANSWER:
            result.output.push_back(0x00);
            result.output_digest = HashUtils::sha256(result.output);
            peer->node->attest(result);
            break;
        case PeerBehavior::EXCEED_MEMORY:
            result.outcome = OutcomeKind::RESOURCE_EXCEEDED;
            result.exceeded = ResourceKind::MEMORY;
            result.error = "memory limit exceeded";
            result.output.clear();
            result.output_digest = HashUtils::sha256(result.output);
            peer->node->attest(result);
            break;
        default:
            break;
    }

    deliver(peer->config.worker_id, task.task_id, TaskCodec::encode_result(result));
}

void LoopbackTransport::deliver(const std::string& worker_id, const std::string& task_id,
                                const Bytes& payload) {
    if (stopping_) {
        return;
    }
    // Held while calling so that clearing the callback waits for deliveries
    std::lock_guard<std::mutex> lock(callback_mutex_);
    if (callback_) {
        callback_(worker_id, task_id, payload);
    }
}

} // namespace vouchrun
