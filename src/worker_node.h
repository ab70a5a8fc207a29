#pragma once

#include <memory>
#include <string>
#include "sandbox.h"
#include "worker_identity.h"
#include "vouchrun/types.h"

namespace vouchrun {

// Peer-side executor: decodes task payloads, runs them in a local sandbox
// and returns signed result payloads.
class WorkerNode {
public:
    // identity may be null, in which case results are not signed
    WorkerNode(const std::string& worker_id,
               std::unique_ptr<WorkerIdentity> identity = nullptr,
               const SandboxConfig& config = SandboxConfig{});

    // Throws std::runtime_error if the payload is not a valid task
    Bytes handle(const Bytes& task_payload, const CancelToken* cancel = nullptr);

    ExecutionResult execute(const Task& task, const CancelToken* cancel = nullptr);

    // Re-sign a result (after it was modified)
    void attest(ExecutionResult& result) const;

    const std::string& worker_id() const { return worker_id_; }

    // Base64 public key, empty when unsigned
    std::string public_key() const;

private:
    std::string worker_id_;
    std::unique_ptr<WorkerIdentity> identity_;
    SandboxExecutor sandbox_;
};

} // namespace vouchrun
