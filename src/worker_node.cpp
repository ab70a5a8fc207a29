#include "worker_node.h"
#include "hash_utils.h"
#include "task_codec.h"
#include "task_hash.h"

namespace vouchrun {

WorkerNode::WorkerNode(const std::string& worker_id,
                       std::unique_ptr<WorkerIdentity> identity,
                       const SandboxConfig& config)
    : worker_id_(worker_id),
      identity_(std::move(identity)),
      sandbox_([&] {
          SandboxConfig node_config = config;
          node_config.executor_id = worker_id;
          return node_config;
      }()) {}

Bytes WorkerNode::handle(const Bytes& task_payload, const CancelToken* cancel) {
    Task task = TaskCodec::decode_task(task_payload);
    return TaskCodec::encode_result(execute(task, cancel));
}

ExecutionResult WorkerNode::execute(const Task& task, const CancelToken* cancel) {
    ExecutionResult result;
    if (HashUtils::sha256(task.module) != task.module_hash) {
        result.task_id = task.task_id;
        result.worker_id = worker_id_;
        result.outcome = OutcomeKind::TRAPPED;
        result.error = "module does not match its hash";
        result.output_digest = HashUtils::sha256(result.output);
    } else {
        result = sandbox_.execute(task, cancel);
    }
    result.task_hash = task_hash(task);
    attest(result);
    return result;
}

void WorkerNode::attest(ExecutionResult& result) const {
    if (identity_) {
        identity_->attest(result);
    }
}

std::string WorkerNode::public_key() const {
    return identity_ ? identity_->get_worker_id() : "";
}

} // namespace vouchrun
