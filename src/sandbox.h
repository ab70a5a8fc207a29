#pragma once

#include <string>
#include <chrono>
#include <memory>
#include "constants.h"
#include "vouchrun/types.h"

namespace vouchrun {

// Sandbox configuration
struct SandboxConfig {
    std::string executor_id = LOCAL_WORKER_ID;   // Reported as ExecutionResult::worker_id
    size_t max_module_size = MAX_MODULE_SIZE;
};

// Runs task bytecode in an isolated, metered virtual machine.
//
// Code inside the VM can read its input, use its own linear memory and
// append to its output. Nothing else of the host is reachable. Every
// instruction is charged in cycles; limits are enforced at checkpoints
// (backward jumps, calls, returns, halt and bulk operations), so a limit
// overshoot is bounded by the longest straight-line run of code.
class SandboxExecutor {
public:
    SandboxExecutor(const SandboxConfig& config = SandboxConfig{});
    ~SandboxExecutor();

    // Execute a task. The cancel token and deadline are observed at
    // checkpoints; a passed deadline yields TIMED_OUT, cancellation
    // yields CANCELLED. Never throws for faults inside the task.
    ExecutionResult execute(const Task& task,
                            const CancelToken* cancel = nullptr,
                            Deadline deadline = Deadline::never());

    // Run bare bytecode without a task envelope
    ExecutionResult run(const Bytes& module,
                        const Bytes& input,
                        const ResourceLimits& limits,
                        const CancelToken* cancel = nullptr,
                        Deadline deadline = Deadline::never());

    const SandboxConfig& config() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace vouchrun
