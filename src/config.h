#pragma once

#include <string>
#include "sandbox.h"
#include "scheduler.h"
#include "vouchrun/job_orchestrator.h"

namespace vouchrun {

// Complete node configuration; defaults come from constants.h
struct Config {
    SandboxConfig sandbox;
    SchedulerConfig scheduler;
    OrchestratorConfig orchestrator;
};

// Loads Config from JSON. Unknown keys are ignored; malformed JSON, values
// of the wrong type and invalid values throw std::runtime_error.
//
// {
//   "limits":       { "max_memory_bytes": 67108864, "max_cpu_cycles": 1000000000,
//                     "max_execution_time_ms": 30000, "max_stack_bytes": 1048576 },
//   "sandbox":      { "max_module_size": 4194304 },
//   "scheduler":    { "trust_decay": 0.9, "trust_weight_success": 0.1, ... },
//   "orchestrator": { "max_parallel_tasks": 16, "verification": "hash",
//                     "job_retention_seconds": 300 }
// }
class ConfigLoader {
public:
    static Config from_file(const std::string& path);
    static Config from_string(const std::string& json);

    static void validate(const Config& config);
};

} // namespace vouchrun
