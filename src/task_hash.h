#pragma once
#include <string>
#include "vouchrun/types.h"

namespace vouchrun {

// Deterministic commitment to everything that determines a task's output.
// Workers echo it back so a result cannot be replayed against another task.
struct TaskDefinition {
    std::string job_id;
    uint32_t ordinal = 0;
    std::string module_hash;
    std::string input_hash;
    ResourceLimits limits;

    static TaskDefinition from_task(const Task& task);

    std::string calculate_hash() const;
};

// Shorthand for TaskDefinition::from_task(task).calculate_hash()
std::string task_hash(const Task& task);

} // namespace vouchrun
