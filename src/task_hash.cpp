#include "task_hash.h"
#include "hash_utils.h"
#include <sstream>

namespace vouchrun {

TaskDefinition TaskDefinition::from_task(const Task& task) {
    TaskDefinition def;
    def.job_id = task.job_id;
    def.ordinal = task.ordinal;
    def.module_hash = task.module_hash.empty() ? HashUtils::sha256(task.module)
                                               : task.module_hash;
    def.input_hash = HashUtils::sha256(task.input);
    def.limits = task.limits;
    return def;
}

std::string TaskDefinition::calculate_hash() const {
    std::ostringstream task_data;
    task_data << job_id << "|"
              << ordinal << "|"
              << limits.max_memory_bytes << "|"
              << limits.max_cpu_cycles << "|"
              << limits.max_execution_time.count() << "|"
              << limits.max_stack_bytes << "|"
              << module_hash << "|"
              << input_hash;
    return HashUtils::sha256_string(task_data.str());
}

std::string task_hash(const Task& task) {
    return TaskDefinition::from_task(task).calculate_hash();
}

} // namespace vouchrun
