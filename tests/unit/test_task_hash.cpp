#include <gtest/gtest.h>
#include "task_hash.h"
#include "hash_utils.h"

namespace vouchrun {
namespace {

class TaskHashTest : public ::testing::Test {
protected:
    Task create_basic_task() {
        Task task;
        task.task_id = "job_1:0";
        task.job_id = "job_1";
        task.ordinal = 0;
        task.module = {0x01};
        task.module_hash = HashUtils::sha256(task.module);
        task.input = {1, 2, 3};
        return task;
    }
};

TEST_F(TaskHashTest, ReturnsValidSha256) {
    std::string hash = task_hash(create_basic_task());

    EXPECT_TRUE(HashUtils::is_valid_sha256(hash));
}

TEST_F(TaskHashTest, SameTaskProducesSameHash) {
    EXPECT_EQ(task_hash(create_basic_task()), task_hash(create_basic_task()));
}

TEST_F(TaskHashTest, MissingModuleHashIsComputed) {
    // Given: The same task with and without a precomputed module hash
    Task with_hash = create_basic_task();
    Task without_hash = create_basic_task();
    without_hash.module_hash.clear();

    // Then: Both commit to the same definition
    EXPECT_EQ(task_hash(with_hash), task_hash(without_hash));
}

TEST_F(TaskHashTest, SchedulingStateDoesNotAffectHash) {
    Task task = create_basic_task();
    std::string before = task_hash(task);

    task.state = TaskState::RUNNING;
    task.assigned_worker = "peer-1";
    task.retry_count = 2;

    EXPECT_EQ(task_hash(task), before);
}

// ============================================================================
// Every field that determines the output changes the hash
// ============================================================================

TEST_F(TaskHashTest, DifferentInputChangesHash) {
    Task a = create_basic_task();
    Task b = create_basic_task();
    b.input = {1, 2, 4};

    EXPECT_NE(task_hash(a), task_hash(b));
}

TEST_F(TaskHashTest, DifferentModuleChangesHash) {
    Task a = create_basic_task();
    Task b = create_basic_task();
    b.module = {0x00, 0x01};
    b.module_hash = HashUtils::sha256(b.module);

    EXPECT_NE(task_hash(a), task_hash(b));
}

TEST_F(TaskHashTest, DifferentOrdinalChangesHash) {
    Task a = create_basic_task();
    Task b = create_basic_task();
    b.ordinal = 1;

    EXPECT_NE(task_hash(a), task_hash(b));
}

TEST_F(TaskHashTest, DifferentJobChangesHash) {
    Task a = create_basic_task();
    Task b = create_basic_task();
    b.job_id = "job_2";

    EXPECT_NE(task_hash(a), task_hash(b));
}

TEST_F(TaskHashTest, DifferentLimitsChangeHash) {
    Task base = create_basic_task();
    std::string hash = task_hash(base);

    Task memory = base;
    memory.limits.max_memory_bytes /= 2;
    EXPECT_NE(task_hash(memory), hash);

    Task cpu = base;
    cpu.limits.max_cpu_cycles += 1;
    EXPECT_NE(task_hash(cpu), hash);

    Task time = base;
    time.limits.max_execution_time = std::chrono::milliseconds(1);
    EXPECT_NE(task_hash(time), hash);

    Task stack = base;
    stack.limits.max_stack_bytes = 64;
    EXPECT_NE(task_hash(stack), hash);
}

} // namespace
} // namespace vouchrun
