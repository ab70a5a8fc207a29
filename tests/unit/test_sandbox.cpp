#include <gtest/gtest.h>
#include "sandbox.h"
#include "assembler.h"
#include "builtin_programs.h"
#include "bytecode.h"
#include "hash_utils.h"
#include "task_hash.h"
#include <chrono>
#include <cstring>
#include <limits>

namespace vouchrun {
namespace {

class SandboxTest : public ::testing::Test {
protected:
    SandboxExecutor sandbox;
    ResourceLimits limits;

    ExecutionResult run(const std::string& source, const Bytes& input = {}) {
        return sandbox.run(Assembler::assemble(source), input, limits);
    }

    static uint64_t read_u64(const Bytes& data, size_t offset = 0) {
        uint64_t value = 0;
        for (int i = 0; i < 8; ++i) {
            value |= static_cast<uint64_t>(data[offset + i]) << (8 * i);
        }
        return value;
    }

    // Effectively unlimited cycles, so only wall-clock checks can stop a loop
    void unlimited_cpu() {
        limits.max_cpu_cycles = std::numeric_limits<uint64_t>::max() / 2;
    }
};

// ============================================================================
// Successful execution
// ============================================================================

TEST_F(SandboxTest, IncrementBytes) {
    // Given: Some input bytes including a wraparound case
    Bytes input = {1, 2, 255};

    // When: We run the increment program
    auto result = sandbox.run(BuiltInPrograms::increment_bytes().bytecode(), input, limits);

    // Then: Each byte is incremented mod 256
    ASSERT_EQ(result.outcome, OutcomeKind::SUCCESS) << result.error;
    EXPECT_EQ(result.output, (Bytes{2, 3, 0}));
    EXPECT_EQ(result.output_digest, HashUtils::sha256(result.output));
    EXPECT_EQ(result.worker_id, LOCAL_WORKER_ID);
}

TEST_F(SandboxTest, SumBytes) {
    Bytes input = {10, 20, 30, 200};

    auto result = sandbox.run(BuiltInPrograms::sum_bytes().bytecode(), input, limits);

    ASSERT_EQ(result.outcome, OutcomeKind::SUCCESS) << result.error;
    ASSERT_EQ(result.output.size(), 8u);
    EXPECT_EQ(read_u64(result.output), 260u);
}

TEST_F(SandboxTest, EmptyInputProducesEmptyOutput) {
    auto result = sandbox.run(BuiltInPrograms::increment_bytes().bytecode(), {}, limits);

    ASSERT_EQ(result.outcome, OutcomeKind::SUCCESS);
    EXPECT_TRUE(result.output.empty());
    EXPECT_EQ(result.output_digest, HashUtils::sha256(Bytes{}));
}

TEST_F(SandboxTest, ArithmeticAndStackOps) {
    auto result = run(R"(
        push 7 push 3 sub emit8        ; 4
        push 6 push 7 mul emit8        ; 42
        push 17 push 5 mod emit8       ; 2
        push 1 push 2 swap emit8 emit8 ; 1 2
        push 9 push 8 over emit8 pop pop
        push 5 push 6 push 7 pick 2 emit8 pop pop pop
        push 0 not emit8
        halt
    )");

    ASSERT_EQ(result.outcome, OutcomeKind::SUCCESS) << result.error;
    EXPECT_EQ(result.output, (Bytes{4, 42, 2, 1, 2, 9, 5, 1}));
}

TEST_F(SandboxTest, CallAndReturn) {
    auto result = run(R"(
        push 20 call double emit8
        halt
double: dup add ret
    )");

    ASSERT_EQ(result.outcome, OutcomeKind::SUCCESS) << result.error;
    EXPECT_EQ(result.output, (Bytes{40}));
}

TEST_F(SandboxTest, LinearMemoryAndBulkOps) {
    // Copy the input into memory, then emit it back
    Bytes input = {'a', 'b', 'c', 'd'};
    auto result = run(R"(
        push 16 grow pop
        push 4 push 0 push 4 incopy
        push 4 push 4 emitmem
        memsize emit8
        halt
    )", input);

    ASSERT_EQ(result.outcome, OutcomeKind::SUCCESS) << result.error;
    EXPECT_EQ(result.output, (Bytes{'a', 'b', 'c', 'd', 16}));
    EXPECT_GE(result.usage.peak_memory_bytes, 16u);
}

TEST_F(SandboxTest, MatrixMultiplyRowBlock) {
    // Given: A = [[1,2],[3,4]] and B = [[5,6],[7,8]]
    Bytes input;
    auto put = [&input](int64_t v) {
        for (int i = 0; i < 8; ++i) {
            input.push_back(static_cast<uint8_t>((static_cast<uint64_t>(v) >> (8 * i)) & 0xff));
        }
    };
    for (int64_t v : {2, 2, 1, 2, 3, 4}) put(v);
    for (int64_t v : {2, 2, 5, 6, 7, 8}) put(v);

    auto result = sandbox.run(BuiltInPrograms::matrix_multiply().bytecode(), input, limits);

    // Then: C = [[19,22],[43,50]]
    ASSERT_EQ(result.outcome, OutcomeKind::SUCCESS) << result.error;
    ASSERT_EQ(result.output.size(), 8u * 6);
    EXPECT_EQ(read_u64(result.output, 0), 2u);
    EXPECT_EQ(read_u64(result.output, 8), 2u);
    EXPECT_EQ(read_u64(result.output, 16), 19u);
    EXPECT_EQ(read_u64(result.output, 24), 22u);
    EXPECT_EQ(read_u64(result.output, 32), 43u);
    EXPECT_EQ(read_u64(result.output, 40), 50u);
}

TEST_F(SandboxTest, MatrixMultiplyDimensionMismatchTraps) {
    Bytes input(8 * 6, 0);
    input[0] = 1;   // r
    input[8] = 2;   // c
    input[32] = 3;  // k != c
    input[40] = 0;  // n

    auto result = sandbox.run(BuiltInPrograms::matrix_multiply().bytecode(), input, limits);

    EXPECT_EQ(result.outcome, OutcomeKind::TRAPPED);
}

TEST_F(SandboxTest, ExecutionIsDeterministic) {
    Bytes input(1000);
    for (size_t i = 0; i < input.size(); ++i) {
        input[i] = static_cast<uint8_t>(i * 31);
    }
    auto module = BuiltInPrograms::increment_bytes().bytecode();

    auto first = sandbox.run(module, input, limits);
    auto second = sandbox.run(module, input, limits);

    EXPECT_EQ(first.output_digest, second.output_digest);
    EXPECT_EQ(first.usage.cpu_cycles, second.usage.cpu_cycles);
}

TEST_F(SandboxTest, ExecuteBindsResultToTask) {
    // Given: A task envelope
    Task task;
    task.task_id = "job_1:0";
    task.job_id = "job_1";
    task.module = BuiltInPrograms::increment_bytes().bytecode();
    task.module_hash = HashUtils::sha256(task.module);
    task.input = {5};
    task.limits = limits;

    // When: We execute it
    auto result = sandbox.execute(task);

    // Then: The result carries the task ID and its commitment
    EXPECT_EQ(result.task_id, "job_1:0");
    EXPECT_EQ(result.task_hash, task_hash(task));
    EXPECT_EQ(result.output, (Bytes{6}));
}

// ============================================================================
// Resource limits
// ============================================================================

TEST_F(SandboxTest, MemoryLimitStopsLargeAllocation) {
    // Given: A 1MB memory limit and a program that grows by 2MB
    limits.max_memory_bytes = 1024 * 1024;

    auto result = sandbox.run(BuiltInPrograms::allocate(2 * 1024 * 1024).bytecode(), {}, limits);

    // Then: Memory is reported as the exceeded resource and nothing leaks out
    EXPECT_EQ(result.outcome, OutcomeKind::RESOURCE_EXCEEDED);
    EXPECT_EQ(result.exceeded, ResourceKind::MEMORY);
    EXPECT_TRUE(result.output.empty());
    EXPECT_LE(result.usage.peak_memory_bytes, limits.max_memory_bytes);
}

TEST_F(SandboxTest, AllocationWithinLimitSucceeds) {
    limits.max_memory_bytes = 1024 * 1024;

    auto result = sandbox.run(BuiltInPrograms::allocate(512 * 1024).bytecode(), {}, limits);

    EXPECT_EQ(result.outcome, OutcomeKind::SUCCESS) << result.error;
    EXPECT_EQ(result.usage.peak_memory_bytes, 512u * 1024);
}

TEST_F(SandboxTest, OutputCountsAgainstMemory) {
    limits.max_memory_bytes = 100;

    auto result = run("loop: push 1 emit8 jmp loop");

    EXPECT_EQ(result.outcome, OutcomeKind::RESOURCE_EXCEEDED);
    EXPECT_EQ(result.exceeded, ResourceKind::MEMORY);
    EXPECT_TRUE(result.output.empty());
}

TEST_F(SandboxTest, CpuLimitStopsInfiniteLoop) {
    limits.max_cpu_cycles = 1000;

    auto result = run("loop: jmp loop");

    EXPECT_EQ(result.outcome, OutcomeKind::RESOURCE_EXCEEDED);
    EXPECT_EQ(result.exceeded, ResourceKind::CPU);
    // Every backward jump is a checkpoint, so the overshoot is one instruction
    EXPECT_LE(result.usage.cpu_cycles, 1001u);
}

TEST_F(SandboxTest, CpuLimitChargesBulkOpsUpfront) {
    // A single large grow costs more than the whole budget
    limits.max_cpu_cycles = 100;

    auto result = sandbox.run(BuiltInPrograms::allocate(64 * 1024).bytecode(), {}, limits);

    EXPECT_EQ(result.outcome, OutcomeKind::RESOURCE_EXCEEDED);
    EXPECT_EQ(result.exceeded, ResourceKind::CPU);
    EXPECT_EQ(result.usage.peak_memory_bytes, 0u);
}

TEST_F(SandboxTest, StackLimitStopsUnboundedPush) {
    limits.max_stack_bytes = 64;

    auto result = run("loop: push 1 jmp loop");

    EXPECT_EQ(result.outcome, OutcomeKind::RESOURCE_EXCEEDED);
    EXPECT_EQ(result.exceeded, ResourceKind::STACK);
    EXPECT_LE(result.usage.peak_stack_bytes, 64u);
}

TEST_F(SandboxTest, StackLimitStopsUnboundedRecursion) {
    limits.max_stack_bytes = 1024;

    auto result = run("f: call f");

    EXPECT_EQ(result.outcome, OutcomeKind::RESOURCE_EXCEEDED);
    EXPECT_EQ(result.exceeded, ResourceKind::STACK);
}

TEST_F(SandboxTest, TimeLimitStopsLongRun) {
    unlimited_cpu();
    limits.max_execution_time = std::chrono::milliseconds(50);

    auto result = run("loop: jmp loop");

    EXPECT_EQ(result.outcome, OutcomeKind::RESOURCE_EXCEEDED);
    EXPECT_EQ(result.exceeded, ResourceKind::TIME);
}

TEST_F(SandboxTest, DeadlineYieldsTimedOut) {
    unlimited_cpu();
    limits.max_execution_time = std::chrono::milliseconds(60 * 1000);

    auto result = sandbox.run(Assembler::assemble("loop: jmp loop"), {}, limits, nullptr,
                              Deadline::after(std::chrono::milliseconds(50)));

    EXPECT_EQ(result.outcome, OutcomeKind::TIMED_OUT);
}

TEST_F(SandboxTest, CancellationStopsExecution) {
    unlimited_cpu();
    CancelToken cancel;
    cancel.cancel();

    auto result = sandbox.run(Assembler::assemble("loop: jmp loop"), {}, limits, &cancel);

    EXPECT_EQ(result.outcome, OutcomeKind::CANCELLED);
    EXPECT_TRUE(result.output.empty());
}

// ============================================================================
// Traps
// ============================================================================

TEST_F(SandboxTest, DivisionByZeroTraps) {
    auto result = run("push 1 emit8 push 1 push 0 div halt");

    EXPECT_EQ(result.outcome, OutcomeKind::TRAPPED);
    EXPECT_NE(result.error.find("division"), std::string::npos);
    // Partial output is discarded on failure
    EXPECT_TRUE(result.output.empty());
}

TEST_F(SandboxTest, StackUnderflowTraps) {
    EXPECT_EQ(run("pop halt").outcome, OutcomeKind::TRAPPED);
    EXPECT_EQ(run("add halt").outcome, OutcomeKind::TRAPPED);
}

TEST_F(SandboxTest, OutOfBoundsAccessTraps) {
    EXPECT_EQ(run("push 0 load8 halt").outcome, OutcomeKind::TRAPPED);
    EXPECT_EQ(run("push 8 grow pop push 4 load64 halt").outcome, OutcomeKind::TRAPPED);
    EXPECT_EQ(run("push 0 inload8 halt").outcome, OutcomeKind::TRAPPED);
    EXPECT_EQ(run("push -1 load8 halt").outcome, OutcomeKind::TRAPPED);
}

TEST_F(SandboxTest, ReturnWithoutCallTraps) {
    EXPECT_EQ(run("ret").outcome, OutcomeKind::TRAPPED);
}

TEST_F(SandboxTest, RunningPastEndTraps) {
    EXPECT_EQ(run("nop").outcome, OutcomeKind::TRAPPED);
}

TEST_F(SandboxTest, InvalidOpcodeTraps) {
    auto result = sandbox.run(Bytes{0xFF}, {}, limits);

    EXPECT_EQ(result.outcome, OutcomeKind::TRAPPED);
}

TEST_F(SandboxTest, TruncatedImmediateTraps) {
    auto result = sandbox.run(Bytes{static_cast<uint8_t>(Opcode::PUSH), 0x01}, {}, limits);

    EXPECT_EQ(result.outcome, OutcomeKind::TRAPPED);
}

TEST_F(SandboxTest, EmptyModuleTraps) {
    auto result = sandbox.run(Bytes{}, {}, limits);

    EXPECT_EQ(result.outcome, OutcomeKind::TRAPPED);
}

TEST_F(SandboxTest, OversizedModuleTraps) {
    SandboxConfig config;
    config.max_module_size = 4;
    SandboxExecutor small(config);

    auto result = small.run(Assembler::assemble("push 1 halt"), {}, limits);

    EXPECT_EQ(result.outcome, OutcomeKind::TRAPPED);
}

} // namespace
} // namespace vouchrun
