#pragma once

#include <cstddef>  // for size_t
#include <cstdint>

namespace vouchrun {

// Sandbox limits
constexpr size_t DEFAULT_MEMORY_LIMIT_BYTES = 64 * 1024 * 1024;    // 64MB linear memory + output
constexpr uint64_t DEFAULT_CPU_CYCLE_LIMIT = 1000ULL * 1000 * 1000; // 1 billion cycles
constexpr int64_t DEFAULT_EXECUTION_TIME_MS = 30 * 1000;            // 30 seconds
constexpr size_t DEFAULT_STACK_LIMIT_BYTES = 1024 * 1024;           // 1MB operand + call stack
constexpr size_t STACK_SLOT_BYTES = 8;                              // One operand slot
constexpr size_t CALL_FRAME_BYTES = 16;                             // Return address + saved depth
constexpr size_t MAX_MODULE_SIZE = 4 * 1024 * 1024;                 // 4MB bytecode

// Scheduler
constexpr double DEFAULT_INITIAL_TRUST = 0.5;
constexpr double DEFAULT_TRUST_DECAY = 0.9;
constexpr double DEFAULT_TRUST_WEIGHT_SUCCESS = 0.1;
constexpr double DEFAULT_TRUST_THRESHOLD = 0.4;        // At or below: forced redundancy
constexpr double DEFAULT_QUARANTINE_THRESHOLD = 0.2;   // Below: excluded from selection
constexpr double DEFAULT_SCORE_TRUST_WEIGHT = 0.7;
constexpr double DEFAULT_SCORE_LATENCY_WEIGHT = 0.3;
constexpr double DEFAULT_LATENCY_REFERENCE_MS = 100.0;
constexpr double LATENCY_EWMA_ALPHA = 0.3;
constexpr int DEFAULT_MAX_RETRIES = 3;
constexpr int DEFAULT_REDUNDANCY_FACTOR = 2;
constexpr int DEFAULT_MAX_LIMIT_BREACHES = 2;
constexpr int64_t DEFAULT_LATENCY_MARGIN_MS = 2000;
constexpr int DEFAULT_WORKER_CAPACITY = 4;
constexpr int RESULT_POLL_INTERVAL_MS = 10;            // Await slice for cancellation checks

// Orchestrator
constexpr int DEFAULT_MAX_PARALLEL_TASKS = 16;
constexpr size_t DEFAULT_FIXED_CHUNK_BYTES = 64 * 1024;  // 64KB
constexpr size_t DEFAULT_EQUAL_PARTS = 4;
constexpr size_t DEFAULT_MATRIX_BLOCK_ROWS = 1;

// Identity
constexpr const char* LOCAL_WORKER_ID = "local";

} // namespace vouchrun
