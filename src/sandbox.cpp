#include "sandbox.h"
#include "bytecode.h"
#include "hash_utils.h"
#include "task_hash.h"
#include <algorithm>
#include <limits>
#include <new>
#include <vector>

namespace vouchrun {

namespace {

// Raised inside the interpreter to stop execution
struct Stop {
    OutcomeKind outcome;
    ResourceKind exceeded;
    std::string message;
};

[[noreturn]] void trap(const std::string& message) {
    throw Stop{OutcomeKind::TRAPPED, ResourceKind::NONE, message};
}

[[noreturn]] void exceed(ResourceKind kind, const std::string& message) {
    throw Stop{OutcomeKind::RESOURCE_EXCEEDED, kind, message};
}

uint64_t read_le(const uint8_t* p, int width) {
    uint64_t value = 0;
    for (int i = 0; i < width; ++i) {
        value |= static_cast<uint64_t>(p[i]) << (8 * i);
    }
    return value;
}

void write_le(uint8_t* p, uint64_t value, int width) {
    for (int i = 0; i < width; ++i) {
        p[i] = static_cast<uint8_t>((value >> (8 * i)) & 0xff);
    }
}

// Cycle cost of an instruction that does work proportional to len
uint64_t bulk_cost(uint64_t len, uint64_t per_cycle) {
    return 1 + len / per_cycle;
}

class Machine {
public:
    Machine(const Bytes& code, const Bytes& input, const ResourceLimits& limits,
            const CancelToken* cancel, Deadline deadline)
        : code_(code), input_(input), limits_(limits),
          cancel_(cancel), deadline_(deadline),
          start_(std::chrono::steady_clock::now()) {}

    void run();

    Bytes& output() { return output_; }
    ResourceUsage usage() const {
        ResourceUsage usage;
        usage.cpu_cycles = cycles_;
        usage.peak_memory_bytes = peak_memory_;
        usage.peak_stack_bytes = peak_stack_;
        usage.wall_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_);
        return usage;
    }

private:
    const Bytes& code_;
    const Bytes& input_;
    const ResourceLimits& limits_;
    const CancelToken* cancel_;
    Deadline deadline_;
    std::chrono::steady_clock::time_point start_;

    std::vector<int64_t> stack_;
    std::vector<uint32_t> frames_;  // Return addresses
    Bytes memory_;
    Bytes output_;
    size_t pc_ = 0;
    uint64_t cycles_ = 0;
    uint64_t peak_memory_ = 0;
    uint64_t peak_stack_ = 0;

    void checkpoint();
    void charge_upfront(uint64_t cost);

    uint64_t stack_bytes(size_t slots, size_t frames) const {
        return slots * STACK_SLOT_BYTES + frames * CALL_FRAME_BYTES;
    }
    void note_stack() {
        peak_stack_ = std::max<uint64_t>(peak_stack_, stack_bytes(stack_.size(), frames_.size()));
    }
    void note_memory() {
        peak_memory_ = std::max<uint64_t>(peak_memory_, memory_.size() + output_.size());
    }

    void push(int64_t value) {
        if (stack_bytes(stack_.size() + 1, frames_.size()) > limits_.max_stack_bytes) {
            exceed(ResourceKind::STACK, "operand stack limit exceeded");
        }
        stack_.push_back(value);
        note_stack();
    }
    int64_t pop() {
        if (stack_.empty()) {
            trap("stack underflow");
        }
        int64_t value = stack_.back();
        stack_.pop_back();
        return value;
    }
    void require(size_t depth) const {
        if (stack_.size() < depth) {
            trap("stack underflow");
        }
    }

    uint64_t immediate(int width) {
        if (code_.size() - pc_ < static_cast<size_t>(width)) {
            trap("truncated immediate");
        }
        uint64_t value = read_le(code_.data() + pc_, width);
        pc_ += width;
        return value;
    }

    // Bounds-checked offset into a buffer of the given size
    size_t span(int64_t offset, uint64_t width, size_t size, const char* what) const {
        if (offset < 0 || static_cast<uint64_t>(offset) > size ||
            size - static_cast<uint64_t>(offset) < width) {
            trap(std::string(what) + " access out of bounds");
        }
        return static_cast<size_t>(offset);
    }

    void reserve_output(uint64_t extra) {
        if (memory_.size() + output_.size() + extra > limits_.max_memory_bytes) {
            exceed(ResourceKind::MEMORY, "output exceeds memory limit");
        }
    }

    void jump(uint32_t target, size_t instruction_start) {
        pc_ = target;
        if (target <= instruction_start) {
            checkpoint();
        }
    }

    int64_t binary(Opcode op, int64_t a, int64_t b);
};

void Machine::checkpoint() {
    if (cycles_ > limits_.max_cpu_cycles) {
        exceed(ResourceKind::CPU, "cpu cycle limit exceeded");
    }
    if (cancel_ && cancel_->is_cancelled()) {
        throw Stop{OutcomeKind::CANCELLED, ResourceKind::NONE, "execution cancelled"};
    }
    auto elapsed = std::chrono::steady_clock::now() - start_;
    if (elapsed > limits_.max_execution_time) {
        exceed(ResourceKind::TIME, "execution time limit exceeded");
    }
    if (deadline_.expired()) {
        throw Stop{OutcomeKind::TIMED_OUT, ResourceKind::NONE, "attempt deadline passed"};
    }
}

void Machine::charge_upfront(uint64_t cost) {
    if (cycles_ + cost > limits_.max_cpu_cycles) {
        cycles_ += cost;
        exceed(ResourceKind::CPU, "cpu cycle limit exceeded");
    }
}

int64_t Machine::binary(Opcode op, int64_t a, int64_t b) {
    uint64_t ua = static_cast<uint64_t>(a);
    uint64_t ub = static_cast<uint64_t>(b);
    switch (op) {
        case Opcode::ADD: return static_cast<int64_t>(ua + ub);
        case Opcode::SUB: return static_cast<int64_t>(ua - ub);
        case Opcode::MUL: return static_cast<int64_t>(ua * ub);
        case Opcode::DIV:
        case Opcode::MOD:
            if (b == 0) {
                trap("division by zero");
            }
            if (a == std::numeric_limits<int64_t>::min() && b == -1) {
                trap("division overflow");
            }
            return op == Opcode::DIV ? a / b : a % b;
        case Opcode::AND: return a & b;
        case Opcode::OR: return a | b;
        case Opcode::XOR: return a ^ b;
        case Opcode::SHL: return static_cast<int64_t>(ua << (ub & 63));
        case Opcode::SHR: return static_cast<int64_t>(ua >> (ub & 63));
        case Opcode::EQ: return a == b;
        case Opcode::NE: return a != b;
        case Opcode::LT: return a < b;
        case Opcode::LE: return a <= b;
        case Opcode::GT: return a > b;
        case Opcode::GE: return a >= b;
        default: trap("invalid binary opcode");
    }
}

void Machine::run() {
    for (;;) {
        if (pc_ >= code_.size()) {
            trap("execution ran past end of module");
        }
        const size_t start = pc_;
        const auto op = static_cast<Opcode>(code_[pc_++]);
        cycles_ += 1;

        switch (op) {
            case Opcode::NOP:
                break;
            case Opcode::HALT:
                checkpoint();
                return;
            case Opcode::PUSH:
                push(static_cast<int64_t>(immediate(8)));
                break;
            case Opcode::POP:
                pop();
                break;
            case Opcode::DUP:
                require(1);
                push(stack_.back());
                break;
            case Opcode::SWAP:
                require(2);
                std::swap(stack_[stack_.size() - 1], stack_[stack_.size() - 2]);
                break;
            case Opcode::OVER:
                require(2);
                push(stack_[stack_.size() - 2]);
                break;
            case Opcode::PICK: {
                auto depth = static_cast<size_t>(immediate(1));
                require(depth + 1);
                push(stack_[stack_.size() - 1 - depth]);
                break;
            }

            case Opcode::MUL:
            case Opcode::DIV:
            case Opcode::MOD:
                cycles_ += (op == Opcode::MUL) ? 1 : 3;
                [[fallthrough]];
            case Opcode::ADD:
            case Opcode::SUB:
            case Opcode::AND:
            case Opcode::OR:
            case Opcode::XOR:
            case Opcode::SHL:
            case Opcode::SHR:
            case Opcode::EQ:
            case Opcode::NE:
            case Opcode::LT:
            case Opcode::LE:
            case Opcode::GT:
            case Opcode::GE: {
                int64_t b = pop();
                int64_t a = pop();
                push(binary(op, a, b));
                break;
            }
            case Opcode::NOT:
                push(pop() == 0 ? 1 : 0);
                break;

            case Opcode::JMP:
                jump(static_cast<uint32_t>(immediate(4)), start);
                break;
            case Opcode::JZ:
            case Opcode::JNZ: {
                auto target = static_cast<uint32_t>(immediate(4));
                int64_t cond = pop();
                if ((op == Opcode::JZ) == (cond == 0)) {
                    jump(target, start);
                }
                break;
            }
            case Opcode::CALL: {
                auto target = static_cast<uint32_t>(immediate(4));
                if (stack_bytes(stack_.size(), frames_.size() + 1) > limits_.max_stack_bytes) {
                    exceed(ResourceKind::STACK, "call stack limit exceeded");
                }
                frames_.push_back(static_cast<uint32_t>(pc_));
                note_stack();
                pc_ = target;
                checkpoint();
                break;
            }
            case Opcode::RET:
                if (frames_.empty()) {
                    trap("return with empty call stack");
                }
                pc_ = frames_.back();
                frames_.pop_back();
                checkpoint();
                break;

            case Opcode::LOAD8: {
                size_t at = span(pop(), 1, memory_.size(), "memory");
                push(memory_[at]);
                break;
            }
            case Opcode::LOAD64: {
                size_t at = span(pop(), 8, memory_.size(), "memory");
                push(static_cast<int64_t>(read_le(memory_.data() + at, 8)));
                break;
            }
            case Opcode::STORE8: {
                int64_t value = pop();
                size_t at = span(pop(), 1, memory_.size(), "memory");
                memory_[at] = static_cast<uint8_t>(value & 0xff);
                break;
            }
            case Opcode::STORE64: {
                int64_t value = pop();
                size_t at = span(pop(), 8, memory_.size(), "memory");
                write_le(memory_.data() + at, static_cast<uint64_t>(value), 8);
                break;
            }
            case Opcode::GROW: {
                int64_t n = pop();
                if (n < 0) {
                    trap("negative memory growth");
                }
                auto extra = static_cast<uint64_t>(n);
                charge_upfront(bulk_cost(extra, 64));
                if (extra > limits_.max_memory_bytes ||
                    memory_.size() + output_.size() + extra > limits_.max_memory_bytes) {
                    exceed(ResourceKind::MEMORY, "memory limit exceeded");
                }
                auto old_size = static_cast<int64_t>(memory_.size());
                memory_.resize(memory_.size() + extra, 0);
                note_memory();
                cycles_ += bulk_cost(extra, 64) - 1;
                push(old_size);
                checkpoint();
                break;
            }
            case Opcode::MEMSIZE:
                push(static_cast<int64_t>(memory_.size()));
                break;

            case Opcode::INSIZE:
                push(static_cast<int64_t>(input_.size()));
                break;
            case Opcode::INLOAD8: {
                size_t at = span(pop(), 1, input_.size(), "input");
                push(input_[at]);
                break;
            }
            case Opcode::INLOAD64: {
                size_t at = span(pop(), 8, input_.size(), "input");
                push(static_cast<int64_t>(read_le(input_.data() + at, 8)));
                break;
            }
            case Opcode::INCOPY: {
                int64_t len = pop();
                int64_t src = pop();
                int64_t dst = pop();
                if (len < 0) {
                    trap("negative copy length");
                }
                auto count = static_cast<uint64_t>(len);
                charge_upfront(bulk_cost(count, 8));
                size_t from = span(src, count, input_.size(), "input");
                size_t to = span(dst, count, memory_.size(), "memory");
                std::copy(input_.begin() + from, input_.begin() + from + count,
                          memory_.begin() + to);
                cycles_ += bulk_cost(count, 8) - 1;
                checkpoint();
                break;
            }

            case Opcode::EMIT8: {
                int64_t value = pop();
                reserve_output(1);
                output_.push_back(static_cast<uint8_t>(value & 0xff));
                note_memory();
                break;
            }
            case Opcode::EMIT64: {
                int64_t value = pop();
                reserve_output(8);
                size_t at = output_.size();
                output_.resize(at + 8);
                write_le(output_.data() + at, static_cast<uint64_t>(value), 8);
                note_memory();
                break;
            }
            case Opcode::EMITMEM: {
                int64_t len = pop();
                int64_t addr = pop();
                if (len < 0) {
                    trap("negative emit length");
                }
                auto count = static_cast<uint64_t>(len);
                charge_upfront(bulk_cost(count, 8));
                size_t from = span(addr, count, memory_.size(), "memory");
                reserve_output(count);
                output_.insert(output_.end(), memory_.begin() + from,
                               memory_.begin() + from + count);
                note_memory();
                cycles_ += bulk_cost(count, 8) - 1;
                checkpoint();
                break;
            }

            default:
                trap("invalid opcode at offset " + std::to_string(start));
        }
    }
}

} // namespace

class SandboxExecutor::Impl {
public:
    SandboxConfig config_;

    explicit Impl(const SandboxConfig& config) : config_(config) {}

    ExecutionResult execute(const Bytes& module, const Bytes& input,
                            const ResourceLimits& limits,
                            const CancelToken* cancel, Deadline deadline) {
        ExecutionResult result;
        result.worker_id = config_.executor_id;
        auto start_time = std::chrono::steady_clock::now();

        if (module.empty()) {
            finish_trapped(result, "empty module");
        } else if (module.size() > config_.max_module_size) {
            finish_trapped(result, "module exceeds maximum size");
        } else {
            Machine machine(module, input, limits, cancel, deadline);
            try {
                machine.run();
                result.outcome = OutcomeKind::SUCCESS;
                result.output = std::move(machine.output());
            } catch (const Stop& stop) {
                result.outcome = stop.outcome;
                result.exceeded = stop.exceeded;
                result.error = stop.message;
            } catch (const std::bad_alloc&) {
                result.outcome = OutcomeKind::RESOURCE_EXCEEDED;
                result.exceeded = ResourceKind::MEMORY;
                result.error = "host allocation failed";
            }
            result.usage = machine.usage();
        }

        // Only successful executions carry output
        if (!result.succeeded()) {
            result.output.clear();
        }
        result.output_digest = HashUtils::sha256(result.output);
        result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);
        return result;
    }

private:
    static void finish_trapped(ExecutionResult& result, const std::string& message) {
        result.outcome = OutcomeKind::TRAPPED;
        result.error = message;
    }
};

SandboxExecutor::SandboxExecutor(const SandboxConfig& config)
    : impl(std::make_unique<Impl>(config)) {}

SandboxExecutor::~SandboxExecutor() = default;

ExecutionResult SandboxExecutor::execute(const Task& task,
                                         const CancelToken* cancel,
                                         Deadline deadline) {
    auto result = impl->execute(task.module, task.input, task.limits, cancel, deadline);
    result.task_id = task.task_id;
    result.task_hash = task_hash(task);
    return result;
}

ExecutionResult SandboxExecutor::run(const Bytes& module,
                                     const Bytes& input,
                                     const ResourceLimits& limits,
                                     const CancelToken* cancel,
                                     Deadline deadline) {
    return impl->execute(module, input, limits, cancel, deadline);
}

const SandboxConfig& SandboxExecutor::config() const {
    return impl->config_;
}

} // namespace vouchrun
