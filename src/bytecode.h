#pragma once

#include <cstdint>
#include <string>

namespace vouchrun {

// Sandbox instruction set. One-byte opcodes; immediates are little-endian.
// The operand stack holds int64 values; arithmetic wraps.
enum class Opcode : uint8_t {
    // Stack
    NOP      = 0x00,
    HALT     = 0x01,
    PUSH     = 0x02,  // imm i64
    POP      = 0x03,
    DUP      = 0x04,
    SWAP     = 0x05,
    OVER     = 0x06,
    PICK     = 0x07,  // imm u8, 0 = top

    // Arithmetic and bitwise (pop b, pop a, push a op b)
    ADD      = 0x10,
    SUB      = 0x11,
    MUL      = 0x12,
    DIV      = 0x13,
    MOD      = 0x14,
    AND      = 0x15,
    OR       = 0x16,
    XOR      = 0x17,
    SHL      = 0x18,
    SHR      = 0x19,  // logical

    // Comparison (push 1 or 0)
    EQ       = 0x20,
    NE       = 0x21,
    LT       = 0x22,
    LE       = 0x23,
    GT       = 0x24,
    GE       = 0x25,
    NOT      = 0x26,

    // Control flow (imm u32 absolute offset)
    JMP      = 0x30,
    JZ       = 0x31,
    JNZ      = 0x32,
    CALL     = 0x33,
    RET      = 0x34,

    // Linear memory
    LOAD8    = 0x40,  // addr -> value
    STORE8   = 0x41,  // addr value ->
    LOAD64   = 0x42,
    STORE64  = 0x43,
    GROW     = 0x44,  // n -> old_size
    MEMSIZE  = 0x45,

    // Task input (read-only)
    INSIZE   = 0x50,
    INLOAD8  = 0x51,  // offset -> byte
    INCOPY   = 0x52,  // dst src len ->
    INLOAD64 = 0x53,

    // Output
    EMIT8    = 0x60,
    EMIT64   = 0x61,  // little-endian
    EMITMEM  = 0x62   // addr len ->
};

struct OpcodeInfo {
    const char* mnemonic;
    uint8_t immediate_bytes;  // 0, 1, 4 or 8
};

// Returns false for bytes that are not opcodes
bool lookup_opcode(uint8_t byte, OpcodeInfo& info);

// Mnemonic to opcode, case-insensitive
bool lookup_mnemonic(const std::string& mnemonic, Opcode& op, OpcodeInfo& info);

} // namespace vouchrun
