#include "bytecode.h"
#include <algorithm>
#include <cctype>

namespace vouchrun {

namespace {

struct OpcodeEntry {
    Opcode op;
    OpcodeInfo info;
};

const OpcodeEntry OPCODE_TABLE[] = {
    {Opcode::NOP,      {"nop", 0}},
    {Opcode::HALT,     {"halt", 0}},
    {Opcode::PUSH,     {"push", 8}},
    {Opcode::POP,      {"pop", 0}},
    {Opcode::DUP,      {"dup", 0}},
    {Opcode::SWAP,     {"swap", 0}},
    {Opcode::OVER,     {"over", 0}},
    {Opcode::PICK,     {"pick", 1}},
    {Opcode::ADD,      {"add", 0}},
    {Opcode::SUB,      {"sub", 0}},
    {Opcode::MUL,      {"mul", 0}},
    {Opcode::DIV,      {"div", 0}},
    {Opcode::MOD,      {"mod", 0}},
    {Opcode::AND,      {"and", 0}},
    {Opcode::OR,       {"or", 0}},
    {Opcode::XOR,      {"xor", 0}},
    {Opcode::SHL,      {"shl", 0}},
    {Opcode::SHR,      {"shr", 0}},
    {Opcode::EQ,       {"eq", 0}},
    {Opcode::NE,       {"ne", 0}},
    {Opcode::LT,       {"lt", 0}},
    {Opcode::LE,       {"le", 0}},
    {Opcode::GT,       {"gt", 0}},
    {Opcode::GE,       {"ge", 0}},
    {Opcode::NOT,      {"not", 0}},
    {Opcode::JMP,      {"jmp", 4}},
    {Opcode::JZ,       {"jz", 4}},
    {Opcode::JNZ,      {"jnz", 4}},
    {Opcode::CALL,     {"call", 4}},
    {Opcode::RET,      {"ret", 0}},
    {Opcode::LOAD8,    {"load8", 0}},
    {Opcode::STORE8,   {"store8", 0}},
    {Opcode::LOAD64,   {"load64", 0}},
    {Opcode::STORE64,  {"store64", 0}},
    {Opcode::GROW,     {"grow", 0}},
    {Opcode::MEMSIZE,  {"memsize", 0}},
    {Opcode::INSIZE,   {"insize", 0}},
    {Opcode::INLOAD8,  {"inload8", 0}},
    {Opcode::INCOPY,   {"incopy", 0}},
    {Opcode::INLOAD64, {"inload64", 0}},
    {Opcode::EMIT8,    {"emit8", 0}},
    {Opcode::EMIT64,   {"emit64", 0}},
    {Opcode::EMITMEM,  {"emitmem", 0}},
};

} // namespace

bool lookup_opcode(uint8_t byte, OpcodeInfo& info) {
    for (const auto& entry : OPCODE_TABLE) {
        if (static_cast<uint8_t>(entry.op) == byte) {
            info = entry.info;
            return true;
        }
    }
    return false;
}

bool lookup_mnemonic(const std::string& mnemonic, Opcode& op, OpcodeInfo& info) {
    std::string lower = mnemonic;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (const auto& entry : OPCODE_TABLE) {
        if (lower == entry.info.mnemonic) {
            op = entry.op;
            info = entry.info;
            return true;
        }
    }
    return false;
}

} // namespace vouchrun
