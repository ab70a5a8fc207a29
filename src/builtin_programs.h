#pragma once

#include <string>
#include <cstdint>
#include "vouchrun/types.h"

namespace vouchrun {

// Sandbox program in assembly form
struct Program {
    std::string name;
    std::string description;
    std::string source;

    // Assemble to bytecode (throws AssemblyError)
    Bytes bytecode() const;
};

namespace BuiltInPrograms {
    // Emits each input byte plus one (mod 256)
    Program increment_bytes();

    // Emits the sum of all input bytes as a little-endian u64
    Program sum_bytes();

    // Multiplies a row block of A by B.
    // Input:  [r][c] A(r*c) [k][n] B(k*n), all little-endian int64, k == c
    // Output: [r][n] C(r*n)
    Program matrix_multiply();

    // Grows linear memory by the given number of bytes, then halts
    Program allocate(uint64_t bytes);
}

} // namespace vouchrun
