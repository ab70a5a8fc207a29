#pragma once

#include <stdexcept>
#include <string>
#include "vouchrun/types.h"

namespace vouchrun {

class AssemblyError : public std::runtime_error {
public:
    AssemblyError(int line, const std::string& message);
    int line() const { return line_; }

private:
    int line_;
};

// Text assembler for sandbox modules.
//
//   ; comment
//   loop:  dup insize lt jz done
//          push 0x10
//   done:  halt
//
// Operands are decimal or 0x-prefixed hex integers (optionally negative) or
// label names, which resolve to absolute bytecode offsets.
class Assembler {
public:
    static Bytes assemble(const std::string& source);
};

} // namespace vouchrun
