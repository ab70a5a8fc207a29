#include "builtin_programs.h"
#include "assembler.h"

namespace vouchrun {

Bytes Program::bytecode() const {
    return Assembler::assemble(source);
}

namespace BuiltInPrograms {

Program increment_bytes() {
    Program program;
    program.name = "increment-bytes";
    program.description = "Add one to every input byte";
    program.source = R"(
        push 0                      ; i
loop:   dup insize lt jz done
        dup inload8 push 1 add emit8
        push 1 add
        jmp loop
done:   halt
)";
    return program;
}

Program sum_bytes() {
    Program program;
    program.name = "sum-bytes";
    program.description = "Sum of input bytes as u64";
    program.source = R"(
        ; mem[0] = acc, mem[8] = i
        push 16 grow pop
loop:   push 8 load64 insize lt jz done
        push 0
        push 0 load64
        push 8 load64 inload8 add
        store64
        push 8  push 8 load64 push 1 add store64
        jmp loop
done:   push 0 load64 emit64
        halt
)";
    return program;
}

Program matrix_multiply() {
    Program program;
    program.name = "matrix-multiply";
    program.description = "Row block of A times B";
    program.source = R"(
        ; mem: r@0 c@8 n@16 i@24 j@32 t@40 acc@48 boff@56
        push 64 grow pop
        push 0  push 0 inload64 store64
        push 8  push 8 inload64 store64

        ; B header starts after A
        push 56
        push 0 load64 push 8 load64 mul push 8 mul push 16 add
        store64

        ; inner dimensions must agree
        push 56 load64 inload64 push 8 load64 eq jnz dims_ok
        push 0 push 0 div
dims_ok:
        push 16  push 56 load64 push 8 add inload64 store64
        push 56  push 56 load64 push 16 add store64

        push 0 load64 emit64
        push 16 load64 emit64

        push 24 push 0 store64
row:    push 24 load64 push 0 load64 lt jz done
        push 32 push 0 store64
col:    push 32 load64 push 16 load64 lt jz next_row
        push 48 push 0 store64
        push 40 push 0 store64
dot:    push 40 load64 push 8 load64 lt jz dot_done
        push 24 load64 push 8 load64 mul push 40 load64 add push 8 mul push 16 add inload64
        push 40 load64 push 16 load64 mul push 32 load64 add push 8 mul push 56 load64 add inload64
        mul
        push 48 load64 add
        push 48 swap store64
        push 40  push 40 load64 push 1 add store64
        jmp dot
dot_done:
        push 48 load64 emit64
        push 32  push 32 load64 push 1 add store64
        jmp col
next_row:
        push 24  push 24 load64 push 1 add store64
        jmp row
done:   halt
)";
    return program;
}

Program allocate(uint64_t bytes) {
    Program program;
    program.name = "allocate";
    program.description = "Grow linear memory by " + std::to_string(bytes) + " bytes";
    program.source = "push " + std::to_string(bytes) + " grow pop halt\n";
    return program;
}

} // namespace BuiltInPrograms

} // namespace vouchrun
