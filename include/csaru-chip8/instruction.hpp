#pragma once

#include <cstdint>
#include <string>

namespace CSaruChip8 {

// One entry per distinct CHIP-8 instruction. Decoding never fails outright;
// unknown bit patterns decode to Op::Invalid.
enum class Op : uint8_t {
    Invalid = 0,
    Sys,          // 0NNN
    Cls,          // 00E0
    Ret,          // 00EE
    Jump,         // 1NNN
    Call,         // 2NNN
    SkipEqImm,    // 3XNN
    SkipNeImm,    // 4XNN
    SkipEqReg,    // 5XY0
    LoadImm,      // 6XNN
    AddImm,       // 7XNN
    Move,         // 8XY0
    Or,           // 8XY1
    And,          // 8XY2
    Xor,          // 8XY3
    AddReg,       // 8XY4
    Sub,          // 8XY5
    Shr,          // 8XY6
    SubN,         // 8XY7
    Shl,          // 8XYE
    SkipNeReg,    // 9XY0
    LoadIndex,    // ANNN
    JumpV0,       // BNNN
    Random,       // CXNN
    Draw,         // DXYN
    SkipKey,      // EX9E
    SkipNotKey,   // EXA1
    LoadDelay,    // FX07
    WaitKey,      // FX0A
    SetDelay,     // FX15
    SetSound,     // FX18
    AddIndex,     // FX1E
    LoadFont,     // FX29
    StoreBcd,     // FX33
    StoreRegs,    // FX55
    LoadRegs,     // FX65
};

struct Instruction {
    Op       op;
    uint16_t opcode; // raw 16-bit word
    uint16_t nnn;    // low 12 bits
    uint8_t  nn;     // low 8 bits
    uint8_t  n;      // low 4 bits
    uint8_t  x;      // bits 8-11
    uint8_t  y;      // bits 4-7

    bool IsValid () const { return op != Op::Invalid; }
};

// Pure; touches no machine state.
Instruction Decode (uint16_t opcode);

const char * OpMnemonic (Op op);

// e.g. "DRW V1, V2, 5" or "LD I, 0x2A0". Invalid words come back as "DW 0xFFFF".
std::string Disassemble (const Instruction & inst);

} // namespace CSaruChip8
