#include <cstdio>

#include "../include/csaru-chip8/instruction.hpp"

namespace CSaruChip8 {

//=====================================================================
//
// Static locals
//
//=====================================================================

//=====================================================================
static Op DecodeArithmetic (uint8_t n) {

    switch (n) {
        case 0x0: return Op::Move;
        case 0x1: return Op::Or;
        case 0x2: return Op::And;
        case 0x3: return Op::Xor;
        case 0x4: return Op::AddReg;
        case 0x5: return Op::Sub;
        case 0x6: return Op::Shr;
        case 0x7: return Op::SubN;
        case 0xE: return Op::Shl;
        default:  return Op::Invalid;
    }

}

//=====================================================================
static Op DecodeMisc (uint8_t nn) {

    switch (nn) {
        case 0x07: return Op::LoadDelay;
        case 0x0A: return Op::WaitKey;
        case 0x15: return Op::SetDelay;
        case 0x18: return Op::SetSound;
        case 0x1E: return Op::AddIndex;
        case 0x29: return Op::LoadFont;
        case 0x33: return Op::StoreBcd;
        case 0x55: return Op::StoreRegs;
        case 0x65: return Op::LoadRegs;
        default:   return Op::Invalid;
    }

}


//=====================================================================
//
// Instruction definitions
//
//=====================================================================

//=====================================================================
Instruction Decode (uint16_t opcode) {

    Instruction inst;
    inst.op     = Op::Invalid;
    inst.opcode = opcode;
    inst.nnn    = opcode & 0x0FFF;
    inst.nn     = opcode & 0x00FF;
    inst.n      = opcode & 0x000F;
    inst.x      = (opcode & 0x0F00) >> 8;
    inst.y      = (opcode & 0x00F0) >> 4;

    switch (opcode & 0xF000) {
        case 0x0000:
            if (opcode == 0x00E0)
                inst.op = Op::Cls;
            else if (opcode == 0x00EE)
                inst.op = Op::Ret;
            else
                inst.op = Op::Sys;
            break;

        case 0x1000: inst.op = Op::Jump;      break;
        case 0x2000: inst.op = Op::Call;      break;
        case 0x3000: inst.op = Op::SkipEqImm; break;
        case 0x4000: inst.op = Op::SkipNeImm; break;

        case 0x5000:
            if (inst.n == 0)
                inst.op = Op::SkipEqReg;
            break;

        case 0x6000: inst.op = Op::LoadImm; break;
        case 0x7000: inst.op = Op::AddImm;  break;
        case 0x8000: inst.op = DecodeArithmetic(inst.n); break;

        case 0x9000:
            if (inst.n == 0)
                inst.op = Op::SkipNeReg;
            break;

        case 0xA000: inst.op = Op::LoadIndex; break;
        case 0xB000: inst.op = Op::JumpV0;    break;
        case 0xC000: inst.op = Op::Random;    break;
        case 0xD000: inst.op = Op::Draw;      break;

        case 0xE000:
            if (inst.nn == 0x9E)
                inst.op = Op::SkipKey;
            else if (inst.nn == 0xA1)
                inst.op = Op::SkipNotKey;
            break;

        case 0xF000: inst.op = DecodeMisc(inst.nn); break;
    }

    return inst;

}

//=====================================================================
const char * OpMnemonic (Op op) {

    switch (op) {
        case Op::Invalid:    return "DW";
        case Op::Sys:        return "SYS";
        case Op::Cls:        return "CLS";
        case Op::Ret:        return "RET";
        case Op::Jump:       return "JP";
        case Op::Call:       return "CALL";
        case Op::SkipEqImm:  return "SE";
        case Op::SkipNeImm:  return "SNE";
        case Op::SkipEqReg:  return "SE";
        case Op::LoadImm:    return "LD";
        case Op::AddImm:     return "ADD";
        case Op::Move:       return "LD";
        case Op::Or:         return "OR";
        case Op::And:        return "AND";
        case Op::Xor:        return "XOR";
        case Op::AddReg:     return "ADD";
        case Op::Sub:        return "SUB";
        case Op::Shr:        return "SHR";
        case Op::SubN:       return "SUBN";
        case Op::Shl:        return "SHL";
        case Op::SkipNeReg:  return "SNE";
        case Op::LoadIndex:  return "LD";
        case Op::JumpV0:     return "JP";
        case Op::Random:     return "RND";
        case Op::Draw:       return "DRW";
        case Op::SkipKey:    return "SKP";
        case Op::SkipNotKey: return "SKNP";
        case Op::LoadDelay:  return "LD";
        case Op::WaitKey:    return "LD";
        case Op::SetDelay:   return "LD";
        case Op::SetSound:   return "LD";
        case Op::AddIndex:   return "ADD";
        case Op::LoadFont:   return "LD";
        case Op::StoreBcd:   return "LD";
        case Op::StoreRegs:  return "LD";
        case Op::LoadRegs:   return "LD";
    }

    return "?";

}

//=====================================================================
std::string Disassemble (const Instruction & inst) {

    char operands[32] = {};
    const unsigned x   = inst.x;
    const unsigned y   = inst.y;
    const unsigned nn  = inst.nn;
    const unsigned nnn = inst.nnn;

    switch (inst.op) {
        case Op::Invalid:
            std::snprintf(operands, sizeof(operands), "0x%04X", unsigned(inst.opcode));
            break;

        case Op::Cls:
        case Op::Ret:
            break;

        case Op::Sys:
        case Op::Jump:
        case Op::Call:
            std::snprintf(operands, sizeof(operands), "0x%03X", nnn);
            break;

        case Op::SkipEqImm:
        case Op::SkipNeImm:
        case Op::LoadImm:
        case Op::AddImm:
        case Op::Random:
            std::snprintf(operands, sizeof(operands), "V%X, 0x%02X", x, nn);
            break;

        case Op::SkipEqReg:
        case Op::SkipNeReg:
        case Op::Move:
        case Op::Or:
        case Op::And:
        case Op::Xor:
        case Op::AddReg:
        case Op::Sub:
        case Op::Shr:
        case Op::SubN:
        case Op::Shl:
            std::snprintf(operands, sizeof(operands), "V%X, V%X", x, y);
            break;

        case Op::LoadIndex:
            std::snprintf(operands, sizeof(operands), "I, 0x%03X", nnn);
            break;

        case Op::JumpV0:
            std::snprintf(operands, sizeof(operands), "V0, 0x%03X", nnn);
            break;

        case Op::Draw:
            std::snprintf(operands, sizeof(operands), "V%X, V%X, %u", x, y, unsigned(inst.n));
            break;

        case Op::SkipKey:
        case Op::SkipNotKey:
            std::snprintf(operands, sizeof(operands), "V%X", x);
            break;

        case Op::LoadDelay: std::snprintf(operands, sizeof(operands), "V%X, DT", x);  break;
        case Op::WaitKey:   std::snprintf(operands, sizeof(operands), "V%X, K", x);   break;
        case Op::SetDelay:  std::snprintf(operands, sizeof(operands), "DT, V%X", x);  break;
        case Op::SetSound:  std::snprintf(operands, sizeof(operands), "ST, V%X", x);  break;
        case Op::AddIndex:  std::snprintf(operands, sizeof(operands), "I, V%X", x);   break;
        case Op::LoadFont:  std::snprintf(operands, sizeof(operands), "F, V%X", x);   break;
        case Op::StoreBcd:  std::snprintf(operands, sizeof(operands), "B, V%X", x);   break;
        case Op::StoreRegs: std::snprintf(operands, sizeof(operands), "[I], V%X", x); break;
        case Op::LoadRegs:  std::snprintf(operands, sizeof(operands), "V%X, [I]", x); break;
    }

    std::string text(OpMnemonic(inst.op));
    if (operands[0]) {
        text += ' ';
        text += operands;
    }
    return text;

}

} // namespace CSaruChip8
