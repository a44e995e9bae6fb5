// This is *heavily*  based on Laurence Muller's tutorial at
// http://www.multigesture.net/articles/how-to-write-an-emulator-chip-8-interpreter/

#include <cstdio>

#include <csaru-core-cpp/csaru-core-cpp.h>

#include "../include/csaru-chip8/chip8.hpp"

namespace CSaruChip8 {

const unsigned Chip8::s_registerCount;
const unsigned Chip8::s_stackSize;
const unsigned Chip8::s_flagRegister;

//=====================================================================
//
// Chip8 definitions
//
//=====================================================================

//=====================================================================
Chip8::Chip8 () {
    Initialize(std::mt19937::default_seed);
}

//=====================================================================
void Chip8::Initialize (unsigned randSeed) {

    m_memory.Initialize();
    CSaruCore::SecureZero(m_v, sizeof(m_v));
    m_i  = 0x0000;
    m_pc = Memory::s_progRomRamBegin;
    m_timers.Reset();
    m_keypad.Reset();

    m_opcode = 0x0000;
    for (unsigned i = 0; i < s_stackSize; ++i)
        m_stack[i] = 0x0000;
    m_sp = 0x00;
    m_display.Clear();

    m_runState      = RunState::Running;
    m_awaitRegister = 0;
    m_fault         = Fault::None;
    m_faultPc       = 0x0000;

    m_rng.seed(randSeed);

}

//=====================================================================
Fault Chip8::LoadProgram (const uint8_t * data, std::size_t size) {

    const Fault fault = m_memory.LoadProgram(data, size);
    if (fault != Fault::None)
        return fault;

    m_pc = Memory::s_progRomRamBegin;
    return Fault::None;

}

//=====================================================================
Fault Chip8::EmulateCycle () {

    if (m_runState == RunState::Halted)
        return m_fault;

    if (m_runState == RunState::AwaitingKey) {
        uint8_t key;
        if (m_keypad.ConsumeKeyPress(&key)) {
            m_v[m_awaitRegister] = key;
            m_pc += 2;
            m_runState = RunState::Running;
        }
        return Fault::None;
    }

    // Fetch opcode
    const Fault fetchFault = m_memory.ReadWord(m_pc, &m_opcode);
    if (fetchFault != Fault::None)
        return Halt(fetchFault, m_pc);

    // Decode opcode
    const Instruction inst = Decode(m_opcode);
    if (!inst.IsValid())
        return Halt(Fault::BadInstruction, m_pc);

    return Execute(inst);

}

//=====================================================================
Fault Chip8::Execute (const Instruction & inst) {

    if (m_runState == RunState::Halted)
        return m_fault;

    const uint16_t instPc = m_pc;
    m_opcode = inst.opcode;
    m_pc    += 2;

    Fault fault = Fault::None;
    switch (inst.op) {
        case Op::Move:
        case Op::Or:
        case Op::And:
        case Op::Xor:
        case Op::AddReg:
        case Op::Sub:
        case Op::Shr:
        case Op::SubN:
        case Op::Shl:
            fault = ExecuteArithmetic(inst);
            break;

        case Op::LoadDelay:
        case Op::WaitKey:
        case Op::SetDelay:
        case Op::SetSound:
        case Op::AddIndex:
        case Op::LoadFont:
        case Op::StoreBcd:
        case Op::StoreRegs:
        case Op::LoadRegs:
            fault = ExecuteMisc(inst);
            break;

        default:
            fault = ExecuteFlow(inst);
            break;
    }

    if (fault != Fault::None)
        return Halt(fault, instPc);
    if (m_runState == RunState::AwaitingKey)
        m_pc = instPc;

    return Fault::None;

}

//=====================================================================
std::string Chip8::DescribeFault () const {

    char text[96] = {};
    if (m_fault == Fault::PrefetchAbort) {
        std::snprintf(
            text, sizeof(text), "%s at {0x%04X}",
            FaultName(m_fault),
            unsigned(m_faultPc)
        );
    }
    else {
        std::snprintf(
            text, sizeof(text), "%s: opcode {0x%04X} at {0x%04X}",
            FaultName(m_fault),
            unsigned(m_opcode),
            unsigned(m_faultPc)
        );
    }
    return text;

}

//=====================================================================
Fault Chip8::Halt (Fault fault, uint16_t pc) {

    m_fault    = fault;
    m_faultPc  = pc;
    m_pc       = pc;
    m_runState = RunState::Halted;
    return fault;

}

//=====================================================================
void Chip8::SkipIf (bool condition) {
    if (condition)
        m_pc += 2;
}

//=====================================================================
Fault Chip8::ExecuteFlow (const Instruction & inst) {

    uint8_t & vx = m_v[inst.x];
    uint8_t & vy = m_v[inst.y];

    switch (inst.op) {
        case Op::Sys: // 0x0NNN: call machine code at NNN
            return Fault::UnsupportedSys;

        case Op::Cls: // 0x00E0: clear the screen
            m_display.Clear();
            return Fault::None;

        case Op::Ret: // 0x00EE: return from call
            if (!m_sp)
                return Fault::StackUnderflow;
            m_pc = m_stack[--m_sp];
            return Fault::None;

        case Op::Jump: // 0x1NNN: jump to NNN
            m_pc = inst.nnn;
            return Fault::None;

        case Op::Call: // 0x2NNN: call NNN
            if (m_sp >= s_stackSize)
                return Fault::StackOverflow;
            m_stack[m_sp++] = m_pc;
            m_pc = inst.nnn;
            return Fault::None;

        case Op::SkipEqImm: // 0x3XNN: skip next instruction if VX == NN
            SkipIf(vx == inst.nn);
            return Fault::None;

        case Op::SkipNeImm: // 0x4XNN: skip next instruction if VX != NN
            SkipIf(vx != inst.nn);
            return Fault::None;

        case Op::SkipEqReg: // 0x5XY0: skip next instruction if VX == VY
            SkipIf(vx == vy);
            return Fault::None;

        case Op::LoadImm: // 0x6XNN: set VX to NN
            vx = inst.nn;
            return Fault::None;

        case Op::AddImm: // 0x7XNN: add NN to VX; carry flag not touched
            vx = static_cast<uint8_t>(vx + inst.nn);
            return Fault::None;

        case Op::SkipNeReg: // 0x9XY0: skip next instruction if VX != VY
            SkipIf(vx != vy);
            return Fault::None;

        case Op::LoadIndex: // 0xANNN: set I to NNN
            m_i = inst.nnn;
            return Fault::None;

        case Op::JumpV0: // 0xBNNN: jump to NNN + V0
            m_pc = static_cast<uint16_t>(inst.nnn + m_v[0]);
            return Fault::None;

        case Op::Random: { // 0xCXNN: VX = (rand & NN)
            std::uniform_int_distribution<unsigned> byteDist(0x00, 0xFF);
            vx = static_cast<uint8_t>(byteDist(m_rng) & inst.nn);
            return Fault::None;
        }

        case Op::Draw: { // 0xDXYN
            // XOR-draw N rows of 8-bit-wide sprites from I
            // at (VX, VY), (VX, VY+1), etc.
            // VF set to 1 if a pixel is toggled off, otherwise 0.
            uint8_t sprite[0x10];
            const Fault fault = m_memory.ReadRange(m_i, sprite, inst.n);
            if (fault != Fault::None)
                return fault;
            SetFlag(m_display.Draw(vx, vy, sprite, inst.n) ? 1 : 0);
            return Fault::None;
        }

        case Op::SkipKey: // 0xEX9E: skip next instruction if key VX is pressed
            SkipIf(m_keypad.IsPressed(vx));
            return Fault::None;

        case Op::SkipNotKey: // 0xEXA1: skip next instruction if key VX is not pressed
            SkipIf(!m_keypad.IsPressed(vx)); // values past 0xF are never pressed
            return Fault::None;

        default:
            return Fault::BadInstruction;
    }

}

//=====================================================================
Fault Chip8::ExecuteArithmetic (const Instruction & inst) {

    uint8_t &     vx       = m_v[inst.x];
    const uint8_t vy       = m_v[inst.y];
    const uint8_t shiftSrc = m_quirks.shiftUsesVy ? vy : vx;

    // Flag-producing ops write VF last so VF holds the flag even when X is F.
    switch (inst.op) {
        case Op::Move: // 0x8XY0: set VX to VY
            vx = vy;
            break;

        case Op::Or: // 0x8XY1
            vx |= vy;
            break;

        case Op::And: // 0x8XY2
            vx &= vy;
            break;

        case Op::Xor: // 0x8XY3
            vx ^= vy;
            break;

        case Op::AddReg: { // 0x8XY4: VX += VY; VF is the carry
            const unsigned sum = unsigned(vx) + vy;
            vx = static_cast<uint8_t>(sum);
            SetFlag(sum > 0xFF ? 1 : 0);
            break;
        }

        case Op::Sub: { // 0x8XY5: VX -= VY
            // VF is set to 0 on borrow; 1 otherwise.
            const uint8_t noBorrow = (vx >= vy) ? 1 : 0;
            vx = static_cast<uint8_t>(vx - vy);
            SetFlag(noBorrow);
            break;
        }

        case Op::Shr: { // 0x8XY6: VF is the bit shifted out
            const uint8_t out = shiftSrc & 0x01;
            vx = static_cast<uint8_t>(shiftSrc >> 1);
            SetFlag(out);
            break;
        }

        case Op::SubN: { // 0x8XY7: VX = VY - VX
            const uint8_t noBorrow = (vy >= vx) ? 1 : 0;
            vx = static_cast<uint8_t>(vy - vx);
            SetFlag(noBorrow);
            break;
        }

        case Op::Shl: { // 0x8XYE: VF is the bit shifted out
            const uint8_t out = (shiftSrc & 0x80) ? 1 : 0;
            vx = static_cast<uint8_t>(shiftSrc << 1);
            SetFlag(out);
            break;
        }

        default:
            return Fault::BadInstruction;
    }

    return Fault::None;

}

//=====================================================================
Fault Chip8::ExecuteMisc (const Instruction & inst) {

    uint8_t &         vx    = m_v[inst.x];
    const std::size_t count = inst.x + 1u;

    switch (inst.op) {
        case Op::LoadDelay: // 0xFX07
            vx = m_timers.GetDelay();
            return Fault::None;

        case Op::WaitKey: // 0xFX0A: stall until a key goes down, then store it in VX
            m_runState      = RunState::AwaitingKey;
            m_awaitRegister = inst.x;
            m_keypad.ArmKeyWait();
            return Fault::None;

        case Op::SetDelay: // 0xFX15
            m_timers.SetDelay(vx);
            return Fault::None;

        case Op::SetSound: // 0xFX18
            m_timers.SetSound(vx);
            return Fault::None;

        case Op::AddIndex: { // 0xFX1E
            const unsigned sum = unsigned(m_i) + vx;
            if (sum > 0xFFFF)
                return Fault::DataAbort;
            m_i = static_cast<uint16_t>(sum);
            return Fault::None;
        }

        case Op::LoadFont: // 0xFX29: I = address of the glyph for the low nibble of VX
            m_i = Memory::FontAddress(vx);
            return Fault::None;

        case Op::StoreBcd: { // 0xFX33
            const uint8_t digits[3] = {
                static_cast<uint8_t>(vx / 100),
                static_cast<uint8_t>(vx / 10 % 10),
                static_cast<uint8_t>(vx % 10),
            };
            return m_memory.WriteRange(m_i, digits, sizeof(digits));
        }

        case Op::StoreRegs: { // 0xFX55: V0..VX -> [I]
            const Fault fault = m_memory.WriteRange(m_i, m_v, count);
            if (fault == Fault::None && m_quirks.loadStoreAdvancesIndex)
                m_i = static_cast<uint16_t>(m_i + count);
            return fault;
        }

        case Op::LoadRegs: { // 0xFX65: [I] -> V0..VX
            const Fault fault = m_memory.ReadRange(m_i, m_v, count);
            if (fault == Fault::None && m_quirks.loadStoreAdvancesIndex)
                m_i = static_cast<uint16_t>(m_i + count);
            return fault;
        }

        default:
            return Fault::BadInstruction;
    }

}

} // namespace CSaruChip8
