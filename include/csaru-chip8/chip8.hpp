// This is *heavily*  based on Laurence Muller's tutorial at
// http://www.multigesture.net/articles/how-to-write-an-emulator-chip-8-interpreter/

#pragma once

#include <cstddef>
#include <cstdint>
#include <random>
#include <string>

#include "display.hpp"
#include "fault.hpp"
#include "instruction.hpp"
#include "keypad.hpp"
#include "memory.hpp"
#include "timers.hpp"

namespace CSaruChip8 {

// Behaviors that differ between historical interpreters.
struct Quirks {
    // FX55/FX65 leave I at I + X + 1 afterwards (off: I is unchanged).
    bool loadStoreAdvancesIndex;
    // 8XY6/8XYE shift VY into VX (off: VX is shifted in place).
    bool shiftUsesVy;

    Quirks ()
        : loadStoreAdvancesIndex(false)
        , shiftUsesVy(true)
    {}
};

enum class RunState : uint8_t {
    Running,
    AwaitingKey, // stalled on FX0A; see m_awaitRegister
    Halted,      // stopped on a fault; see m_fault
};

struct Chip8 {
    static const unsigned s_registerCount = 16;
    static const unsigned s_stackSize     = 16;
    static const unsigned s_flagRegister  = 0xF;

    Memory   m_memory;
    uint8_t  m_v[s_registerCount]; // registers V0-VF
    uint16_t m_i;  // index register
    uint16_t m_pc; // program counter
    Timers   m_timers;
    Keypad   m_keypad;

    uint16_t m_opcode; // last word fetched
    uint16_t m_stack[s_stackSize];
    uint8_t  m_sp; // stack pointer
    Display  m_display;

    RunState m_runState;
    uint8_t  m_awaitRegister;
    Fault    m_fault;
    uint16_t m_faultPc; // address of the instruction that faulted

    Quirks       m_quirks;
    std::mt19937 m_rng;

    Chip8 ();

    // Power-on state: memory cleared with the font installed, registers,
    // stack, timers, keypad and display zeroed, PC at 0x200.
    void Initialize (unsigned randSeed);

    // Copy a program image to 0x200 and point PC at it.
    Fault LoadProgram (const uint8_t * data, std::size_t size);

    // Execute one instruction (or poll for the key a pending FX0A waits on).
    // Once a halting fault occurs every further call returns it unchanged.
    Fault EmulateCycle ();

    // Run an already decoded instruction as if it had just been fetched
    // from PC.
    Fault Execute (const Instruction & inst);

    Fault    GetFault () const { return m_fault; }
    uint16_t GetFaultPc () const { return m_faultPc; }

    // e.g. "stack underflow: opcode {0x00EE} at {0x0204}". Fetch faults
    // leave out the opcode since none was read.
    std::string DescribeFault () const;

    bool IsHalted () const { return m_runState == RunState::Halted; }
    bool IsAwaitingKey () const { return m_runState == RunState::AwaitingKey; }

private:
    Fault Halt (Fault fault, uint16_t pc);
    void  SkipIf (bool condition);
    void  SetFlag (uint8_t value) { m_v[s_flagRegister] = value; }

    Fault ExecuteFlow (const Instruction & inst);
    Fault ExecuteArithmetic (const Instruction & inst);
    Fault ExecuteMisc (const Instruction & inst);
};

} // namespace CSaruChip8
