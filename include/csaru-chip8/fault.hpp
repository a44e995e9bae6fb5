#pragma once

#include <cstdint>

namespace CSaruChip8 {

// Everything the interpreter can report instead of carrying on.
// Decode and execution faults halt the machine; the rest are returned to
// whoever made the bad call.
enum class Fault : uint8_t {
    None = 0,

    // ROM loading
    RomTooLarge,
    RomEmpty,

    // Decoding
    BadInstruction,

    // Execution
    UnsupportedSys,
    PrefetchAbort,  // PC outside of memory
    DataAbort,      // I-relative access outside of memory
    ProtectedWrite, // write into the interpreter area (below 0x200)
    StackOverflow,
    StackUnderflow,

    // Adapters
    InvalidKey,
};

const char * FaultName (Fault fault);

// True for faults that stop the machine for the rest of the run.
bool IsHaltingFault (Fault fault);

} // namespace CSaruChip8
