#include "../include/csaru-chip8/fault.hpp"

namespace CSaruChip8 {

//=====================================================================
const char * FaultName (Fault fault) {

    switch (fault) {
        case Fault::None:           return "no fault";
        case Fault::RomTooLarge:    return "program is larger than program memory";
        case Fault::RomEmpty:       return "program is empty";
        case Fault::BadInstruction: return "bad instruction";
        case Fault::UnsupportedSys: return "machine code routines (0NNN) are not supported";
        case Fault::PrefetchAbort:  return "instruction fetch outside of memory";
        case Fault::DataAbort:      return "data access outside of memory";
        case Fault::ProtectedWrite: return "write into interpreter memory";
        case Fault::StackOverflow:  return "stack overflow";
        case Fault::StackUnderflow: return "stack underflow";
        case Fault::InvalidKey:     return "invalid key";
    }

    return "unknown fault";

}

//=====================================================================
bool IsHaltingFault (Fault fault) {

    switch (fault) {
        case Fault::BadInstruction:
        case Fault::UnsupportedSys:
        case Fault::PrefetchAbort:
        case Fault::DataAbort:
        case Fault::ProtectedWrite:
        case Fault::StackOverflow:
        case Fault::StackUnderflow:
            return true;

        default:
            return false;
    }

}

} // namespace CSaruChip8
