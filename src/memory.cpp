// This is *heavily*  based on Laurence Muller's tutorial at
// http://www.multigesture.net/articles/how-to-write-an-emulator-chip-8-interpreter/

#include <cstring>

#include <csaru-core-cpp/csaru-core-cpp.h>

#include "../include/csaru-chip8/memory.hpp"

namespace CSaruChip8 {

//=====================================================================
//
// Static locals
//
//=====================================================================

//=====================================================================
static const uint8_t s_fontSet[Memory::s_fontGlyphBytes * Memory::s_fontGlyphCount] = {
    0xF0, 0x90, 0x90, 0x90, 0xF0, // 0
    0x20, 0x60, 0x20, 0x20, 0x70, // 1
    0xF0, 0x10, 0xF0, 0x80, 0xF0, // 2
    0xF0, 0x10, 0xF0, 0x10, 0xF0, // 3
    0x90, 0x90, 0xF0, 0x10, 0x10, // 4
    0xF0, 0x80, 0xF0, 0x10, 0xF0, // 5
    0xF0, 0x80, 0xF0, 0x90, 0xF0, // 6
    0xF0, 0x10, 0x20, 0x40, 0x40, // 7
    0xF0, 0x90, 0xF0, 0x90, 0xF0, // 8
    0xF0, 0x90, 0xF0, 0x10, 0xF0, // 9
    0xF0, 0x90, 0xF0, 0x90, 0x90, // A
    0xE0, 0x90, 0xE0, 0x90, 0xE0, // B
    0xF0, 0x80, 0x80, 0x80, 0xF0, // C
    0xE0, 0x90, 0x90, 0x90, 0xE0, // D
    0xF0, 0x80, 0xF0, 0x80, 0xF0, // E
    0xF0, 0x80, 0xF0, 0x80, 0x80, // F
};


//=====================================================================
//
// Memory definitions
//
//=====================================================================

const unsigned Memory::s_memoryBytes;
const uint16_t Memory::s_fontBegin;
const uint16_t Memory::s_progRomRamBegin;
const unsigned Memory::s_fontGlyphBytes;
const unsigned Memory::s_fontGlyphCount;
const unsigned Memory::s_maxProgramBytes;

//=====================================================================
Memory::Memory () {
    Initialize();
}

//=====================================================================
void Memory::Initialize () {

    CSaruCore::SecureZero(m_bytes, sizeof(m_bytes));
    std::memcpy(m_bytes + s_fontBegin, s_fontSet, sizeof(s_fontSet));

}

//=====================================================================
Fault Memory::LoadProgram (const uint8_t * data, std::size_t size) {

    if (!data || !size)
        return Fault::RomEmpty;
    if (size > s_maxProgramBytes)
        return Fault::RomTooLarge;

    CSaruCore::SecureZero(m_bytes + s_progRomRamBegin, s_maxProgramBytes);
    std::memcpy(m_bytes + s_progRomRamBegin, data, size);
    return Fault::None;

}

//=====================================================================
Fault Memory::Read (uint16_t addr, uint8_t * out) const {
    return ReadRange(addr, out, 1);
}

//=====================================================================
Fault Memory::Write (uint16_t addr, uint8_t value) {
    return WriteRange(addr, &value, 1);
}

//=====================================================================
Fault Memory::ReadWord (uint16_t addr, uint16_t * out) const {

    if (!InBounds(addr, 2))
        return Fault::PrefetchAbort;

    *out = static_cast<uint16_t>(m_bytes[addr] << 8 | m_bytes[addr + 1]);
    return Fault::None;

}

//=====================================================================
Fault Memory::ReadRange (uint16_t addr, uint8_t * out, std::size_t count) const {

    if (!InBounds(addr, count))
        return Fault::DataAbort;

    if (count)
        std::memcpy(out, m_bytes + addr, count);
    return Fault::None;

}

//=====================================================================
Fault Memory::WriteRange (uint16_t addr, const uint8_t * data, std::size_t count) {

    if (!InBounds(addr, count))
        return Fault::DataAbort;
    if (count && addr < s_progRomRamBegin)
        return Fault::ProtectedWrite;

    if (count)
        std::memcpy(m_bytes + addr, data, count);
    return Fault::None;

}

//=====================================================================
uint16_t Memory::FontAddress (uint8_t digit) {
    return static_cast<uint16_t>(s_fontBegin + (digit & 0x0F) * s_fontGlyphBytes);
}

//=====================================================================
bool Memory::InBounds (uint32_t addr, std::size_t count) {
    return addr < s_memoryBytes && count <= s_memoryBytes - addr;
}

} // namespace CSaruChip8
