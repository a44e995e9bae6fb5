#pragma once

#include <cstddef>
#include <cstdint>

#include "fault.hpp"

namespace CSaruChip8 {

// 4KiB of CHIP-8 address space.
//
//   0x000 - 0x1FF  interpreter area (hex font lives at 0x050 - 0x09F)
//   0x200 - 0xFFF  program ROM/RAM
//
// Every access is bounds checked. Writes into the interpreter area are
// refused once the font has been installed.
class Memory {
public:
    static const unsigned s_memoryBytes = 4096;

    static const uint16_t s_fontBegin       = 0x050;
    static const uint16_t s_progRomRamBegin = 0x200;

    static const unsigned s_fontGlyphBytes = 5;
    static const unsigned s_fontGlyphCount = 16;
    static const unsigned s_maxProgramBytes = s_memoryBytes - s_progRomRamBegin;

public:
    Memory ();

    // Zero everything and install the font.
    void Initialize ();

    // Copy a program image to 0x200. Memory past the image is cleared.
    Fault LoadProgram (const uint8_t * data, std::size_t size);

    Fault Read (uint16_t addr, uint8_t * out) const;
    Fault Write (uint16_t addr, uint8_t value);

    // Big-endian 16-bit fetch, as instructions are stored.
    Fault ReadWord (uint16_t addr, uint16_t * out) const;

    // Range helpers; the whole range must be valid or nothing is touched.
    Fault ReadRange (uint16_t addr, uint8_t * out, std::size_t count) const;
    Fault WriteRange (uint16_t addr, const uint8_t * data, std::size_t count);

    static uint16_t FontAddress (uint8_t digit);
    static bool InBounds (uint32_t addr, std::size_t count);

private:
    uint8_t m_bytes[s_memoryBytes];
};

} // namespace CSaruChip8
