#include <csaru-core-cpp/csaru-core-cpp.h>

#include "../include/csaru-chip8/display.hpp"

namespace CSaruChip8 {

const unsigned Display::s_renderWidth;
const unsigned Display::s_renderHeight;
const unsigned Display::s_pixelCount;
const unsigned Display::s_spriteWidth;

//=====================================================================
Display::Display () {
    Clear();
}

//=====================================================================
void Display::Clear () {

    CSaruCore::SecureZero(m_renderOut, sizeof(m_renderOut));
    m_drawFlag = true;

}

//=====================================================================
bool Display::Draw (unsigned x, unsigned y, const uint8_t * sprite, std::size_t rows) {

    bool collided = false;

    for (std::size_t row = 0; row < rows; ++row) {
        const uint8_t  bits = sprite[row];
        const unsigned py   = (y + row) % s_renderHeight;

        for (unsigned bit = 0; bit < s_spriteWidth; ++bit) {
            if (!(bits & (0x80 >> bit)))
                continue;

            const unsigned px    = (x + bit) % s_renderWidth;
            uint8_t &      pixel = m_renderOut[py * s_renderWidth + px];
            if (pixel)
                collided = true;
            pixel ^= 1;
        }
    }

    m_drawFlag = true;
    return collided;

}

//=====================================================================
bool Display::GetPixel (unsigned x, unsigned y) const {
    return m_renderOut[(y % s_renderHeight) * s_renderWidth + (x % s_renderWidth)] != 0;
}

//=====================================================================
unsigned Display::LitPixelCount () const {

    unsigned count = 0;
    for (unsigned i = 0; i < s_pixelCount; ++i)
        count += m_renderOut[i];
    return count;

}

} // namespace CSaruChip8
