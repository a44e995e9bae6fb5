#pragma once

#include <cstddef>
#include <cstdint>

namespace CSaruChip8 {

// 64x32 monochrome frame buffer. One byte per pixel (0 or 1), row major.
class Display {
public:
    static const unsigned s_renderWidth  = 64;
    static const unsigned s_renderHeight = 32;
    static const unsigned s_pixelCount   = s_renderWidth * s_renderHeight;
    static const unsigned s_spriteWidth  = 8;

public:
    Display ();

    void Clear ();

    // XOR-blit `rows` sprite bytes (MSB is the leftmost pixel) with the
    // top-left corner at (x, y). Coordinates wrap on both axes.
    // Returns true if any lit pixel was switched off.
    bool Draw (unsigned x, unsigned y, const uint8_t * sprite, std::size_t rows);

    bool GetPixel (unsigned x, unsigned y) const;
    const uint8_t * Pixels () const { return m_renderOut; }
    unsigned LitPixelCount () const;

    // Set by Draw/Clear; the driver clears it once a frame is presented.
    bool IsDirty () const { return m_drawFlag; }
    void ClearDirty () { m_drawFlag = false; }

private:
    uint8_t m_renderOut[s_pixelCount];
    bool    m_drawFlag; // whether or not a GUI application should render
};

} // namespace CSaruChip8
