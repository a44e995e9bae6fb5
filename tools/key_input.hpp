#pragma once

#include <cstdint>

#include "../include/csaru-chip8/keypad.hpp"

// Maps the left-hand block of a QWERTY keyboard onto the hex keypad:
//
//   1 2 3 4        1 2 3 C
//   Q W E R   ->   4 5 6 D
//   A S D F        7 8 9 E
//   Z X C V        A 0 B F
//
// Case-insensitive. Returns -1 for characters that are not keypad keys.
int KeypadKeyForChar (char c);

// Terminals report key presses but never releases, so a press holds the
// keypad key down for a fixed number of frames. Auto-repeat while the
// physical key is held refreshes the hold.
class KeyHold {
public:
    explicit KeyHold (unsigned holdFrames);

    CSaruChip8::Fault Press (unsigned key, CSaruChip8::Keypad & keypad);

    // Call once per frame, after the frame has run.
    CSaruChip8::Fault EndFrame (CSaruChip8::Keypad & keypad);

private:
    unsigned m_holdFrames;
    unsigned m_framesLeft[CSaruChip8::Keypad::s_keyCount];
};
