#pragma once

#include <cstdint>

#include "fault.hpp"

namespace CSaruChip8 {

// Hex keypad state, 0x0 - 0xF.
//
// Besides the current up/down state the keypad latches the most recent
// released->pressed transition. The key-wait instruction consumes that latch,
// so a press that is released again before the next step is not lost.
class Keypad {
public:
    static const unsigned s_keyCount = 16;

public:
    Keypad ();

    void Reset ();

    Fault SetKey (unsigned key, bool pressed);
    bool  IsPressed (unsigned key) const;
    bool  AnyPressed () const;

    // Forget any latched press; called when a key-wait begins.
    void ArmKeyWait ();

    // Returns true and the latched key if one was pressed since ArmKeyWait().
    bool ConsumeKeyPress (uint8_t * key);

private:
    uint8_t m_keyStates[s_keyCount]; // hex keypad buttonstates
    bool    m_pressLatched;
    uint8_t m_latchedKey;
};

} // namespace CSaruChip8
