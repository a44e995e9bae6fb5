#include <csaru-core-cpp/csaru-core-cpp.h>

#include "../include/csaru-chip8/keypad.hpp"

namespace CSaruChip8 {

const unsigned Keypad::s_keyCount;

//=====================================================================
Keypad::Keypad () {
    Reset();
}

//=====================================================================
void Keypad::Reset () {

    CSaruCore::SecureZero(m_keyStates, sizeof(m_keyStates));
    m_pressLatched = false;
    m_latchedKey   = 0;

}

//=====================================================================
Fault Keypad::SetKey (unsigned key, bool pressed) {

    if (key >= s_keyCount)
        return Fault::InvalidKey;

    if (pressed && !m_keyStates[key]) {
        m_pressLatched = true;
        m_latchedKey   = static_cast<uint8_t>(key);
    }
    m_keyStates[key] = pressed ? 1 : 0;
    return Fault::None;

}

//=====================================================================
bool Keypad::IsPressed (unsigned key) const {
    return key < s_keyCount && m_keyStates[key];
}

//=====================================================================
bool Keypad::AnyPressed () const {

    for (unsigned key = 0; key < s_keyCount; ++key) {
        if (m_keyStates[key])
            return true;
    }
    return false;

}

//=====================================================================
void Keypad::ArmKeyWait () {
    m_pressLatched = false;
}

//=====================================================================
bool Keypad::ConsumeKeyPress (uint8_t * key) {

    if (!m_pressLatched)
        return false;

    *key           = m_latchedKey;
    m_pressLatched = false;
    return true;

}

} // namespace CSaruChip8
