#include "key_input.hpp"

using namespace CSaruChip8;

//=====================================================================
int KeypadKeyForChar (char c) {

    switch (c) {
        case '1':           return 0x1;
        case '2':           return 0x2;
        case '3':           return 0x3;
        case '4':           return 0xC;
        case 'q': case 'Q': return 0x4;
        case 'w': case 'W': return 0x5;
        case 'e': case 'E': return 0x6;
        case 'r': case 'R': return 0xD;
        case 'a': case 'A': return 0x7;
        case 's': case 'S': return 0x8;
        case 'd': case 'D': return 0x9;
        case 'f': case 'F': return 0xE;
        case 'z': case 'Z': return 0xA;
        case 'x': case 'X': return 0x0;
        case 'c': case 'C': return 0xB;
        case 'v': case 'V': return 0xF;
        default:            return -1;
    }

}

//=====================================================================
KeyHold::KeyHold (unsigned holdFrames)
    : m_holdFrames(holdFrames ? holdFrames : 1)
{
    for (unsigned key = 0; key < Keypad::s_keyCount; ++key)
        m_framesLeft[key] = 0;
}

//=====================================================================
Fault KeyHold::Press (unsigned key, Keypad & keypad) {

    if (key >= Keypad::s_keyCount)
        return Fault::InvalidKey;

    if (!m_framesLeft[key]) {
        const Fault fault = keypad.SetKey(key, true);
        if (fault != Fault::None)
            return fault;
    }
    m_framesLeft[key] = m_holdFrames;
    return Fault::None;

}

//=====================================================================
Fault KeyHold::EndFrame (Keypad & keypad) {

    for (unsigned key = 0; key < Keypad::s_keyCount; ++key) {
        if (!m_framesLeft[key] || --m_framesLeft[key])
            continue;

        const Fault fault = keypad.SetKey(key, false);
        if (fault != Fault::None)
            return fault;
    }
    return Fault::None;

}
