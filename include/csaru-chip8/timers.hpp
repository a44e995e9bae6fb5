#pragma once

#include <cstdint>

namespace CSaruChip8 {

// Delay and sound counters. Only Tick() counts them down; it is meant to be
// called at 60Hz no matter how fast instructions are executed.
class Timers {
public:
    Timers ();

    void Reset ();
    void Tick ();

    uint8_t GetDelay () const { return m_delayTimer; }
    void    SetDelay (uint8_t value) { m_delayTimer = value; }

    uint8_t GetSound () const { return m_soundTimer; }
    void    SetSound (uint8_t value) { m_soundTimer = value; }

    bool IsSoundActive () const { return m_soundTimer != 0; }

private:
    uint8_t m_delayTimer; // decrement if not 0
    uint8_t m_soundTimer; // decrement if not 0; tone while not 0
};

} // namespace CSaruChip8
