#include "../include/csaru-chip8/timers.hpp"

namespace CSaruChip8 {

//=====================================================================
Timers::Timers () {
    Reset();
}

//=====================================================================
void Timers::Reset () {
    m_delayTimer = 0;
    m_soundTimer = 0;
}

//=====================================================================
void Timers::Tick () {

    if (m_delayTimer)
        --m_delayTimer;
    if (m_soundTimer)
        --m_soundTimer;

}

} // namespace CSaruChip8
