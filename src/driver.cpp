#include "../include/csaru-chip8/driver.hpp"

namespace CSaruChip8 {

const unsigned DriverConfig::s_framesPerSecond;

//=====================================================================
Driver::Driver (Chip8 & chip8, const DriverConfig & config)
    : m_chip8(chip8)
    , m_config(config)
    , m_renderer(nullptr)
    , m_audio(nullptr)
    , m_trace(nullptr)
    , m_frameCount(0)
    , m_instructionCount(0)
{
    if (!m_config.instructionsPerFrame)
        m_config.instructionsPerFrame = 1;
}

//=====================================================================
Fault Driver::LoadRom (const uint8_t * data, std::size_t size) {

    const Fault fault = m_chip8.LoadProgram(data, size);
    if (fault != Fault::None)
        return fault;

    m_frameCount       = 0;
    m_instructionCount = 0;
    return Fault::None;

}

//=====================================================================
Fault Driver::RunFrame () {

    Fault fault = Fault::None;
    for (unsigned i = 0; i < m_config.instructionsPerFrame; ++i) {
        fault = Step();
        if (fault != Fault::None || m_chip8.IsAwaitingKey())
            break;
    }

    // Timers keep running while the CPU waits on a key.
    if (!m_chip8.IsHalted())
        m_chip8.m_timers.Tick();

    Present();
    ++m_frameCount;
    return fault;

}

//=====================================================================
Fault Driver::Step () {

    if (m_trace && m_chip8.m_runState == RunState::Running) {
        uint16_t word;
        if (m_chip8.m_memory.ReadWord(m_chip8.m_pc, &word) == Fault::None)
            m_trace->OnInstruction(m_chip8.m_pc, Decode(word));
    }

    const bool wasRunning = m_chip8.m_runState == RunState::Running;
    const Fault fault = m_chip8.EmulateCycle();
    if (wasRunning && fault == Fault::None)
        ++m_instructionCount;
    return fault;

}

//=====================================================================
void Driver::Present () {

    if (m_renderer)
        m_renderer->Present(m_chip8.m_display);
    if (m_audio)
        m_audio->SetTone(m_chip8.m_timers.IsSoundActive());

    m_chip8.m_display.ClearDirty();

}

} // namespace CSaruChip8
