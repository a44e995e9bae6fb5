#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

#include "chip8.hpp"

namespace CSaruChip8 {

struct DriverConfig {
    static const unsigned s_framesPerSecond = 60;

    unsigned instructionsPerFrame;

    DriverConfig ()
        : instructionsPerFrame(10)
    {}

    static std::chrono::microseconds FrameDuration () {
        return std::chrono::microseconds(1000000 / s_framesPerSecond);
    }
};

// Receives the frame buffer once per frame.
class RenderAdapter {
public:
    virtual ~RenderAdapter () {}
    virtual void Present (const Display & display) = 0;
};

// Receives the sound-timer state once per frame.
class AudioAdapter {
public:
    virtual ~AudioAdapter () {}
    virtual void SetTone (bool active) = 0;
};

// Called before each instruction is executed; used for tracing.
class TraceSink {
public:
    virtual ~TraceSink () {}
    virtual void OnInstruction (uint16_t pc, const Instruction & inst) = 0;
};

// Frame-at-a-time scheduler around a Chip8. Does no sleeping of its own;
// callers pace RunFrame() at DriverConfig::FrameDuration().
class Driver {
public:
    explicit Driver (Chip8 & chip8, const DriverConfig & config = DriverConfig());

    Fault LoadRom (const uint8_t * data, std::size_t size);

    // Up to instructionsPerFrame steps (fewer if a key-wait or fault stops
    // them), one timer tick, then hand the frame to the adapters.
    Fault RunFrame ();

    void AttachRenderer (RenderAdapter * renderer) { m_renderer = renderer; }
    void AttachAudio (AudioAdapter * audio) { m_audio = audio; }
    void AttachTrace (TraceSink * trace) { m_trace = trace; }

    // Pull-style access for adapters that poll after RunFrame().
    const Display & GetDisplay () const { return m_chip8.m_display; }
    bool IsSoundActive () const { return m_chip8.m_timers.IsSoundActive(); }

    Chip8 &              GetChip8 () { return m_chip8; }
    const DriverConfig & GetConfig () const { return m_config; }
    uint64_t             GetFrameCount () const { return m_frameCount; }
    uint64_t             GetInstructionCount () const { return m_instructionCount; }

private:
    Fault Step ();
    void  Present ();

private:
    Chip8 &       m_chip8;
    DriverConfig  m_config;
    RenderAdapter * m_renderer;
    AudioAdapter *  m_audio;
    TraceSink *     m_trace;
    uint64_t      m_frameCount;
    uint64_t      m_instructionCount;
};

} // namespace CSaruChip8
