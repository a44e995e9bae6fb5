#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <string>
#include <thread>
#include <vector>

#include <termios.h>
#include <unistd.h>

#include <csaru-core-cpp/csaru-core-cpp.h>

#include "../include/csaru-chip8/driver.hpp"
#include "key_input.hpp"

using namespace CSaruChip8;

//=====================================================================
//
// Command line
//
//=====================================================================

enum class ParseResult {
    Ok,
    Help,
    Error
};

struct CliOptions {
    std::string romPath;
    unsigned    instructionsPerFrame;
    uint64_t    maxFrames; // 0 runs until a fault
    unsigned    seed;
    bool        quirkLoadStore;
    bool        quirkShiftVx;
    bool        trace;
    bool        sleep;
    unsigned    keyHoldFrames;

    CliOptions ()
        : instructionsPerFrame(DriverConfig().instructionsPerFrame)
        , maxFrames(0)
        , seed(static_cast<unsigned>(std::time(nullptr)))
        , quirkLoadStore(false)
        , quirkShiftVx(false)
        , trace(false)
        , sleep(true)
        , keyHoldFrames(6)
    {}
};

//=====================================================================
static void PrintUsage (const char * programName) {

    std::printf(
        "Usage: %s [OPTIONS] ROM_PATH\n\n"
        "Run a CHIP-8 program, drawing the display as text.\n"
        "Keys 1234/QWER/ASDF/ZXCV drive the hex keypad; Esc quits.\n\n"
        "Options:\n"
        "  -h, --help            Show this help message\n"
        "  --ipf N               Instructions executed per 60Hz frame (default %u)\n"
        "  --frames N            Stop after N frames (default: until a fault)\n"
        "  --seed N              Seed for the RND instruction\n"
        "  --quirk-load-store    FX55/FX65 advance I past the registers\n"
        "  --quirk-shift-vx      8XY6/8XYE shift VX in place instead of VY\n"
        "  --trace               Print every instruction to stderr\n"
        "  --no-sleep            Do not pace frames in real time\n"
        "  --key-hold N          Frames a key stays down after a press (default %u)\n",
        programName,
        DriverConfig().instructionsPerFrame,
        CliOptions().keyHoldFrames
    );

}

//=====================================================================
static bool ParseUnsigned (const char * str, unsigned long long * out) {

    if (!str || !*str || *str == '-')
        return false;

    char * end = nullptr;
    errno = 0;
    const unsigned long long value = std::strtoull(str, &end, 0);
    if (errno || *end)
        return false;

    *out = value;
    return true;

}

//=====================================================================
static ParseResult ParseArgs (int argc, char * argv[], CliOptions & opts) {

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            PrintUsage(argv[0]);
            return ParseResult::Help;
        }
        else if (arg == "--ipf" || arg == "--frames" || arg == "--seed" || arg == "--key-hold") {
            unsigned long long value = 0;
            if (i + 1 >= argc || !ParseUnsigned(argv[i + 1], &value)) {
                std::fprintf(stderr, "Chip8: {%s} requires an unsigned integer.\n", arg.c_str());
                return ParseResult::Error;
            }
            ++i;

            if (arg == "--ipf") {
                if (!value || value > 100000) {
                    std::fprintf(stderr, "Chip8: {--ipf} must be between 1 and 100000.\n");
                    return ParseResult::Error;
                }
                opts.instructionsPerFrame = static_cast<unsigned>(value);
            }
            else if (arg == "--frames")
                opts.maxFrames = value;
            else if (arg == "--key-hold") {
                if (!value || value > 600) {
                    std::fprintf(stderr, "Chip8: {--key-hold} must be between 1 and 600.\n");
                    return ParseResult::Error;
                }
                opts.keyHoldFrames = static_cast<unsigned>(value);
            }
            else
                opts.seed = static_cast<unsigned>(value);
        }
        else if (arg == "--quirk-load-store")
            opts.quirkLoadStore = true;
        else if (arg == "--quirk-shift-vx")
            opts.quirkShiftVx = true;
        else if (arg == "--trace")
            opts.trace = true;
        else if (arg == "--no-sleep")
            opts.sleep = false;
        else if (arg[0] == '-') {
            std::fprintf(stderr, "Chip8: Unknown option {%s}.\n", arg.c_str());
            return ParseResult::Error;
        }
        else if (opts.romPath.empty())
            opts.romPath = arg;
        else {
            std::fprintf(stderr, "Chip8: Too many program paths.\n");
            return ParseResult::Error;
        }
    }

    if (opts.romPath.empty()) {
        std::fprintf(stderr, "Chip8: No program path given.\n");
        return ParseResult::Error;
    }

    return ParseResult::Ok;

}


//=====================================================================
//
// Adapters
//
//=====================================================================

//=====================================================================
class TextRenderer : public RenderAdapter {
public:
    void Present (const Display & display) override {

        if (!display.IsDirty())
            return;

        const uint8_t * pixels = display.Pixels();
        std::string frame("\x1b[H");
        frame.reserve(3 + (Display::s_renderWidth + 1) * Display::s_renderHeight);
        for (unsigned y = 0; y < Display::s_renderHeight; ++y) {
            for (unsigned x = 0; x < Display::s_renderWidth; ++x)
                frame += *pixels++ ? '#' : ' ';
            frame += '\n';
        }
        std::fputs(frame.c_str(), stdout);
        std::fflush(stdout);

    }
};

//=====================================================================
class BeepAudio : public AudioAdapter {
public:
    BeepAudio () : m_wasActive(false) {}

    void SetTone (bool active) override {
        if (active && !m_wasActive)
            CSaruCore::Beep(); // beep the PC speaker
        m_wasActive = active;
    }

private:
    bool m_wasActive;
};

//=====================================================================
class StderrTrace : public TraceSink {
public:
    void OnInstruction (uint16_t pc, const Instruction & inst) override {
        std::fprintf(
            stderr,
            "Chip8: {0x%04X} {0x%04X} %s\n",
            unsigned(pc),
            unsigned(inst.opcode),
            Disassemble(inst).c_str()
        );
    }
};

//=====================================================================
// Puts an interactive stdin into unbuffered, no-echo, non-blocking mode
// for its lifetime. Does nothing when stdin is not a terminal.
class TerminalInput {
public:
    TerminalInput () : m_active(false) {

        if (!isatty(STDIN_FILENO) || tcgetattr(STDIN_FILENO, &m_saved) != 0)
            return;

        termios raw = m_saved;
        raw.c_lflag &= ~tcflag_t(ICANON | ECHO);
        raw.c_cc[VMIN]  = 0;
        raw.c_cc[VTIME] = 0;
        m_active = tcsetattr(STDIN_FILENO, TCSANOW, &raw) == 0;
        if (!m_active)
            std::fprintf(stderr, "Chip8: Failed to set terminal mode; keyboard disabled.\n");

    }

    ~TerminalInput () {
        if (m_active)
            tcsetattr(STDIN_FILENO, TCSANOW, &m_saved);
    }

    // Returns the number of bytes waiting on stdin, up to `size`.
    std::size_t Read (char * buffer, std::size_t size) {

        if (!m_active)
            return 0;

        const ssize_t count = read(STDIN_FILENO, buffer, size);
        if (count < 0) {
            if (errno == EAGAIN || errno == EINTR)
                return 0;
            std::fprintf(stderr, "Chip8: Failed to read the terminal; keyboard disabled.\n");
            tcsetattr(STDIN_FILENO, TCSANOW, &m_saved);
            m_active = false;
            return 0;
        }
        return std::size_t(count);

    }

private:
    TerminalInput (const TerminalInput &);
    TerminalInput & operator= (const TerminalInput &);

    bool    m_active;
    termios m_saved;
};

//=====================================================================
static bool ReadProgramFile (const char * path, std::vector<uint8_t> * out) {

    std::FILE * progFile = std::fopen(path, "rb");
    if (!progFile) {
        std::fprintf(stderr, "Chip8: Failed to open program file at {%s}.\n", path);
        return false;
    }

    // One byte more than fits, so oversized programs are caught by the loader.
    out->resize(Memory::s_maxProgramBytes + 1);
    const std::size_t readCount = std::fread(
        out->data(),
        1, /* size of element to read (in bytes) */
        out->size(), /* number of element to read */
        progFile
    );
    const bool readError = std::ferror(progFile) != 0;
    std::fclose(progFile);

    if (readError) {
        std::fprintf(stderr, "Chip8: Failed to read from program file {%s}.\n", path);
        return false;
    }

    out->resize(readCount);
    return true;

}


//=====================================================================
//
// Entry point
//
//=====================================================================

//=====================================================================
int main (int argc, char * argv[]) {

    CliOptions opts;
    const ParseResult parsed = ParseArgs(argc, argv, opts);
    if (parsed == ParseResult::Help)
        return EXIT_SUCCESS;
    if (parsed == ParseResult::Error) {
        PrintUsage(argv[0]);
        return EXIT_FAILURE;
    }

    std::vector<uint8_t> program;
    if (!ReadProgramFile(opts.romPath.c_str(), &program))
        return EXIT_FAILURE;

    Chip8 chip8;
    chip8.Initialize(opts.seed);
    chip8.m_quirks.loadStoreAdvancesIndex = opts.quirkLoadStore;
    chip8.m_quirks.shiftUsesVy            = !opts.quirkShiftVx;

    DriverConfig config;
    config.instructionsPerFrame = opts.instructionsPerFrame;

    Driver driver(chip8, config);
    const Fault loadFault = driver.LoadRom(program.data(), program.size());
    if (loadFault != Fault::None) {
        std::fprintf(
            stderr,
            "Chip8: Failed to load {%s}: %s ({%u} bytes, at most {%u}).\n",
            opts.romPath.c_str(),
            FaultName(loadFault),
            unsigned(program.size()),
            Memory::s_maxProgramBytes
        );
        return EXIT_FAILURE;
    }

    TextRenderer renderer;
    BeepAudio    audio;
    StderrTrace  trace;
    driver.AttachRenderer(&renderer);
    driver.AttachAudio(&audio);
    if (opts.trace)
        driver.AttachTrace(&trace);

    std::fputs("\x1b[2J", stdout);

    TerminalInput terminal;
    KeyHold       keys(opts.keyHoldFrames);

    typedef std::chrono::steady_clock Clock;
    Clock::time_point nextFrame = Clock::now();

    while (!opts.maxFrames || driver.GetFrameCount() < opts.maxFrames) {
        char input[32];
        const std::size_t inputCount = terminal.Read(input, sizeof(input));
        bool quit = false;
        for (std::size_t i = 0; i < inputCount; ++i) {
            if (input[i] == '\x1b')
                quit = true;

            const int key = KeypadKeyForChar(input[i]);
            if (key < 0)
                continue;

            const Fault keyFault = keys.Press(unsigned(key), chip8.m_keypad);
            if (keyFault != Fault::None)
                std::fprintf(stderr, "Chip8: Key {%d} dropped: %s.\n", key, FaultName(keyFault));
        }
        if (quit)
            break;

        const Fault fault = driver.RunFrame();
        if (IsHaltingFault(fault)) {
            std::fprintf(stderr, "Chip8: Halted on %s.\n", chip8.DescribeFault().c_str());
            return EXIT_FAILURE;
        }
        if (fault != Fault::None)
            std::fprintf(stderr, "Chip8: %s.\n", FaultName(fault));

        const Fault releaseFault = keys.EndFrame(chip8.m_keypad);
        if (releaseFault != Fault::None)
            std::fprintf(stderr, "Chip8: Key release failed: %s.\n", FaultName(releaseFault));

        if (opts.sleep) {
            nextFrame += DriverConfig::FrameDuration();
            std::this_thread::sleep_until(nextFrame);
        }
    }

    std::fprintf(
        stderr,
        "Chip8: Stopped after {%llu} frames, {%llu} instructions.\n",
        static_cast<unsigned long long>(driver.GetFrameCount()),
        static_cast<unsigned long long>(driver.GetInstructionCount())
    );
    return EXIT_SUCCESS;

}
