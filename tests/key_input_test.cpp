#include "key_input.hpp"

#include <cstdlib>
#include <iostream>

using namespace CSaruChip8;

int main() {
    int failures = 0;

    // Test 1: Keyboard layout maps onto the hex keypad
    {
        const char* rows[4] = { "1234", "qwer", "asdf", "zxcv" };
        const int expected[16] = {
            0x1, 0x2, 0x3, 0xC,
            0x4, 0x5, 0x6, 0xD,
            0x7, 0x8, 0x9, 0xE,
            0xA, 0x0, 0xB, 0xF,
        };
        bool pass = true;
        for (int row = 0; row < 4; ++row) {
            for (int col = 0; col < 4; ++col)
                pass = pass && KeypadKeyForChar(rows[row][col]) == expected[row * 4 + col];
        }

        if (!pass) {
            std::cerr << "FAIL: Keyboard layout\n";
            failures++;
        } else {
            std::cout << "PASS: Keyboard layout\n";
        }
    }

    // Test 2: Upper case maps the same, unmapped characters return -1
    {
        bool pass = KeypadKeyForChar('Q') == 0x4 && KeypadKeyForChar('V') == 0xF;
        pass = pass && KeypadKeyForChar('5') == -1 && KeypadKeyForChar('p') == -1;
        pass = pass && KeypadKeyForChar('\x1b') == -1 && KeypadKeyForChar(' ') == -1;

        if (!pass) {
            std::cerr << "FAIL: Case and unmapped characters\n";
            failures++;
        } else {
            std::cout << "PASS: Case and unmapped characters\n";
        }
    }

    // Test 3: A press holds the key for the configured number of frames
    {
        Keypad keypad;
        KeyHold keys(3);
        bool pass = keys.Press(0x5, keypad) == Fault::None && keypad.IsPressed(0x5);
        pass = pass && keys.EndFrame(keypad) == Fault::None && keypad.IsPressed(0x5);
        pass = pass && keys.EndFrame(keypad) == Fault::None && keypad.IsPressed(0x5);
        pass = pass && keys.EndFrame(keypad) == Fault::None && !keypad.IsPressed(0x5);
        pass = pass && !keypad.AnyPressed();

        if (!pass) {
            std::cerr << "FAIL: Key hold duration\n";
            failures++;
        } else {
            std::cout << "PASS: Key hold duration\n";
        }
    }

    // Test 4: Repeated presses refresh the hold without a release in between
    {
        Keypad keypad;
        KeyHold keys(2);
        bool pass = keys.Press(0xA, keypad) == Fault::None;
        pass = pass && keys.EndFrame(keypad) == Fault::None;
        pass = pass && keys.Press(0xA, keypad) == Fault::None;
        pass = pass && keys.EndFrame(keypad) == Fault::None && keypad.IsPressed(0xA);
        pass = pass && keys.EndFrame(keypad) == Fault::None && !keypad.IsPressed(0xA);

        if (!pass) {
            std::cerr << "FAIL: Hold refresh\n";
            failures++;
        } else {
            std::cout << "PASS: Hold refresh\n";
        }
    }

    // Test 5: A held key satisfies a wait once, as a single press
    {
        Keypad keypad;
        KeyHold keys(4);
        uint8_t key = 0xFF;
        keypad.ArmKeyWait();
        bool pass = keys.Press(0xE, keypad) == Fault::None;
        pass = pass && keys.Press(0xE, keypad) == Fault::None;
        pass = pass && keypad.ConsumeKeyPress(&key) && key == 0xE;
        keypad.ArmKeyWait();
        pass = pass && keys.Press(0xE, keypad) == Fault::None;
        pass = pass && !keypad.ConsumeKeyPress(&key);

        if (!pass) {
            std::cerr << "FAIL: Held key and key wait\n";
            failures++;
        } else {
            std::cout << "PASS: Held key and key wait\n";
        }
    }

    // Test 6: Out-of-range keys are rejected and nothing is held
    {
        Keypad keypad;
        KeyHold keys(2);
        bool pass = keys.Press(16, keypad) == Fault::InvalidKey;
        pass = pass && !keypad.AnyPressed() && keys.EndFrame(keypad) == Fault::None;

        if (!pass) {
            std::cerr << "FAIL: Invalid key press\n";
            failures++;
        } else {
            std::cout << "PASS: Invalid key press rejected\n";
        }
    }

    if (failures == 0) {
        std::cout << "\nAll tests passed!\n";
        return EXIT_SUCCESS;
    } else {
        std::cerr << "\n" << failures << " test(s) failed!\n";
        return EXIT_FAILURE;
    }
}
