//
// Created by the chip8vm authors on 19.10.26.
//

#include <ctype.h>
#include "KeyMap.h"

using namespace chip8vm;
using namespace chip8vm::core;

// Indexed by keypad key, the host key in lower case
static const char keypadToHost[16] = {
    'x', '1', '2', '3',     // 0, 1, 2, 3
    'q', 'w', 'e', 'a',     // 4, 5, 6, 7
    's', 'd', 'z', 'c',     // 8, 9, A, B
    '4', 'r', 'f', 'v',     // C, D, E, F
};

std::optional<uint8_t> KeyMap::FromHostKey(char hostKey) {
    auto lowerKey = static_cast<char>(tolower(static_cast<unsigned char>(hostKey)));
    for(uint8_t key = 0; key < 16; key++) {
        if (keypadToHost[key] == lowerKey) {
            return key;
        }
    }
    return {};
}

std::optional<char> KeyMap::ToHostKey(uint8_t keypadKey) {
    if (keypadKey > 0x0f) {
        return {};
    }
    return keypadToHost[keypadKey];
}
