//
// Created by the chip8vm authors on 19.10.26.
//

#ifndef CHIP8VM_KEYMAP_H
#define CHIP8VM_KEYMAP_H

#include <stdint.h>
#include <optional>

namespace chip8vm {
    namespace core {
        //
        // Host keyboard to CHIP-8 keypad mapping (the common layout)
        //
        //   Keypad       Keyboard
        //  +-+-+-+-+    +-+-+-+-+
        //  |1|2|3|C|    |1|2|3|4|
        //  +-+-+-+-+    +-+-+-+-+
        //  |4|5|6|D|    |Q|W|E|R|
        //  +-+-+-+-+ => +-+-+-+-+
        //  |7|8|9|E|    |A|S|D|F|
        //  +-+-+-+-+    +-+-+-+-+
        //  |A|0|B|F|    |Z|X|C|V|
        //  +-+-+-+-+    +-+-+-+-+
        //
        class KeyMap {
        public:
            // Case-insensitive, returns nothing for keys not on the grid
            static std::optional<uint8_t> FromHostKey(char hostKey);
            // Returns nothing for keys > 0xF
            static std::optional<char> ToHostKey(uint8_t keypadKey);
        };
    }
}

#endif //CHIP8VM_KEYMAP_H
