//
// Created by the chip8vm authors on 19.10.26.
//

#ifndef CHIP8VM_OPCODE_H
#define CHIP8VM_OPCODE_H

#include <stdint.h>

namespace chip8vm {
    namespace core {
        //
        // Field extraction for the 16 bit instruction word, layout (MSB first):
        //
        //   15..12 | 11..8 | 7..4 | 3..0
        //   -------+-------+------+------
        //    kind  |   x   |  y   |  n
        //          |       |     nn
        //          |         nnn
        //
        // All of these are total - any 16 bit value is a valid input
        //
        namespace opcode {
            // Instruction family selector
            static constexpr uint8_t Kind(uint16_t op) {
                return static_cast<uint8_t>((op >> 12) & 0x0f);
            }
            // First register index
            static constexpr uint8_t X(uint16_t op) {
                return static_cast<uint8_t>((op >> 8) & 0x0f);
            }
            // Second register index
            static constexpr uint8_t Y(uint16_t op) {
                return static_cast<uint8_t>((op >> 4) & 0x0f);
            }
            // 4 bit immediate, sprite height or sub-selector in the 0x5/0x8/0x9 families
            static constexpr uint8_t N(uint16_t op) {
                return static_cast<uint8_t>(op & 0x0f);
            }
            // 8 bit immediate, sub-selector in the 0x0/0xE/0xF families
            static constexpr uint8_t NN(uint16_t op) {
                return static_cast<uint8_t>(op & 0xff);
            }
            // 12 bit address
            static constexpr uint16_t NNN(uint16_t op) {
                return static_cast<uint16_t>(op & 0x0fff);
            }
            // Big-endian, high byte comes first in memory
            static constexpr uint16_t FromBytes(uint8_t hi, uint8_t lo) {
                return static_cast<uint16_t>((uint16_t(hi) << 8) | lo);
            }
        }
    }
}

#endif //CHIP8VM_OPCODE_H
