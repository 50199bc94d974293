//
// Created by the chip8vm authors on 19.10.26.
//

#ifndef CHIP8VM_INSTRUCTIONDECODER_H
#define CHIP8VM_INSTRUCTIONDECODER_H

#include <stdint.h>
#include <string>
#include <optional>

#include "Opcode.h"
#include "InstructionSetDef.h"

namespace chip8vm {
    namespace core {

        // Result of decoding, all operand fields are extracted regardless if the instruction uses them
        struct DecodedInstruction {
            uint16_t opCode = 0;        // raw instruction word
            InstrCode code = {};
            uint8_t x = 0;
            uint8_t y = 0;
            uint8_t n = 0;
            uint8_t nn = 0;
            uint16_t nnn = 0;
        };

        class InstructionDecoder {
        public:
            InstructionDecoder() = default;
            virtual ~InstructionDecoder() = default;

            // Returns
            //   the decoded instruction
            //   nothing - if the instruction word doesn't match any instruction
            static std::optional<DecodedInstruction> Decode(uint16_t opCode);

            // Raw opcode and mnemonic, used for trace output
            static std::string ToString(const DecodedInstruction &instr);
        protected:
            static std::optional<InstrCode> DecodeSystem(uint16_t opCode);
            static std::optional<InstrCode> DecodeArithmetic(uint16_t opCode);
            static std::optional<InstrCode> DecodeKeypad(uint16_t opCode);
            static std::optional<InstrCode> DecodeMisc(uint16_t opCode);
        };
    }
}

#endif //CHIP8VM_INSTRUCTIONDECODER_H
