//
// Created by the chip8vm authors on 19.10.26.
//

#ifndef CHIP8VM_INSTRUCTIONSETDEF_H
#define CHIP8VM_INSTRUCTIONSETDEF_H

#include <stdint.h>
#include <stddef.h>
#include <string>
#include <unordered_map>
#include <optional>

namespace chip8vm {
    namespace core {

        //
        // The complete instruction set, one code per opcode form.
        // The opcode pattern is given in the comment, lower case letters are operand fields:
        //   nnn - 12 bit address, kk - 8 bit immediate, n - 4 bit immediate, x/y - register index
        //
        // Note: 0nnn (call machine code routine) is not part of this, it can't be emulated and decodes as invalid
        //
        enum class InstrCode : uint8_t {
            CLS = 0,        // 00E0
            RET,            // 00EE
            JP,             // 1nnn
            CALL,           // 2nnn
            SE_VX_KK,       // 3xkk
            SNE_VX_KK,      // 4xkk
            SE_VX_VY,       // 5xy0
            LD_VX_KK,       // 6xkk
            ADD_VX_KK,      // 7xkk
            LD_VX_VY,       // 8xy0
            OR,             // 8xy1
            AND,            // 8xy2
            XOR,            // 8xy3
            ADD_VX_VY,      // 8xy4
            SUB,            // 8xy5
            SHR,            // 8xy6
            SUBN,           // 8xy7
            SHL,            // 8xyE
            SNE_VX_VY,      // 9xy0
            LD_I,           // Annn
            JP_V0,          // Bnnn
            RND,            // Cxkk
            DRW,            // Dxyn
            SKP,            // Ex9E
            SKNP,           // ExA1
            LD_VX_DT,       // Fx07
            LD_VX_K,        // Fx0A
            LD_DT_VX,       // Fx15
            LD_ST_VX,       // Fx18
            ADD_I_VX,       // Fx1E
            LD_F_VX,        // Fx29
            LD_B_VX,        // Fx33
            LD_MEM_VX,      // Fx55
            LD_VX_MEM,      // Fx65
        };

        static constexpr size_t kNumInstructions = static_cast<size_t>(InstrCode::LD_VX_MEM) + 1;

        struct InstrDescription {
            std::string name;
            std::string pattern;
        };

        class InstructionSetDef {
        public:
            static const std::unordered_map<InstrCode, InstrDescription> &GetInstructionSet();
            static std::optional<InstrDescription> GetDescription(InstrCode code);
        };
    }
}

#endif //CHIP8VM_INSTRUCTIONSETDEF_H
