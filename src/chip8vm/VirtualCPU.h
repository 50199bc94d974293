//
// Created by the chip8vm authors on 19.10.26.
//

#ifndef CHIP8VM_VIRTUALCPU_H
#define CHIP8VM_VIRTUALCPU_H

#include <stdint.h>
#include <optional>

#include "fmt/format.h"
#include "CPUBase.h"
#include "InstructionDecoder.h"
#include "InstructionSetImpl.h"

namespace chip8vm {
    namespace core {

        // Snapshot of the last executed instruction, used for tracing
        struct LastInstruction {
            uint16_t instrAddr = 0;
            Registers cpuRegistersBefore;
            Registers cpuRegistersAfter;
            DecodedInstruction instruction = {};

            std::string ToString() const {
                return InstructionDecoder::ToString(instruction);
            }
        };

        class VirtualCPU : public CPUBase {
        public:
            VirtualCPU() = default;
            virtual ~VirtualCPU() = default;

            void Reset() override;

            // Executes exactly one instruction
            // Returns
            //   true - instruction executed
            //   false - a fault was raised, see 'GetLastFault'
            bool Step();

            // Only valid after at least one successful step
            const LastInstruction *GetLastDecodedInstr() const {
                if (!haveLastInstruction) {
                    return nullptr;
                }
                return &lastDecodedInstruction;
            }
        private:
            InstructionSetImpl instructionSet;
            LastInstruction lastDecodedInstruction;
            bool haveLastInstruction = false;
        };
    }
}

#endif //CHIP8VM_VIRTUALCPU_H
