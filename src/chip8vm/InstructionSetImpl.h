//
// Created by the chip8vm authors on 19.10.26.
//

#ifndef CHIP8VM_INSTRUCTIONSETIMPL_H
#define CHIP8VM_INSTRUCTIONSETIMPL_H

#include "CPUBase.h"
#include "InstructionDecoder.h"

namespace chip8vm {
    namespace core {

        // Implements execution of the instruction set
        // Handlers that can fault return bool, 'false' means a fault has been raised on the CPU
        class InstructionSetImpl {
        public:
            InstructionSetImpl() = default;
            virtual ~InstructionSetImpl() = default;

            bool ExecuteInstruction(CPUBase &cpu, const DecodedInstruction &instr);

        protected:
            // flow control
            void ExecuteClsInstr(CPUBase &cpu, const DecodedInstruction &instr);
            bool ExecuteRetInstr(CPUBase &cpu, const DecodedInstruction &instr);
            void ExecuteJpInstr(CPUBase &cpu, const DecodedInstruction &instr);
            bool ExecuteCallInstr(CPUBase &cpu, const DecodedInstruction &instr);
            void ExecuteJpV0Instr(CPUBase &cpu, const DecodedInstruction &instr);

            // conditional skips
            void ExecuteSeImmInstr(CPUBase &cpu, const DecodedInstruction &instr);
            void ExecuteSneImmInstr(CPUBase &cpu, const DecodedInstruction &instr);
            void ExecuteSeRegInstr(CPUBase &cpu, const DecodedInstruction &instr);
            void ExecuteSneRegInstr(CPUBase &cpu, const DecodedInstruction &instr);
            bool ExecuteSkpInstr(CPUBase &cpu, const DecodedInstruction &instr);
            bool ExecuteSknpInstr(CPUBase &cpu, const DecodedInstruction &instr);

            // register loads and alu
            void ExecuteLdImmInstr(CPUBase &cpu, const DecodedInstruction &instr);
            void ExecuteAddImmInstr(CPUBase &cpu, const DecodedInstruction &instr);
            void ExecuteLdRegInstr(CPUBase &cpu, const DecodedInstruction &instr);
            void ExecuteOrInstr(CPUBase &cpu, const DecodedInstruction &instr);
            void ExecuteAndInstr(CPUBase &cpu, const DecodedInstruction &instr);
            void ExecuteXorInstr(CPUBase &cpu, const DecodedInstruction &instr);
            void ExecuteAddRegInstr(CPUBase &cpu, const DecodedInstruction &instr);
            void ExecuteSubInstr(CPUBase &cpu, const DecodedInstruction &instr);
            void ExecuteShrInstr(CPUBase &cpu, const DecodedInstruction &instr);
            void ExecuteSubnInstr(CPUBase &cpu, const DecodedInstruction &instr);
            void ExecuteShlInstr(CPUBase &cpu, const DecodedInstruction &instr);
            void ExecuteRndInstr(CPUBase &cpu, const DecodedInstruction &instr);

            // index register and memory
            void ExecuteLdIndexInstr(CPUBase &cpu, const DecodedInstruction &instr);
            void ExecuteAddIndexInstr(CPUBase &cpu, const DecodedInstruction &instr);
            void ExecuteLdFontInstr(CPUBase &cpu, const DecodedInstruction &instr);
            bool ExecuteLdBcdInstr(CPUBase &cpu, const DecodedInstruction &instr);
            bool ExecuteStoreRegsInstr(CPUBase &cpu, const DecodedInstruction &instr);
            bool ExecuteLoadRegsInstr(CPUBase &cpu, const DecodedInstruction &instr);

            // timers, keypad and display
            void ExecuteLdFromDelayInstr(CPUBase &cpu, const DecodedInstruction &instr);
            void ExecuteLdDelayInstr(CPUBase &cpu, const DecodedInstruction &instr);
            void ExecuteLdSoundInstr(CPUBase &cpu, const DecodedInstruction &instr);
            void ExecuteWaitKeyInstr(CPUBase &cpu, const DecodedInstruction &instr);
            bool ExecuteDrawInstr(CPUBase &cpu, const DecodedInstruction &instr);

            // Skip next instruction when 'condition' is true
            static void SkipIf(CPUBase &cpu, bool condition);
            // Key index comes from a register and can be out of range
            static bool ReadKeyFromReg(CPUBase &cpu, uint8_t idxRegister, bool &outIsPressed);
        };
    }
}

#endif //CHIP8VM_INSTRUCTIONSETIMPL_H
