//
// Created by the chip8vm authors on 19.10.26.
//

#include "fmt/format.h"
#include "VirtualCPU.h"

using namespace chip8vm;
using namespace chip8vm::core;

void VirtualCPU::Reset() {
    CPUBase::Reset();
    lastDecodedInstruction = {};
    haveLastInstruction = false;
}

//
// fetch -> advance -> decode -> execute
// The instr. ptr is moved past the instruction BEFORE execution, jumps/calls/skips simply overwrite or add to it
//
bool VirtualCPU::Step() {
    ClearFault();

    auto registersBefore = registers;
    currentInstrAddr = registers.instrPointer;
    currentOpCode = 0;

    uint16_t opCode = 0;
    if (!FetchOpCode(opCode)) {
        return false;
    }
    currentOpCode = opCode;
    AdvanceInstrPtr(2);

    auto instr = InstructionDecoder::Decode(opCode);
    if (!instr.has_value()) {
        return RaiseFault(CPUFault::UnknownOpcode);
    }

    if (!instructionSet.ExecuteInstruction(*this, *instr)) {
        return false;
    }

    lastDecodedInstruction.instrAddr = currentInstrAddr;
    lastDecodedInstruction.cpuRegistersBefore = registersBefore;
    lastDecodedInstruction.cpuRegistersAfter = registers;
    lastDecodedInstruction.instruction = *instr;
    haveLastInstruction = true;

    return true;
}
