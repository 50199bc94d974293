//
// Created by the chip8vm authors on 19.10.26.
//
// This implements the instruction execution
// The instr. ptr has already been advanced past the instruction when any of these are called
//

#include "fmt/format.h"

#include "InstructionSetImpl.h"

using namespace chip8vm;
using namespace chip8vm::core;

bool InstructionSetImpl::ExecuteInstruction(CPUBase &cpu, const DecodedInstruction &instr) {
    switch(instr.code) {
        case InstrCode::CLS :
            ExecuteClsInstr(cpu, instr);
            break;
        case InstrCode::RET :
            return ExecuteRetInstr(cpu, instr);
        case InstrCode::JP :
            ExecuteJpInstr(cpu, instr);
            break;
        case InstrCode::CALL :
            return ExecuteCallInstr(cpu, instr);
        case InstrCode::SE_VX_KK :
            ExecuteSeImmInstr(cpu, instr);
            break;
        case InstrCode::SNE_VX_KK :
            ExecuteSneImmInstr(cpu, instr);
            break;
        case InstrCode::SE_VX_VY :
            ExecuteSeRegInstr(cpu, instr);
            break;
        case InstrCode::LD_VX_KK :
            ExecuteLdImmInstr(cpu, instr);
            break;
        case InstrCode::ADD_VX_KK :
            ExecuteAddImmInstr(cpu, instr);
            break;
        case InstrCode::LD_VX_VY :
            ExecuteLdRegInstr(cpu, instr);
            break;
        case InstrCode::OR :
            ExecuteOrInstr(cpu, instr);
            break;
        case InstrCode::AND :
            ExecuteAndInstr(cpu, instr);
            break;
        case InstrCode::XOR :
            ExecuteXorInstr(cpu, instr);
            break;
        case InstrCode::ADD_VX_VY :
            ExecuteAddRegInstr(cpu, instr);
            break;
        case InstrCode::SUB :
            ExecuteSubInstr(cpu, instr);
            break;
        case InstrCode::SHR :
            ExecuteShrInstr(cpu, instr);
            break;
        case InstrCode::SUBN :
            ExecuteSubnInstr(cpu, instr);
            break;
        case InstrCode::SHL :
            ExecuteShlInstr(cpu, instr);
            break;
        case InstrCode::SNE_VX_VY :
            ExecuteSneRegInstr(cpu, instr);
            break;
        case InstrCode::LD_I :
            ExecuteLdIndexInstr(cpu, instr);
            break;
        case InstrCode::JP_V0 :
            ExecuteJpV0Instr(cpu, instr);
            break;
        case InstrCode::RND :
            ExecuteRndInstr(cpu, instr);
            break;
        case InstrCode::DRW :
            return ExecuteDrawInstr(cpu, instr);
        case InstrCode::SKP :
            return ExecuteSkpInstr(cpu, instr);
        case InstrCode::SKNP :
            return ExecuteSknpInstr(cpu, instr);
        case InstrCode::LD_VX_DT :
            ExecuteLdFromDelayInstr(cpu, instr);
            break;
        case InstrCode::LD_VX_K :
            ExecuteWaitKeyInstr(cpu, instr);
            break;
        case InstrCode::LD_DT_VX :
            ExecuteLdDelayInstr(cpu, instr);
            break;
        case InstrCode::LD_ST_VX :
            ExecuteLdSoundInstr(cpu, instr);
            break;
        case InstrCode::ADD_I_VX :
            ExecuteAddIndexInstr(cpu, instr);
            break;
        case InstrCode::LD_F_VX :
            ExecuteLdFontInstr(cpu, instr);
            break;
        case InstrCode::LD_B_VX :
            return ExecuteLdBcdInstr(cpu, instr);
        case InstrCode::LD_MEM_VX :
            return ExecuteStoreRegsInstr(cpu, instr);
        case InstrCode::LD_VX_MEM :
            return ExecuteLoadRegsInstr(cpu, instr);
        default:
            fmt::print(stderr, "Invalid instruction code: {}\n", static_cast<int>(instr.code));
            return cpu.RaiseFault(CPUFault::UnknownOpcode);
    }
    return true;
}

////////////////////////////
//
// Instruction emulation begins here
//

// Helpers
void InstructionSetImpl::SkipIf(CPUBase &cpu, bool condition) {
    if (condition) {
        cpu.AdvanceInstrPtr(2);
    }
}

bool InstructionSetImpl::ReadKeyFromReg(CPUBase &cpu, uint8_t idxRegister, bool &outIsPressed) {
    auto key = cpu.GetRegisters().v[idxRegister];
    if (key >= CHIP8_NUM_KEYS) {
        fmt::print(stderr, "Key index {:#x} in V{:X} out of range\n", key, idxRegister);
        return cpu.RaiseFault(CPUFault::OutOfBounds);
    }
    outIsPressed = cpu.IsKeyPressed(key);
    return true;
}

//
// Flow control
//
void InstructionSetImpl::ExecuteClsInstr(CPUBase &cpu, const DecodedInstruction &instr) {
    cpu.GetFramebuffer().Clear();
}

bool InstructionSetImpl::ExecuteRetInstr(CPUBase &cpu, const DecodedInstruction &instr) {
    uint16_t retAddr = 0;
    if (!cpu.PopReturnAddress(retAddr)) {
        return false;
    }
    cpu.SetInstrPtr(retAddr);
    return true;
}

void InstructionSetImpl::ExecuteJpInstr(CPUBase &cpu, const DecodedInstruction &instr) {
    cpu.SetInstrPtr(instr.nnn);
}

bool InstructionSetImpl::ExecuteCallInstr(CPUBase &cpu, const DecodedInstruction &instr) {
    // instr. ptr is already pointing to the next instruction - that's our return address
    if (!cpu.PushReturnAddress(cpu.GetInstrPtr())) {
        return false;
    }
    cpu.SetInstrPtr(instr.nnn);
    return true;
}

void InstructionSetImpl::ExecuteJpV0Instr(CPUBase &cpu, const DecodedInstruction &instr) {
    auto &regs = cpu.GetRegisters();
    cpu.SetInstrPtr(instr.nnn + regs.v[0]);
}

//
// Conditional skips
//
void InstructionSetImpl::ExecuteSeImmInstr(CPUBase &cpu, const DecodedInstruction &instr) {
    auto &regs = cpu.GetRegisters();
    SkipIf(cpu, regs.v[instr.x] == instr.nn);
}

void InstructionSetImpl::ExecuteSneImmInstr(CPUBase &cpu, const DecodedInstruction &instr) {
    auto &regs = cpu.GetRegisters();
    SkipIf(cpu, regs.v[instr.x] != instr.nn);
}

void InstructionSetImpl::ExecuteSeRegInstr(CPUBase &cpu, const DecodedInstruction &instr) {
    auto &regs = cpu.GetRegisters();
    SkipIf(cpu, regs.v[instr.x] == regs.v[instr.y]);
}

void InstructionSetImpl::ExecuteSneRegInstr(CPUBase &cpu, const DecodedInstruction &instr) {
    auto &regs = cpu.GetRegisters();
    SkipIf(cpu, regs.v[instr.x] != regs.v[instr.y]);
}

bool InstructionSetImpl::ExecuteSkpInstr(CPUBase &cpu, const DecodedInstruction &instr) {
    bool isPressed = false;
    if (!ReadKeyFromReg(cpu, instr.x, isPressed)) {
        return false;
    }
    SkipIf(cpu, isPressed);
    return true;
}

bool InstructionSetImpl::ExecuteSknpInstr(CPUBase &cpu, const DecodedInstruction &instr) {
    bool isPressed = false;
    if (!ReadKeyFromReg(cpu, instr.x, isPressed)) {
        return false;
    }
    SkipIf(cpu, !isPressed);
    return true;
}

//
// Register loads and ALU
// Flags are computed from the operands before the result is written, VF is always written last.
// Thus, when the destination is VF it ends up holding the flag.
//
void InstructionSetImpl::ExecuteLdImmInstr(CPUBase &cpu, const DecodedInstruction &instr) {
    auto &regs = cpu.GetRegisters();
    regs.v[instr.x] = instr.nn;
}

// Note: does not touch VF
void InstructionSetImpl::ExecuteAddImmInstr(CPUBase &cpu, const DecodedInstruction &instr) {
    auto &regs = cpu.GetRegisters();
    regs.v[instr.x] = static_cast<uint8_t>(regs.v[instr.x] + instr.nn);
}

void InstructionSetImpl::ExecuteLdRegInstr(CPUBase &cpu, const DecodedInstruction &instr) {
    auto &regs = cpu.GetRegisters();
    regs.v[instr.x] = regs.v[instr.y];
}

void InstructionSetImpl::ExecuteOrInstr(CPUBase &cpu, const DecodedInstruction &instr) {
    auto &regs = cpu.GetRegisters();
    regs.v[instr.x] |= regs.v[instr.y];
}

void InstructionSetImpl::ExecuteAndInstr(CPUBase &cpu, const DecodedInstruction &instr) {
    auto &regs = cpu.GetRegisters();
    regs.v[instr.x] &= regs.v[instr.y];
}

void InstructionSetImpl::ExecuteXorInstr(CPUBase &cpu, const DecodedInstruction &instr) {
    auto &regs = cpu.GetRegisters();
    regs.v[instr.x] ^= regs.v[instr.y];
}

void InstructionSetImpl::ExecuteAddRegInstr(CPUBase &cpu, const DecodedInstruction &instr) {
    auto &regs = cpu.GetRegisters();
    uint16_t sum = uint16_t(regs.v[instr.x]) + uint16_t(regs.v[instr.y]);
    uint8_t carry = (sum > 0xff) ? 1 : 0;

    regs.v[instr.x] = static_cast<uint8_t>(sum & 0xff);
    regs.v[CHIP8_FLAG_REGISTER] = carry;
}

// VF = 1 when there is NO borrow
void InstructionSetImpl::ExecuteSubInstr(CPUBase &cpu, const DecodedInstruction &instr) {
    auto &regs = cpu.GetRegisters();
    auto numDst = regs.v[instr.x];
    auto numSrc = regs.v[instr.y];
    uint8_t notBorrow = (numDst >= numSrc) ? 1 : 0;

    regs.v[instr.x] = static_cast<uint8_t>(numDst - numSrc);
    regs.v[CHIP8_FLAG_REGISTER] = notBorrow;
}

void InstructionSetImpl::ExecuteShrInstr(CPUBase &cpu, const DecodedInstruction &instr) {
    auto &regs = cpu.GetRegisters();
    auto value = regs.v[instr.x];
    uint8_t lsb = value & 0x01;

    regs.v[instr.x] = static_cast<uint8_t>(value >> 1);
    regs.v[CHIP8_FLAG_REGISTER] = lsb;
}

// Reverse subtract, Vx = Vy - Vx
void InstructionSetImpl::ExecuteSubnInstr(CPUBase &cpu, const DecodedInstruction &instr) {
    auto &regs = cpu.GetRegisters();
    auto numDst = regs.v[instr.x];
    auto numSrc = regs.v[instr.y];
    uint8_t notBorrow = (numSrc >= numDst) ? 1 : 0;

    regs.v[instr.x] = static_cast<uint8_t>(numSrc - numDst);
    regs.v[CHIP8_FLAG_REGISTER] = notBorrow;
}

void InstructionSetImpl::ExecuteShlInstr(CPUBase &cpu, const DecodedInstruction &instr) {
    auto &regs = cpu.GetRegisters();
    auto value = regs.v[instr.x];
    uint8_t msb = (value >> 7) & 0x01;

    regs.v[instr.x] = static_cast<uint8_t>(value << 1);
    regs.v[CHIP8_FLAG_REGISTER] = msb;
}

void InstructionSetImpl::ExecuteRndInstr(CPUBase &cpu, const DecodedInstruction &instr) {
    auto &regs = cpu.GetRegisters();
    regs.v[instr.x] = cpu.GetRandomSource().NextByte() & instr.nn;
}

//
// Index register and memory
//
void InstructionSetImpl::ExecuteLdIndexInstr(CPUBase &cpu, const DecodedInstruction &instr) {
    auto &regs = cpu.GetRegisters();
    regs.index = instr.nnn;
}

// Note: VF is not touched, even if I moves past the 12 bit address space
void InstructionSetImpl::ExecuteAddIndexInstr(CPUBase &cpu, const DecodedInstruction &instr) {
    auto &regs = cpu.GetRegisters();
    regs.index = static_cast<uint16_t>(regs.index + regs.v[instr.x]);
}

void InstructionSetImpl::ExecuteLdFontInstr(CPUBase &cpu, const DecodedInstruction &instr) {
    auto &regs = cpu.GetRegisters();
    regs.index = static_cast<uint16_t>(CHIP8_FONT_ADDRESS + regs.v[instr.x] * CHIP8_FONT_GLYPH_SIZE);
}

bool InstructionSetImpl::ExecuteLdBcdInstr(CPUBase &cpu, const DecodedInstruction &instr) {
    auto &regs = cpu.GetRegisters();
    uint32_t address = regs.index;
    if (!cpu.CheckRamRange(address, 3, true)) {
        return false;
    }
    auto value = regs.v[instr.x];
    return cpu.WriteRam(address, value / 100) &&
           cpu.WriteRam(address + 1, (value / 10) % 10) &&
           cpu.WriteRam(address + 2, value % 10);
}

// V0..Vx (inclusive) to memory at I, I is left unchanged
bool InstructionSetImpl::ExecuteStoreRegsInstr(CPUBase &cpu, const DecodedInstruction &instr) {
    auto &regs = cpu.GetRegisters();
    uint32_t address = regs.index;
    if (!cpu.CheckRamRange(address, size_t(instr.x) + 1, true)) {
        return false;
    }
    for(uint8_t i = 0; i <= instr.x; i++) {
        if (!cpu.WriteRam(address + i, regs.v[i])) {
            return false;
        }
    }
    return true;
}

// V0..Vx (inclusive) from memory at I, I is left unchanged
bool InstructionSetImpl::ExecuteLoadRegsInstr(CPUBase &cpu, const DecodedInstruction &instr) {
    auto &regs = cpu.GetRegisters();
    uint32_t address = regs.index;
    if (!cpu.CheckRamRange(address, size_t(instr.x) + 1, false)) {
        return false;
    }
    for(uint8_t i = 0; i <= instr.x; i++) {
        if (!cpu.ReadRam(address + i, regs.v[i])) {
            return false;
        }
    }
    return true;
}

//
// Timers, keypad and display
//
void InstructionSetImpl::ExecuteLdFromDelayInstr(CPUBase &cpu, const DecodedInstruction &instr) {
    auto &regs = cpu.GetRegisters();
    regs.v[instr.x] = regs.delayTimer;
}

void InstructionSetImpl::ExecuteLdDelayInstr(CPUBase &cpu, const DecodedInstruction &instr) {
    auto &regs = cpu.GetRegisters();
    regs.delayTimer = regs.v[instr.x];
}

void InstructionSetImpl::ExecuteLdSoundInstr(CPUBase &cpu, const DecodedInstruction &instr) {
    auto &regs = cpu.GetRegisters();
    regs.soundTimer = regs.v[instr.x];
}

//
// Wait for key - this doesn't block, if no key is down we rewind the instr. ptr so the next step
// executes this instruction again. The lowest pressed key wins.
//
void InstructionSetImpl::ExecuteWaitKeyInstr(CPUBase &cpu, const DecodedInstruction &instr) {
    auto &regs = cpu.GetRegisters();
    for(uint8_t key = 0; key < CHIP8_NUM_KEYS; key++) {
        if (cpu.IsKeyPressed(key)) {
            regs.v[instr.x] = key;
            return;
        }
    }
    cpu.SetInstrPtr(cpu.GetInstrPtr() - 2);
}

//
// Sprites are 8 pixels wide and 'n' rows high, MSB is the left most pixel.
// The start position wraps to the screen, pixels falling outside wrap around as well.
//
bool InstructionSetImpl::ExecuteDrawInstr(CPUBase &cpu, const DecodedInstruction &instr) {
    auto &regs = cpu.GetRegisters();
    uint32_t address = regs.index;
    if (!cpu.CheckRamRange(address, instr.n, false)) {
        return false;
    }

    auto &framebuffer = cpu.GetFramebuffer();
    int xStart = regs.v[instr.x] % Framebuffer::kWidth;
    int yStart = regs.v[instr.y] % Framebuffer::kHeight;
    bool collision = false;

    for(uint8_t row = 0; row < instr.n; row++) {
        uint8_t spriteByte = 0;
        if (!cpu.ReadRam(address + row, spriteByte)) {
            return false;
        }
        for(int bit = 0; bit < 8; bit++) {
            if (spriteByte & (0x80 >> bit)) {
                if (framebuffer.XorPixel(xStart + bit, yStart + row)) {
                    collision = true;
                }
            }
        }
    }
    regs.v[CHIP8_FLAG_REGISTER] = collision ? 1 : 0;
    return true;
}
