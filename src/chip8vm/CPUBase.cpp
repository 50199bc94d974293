//
// Created by the chip8vm authors on 19.10.26.
//

#include <string.h>
#include "fmt/format.h"
#include "CPUBase.h"
#include "Opcode.h"

using namespace chip8vm;
using namespace chip8vm::core;

// Hex digit glyphs 0..F, 4 pixels wide (high nibble) and 5 rows
static const uint8_t fontGlyphs[16 * CHIP8_FONT_GLYPH_SIZE] = {
    0xF0, 0x90, 0x90, 0x90, 0xF0, // 0
    0x20, 0x60, 0x20, 0x20, 0x70, // 1
    0xF0, 0x10, 0xF0, 0x80, 0xF0, // 2
    0xF0, 0x10, 0xF0, 0x10, 0xF0, // 3
    0x90, 0x90, 0xF0, 0x10, 0x10, // 4
    0xF0, 0x80, 0xF0, 0x10, 0xF0, // 5
    0xF0, 0x80, 0xF0, 0x90, 0xF0, // 6
    0xF0, 0x10, 0x20, 0x40, 0x40, // 7
    0xF0, 0x90, 0xF0, 0x90, 0xF0, // 8
    0xF0, 0x90, 0xF0, 0x10, 0xF0, // 9
    0xF0, 0x90, 0xF0, 0x90, 0x90, // A
    0xE0, 0x90, 0xE0, 0x90, 0xE0, // B
    0xF0, 0x80, 0x80, 0x80, 0xF0, // C
    0xE0, 0x90, 0x90, 0x90, 0xE0, // D
    0xF0, 0x80, 0xF0, 0x80, 0xF0, // E
    0xF0, 0x80, 0xF0, 0x80, 0x80, // F
};

const char *chip8vm::core::FaultToString(CPUFault fault) {
    switch(fault) {
        case CPUFault::None :
            return "none";
        case CPUFault::RomTooLarge :
            return "rom too large";
        case CPUFault::TruncatedSource :
            return "truncated source";
        case CPUFault::UnknownOpcode :
            return "unknown opcode";
        case CPUFault::StackOverflow :
            return "stack overflow";
        case CPUFault::StackUnderflow :
            return "stack underflow";
        case CPUFault::OutOfBounds :
            return "out of bounds";
    }
    return "unknown fault";
}

CPUBase::CPUBase() {
    randomSource = DefaultRandomSource::Create();
    Reset();
}

void CPUBase::Reset() {
    ram.fill(0);
    registers = {};
    stack.fill(0);
    keypad.fill(false);
    framebuffer.Clear();
    framebuffer.ClearDirty();

    memcpy(&ram[CHIP8_FONT_ADDRESS], fontGlyphs, sizeof(fontGlyphs));

    registers.instrPointer = CHIP8_PROGRAM_ADDRESS;
    currentInstrAddr = 0;
    currentOpCode = 0;
    lastFault = CPUFault::None;
}

bool CPUBase::LoadRom(const uint8_t *ptrData, size_t szData) {
    if (szData > CHIP8_MAX_ROM_SIZE) {
        fmt::print(stderr, "CPUBase, ROM size {} exceeds maximum {}\n", szData, CHIP8_MAX_ROM_SIZE);
        return RaiseFault(CPUFault::RomTooLarge);
    }
    if (szData > 0) {
        memcpy(&ram[CHIP8_PROGRAM_ADDRESS], ptrData, szData);
    }
    return true;
}

void CPUBase::TickTimers() {
    if (registers.delayTimer > 0) {
        registers.delayTimer--;
    }
    if (registers.soundTimer > 0) {
        registers.soundTimer--;
    }
}

bool CPUBase::SetKey(uint8_t key, bool isPressed) {
    if (key >= CHIP8_NUM_KEYS) {
        return false;
    }
    keypad[key] = isPressed;
    return true;
}

void CPUBase::ReleaseAllKeys() {
    keypad.fill(false);
}

bool CPUBase::IsKeyPressed(uint8_t key) const {
    if (key >= CHIP8_NUM_KEYS) {
        return false;
    }
    return keypad[key];
}

void CPUBase::SetRandomSource(RandomSource::Ref newRandomSource) {
    if (newRandomSource == nullptr) {
        return;
    }
    randomSource = newRandomSource;
}

bool CPUBase::RaiseFault(CPUFault fault) {
    lastFault = fault;
    fmt::print(stderr, "CPUBase, fault '{}' at pc={:#05x} opcode={:04X}\n", FaultToString(fault), currentInstrAddr, currentOpCode);
    return false;
}

bool CPUBase::CheckRamRange(uint32_t address, size_t szRange, bool forWrite) {
    if ((address + szRange) > ram.size()) {
        fmt::print(stderr, "CPUBase, range {:#x}+{} exceeds memory\n", address, szRange);
        return RaiseFault(CPUFault::OutOfBounds);
    }
    if (forWrite && (szRange > 0) && (address < CHIP8_FONT_END) && ((address + szRange) > CHIP8_FONT_ADDRESS)) {
        fmt::print(stderr, "CPUBase, write {:#x}+{} overlaps font area\n", address, szRange);
        return RaiseFault(CPUFault::OutOfBounds);
    }
    return true;
}

bool CPUBase::ReadRam(uint32_t address, uint8_t &outValue) {
    if (!CheckRamRange(address, 1, false)) {
        return false;
    }
    outValue = ram[address];
    return true;
}

bool CPUBase::WriteRam(uint32_t address, uint8_t value) {
    if (!CheckRamRange(address, 1, true)) {
        return false;
    }
    ram[address] = value;
    return true;
}

bool CPUBase::FetchOpCode(uint16_t &outOpCode) {
    auto address = registers.instrPointer;
    uint8_t hi = 0, lo = 0;
    if (!ReadRam(address, hi) || !ReadRam(uint32_t(address) + 1, lo)) {
        return false;
    }
    outOpCode = opcode::FromBytes(hi, lo);
    return true;
}

bool CPUBase::PushReturnAddress(uint16_t address) {
    if (registers.stackPointer >= CHIP8_STACK_DEPTH) {
        return RaiseFault(CPUFault::StackOverflow);
    }
    stack[registers.stackPointer] = address;
    registers.stackPointer++;
    return true;
}

bool CPUBase::PopReturnAddress(uint16_t &outAddress) {
    if (registers.stackPointer == 0) {
        return RaiseFault(CPUFault::StackUnderflow);
    }
    registers.stackPointer--;
    outAddress = stack[registers.stackPointer];
    return true;
}
