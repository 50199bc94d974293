//
// Created by the chip8vm authors on 19.10.26.
//
#include <stdint.h>
#include <testinterface.h>

#include "Opcode.h"

using namespace chip8vm;
using namespace chip8vm::core;

extern "C" {
    DLL_EXPORT int test_opcode(ITesting *t);
    DLL_EXPORT int test_opcode_fields(ITesting *t);
    DLL_EXPORT int test_opcode_frombytes(ITesting *t);
    DLL_EXPORT int test_opcode_extremes(ITesting *t);
}

DLL_EXPORT int test_opcode(ITesting *t) {
    return kTR_Pass;
}

DLL_EXPORT int test_opcode_fields(ITesting *t) {
    uint16_t op = 0xD12A;
    TR_ASSERT(t, opcode::Kind(op) == 0x0D);
    TR_ASSERT(t, opcode::X(op) == 0x01);
    TR_ASSERT(t, opcode::Y(op) == 0x02);
    TR_ASSERT(t, opcode::N(op) == 0x0A);
    TR_ASSERT(t, opcode::NN(op) == 0x2A);
    TR_ASSERT(t, opcode::NNN(op) == 0x12A);

    // All compile time
    static_assert(opcode::Kind(0x8AB4) == 0x08);
    static_assert(opcode::NNN(0x2FFF) == 0x0FFF);
    return kTR_Pass;
}

DLL_EXPORT int test_opcode_frombytes(ITesting *t) {
    TR_ASSERT(t, opcode::FromBytes(0x12, 0x34) == 0x1234);
    TR_ASSERT(t, opcode::FromBytes(0x00, 0xE0) == 0x00E0);
    TR_ASSERT(t, opcode::FromBytes(0xF0, 0x00) == 0xF000);
    return kTR_Pass;
}

DLL_EXPORT int test_opcode_extremes(ITesting *t) {
    TR_ASSERT(t, opcode::Kind(0x0000) == 0);
    TR_ASSERT(t, opcode::NNN(0x0000) == 0);
    TR_ASSERT(t, opcode::Kind(0xFFFF) == 0x0F);
    TR_ASSERT(t, opcode::X(0xFFFF) == 0x0F);
    TR_ASSERT(t, opcode::Y(0xFFFF) == 0x0F);
    TR_ASSERT(t, opcode::N(0xFFFF) == 0x0F);
    TR_ASSERT(t, opcode::NN(0xFFFF) == 0xFF);
    TR_ASSERT(t, opcode::NNN(0xFFFF) == 0x0FFF);
    return kTR_Pass;
}
