//
// Created by the chip8vm authors on 19.10.26.
//

//
// Maps an instruction word to an instruction code.
// The top nibble selects the family, families 0x0, 0x5, 0x8, 0x9, 0xE and 0xF need a second look
// at the low nibble/byte to pick the instruction.
//
#include "fmt/format.h"

#include "InstructionDecoder.h"

using namespace chip8vm;
using namespace chip8vm::core;

std::optional<DecodedInstruction> InstructionDecoder::Decode(uint16_t opCode) {
    std::optional<InstrCode> code = {};

    switch(opcode::Kind(opCode)) {
        case 0x0 :
            code = DecodeSystem(opCode);
            break;
        case 0x1 :
            code = InstrCode::JP;
            break;
        case 0x2 :
            code = InstrCode::CALL;
            break;
        case 0x3 :
            code = InstrCode::SE_VX_KK;
            break;
        case 0x4 :
            code = InstrCode::SNE_VX_KK;
            break;
        case 0x5 :
            if (opcode::N(opCode) == 0) {
                code = InstrCode::SE_VX_VY;
            }
            break;
        case 0x6 :
            code = InstrCode::LD_VX_KK;
            break;
        case 0x7 :
            code = InstrCode::ADD_VX_KK;
            break;
        case 0x8 :
            code = DecodeArithmetic(opCode);
            break;
        case 0x9 :
            if (opcode::N(opCode) == 0) {
                code = InstrCode::SNE_VX_VY;
            }
            break;
        case 0xA :
            code = InstrCode::LD_I;
            break;
        case 0xB :
            code = InstrCode::JP_V0;
            break;
        case 0xC :
            code = InstrCode::RND;
            break;
        case 0xD :
            code = InstrCode::DRW;
            break;
        case 0xE :
            code = DecodeKeypad(opCode);
            break;
        case 0xF :
            code = DecodeMisc(opCode);
            break;
    }

    if (!code.has_value()) {
        return {};
    }

    DecodedInstruction instr = {
        .opCode = opCode,
        .code = *code,
        .x = opcode::X(opCode),
        .y = opcode::Y(opCode),
        .n = opcode::N(opCode),
        .nn = opcode::NN(opCode),
        .nnn = opcode::NNN(opCode),
    };
    return instr;
}

// 00E0 and 00EE, anything else in this family is the machine code call (0nnn) which we can't emulate
std::optional<InstrCode> InstructionDecoder::DecodeSystem(uint16_t opCode) {
    switch(opCode) {
        case 0x00E0 :
            return InstrCode::CLS;
        case 0x00EE :
            return InstrCode::RET;
    }
    return {};
}

std::optional<InstrCode> InstructionDecoder::DecodeArithmetic(uint16_t opCode) {
    switch(opcode::N(opCode)) {
        case 0x0 :
            return InstrCode::LD_VX_VY;
        case 0x1 :
            return InstrCode::OR;
        case 0x2 :
            return InstrCode::AND;
        case 0x3 :
            return InstrCode::XOR;
        case 0x4 :
            return InstrCode::ADD_VX_VY;
        case 0x5 :
            return InstrCode::SUB;
        case 0x6 :
            return InstrCode::SHR;
        case 0x7 :
            return InstrCode::SUBN;
        case 0xE :
            return InstrCode::SHL;
    }
    return {};
}

std::optional<InstrCode> InstructionDecoder::DecodeKeypad(uint16_t opCode) {
    switch(opcode::NN(opCode)) {
        case 0x9E :
            return InstrCode::SKP;
        case 0xA1 :
            return InstrCode::SKNP;
    }
    return {};
}

std::optional<InstrCode> InstructionDecoder::DecodeMisc(uint16_t opCode) {
    switch(opcode::NN(opCode)) {
        case 0x07 :
            return InstrCode::LD_VX_DT;
        case 0x0A :
            return InstrCode::LD_VX_K;
        case 0x15 :
            return InstrCode::LD_DT_VX;
        case 0x18 :
            return InstrCode::LD_ST_VX;
        case 0x1E :
            return InstrCode::ADD_I_VX;
        case 0x29 :
            return InstrCode::LD_F_VX;
        case 0x33 :
            return InstrCode::LD_B_VX;
        case 0x55 :
            return InstrCode::LD_MEM_VX;
        case 0x65 :
            return InstrCode::LD_VX_MEM;
    }
    return {};
}

std::string InstructionDecoder::ToString(const DecodedInstruction &instr) {
    auto desc = InstructionSetDef::GetDescription(instr.code);
    if (!desc.has_value()) {
        return fmt::format("{:04X}  invalid", instr.opCode);
    }

    // Operands are listed in the order they appear in the pattern
    std::string operands;
    auto &pattern = desc->pattern;
    auto append = [&operands](const std::string &str) {
        if (!operands.empty()) {
            operands += ", ";
        }
        operands += str;
    };
    if (pattern.find('x') != std::string::npos) {
        append(fmt::format("v{:x}", instr.x));
    }
    if (pattern.find('y') != std::string::npos) {
        append(fmt::format("v{:x}", instr.y));
    }
    if (pattern.find("nnn") != std::string::npos) {
        append(fmt::format("0x{:03x}", instr.nnn));
    } else if (pattern.find("kk") != std::string::npos) {
        append(fmt::format("0x{:02x}", instr.nn));
    } else if (pattern.back() == 'n') {
        append(fmt::format("{}", instr.n));
    }

    if (operands.empty()) {
        return fmt::format("{:04X}  {}", instr.opCode, desc->name);
    }
    return fmt::format("{:04X}  {:<8}{}", instr.opCode, desc->name, operands);
}
