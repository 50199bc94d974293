//
// Created by the chip8vm authors on 19.10.26.
//

//
// This defines the instruction set - name and opcode pattern for each instruction.
// The names follow the classic Cowgod mnemonics, they are only used for tracing.
//
#include <unordered_map>
#include <optional>
#include "InstructionSetDef.h"

using namespace chip8vm;
using namespace chip8vm::core;

static std::unordered_map<InstrCode, InstrDescription> instructionSet = {
    {InstrCode::CLS,        {.name="cls",       .pattern="00E0"}},
    {InstrCode::RET,        {.name="ret",       .pattern="00EE"}},
    {InstrCode::JP,         {.name="jp",        .pattern="1nnn"}},
    {InstrCode::CALL,       {.name="call",      .pattern="2nnn"}},
    {InstrCode::SE_VX_KK,   {.name="se",        .pattern="3xkk"}},
    {InstrCode::SNE_VX_KK,  {.name="sne",       .pattern="4xkk"}},
    {InstrCode::SE_VX_VY,   {.name="se.r",      .pattern="5xy0"}},
    {InstrCode::LD_VX_KK,   {.name="ld",        .pattern="6xkk"}},
    {InstrCode::ADD_VX_KK,  {.name="add",       .pattern="7xkk"}},
    {InstrCode::LD_VX_VY,   {.name="ld.r",      .pattern="8xy0"}},
    {InstrCode::OR,         {.name="or",        .pattern="8xy1"}},
    {InstrCode::AND,        {.name="and",       .pattern="8xy2"}},
    {InstrCode::XOR,        {.name="xor",       .pattern="8xy3"}},
    {InstrCode::ADD_VX_VY,  {.name="add.r",     .pattern="8xy4"}},
    {InstrCode::SUB,        {.name="sub",       .pattern="8xy5"}},
    {InstrCode::SHR,        {.name="shr",       .pattern="8xy6"}},
    {InstrCode::SUBN,       {.name="subn",      .pattern="8xy7"}},
    {InstrCode::SHL,        {.name="shl",       .pattern="8xyE"}},
    {InstrCode::SNE_VX_VY,  {.name="sne.r",     .pattern="9xy0"}},
    {InstrCode::LD_I,       {.name="ld.i",      .pattern="Annn"}},
    {InstrCode::JP_V0,      {.name="jp.v0",     .pattern="Bnnn"}},
    {InstrCode::RND,        {.name="rnd",       .pattern="Cxkk"}},
    {InstrCode::DRW,        {.name="drw",       .pattern="Dxyn"}},
    {InstrCode::SKP,        {.name="skp",       .pattern="Ex9E"}},
    {InstrCode::SKNP,       {.name="sknp",      .pattern="ExA1"}},
    {InstrCode::LD_VX_DT,   {.name="ld.dt",     .pattern="Fx07"}},
    {InstrCode::LD_VX_K,    {.name="ld.k",      .pattern="Fx0A"}},
    {InstrCode::LD_DT_VX,   {.name="st.dt",     .pattern="Fx15"}},
    {InstrCode::LD_ST_VX,   {.name="st.st",     .pattern="Fx18"}},
    {InstrCode::ADD_I_VX,   {.name="add.i",     .pattern="Fx1E"}},
    {InstrCode::LD_F_VX,    {.name="ld.f",      .pattern="Fx29"}},
    {InstrCode::LD_B_VX,    {.name="ld.b",      .pattern="Fx33"}},
    {InstrCode::LD_MEM_VX,  {.name="st.mem",    .pattern="Fx55"}},
    {InstrCode::LD_VX_MEM,  {.name="ld.mem",    .pattern="Fx65"}},
};

const std::unordered_map<InstrCode, InstrDescription> &InstructionSetDef::GetInstructionSet() {
    return instructionSet;
}

std::optional<InstrDescription> InstructionSetDef::GetDescription(InstrCode code) {
    if (!instructionSet.contains(code)) {
        return {};
    }
    return instructionSet.at(code);
}
