#pragma once
#include <cstdint>

namespace tablet
{

/** Opcode set (one 32-bit word). */
enum class Op : std::uint32_t
{
#define OP(name, val, _) name = val,
#include <tablet/opcodes.def>
#undef OP
};

// -----------------------------------------------------------------------------
// Mnemonic table for assembler/disassembler table-driven lookup
// -----------------------------------------------------------------------------
struct OpcodeEntry
{
  const char* mnemonic;
  uint32_t opcode;
};

static constexpr OpcodeEntry kOpcodeTable[] = {
#define OP(name, val, mnemonic) {#mnemonic, val},
#include <tablet/opcodes.def>
#undef OP
};

static constexpr uint32_t kOpcodeCount = sizeof(kOpcodeTable) / sizeof(kOpcodeTable[0]);

// -----------------------------------------------------------------------------
// Assembler macro table (auto-generated from macros.def)
// -----------------------------------------------------------------------------
enum class Macro : uint8_t
{
#define MACRO(name, mnemonic, insns, operands) name,
#include <tablet/macros.def>
#undef MACRO
};

struct MacroEntry
{
  const char* mnemonic;
  Macro macro;
  uint8_t instructions;  // expansion length in instructions
  uint8_t operands;      // maximum written operands
};

static constexpr MacroEntry kMacroTable[] = {
#define MACRO(name, mnemonic, insns, operands) {#mnemonic, Macro::name, insns, operands},
#include <tablet/macros.def>
#undef MACRO
};

}  // namespace tablet
