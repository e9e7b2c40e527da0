/**
 * @file vm_api.hpp
 * @brief Tablet VM C++ API wrapper
 *
 * SPDX-License-Identifier: MIT OR Apache-2.0
 */

#pragma once

#include "tablet/opcodes.h"
#include "tablet/opcodes.hpp"
#include "tablet/vm_api.h"

namespace tablet
{

/**
 * @brief Human readable engine state
 * @param s  State value
 * @return "running", "halted" or "faulted"
 */
inline const char *state_str(tb_state_t s)
{
  switch (s)
  {
    case TB_STATE_RUNNING:
      return "running";
    case TB_STATE_HALTED:
      return "halted";
    case TB_STATE_FAULTED:
      return "faulted";
    default:
      return "unknown";
  }
}

/**
 * @brief C++ wrapper for instruction accessors
 */
class Instr
{
public:
  /**
   * @brief Check whether the opcode word names a defined opcode
   * @param instr  Instruction view
   * @return true if 0 <= op <= 16
   */
  static bool is_valid(const TbInstr &instr)
  {
    return instr.op < TB_OP_COUNT;
  }

  /**
   * @brief Get the typed opcode
   * @param instr  Instruction view (must be valid)
   * @return Opcode
   */
  static Op opcode(const TbInstr &instr)
  {
    return static_cast<Op>(instr.op);
  }

  /**
   * @brief Fetch the instruction at an address
   * @param vm    VM instance
   * @param addr  Address of the opcode word
   * @return Instruction view (all zero on error)
   */
  static TbInstr at(struct ::Vm *vm, tb_u32 addr)
  {
    TbInstr instr{};
    if (vm_fetch_instr(vm, addr, &instr) != 0)
      return TbInstr{};
    return instr;
  }
};

}  // namespace tablet
