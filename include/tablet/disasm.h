#pragma once
#include <stddef.h>

#include "tablet/vm_api.h"

#ifdef __cplusplus
extern "C"
{
#endif

  /**
   * @brief Three-letter mnemonic for an opcode.
   * @param op  Opcode word.
   * @return Mnemonic, or NULL if op is outside 0-16.
   */
  const char *tb_op_mnemonic(tb_u32 op);

  /**
   * @brief Render an instruction as assembler text, e.g. "add 4 9 a".
   *
   * Operands are lowercase hex. An undefined opcode is rendered as a
   * zero-prefixed hex number ("0add", never "add"), so the text always
   * re-assembles to the same four words.
   * Semantics follow snprintf: at most cap-1 characters plus a NUL.
   *
   * @param instr  Instruction to render.
   * @param buf    Output buffer (can be NULL when cap is 0).
   * @param cap    Buffer capacity in bytes.
   * @return Length of the full text, or a negative error code.
   */
  int tb_disasm(const TbInstr *instr, char *buf, size_t cap);

#ifdef __cplusplus
} /* extern "C" */
#endif
