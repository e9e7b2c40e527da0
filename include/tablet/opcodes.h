#pragma once
#include <stdint.h>

#ifdef __cplusplus
extern "C"
{
#endif

  /** @file
   *  @brief Opcode set for C.
   *
   *  One 32-bit word per opcode, followed by three 32-bit operand words.
   *  Keep numeric values stable once published.
   */

  typedef enum tb_op_t
  {
#define OP(name, val, _) TB_OP_##name = val,
#include <tablet/opcodes.def>
#undef OP
  } tb_op_t;

/** Number of defined opcodes. Valid opcodes are 0 .. TB_OP_COUNT-1. */
#define TB_OP_COUNT 17u

#ifdef __cplusplus
}  // extern "C"
#endif
