#include "tablet/disasm.h"

#include <stdio.h>

#include "tablet/errors.hpp"
#include "tablet/opcodes.hpp"

extern "C" const char* tb_op_mnemonic(tb_u32 op)
{
  if (op >= tablet::kOpcodeCount)
    return nullptr;
  return tablet::kOpcodeTable[op].mnemonic;
}

extern "C" int tb_disasm(const TbInstr* instr, char* buf, size_t cap)
{
  if (!instr || (!buf && cap > 0))
    return TB_ERR(InvalidArg);

  const char* name = tb_op_mnemonic(instr->op);
  int n;
  if (name)
    n = snprintf(buf, cap, "%s %x %x %x", name, instr->a, instr->b, instr->c);
  else
    n = snprintf(buf, cap, "0%x %x %x %x", instr->op, instr->a, instr->b, instr->c);

  return n < 0 ? TB_ERR(InvalidArg) : n;
}
