#include "tablet/panic.h"

#include <inttypes.h>
#include <stdio.h>

#include "tablet/disasm.h"
#include "tablet/errors.hpp"
#include "tablet/internal/memory.hpp"
#include "tablet/internal/vm.h"  // For Vm struct definition
#include "tablet/vm_api.h"

extern "C"
{
  void vm_set_panic_handler(struct Vm *vm, TbPanicHandler handler, void *user_data)
  {
    if (!vm)
      return;

    vm->panic_handler = handler;
    vm->panic_user_data = user_data;
  }

  int vm_panic(struct Vm *vm, int error_code)
  {
    if (!vm)
      return error_code;

    // Collect panic information
    TbInstr instr;
    instr.op = tb_mem_read_core(vm, vm->pc);
    instr.a = tb_mem_read_core(vm, vm->pc + 1u);
    instr.b = tb_mem_read_core(vm, vm->pc + 2u);
    instr.c = tb_mem_read_core(vm, vm->pc + 3u);

    TbPanicInfo info;
    info.error_code = error_code;
    info.pc = vm->pc;
    info.opcode = instr.op;
    info.a = instr.a;
    info.b = instr.b;
    info.c = instr.c;
    info.steps = vm->steps;

    char text[64];
    if (tb_disasm(&instr, text, sizeof(text)) < 0)
      text[0] = '\0';

    // Output diagnostic information
    printf("\n");
    printf("========== TABLET PANIC ==========\n");

    // Error information
    Err err = static_cast<Err>(error_code);
    printf("Error: %s (code=%d)\n", err_str(err), error_code);

    // Program Counter and the instruction it names
    printf("PC: 0x%08" PRIX32 "\n", info.pc);
    printf("Instruction: [%08" PRIX32 " %08" PRIX32 " %08" PRIX32 " %08" PRIX32 "] %s\n",
           info.opcode, info.a, info.b, info.c, text);

    printf("Steps: %" PRIu64 "\n", info.steps);

    printf("==================================\n");
    printf("\n");

    // Call custom panic handler if registered
    if (vm->panic_handler)
    {
      vm->panic_handler(vm->panic_user_data, &info);
    }

    return error_code;
  }

}  // extern "C"
