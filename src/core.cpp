#include <cstdint>

#include "tablet/errors.hpp"
#include "tablet/internal/memory.hpp"
#include "tablet/internal/vm.h"
#include "tablet/opcodes.hpp"
#include "tablet/panic.h"
#include "tablet/vm_api.h"

extern "C" int tb_vm_version(void)
{
  return 0;
}

extern "C" void vm_reset(Vm* vm)
{
  if (!vm)
    return;

  vm->pc = 0;
  vm->state = TB_STATE_RUNNING;
  vm->last_err = 0;
  vm->steps = 0;
  vm->stop_requested = 0;
}

/* ============================ Memory helpers ============================= */

static inline tb_u32 ld(const Vm* vm, tb_u32 addr)
{
  return tb_mem_read_core(vm, addr);
}

static inline tb_err st(Vm* vm, tb_u32 addr, tb_u32 val)
{
  return tb_mem_write_core(vm, addr, val);
}

/* ============================ Fault handling ============================= */

// PC is left on the faulting instruction so the report names it.
static tb_err fault(Vm* vm, tb_err e)
{
  vm->state = TB_STATE_FAULTED;
  vm->last_err = e;
  return vm_panic(vm, e);
}

/* ====================== Fetch / decode / execute ========================= */

extern "C" tb_err vm_step(Vm* vm)
{
  if (!vm)
    return TB_ERR(InvalidArg);
  if (vm->state == TB_STATE_HALTED)
    return TB_ERR(OK);
  if (vm->state == TB_STATE_FAULTED)
    return vm->last_err;

  const tb_u32 pc = vm->pc;
  const tb_u32 op = ld(vm, pc);
  const tb_u32 a = ld(vm, pc + 1u);
  const tb_u32 b = ld(vm, pc + 2u);
  const tb_u32 c = ld(vm, pc + 3u);

  tb_u32 next = pc + 4u;
  tb_err err = TB_ERR(OK);

  switch (static_cast<tablet::Op>(op))
  {
    /* -------- Control -------- */
    case tablet::Op::BRK:
      vm->state = TB_STATE_HALTED;
      next = pc;
      break;

    case tablet::Op::LPC:
      next = ld(vm, a);
      break;

    case tablet::Op::BEQ:
      if (ld(vm, b) == 0)
        next = ld(vm, a);
      break;

    case tablet::Op::SPC:
      err = st(vm, a, pc);
      break;

    /* -------- Moves -------- */
    case tablet::Op::LEA:
      err = st(vm, a, ld(vm, b));
      break;

    case tablet::Op::LRA:
      err = st(vm, a, ld(vm, ld(vm, b)));
      break;

    case tablet::Op::SRA:
      err = st(vm, ld(vm, b), ld(vm, a));
      break;

    /* -------- Arithmetic (wrapping, unsigned) -------- */
    case tablet::Op::ADD:
      err = st(vm, a, ld(vm, b) + ld(vm, c));
      break;

    case tablet::Op::SUB:
      err = st(vm, a, ld(vm, b) - ld(vm, c));
      break;

    case tablet::Op::MUL:
      err = st(vm, a, ld(vm, b) * ld(vm, c));
      break;

    case tablet::Op::DIV:
    {
      tb_u32 divisor = ld(vm, c);
      if (divisor == 0)
        return fault(vm, TB_ERR(DivByZero));
      err = st(vm, a, ld(vm, b) / divisor);
      break;
    }

    case tablet::Op::MOD:
    {
      tb_u32 divisor = ld(vm, c);
      if (divisor == 0)
        return fault(vm, TB_ERR(DivByZero));
      err = st(vm, a, ld(vm, b) % divisor);
      break;
    }

    /* -------- Comparison / logic -------- */
    case tablet::Op::CMP:
      err = st(vm, a, ld(vm, b) < ld(vm, c) ? 1u : 0u);
      break;

    case tablet::Op::NAD:
      err = st(vm, a, ~(ld(vm, b) & ld(vm, c)));
      break;

    /* -------- I/O -------- */
    case tablet::Op::DRW:
      if (vm->io.draw && vm->display.width && vm->display.height)
        err = vm->io.draw(vm->io.user, vm, &vm->display);
      break;

    case tablet::Op::KEY:
    {
      tb_u32 key = 0;
      if (vm->io.key)
        err = vm->io.key(vm->io.user, &key);
      if (!err)
        err = st(vm, a, key);
      break;
    }

    case tablet::Op::NOP:
      break;

    default:
      return fault(vm, TB_ERR(UnknownOp));
  }

  if (err)
    return fault(vm, err);

  vm->pc = next;
  vm->steps++;
  return TB_ERR(OK);
}

extern "C" tb_err vm_run(Vm* vm, uint64_t max_steps)
{
  if (!vm)
    return TB_ERR(InvalidArg);

  uint64_t executed = 0;
  while (vm->state == TB_STATE_RUNNING)
  {
    // Cancellation is observed only between instructions
    if (vm->stop_requested)
    {
      vm->stop_requested = 0;
      break;
    }
    if (max_steps && executed >= max_steps)
      break;

    if (tb_err e = vm_step(vm))
      return e;
    ++executed;
  }

  return vm->state == TB_STATE_FAULTED ? vm->last_err : TB_ERR(OK);
}

extern "C" void vm_request_stop(Vm* vm)
{
  if (vm)
    vm->stop_requested = 1;
}

/* =========================== State inspection ============================ */

extern "C" tb_state_t vm_state(const Vm* vm)
{
  return vm ? vm->state : TB_STATE_FAULTED;
}

extern "C" tb_u32 vm_pc(const Vm* vm)
{
  return vm ? vm->pc : 0u;
}

extern "C" void vm_set_pc(Vm* vm, tb_u32 pc)
{
  if (vm)
    vm->pc = pc;
}

extern "C" tb_err vm_last_err(const Vm* vm)
{
  return vm ? vm->last_err : TB_ERR(InvalidArg);
}

extern "C" uint64_t vm_steps(const Vm* vm)
{
  return vm ? vm->steps : 0;
}

extern "C" tb_err vm_fetch_instr(Vm* vm, tb_u32 addr, TbInstr* out)
{
  if (!vm || !out)
    return TB_ERR(InvalidArg);

  out->op = ld(vm, addr);
  out->a = ld(vm, addr + 1u);
  out->b = ld(vm, addr + 2u);
  out->c = ld(vm, addr + 3u);
  return TB_ERR(OK);
}
