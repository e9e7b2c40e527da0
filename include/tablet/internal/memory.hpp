#pragma once
#include "tablet/internal/vm.h"
#include "tablet/vm_api.h"

/**
 * Core memory helpers used by the engine and public API wrappers.
 *  - Word addressed, 32-bit address space
 *  - Untouched addresses read 0 without allocating
 *  - Pages allocated on first write
 */

tb_u32 tb_mem_read_core(const Vm *vm, tb_u32 addr);
tb_err tb_mem_write_core(Vm *vm, tb_u32 addr, tb_u32 val);
void tb_mem_release_core(Vm *vm);

static inline tb_u32 tb_dir_index(tb_u32 addr)
{
  return addr >> (TB_PAGE_SHIFT + TB_TABLE_BITS);
}

static inline tb_u32 tb_table_index(tb_u32 addr)
{
  return (addr >> TB_PAGE_SHIFT) & (TB_TABLE_SLOTS - 1u);
}

static inline tb_u32 tb_word_index(tb_u32 addr)
{
  return addr & (TB_PAGE_WORDS - 1u);
}
