// src/memory.cpp: sparse page table, core accessors and public memory API
#include "tablet/internal/memory.hpp"  // page table index helpers + prototypes

#include <stdlib.h>
#include <string.h>

#include "tablet/errors.hpp"
#include "tablet/internal/vm.h"
#include "tablet/vm_api.h"

/* ---- page lookup ---- */
static inline TbPage *find_page(const Vm *vm, tb_u32 addr)
{
  const TbPageTable *t = vm->dir[tb_dir_index(addr)];
  if (!t)
    return nullptr;
  return t->pages[tb_table_index(addr)];
}

static TbPage *alloc_page(Vm *vm)
{
  // Arena first; fall back to the heap once it is exhausted.
  if (vm->arena)
  {
    void *p = tb_arena_alloc(vm->arena, sizeof(TbPage), alignof(TbPage));
    if (p)
    {
      TbPage *page = static_cast<TbPage *>(p);
      ::memset(page, 0, sizeof(TbPage));
      page->from_arena = 1;
      return page;
    }
  }
  return static_cast<TbPage *>(::calloc(1, sizeof(TbPage)));
}

/* ---- core accessors (used by VM ops and public API) ---- */
tb_u32 tb_mem_read_core(const Vm *vm, tb_u32 addr)
{
  const TbPage *page = find_page(vm, addr);
  return page ? page->words[tb_word_index(addr)] : 0u;
}

tb_err tb_mem_write_core(Vm *vm, tb_u32 addr, tb_u32 val)
{
  TbPageTable *&t = vm->dir[tb_dir_index(addr)];
  if (!t)
  {
    // Storing zero into untouched memory is a no-op.
    if (val == 0)
      return TB_ERR(OK);
    t = static_cast<TbPageTable *>(::calloc(1, sizeof(TbPageTable)));
    if (!t)
      return TB_ERR(OutOfMemory);
  }

  TbPage *&page = t->pages[tb_table_index(addr)];
  if (!page)
  {
    if (val == 0)
      return TB_ERR(OK);
    page = alloc_page(vm);
    if (!page)
      return TB_ERR(OutOfMemory);
    ++vm->page_count;
  }

  page->words[tb_word_index(addr)] = val;
  return TB_ERR(OK);
}

void tb_mem_release_core(Vm *vm)
{
  for (tb_u32 d = 0; d < TB_DIR_SLOTS; ++d)
  {
    TbPageTable *t = vm->dir[d];
    if (!t)
      continue;
    for (tb_u32 i = 0; i < TB_TABLE_SLOTS; ++i)
    {
      TbPage *page = t->pages[i];
      // Arena pages are reclaimed by the arena owner (tb_arena_reset)
      if (page && !page->from_arena)
        ::free(page);
    }
    ::free(t);
    vm->dir[d] = nullptr;
  }
  vm->page_count = 0;
}

/* ---- public API: direct memory access (for tests/embedding) ---- */
extern "C" tb_err vm_mem_read32(const struct Vm *vm, tb_u32 addr, tb_u32 *out)
{
  if (!vm || !out)
    return TB_ERR(InvalidArg);
  *out = tb_mem_read_core(vm, addr);
  return TB_ERR(OK);
}

extern "C" tb_err vm_mem_write32(struct Vm *vm, tb_u32 addr, tb_u32 val)
{
  if (!vm)
    return TB_ERR(InvalidArg);
  tb_err e = tb_mem_write_core(vm, addr, val);
  if (e)
    vm->last_err = e;
  return e;
}

extern "C" void vm_mem_clear(struct Vm *vm)
{
  if (!vm)
    return;
  tb_mem_release_core(vm);
}

extern "C" size_t vm_mem_page_count(const struct Vm *vm)
{
  return vm ? vm->page_count : 0;
}

extern "C" tb_err vm_load_image(struct Vm *vm, const tb_u32 *words, size_t count)
{
  if (!vm || (!words && count > 0))
    return TB_ERR(InvalidArg);

  tb_mem_release_core(vm);
  for (size_t i = 0; i < count; ++i)
  {
    if (tb_err e = tb_mem_write_core(vm, static_cast<tb_u32>(i), words[i]))
    {
      tb_mem_release_core(vm);
      vm->last_err = e;
      return e;
    }
  }

  vm_reset(vm);
  return TB_ERR(OK);
}

/* ---- public API: lifecycle ---- */
extern "C" VmConfig vm_default_config(void)
{
  VmConfig cfg;
  ::memset(&cfg, 0, sizeof(cfg));
  cfg.display.base = TB_DISPLAY_DEFAULT_BASE;
  cfg.display.width = TB_DISPLAY_DEFAULT_WIDTH;
  cfg.display.height = TB_DISPLAY_DEFAULT_HEIGHT;
  cfg.display.border = 0;
  return cfg;
}

extern "C" struct Vm *vm_create(const VmConfig *cfg)
{
  if (!cfg)
    return nullptr;
  Vm *vm = (Vm *)::calloc(1, sizeof(Vm));
  if (!vm)
    return nullptr;

  // Memory config
  vm->arena = cfg->arena;
  vm->page_count = 0;

  // Peripherals
  vm->display = cfg->display;
  if (cfg->io)
    vm->io = *cfg->io;

  vm_reset(vm);  // declared in vm_api.h / defined in core.cpp
  return vm;
}

extern "C" void vm_destroy(struct Vm *vm)
{
  if (!vm)
    return;

  tb_mem_release_core(vm);
  ::free(vm);
}
