#pragma once
#include <stdint.h>

#include "tablet/panic.h"
#include "tablet/vm_api.h"

#ifdef __cplusplus
extern "C"
{
#endif

  /* Address split: [dir:10][table:10][word:12] */
  enum
  {
    TB_PAGE_SHIFT = 12,
    TB_PAGE_WORDS = 1u << TB_PAGE_SHIFT, /**< Words per page (16 KiB) */
    TB_TABLE_BITS = 10,
    TB_TABLE_SLOTS = 1u << TB_TABLE_BITS, /**< Pages per table */
    TB_DIR_SLOTS = 1u << 10,              /**< Tables per directory */
  };

  /**
   * @brief One page of memory, allocated on first write.
   */
  typedef struct TbPage
  {
    tb_u32 words[TB_PAGE_WORDS];
    int from_arena; /**< Nonzero if carved from VmConfig::arena (not freed) */
  } TbPage;

  /**
   * @brief Second-level table: page pointers for 4 M words.
   */
  typedef struct TbPageTable
  {
    TbPage *pages[TB_TABLE_SLOTS];
  } TbPageTable;

  /**
   * @brief Internal VM structure (not part of the public API).
   *        Visible only for unit tests or tightly coupled components.
   */
  typedef struct Vm
  {
    /* Sparse memory */
    TbPageTable *dir[TB_DIR_SLOTS]; /**< Top-level directory (NULL = untouched) */
    size_t page_count;              /**< Pages currently allocated */
    TbArena *arena;                 /**< Optional page pool (NULL = heap) */

    /* Execution state */
    tb_u32 pc;                   /**< Address of the next opcode word */
    tb_state_t state;            /**< RUNNING / HALTED / FAULTED */
    int last_err;                /**< Last error code (0 = OK) */
    uint64_t steps;              /**< Instructions executed since reset */
    volatile int stop_requested; /**< Set by vm_request_stop() */

    /* Peripherals */
    TbDisplay display; /**< Frame-buffer region for DRW */
    TbIo io;           /**< Display/key adapters (callbacks may be NULL) */

    /* Fault reporting */
    TbPanicHandler panic_handler;
    void *panic_user_data;
  } Vm;

#ifdef __cplusplus
} /* extern "C" */
#endif
