#pragma once
#include <stddef.h>
#include <stdint.h>

#include "tablet/arena.h"

#ifdef __cplusplus
extern "C"
{
#endif

  /* ------------------------------------------------------------------------- */
  /* Basic typedefs                                                            */
  /* ------------------------------------------------------------------------- */

  /** 32-bit unsigned word. Every memory cell, address and register is one. */
  typedef uint32_t tb_u32;
  /** 8-bit unsigned integer used for display output. */
  typedef uint8_t tb_u8;
  /** Error code type. 0 = OK, negative = error. */
  typedef int tb_err;

  /* Forward declaration for the opaque VM structure. */
  struct Vm;

  /* ------------------------------------------------------------------------- */
  /* Instruction view                                                          */
  /* ------------------------------------------------------------------------- */

  /**
   * @brief One instruction: four consecutive words at pc .. pc+3.
   *
   * Instructions are not stored as a structure in memory; this is a copy
   * fetched by vm_fetch_instr() for inspection.
   */
  typedef struct TbInstr
  {
    tb_u32 op; /**< Opcode word */
    tb_u32 a;  /**< Operand A */
    tb_u32 b;  /**< Operand B */
    tb_u32 c;  /**< Operand C */
  } TbInstr;

  /** Engine state. HALTED and FAULTED are terminal until vm_reset(). */
  typedef enum tb_state_t
  {
    TB_STATE_RUNNING = 0,
    TB_STATE_HALTED = 1,
    TB_STATE_FAULTED = 2,
  } tb_state_t;

  /* ------------------------------------------------------------------------- */
  /* Display and keyboard adapters                                             */
  /* ------------------------------------------------------------------------- */

#define TB_DISPLAY_DEFAULT_BASE 0x100000u
#define TB_DISPLAY_DEFAULT_WIDTH 512u
#define TB_DISPLAY_DEFAULT_HEIGHT 684u

  /**
   * @brief Frame-buffer region rendered by the DRW opcode.
   *
   * Pixels are stored row-major, one word per pixel, starting at `base`.
   * A nonzero word is a lit pixel.
   */
  typedef struct TbDisplay
  {
    tb_u32 base;   /**< Address of the top-left pixel */
    tb_u32 width;  /**< Pixels per row */
    tb_u32 height; /**< Number of rows */
    int border;    /**< Nonzero to frame the output */
  } TbDisplay;

  /**
   * @brief Display refresh callback, invoked by DRW.
   * @param user     User-defined context pointer.
   * @param vm       VM whose memory holds the frame buffer.
   * @param display  Frame-buffer region to render.
   * @return 0 on success, negative error code otherwise (faults the VM).
   */
  typedef tb_err (*tb_draw_fn)(void *user, struct Vm *vm, const TbDisplay *display);

  /**
   * @brief Key poll callback, invoked by KEY.
   *
   * Must not block. Stores the most recent key code since the previous
   * poll, or 0 when no key arrived.
   *
   * @param user  User-defined context pointer.
   * @param out   Output key code.
   * @return 0 on success, negative error code otherwise (faults the VM).
   */
  typedef tb_err (*tb_key_fn)(void *user, tb_u32 *out);

  /**
   * @brief I/O adapter table.
   *
   * A NULL `draw` turns DRW into a no-op; a NULL `key` makes KEY store 0.
   */
  typedef struct TbIo
  {
    tb_draw_fn draw; /**< Display refresh callback (can be NULL) */
    tb_key_fn key;   /**< Key poll callback (can be NULL) */
    void *user;      /**< User data passed to callbacks */
  } TbIo;

  /* ------------------------------------------------------------------------- */
  /* VM configuration                                                          */
  /* ------------------------------------------------------------------------- */

  /**
   * @brief Configuration structure used when creating a VM instance.
   *
   * The VM operates on a sparse 32-bit word-addressed space. Pages are
   * allocated on first write, from `arena` while it has room and from the
   * heap otherwise. The I/O table is copied at creation.
   */
  typedef struct VmConfig
  {
    TbArena *arena;    /**< Optional page pool (can be NULL, uses the heap if NULL) */
    TbDisplay display; /**< Frame-buffer region for DRW */
    const TbIo *io;    /**< Optional I/O adapters (can be NULL) */
  } VmConfig;

  /**
   * @brief Default configuration: no arena, no I/O, 512x684 display at 0x100000.
   */
  VmConfig vm_default_config(void);

  /* ------------------------------------------------------------------------- */
  /* Lifecycle and execution                                                   */
  /* ------------------------------------------------------------------------- */

  /**
   * @brief Create a new VM instance with empty memory and PC = 0.
   * @param cfg  Pointer to a valid VmConfig.
   * @return Pointer to the new VM, or NULL on allocation failure.
   */
  struct Vm *vm_create(const VmConfig *cfg);

  /**
   * @brief Destroy a VM instance and free its pages.
   * @param vm  VM instance to destroy (NULL-safe).
   */
  void vm_destroy(struct Vm *vm);

  /**
   * @brief Reset PC to 0 and state to RUNNING. Memory is preserved.
   * @param vm  VM instance.
   */
  void vm_reset(struct Vm *vm);

  /**
   * @brief Execute exactly one instruction.
   *
   * A HALTED VM does nothing and returns 0. A FAULTED VM returns its fault.
   *
   * @param vm  VM instance.
   * @return 0 on success, negative error code if the instruction faulted.
   */
  tb_err vm_step(struct Vm *vm);

  /**
   * @brief Run until BRK, a fault, a stop request or the step budget.
   *
   * Check vm_state() afterwards to tell a halt from an interrupted run.
   *
   * @param vm         VM instance.
   * @param max_steps  Maximum instructions to execute (0 = unbounded).
   * @return 0 unless an instruction faulted, negative error code otherwise.
   */
  tb_err vm_run(struct Vm *vm, uint64_t max_steps);

  /**
   * @brief Ask vm_run() to return at the next instruction boundary.
   * @param vm  VM instance.
   */
  void vm_request_stop(struct Vm *vm);

  /* ------------------------------------------------------------------------- */
  /* State inspection                                                          */
  /* ------------------------------------------------------------------------- */

  tb_state_t vm_state(const struct Vm *vm);
  tb_u32 vm_pc(const struct Vm *vm);
  void vm_set_pc(struct Vm *vm, tb_u32 pc);

  /** @brief Last error recorded by the engine or a memory access (0 = OK). */
  tb_err vm_last_err(const struct Vm *vm);

  /** @brief Instructions executed since the last reset. */
  uint64_t vm_steps(const struct Vm *vm);

  /**
   * @brief Copy the four words at addr .. addr+3.
   * @param vm    VM instance.
   * @param addr  Address of the opcode word.
   * @param out   Output instruction.
   * @return 0 on success, negative error code on invalid arguments.
   */
  tb_err vm_fetch_instr(struct Vm *vm, tb_u32 addr, TbInstr *out);

  /* ------------------------------------------------------------------------- */
  /* Memory access                                                             */
  /* ------------------------------------------------------------------------- */

  /**
   * @brief Read a word. Never-written addresses read 0.
   *
   * Reading never allocates.
   *
   * @param vm    VM instance.
   * @param addr  Word address.
   * @param out   Output value pointer.
   * @return 0 on success, negative error code on invalid arguments.
   */
  tb_err vm_mem_read32(const struct Vm *vm, tb_u32 addr, tb_u32 *out);

  /**
   * @brief Write a word, allocating its page on first touch.
   *
   * @param vm    VM instance.
   * @param addr  Word address.
   * @param val   Value to store.
   * @return 0 on success, -3 (OutOfMemory) if the host cannot supply a page.
   */
  tb_err vm_mem_write32(struct Vm *vm, tb_u32 addr, tb_u32 val);

  /**
   * @brief Release every page. All addresses read 0 afterwards.
   * @param vm  VM instance.
   */
  void vm_mem_clear(struct Vm *vm);

  /** @brief Number of pages currently allocated. */
  size_t vm_mem_page_count(const struct Vm *vm);

  /**
   * @brief Replace memory with `count` words starting at address 0 and reset.
   * @param vm     VM instance.
   * @param words  Image words (can be NULL when count is 0).
   * @param count  Number of words.
   * @return 0 on success, negative error code otherwise.
   */
  tb_err vm_load_image(struct Vm *vm, const tb_u32 *words, size_t count);

  /* ------------------------------------------------------------------------- */
  /* Version                                                                   */
  /* ------------------------------------------------------------------------- */

  /**
   * @brief Get the current version of the VM.
   * @return Version number as an integer.
   */
  int tb_vm_version(void);

  /* ------------------------------------------------------------------------- */
  /* Error handling notes                                                      */
  /* ------------------------------------------------------------------------- */
  /**
   * All public APIs return 0 on success and a negative tb_err on failure.
   * Errors are defined in `errors.def` and generated into `errors.h/hpp`.
   *
   * Examples:
   *  -  -1 = Unknown opcode
   *  -  -2 = Division by zero
   *  - -20 = Undefined label
   *
   * Exceptions are never thrown across this API.
   * Error propagation is done purely via return values.
   */

  /* ------------------------------------------------------------------------- */

#ifdef __cplusplus
} /* extern "C" */
#endif
