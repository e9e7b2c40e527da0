#pragma once
#include <stddef.h>
#include <stdint.h>

#include "tablet/vm_api.h"

#ifdef __cplusplus
extern "C"
{
#endif

  /**
   * @file assembler.h
   * @brief Two-pass assembler for the tablet instruction set
   *
   * Source syntax, one statement per line:
   *
   *     ; comment to end of line
   *     loop:                 ; label definition
   *       key x               ; mnemonic + up to three operands
   *       sub x x target      ; operands: label, hex literal or /n
   *       beq /1 x exit       ; /n = this instruction's address + 4*n
   *     exit: brk             ; a label may share a line with an instruction
   *
   * Mnemonics are the three-letter opcode names, the macros of macros.def, or
   * a hex number (emitted as a raw word, which is how data is laid out).
   * All numbers are hexadecimal. Missing operands default to 0.
   */

#define TB_ASM_TOKEN_MAX 64
#define TB_ASM_MESSAGE_MAX 160

  /**
   * @brief Assembly diagnostic.
   *
   * On failure `line` is the 1-based source line and `token` the offending
   * token. On success `code` is 0 and `words` the image size.
   */
  typedef struct TbAsmDiag
  {
    tb_err code;                      /**< Error code (0 = OK) */
    int line;                         /**< 1-based line number (0 if none) */
    char token[TB_ASM_TOKEN_MAX];     /**< Offending token (may be empty) */
    char message[TB_ASM_MESSAGE_MAX]; /**< Human readable description */
    tb_u32 words;                     /**< Words emitted on success */
  } TbAsmDiag;

  /**
   * @brief Word sink callback.
   * @param user  User-defined context pointer.
   * @param addr  Address of the word.
   * @param word  Encoded word.
   * @return 0 on success, negative error code to abort.
   */
  typedef tb_err (*tb_asm_emit_fn)(void *user, tb_u32 addr, tb_u32 word);

  /**
   * @brief Assemble source text.
   *
   * Words are handed to `emit` in address order starting at 0, and only
   * after both passes succeeded.
   *
   * @param src   Source text (need not be NUL-terminated).
   * @param len   Length of src in bytes.
   * @param emit  Word sink.
   * @param user  User data passed to emit.
   * @param diag  Optional diagnostic output (can be NULL).
   * @return 0 on success, negative error code otherwise.
   */
  tb_err tb_asm_assemble(const char *src, size_t len, tb_asm_emit_fn emit, void *user,
                         TbAsmDiag *diag);

  /**
   * @brief Assemble into a VM: clear memory, write the image, reset the engine.
   *
   * Memory is left empty if assembly fails.
   *
   * @param vm    VM instance.
   * @param src   Source text.
   * @param len   Length of src in bytes.
   * @param diag  Optional diagnostic output (can be NULL).
   * @return 0 on success, negative error code otherwise.
   */
  tb_err vm_load_source(struct Vm *vm, const char *src, size_t len, TbAsmDiag *diag);

#ifdef __cplusplus
} /* extern "C" */
#endif
