#pragma once
#include <stddef.h>

#include "tablet/vm_api.h"

#ifdef __cplusplus
extern "C"
{
#endif

  /**
   * @file sixel.h
   * @brief Frame buffer to DEC Sixel conversion
   *
   * Each band of six rows becomes one character per column, 63 + bits where
   * bit i is set when row band+i is lit, followed by "$-" (carriage return,
   * next band).
   */

#define TB_SIXEL_BEGIN "\x1bPq"
#define TB_SIXEL_END "\x1b\\"
#define TB_CURSOR_HOME "\x1b[1;1H"

  /**
   * @brief Encode the display region of VM memory as a Sixel body.
   *
   * Reads memory without allocating pages. Semantics follow snprintf: at
   * most cap-1 bytes plus a NUL are written.
   *
   * @param vm       VM whose memory holds the frame buffer.
   * @param display  Region to encode.
   * @param out      Output buffer (can be NULL when cap is 0).
   * @param cap      Buffer capacity in bytes.
   * @return Length of the full body in bytes.
   */
  size_t tb_sixel_encode(const struct Vm *vm, const TbDisplay *display, char *out,
                         size_t cap);

#ifdef __cplusplus
} /* extern "C" */
#endif
