#pragma once

#include "tablet/vm_api.h"

#ifdef __cplusplus
extern "C"
{
#endif

  /**
   * @file hal_io.h
   * @brief Display and keyboard adapters over V4-hal console I/O
   *
   * DRW writes cursor-home and a Sixel image of the frame buffer through
   * hal_console_write(). KEY drains hal_console_read() without blocking and
   * reports the last byte received, or 0 when nothing arrived.
   *
   * The HAL must be initialised by the embedder before the VM runs.
   */

  /**
   * @brief Adapter table for VmConfig::io.
   * @return TbIo with HAL-backed draw and key callbacks.
   */
  TbIo tb_hal_io(void);

  tb_err tb_hal_draw(void *user, struct Vm *vm, const TbDisplay *display);
  tb_err tb_hal_key(void *user, tb_u32 *out);

#ifdef __cplusplus
} /* extern "C" */
#endif
