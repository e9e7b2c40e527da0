/**
 * @file hal_wrapper.cpp
 * @brief Bridge layer between the VM's I/O callbacks and V4-hal's console API
 *
 * DRW renders the frame buffer as Sixel graphics on the console.
 * KEY polls console input without blocking.
 */

#include <cstring>
#include <vector>

#include "tablet/errors.hpp"
#include "tablet/hal_io.h"
#include "tablet/sixel.h"
#include "v4/hal.h"

/* ========================================================================= */
/* Display                                                                   */
/* ========================================================================= */

static tb_err console_write_all(const char* buf, size_t len)
{
  while (len > 0)
  {
    int ret = hal_console_write(reinterpret_cast<const uint8_t*>(buf), len);
    if (ret <= 0)
      return TB_ERR(IoError);
    buf += ret;
    len -= static_cast<size_t>(ret);
  }
  return TB_ERR(OK);
}

extern "C" tb_err tb_hal_draw(void* user, struct Vm* vm, const TbDisplay* display)
{
  (void)user;
  if (!vm || !display)
    return TB_ERR(InvalidArg);

  // Size first, then render into a buffer of exactly that length
  const size_t body_len = tb_sixel_encode(vm, display, nullptr, 0);
  std::vector<char> body(body_len + 1);
  tb_sixel_encode(vm, display, body.data(), body.size());

  if (tb_err e = console_write_all(TB_CURSOR_HOME, strlen(TB_CURSOR_HOME)))
    return e;
  if (tb_err e = console_write_all(TB_SIXEL_BEGIN, strlen(TB_SIXEL_BEGIN)))
    return e;
  if (tb_err e = console_write_all(body.data(), body_len))
    return e;
  return console_write_all(TB_SIXEL_END, strlen(TB_SIXEL_END));
}

/* ========================================================================= */
/* Keyboard                                                                  */
/* ========================================================================= */

extern "C" tb_err tb_hal_key(void* user, tb_u32* out)
{
  (void)user;
  if (!out)
    return TB_ERR(InvalidArg);

  // Drain everything pending; only the most recent key is reported.
  tb_u32 last = 0;
  uint8_t buf[32];
  for (;;)
  {
    int ret = hal_console_read(buf, sizeof(buf));
    if (ret < 0)
      return TB_ERR(IoError);
    if (ret == 0)
      break;
    last = buf[ret - 1];
    if (static_cast<size_t>(ret) < sizeof(buf))
      break;
  }

  *out = last;
  return TB_ERR(OK);
}

extern "C" TbIo tb_hal_io(void)
{
  TbIo io;
  io.draw = tb_hal_draw;
  io.key = tb_hal_key;
  io.user = nullptr;
  return io;
}
