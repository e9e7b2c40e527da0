#include "tablet/sixel.h"

#include <cstdint>

#include "tablet/internal/memory.hpp"
#include "tablet/internal/vm.h"

namespace
{

// snprintf-style sink: counts every byte, stores while there is room.
struct Sink
{
  char *out;
  size_t cap;
  size_t len;

  void put(char ch)
  {
    if (out && len + 1 < cap)
      out[len] = ch;
    ++len;
  }

  void repeat(char ch, uint64_t n)
  {
    for (uint64_t i = 0; i < n; ++i)
      put(ch);
  }

  void next_band()
  {
    put('$');
    put('-');
  }

  void finish()
  {
    if (out && cap > 0)
      out[len < cap ? len : cap - 1] = '\0';
  }
};

}  // namespace

extern "C" size_t tb_sixel_encode(const struct Vm *vm, const TbDisplay *display, char *out,
                                  size_t cap)
{
  Sink sink{out, cap, 0};
  if (!vm || !display)
  {
    sink.finish();
    return 0;
  }

  const uint64_t width = display->width;
  const uint64_t height = display->height;

  if (display->border)
  {
    sink.repeat('_', width + 2);
    sink.next_band();
  }

  for (uint64_t row = 0; row < height; row += 6)
  {
    if (display->border)
      sink.put('~');

    for (uint64_t x = 0; x < width; ++x)
    {
      unsigned bits = 0;
      for (unsigned y = 0; y < 6; ++y)
      {
        if (row + y >= height)
          break;
        const uint64_t offset = x + (row + y) * width;
        const tb_u32 addr = static_cast<tb_u32>(display->base + offset);
        if (tb_mem_read_core(vm, addr) != 0)
          bits |= 1u << y;
      }
      sink.put(static_cast<char>(63 + bits));
    }

    if (display->border)
      sink.put('~');
    sink.next_band();
  }

  if (display->border)
  {
    sink.repeat('@', width + 2);
    sink.next_band();
  }

  sink.finish();
  return sink.len;
}
