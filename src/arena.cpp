#include "tablet/arena.h"

#include <cstring>

extern "C" void tb_arena_init(TbArena* arena, uint8_t* buffer, size_t size)
{
  if (!arena)
    return;

  arena->buffer = buffer;
  arena->size = size;
  arena->used = 0;
}

extern "C" void* tb_arena_alloc(TbArena* arena, size_t bytes, size_t align)
{
  if (!arena || !arena->buffer || bytes == 0)
    return nullptr;

  // Alignment must be power of 2
  if (align == 0 || (align & (align - 1)) != 0)
    return nullptr;

  // Align the absolute address so pages carved from any buffer stay word aligned
  uintptr_t base = reinterpret_cast<uintptr_t>(arena->buffer);
  uintptr_t current = base + arena->used;
  uintptr_t aligned = (current + align - 1) & ~(static_cast<uintptr_t>(align) - 1);
  size_t offset = static_cast<size_t>(aligned - base);

  // Check if we have enough space
  if (offset > arena->size || bytes > arena->size - offset)
    return nullptr;

  // Allocate
  void* ptr = arena->buffer + offset;
  arena->used = offset + bytes;

  return ptr;
}

extern "C" void tb_arena_reset(TbArena* arena)
{
  if (!arena)
    return;

  arena->used = 0;
}

extern "C" size_t tb_arena_used(const TbArena* arena)
{
  if (!arena)
    return 0;

  return arena->used;
}

extern "C" size_t tb_arena_available(const TbArena* arena)
{
  if (!arena)
    return 0;

  return arena->size - arena->used;
}
