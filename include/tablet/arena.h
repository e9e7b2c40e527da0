#pragma once

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C"
{
#endif

  /**
   * @file arena.h
   * @brief Simple linear memory allocator (bump allocator)
   *
   * Arena allocator used as an optional page pool for VM memory.
   * Allocates from a fixed buffer without individual free().
   * Call tb_arena_reset() to free all allocations at once.
   *
   * Features:
   * - No fragmentation
   * - Fast allocation (O(1))
   * - Alignment support
   * - No individual free (reset only)
   */

  /**
   * @brief Arena allocator structure
   *
   * Manages a fixed buffer for linear memory allocation.
   */
  typedef struct TbArena
  {
    uint8_t *buffer; /**< Managed buffer base pointer */
    size_t size;     /**< Total buffer size in bytes */
    size_t used;     /**< Currently used bytes */
  } TbArena;

  /**
   * @brief Initialize an arena allocator
   *
   * @param arena  Pointer to arena structure
   * @param buffer Pointer to memory buffer to manage
   * @param size   Size of buffer in bytes
   */
  void tb_arena_init(TbArena *arena, uint8_t *buffer, size_t size);

  /**
   * @brief Allocate memory from arena with alignment
   *
   * Allocates memory with specified alignment (must be power of 2).
   * Returns NULL if insufficient space.
   *
   * @param arena Pointer to arena
   * @param bytes Number of bytes to allocate
   * @param align Alignment requirement (must be power of 2)
   * @return Pointer to allocated memory, or NULL on failure
   */
  void *tb_arena_alloc(TbArena *arena, size_t bytes, size_t align);

  /**
   * @brief Reset arena to initial state
   *
   * Frees all allocations at once by resetting used counter to 0.
   * Does not clear memory contents.
   *
   * @param arena Pointer to arena
   */
  void tb_arena_reset(TbArena *arena);

  /**
   * @brief Get current used bytes
   *
   * @param arena Pointer to arena
   * @return Number of bytes currently allocated
   */
  size_t tb_arena_used(const TbArena *arena);

  /**
   * @brief Get available bytes
   *
   * @param arena Pointer to arena
   * @return Number of bytes available for allocation
   */
  size_t tb_arena_available(const TbArena *arena);

#ifdef __cplusplus
}
#endif
