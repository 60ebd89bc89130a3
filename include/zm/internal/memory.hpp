#pragma once
#include "zm/errors.h"
#include "zm/internal/machine.h"
#include "zm/zm_api.h"

/**
 * Core address-space helpers used by opcodes and the public API wrappers.
 *  - Big-endian words, no alignment requirement
 *  - Reads allowed anywhere inside the image
 *  - Writes allowed only below the static memory base
 */

zm_err zm_mem_read8_core(const Machine *vm, zm_u32 addr, zm_u8 *out);
zm_err zm_mem_read16_core(const Machine *vm, zm_u32 addr, zm_u16 *out);
zm_err zm_mem_write8_core(Machine *vm, zm_u32 addr, zm_u8 val);
zm_err zm_mem_write16_core(Machine *vm, zm_u32 addr, zm_u16 val);

/* Sum of bytes 0x40..length modulo 0x10000, as `verify` checks it. */
zm_u16 zm_story_checksum(const uint8_t *image, zm_u32 length);

/* Range check within the image. Returns 0 or OobMemory. */
static inline zm_err zm_is_in_image(const Machine *vm, zm_u32 addr, zm_u32 bytes)
{
  uint64_t end = (uint64_t)addr + (uint64_t)bytes;
  return (vm->mem && end <= (uint64_t)vm->mem_size) ? 0 : ZM_ERR_OobMemory;
}

/* Writable range check (dynamic memory). Returns 0 or ReadOnly. */
static inline zm_err zm_is_dynamic(const Machine *vm, zm_u32 addr, zm_u32 bytes)
{
  return ((uint64_t)addr + bytes <= (uint64_t)vm->header.static_base) ? 0 : ZM_ERR_ReadOnly;
}

/* V3 packed addresses: routines and strings both scale by 2. */
static inline zm_u32 zm_routine_address(zm_u16 packed)
{
  return (zm_u32)packed * 2u;
}

static inline zm_u32 zm_string_address(zm_u16 packed)
{
  return (zm_u32)packed * 2u;
}

/* Unchecked big-endian helpers for code that already validated the range. */
static inline zm_u16 zm_ld_be16(const uint8_t *p)
{
  return (zm_u16)(((zm_u16)p[0] << 8) | (zm_u16)p[1]);
}

static inline void zm_st_be16(uint8_t *p, zm_u16 v)
{
  p[0] = (uint8_t)((v >> 8) & 0xFF);
  p[1] = (uint8_t)(v & 0xFF);
}
