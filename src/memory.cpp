// src/memory.cpp — address space, header loading and interpreter lifecycle
#include "zm/internal/memory.hpp"

#include <stdlib.h>
#include <string.h>

#include "zm/errors.hpp"
#include "zm/internal/dictionary.hpp"
#include "zm/internal/machine.h"
#include "zm/internal/object.hpp"
#include "zm/internal/random.hpp"
#include "zm/zm_api.h"

/* ---- Header offsets (V3) ---- */
enum
{
  HDR_VERSION = 0x00,
  HDR_FLAGS1 = 0x01,
  HDR_HIGH_BASE = 0x04,
  HDR_INITIAL_PC = 0x06,
  HDR_DICTIONARY = 0x08,
  HDR_OBJECTS = 0x0A,
  HDR_GLOBALS = 0x0C,
  HDR_STATIC_BASE = 0x0E,
  HDR_ABBREVIATIONS = 0x18,
  HDR_FILE_LENGTH = 0x1A,
  HDR_CHECKSUM = 0x1C,
  HDR_INTERPRETER_NUMBER = 0x1E,
  HDR_INTERPRETER_VERSION = 0x1F,
  HDR_SCREEN_ROWS = 0x20,
  HDR_SCREEN_COLS = 0x21,
  HDR_SIZE = 0x40,
};

/* flags1 bits the interpreter owns in V3 */
enum
{
  FLAGS1_NO_STATUS_LINE = 0x10,
  FLAGS1_SPLIT_SCREEN = 0x20,
};

/* ---- core accessors (used by opcodes and public API) ---- */
zm_err zm_mem_read8_core(const Machine *vm, zm_u32 addr, zm_u8 *out)
{
  if (zm_err e = zm_is_in_image(vm, addr, 1))
    return e;
  *out = vm->mem[addr];
  return 0;
}

zm_err zm_mem_read16_core(const Machine *vm, zm_u32 addr, zm_u16 *out)
{
  if (zm_err e = zm_is_in_image(vm, addr, 2))
    return e;
  *out = zm_ld_be16(&vm->mem[addr]);
  return 0;
}

zm_err zm_mem_write8_core(Machine *vm, zm_u32 addr, zm_u8 val)
{
  // Range check first so OOB wins over ReadOnly
  if (zm_err e = zm_is_in_image(vm, addr, 1))
    return e;
  if (zm_err e = zm_is_dynamic(vm, addr, 1))
    return e;
  vm->mem[addr] = val;
  return 0;
}

zm_err zm_mem_write16_core(Machine *vm, zm_u32 addr, zm_u16 val)
{
  if (zm_err e = zm_is_in_image(vm, addr, 2))
    return e;
  if (zm_err e = zm_is_dynamic(vm, addr, 2))
    return e;
  zm_st_be16(&vm->mem[addr], val);
  return 0;
}

zm_u16 zm_story_checksum(const uint8_t *image, zm_u32 length)
{
  zm_u32 sum = 0;
  for (zm_u32 i = HDR_SIZE; i < length; i++)
    sum += image[i];
  return (zm_u16)(sum & 0xFFFF);
}

/* ---- public API: direct memory access (for tests/embedding) ---- */
extern "C" zm_err zm_mem_read8(struct Machine *vm, zm_u32 addr, zm_u8 *out)
{
  if (!vm || !out)
    return ZM_ERR(InvalidArg);
  return zm_mem_read8_core(vm, addr, out);
}

extern "C" zm_err zm_mem_read16(struct Machine *vm, zm_u32 addr, zm_u16 *out)
{
  if (!vm || !out)
    return ZM_ERR(InvalidArg);
  return zm_mem_read16_core(vm, addr, out);
}

extern "C" zm_err zm_mem_write8(struct Machine *vm, zm_u32 addr, zm_u8 val)
{
  if (!vm)
    return ZM_ERR(InvalidArg);
  return zm_mem_write8_core(vm, addr, val);
}

extern "C" zm_err zm_mem_write16(struct Machine *vm, zm_u32 addr, zm_u16 val)
{
  if (!vm)
    return ZM_ERR(InvalidArg);
  return zm_mem_write16_core(vm, addr, val);
}

/* ---- header validation ---- */
static zm_err load_header(const uint8_t *img, zm_u32 size, ZmHeader *h)
{
  if (size < HDR_SIZE)
    return ZM_ERR(StoryFormat);

  h->version = img[HDR_VERSION];
  if (h->version != 3)
    return ZM_ERR(UnsupportedVersion);

  h->flags1 = img[HDR_FLAGS1];
  h->high_base = zm_ld_be16(&img[HDR_HIGH_BASE]);
  h->initial_pc = zm_ld_be16(&img[HDR_INITIAL_PC]);
  h->dictionary = zm_ld_be16(&img[HDR_DICTIONARY]);
  h->object_table = zm_ld_be16(&img[HDR_OBJECTS]);
  h->globals = zm_ld_be16(&img[HDR_GLOBALS]);
  h->static_base = zm_ld_be16(&img[HDR_STATIC_BASE]);
  h->abbreviations = zm_ld_be16(&img[HDR_ABBREVIATIONS]);
  h->file_length = (zm_u32)zm_ld_be16(&img[HDR_FILE_LENGTH]) * 2u;
  h->checksum = zm_ld_be16(&img[HDR_CHECKSUM]);

  // Some early files leave the length blank
  if (h->file_length == 0)
    h->file_length = size;
  if (h->file_length > size)
    return ZM_ERR(StoryFormat);

  // The header itself must stay writable, and the tables must fit
  if (h->static_base < HDR_SIZE || h->static_base > size)
    return ZM_ERR(StoryFormat);
  if ((zm_u32)h->globals + 240u * 2u > h->static_base)
    return ZM_ERR(StoryFormat);
  if ((zm_u32)h->object_table + 31u * 2u > size)
    return ZM_ERR(StoryFormat);
  if ((zm_u32)h->abbreviations + 96u * 2u > size)
    return ZM_ERR(StoryFormat);
  if (h->dictionary >= size || h->initial_pc >= size || h->high_base > size)
    return ZM_ERR(StoryFormat);

  return ZM_ERR(OK);
}

/* ---- public API: lifecycle ---- */
extern "C" zm_err zm_create(const ZmConfig *cfg, struct Machine **out)
{
  if (!cfg || !out || !cfg->story)
    return ZM_ERR(InvalidArg);
  if (!cfg->host.print || !cfg->host.read_line)
    return ZM_ERR(InvalidArg);
  *out = nullptr;

  ZmHeader header;
  if (zm_err e = load_header(cfg->story, cfg->story_size, &header))
    return e;

  zm_u16 checksum = zm_story_checksum(cfg->story, header.file_length);
  if (cfg->verify_checksum && header.checksum != 0 && header.checksum != checksum)
    return ZM_ERR(ChecksumMismatch);

  Machine *vm = (Machine *)::malloc(sizeof(Machine));
  if (!vm)
    return ZM_ERR(OutOfMemory);
  ::memset(vm, 0, sizeof(Machine));

  vm->mem = (uint8_t *)::malloc(cfg->story_size);
  if (!vm->mem)
  {
    ::free(vm);
    return ZM_ERR(OutOfMemory);
  }
  ::memcpy(vm->mem, cfg->story, cfg->story_size);
  vm->mem_size = cfg->story_size;
  vm->header = header;
  vm->checksum = checksum;
  vm->host = cfg->host;

  // Interpreter-owned header bytes
  uint8_t flags1 = (uint8_t)(header.flags1 & ~(FLAGS1_NO_STATUS_LINE | FLAGS1_SPLIT_SCREEN));
  if (cfg->host.split_window)
    flags1 |= FLAGS1_SPLIT_SCREEN;
  vm->mem[HDR_FLAGS1] = flags1;
  vm->header.flags1 = flags1;
  vm->mem[HDR_INTERPRETER_NUMBER] = 6;  // IBM PC
  vm->mem[HDR_INTERPRETER_VERSION] = 'A';
  if (cfg->screen_rows)
    vm->mem[HDR_SCREEN_ROWS] = cfg->screen_rows;
  if (cfg->screen_cols)
    vm->mem[HDR_SCREEN_COLS] = cfg->screen_cols;

  // Main routine: no header, no locals
  vm->frames[0].routine = 0;
  vm->frames[0].num_locals = 0;
  vm->frames[0].stack_base = 0;
  vm->frame_count = 1;
  vm->sp = 0;
  vm->pc = header.initial_pc;
  vm->op_pc = header.initial_pc;
  vm->screen_enabled = 1;

  if (zm_err e = zm_dict_load(vm))
  {
    zm_destroy(vm);
    return e;
  }
  vm->object_count = zm_obj_count_objects(vm);

  zm_random_seed_prng(&vm->rng,
                      cfg->random_seed ? (uint32_t)cfg->random_seed : zm_random_entropy(vm));

  *out = vm;
  return ZM_ERR(OK);
}

extern "C" void zm_destroy(struct Machine *vm)
{
  if (!vm)
    return;

  ::free(vm->mem);
  ::free(vm);
}
