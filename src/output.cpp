// src/output.cpp: output streams and the status line
#include "zm/internal/output.hpp"

#include <string.h>

#include "zm/errors.hpp"
#include "zm/internal/machine.h"
#include "zm/internal/memory.hpp"
#include "zm/internal/object.hpp"
#include "zm/internal/text.hpp"

enum
{
  HDR_FLAGS1 = 0x01,
  HDR_FLAGS2 = 0x11, /* low byte of the flags2 word */
  FLAGS1_TIME_GAME = 0x02,
  FLAGS2_TRANSCRIPT = 0x01,
  ZSCII_NEWLINE = 13,
  CHUNK_SIZE = 256,
  STATUS_NAME_MAX = 128,
};

static void emit(Machine *vm, const char *text, size_t len)
{
  if (len == 0)
    return;
  if (vm->screen_enabled)
    vm->host.print(vm->host.user, text, len);
  if ((vm->mem[HDR_FLAGS2] & FLAGS2_TRANSCRIPT) && vm->host.transcript)
    vm->host.transcript(vm->host.user, text, len);
}

/* Collects UTF-8 for the screen, or stores ZSCII into the open stream 3 table. */
struct Chunk
{
  Machine *vm;
  char buf[CHUNK_SIZE];
  size_t len;
  zm_err err;
};

static void chunk_flush(Chunk *c)
{
  emit(c->vm, c->buf, c->len);
  c->len = 0;
}

static void chunk_put(void *user, zm_u16 zscii)
{
  Chunk *c = static_cast<Chunk *>(user);
  if (c->err)
    return;

  Machine *vm = c->vm;
  if (vm->mem_stream_depth > 0)
  {
    ZmMemStream *s = &vm->mem_streams[vm->mem_stream_depth - 1];
    c->err = zm_mem_write8_core(vm, (zm_u32)s->table + 2u + s->count, (zm_u8)zscii);
    if (!c->err)
      s->count++;
    return;
  }

  char tmp[4];
  int n = zm_zscii_to_utf8(zscii, tmp);
  if (c->len + (size_t)n > sizeof(c->buf))
    chunk_flush(c);
  memcpy(c->buf + c->len, tmp, (size_t)n);
  c->len += (size_t)n;
}

static inline void chunk_init(Chunk *c, Machine *vm)
{
  c->vm = vm;
  c->len = 0;
  c->err = 0;
}

zm_err zm_out_zscii(Machine *vm, zm_u16 zscii)
{
  Chunk c;
  chunk_init(&c, vm);
  chunk_put(&c, zscii);
  chunk_flush(&c);
  return c.err;
}

zm_err zm_out_ascii(Machine *vm, const char *s)
{
  Chunk c;
  chunk_init(&c, vm);
  for (; *s; s++)
    chunk_put(&c, *s == '\n' ? (zm_u16)ZSCII_NEWLINE : (zm_u16)(uint8_t)*s);
  chunk_flush(&c);
  return c.err;
}

zm_err zm_out_string(Machine *vm, zm_u32 addr, zm_u32 *out_next)
{
  Chunk c;
  chunk_init(&c, vm);
  zm_err e = zm_text_decode(vm, addr, 0, chunk_put, &c, out_next);
  chunk_flush(&c);
  return e ? e : c.err;
}

zm_err zm_out_select(Machine *vm, zm_i16 stream, zm_u16 table)
{
  switch (stream)
  {
    case 1:
    case -1:
      vm->screen_enabled = stream > 0;
      return ZM_ERR(OK);

    case 2:
    case -2:
    {
      zm_u8 f = vm->mem[HDR_FLAGS2];
      f = stream > 0 ? (zm_u8)(f | FLAGS2_TRANSCRIPT) : (zm_u8)(f & ~FLAGS2_TRANSCRIPT);
      return zm_mem_write8_core(vm, HDR_FLAGS2, f);
    }

    case 3:
      if (vm->mem_stream_depth >= Machine::ZM_MAX_MEM_STREAMS)
        return ZM_ERR(StreamDepth);
      // The table must be writable before anything is redirected into it
      if (zm_err e = zm_mem_write16_core(vm, table, 0))
        return e;
      vm->mem_streams[vm->mem_stream_depth].table = table;
      vm->mem_streams[vm->mem_stream_depth].count = 0;
      vm->mem_stream_depth++;
      return ZM_ERR(OK);

    case -3:
    {
      if (vm->mem_stream_depth == 0)
        return ZM_ERR(OK);
      ZmMemStream s = vm->mem_streams[--vm->mem_stream_depth];
      return zm_mem_write16_core(vm, s.table, s.count);
    }

    default:
      // 0 selects nothing; stream 4 (command script) is not kept
      return ZM_ERR(OK);
  }
}

/* ---- status line ---- */

struct NameBuf
{
  char buf[STATUS_NAME_MAX];
  size_t len;
};

static void name_put(void *user, zm_u16 zscii)
{
  NameBuf *b = static_cast<NameBuf *>(user);
  char tmp[4];
  int n = zm_zscii_to_utf8(zscii, tmp);
  if (b->len + (size_t)n + 1 > sizeof(b->buf))
    return;
  memcpy(b->buf + b->len, tmp, (size_t)n);
  b->len += (size_t)n;
}

zm_err zm_out_status(Machine *vm)
{
  if (!vm->host.show_status)
    return ZM_ERR(OK);

  // Globals 0-2: location object, score/hours, moves/minutes
  zm_u16 location, a, b;
  if (zm_err e = zm_mem_read16_core(vm, vm->header.globals, &location))
    return e;
  if (zm_err e = zm_mem_read16_core(vm, vm->header.globals + 2u, &a))
    return e;
  if (zm_err e = zm_mem_read16_core(vm, vm->header.globals + 4u, &b))
    return e;

  NameBuf name;
  name.len = 0;
  if (location != 0)
  {
    zm_u32 addr;
    zm_u8 words;
    if (zm_err e = zm_obj_name_addr(vm, location, &addr))
      return e;
    if (zm_err e = zm_mem_read8_core(vm, addr - 1, &words))
      return e;
    if (words)
    {
      if (zm_err e = zm_text_decode(vm, addr, 2u * words, name_put, &name, nullptr))
        return e;
    }
  }
  name.buf[name.len] = '\0';

  int is_time = (vm->mem[HDR_FLAGS1] & FLAGS1_TIME_GAME) != 0;
  vm->host.show_status(vm->host.user, name.buf, (zm_i16)a, (zm_i16)b, is_time);
  return ZM_ERR(OK);
}
