#include "zm/internal/text.hpp"

#include <string.h>

#include "zm/errors.hpp"
#include "zm/internal/machine.h"
#include "zm/internal/memory.hpp"

/* Alphabet rows indexed by Z-character - 6. A2[0] is the ZSCII escape. */
static const char kAlphabet[3][27] = {
    "abcdefghijklmnopqrstuvwxyz",
    "ABCDEFGHIJKLMNOPQRSTUVWXYZ",
    " \n0123456789.,!?_#'\"/\\-:()",
};

/* Default Unicode translations for ZSCII 155..223. */
static const uint16_t kExtraChars[] = {
    0x0e4, 0x0f6, 0x0fc, 0x0c4, 0x0d6, 0x0dc, 0x0df, 0x0bb, 0x0ab, 0x0eb, 0x0ef, 0x0ff,
    0x0cb, 0x0cf, 0x0e1, 0x0e9, 0x0ed, 0x0f3, 0x0fa, 0x0fd, 0x0c1, 0x0c9, 0x0cd, 0x0d3,
    0x0da, 0x0dd, 0x0e0, 0x0e8, 0x0ec, 0x0f2, 0x0f9, 0x0c0, 0x0c8, 0x0cc, 0x0d2, 0x0d9,
    0x0e2, 0x0ea, 0x0ee, 0x0f4, 0x0fb, 0x0c2, 0x0ca, 0x0ce, 0x0d4, 0x0db, 0x0e5, 0x0c5,
    0x0f8, 0x0d8, 0x0e3, 0x0f1, 0x0f5, 0x0c3, 0x0d1, 0x0d5, 0x0e6, 0x0c6, 0x0e7, 0x0c7,
    0x0fe, 0x0f0, 0x0de, 0x0d0, 0x0a3, 0x153, 0x152, 0x0a1, 0x0bf,
};

enum
{
  ZSCII_EXTRA_FIRST = 155,
  ZSCII_EXTRA_COUNT = sizeof(kExtraChars) / sizeof(kExtraChars[0]),
  ZCHAR_PAD = 5,
  DICT_ZCHARS = 6,
};

/* ============================== Decoding ================================= */

static zm_err decode_impl(const Machine *vm, zm_u32 addr, zm_u32 max_bytes, ZmZsciiSink sink,
                          void *user, zm_u32 *out_next, bool in_abbrev)
{
  int shift = 0;     // one-shot alphabet for the next character
  int abbrev = 0;    // pending abbreviation bank (1-3)
  int escape = 0;    // 1: expecting high 5 bits, 2: expecting low 5 bits
  zm_u16 high = 0;
  zm_u32 p = addr;

  for (;;)
  {
    if (max_bytes && p - addr >= max_bytes)
      break;

    zm_u16 w;
    if (zm_err e = zm_mem_read16_core(vm, p, &w))
      return e;
    p += 2;

    for (int k = 2; k >= 0; k--)
    {
      zm_u16 c = (zm_u16)((w >> (5 * k)) & 0x1F);

      if (escape == 1)
      {
        high = c;
        escape = 2;
        continue;
      }
      if (escape == 2)
      {
        sink(user, (zm_u16)((high << 5) | c));
        escape = 0;
        continue;
      }
      if (abbrev)
      {
        if (in_abbrev)
          return ZM_ERR(DecodeError);
        zm_u16 entry;
        zm_u32 slot = vm->header.abbreviations + 2u * (32u * (zm_u32)(abbrev - 1) + c);
        if (zm_err e = zm_mem_read16_core(vm, slot, &entry))
          return e;
        // Abbreviation table holds word addresses
        if (zm_err e = decode_impl(vm, zm_string_address(entry), 0, sink, user, nullptr, true))
          return e;
        abbrev = 0;
        continue;
      }

      switch (c)
      {
        case 0:
          sink(user, ' ');
          shift = 0;
          break;
        case 1:
        case 2:
        case 3:
          // Always an abbreviation in V3; a pending shift is dropped
          abbrev = c;
          shift = 0;
          break;
        case 4:
          shift = 1;
          break;
        case 5:
          shift = 2;
          break;
        default:
          if (shift == 2 && c == 6)
            escape = 1;
          else if (shift == 2 && c == 7)
            sink(user, 13);
          else
            sink(user, (zm_u16)(uint8_t)kAlphabet[shift][c - 6]);
          shift = 0;
          break;
      }
    }

    if (w & 0x8000)
      break;
  }

  if (out_next)
    *out_next = p;
  return ZM_ERR(OK);
}

zm_err zm_text_decode(const Machine *vm, zm_u32 addr, zm_u32 max_bytes, ZmZsciiSink sink,
                      void *user, zm_u32 *out_next)
{
  return decode_impl(vm, addr, max_bytes, sink, user, out_next, false);
}

/* ============================ ZSCII <-> UTF-8 ============================ */

static int put_utf8(uint32_t cp, char out[4])
{
  if (cp < 0x80)
  {
    out[0] = (char)cp;
    return 1;
  }
  if (cp < 0x800)
  {
    out[0] = (char)(0xC0 | (cp >> 6));
    out[1] = (char)(0x80 | (cp & 0x3F));
    return 2;
  }
  out[0] = (char)(0xE0 | (cp >> 12));
  out[1] = (char)(0x80 | ((cp >> 6) & 0x3F));
  out[2] = (char)(0x80 | (cp & 0x3F));
  return 3;
}

int zm_zscii_to_utf8(zm_u16 zscii, char out[4])
{
  if (zscii == 13)
  {
    out[0] = '\n';
    return 1;
  }
  if (zscii >= 32 && zscii <= 126)
  {
    out[0] = (char)zscii;
    return 1;
  }
  if (zscii >= ZSCII_EXTRA_FIRST && zscii < ZSCII_EXTRA_FIRST + ZSCII_EXTRA_COUNT)
    return put_utf8(kExtraChars[zscii - ZSCII_EXTRA_FIRST], out);
  // No output form in V3
  return 0;
}

zm_u16 zm_unicode_to_zscii(uint32_t cp)
{
  if (cp >= 32 && cp <= 126)
    return (zm_u16)cp;
  for (int i = 0; i < ZSCII_EXTRA_COUNT; i++)
  {
    if (kExtraChars[i] == cp)
      return (zm_u16)(ZSCII_EXTRA_FIRST + i);
  }
  return '?';
}

struct Utf8Buf
{
  char *buf;
  size_t cap;
  size_t len;
};

static void utf8_sink(void *user, zm_u16 zscii)
{
  Utf8Buf *b = static_cast<Utf8Buf *>(user);
  char tmp[4];
  int n = zm_zscii_to_utf8(zscii, tmp);
  if (b->len + (size_t)n + 1 > b->cap)
    return;
  memcpy(b->buf + b->len, tmp, (size_t)n);
  b->len += (size_t)n;
}

int zm_text_decode_utf8(const Machine *vm, zm_u32 addr, char *buf, size_t cap)
{
  if (!buf || cap == 0)
    return ZM_ERR(InvalidArg);
  Utf8Buf b = {buf, cap, 0};
  zm_err e = zm_text_decode(vm, addr, 0, utf8_sink, &b, nullptr);
  buf[b.len] = '\0';
  if (e)
    return e;
  return (int)b.len;
}

/* ============================== Encoding ================================= */

static int alphabet_index(int row, zm_u16 zscii)
{
  if (zscii == 0 || zscii > 126)
    return -1;
  const char *hit = strchr(kAlphabet[row], (char)zscii);
  if (!hit)
    return -1;
  int idx = (int)(hit - kAlphabet[row]);
  // A2[0] is the escape slot, not a real space
  if (row == 2 && idx == 0)
    return -1;
  return idx;
}

void zm_text_encode(const char *word, size_t len, zm_u16 out[2])
{
  uint8_t z[DICT_ZCHARS + 4];
  int n = 0;

  for (size_t i = 0; i < len && n < DICT_ZCHARS; i++)
  {
    zm_u16 ch = (uint8_t)word[i];
    if (ch >= 'A' && ch <= 'Z')
      ch = (zm_u16)(ch - 'A' + 'a');

    int idx = alphabet_index(0, ch);
    if (idx >= 0)
    {
      z[n++] = (uint8_t)(idx + 6);
      continue;
    }
    idx = alphabet_index(2, ch);
    if (idx >= 0)
    {
      z[n++] = 5;
      z[n++] = (uint8_t)(idx + 6);
      continue;
    }
    // 10-bit ZSCII literal
    z[n++] = 5;
    z[n++] = 6;
    z[n++] = (uint8_t)((ch >> 5) & 0x1F);
    z[n++] = (uint8_t)(ch & 0x1F);
  }

  // Overflow is truncated, short words padded
  while (n < DICT_ZCHARS)
    z[n++] = ZCHAR_PAD;

  out[0] = (zm_u16)((z[0] << 10) | (z[1] << 5) | z[2]);
  out[1] = (zm_u16)(0x8000 | (z[3] << 10) | (z[4] << 5) | z[5]);
}
