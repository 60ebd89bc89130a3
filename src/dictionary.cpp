#include "zm/internal/dictionary.hpp"

#include <string.h>

#include "zm/errors.hpp"
#include "zm/internal/machine.h"
#include "zm/internal/memory.hpp"
#include "zm/internal/text.hpp"

enum
{
  DICT_KEY_BYTES = 4,
  PARSE_RECORD_SIZE = 4,
};

zm_err zm_dict_load(Machine *vm)
{
  ZmDictionary *d = &vm->dict;
  zm_u32 p = vm->header.dictionary;

  zm_u8 n;
  if (zm_err e = zm_mem_read8_core(vm, p, &n))
    return e;
  if (n > sizeof(d->separators))
    return ZM_ERR(StoryFormat);
  for (zm_u8 i = 0; i < n; i++)
  {
    if (zm_err e = zm_mem_read8_core(vm, p + 1 + i, &d->separators[i]))
      return e;
  }
  d->separator_count = n;
  p += 1u + n;

  zm_u8 entry_length;
  zm_u16 count;
  if (zm_err e = zm_mem_read8_core(vm, p, &entry_length))
    return e;
  if (zm_err e = zm_mem_read16_core(vm, p + 1, &count))
    return e;
  if (entry_length < DICT_KEY_BYTES)
    return ZM_ERR(StoryFormat);

  // A negative count marks an unsorted dictionary
  zm_i16 signed_count = (zm_i16)count;
  d->sorted = signed_count >= 0;
  d->entry_count = (uint16_t)(signed_count < 0 ? -signed_count : signed_count);
  d->entry_length = entry_length;
  d->entries = p + 3;
  d->addr = vm->header.dictionary;

  if ((uint64_t)d->entries + (uint64_t)d->entry_count * entry_length > vm->mem_size)
    return ZM_ERR(StoryFormat);
  return ZM_ERR(OK);
}

static int compare_key(const Machine *vm, zm_u32 entry, const zm_u16 key[2])
{
  zm_u16 w0 = zm_ld_be16(&vm->mem[entry]);
  if (w0 != key[0])
    return w0 < key[0] ? -1 : 1;
  zm_u16 w1 = zm_ld_be16(&vm->mem[entry + 2]);
  if (w1 != key[1])
    return w1 < key[1] ? -1 : 1;
  return 0;
}

zm_u16 zm_dict_lookup(const Machine *vm, const zm_u16 key[2])
{
  const ZmDictionary *d = &vm->dict;

  if (!d->sorted)
  {
    for (uint16_t i = 0; i < d->entry_count; i++)
    {
      zm_u32 e = d->entries + (zm_u32)i * d->entry_length;
      if (compare_key(vm, e, key) == 0)
        return (zm_u16)e;
    }
    return 0;
  }

  int lo = 0;
  int hi = (int)d->entry_count - 1;
  while (lo <= hi)
  {
    int mid = lo + (hi - lo) / 2;
    zm_u32 e = d->entries + (zm_u32)mid * d->entry_length;
    int c = compare_key(vm, e, key);
    if (c == 0)
      return (zm_u16)e;
    if (c < 0)
      lo = mid + 1;
    else
      hi = mid - 1;
  }
  return 0;
}

static bool is_space(char c)
{
  return c == ' ' || c == '\t' || c == '\v' || c == '\f';
}

static bool is_separator(const ZmDictionary *d, char c)
{
  return memchr(d->separators, (uint8_t)c, d->separator_count) != nullptr;
}

int zm_tokenize(const Machine *vm, const char *line, size_t len, ZmToken *out, int max)
{
  const ZmDictionary *d = &vm->dict;
  int count = 0;
  size_t i = 0;

  while (i < len)
  {
    if (is_space(line[i]))
    {
      i++;
      continue;
    }

    size_t start = i;
    if (is_separator(d, line[i]))
      i++;
    else
    {
      while (i < len && !is_space(line[i]) && !is_separator(d, line[i]))
        i++;
    }

    if (count < max)
    {
      zm_u16 key[2];
      zm_text_encode(line + start, i - start, key);
      out[count].start = (uint16_t)start;
      out[count].length = (uint8_t)(i - start > 255 ? 255 : i - start);
      out[count].entry = zm_dict_lookup(vm, key);
    }
    count++;
  }
  return count;
}

zm_err zm_dict_store_input(Machine *vm, zm_u16 text_addr, zm_u16 parse_addr, const char *line,
                           size_t len)
{
  zm_u8 text_max;
  if (zm_err e = zm_mem_read8_core(vm, text_addr, &text_max))
    return e;
  if (len > text_max)
    len = text_max;

  for (size_t i = 0; i < len; i++)
  {
    if (zm_err e = zm_mem_write8_core(vm, text_addr + 1u + (zm_u32)i, (zm_u8)line[i]))
      return e;
  }
  if (zm_err e = zm_mem_write8_core(vm, text_addr + 1u + (zm_u32)len, 0))
    return e;

  zm_u8 parse_max;
  if (zm_err e = zm_mem_read8_core(vm, parse_addr, &parse_max))
    return e;

  ZmToken tokens[255];
  int found = zm_tokenize(vm, line, len, tokens, parse_max);
  int stored = found < parse_max ? found : parse_max;

  if (zm_err e = zm_mem_write8_core(vm, parse_addr + 1u, (zm_u8)stored))
    return e;
  for (int i = 0; i < stored; i++)
  {
    zm_u32 rec = parse_addr + 2u + (zm_u32)i * PARSE_RECORD_SIZE;
    if (zm_err e = zm_mem_write16_core(vm, rec, tokens[i].entry))
      return e;
    if (zm_err e = zm_mem_write8_core(vm, rec + 2, tokens[i].length))
      return e;
    // Position counts from the start of the text buffer, past the length byte
    if (zm_err e = zm_mem_write8_core(vm, rec + 3, (zm_u8)(tokens[i].start + 1)))
      return e;
  }
  return ZM_ERR(OK);
}
