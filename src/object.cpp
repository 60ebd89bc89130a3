#include "zm/internal/object.hpp"

#include "zm/errors.hpp"
#include "zm/internal/machine.h"
#include "zm/internal/memory.hpp"

enum
{
  OBJ_PARENT = 4,
  OBJ_SIBLING = 5,
  OBJ_CHILD = 6,
  OBJ_PROPS = 7,
  DEFAULTS_SIZE = ZM_PROPERTY_MAX * 2,
  MAX_OBJECTS = 255,
};

static inline zm_u32 first_entry(const Machine *vm)
{
  return (zm_u32)vm->header.object_table + DEFAULTS_SIZE;
}

static zm_err entry_addr(const Machine *vm, zm_u16 obj, zm_u32 *out)
{
  if (obj == 0 || obj > vm->object_count)
    return ZM_ERR(InvalidObject);
  *out = first_entry(vm) + (zm_u32)(obj - 1) * ZM_OBJECT_ENTRY_SIZE;
  return ZM_ERR(OK);
}

/* ---- tree links ---- */

static zm_err read_link(const Machine *vm, zm_u16 obj, int field, zm_u16 *out)
{
  zm_u32 e;
  if (zm_err err = entry_addr(vm, obj, &e))
    return err;
  zm_u8 v;
  if (zm_err err = zm_mem_read8_core(vm, e + (zm_u32)field, &v))
    return err;
  *out = v;
  return ZM_ERR(OK);
}

static zm_err write_link(Machine *vm, zm_u16 obj, int field, zm_u16 value)
{
  zm_u32 e;
  if (zm_err err = entry_addr(vm, obj, &e))
    return err;
  return zm_mem_write8_core(vm, e + (zm_u32)field, (zm_u8)value);
}

zm_err zm_obj_parent(const Machine *vm, zm_u16 obj, zm_u16 *out)
{
  return read_link(vm, obj, OBJ_PARENT, out);
}

zm_err zm_obj_sibling(const Machine *vm, zm_u16 obj, zm_u16 *out)
{
  return read_link(vm, obj, OBJ_SIBLING, out);
}

zm_err zm_obj_child(const Machine *vm, zm_u16 obj, zm_u16 *out)
{
  return read_link(vm, obj, OBJ_CHILD, out);
}

/* ---- attributes ---- */

static zm_err attr_byte(const Machine *vm, zm_u16 obj, zm_u16 attr, zm_u32 *addr, zm_u8 *mask)
{
  if (attr >= ZM_ATTRIBUTE_COUNT)
    return ZM_ERR(InvalidAttribute);
  zm_u32 e;
  if (zm_err err = entry_addr(vm, obj, &e))
    return err;
  // Attribute 0 is the top bit of the first byte
  *addr = e + attr / 8u;
  *mask = (zm_u8)(0x80u >> (attr % 8u));
  return ZM_ERR(OK);
}

zm_err zm_obj_test_attr(const Machine *vm, zm_u16 obj, zm_u16 attr, bool *out)
{
  zm_u32 addr;
  zm_u8 mask, v;
  if (zm_err e = attr_byte(vm, obj, attr, &addr, &mask))
    return e;
  if (zm_err e = zm_mem_read8_core(vm, addr, &v))
    return e;
  *out = (v & mask) != 0;
  return ZM_ERR(OK);
}

zm_err zm_obj_set_attr(Machine *vm, zm_u16 obj, zm_u16 attr, bool value)
{
  zm_u32 addr;
  zm_u8 mask, v;
  if (zm_err e = attr_byte(vm, obj, attr, &addr, &mask))
    return e;
  if (zm_err e = zm_mem_read8_core(vm, addr, &v))
    return e;
  v = value ? (zm_u8)(v | mask) : (zm_u8)(v & ~mask);
  return zm_mem_write8_core(vm, addr, v);
}

/* ---- property tables ---- */

static zm_err prop_table(const Machine *vm, zm_u16 obj, zm_u32 *out)
{
  zm_u32 e;
  if (zm_err err = entry_addr(vm, obj, &e))
    return err;
  zm_u16 pt;
  if (zm_err err = zm_mem_read16_core(vm, e + OBJ_PROPS, &pt))
    return err;
  *out = pt;
  return ZM_ERR(OK);
}

zm_err zm_obj_name_addr(const Machine *vm, zm_u16 obj, zm_u32 *out)
{
  zm_u32 pt;
  if (zm_err e = prop_table(vm, obj, &pt))
    return e;
  *out = pt + 1;
  return ZM_ERR(OK);
}

/* Address of the first size byte (past the short name). */
static zm_err first_prop(const Machine *vm, zm_u16 obj, zm_u32 *out)
{
  zm_u32 pt;
  if (zm_err e = prop_table(vm, obj, &pt))
    return e;
  zm_u8 name_words;
  if (zm_err e = zm_mem_read8_core(vm, pt, &name_words))
    return e;
  *out = pt + 1 + 2u * name_words;
  return ZM_ERR(OK);
}

/**
 * Locate property prop. *size_addr is 0 when the object lacks it.
 * Lists are sorted by descending number, so the scan stops early.
 */
static zm_err find_prop(const Machine *vm, zm_u16 obj, zm_u16 prop, zm_u32 *size_addr,
                        zm_u8 *len)
{
  zm_u32 p;
  if (zm_err e = first_prop(vm, obj, &p))
    return e;
  *size_addr = 0;
  *len = 0;
  for (;;)
  {
    zm_u8 sb;
    if (zm_err e = zm_mem_read8_core(vm, p, &sb))
      return e;
    zm_u16 num = sb & 0x1F;
    if (sb == 0 || num < prop)
      return ZM_ERR(OK);
    zm_u8 l = (zm_u8)((sb >> 5) + 1);
    if (num == prop)
    {
      *size_addr = p;
      *len = l;
      return ZM_ERR(OK);
    }
    p += 1u + l;
  }
}

static inline zm_err check_prop_number(zm_u16 prop)
{
  return (prop == 0 || prop > ZM_PROPERTY_MAX) ? ZM_ERR(InvalidProperty) : ZM_ERR(OK);
}

zm_err zm_obj_get_prop(const Machine *vm, zm_u16 obj, zm_u16 prop, zm_u16 *out)
{
  if (zm_err e = check_prop_number(prop))
    return e;
  zm_u32 at;
  zm_u8 len;
  if (zm_err e = find_prop(vm, obj, prop, &at, &len))
    return e;

  if (!at)
    return zm_mem_read16_core(vm, vm->header.object_table + 2u * (prop - 1u), out);

  if (len == 1)
  {
    zm_u8 b;
    if (zm_err e = zm_mem_read8_core(vm, at + 1, &b))
      return e;
    *out = b;
    return ZM_ERR(OK);
  }
  if (len == 2)
    return zm_mem_read16_core(vm, at + 1, out);
  return ZM_ERR(InvalidProperty);
}

zm_err zm_obj_put_prop(Machine *vm, zm_u16 obj, zm_u16 prop, zm_u16 value)
{
  if (zm_err e = check_prop_number(prop))
    return e;
  zm_u32 at;
  zm_u8 len;
  if (zm_err e = find_prop(vm, obj, prop, &at, &len))
    return e;
  if (!at)
    return ZM_ERR(InvalidProperty);
  if (len == 1)
    return zm_mem_write8_core(vm, at + 1, (zm_u8)(value & 0xFF));
  if (len == 2)
    return zm_mem_write16_core(vm, at + 1, value);
  return ZM_ERR(InvalidProperty);
}

zm_err zm_obj_get_prop_addr(const Machine *vm, zm_u16 obj, zm_u16 prop, zm_u16 *out)
{
  if (zm_err e = check_prop_number(prop))
    return e;
  zm_u32 at;
  zm_u8 len;
  if (zm_err e = find_prop(vm, obj, prop, &at, &len))
    return e;
  *out = at ? (zm_u16)(at + 1) : 0;
  return ZM_ERR(OK);
}

zm_err zm_obj_get_prop_len(const Machine *vm, zm_u16 addr, zm_u16 *out)
{
  if (addr == 0)
  {
    *out = 0;
    return ZM_ERR(OK);
  }
  zm_u8 sb;
  if (zm_err e = zm_mem_read8_core(vm, (zm_u32)addr - 1, &sb))
    return e;
  *out = (zm_u16)((sb >> 5) + 1);
  return ZM_ERR(OK);
}

zm_err zm_obj_get_next_prop(const Machine *vm, zm_u16 obj, zm_u16 prop, zm_u16 *out)
{
  zm_u32 p;
  if (prop == 0)
  {
    if (zm_err e = first_prop(vm, obj, &p))
      return e;
  }
  else
  {
    if (zm_err e = check_prop_number(prop))
      return e;
    zm_u8 len;
    if (zm_err e = find_prop(vm, obj, prop, &p, &len))
      return e;
    if (!p)
      return ZM_ERR(InvalidProperty);
    p += 1u + len;
  }

  zm_u8 sb;
  if (zm_err e = zm_mem_read8_core(vm, p, &sb))
    return e;
  *out = sb & 0x1F;
  return ZM_ERR(OK);
}

/* ---- tree edits ---- */

zm_err zm_obj_remove(Machine *vm, zm_u16 obj)
{
  zm_u16 parent, sibling;
  if (zm_err e = zm_obj_parent(vm, obj, &parent))
    return e;
  if (parent == 0)
    return ZM_ERR(OK);
  if (zm_err e = zm_obj_sibling(vm, obj, &sibling))
    return e;

  zm_u16 cur;
  if (zm_err e = zm_obj_child(vm, parent, &cur))
    return e;

  if (cur == obj)
  {
    if (zm_err e = write_link(vm, parent, OBJ_CHILD, sibling))
      return e;
  }
  else
  {
    // Bounded walk: a corrupt sibling chain must not hang the interpreter
    for (int guard = 0; cur != 0; guard++)
    {
      if (guard > vm->object_count)
        return ZM_ERR(InvalidObject);
      zm_u16 next;
      if (zm_err e = zm_obj_sibling(vm, cur, &next))
        return e;
      if (next == obj)
      {
        if (zm_err e = write_link(vm, cur, OBJ_SIBLING, sibling))
          return e;
        break;
      }
      cur = next;
    }
  }

  if (zm_err e = write_link(vm, obj, OBJ_PARENT, 0))
    return e;
  return write_link(vm, obj, OBJ_SIBLING, 0);
}

zm_err zm_obj_insert(Machine *vm, zm_u16 obj, zm_u16 dest)
{
  zm_u32 e;
  if (zm_err err = entry_addr(vm, obj, &e))
    return err;
  if (zm_err err = entry_addr(vm, dest, &e))
    return err;

  // Only a direct self-loop is refused; other relinks are applied as asked
  if (obj == dest)
    return ZM_ERR(InvalidObject);

  if (zm_err err = zm_obj_remove(vm, obj))
    return err;

  zm_u16 first;
  if (zm_err err = zm_obj_child(vm, dest, &first))
    return err;
  if (zm_err err = write_link(vm, obj, OBJ_PARENT, dest))
    return err;
  if (zm_err err = write_link(vm, obj, OBJ_SIBLING, first))
    return err;
  return write_link(vm, dest, OBJ_CHILD, obj);
}

zm_u16 zm_obj_count_objects(const Machine *vm)
{
  zm_u32 lowest = vm->mem_size;
  zm_u16 n = 0;
  zm_u32 e = first_entry(vm);

  while (n < MAX_OBJECTS && e + ZM_OBJECT_ENTRY_SIZE <= lowest)
  {
    zm_u16 pt;
    if (zm_mem_read16_core(vm, e + OBJ_PROPS, &pt) != 0)
      break;
    if (pt < lowest)
      lowest = pt;
    if (e + ZM_OBJECT_ENTRY_SIZE > lowest)
      break;
    n++;
    e += ZM_OBJECT_ENTRY_SIZE;
  }
  return n;
}
