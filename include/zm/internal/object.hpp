#pragma once
#include "zm/internal/machine.h"
#include "zm/zm_api.h"

/**
 * Object tree (V3 layout).
 *
 * Object table: 31 default property words, then 9-byte entries
 * [attributes:4][parent][sibling][child][property table:2].
 * Property table: [name length in words][encoded name][properties...][0],
 * each property prefixed by a size byte 32*(len-1) + number.
 */

enum
{
  ZM_ATTRIBUTE_COUNT = 32,
  ZM_PROPERTY_MAX = 31,
  ZM_OBJECT_ENTRY_SIZE = 9,
};

zm_err zm_obj_parent(const Machine *vm, zm_u16 obj, zm_u16 *out);
zm_err zm_obj_sibling(const Machine *vm, zm_u16 obj, zm_u16 *out);
zm_err zm_obj_child(const Machine *vm, zm_u16 obj, zm_u16 *out);

zm_err zm_obj_test_attr(const Machine *vm, zm_u16 obj, zm_u16 attr, bool *out);
zm_err zm_obj_set_attr(Machine *vm, zm_u16 obj, zm_u16 attr, bool value);

/* Address of the encoded short name. */
zm_err zm_obj_name_addr(const Machine *vm, zm_u16 obj, zm_u32 *out);

/**
 * @brief Property value: 1- or 2-byte properties, default table when absent.
 */
zm_err zm_obj_get_prop(const Machine *vm, zm_u16 obj, zm_u16 prop, zm_u16 *out);
zm_err zm_obj_put_prop(Machine *vm, zm_u16 obj, zm_u16 prop, zm_u16 value);

/* Data address of a property, 0 when the object lacks it. */
zm_err zm_obj_get_prop_addr(const Machine *vm, zm_u16 obj, zm_u16 prop, zm_u16 *out);

/* Length of the property whose data starts at addr; 0 for addr 0. */
zm_err zm_obj_get_prop_len(const Machine *vm, zm_u16 addr, zm_u16 *out);

/* Property after prop (first one for 0), 0 after the last. */
zm_err zm_obj_get_next_prop(const Machine *vm, zm_u16 obj, zm_u16 prop, zm_u16 *out);

/**
 * @brief Move obj to be the first child of dest.
 *
 * obj is detached first; dest's child link is read only after that.
 * Inserting an object into itself is InvalidObject.
 */
zm_err zm_obj_insert(Machine *vm, zm_u16 obj, zm_u16 dest);

/* Detach obj from its parent; parent and sibling become 0. */
zm_err zm_obj_remove(Machine *vm, zm_u16 obj);

/* Count objects: entries run up to the lowest property table. */
zm_u16 zm_obj_count_objects(const Machine *vm);
