#pragma once
#include <stddef.h>

#include "zm/internal/machine.h"
#include "zm/zm_api.h"

/**
 * Dictionary and input tokenization.
 *
 * Dictionary header: [n][n separator codes][entry length][entry count:2],
 * followed by entries sorted by their 4-byte encoded text.
 */

/* One word of a tokenized line. */
typedef struct ZmToken
{
  uint16_t start;  /**< Offset of the first character in the line */
  uint8_t length;  /**< Characters in the word */
  zm_u16 entry;    /**< Dictionary entry address, 0 when unknown */
} ZmToken;

/* Read the dictionary header at vm->header.dictionary. */
zm_err zm_dict_load(Machine *vm);

/* Binary search for an encoded key; returns the entry address or 0. */
zm_u16 zm_dict_lookup(const Machine *vm, const zm_u16 key[2]);

/**
 * @brief Split a lower-cased line into words and look each one up.
 *
 * Spaces separate words; every dictionary separator is a word of its own.
 * @return Number of tokens found (may exceed max; only max are stored).
 */
int zm_tokenize(const Machine *vm, const char *line, size_t len, ZmToken *out, int max);

/**
 * @brief Fill the `sread` text and parse buffers from one input line.
 *
 * Text buffer: [max][chars...][0]. Parse buffer: [max][count] then
 * 4-byte records [entry:2][length][position in text buffer].
 */
zm_err zm_dict_store_input(Machine *vm, zm_u16 text_addr, zm_u16 parse_addr, const char *line,
                           size_t len);
