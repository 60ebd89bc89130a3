#pragma once
#include <stddef.h>

#include "zm/internal/machine.h"
#include "zm/zm_api.h"

/**
 * Z-character text codec (version 3).
 *
 * A string is a run of big-endian words holding three 5-bit Z-characters
 * each; the word with the top bit set ends it. Alphabets:
 *   A0  a-z
 *   A1  A-Z
 *   A2  escape, newline, 0-9 . , ! ? _ # ' " / \ - : ( )
 * Z-characters 1-3 splice an abbreviation, 4/5 shift the next character into
 * A1/A2, 6 in A2 starts a 10-bit ZSCII literal.
 */

/* Receives one decoded ZSCII code. */
typedef void (*ZmZsciiSink)(void *user, zm_u16 zscii);

/**
 * @brief Decode the string at addr.
 * @param max_bytes  Stop after this many bytes even without an end bit (0 = no limit).
 * @param out_next   Receives the address after the last word (may be NULL).
 */
zm_err zm_text_decode(const Machine *vm, zm_u32 addr, zm_u32 max_bytes, ZmZsciiSink sink,
                      void *user, zm_u32 *out_next);

/**
 * @brief Decode into a NUL-terminated UTF-8 buffer (truncated to cap).
 * @return Bytes written (excluding NUL) or a negative error code.
 */
int zm_text_decode_utf8(const Machine *vm, zm_u32 addr, char *buf, size_t cap);

/**
 * @brief Encode a word the way dictionary entries are stored.
 *
 * Input is lower-cased, truncated to 6 Z-characters and padded with 5s.
 */
void zm_text_encode(const char *word, size_t len, zm_u16 out[2]);

/**
 * @brief Map a ZSCII output code to UTF-8.
 * @return Number of bytes written to out (0 = code has no printable form).
 */
int zm_zscii_to_utf8(zm_u16 zscii, char out[4]);

/* Map a Unicode code point from input to ZSCII ('?' when unrepresentable). */
zm_u16 zm_unicode_to_zscii(uint32_t cp);
