#pragma once
#include <stddef.h>

#include "zm/internal/machine.h"
#include "zm/zm_api.h"

/**
 * Output stream routing.
 *
 * While a stream 3 table is open it receives all text exclusively.
 * Otherwise text goes to the screen (stream 1) when enabled and to the
 * transcript when flags2 bit 0 is set.
 */

zm_err zm_out_zscii(Machine *vm, zm_u16 zscii);
zm_err zm_out_ascii(Machine *vm, const char *s);

/* Decode and print the string at addr; out_next as for zm_text_decode. */
zm_err zm_out_string(Machine *vm, zm_u32 addr, zm_u32 *out_next);

/* output_stream with a signed stream number; table used by stream 3. */
zm_err zm_out_select(Machine *vm, zm_i16 stream, zm_u16 table);

/* Send the V3 status line to the host. */
zm_err zm_out_status(Machine *vm);
