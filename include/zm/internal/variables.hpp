#pragma once
#include "zm/internal/machine.h"
#include "zm/zm_api.h"

/**
 * Variable and stack model.
 *
 * Variable numbers:
 *   0        top of the current frame's evaluation stack
 *   1..15    locals of the current routine (only those it declares)
 *   16..255  globals, stored as words in the global table
 *
 * zm_var_read/zm_var_write pop and push for variable 0.
 * zm_var_peek/zm_var_poke touch the top slot in place; they back the
 * `load` and `store` opcodes.
 */

zm_err zm_stack_push(Machine *vm, zm_u16 v);
zm_err zm_stack_pop(Machine *vm, zm_u16 *out);
zm_err zm_stack_peek(const Machine *vm, zm_u16 *out);
zm_err zm_stack_poke(Machine *vm, zm_u16 v);

zm_err zm_var_read_core(Machine *vm, zm_u8 var, zm_u16 *out);
zm_err zm_var_write_core(Machine *vm, zm_u8 var, zm_u16 val);
zm_err zm_var_peek_core(Machine *vm, zm_u8 var, zm_u16 *out);
zm_err zm_var_poke_core(Machine *vm, zm_u8 var, zm_u16 val);

/* Current frame (never NULL once the interpreter is created). */
static inline ZmFrame *zm_frame_top(Machine *vm)
{
  return &vm->frames[vm->frame_count - 1];
}

/**
 * @brief Enter a routine.
 *
 * Packed address 0 stores 0 (unless discarded) without pushing a frame.
 *
 * @param packed     Packed routine address.
 * @param args       Argument values (copied over the declared defaults).
 * @param argc       Number of arguments (0-3 in V3).
 * @param store_var  Variable receiving the result.
 * @param discard    Non-zero to drop the result.
 * @param return_pc  Address execution resumes at after the return.
 */
zm_err zm_call_routine(Machine *vm, zm_u16 packed, const zm_u16 *args, int argc,
                       zm_u8 store_var, int discard, zm_u32 return_pc);

/**
 * @brief Leave the current routine with a value.
 *
 * Drops the frame's stack window, resumes the caller and stores the value.
 */
zm_err zm_return(Machine *vm, zm_u16 value);
