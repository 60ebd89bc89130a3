// src/variables.cpp: evaluation stack, variables and call frames
#include "zm/internal/variables.hpp"

#include "zm/errors.hpp"
#include "zm/internal/machine.h"
#include "zm/internal/memory.hpp"
#include "zm/zm_api.h"

/* ========================== Evaluation stack ============================= */

zm_err zm_stack_push(Machine *vm, zm_u16 v)
{
  if (vm->sp >= Machine::ZM_STACK_SIZE)
    return ZM_ERR(StackOverflow);
  vm->stack[vm->sp++] = v;
  return ZM_ERR(OK);
}

zm_err zm_stack_pop(Machine *vm, zm_u16 *out)
{
  // A frame never pops into its caller's window
  if (vm->sp <= zm_frame_top(vm)->stack_base)
    return ZM_ERR(StackUnderflow);
  *out = vm->stack[--vm->sp];
  return ZM_ERR(OK);
}

zm_err zm_stack_peek(const Machine *vm, zm_u16 *out)
{
  if (vm->sp <= vm->frames[vm->frame_count - 1].stack_base)
    return ZM_ERR(StackUnderflow);
  *out = vm->stack[vm->sp - 1];
  return ZM_ERR(OK);
}

zm_err zm_stack_poke(Machine *vm, zm_u16 v)
{
  if (vm->sp <= zm_frame_top(vm)->stack_base)
    return ZM_ERR(StackUnderflow);
  vm->stack[vm->sp - 1] = v;
  return ZM_ERR(OK);
}

/* ============================== Variables ================================ */

static inline zm_err local_slot(Machine *vm, zm_u8 var, zm_u16 **slot)
{
  ZmFrame *f = zm_frame_top(vm);
  if (var > f->num_locals)
    return ZM_ERR(InvalidVariable);
  *slot = &f->locals[var - 1];
  return ZM_ERR(OK);
}

static inline zm_u32 global_addr(const Machine *vm, zm_u8 var)
{
  return (zm_u32)vm->header.globals + 2u * (zm_u32)(var - 16);
}

zm_err zm_var_read_core(Machine *vm, zm_u8 var, zm_u16 *out)
{
  if (var == 0)
    return zm_stack_pop(vm, out);
  if (var < 16)
  {
    zm_u16 *slot;
    if (zm_err e = local_slot(vm, var, &slot))
      return e;
    *out = *slot;
    return ZM_ERR(OK);
  }
  return zm_mem_read16_core(vm, global_addr(vm, var), out);
}

zm_err zm_var_write_core(Machine *vm, zm_u8 var, zm_u16 val)
{
  if (var == 0)
    return zm_stack_push(vm, val);
  if (var < 16)
  {
    zm_u16 *slot;
    if (zm_err e = local_slot(vm, var, &slot))
      return e;
    *slot = val;
    return ZM_ERR(OK);
  }
  return zm_mem_write16_core(vm, global_addr(vm, var), val);
}

zm_err zm_var_peek_core(Machine *vm, zm_u8 var, zm_u16 *out)
{
  if (var == 0)
    return zm_stack_peek(vm, out);
  return zm_var_read_core(vm, var, out);
}

zm_err zm_var_poke_core(Machine *vm, zm_u8 var, zm_u16 val)
{
  if (var == 0)
    return zm_stack_poke(vm, val);
  return zm_var_write_core(vm, var, val);
}

/* ============================ Call / Return ============================== */

zm_err zm_call_routine(Machine *vm, zm_u16 packed, const zm_u16 *args, int argc,
                       zm_u8 store_var, int discard, zm_u32 return_pc)
{
  if (packed == 0)
  {
    vm->pc = return_pc;
    if (discard)
      return ZM_ERR(OK);
    return zm_var_write_core(vm, store_var, 0);
  }

  if (vm->frame_count >= Machine::ZM_MAX_FRAMES)
    return ZM_ERR(CallDepth);

  zm_u32 addr = zm_routine_address(packed);
  zm_u8 num_locals;
  if (zm_err e = zm_mem_read8_core(vm, addr, &num_locals))
    return e;
  if (num_locals > 15)
    return ZM_ERR(DecodeError);

  ZmFrame *f = &vm->frames[vm->frame_count];
  f->return_pc = return_pc;
  f->routine = addr;
  f->num_locals = num_locals;
  f->store_var = store_var;
  f->discard = (uint8_t)(discard ? 1 : 0);
  f->arg_count = (uint8_t)argc;
  f->stack_base = (uint16_t)vm->sp;

  // Declared defaults first, then the supplied arguments over them
  for (int i = 0; i < num_locals; i++)
  {
    zm_u16 v;
    if (zm_err e = zm_mem_read16_core(vm, addr + 1 + 2u * (zm_u32)i, &v))
      return e;
    f->locals[i] = (i < argc) ? args[i] : v;
  }

  vm->frame_count++;
  vm->pc = addr + 1 + 2u * num_locals;
  return ZM_ERR(OK);
}

zm_err zm_return(Machine *vm, zm_u16 value)
{
  if (vm->frame_count <= 1)
    return ZM_ERR(ReturnFromMain);

  ZmFrame f = vm->frames[--vm->frame_count];
  vm->sp = f.stack_base;
  vm->pc = f.return_pc;
  if (f.discard)
    return ZM_ERR(OK);
  return zm_var_write_core(vm, f.store_var, value);
}

/* ===================== Public variable / stack API ======================= */

extern "C" zm_err zm_var_read(struct Machine *vm, zm_u8 var, zm_u16 *out)
{
  if (!vm || !out)
    return ZM_ERR(InvalidArg);
  return zm_var_read_core(vm, var, out);
}

extern "C" zm_err zm_var_write(struct Machine *vm, zm_u8 var, zm_u16 val)
{
  if (!vm)
    return ZM_ERR(InvalidArg);
  return zm_var_write_core(vm, var, val);
}

extern "C" int zm_stack_depth(struct Machine *vm)
{
  if (!vm)
    return 0;
  return vm->sp - zm_frame_top(vm)->stack_base;
}

extern "C" int zm_frame_depth(struct Machine *vm)
{
  if (!vm)
    return 0;
  return vm->frame_count;
}
