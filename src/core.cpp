// src/core.cpp: fetch/decode/execute loop and the public execution API
#include <cstdint>
#include <cstdio>

#include "zm/errors.hpp"
#include "zm/internal/decode.hpp"
#include "zm/internal/dictionary.hpp"
#include "zm/internal/machine.h"
#include "zm/internal/memory.hpp"
#include "zm/internal/object.hpp"
#include "zm/internal/output.hpp"
#include "zm/internal/random.hpp"
#include "zm/internal/text.hpp"
#include "zm/internal/variables.hpp"
#include "zm/panic.h"
#include "zm/zm_api.h"

using zm::Form;
using zm::Instruction;
using zm::Op;
using zm::OperandType;

namespace
{

const int kZmVersion = 1;
const zm_u16 kZsciiNewline = 13;
const size_t kInputMax = 256;
const size_t kTraceLineMax = 160;

/* Fewest operands each opcode can execute with. */
int min_operands(const Instruction &ins)
{
  switch (ins.form)
  {
    case Form::OP0:
      return 0;
    case Form::OP1:
      return 1;
    case Form::OP2:
      return 2;
    case Form::VAR:
      break;
  }
  switch (ins.op)
  {
    case Op::STOREW:
    case Op::STOREB:
    case Op::PUT_PROP:
      return 3;
    case Op::SREAD:
      return 2;
    case Op::SOUND_EFFECT:
    case Op::INPUT_STREAM:
      return 0;
    default:
      return 1;
  }
}

/* Operand values in order; variable operands are read (and popped) left to right. */
zm_err resolve(Machine *vm, const Instruction &ins, zm_u16 v[4])
{
  for (int i = 0; i < 4; i++)
    v[i] = 0;
  for (int i = 0; i < ins.operand_count; i++)
  {
    const zm::Operand &o = ins.operands[i];
    if (o.type == OperandType::Variable)
    {
      if (zm_err e = zm_var_read_core(vm, (zm_u8)o.value, &v[i]))
        return e;
    }
    else
      v[i] = o.value;
  }
  return ZM_ERR(OK);
}

inline zm_err store(Machine *vm, const Instruction &ins, zm_u16 value)
{
  return zm_var_write_core(vm, ins.store_var, value);
}

/* Offsets 0 and 1 return false/true from the current routine. */
zm_err branch(Machine *vm, const Instruction &ins, bool cond)
{
  if (cond != ins.branch_on_true)
    return ZM_ERR(OK);
  if (ins.branch_offset == 0)
    return zm_return(vm, 0);
  if (ins.branch_offset == 1)
    return zm_return(vm, 1);
  vm->pc = (zm_u32)((int32_t)ins.next + ins.branch_offset - 2);
  return ZM_ERR(OK);
}

inline zm_u16 wrap16(int32_t v)
{
  return (zm_u16)(uint32_t)v;
}

/* Decode UTF-8 input to lower-case ZSCII; line ends are dropped. */
size_t input_to_zscii(const char *in, size_t len, char *out, size_t cap)
{
  size_t n = 0;
  size_t i = 0;
  while (i < len && n < cap)
  {
    uint8_t c = (uint8_t)in[i];
    uint32_t cp;
    size_t extra;
    if (c < 0x80)
    {
      cp = c;
      extra = 0;
    }
    else if ((c & 0xE0) == 0xC0)
    {
      cp = c & 0x1F;
      extra = 1;
    }
    else if ((c & 0xF0) == 0xE0)
    {
      cp = c & 0x0F;
      extra = 2;
    }
    else
    {
      cp = c & 0x07;
      extra = 3;
    }
    i++;
    for (size_t k = 0; k < extra && i < len; k++, i++)
      cp = (cp << 6) | ((uint8_t)in[i] & 0x3F);

    if (cp == '\n' || cp == '\r')
      continue;
    if (cp == '\t' || cp == '\v' || cp == '\f')
      cp = ' ';
    if (cp >= 'A' && cp <= 'Z')
      cp += 'a' - 'A';
    out[n++] = (char)zm_unicode_to_zscii(cp);
  }
  return n;
}

zm_err exec_sread(Machine *vm, const Instruction &ins)
{
  if (!vm->input_pending)
  {
    if (zm_err e = zm_out_status(vm))
      return e;
  }

  // Ask the host before touching operands so a suspended read can re-run
  char line[kInputMax];
  int n = vm->host.read_line(vm->host.user, line, sizeof(line));
  if (n == ZM_HOST_PENDING)
  {
    vm->input_pending = 1;
    vm->pc = ins.addr;
    return ZM_STEP_INPUT;
  }
  vm->input_pending = 0;
  if (n == ZM_HOST_EOF)
    return ZM_ERR(InputClosed);
  if (n < 0)
    return ZM_ERR(HostIo);
  if ((size_t)n > sizeof(line))
    n = (int)sizeof(line);

  zm_u16 v[4];
  if (zm_err e = resolve(vm, ins, v))
    return e;

  char zscii[kInputMax];
  size_t len = input_to_zscii(line, (size_t)n, zscii, sizeof(zscii));
  return zm_dict_store_input(vm, v[0], v[1], zscii, len);
}

zm_err exec_print_obj(Machine *vm, zm_u16 obj)
{
  zm_u32 addr;
  zm_u8 words;
  if (zm_err e = zm_obj_name_addr(vm, obj, &addr))
    return e;
  if (zm_err e = zm_mem_read8_core(vm, addr - 1, &words))
    return e;
  if (words == 0)
    return ZM_ERR(OK);
  return zm_out_string(vm, addr, nullptr);
}

zm_err execute(Machine *vm, const Instruction &ins)
{
  if (ins.operand_count < min_operands(ins))
    return ZM_ERR(DecodeError);

  vm->pc = ins.next;

  if (ins.op == Op::SREAD)
    return exec_sread(vm, ins);

  zm_u16 v[4];
  if (zm_err e = resolve(vm, ins, v))
    return e;
  zm_u16 a = v[0], b = v[1];
  zm_i16 sa = (zm_i16)a, sb = (zm_i16)b;

  switch (ins.op)
  {
    /* ---- comparisons and branches ---- */
    case Op::JE:
    {
      bool hit = false;
      for (int i = 1; i < ins.operand_count; i++)
        hit = hit || v[i] == a;
      return branch(vm, ins, hit);
    }
    case Op::JL:
      return branch(vm, ins, sa < sb);
    case Op::JG:
      return branch(vm, ins, sa > sb);
    case Op::JZ:
      return branch(vm, ins, a == 0);
    case Op::TEST:
      return branch(vm, ins, (a & b) == b);

    case Op::DEC_CHK:
    case Op::INC_CHK:
    {
      zm_u16 old;
      if (zm_err e = zm_var_read_core(vm, (zm_u8)a, &old))
        return e;
      zm_i16 nv = (zm_i16)(ins.op == Op::INC_CHK ? old + 1 : old - 1);
      if (zm_err e = zm_var_write_core(vm, (zm_u8)a, (zm_u16)nv))
        return e;
      return branch(vm, ins, ins.op == Op::INC_CHK ? nv > sb : nv < sb);
    }

    case Op::JUMP:
      vm->pc = (zm_u32)((int32_t)ins.next + sa - 2);
      return ZM_ERR(OK);

    /* ---- arithmetic (signed 16-bit, wrapping) ---- */
    case Op::ADD:
      return store(vm, ins, wrap16((int32_t)sa + sb));
    case Op::SUB:
      return store(vm, ins, wrap16((int32_t)sa - sb));
    case Op::MUL:
      return store(vm, ins, wrap16((int32_t)sa * sb));
    case Op::DIV:
      if (sb == 0)
        return ZM_ERR(DivByZero);
      return store(vm, ins, wrap16((int32_t)sa / sb));
    case Op::MOD:
      if (sb == 0)
        return ZM_ERR(DivByZero);
      return store(vm, ins, wrap16((int32_t)sa % sb));
    case Op::OR:
      return store(vm, ins, (zm_u16)(a | b));
    case Op::AND:
      return store(vm, ins, (zm_u16)(a & b));
    case Op::NOT:
      return store(vm, ins, (zm_u16)~a);

    /* ---- variables and stack ---- */
    case Op::STORE:
      return zm_var_poke_core(vm, (zm_u8)a, b);
    case Op::LOAD:
    {
      zm_u16 val;
      if (zm_err e = zm_var_peek_core(vm, (zm_u8)a, &val))
        return e;
      return store(vm, ins, val);
    }
    case Op::INC:
    case Op::DEC:
    {
      zm_u16 val;
      if (zm_err e = zm_var_read_core(vm, (zm_u8)a, &val))
        return e;
      val = (zm_u16)(ins.op == Op::INC ? val + 1 : val - 1);
      return zm_var_write_core(vm, (zm_u8)a, val);
    }
    case Op::PUSH:
      return zm_stack_push(vm, a);
    case Op::PULL:
    {
      zm_u16 val;
      if (zm_err e = zm_stack_pop(vm, &val))
        return e;
      return zm_var_poke_core(vm, (zm_u8)a, val);
    }
    case Op::POP:
    {
      zm_u16 dropped;
      return zm_stack_pop(vm, &dropped);
    }

    /* ---- memory ---- */
    case Op::LOADW:
    {
      zm_u16 val;
      if (zm_err e = zm_mem_read16_core(vm, (zm_u16)(a + 2u * b), &val))
        return e;
      return store(vm, ins, val);
    }
    case Op::LOADB:
    {
      zm_u8 val;
      if (zm_err e = zm_mem_read8_core(vm, (zm_u16)(a + b), &val))
        return e;
      return store(vm, ins, val);
    }
    case Op::STOREW:
      return zm_mem_write16_core(vm, (zm_u16)(a + 2u * b), v[2]);
    case Op::STOREB:
      return zm_mem_write8_core(vm, (zm_u16)(a + b), (zm_u8)v[2]);

    /* ---- objects ---- */
    case Op::JIN:
    {
      zm_u16 parent;
      if (zm_err e = zm_obj_parent(vm, a, &parent))
        return e;
      return branch(vm, ins, parent == b);
    }
    case Op::TEST_ATTR:
    {
      bool set;
      if (zm_err e = zm_obj_test_attr(vm, a, b, &set))
        return e;
      return branch(vm, ins, set);
    }
    case Op::SET_ATTR:
      return zm_obj_set_attr(vm, a, b, true);
    case Op::CLEAR_ATTR:
      return zm_obj_set_attr(vm, a, b, false);
    case Op::INSERT_OBJ:
      return zm_obj_insert(vm, a, b);
    case Op::REMOVE_OBJ:
      return zm_obj_remove(vm, a);
    case Op::GET_SIBLING:
    case Op::GET_CHILD:
    {
      zm_u16 rel;
      zm_err e = ins.op == Op::GET_SIBLING ? zm_obj_sibling(vm, a, &rel) : zm_obj_child(vm, a, &rel);
      if (e)
        return e;
      if (zm_err e2 = store(vm, ins, rel))
        return e2;
      return branch(vm, ins, rel != 0);
    }
    case Op::GET_PARENT:
    {
      zm_u16 parent;
      if (zm_err e = zm_obj_parent(vm, a, &parent))
        return e;
      return store(vm, ins, parent);
    }
    case Op::GET_PROP:
    case Op::GET_PROP_ADDR:
    case Op::GET_NEXT_PROP:
    case Op::GET_PROP_LEN:
    {
      zm_u16 val;
      zm_err e;
      if (ins.op == Op::GET_PROP)
        e = zm_obj_get_prop(vm, a, b, &val);
      else if (ins.op == Op::GET_PROP_ADDR)
        e = zm_obj_get_prop_addr(vm, a, b, &val);
      else if (ins.op == Op::GET_NEXT_PROP)
        e = zm_obj_get_next_prop(vm, a, b, &val);
      else
        e = zm_obj_get_prop_len(vm, a, &val);
      if (e)
        return e;
      return store(vm, ins, val);
    }
    case Op::PUT_PROP:
      return zm_obj_put_prop(vm, a, b, v[2]);

    /* ---- calls and returns ---- */
    case Op::CALL:
      return zm_call_routine(vm, a, v + 1, ins.operand_count - 1, ins.store_var, 0, ins.next);
    case Op::RET:
      return zm_return(vm, a);
    case Op::RTRUE:
      return zm_return(vm, 1);
    case Op::RFALSE:
      return zm_return(vm, 0);
    case Op::RET_POPPED:
    {
      zm_u16 val;
      if (zm_err e = zm_stack_pop(vm, &val))
        return e;
      return zm_return(vm, val);
    }

    /* ---- text output ---- */
    case Op::PRINT:
      return zm_out_string(vm, ins.text_addr, nullptr);
    case Op::PRINT_RET:
      if (zm_err e = zm_out_string(vm, ins.text_addr, nullptr))
        return e;
      if (zm_err e = zm_out_zscii(vm, kZsciiNewline))
        return e;
      return zm_return(vm, 1);
    case Op::PRINT_ADDR:
      return zm_out_string(vm, a, nullptr);
    case Op::PRINT_PADDR:
      return zm_out_string(vm, zm_string_address(a), nullptr);
    case Op::PRINT_OBJ:
      return exec_print_obj(vm, a);
    case Op::PRINT_CHAR:
      return zm_out_zscii(vm, a);
    case Op::PRINT_NUM:
    {
      char num[8];
      snprintf(num, sizeof(num), "%d", (int)sa);
      return zm_out_ascii(vm, num);
    }
    case Op::NEW_LINE:
      return zm_out_zscii(vm, kZsciiNewline);
    case Op::SHOW_STATUS:
      return zm_out_status(vm);

    /* ---- screen and streams ---- */
    case Op::SPLIT_WINDOW:
      if (vm->host.split_window)
        vm->host.split_window(vm->host.user, sa);
      return ZM_ERR(OK);
    case Op::SET_WINDOW:
      if (vm->host.set_window)
        vm->host.set_window(vm->host.user, sa);
      return ZM_ERR(OK);
    case Op::OUTPUT_STREAM:
      if (sa == 3 && ins.operand_count < 2)
        return ZM_ERR(DecodeError);
      return zm_out_select(vm, sa, b);
    case Op::INPUT_STREAM:
    case Op::SOUND_EFFECT:
    case Op::NOP:
      return ZM_ERR(OK);

    /* ---- random ---- */
    case Op::RANDOM:
      if (sa > 0)
        return store(vm, ins, zm_random_next(&vm->rng, a));
      if (sa < 0)
        zm_random_seed(&vm->rng, sa);
      else
        zm_random_seed_prng(&vm->rng, zm_random_entropy(vm));
      return store(vm, ins, 0);

    /* ---- session ---- */
    case Op::SAVE:
    case Op::RESTORE:
      // No persistence: report failure through the branch
      return branch(vm, ins, false);
    case Op::RESTART:
      return ZM_ERR(Unsupported);
    case Op::VERIFY:
      return branch(vm, ins, vm->header.checksum == vm->checksum);
    case Op::QUIT:
      vm->quit = 1;
      return ZM_STEP_QUIT;

    case Op::SREAD:
    case Op::COUNT:
      break;
  }
  return ZM_ERR(InvalidOpcode);
}

zm_err step_core(Machine *vm)
{
  vm->op_pc = vm->pc;

  Instruction ins;
  if (zm_err e = zm::decode(vm, vm->pc, &ins))
    return e;

  if (vm->trace_fn)
  {
    char line[kTraceLineMax];
    zm::format(vm, ins, line, sizeof(line));
    vm->trace_fn(vm->trace_user, line);
  }

  return execute(vm, ins);
}

}  // namespace

/* ============================ Execution API ============================== */

extern "C" zm_err zm_step(struct Machine *vm)
{
  if (!vm)
    return ZM_ERR(InvalidArg);
  if (vm->last_err)
    return vm->last_err;
  if (vm->quit)
    return ZM_STEP_QUIT;

  zm_err r = step_core(vm);
  if (r < 0)
    vm->last_err = r;
  return r;
}

extern "C" zm_err zm_run(struct Machine *vm)
{
  if (!vm)
    return ZM_ERR(InvalidArg);
  if (vm->last_err)
    return vm->last_err;

  for (;;)
  {
    zm_err r = zm_step(vm);
    if (r < 0)
      return zm_panic(vm, r);
    if (r != ZM_STEP_OK)
      return r;
  }
}

/* ============================== Inspection =============================== */

extern "C" zm_u32 zm_pc(struct Machine *vm)
{
  return vm ? vm->pc : 0;
}

extern "C" int zm_object_count(struct Machine *vm)
{
  return vm ? vm->object_count : 0;
}

extern "C" zm_err zm_last_error(struct Machine *vm)
{
  return vm ? vm->last_err : ZM_ERR(InvalidArg);
}

extern "C" int zm_disassemble(struct Machine *vm, zm_u32 addr, char *buf, size_t cap)
{
  if (!vm || !buf || cap == 0)
    return ZM_ERR(InvalidArg);
  Instruction ins;
  if (zm_err e = zm::decode(vm, addr, &ins))
  {
    buf[0] = '\0';
    return e;
  }
  return zm::format(vm, ins, buf, cap);
}

extern "C" void zm_set_trace(struct Machine *vm, ZmTraceFn fn, void *user)
{
  if (!vm)
    return;
  vm->trace_fn = fn;
  vm->trace_user = user;
}

extern "C" int zm_version(void)
{
  return kZmVersion;
}

extern "C" const char *zm_err_str(zm_err e)
{
  return err_str(static_cast<Err>(e));
}
