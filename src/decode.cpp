#include "zm/internal/decode.hpp"

#include <stdarg.h>
#include <stdio.h>

#include "zm/errors.hpp"
#include "zm/internal/memory.hpp"
#include "zm/internal/text.hpp"

namespace zm
{

namespace
{

/* Bounds-checked forward reader over the address space. */
struct Cursor
{
  const Machine* vm;
  zm_u32 p;

  zm_err u8(std::uint8_t* out)
  {
    if (zm_err e = zm_mem_read8_core(vm, p, out))
      return e;
    p += 1;
    return ZM_ERR(OK);
  }

  zm_err u16(zm_u16* out)
  {
    if (zm_err e = zm_mem_read16_core(vm, p, out))
      return e;
    p += 2;
    return ZM_ERR(OK);
  }
};

zm_err read_operand(Cursor& c, OperandType t, Operand* out)
{
  out->type = t;
  if (t == OperandType::Large)
    return c.u16(&out->value);

  std::uint8_t b;
  if (zm_err e = c.u8(&b))
    return e;
  out->value = b;
  return ZM_ERR(OK);
}

void discard_zscii(void*, zm_u16) {}

}  // namespace

zm_err decode(const Machine* vm, zm_u32 addr, Instruction* out)
{
  Cursor c = {vm, addr};
  Instruction& ins = *out;
  ins.addr = addr;
  ins.operand_count = 0;
  ins.has_store = false;
  ins.store_var = 0;
  ins.has_branch = false;
  ins.branch_on_true = false;
  ins.branch_offset = 0;
  ins.text_addr = 0;

  std::uint8_t b0;
  if (zm_err e = c.u8(&b0))
    return e;

  OperandType types[4];
  int count = 0;

  if (b0 >= 0xC0)
  {
    // Variable form: bit 5 clear means a 2OP opcode with a types byte
    ins.form = (b0 & 0x20) ? Form::VAR : Form::OP2;
    ins.number = b0 & 0x1F;

    std::uint8_t tb;
    if (zm_err e = c.u8(&tb))
      return e;
    for (int i = 0; i < 4; i++)
    {
      OperandType t = static_cast<OperandType>((tb >> (6 - 2 * i)) & 0x03);
      if (t == OperandType::Omitted)
        break;
      types[count++] = t;
    }
  }
  else if (b0 >= 0x80)
  {
    // Short form: bits 4-5 give the single operand type, 3 means none
    OperandType t = static_cast<OperandType>((b0 >> 4) & 0x03);
    ins.number = b0 & 0x0F;
    if (t == OperandType::Omitted)
      ins.form = Form::OP0;
    else
    {
      ins.form = Form::OP1;
      types[count++] = t;
    }
  }
  else
  {
    // Long form: always two operands, small constant or variable
    ins.form = Form::OP2;
    ins.number = b0 & 0x1F;
    types[count++] = (b0 & 0x40) ? OperandType::Variable : OperandType::Small;
    types[count++] = (b0 & 0x20) ? OperandType::Variable : OperandType::Small;
  }

  if (!op_lookup(ins.form, ins.number, &ins.op))
    return ZM_ERR(InvalidOpcode);

  for (int i = 0; i < count; i++)
  {
    if (zm_err e = read_operand(c, types[i], &ins.operands[i]))
      return e;
  }
  ins.operand_count = static_cast<std::uint8_t>(count);

  OpKind kind = op_entry(ins.op).kind;

  if (op_stores(kind))
  {
    if (zm_err e = c.u8(&ins.store_var))
      return e;
    ins.has_store = true;
  }

  if (op_branches(kind))
  {
    std::uint8_t b1;
    if (zm_err e = c.u8(&b1))
      return e;
    ins.has_branch = true;
    ins.branch_on_true = (b1 & 0x80) != 0;
    if (b1 & 0x40)
    {
      ins.branch_offset = static_cast<std::int16_t>(b1 & 0x3F);
    }
    else
    {
      std::uint8_t b2;
      if (zm_err e = c.u8(&b2))
        return e;
      int raw = ((b1 & 0x3F) << 8) | b2;
      if (raw & 0x2000)
        raw -= 0x4000;
      ins.branch_offset = static_cast<std::int16_t>(raw);
    }
  }

  if (kind == OpKind::T)
  {
    ins.text_addr = c.p;
    zm_u32 end;
    if (zm_err e = zm_text_decode(vm, c.p, 0, discard_zscii, nullptr, &end))
      return e;
    c.p = end;
  }

  ins.next = c.p;
  return ZM_ERR(OK);
}

/* ============================ Disassembly ================================ */

namespace
{

struct Writer
{
  char* buf;
  size_t cap;
  size_t len;

  void put(const char* fmt, ...)
  {
    if (len >= cap)
      return;
    va_list ap;
    va_start(ap, fmt);
    int n = vsnprintf(buf + len, cap - len, fmt, ap);
    va_end(ap);
    if (n > 0)
      len += static_cast<size_t>(n);
    if (len >= cap)
      len = cap - 1;
  }

  void variable(zm_u16 var)
  {
    if (var == 0)
      put("SP");
    else if (var < 16)
      put("L%02X", var - 1);
    else
      put("G%02X", var - 16);
  }
};

struct QuoteSink
{
  Writer* w;
  int chars;
};

const int kQuoteMax = 32;

void quote_zscii(void* user, zm_u16 z)
{
  QuoteSink* q = static_cast<QuoteSink*>(user);
  if (q->chars++ >= kQuoteMax)
    return;
  char tmp[4];
  int n = zm_zscii_to_utf8(z, tmp);
  if (n == 1 && tmp[0] == '\n')
    q->w->put("^");
  else if (n > 0)
    q->w->put("%.*s", n, tmp);
}

}  // namespace

int format(const Machine* vm, const Instruction& ins, char* buf, size_t cap)
{
  if (!buf || cap == 0)
    return 0;
  buf[0] = '\0';
  Writer w = {buf, cap, 0};
  OpKind kind = op_entry(ins.op).kind;

  w.put("[%08X] %s", static_cast<unsigned>(ins.addr), op_entry(ins.op).name);

  for (int i = 0; i < ins.operand_count; i++)
  {
    const Operand& o = ins.operands[i];
    w.put(i == 0 ? " " : ",");
    if (o.type == OperandType::Variable)
      w.variable(o.value);
    else if (i == 0 && op_takes_varref(kind))
    {
      // Constant names the variable to operate on
      w.put("[");
      w.variable(o.value);
      w.put("]");
    }
    else if (o.type == OperandType::Large)
      w.put("#%04X", o.value);
    else
      w.put("#%02X", o.value);
  }

  if (kind == OpKind::T)
  {
    QuoteSink q = {&w, 0};
    w.put(" \"");
    zm_err e = zm_text_decode(vm, ins.text_addr, 0, quote_zscii, &q, nullptr);
    if (e || q.chars > kQuoteMax)
      w.put("...");
    w.put("\"");
  }

  if (ins.has_store)
  {
    w.put(" -> ");
    w.variable(ins.store_var);
  }

  if (ins.has_branch)
  {
    w.put(ins.branch_on_true ? " ?" : " ?~");
    if (ins.branch_offset == 0)
      w.put("RFALSE");
    else if (ins.branch_offset == 1)
      w.put("RTRUE");
    else
      w.put("%08X", static_cast<unsigned>(ins.next + ins.branch_offset - 2));
  }

  return static_cast<int>(w.len);
}

}  // namespace zm
