#pragma once
#include <cstddef>
#include <cstdint>

namespace zm
{

/** Instruction form; 2OP opcodes may also be encoded in variable form. */
enum class Form : std::uint8_t
{
  OP0 = 0,
  OP1 = 1,
  OP2 = 2,
  VAR = 3,
};

/** Closed set of V3 opcodes. */
enum class Op : std::uint8_t
{
#define OP(name, form, num, kind) name,
#include <zm/opcodes.def>
#undef OP
  COUNT
};

// -----------------------------------------------------------------------------
// Operand/result classification used by the decoder
// -----------------------------------------------------------------------------
enum class OpKind : std::uint8_t
{
  N,   // no result
  S,   // store
  B,   // branch
  SB,  // store + branch
  T,   // inline string
  R,   // variable-number operand
  RB,  // variable-number operand + branch
  RS,  // variable-number operand + store
  C,   // call (store)
};

struct OpcodeEntry
{
  const char* name;
  Form form;
  std::uint8_t number;
  OpKind kind;
};

// -----------------------------------------------------------------------------
// Opcode table (auto-generated from opcodes.def), indexed by Op
// -----------------------------------------------------------------------------
static constexpr OpcodeEntry kOpcodeTable[] = {
#define OP(name, form, num, kind) {#name, Form::form, num, OpKind::kind},
#include <zm/opcodes.def>
#undef OP
};

static_assert(sizeof(kOpcodeTable) / sizeof(kOpcodeTable[0]) ==
                  static_cast<std::size_t>(Op::COUNT),
              "opcode table out of sync");

inline const OpcodeEntry& op_entry(Op op)
{
  return kOpcodeTable[static_cast<std::size_t>(op)];
}

inline bool op_stores(OpKind k)
{
  return k == OpKind::S || k == OpKind::SB || k == OpKind::RS || k == OpKind::C;
}

inline bool op_branches(OpKind k)
{
  return k == OpKind::B || k == OpKind::SB || k == OpKind::RB;
}

inline bool op_takes_varref(OpKind k)
{
  return k == OpKind::R || k == OpKind::RB || k == OpKind::RS;
}

/**
 * @brief Resolve (form, number) to an opcode.
 * @return false when version 3 defines nothing at that slot.
 */
inline bool op_lookup(Form form, std::uint8_t number, Op* out)
{
  switch ((static_cast<unsigned>(form) << 5) | number)
  {
#define OP(name, form, num, kind)                          \
  case (static_cast<unsigned>(Form::form) << 5) | (num): \
    *out = Op::name;                                       \
    return true;
#include <zm/opcodes.def>
#undef OP
    default:
      return false;
  }
}

}  // namespace zm
