#pragma once
#include <stddef.h>

#include "zm/internal/machine.h"
#include "zm/opcodes.hpp"
#include "zm/zm_api.h"

/**
 * Instruction decoder. Pure: reads the address space, never mutates it,
 * so it can run on arbitrary bytes independently of execution.
 */

namespace zm
{

enum class OperandType : std::uint8_t
{
  Large = 0,
  Small = 1,
  Variable = 2,
  Omitted = 3,
};

struct Operand
{
  OperandType type;
  zm_u16 value;  // constant, or variable number
};

struct Instruction
{
  zm_u32 addr;        // first byte
  zm_u32 next;        // first byte after the whole instruction
  Op op;
  Form form;
  std::uint8_t number;
  std::uint8_t operand_count;
  Operand operands[4];
  bool has_store;
  std::uint8_t store_var;
  bool has_branch;
  bool branch_on_true;
  std::int16_t branch_offset;  // 0 = rfalse, 1 = rtrue, else jump
  zm_u32 text_addr;            // inline string (print, print_ret)
};

/**
 * @brief Decode the instruction at addr.
 * @return 0, OobMemory when it runs off the image, InvalidOpcode for
 *         slots version 3 leaves empty, DecodeError for bad operand types.
 */
zm_err decode(const Machine *vm, zm_u32 addr, Instruction *out);

/**
 * @brief One-line disassembly, e.g. "[00004F05] ADD L00,#01 -> G03".
 * @return Length written (excluding NUL).
 */
int format(const Machine *vm, const Instruction &ins, char *buf, size_t cap);

}  // namespace zm
