#include "zm/panic.h"

#include <inttypes.h>
#include <stdio.h>

#include "zm/errors.hpp"
#include "zm/internal/machine.h"  // For Machine struct definition
#include "zm/panic.hpp"
#include "zm/zm_api.h"

extern "C"
{
  void zm_set_panic_handler(struct Machine *vm, ZmPanicHandler handler, void *user_data)
  {
    if (!vm)
      return;

    vm->panic_handler = handler;
    vm->panic_user_data = user_data;
  }

  int zm_panic(struct Machine *vm, int error_code)
  {
    if (!vm)
      return error_code;

    // Collect panic information
    ZmPanicInfo info;
    info.error_code = error_code;
    info.pc = vm->op_pc;
    info.tos = 0;
    info.nos = 0;
    info.stack_depth = (uint16_t)zm_stack_depth(vm);
    info.frame_depth = (uint16_t)zm_frame_depth(vm);
    info.has_stack_data = (info.stack_depth > 0);

    // Top of the current frame's evaluation stack
    for (int i = 0; i < 4; ++i)
    {
      info.stack[i] = (i < info.stack_depth) ? vm->stack[vm->sp - 1 - i] : 0;
    }
    if (info.has_stack_data)
    {
      info.tos = info.stack[0];
      if (info.stack_depth >= 2)
      {
        info.nos = info.stack[1];
      }
    }

    // Output diagnostic information
    printf("\n");
    printf("========== ZM PANIC ==========\n");

    // Error information
    Err err = static_cast<Err>(error_code);
    printf("Error: %s (code=%d)\n", err_str(err), error_code);

    // Program Counter and the instruction there
    printf("PC: 0x%08" PRIX32 "\n", info.pc);
    char line[160];
    if (zm_disassemble(vm, info.pc, line, sizeof(line)) > 0)
    {
      printf("Instruction: %s\n", line);
    }

    // Evaluation stack
    printf("Stack: [%d]", info.stack_depth);
    if (info.has_stack_data)
    {
      printf(" TOS=0x%04X", info.tos);
      if (info.stack_depth >= 2)
      {
        printf(", NOS=0x%04X", info.nos);
      }
    }
    printf("\n");

    // Routine frames, innermost first
    printf("Frames: [%d]\n", info.frame_depth);
    if (vm->frame_count > 1)
    {
      printf("Call trace:\n");

      int shown = 0;
      for (int i = vm->frame_count - 1; i >= 1 && shown < 16; --i, ++shown)
      {
        const ZmFrame &f = vm->frames[i];
        printf("  [%d] routine 0x%08" PRIX32 " returns to 0x%08" PRIX32 "\n", shown, f.routine,
               f.return_pc);
      }

      if (vm->frame_count - 1 > 16)
      {
        printf("  ... (%d more entries)\n", vm->frame_count - 1 - 16);
      }
    }

    printf("==============================\n");
    printf("\n");

    // Call custom panic handler if registered
    if (vm->panic_handler)
    {
      vm->panic_handler(vm->panic_user_data, &info);
    }

    return error_code;
  }

}  // extern "C"
