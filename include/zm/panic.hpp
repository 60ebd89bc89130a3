/**
 * @file panic.hpp
 * @brief zm panic handler C++ wrapper
 */

#pragma once

#include "zm/panic.h"

namespace zm
{

using PanicInfo = ZmPanicInfo;

using PanicHandler = ZmPanicHandler;

/**
 * @brief Set panic handler (C++ wrapper)
 *
 * @param vm         Interpreter instance
 * @param handler    Panic handler callback
 * @param user_data  User data passed to handler
 */
inline void set_panic_handler(Machine *vm, PanicHandler handler, void *user_data = nullptr)
{
  zm_set_panic_handler(vm, handler, user_data);
}

}  // namespace zm
