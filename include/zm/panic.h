#pragma once
#include <stdbool.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C"
{
#endif

  /**
   * @brief Interpreter panic diagnostic information
   *
   * Collected by zm_panic() when execution stops on a fatal error and
   * handed to the registered panic handler.
   */
  typedef struct ZmPanicInfo
  {
    int32_t error_code;  /**< Error code (Err enumeration value) */
    uint32_t pc;         /**< Start of the faulting instruction */
    uint16_t tos;        /**< Top of Stack (when valid) */
    uint16_t nos;        /**< Next on Stack (when valid) */
    uint16_t stack_depth; /**< Evaluation stack depth of the current frame */
    uint16_t frame_depth; /**< Number of active routine frames */
    bool has_stack_data; /**< Whether stack data is valid */
    uint16_t stack[4];   /**< Top 4 stack values (when available) */
  } ZmPanicInfo;

  // Forward declaration
  struct Machine;

  /**
   * @brief Panic handler callback type
   *
   * @param user_data  User data pointer passed to zm_set_panic_handler
   * @param info       Panic diagnostic information
   */
  typedef void (*ZmPanicHandler)(void *user_data, const ZmPanicInfo *info);

  /**
   * @brief Set custom panic handler
   *
   * Registers a callback to be invoked when zm_panic() is called, so that
   * embedders can surface story-file corruption their own way.
   *
   * @param vm         Interpreter instance
   * @param handler    Panic handler callback (NULL to disable)
   * @param user_data  User data passed to handler
   */
  void zm_set_panic_handler(struct Machine *vm, ZmPanicHandler handler, void *user_data);

  /**
   * @brief Report a fatal error
   *
   * Prints a diagnostic block (error, PC, instruction, stacks, call trace)
   * and invokes the registered handler.
   *
   * @return error_code, unchanged
   */
  int zm_panic(struct Machine *vm, int error_code);

#ifdef __cplusplus
}
#endif
