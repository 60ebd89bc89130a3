#pragma once
#include <stddef.h>
#include <stdint.h>

#include "zm/zm_api.h"

#ifdef __cplusplus
extern "C"
{
#endif

#define ZM_CONSOLE_LINE_MAX 256

  /**
   * @brief Console host state on top of the HAL console API.
   *
   * Bytes are polled from hal_console_read() into a partial line until a
   * newline arrives, so a story can suspend on ZM_STEP_INPUT between polls.
   */
  typedef struct ZmConsole
  {
    char line[ZM_CONSOLE_LINE_MAX];
    size_t line_len;
    int eof_on_empty; /**< Treat "no data" as end of input (piped stdin) */
    int io_error;     /**< Latched HAL write failure */
  } ZmConsole;

  /**
   * @brief Reset console state.
   * @param eof_on_empty  Non-zero: an empty read ends input instead of suspending.
   */
  void zm_console_init(ZmConsole *con, int eof_on_empty);

  /**
   * @brief Host callback table bound to con.
   *
   * print/read_line/show_status go through the HAL console,
   * entropy comes from hal_micros().
   */
  ZmHost zm_console_host(ZmConsole *con);

#ifdef __cplusplus
}
#endif
