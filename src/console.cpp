/**
 * @file console.cpp
 * @brief Interpreter host bound to the V4-hal console
 */

#include "zm/console.h"

#include <cstdio>
#include <cstring>

#include "v4/hal.h"

/* ========================================================================= */
/* Output                                                                    */
/* ========================================================================= */

static void console_write_all(ZmConsole* con, const char* text, size_t len)
{
  const uint8_t* p = reinterpret_cast<const uint8_t*>(text);
  while (len > 0)
  {
    int n = hal_console_write(p, len);
    if (n <= 0)
    {
      con->io_error = 1;
      return;
    }
    p += n;
    len -= static_cast<size_t>(n);
  }
}

static void console_print(void* user, const char* text, size_t len)
{
  console_write_all(static_cast<ZmConsole*>(user), text, len);
}

static void console_show_status(void* user, const char* location, zm_i16 a, zm_i16 b,
                                int is_time)
{
  ZmConsole* con = static_cast<ZmConsole*>(user);
  char buf[ZM_CONSOLE_LINE_MAX];
  int n;

  if (is_time)
    n = snprintf(buf, sizeof(buf), "[%s]  Time: %d:%02d\n", location, a, b);
  else
    n = snprintf(buf, sizeof(buf), "[%s]  Score: %d  Moves: %d\n", location, a, b);

  if (n <= 0)
    return;
  size_t len = static_cast<size_t>(n);
  console_write_all(con, buf, len < sizeof(buf) ? len : sizeof(buf) - 1);
}

/* ========================================================================= */
/* Input                                                                     */
/* ========================================================================= */

static int take_line(ZmConsole* con, char* buf, size_t cap)
{
  size_t n = con->line_len < cap ? con->line_len : cap;
  memcpy(buf, con->line, n);
  con->line_len = 0;
  return static_cast<int>(n);
}

static int console_read_line(void* user, char* buf, size_t cap)
{
  ZmConsole* con = static_cast<ZmConsole*>(user);

  for (;;)
  {
    uint8_t byte;
    int r = hal_console_read(&byte, 1);
    if (r < 0)
      return ZM_HOST_ERROR;

    if (r == 0)
    {
      if (!con->eof_on_empty)
        return ZM_HOST_PENDING;
      // Last line without a newline still counts
      if (con->line_len > 0)
        return take_line(con, buf, cap);
      return ZM_HOST_EOF;
    }

    if (byte == '\n')
      return take_line(con, buf, cap);
    if (byte == '\r')
      continue;
    if (con->line_len < sizeof(con->line))
      con->line[con->line_len++] = static_cast<char>(byte);
  }
}

/* ========================================================================= */
/* Misc                                                                      */
/* ========================================================================= */

static uint32_t console_entropy(void*)
{
  uint64_t us = hal_micros();
  return static_cast<uint32_t>(us ^ (us >> 32));
}

extern "C" void zm_console_init(ZmConsole* con, int eof_on_empty)
{
  if (!con)
    return;
  memset(con, 0, sizeof(*con));
  con->eof_on_empty = eof_on_empty;
}

extern "C" ZmHost zm_console_host(ZmConsole* con)
{
  ZmHost host;
  memset(&host, 0, sizeof(host));
  host.print = console_print;
  host.read_line = console_read_line;
  host.show_status = console_show_status;
  host.entropy = console_entropy;
  host.user = con;
  return host;
}
