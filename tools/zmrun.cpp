/**
 * @file zmrun.cpp
 * @brief Run a version 3 story on the HAL console
 *
 * usage: zmrun [-s seed] [-c] [-t] [-b] story.z3
 *   -s seed  fixed random seed
 *   -c       reject stories whose checksum does not match
 *   -t       trace every instruction to stderr
 *   -b       batch input: end of console data ends the story input
 */

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <vector>

#include "v4/hal.h"
#include "zm/console.h"
#include "zm/errors.hpp"
#include "zm/zm_api.hpp"

static const uint32_t kInputPollMs = 10;

static void usage(const char *prog)
{
  fprintf(stderr, "usage: %s [-s seed] [-c] [-t] [-b] story.z3\n", prog);
}

static void trace_line(void *, const char *line)
{
  fprintf(stderr, "%s\n", line);
}

static bool load_story(const char *path, std::vector<uint8_t> *out)
{
  FILE *f = fopen(path, "rb");
  if (!f)
    return false;

  uint8_t chunk[4096];
  size_t n;
  while ((n = fread(chunk, 1, sizeof(chunk), f)) > 0)
    out->insert(out->end(), chunk, chunk + n);

  bool ok = !ferror(f);
  fclose(f);
  return ok;
}

int main(int argc, char **argv)
{
  int32_t seed = 0;
  bool verify = false;
  bool trace = false;
  bool batch = false;
  const char *path = nullptr;

  for (int i = 1; i < argc; i++)
  {
    if (strcmp(argv[i], "-s") == 0 && i + 1 < argc)
      seed = static_cast<int32_t>(strtol(argv[++i], nullptr, 0));
    else if (strcmp(argv[i], "-c") == 0)
      verify = true;
    else if (strcmp(argv[i], "-t") == 0)
      trace = true;
    else if (strcmp(argv[i], "-b") == 0)
      batch = true;
    else if (argv[i][0] == '-' || path)
    {
      usage(argv[0]);
      return 1;
    }
    else
      path = argv[i];
  }

  if (!path)
  {
    usage(argv[0]);
    return 1;
  }

  std::vector<uint8_t> story;
  if (!load_story(path, &story))
  {
    fprintf(stderr, "%s: cannot read %s\n", argv[0], path);
    return 1;
  }

  ZmConsole console;
  zm_console_init(&console, batch ? 1 : 0);

  ZmConfig cfg;
  memset(&cfg, 0, sizeof(cfg));
  cfg.story = story.data();
  cfg.story_size = static_cast<zm_u32>(story.size());
  cfg.host = zm_console_host(&console);
  cfg.random_seed = seed;
  cfg.verify_checksum = verify ? 1 : 0;
  cfg.screen_rows = 25;
  cfg.screen_cols = 80;

  zm::Interpreter interp;
  zm_err err = interp.create(cfg);
  if (err)
  {
    fprintf(stderr, "%s: %s: %s\n", argv[0], path, err_str(static_cast<Err>(err)));
    return 1;
  }
  if (trace)
    zm_set_trace(interp.get(), trace_line, nullptr);

  for (;;)
  {
    zm_err r = interp.run();
    if (r == ZM_STEP_INPUT)
    {
      hal_delay_ms(kInputPollMs);
      continue;
    }
    if (console.io_error)
      fprintf(stderr, "%s: console write failed\n", argv[0]);
    return r == ZM_STEP_QUIT ? 0 : 1;
  }
}
