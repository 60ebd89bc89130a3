#include "zm/internal/random.hpp"

#include <time.h>

#include "zm/internal/machine.h"

static inline uint32_t xorshift32(uint32_t *state)
{
  uint32_t x = *state;
  x ^= x << 13;
  x ^= x >> 17;
  x ^= x << 5;
  *state = x;
  return x;
}

void zm_random_seed_prng(ZmRandom *rng, uint32_t seed)
{
  // xorshift has a fixed point at 0
  rng->state = seed ? seed : 0x9E3779B9u;
  rng->seq_range = 0;
  rng->seq_next = 0;
}

void zm_random_seed(ZmRandom *rng, int32_t seed)
{
  uint32_t magnitude = seed < 0 ? (uint32_t)(-(int64_t)seed) : (uint32_t)seed;
  if (magnitude > 0 && magnitude < ZM_RANDOM_SEQUENTIAL_LIMIT)
  {
    rng->seq_range = (uint16_t)magnitude;
    rng->seq_next = 1;
    return;
  }
  zm_random_seed_prng(rng, magnitude);
}

uint16_t zm_random_next(ZmRandom *rng, uint16_t range)
{
  if (rng->seq_range)
  {
    uint16_t v = rng->seq_next;
    rng->seq_next = (uint16_t)(v >= rng->seq_range ? 1 : v + 1);
    // Sequence values above the requested range wrap into it
    return (uint16_t)((v - 1) % range + 1);
  }

  // Rejection sampling keeps [1, range] uniform
  uint32_t limit = 0xFFFFFFFFu - (0xFFFFFFFFu % range);
  uint32_t x;
  do
  {
    x = xorshift32(&rng->state);
  } while (x >= limit);
  return (uint16_t)(x % range + 1);
}

uint32_t zm_random_entropy(const Machine *vm)
{
  if (vm->host.entropy)
    return vm->host.entropy(vm->host.user);
  return (uint32_t)time(nullptr) ^ (uint32_t)clock() ^ (uint32_t)(uintptr_t)vm;
}
