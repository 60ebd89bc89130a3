#pragma once
#include <stdint.h>

#include "zm/internal/machine.h"

/**
 * Random source behind the `random` opcode.
 *
 *   seed s, |s| < 1000  sequential mode: 1, 2, ..., |s|, 1, ...
 *   other seeds         xorshift32 seeded from the value
 */

enum
{
  ZM_RANDOM_SEQUENTIAL_LIMIT = 1000,
};

/* Seed as `random` does for a negative argument (magnitude is used). */
void zm_random_seed(ZmRandom *rng, int32_t seed);

/* Switch to the generator, seeded with an arbitrary value. */
void zm_random_seed_prng(ZmRandom *rng, uint32_t seed);

/* Uniform value in [1, range]; range must be positive. */
uint16_t zm_random_next(ZmRandom *rng, uint16_t range);

/* Seed for `random 0`: host entropy when available. */
uint32_t zm_random_entropy(const Machine *vm);
