#pragma once
#include <cstddef>
#include <cstdint>

namespace RNG {

//
// xorshift
// --------
// Tiny deterministic pseudo-random number generator behind the parameter
// sampler.  The routine takes a mutable `state` reference so the caller owns
// the generator: log the seed at the start of a run and the exact same walk
// through the parameter space can be replayed later.
inline uint32_t xorshift(uint32_t& state) {
  // The zero state would stay stuck at zero forever, so substitute the
  // constant from Marsaglia's original paper.
  uint32_t x = state ? state : 2463534242u;
  x ^= x << 13;
  x ^= x >> 17;
  x ^= x << 5;
  state = x;
  return x;
}

// Uniform pick in [0, count).  Multiply-shift maps the 32-bit output onto
// `count` buckets; Lemire's rejection step then redraws the few low products
// that would hand some buckets one extra preimage.  `count` of zero yields 0
// and counts past 2^32 are clamped.
inline std::size_t uniformIndex(uint32_t& state, std::size_t count) {
  if (count == 0) {
    return 0;
  }
  const uint32_t bound = count > UINT32_MAX ? UINT32_MAX : static_cast<uint32_t>(count);
  uint64_t wide = static_cast<uint64_t>(xorshift(state)) * bound;
  uint32_t low = static_cast<uint32_t>(wide);
  if (low < bound) {
    const uint32_t threshold = (0u - bound) % bound;
    while (low < threshold) {
      wide = static_cast<uint64_t>(xorshift(state)) * bound;
      low = static_cast<uint32_t>(wide);
    }
  }
  return static_cast<std::size_t>(wide >> 32);
}

} // namespace RNG
