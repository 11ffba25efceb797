#pragma once

#include <NTL/ZZ.h>
#include <NTL/ZZ_p.h>

#include <cstdint>

namespace common::utils {

// Plaintext values live in Z_{2^64}.
using Ring = uint64_t;

// Shares are elements of NTL::ZZ_p initialised with modulus 2^64 (see
// initField()).
using Field = NTL::ZZ_p;

constexpr int RINGSIZEBITS = 64;
constexpr int RINGSIZE = sizeof(Ring);

// Number of slots in the one-hot vector used by equality-to-zero. Divides 2^64
// and exceeds the largest Hamming distance of two 64-bit strings.
constexpr int EQZSLOTS = 2 * RINGSIZEBITS;

};  // namespace common::utils
