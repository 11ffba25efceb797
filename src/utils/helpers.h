#pragma once

#include <emp-tool/emp-tool.h>

#include <cstdint>
#include <vector>

#include "types.h"

namespace common::utils {

// Sets the ZZ_p modulus to 2^64 for the calling thread. NTL keeps the modulus
// in thread local storage, so every thread touching Field must call this (or
// restore a saved NTL::ZZ_pContext) first.
void initField();

void randomizeZZp(emp::PRG& prg, Field& val);

Field u64ToField(uint64_t val);
uint64_t fieldToU64(const Field& val);

// Fields are sent over the network as fixed width 64-bit words.
std::vector<Ring> packFields(const std::vector<Field>& vals);
std::vector<Field> unpackFields(const std::vector<Ring>& words);

// Little endian bit decomposition of a 64-bit value.
std::vector<int> bitDecompose(uint64_t val);

};  // namespace common::utils
