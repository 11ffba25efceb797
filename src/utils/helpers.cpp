#include "helpers.h"

namespace common::utils {

void initField() {
  NTL::ZZ modulus(1);
  modulus <<= RINGSIZEBITS;
  Field::init(modulus);
}

void randomizeZZp(emp::PRG& prg, Field& val) {
  uint64_t rand;
  prg.random_data(&rand, sizeof(rand));
  val = u64ToField(rand);
}

Field u64ToField(uint64_t val) {
  NTL::ZZ tmp;
  NTL::conv(tmp, static_cast<unsigned long>(val));
  return NTL::conv<Field>(tmp);
}

uint64_t fieldToU64(const Field& val) {
  return NTL::conv<unsigned long>(NTL::rep(val));
}

std::vector<Ring> packFields(const std::vector<Field>& vals) {
  std::vector<Ring> words(vals.size());
  for (size_t i = 0; i < vals.size(); ++i) {
    words[i] = fieldToU64(vals[i]);
  }
  return words;
}

std::vector<Field> unpackFields(const std::vector<Ring>& words) {
  std::vector<Field> vals(words.size());
  for (size_t i = 0; i < words.size(); ++i) {
    vals[i] = u64ToField(words[i]);
  }
  return vals;
}

std::vector<int> bitDecompose(uint64_t val) {
  std::vector<int> bits(RINGSIZEBITS);
  for (int i = 0; i < RINGSIZEBITS; ++i) {
    bits[i] = static_cast<int>((val >> i) & 1ULL);
  }
  return bits;
}

};  // namespace common::utils
