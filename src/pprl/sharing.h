#pragma once

#include <emp-tool/emp-tool.h>

#include "../utils/helpers.h"
#include "../utils/types.h"

using namespace common::utils;

namespace pprl {

// Additive share of a value in Z_{2^64}: the values held by the computing
// parties 1..nP sum to the secret. The helper party holds no shares online.
class AddShare {
  Field value_;

 public:
  AddShare() = default;
  explicit AddShare(Field value) : value_{value} {}

  void randomize(emp::PRG& prg) { randomizeZZp(prg, value_); }

  Field& valueAt() { return value_; }
  [[nodiscard]] const Field& valueAt() const { return value_; }

  void pushValue(Field val) { value_ = val; }

  // Arithmetic operators.
  AddShare& operator+=(const AddShare& rhs) {
    value_ += rhs.value_;
    return *this;
  }

  friend AddShare operator+(AddShare lhs, const AddShare& rhs) {
    lhs += rhs;
    return lhs;
  }

  AddShare& operator-=(const AddShare& rhs) {
    value_ -= rhs.value_;
    return *this;
  }

  friend AddShare operator-(AddShare lhs, const AddShare& rhs) {
    lhs -= rhs;
    return lhs;
  }

  AddShare& operator*=(const Field& rhs) {
    value_ *= rhs;
    return *this;
  }

  friend AddShare operator*(AddShare lhs, const Field& rhs) {
    lhs *= rhs;
    return lhs;
  }

  // Adds a public value; only party 1 shifts its share.
  AddShare& add(const Field& val, int pid) {
    if (pid == 1) {
      value_ += val;
    }
    return *this;
  }
};

};  // namespace pprl
