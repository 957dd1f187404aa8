/*******************************************************************************
 * Copyright (c) 2026 Advanced Micro Devices, Inc. All rights reserved.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 *******************************************************************************/
#include "bfloat16.hpp"
#include <cmath>
#include <cstring>

namespace winpool {
namespace common {

namespace {
uint32_t f32_bits(float f) {
  uint32_t bits;
  std::memcpy(&bits, &f, sizeof(float));
  return bits;
}
}

bfloat16_t::bfloat16_t():raw_bits_{0} {
}

bfloat16_t::bfloat16_t(float f) : raw_bits_{0} {
  uint32_t bits = f32_bits(f);
  switch (std::fpclassify(f)) {
  case FP_SUBNORMAL:
  case FP_ZERO:
    // sign preserving zero (denormal go to zero)
    raw_bits_ = uint16_t(bits >> 16) & 0x8000;
    break;
  case FP_INFINITE:
    raw_bits_ = uint16_t(bits >> 16);
    break;
  case FP_NAN:
    // truncate and set MSB of the mantissa to force QNAN
    raw_bits_ = uint16_t(bits >> 16) | (0x01 << 6);
    break;
  default:
    // round to nearest even and truncate
    bits     += 0x00007FFF + ((bits >> 16) & 0x1);
    raw_bits_ = uint16_t(bits >> 16);
    break;
  }
}

bfloat16_t::operator float() const {
  uint32_t bits = uint32_t(raw_bits_) << 16;
  float f;
  std::memcpy(&f, &bits, sizeof(float));
  return f;
}

bfloat16_t &bfloat16_t::operator=(float f) {
  return (*this) = bfloat16_t(f);
}

uint16_t bfloat16_t::raw_bits() const {
  return raw_bits_;
}

bfloat16_t bfloat16_t::from_bits(uint16_t bits_) {
  bfloat16_t value;
  value.raw_bits_ = bits_;
  return value;
}

}//namespace common
}//namespace winpool
