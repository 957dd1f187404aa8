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
#ifndef _WINPOOL_BFLOAT16_HPP_
#define _WINPOOL_BFLOAT16_HPP_

#include <cstdint>
#include <type_traits>

namespace winpool {
namespace common {

/** @class bfloat16_t
 *  @brief Implements a bfloat16 storage type
 *
 *  Bfloat16 type is a numeric type not directly supported in C++. This class
 *  stores the upper 16 bits of a float32 and converts to and from float32.
 *  Comparisons are done after widening to float32, which is exact.
 */
class bfloat16_t {
 public:
  /** @name Constructors, Destructors and Assignment
   */
  /**@{*/
  /** @brief Default constructor, initializes to zero. */
  bfloat16_t();

  /** @brief Conversion from float32 with round to nearest even.
   * @param f : float32 value.
   */
  bfloat16_t(float f);

  /** @brief Conversion assignment from float32.
   * @param f : float32 value.
   */
  bfloat16_t &operator=(float f);

  /** @brief Conversion constructor from an integer type to bfloat16.
   * @param i : an integer type value.
   */
  template<typename integer_type,
           typename SFINAE = std::enable_if_t<std::is_integral_v<integer_type>>>
  bfloat16_t(integer_type i): bfloat16_t{float(i)} {
  }
  /**@}*/

  /** @brief Conversion from bfloat16 to float. */
  operator float() const;

  /** @brief Raw bits of the value */
  uint16_t raw_bits() const;

  /** @brief Build a value from raw bits */
  static bfloat16_t from_bits(uint16_t bits_);

 private:
  uint16_t raw_bits_;
};

static_assert(sizeof(bfloat16_t) == 2, "bfloat16_t must be 2 bytes");

}//namespace common
}//namespace winpool

#endif
