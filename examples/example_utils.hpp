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
#ifndef _EXAMPLE_UTILS_HPP_
#define _EXAMPLE_UTILS_HPP_

#include <vector>
#include <cstring>
#include <random>
#include <algorithm>

#include "winpool.hpp"

#define  OK          (0)
#define  NOT_OK      (1)

namespace winpool {
/** @namespace winpool::examples
 *  @brief A namespace that contains examples of how to use winpool.
 */
namespace examples {
using namespace winpool::interface;

/** @class tensor_factory_t
 * @brief Quick generation of predefined tensors.
 */
class tensor_factory_t {
 public:
  /** @brief Index type */
  using index_type = tensor4d_t::index_type;
  using data_type  = data_type_t;

  /** @brief zero tensor */
  tensor4d_t zero_tensor(const std::vector<index_type> size_, data_type dtype_,
                         std::string tensor_name_="zero");

  /** @brief tensor holding 0, 1, 2, ... in row-major order */
  tensor4d_t iota_tensor(const std::vector<index_type> size_, data_type dtype_,
                         std::string tensor_name_="iota");

  /** @brief uniform distributed tensor */
  tensor4d_t uniform_dist_tensor(const std::vector<index_type> size_,
                                 data_type dtype_, float range_,
                                 std::string tensor_name_="uniform dist");
};

/** @class tensor_functions_t
 * @brief Tensor helpers for examples.
 */
class tensor_functions_t {
 public:
  /** @brief Print the spatial planes of a 4-d tensor */
  void tensor_pretty_print(const tensor4d_t &tensor_);

  /** @brief Bitwise comparison of two tensors of the same shape */
  bool tensor_bitwise_equal(const tensor4d_t &lhs_, const tensor4d_t &rhs_);
};

} //examples
} //winpool

#endif
