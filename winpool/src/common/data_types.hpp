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
#ifndef _WINPOOL_DATA_TYPES_HPP_
#define _WINPOOL_DATA_TYPES_HPP_

#include <cstdint>
#include <string>
#include "common/bfloat16.hpp"

/** @namespace winpool
 *  @brief winpool top level namespace.
 */
namespace winpool {
/** @namespace winpool::common
 *  @brief A namespace to contain classes, functions, variable and enumerations
 *  common to all winpool.
 */
namespace common {

/** @enum data_type_t
 *  @brief data types supported by winpool tensors
 *
 * Pooled data is f32 or bf16. Index maps are s32.
 */
enum class data_type_t : uint8_t {
  f32,  /*!< float 32bit */
  bf16, /*!< brain float 16bit */
  s32   /*!< signed integer 32 bit */
};

/** @brief conversion from data_type_t to corresponding C++ type */
template <data_type_t>
struct prec_traits {};

template <>
struct prec_traits<data_type_t::f32> {
  typedef float type;
};

template <>
struct prec_traits<data_type_t::bf16> {
  typedef bfloat16_t type;
};

template <>
struct prec_traits<data_type_t::s32> {
  typedef int32_t type;
};

/** @brief Conversion from C++ types to data_type_t */
template <typename>
struct data_traits {};

template <>
struct data_traits<float> {
  static constexpr data_type_t data_type = data_type_t::f32;
};

template <>
struct data_traits<bfloat16_t> {
  static constexpr data_type_t data_type = data_type_t::bf16;
};

template <>
struct data_traits<int32_t> {
  static constexpr data_type_t data_type = data_type_t::s32;
};

/** @brief Get size of a data type
 *  @param data_type : the data type
 *  @return Size of the data type in bytes
 */
uint32_t size_of(data_type_t data_type);

/** @brief Get name of the data type
 *  @param data_type : the data type
 *  @return Name of the data type
 */
std::string dtype_info(data_type_t data_type);

}//common

/** @namespace winpool::interface
 *  @brief A namespace that exports classes, functions, variables and enums
 *  needed by external code.
 *
 *  By convention other namespaces are internal to winpool and external code
 *  should refer to only winpool::interface namespace.
 */
namespace interface {
using data_type_t = winpool::common::data_type_t;
using bfloat16_t  = winpool::common::bfloat16_t;
} //export

}//winpool

#endif
