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
#ifndef _WINPOOL_ERROR_STATUS_HPP_
#define _WINPOOL_ERROR_STATUS_HPP_

#include <cstdint>
#include <string>

namespace winpool {
/** @namespace winpool::error_handling
 *  @brief A namespace for classes, functions, variables and enums for error handling.
 *
 *  This namespace contains error code enumerations, exception classes and logger
 *  classes needed to detect, propagate, and act upon errors generated in winpool.
 */
namespace error_handling {

/** @enum status_t
 *  @brief Error status of a function, an object or a class.
 */
enum class status_t : int32_t {
  success                 = 1,   /*!< Success */
  failure                 = 0,   /*!< Unknown failure */
  unimplemented           = -1,  /*!< Unimplemented function, kernel or feature */
  pool_invalid_dimension  = -2,  /*!< Non-positive kernel, stride or input extent */
  pool_padding_too_large  = -3,  /*!< Reflect padding beyond available data */
  pool_shape_mismatch     = -4,  /*!< Tensor rank or shape does not match */
  pool_unsupported_dtype  = -5,  /*!< Data type not supported by pooling */
  pool_bad_kernel         = -6,  /*!< Unknown or unavailable pooling kernel */
  memory_bad_size         = -7,  /*!< bad tensor size */
  memory_bad_index        = -8,  /*!< bad tensor index */
  config_bad_json_file    = -9   /*!< bad json file */
};

/** @brief Get printable name of a status
 *  @param status_ : the status
 *  @return Name of the status.
 */
std::string status_to_str(status_t status_);

} //error_handling

namespace interface {
using status_t = winpool::error_handling::status_t;
using winpool::error_handling::status_to_str;
} //export

} //winpool
#endif
