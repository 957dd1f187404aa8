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
#ifndef _WINPOOL_POOLING_UTILS_HPP_
#define _WINPOOL_POOLING_UTILS_HPP_

#include <string>

#include "common/winpool_global.hpp"
#include "pooling/pooling_common.hpp"

namespace winpool {
namespace pooling {

using namespace winpool::error_handling;

/**
 * @brief Validate a max pooling call and fill @c params.dims.
 *
 * @return success, pool_shape_mismatch for a rank other than 4,
 *         pool_invalid_dimension for empty axes, non-positive kernel or
 *         stride, negative padding, a padded tensor too large to address,
 *         a thread count above INT_MAX or an empty output, and
 *         pool_unsupported_dtype for data types other than f32 and bf16.
 */
status_t validate_pooling_inputs(const tensor4d_t &input,
                                 pool_params &params);

/**
 * @brief Fill output extents of @c params.dims from input extents, padding,
 * kernel and stride.
 */
void get_output_dims(pool_params &params);

/** @brief OpenMP thread count for a requested count, 0 meaning the OpenMP
 *  default. Requests above INT_MAX are clamped. */
int pool_thread_count(uint32_t num_threads);

/** @brief One line description of a pooling call, used in logs */
std::string pooling_params_str(const pool_params &params);

} // namespace pooling
} // namespace winpool

#endif
