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
#ifndef _MAX_POOLING_EXAMPLE_HPP_
#define _MAX_POOLING_EXAMPLE_HPP_

#include "winpool.hpp"
#include "example_utils.hpp"

namespace winpool {
namespace examples {

/** @fn max_pooling_block_reduce_f32_example
 *  @brief Demonstrates max pooling as a block reduction.
 *
 *  Configuration:
 *    - Input: F32 [1, 1, 4, 4] holding 0..15
 *    - Kernel: 2x2
 *    - Stride: 2x2
 *    - Padding: explicit 0
 */
int max_pooling_block_reduce_f32_example();

/** @fn max_pooling_same_padding_f32_example
 *  @brief Demonstrates "same" padding with reflect fill and an index map.
 *
 *  Configuration:
 *    - Input: F32 [2, 3, 5, 5]
 *    - Kernel: 3x3
 *    - Stride: 2x2
 *    - Padding: same, (1, 1) on both axes, output [2, 3, 3, 3]
 */
int max_pooling_same_padding_f32_example();

/** @fn max_pooling_bf16_example
 *  @brief Demonstrates max pooling on bf16 inputs with caller owned storage.
 */
int max_pooling_bf16_example();

/** @fn max_pooling_compare_kernels_example
 *  @brief Runs reference and batched kernels on the same input and checks
 *  that outputs and index maps are bitwise equal.
 */
int max_pooling_compare_kernels_example();

/** @fn max_pooling_backward_example
 *  @brief Routes a gradient of ones back to the input through an index map.
 */
int max_pooling_backward_example();

/** @fn max_pooling_padding_too_large_example
 *  @brief Shows the failure reported when reflect padding needs more data
 *  than the input holds.
 */
int max_pooling_padding_too_large_example();

} //examples
} //winpool

#endif
