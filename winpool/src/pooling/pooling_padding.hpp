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
#ifndef _WINPOOL_POOLING_PADDING_HPP_
#define _WINPOOL_POOLING_PADDING_HPP_

#include <cstdint>
#include "common/winpool_global.hpp"
#include "pooling/pooling_common.hpp"

namespace winpool {
namespace pooling {

using namespace winpool::error_handling;

/**
 * @brief Compute padding amounts of a pooling call.
 *
 * explicit_padding : (left, right, top, bottom) = (pad.w, pad.w, pad.h, pad.h).
 *
 * same : per axis, with r = in % stride,
 *   needed = max(kernel - (r ? r : stride), 0),
 *   before = needed / 2, after = needed - before,
 * which gives an output size of ceil(in / stride).
 *
 * @param in_h, in_w     Input spatial extent
 * @param kernel         Window size
 * @param stride         Window step
 * @param mode           Padding policy
 * @param explicit_pad   Requested padding, used only by explicit_padding
 * @param padding        Result, untouched on failure
 *
 * @return success, or pool_invalid_dimension for a non-positive extent,
 *         kernel or stride, or a negative explicit request.
 */
status_t compute_padding(int64_t in_h, int64_t in_w,
                         const pool_kernel_t &kernel,
                         const pool_stride_t &stride,
                         pool_padding_mode_t mode,
                         const pool_pad_hw_t &explicit_pad,
                         pool_padding_t &padding);

/** @overload scalar explicit padding, same amount on both axes */
status_t compute_padding(int64_t in_h, int64_t in_w,
                         const pool_kernel_t &kernel,
                         const pool_stride_t &stride,
                         pool_padding_mode_t mode,
                         int64_t explicit_pad,
                         pool_padding_t &padding);

/**
 * @brief Output extent along one axis.
 *
 * @return floor((in + before + after - kernel) / stride) + 1, or 0 if the
 *         padded extent is smaller than the kernel or does not fit in int64.
 */
int64_t pooled_size(int64_t in, int64_t pad_before, int64_t pad_after,
                    int64_t kernel, int64_t stride);

/**
 * @brief Fill the padded extents of @p dims from its input extents.
 *
 * @p padding must not be negative.
 * @return success, or pool_invalid_dimension when a padded extent or the
 *         byte size of the padded N x C x HP x WP tensor of @p dtype does
 *         not fit in int64.
 */
status_t get_padded_dims(pooling_dims_t &dims, const pool_padding_t &padding,
                         data_type_t dtype);

/**
 * @brief Map a coordinate relative to the unpadded origin into the input.
 *
 * -1 maps to 1, -2 to 2, extent to extent-2, and so on. Valid for
 * pos in (-extent, 2*extent - 1).
 */
inline int64_t reflect_index(int64_t pos, int64_t extent) {
  if (pos < 0) {
    return -pos;
  }
  if (pos >= extent) {
    return 2 * (extent - 1) - pos;
  }
  return pos;
}

/**
 * @brief Check that reflect padding can be built from the input.
 *
 * Fails if an amount, or the total of an axis, reaches the input extent of
 * that axis.
 *
 * @return success or pool_padding_too_large.
 */
status_t check_reflect_padding(uint64_t in_h, uint64_t in_w,
                               const pool_padding_t &padding);

/**
 * @brief Build the padded tensor.
 *
 * With @p reflect the border mirrors interior values, excluding the border
 * element. Without it the border holds -infinity, so that a max never
 * selects it over data.
 *
 * @param input    Input [N, C, H, W], f32 or bf16
 * @param padding  Padding amounts
 * @param reflect  Reflect or -infinity fill
 * @param padded   Created by this call, [N, C, H+top+bottom, W+left+right]
 * @param num_threads Threads, 0 = OpenMP default
 *
 * @return success, pool_padding_too_large, pool_shape_mismatch or
 *         pool_unsupported_dtype.
 */
status_t pad_tensor(const tensor4d_t &input, const pool_padding_t &padding,
                    bool reflect, tensor4d_t &padded,
                    uint32_t num_threads = 0);

} // namespace pooling
} // namespace winpool

#endif
