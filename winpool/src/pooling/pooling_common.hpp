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
#ifndef _WINPOOL_POOLING_COMMON_HPP_
#define _WINPOOL_POOLING_COMMON_HPP_

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "common/data_types.hpp"
#include "memory/tensor4d.hpp"

namespace winpool {
/** @namespace winpool::pooling
 *  @brief Sliding-window max pooling over (batch, channel, height, width)
 *  tensors.
 */
namespace pooling {

using namespace winpool::common;
using namespace winpool::memory;

/**
 * @brief Pooling kernel selection
 */
enum class pooling_algo_t : int32_t {
  none      = -1, /*!< Use the configured default kernel */
  reference = 1,  /*!< Per output cell array indexing */
  batched   = 2,  /*!< Strided max over all (batch, channel) planes at once */
  algo_count      /*!< Algo count */
};

/**
 * @brief Padding policy
 */
enum class pool_padding_mode_t : uint8_t {
  explicit_padding = 0, /*!< Caller supplied (pad_h, pad_w), both sides */
  same             = 1  /*!< Adaptive, output size is ceil(input/stride) */
};

/**
 * @brief Pooling window size [KH, KW]
 */
struct pool_kernel_t {
  int64_t height = 1;
  int64_t width  = 1;
};

/**
 * @brief Window step [SH, SW]
 */
struct pool_stride_t {
  int64_t height = 1;
  int64_t width  = 1;
};

/**
 * @brief Explicit padding request, applied to both sides of an axis.
 *
 * A scalar request p is {p, p}.
 */
struct pool_pad_hw_t {
  int64_t height = 0;
  int64_t width  = 0;
};

/**
 * @brief Padding amounts in pixels
 */
struct pool_padding_t {
  int64_t left   = 0;
  int64_t right  = 0;
  int64_t top    = 0;
  int64_t bottom = 0;

  bool is_zero() const {
    return !(left || right || top || bottom);
  }
};

/**
 * @brief Pooling tensor dimensions, derived by validation
 *
 * Input [N, C, H, W], padded [N, C, HP, WP], output [N, C, H_out, W_out]
 */
struct pooling_dims_t {
  uint64_t batch         = 0;  ///< Batch size (N)
  uint64_t channels      = 0;  ///< Number of channels (C)
  uint64_t in_height     = 0;  ///< Input height (H)
  uint64_t in_width      = 0;  ///< Input width (W)
  uint64_t padded_height = 0;  ///< Height after padding (HP)
  uint64_t padded_width  = 0;  ///< Width after padding (WP)
  uint64_t out_height    = 0;  ///< Output height
  uint64_t out_width     = 0;  ///< Output width
};

/**
 * @brief Instrumentation hook, receives call description and elapsed
 * milliseconds.
 */
using pool_profile_cb_t = std::function<void(const std::string &,
                                             double)>;

/**
 * @brief Parameter block of one max pooling call
 */
struct pool_params {
  pool_kernel_t     kernel;                      ///< Window size
  pool_stride_t     stride;                      ///< Window step
  pool_padding_t    padding;                     ///< Padding amounts
  bool              reflect      = true;         ///< Reflect fill, else -inf
  bool              want_indices = false;        ///< Produce an index map
  pooling_algo_t    algo = pooling_algo_t::none; ///< Kernel, none = configured
  uint32_t          num_threads  = 0;            ///< Threads, 0 = OpenMP default, at most INT_MAX
  pool_profile_cb_t profile_cb;                  ///< Optional timing hook
  pooling_dims_t    dims;                        ///< Filled by validation
};

/**
 * @brief Result of a max pooling call
 *
 * @c indices holds s32 offsets in [0, KH*KW) of the window maximum, in
 * row-major window order. Present only when requested.
 */
struct pool_output_t {
  tensor4d_t                output;
  std::optional<tensor4d_t> indices;
};

} // namespace pooling

namespace interface {
using pooling_algo_t      = winpool::pooling::pooling_algo_t;
using pool_padding_mode_t = winpool::pooling::pool_padding_mode_t;
using pool_kernel_t       = winpool::pooling::pool_kernel_t;
using pool_stride_t       = winpool::pooling::pool_stride_t;
using pool_pad_hw_t       = winpool::pooling::pool_pad_hw_t;
using pool_padding_t      = winpool::pooling::pool_padding_t;
using pool_params         = winpool::pooling::pool_params;
using pool_output_t       = winpool::pooling::pool_output_t;
} //export

} // namespace winpool

#endif // _WINPOOL_POOLING_COMMON_HPP_
