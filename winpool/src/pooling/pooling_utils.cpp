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
#include <climits>
#include <sstream>
#include <omp.h>
#include "pooling_utils.hpp"
#include "pooling/pooling_config.hpp"
#include "pooling/pooling_padding.hpp"

namespace winpool {
namespace pooling {

void get_output_dims(pool_params &params) {
  params.dims.padded_height = params.dims.in_height + params.padding.top +
                              params.padding.bottom;
  params.dims.padded_width  = params.dims.in_width + params.padding.left +
                              params.padding.right;
  params.dims.out_height    = uint64_t(pooled_size(int64_t(params.dims.in_height),
                                       params.padding.top, params.padding.bottom,
                                       params.kernel.height, params.stride.height));
  params.dims.out_width     = uint64_t(pooled_size(int64_t(params.dims.in_width),
                                       params.padding.left, params.padding.right,
                                       params.kernel.width, params.stride.width));
}

status_t validate_pooling_inputs(const tensor4d_t &input,
                                 pool_params &params) {
  if (!input.is_valid()) {
    log_error("Pooling: Input tensor is not created");
    return status_t::pool_shape_mismatch;
  }

  if (input.get_dim() != 4) {
    log_error("Pooling: Input must be [N, C, H, W], got ", input.tensor_info());
    return status_t::pool_shape_mismatch;
  }

  auto dtype = input.get_data_type();
  if (dtype != data_type_t::f32 && dtype != data_type_t::bf16) {
    log_error("Pooling: Unsupported input data type ", dtype_info(dtype));
    return status_t::pool_unsupported_dtype;
  }

  params.dims.batch     = input.get_size(0);
  params.dims.channels  = input.get_size(1);
  params.dims.in_height = input.get_size(2);
  params.dims.in_width  = input.get_size(3);

  if (params.dims.batch == 0 || params.dims.channels == 0 ||
      params.dims.in_height == 0 || params.dims.in_width == 0) {
    log_error("Pooling: Invalid input dimensions");
    return status_t::pool_invalid_dimension;
  }

  if (params.kernel.height <= 0 || params.kernel.width <= 0) {
    log_error("Pooling: Invalid kernel dimensions ", params.kernel.height,
              "x", params.kernel.width);
    return status_t::pool_invalid_dimension;
  }

  if (params.stride.height <= 0 || params.stride.width <= 0) {
    log_error("Pooling: Invalid stride values ", params.stride.height,
              "x", params.stride.width);
    return status_t::pool_invalid_dimension;
  }

  if (params.padding.left < 0 || params.padding.right < 0 ||
      params.padding.top < 0 || params.padding.bottom < 0) {
    log_error("Pooling: Negative padding");
    return status_t::pool_invalid_dimension;
  }

  if (params.num_threads > uint32_t(INT_MAX)) {
    log_error("Pooling: Thread count ", params.num_threads, " above ", INT_MAX);
    return status_t::pool_invalid_dimension;
  }

  if (params.reflect) {
    status_t status = check_reflect_padding(params.dims.in_height,
                                            params.dims.in_width,
                                            params.padding);
    if (status != status_t::success) {
      return status;
    }
  }

  status_t status = get_padded_dims(params.dims, params.padding, dtype);
  if (status != status_t::success) {
    return status;
  }

  get_output_dims(params);
  if (params.dims.out_height == 0 || params.dims.out_width == 0) {
    log_error("Pooling: Kernel ", params.kernel.height, "x",
              params.kernel.width, " does not fit padded input ",
              params.dims.padded_height, "x", params.dims.padded_width);
    return status_t::pool_invalid_dimension;
  }

  return status_t::success;
}

int pool_thread_count(uint32_t num_threads) {
  if (num_threads == 0) {
    return omp_get_max_threads();
  }
  return num_threads > uint32_t(INT_MAX) ? INT_MAX : int(num_threads);
}

std::string pooling_params_str(const pool_params &params) {
  std::ostringstream ss;
  ss << "max_pooling_direct: "
     << "batch=" << params.dims.batch
     << ", channels=" << params.dims.channels
     << ", in_h=" << params.dims.in_height
     << ", in_w=" << params.dims.in_width
     << ", out_h=" << params.dims.out_height
     << ", out_w=" << params.dims.out_width
     << ", kernel_h=" << params.kernel.height
     << ", kernel_w=" << params.kernel.width
     << ", stride_h=" << params.stride.height
     << ", stride_w=" << params.stride.width
     << ", pad_t=" << params.padding.top << ", pad_l=" << params.padding.left
     << ", pad_b=" << params.padding.bottom
     << ", pad_r=" << params.padding.right
     << ", reflect=" << (params.reflect ? "true" : "false")
     << ", indices=" << (params.want_indices ? "true" : "false")
     << ", algo=" << pooling_config_t::pooling_algo_to_str(params.algo)
     << ", threads=" << params.num_threads;
  return ss.str();
}

} // namespace pooling
} // namespace winpool
