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
#include <omp.h>
#include "reference_kernel.hpp"
#include "pooling/pooling_utils.hpp"

namespace winpool {
namespace pooling {

using namespace winpool::common;

namespace {

template<typename T, bool track_index>
void max_pooling_reference_impl(
  const T *input,
  T *output,
  int32_t *indices,
  const pool_params &params,
  const int num_threads
) {
  const uint64_t planes   = params.dims.batch * params.dims.channels;
  const uint64_t pad_h    = params.dims.padded_height;
  const uint64_t pad_w    = params.dims.padded_width;
  const uint64_t out_h    = params.dims.out_height;
  const uint64_t out_w    = params.dims.out_width;
  const uint64_t kh       = uint64_t(params.kernel.height);
  const uint64_t kw       = uint64_t(params.kernel.width);
  const uint64_t stride_h = uint64_t(params.stride.height);
  const uint64_t stride_w = uint64_t(params.stride.width);

  // NCHW: every (n, c) pair is an independent plane
  #pragma omp parallel for collapse(2) num_threads(num_threads)
  for (uint64_t p = 0; p < planes; ++p) {
    for (uint64_t oh = 0; oh < out_h; ++oh) {
      const T *plane   = input + p * pad_h * pad_w;
      uint64_t out_idx = (p * out_h + oh) * out_w;

      for (uint64_t ow = 0; ow < out_w; ++ow, ++out_idx) {
        const T *window  = plane + (oh * stride_h) * pad_w + ow * stride_w;
        T        max_val = window[0];
        int32_t  max_idx = 0;

        for (uint64_t kh_idx = 0; kh_idx < kh; ++kh_idx) {
          for (uint64_t kw_idx = 0; kw_idx < kw; ++kw_idx) {
            const T &val = window[kh_idx * pad_w + kw_idx];
            if (replaces_max(val, max_val)) {
              max_val = val;
              if constexpr(track_index) {
                max_idx = int32_t(kh_idx * kw + kw_idx);
              }
            }
          }
        }

        output[out_idx] = max_val;
        if constexpr(track_index) {
          indices[out_idx] = max_idx;
        }
      }
    }
  }
}

template<typename T>
void max_pooling_reference_dispatch(const tensor4d_t &padded,
                                    const pool_params &params,
                                    tensor4d_t &output,
                                    tensor4d_t *indices,
                                    const int num_threads) {
  if (indices) {
    max_pooling_reference_impl<T, true>(padded.data<const T>(),
                                        output.data<T>(),
                                        indices->data<int32_t>(),
                                        params, num_threads);
  }
  else {
    max_pooling_reference_impl<T, false>(padded.data<const T>(),
                                         output.data<T>(),
                                         nullptr, params, num_threads);
  }
}

}

status_t max_pool_ref_kernel_t::execute(const tensor4d_t &padded,
                                        const pool_params &params,
                                        tensor4d_t &output,
                                        tensor4d_t *indices) {
  const int num_threads = pool_thread_count(params.num_threads);

  switch (padded.get_data_type()) {
  case data_type_t::f32:
    max_pooling_reference_dispatch<float>(padded, params, output, indices,
                                          num_threads);
    return status_t::success;
  case data_type_t::bf16:
    max_pooling_reference_dispatch<bfloat16_t>(padded, params, output,
                                               indices, num_threads);
    return status_t::success;
  default:
    break;
  }

  log_error("Pooling Reference: Unsupported data type");
  return status_t::pool_unsupported_dtype;
}

std::string max_pool_ref_kernel_t::name() const {
  return "reference";
}

} // namespace pooling
} // namespace winpool
