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
#include <algorithm>
#include <climits>
#include <cstring>
#include <omp.h>
#include "max_pooling.hpp"

namespace winpool {
namespace pooling {

namespace {

pooling_algo_t resolve_pooling_algo(pooling_algo_t algo) {
  if (algo != pooling_algo_t::none) {
    return algo;
  }
  return pooling_config_t::instance().get_algo();
}

template<typename T>
void max_pooling_backward_impl(const T *grad_out, const int32_t *indices,
                               float *grad_in, const pool_params &params,
                               int num_threads) {
  const int64_t planes   = int64_t(params.dims.batch * params.dims.channels);
  const int64_t in_h     = int64_t(params.dims.in_height);
  const int64_t in_w     = int64_t(params.dims.in_width);
  const int64_t out_h    = int64_t(params.dims.out_height);
  const int64_t out_w    = int64_t(params.dims.out_width);
  const int64_t kw       = params.kernel.width;
  const int64_t stride_h = params.stride.height;
  const int64_t stride_w = params.stride.width;
  const int64_t top      = params.padding.top;
  const int64_t left     = params.padding.left;
  const bool    reflect  = params.reflect;

  // each plane is owned by one thread, cells accumulate in row-major order
  #pragma omp parallel for num_threads(num_threads)
  for (int64_t p = 0; p < planes; ++p) {
    float *plane_in = grad_in + p * in_h * in_w;
    int64_t cell    = p * out_h * out_w;

    for (int64_t oh = 0; oh < out_h; ++oh) {
      for (int64_t ow = 0; ow < out_w; ++ow, ++cell) {
        const int64_t offset = indices[cell];
        int64_t ih = oh * stride_h + offset / kw - top;
        int64_t iw = ow * stride_w + offset % kw - left;

        if (reflect) {
          ih = reflect_index(ih, in_h);
          iw = reflect_index(iw, in_w);
        }
        else if (ih < 0 || ih >= in_h || iw < 0 || iw >= in_w) {
          continue;
        }
        plane_in[ih * in_w + iw] += float(grad_out[cell]);
      }
    }
  }
}

}

status_t max_pooling_direct(const tensor4d_t &input,
                            pool_output_t &output,
                            pool_params &params) {
  profile::profiler_t profiler;
  bool is_profile = is_profile_enabled() || bool(params.profile_cb);
  if (is_profile) {
    profiler.tbp_start();
  }

  status_t status = validate_pooling_inputs(input, params);
  if (status != status_t::success) {
    return status;
  }

  const pooling_algo_t algo = resolve_pooling_algo(params.algo);
  if (algo != pooling_algo_t::reference && algo != pooling_algo_t::batched) {
    log_error("Pooling: unknown kernel ",
              pooling_config_t::pooling_algo_to_str(algo));
    return status_t::pool_bad_kernel;
  }

  std::string params_str;
  if (apilog_info_enabled() || is_profile) {
    params_str = pooling_params_str(params);
  }
  apilog_info(params_str);

  std::unique_ptr<max_pool_kernel_t> kernel = make_max_pool_kernel(algo);
  log_info("Using ", kernel->name(), " kernel for max pooling");

  tensor4d_t padded;
  if (params.padding.is_zero()) {
    padded = input;
  }
  else {
    status = pad_tensor(input, params.padding, params.reflect, padded,
                        params.num_threads);
    if (status != status_t::success) {
      return status;
    }
  }

  const tensor4d_t::index_vec_type out_size = {params.dims.batch,
                                               params.dims.channels,
                                               params.dims.out_height,
                                               params.dims.out_width};
  tensor4d_t pooled = tensor4d_t()
                      .set_size(out_size)
                      .set_data_type(input.get_data_type())
                      .set_name(input.get_name() + "_pooled")
                      .create();
  if (!pooled.is_valid()) {
    return pooled.get_last_status();
  }

  std::optional<tensor4d_t> indices;
  if (params.want_indices) {
    indices = tensor4d_t()
              .set_size(out_size)
              .set_data_type(data_type_t::s32)
              .set_name(input.get_name() + "_indices")
              .create();
    if (!indices->is_valid()) {
      return indices->get_last_status();
    }
  }

  status = kernel->execute(padded, params, pooled,
                           indices ? &(*indices) : nullptr);
  if (status != status_t::success) {
    return status;
  }

  output.output  = std::move(pooled);
  output.indices = std::move(indices);

  if (is_profile) {
    profiler.tbp_stop();
    if (is_profile_enabled()) {
      profilelog_verbose(params_str, ", kernel=", kernel->name(), ", time=",
                         profiler.tbp_elapsedtime(), profiler.get_res_str());
    }
    if (params.profile_cb) {
      params.profile_cb(params_str, profiler.tbp_elapsedtime());
    }
  }

  return status_t::success;
}

status_t max_pooling(const tensor4d_t &input,
                     const pool_kernel_t &kernel,
                     const pool_stride_t &stride,
                     pool_padding_mode_t mode,
                     const pool_pad_hw_t &explicit_pad,
                     bool want_indices,
                     pool_output_t &output,
                     pooling_algo_t algo) {
  if (!input.is_valid() || input.get_dim() != 4) {
    log_error("Pooling: Input must be a created [N, C, H, W] tensor");
    return status_t::pool_shape_mismatch;
  }

  pool_params params;
  params.kernel       = kernel;
  params.stride       = stride;
  params.want_indices = want_indices;
  params.algo         = algo;

  status_t status = compute_padding(int64_t(input.get_size(2)),
                                    int64_t(input.get_size(3)),
                                    kernel, stride, mode, explicit_pad,
                                    params.padding);
  if (status != status_t::success) {
    return status;
  }

  return max_pooling_direct(input, output, params);
}

status_t max_pooling_backward_direct(const tensor4d_t &grad_output,
                                     const tensor4d_t &indices,
                                     tensor4d_t &grad_input,
                                     const pool_params &params) {
  if (!grad_output.is_valid() || !indices.is_valid() ||
      grad_output.get_dim() != 4 || indices.get_dim() != 4 ||
      grad_output.get_size() != indices.get_size()) {
    log_error("Pooling backward: gradient ", grad_output.tensor_info(),
              " and index map ", indices.tensor_info(),
              " must be 4-d tensors of the same shape");
    return status_t::pool_shape_mismatch;
  }

  if (params.kernel.height <= 0 || params.kernel.width <= 0 ||
      params.stride.height <= 0 || params.stride.width <= 0 ||
      params.dims.in_height == 0 || params.dims.in_width == 0 ||
      params.dims.batch == 0 || params.dims.channels == 0 ||
      params.num_threads > uint32_t(INT_MAX)) {
    log_error("Pooling backward: invalid parameter block");
    return status_t::pool_invalid_dimension;
  }

  const tensor4d_t::index_vec_type out_size = {params.dims.batch,
                                               params.dims.channels,
                                               params.dims.out_height,
                                               params.dims.out_width};
  if (grad_output.get_size() != out_size) {
    log_error("Pooling backward: gradient ", grad_output.tensor_info(),
              " does not match forward output extents");
    return status_t::pool_shape_mismatch;
  }

  auto dtype = grad_output.get_data_type();
  if ((dtype != data_type_t::f32 && dtype != data_type_t::bf16) ||
      indices.get_data_type() != data_type_t::s32) {
    log_error("Pooling backward: unsupported data types ",
              dtype_info(dtype), ", ", dtype_info(indices.get_data_type()));
    return status_t::pool_unsupported_dtype;
  }

  const int32_t  window  = int32_t(params.kernel.height * params.kernel.width);
  const int32_t *idx_ptr = indices.data<const int32_t>();
  const uint64_t ncells  = indices.get_nelem();
  const int32_t *bad     = std::find_if(idx_ptr, idx_ptr + ncells,
  [window](int32_t idx) {
    return idx < 0 || idx >= window;
  });
  if (bad != idx_ptr + ncells) {
    log_error("Pooling backward: index ", *bad, " outside window of ",
              window, " elements");
    return status_t::pool_invalid_dimension;
  }

  const tensor4d_t::index_vec_type in_size = {params.dims.batch,
                                              params.dims.channels,
                                              params.dims.in_height,
                                              params.dims.in_width};
  if (!(grad_input.is_valid() && grad_input.get_size() == in_size &&
        grad_input.get_data_type() == data_type_t::f32)) {
    grad_input = tensor4d_t()
                 .set_size(in_size)
                 .set_data_type(data_type_t::f32)
                 .set_name(grad_output.get_name() + "_scattered")
                 .create();
    if (!grad_input.is_valid()) {
      return grad_input.get_last_status();
    }
  }
  std::memset(grad_input.get_raw_handle_unsafe(), 0,
              grad_input.get_buffer_sz_bytes());

  const int num_threads = pool_thread_count(params.num_threads);
  if (dtype == data_type_t::f32) {
    max_pooling_backward_impl<float>(grad_output.data<const float>(), idx_ptr,
                                     grad_input.data<float>(), params,
                                     num_threads);
  }
  else {
    max_pooling_backward_impl<bfloat16_t>(grad_output.data<const bfloat16_t>(),
                                          idx_ptr, grad_input.data<float>(),
                                          params, num_threads);
  }

  return status_t::success;
}

} // namespace pooling
} // namespace winpool
