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
#include <cstring>
#include <limits>
#include <omp.h>
#include "pooling_padding.hpp"
#include "pooling/pooling_utils.hpp"

namespace winpool {
namespace pooling {

using namespace winpool::error_handling;

namespace {

constexpr uint64_t max_extent = uint64_t(std::numeric_limits<int64_t>::max());

// a <= max_extent
bool sum_fits(uint64_t a, uint64_t b) {
  return b <= max_extent - a;
}

bool product_fits(uint64_t a, uint64_t b) {
  return a == 0 || b <= max_extent / a;
}

int64_t same_padding_needed(int64_t in, int64_t kernel, int64_t stride) {
  int64_t rem = in % stride;
  return std::max<int64_t>(kernel - (rem == 0 ? stride : rem), 0);
}

template<typename T>
void pad_tensor_impl(const T *src, T *dst, const pooling_dims_t &dims,
                     const pool_padding_t &padding, bool reflect,
                     int num_threads) {
  const int64_t planes = int64_t(dims.batch * dims.channels);
  const int64_t in_h   = int64_t(dims.in_height);
  const int64_t in_w   = int64_t(dims.in_width);
  const int64_t pad_h  = int64_t(dims.padded_height);
  const int64_t pad_w  = int64_t(dims.padded_width);
  const T       fill   = T(-std::numeric_limits<float>::infinity());

  #pragma omp parallel for collapse(2) num_threads(num_threads)
  for (int64_t p = 0; p < planes; ++p) {
    for (int64_t ph = 0; ph < pad_h; ++ph) {
      T            *dst_row = dst + (p * pad_h + ph) * pad_w;
      const int64_t ih      = ph - padding.top;

      if (!reflect && (ih < 0 || ih >= in_h)) {
        std::fill(dst_row, dst_row + pad_w, fill);
        continue;
      }

      const T *src_row = src + (p * in_h + reflect_index(ih, in_h)) * in_w;
      for (int64_t pw = 0; pw < padding.left; ++pw) {
        dst_row[pw] = reflect ? src_row[reflect_index(pw - padding.left, in_w)]
                      : fill;
      }
      std::memcpy(dst_row + padding.left, src_row, in_w * sizeof(T));
      for (int64_t pw = padding.left + in_w; pw < pad_w; ++pw) {
        dst_row[pw] = reflect ? src_row[reflect_index(pw - padding.left, in_w)]
                      : fill;
      }
    }
  }
}

}

status_t compute_padding(int64_t in_h, int64_t in_w,
                         const pool_kernel_t &kernel,
                         const pool_stride_t &stride,
                         pool_padding_mode_t mode,
                         const pool_pad_hw_t &explicit_pad,
                         pool_padding_t &padding) {
  if (in_h <= 0 || in_w <= 0) {
    log_error("Pooling padding: input extent must be positive, got ",
              in_h, "x", in_w);
    return status_t::pool_invalid_dimension;
  }
  if (kernel.height <= 0 || kernel.width <= 0) {
    log_error("Pooling padding: kernel must be positive, got ",
              kernel.height, "x", kernel.width);
    return status_t::pool_invalid_dimension;
  }
  if (stride.height <= 0 || stride.width <= 0) {
    log_error("Pooling padding: stride must be positive, got ",
              stride.height, "x", stride.width);
    return status_t::pool_invalid_dimension;
  }

  if (mode == pool_padding_mode_t::explicit_padding) {
    if (explicit_pad.height < 0 || explicit_pad.width < 0) {
      log_error("Pooling padding: explicit padding must not be negative, got ",
                explicit_pad.height, "x", explicit_pad.width);
      return status_t::pool_invalid_dimension;
    }
    padding.left   = explicit_pad.width;
    padding.right  = explicit_pad.width;
    padding.top    = explicit_pad.height;
    padding.bottom = explicit_pad.height;
    return status_t::success;
  }

  int64_t needed_h = same_padding_needed(in_h, kernel.height, stride.height);
  int64_t needed_w = same_padding_needed(in_w, kernel.width, stride.width);

  padding.top    = needed_h / 2;
  padding.bottom = needed_h - padding.top;
  padding.left   = needed_w / 2;
  padding.right  = needed_w - padding.left;

  return status_t::success;
}

status_t compute_padding(int64_t in_h, int64_t in_w,
                         const pool_kernel_t &kernel,
                         const pool_stride_t &stride,
                         pool_padding_mode_t mode,
                         int64_t explicit_pad,
                         pool_padding_t &padding) {
  return compute_padding(in_h, in_w, kernel, stride, mode,
                         pool_pad_hw_t{explicit_pad, explicit_pad}, padding);
}

int64_t pooled_size(int64_t in, int64_t pad_before, int64_t pad_after,
                    int64_t kernel, int64_t stride) {
  if (stride <= 0 || in < 0 || pad_before < 0 || pad_after < 0 ||
      !sum_fits(uint64_t(in), uint64_t(pad_before)) ||
      !sum_fits(uint64_t(in + pad_before), uint64_t(pad_after))) {
    return 0;
  }
  int64_t padded = in + pad_before + pad_after;
  if (padded < kernel) {
    return 0;
  }
  return (padded - kernel) / stride + 1;
}

status_t get_padded_dims(pooling_dims_t &dims, const pool_padding_t &padding,
                         data_type_t dtype) {
  const uint64_t h = dims.in_height;
  const uint64_t w = dims.in_width;

  bool fits = h <= max_extent && w <= max_extent &&
              sum_fits(h, uint64_t(padding.top)) &&
              sum_fits(h + padding.top, uint64_t(padding.bottom)) &&
              sum_fits(w, uint64_t(padding.left)) &&
              sum_fits(w + padding.left, uint64_t(padding.right));
  if (fits) {
    dims.padded_height = h + padding.top + padding.bottom;
    dims.padded_width  = w + padding.left + padding.right;

    uint64_t bytes = size_of(dtype);
    for (uint64_t extent : {dims.batch, dims.channels, dims.padded_height,
                            dims.padded_width}) {
      if (!product_fits(bytes, extent)) {
        fits = false;
        break;
      }
      bytes *= extent;
    }
  }

  if (!fits) {
    log_error("Pooling: padding top=", padding.top, " bottom=", padding.bottom,
              " left=", padding.left, " right=", padding.right,
              " overflows the padded tensor size");
    return status_t::pool_invalid_dimension;
  }
  return status_t::success;
}

status_t check_reflect_padding(uint64_t in_h, uint64_t in_w,
                               const pool_padding_t &padding) {
  const int64_t h = int64_t(in_h);
  const int64_t w = int64_t(in_w);

  if (padding.top >= h || padding.bottom >= h ||
      padding.top + padding.bottom >= h) {
    log_error("Pooling: reflect padding top=", padding.top, " bottom=",
              padding.bottom, " needs more than input height ", h);
    return status_t::pool_padding_too_large;
  }
  if (padding.left >= w || padding.right >= w ||
      padding.left + padding.right >= w) {
    log_error("Pooling: reflect padding left=", padding.left, " right=",
              padding.right, " needs more than input width ", w);
    return status_t::pool_padding_too_large;
  }

  return status_t::success;
}

status_t pad_tensor(const tensor4d_t &input, const pool_padding_t &padding,
                    bool reflect, tensor4d_t &padded, uint32_t num_threads) {
  if (input.get_dim() != 4 || !input.is_valid()) {
    log_error("Pooling: pad expects a valid 4-d tensor, got ",
              input.tensor_info());
    return status_t::pool_shape_mismatch;
  }
  if (padding.left < 0 || padding.right < 0 ||
      padding.top < 0 || padding.bottom < 0) {
    log_error("Pooling: padding amounts must not be negative");
    return status_t::pool_invalid_dimension;
  }

  auto dtype = input.get_data_type();
  if (dtype != data_type_t::f32 && dtype != data_type_t::bf16) {
    log_error("Pooling: unsupported data type ", dtype_info(dtype));
    return status_t::pool_unsupported_dtype;
  }

  pooling_dims_t dims;
  dims.batch     = input.get_size(0);
  dims.channels  = input.get_size(1);
  dims.in_height = input.get_size(2);
  dims.in_width  = input.get_size(3);

  if (reflect) {
    status_t status = check_reflect_padding(dims.in_height, dims.in_width,
                                            padding);
    if (status != status_t::success) {
      return status;
    }
  }

  status_t status = get_padded_dims(dims, padding, dtype);
  if (status != status_t::success) {
    return status;
  }

  padded = tensor4d_t()
           .set_size({dims.batch, dims.channels,
                      dims.padded_height, dims.padded_width})
           .set_data_type(dtype)
           .set_name(input.get_name() + "_padded")
           .create();
  if (!padded.is_valid()) {
    return padded.get_last_status();
  }

  const int threads = pool_thread_count(num_threads);
  if (dtype == data_type_t::f32) {
    pad_tensor_impl<float>(input.data<const float>(), padded.data<float>(),
                           dims, padding, reflect, threads);
  }
  else {
    pad_tensor_impl<bfloat16_t>(input.data<const bfloat16_t>(),
                                padded.data<bfloat16_t>(),
                                dims, padding, reflect, threads);
  }

  return status_t::success;
}

} // namespace pooling
} // namespace winpool
