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
#include <sstream>
#include "example_utils.hpp"

namespace winpool {
namespace examples {

using namespace winpool::interface;

tensor4d_t tensor_factory_t::zero_tensor(const std::vector<index_type> size_,
                                         data_type dtype_,
                                         std::string tensor_name_) {
  auto ztensor = tensor4d_t()
                 .set_name(tensor_name_)
                 .set_size(size_)
                 .set_data_type(dtype_)
                 .create();

  if (! ztensor.is_valid()) {
    log_warning("tensor creation of ", ztensor.get_name(), " failed.");
  }
  return ztensor;
}

tensor4d_t tensor_factory_t::iota_tensor(const std::vector<index_type> size_,
                                         data_type dtype_,
                                         std::string tensor_name_) {
  auto itensor = tensor4d_t()
                 .set_name(tensor_name_)
                 .set_size(size_)
                 .set_data_type(dtype_)
                 .create();

  if (! itensor.is_valid()) {
    log_warning("tensor creation of ", itensor.get_name(), " failed.");
  }
  else {
    auto  buf_nelem = itensor.get_nelem();
    void *buf_vptr  = itensor.get_raw_handle_unsafe();

    if (dtype_ == data_type::f32) {
      float *buf_ptr = static_cast<float *>(buf_vptr);
      for (index_type i = 0; i < buf_nelem; ++i) {
        buf_ptr[i] = float(i);
      }
    }
    else if (dtype_ == data_type::bf16) {
      bfloat16_t *buf_ptr = static_cast<bfloat16_t *>(buf_vptr);
      for (index_type i = 0; i < buf_nelem; ++i) {
        buf_ptr[i] = bfloat16_t(float(i));
      }
    }
    else {
      log_warning("tensor ", itensor.get_name(), " unsupported data type.");
    }
  }
  return itensor;
}

tensor4d_t tensor_factory_t::uniform_dist_tensor(const std::vector<index_type>
    size_, data_type dtype_, float range_, std::string tensor_name_) {
  auto udtensor = tensor4d_t()
                  .set_name(tensor_name_)
                  .set_size(size_)
                  .set_data_type(dtype_)
                  .create();

  if (! udtensor.is_valid()) {
    log_warning("tensor creation of ", udtensor.get_name(), " failed.");
  }
  else {
    std::mt19937 gen(100);
    std::uniform_real_distribution<float> dist(-1.0 * range_, 1.0 * range_);

    auto  buf_nelem = udtensor.get_nelem();
    void *buf_vptr  = udtensor.get_raw_handle_unsafe();

    if (dtype_ == data_type::f32) {
      float *buf_ptr = static_cast<float *>(buf_vptr);
      std::generate(buf_ptr, buf_ptr+buf_nelem, [&] {return dist(gen);});
    }
    else if (dtype_ == data_type::bf16) {
      bfloat16_t *buf_ptr = static_cast<bfloat16_t *>(buf_vptr);
      std::generate(buf_ptr, buf_ptr+buf_nelem, [&] {return bfloat16_t(dist(gen));});
    }
    else {
      log_warning("tensor ", udtensor.get_name(), " unsupported data type.");
    }
  }
  return udtensor;
}

void tensor_functions_t::tensor_pretty_print(const tensor4d_t &tensor_) {
  if (! tensor_.is_valid() || tensor_.get_dim() != 4) {
    log_warning("tensor ", tensor_.get_name(), " can not be printed.");
    return;
  }

  auto size = tensor_.get_size();
  std::ostringstream ss;
  ss << tensor_.tensor_info() << "\n";
  for (uint64_t n = 0; n < size[0]; ++n) {
    for (uint64_t c = 0; c < size[1]; ++c) {
      ss << "[" << n << ", " << c << "]\n";
      for (uint64_t h = 0; h < size[2]; ++h) {
        for (uint64_t w = 0; w < size[3]; ++w) {
          ss << " " << tensor_.at({n, c, h, w});
        }
        ss << "\n";
      }
    }
  }
  log_info(ss.str());
}

bool tensor_functions_t::tensor_bitwise_equal(const tensor4d_t &lhs_,
                                              const tensor4d_t &rhs_) {
  if (! lhs_.is_alike(rhs_)) {
    return false;
  }
  return std::memcmp(lhs_.get_raw_handle_const(), rhs_.get_raw_handle_const(),
                     lhs_.get_buffer_sz_bytes()) == 0;
}

} //examples
} //winpool
