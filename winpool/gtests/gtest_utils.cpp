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
#include <cmath>
#include <cstring>
#include "gtest_utils.hpp"

PoolType::PoolType() {
  batch       = 1 + rand() % POOL_BATCH_END;
  channels    = 1 + rand() % POOL_CHANNEL_END;
  kernel      = {1 + rand() % POOL_KERNEL_END, 1 + rand() % POOL_KERNEL_END};
  stride      = {1 + rand() % POOL_STRIDE_END, 1 + rand() % POOL_STRIDE_END};
  in_height   = uint64_t(kernel.height) + rand() % POOL_SIZE_END;
  in_width    = uint64_t(kernel.width) + rand() % POOL_SIZE_END;
  mode        = rand() % 2 ? pool_padding_mode_t::same :
                pool_padding_mode_t::explicit_padding;
  explicit_pad.height = std::min<int64_t>(rand() % (POOL_PAD_END + 1),
                                          int64_t(in_height - 1) / 2);
  explicit_pad.width  = std::min<int64_t>(rand() % (POOL_PAD_END + 1),
                                          int64_t(in_width - 1) / 2);
  reflect     = rand() % 4 != 0;
  dtype       = rand() % 2 ? data_type_t::bf16 : data_type_t::f32;
  num_threads = rand() % 2 ? 0 : 1 + rand() % 4;
}

tensor4d_t tensor_factory_t::zero_tensor(const std::vector<index_type> size_,
                                         data_type dtype_) {
  auto ztensor = tensor4d_t()
                 .set_name("zero tensor")
                 .set_size(size_)
                 .set_data_type(dtype_)
                 .create();

  if (! ztensor.is_valid()) {
    log_warning("tensor creation of ", ztensor.get_name(), " failed.");
  }
  return ztensor;
}

tensor4d_t tensor_factory_t::uniform_dist_tensor(const std::vector<index_type>
    size_, data_type dtype_, float range_) {
  auto udtensor = tensor4d_t()
                  .set_name("uniform distributed tensor")
                  .set_size(size_)
                  .set_data_type(dtype_)
                  .create();

  if (! udtensor.is_valid()) {
    log_warning("tensor creation of ", udtensor.get_name(), " failed.");
    return udtensor;
  }

  std::mt19937 gen(rand());
  std::uniform_real_distribution<float> dist(-1.0 * range_, 1.0 * range_);
  auto buf_nelem = udtensor.get_nelem();
  if (dtype_ == data_type::f32) {
    float *buf_ptr = udtensor.data<float>();
    std::generate(buf_ptr, buf_ptr+buf_nelem, [&] {return dist(gen);});
  }
  else if (dtype_ == data_type::bf16) {
    bfloat16_t *buf_ptr = udtensor.data<bfloat16_t>();
    std::generate(buf_ptr, buf_ptr+buf_nelem, [&] {return bfloat16_t(dist(gen));});
  }
  else {
    log_warning("tensor ", udtensor.get_name(), " unsupported data type.");
  }
  return udtensor;
}

tensor4d_t tensor_factory_t::coarse_tensor(const std::vector<index_type> size_,
                                           data_type dtype_, int levels_) {
  auto ctensor = tensor4d_t()
                 .set_name("coarse tensor")
                 .set_size(size_)
                 .set_data_type(dtype_)
                 .create();

  if (! ctensor.is_valid()) {
    log_warning("tensor creation of ", ctensor.get_name(), " failed.");
    return ctensor;
  }

  std::mt19937 gen(rand());
  std::uniform_int_distribution<int> dist(0, levels_ - 1);
  for (uint64_t i = 0; i < ctensor.get_nelem(); ++i) {
    float val = float(dist(gen));
    if (dtype_ == data_type::f32) {
      ctensor.data<float>()[i] = val;
    }
    else {
      ctensor.data<bfloat16_t>()[i] = bfloat16_t(val);
    }
  }
  return ctensor;
}

tensor4d_t tensor_factory_t::value_tensor(const std::vector<index_type> size_,
                                          data_type dtype_,
                                          std::vector<float> val_) {
  auto vtensor = tensor4d_t()
                 .set_name("value tensor")
                 .set_size(size_)
                 .set_data_type(dtype_)
                 .create();

  if (! vtensor.is_valid() || vtensor.get_nelem() != val_.size()) {
    log_warning("tensor creation of ", vtensor.get_name(), " failed.");
    return vtensor;
  }

  for (uint64_t i = 0; i < val_.size(); ++i) {
    if (dtype_ == data_type::f32) {
      vtensor.data<float>()[i] = val_[i];
    }
    else {
      vtensor.data<bfloat16_t>()[i] = bfloat16_t(val_[i]);
    }
  }
  return vtensor;
}

status_t pool_params_from(const PoolType &pool, pool_params &params) {
  params.kernel      = pool.kernel;
  params.stride      = pool.stride;
  params.reflect     = pool.reflect;
  params.num_threads = pool.num_threads;
  return compute_padding(int64_t(pool.in_height), int64_t(pool.in_width),
                         pool.kernel, pool.stride, pool.mode,
                         pool.explicit_pad, params.padding);
}

status_t max_pool_kernel_test(const tensor4d_t &input, const PoolType &pool,
                              pooling_algo_t algo, bool want_indices,
                              pool_output_t &output) {
  try {
    pool_params params;
    status_t status = pool_params_from(pool, params);
    if (status != status_t::success) {
      return status;
    }
    params.algo         = algo;
    params.want_indices = want_indices;
    return max_pooling_direct(input, output, params);
  }
  catch (const exception_t &ex) {
    log_error("Exception: ", ex.what());
    return status_t::failure;
  }
}

bool tensor_bitwise_equal(const tensor4d_t &lhs, const tensor4d_t &rhs) {
  if (! lhs.is_alike(rhs)) {
    log_error("tensors differ in shape or type: ", lhs.tensor_info(), " ",
              rhs.tensor_info());
    return false;
  }
  return std::memcmp(lhs.get_raw_handle_const(), rhs.get_raw_handle_const(),
                     lhs.get_buffer_sz_bytes()) == 0;
}

void check_window_max(const tensor4d_t &padded, const tensor4d_t &output,
                      const tensor4d_t &indices, const pool_params &params,
                      bool &is_test_successful) {
  const uint64_t kh = uint64_t(params.kernel.height);
  const uint64_t kw = uint64_t(params.kernel.width);

  for (uint64_t n = 0; n < params.dims.batch && is_test_successful; ++n) {
    for (uint64_t c = 0; c < params.dims.channels; ++c) {
      for (uint64_t oh = 0; oh < params.dims.out_height; ++oh) {
        for (uint64_t ow = 0; ow < params.dims.out_width; ++ow) {
          const float    out = output.at({n, c, oh, ow});
          const int32_t  idx = indices.data<const int32_t>()[
                                 indices.compute_offset({n, c, oh, ow})];
          const bool     out_nan = std::isnan(out);

          if (idx < 0 || uint64_t(idx) >= kh * kw) {
            is_test_successful = false;
            return;
          }
          for (uint64_t w = 0; w < kh * kw; ++w) {
            const float val = padded.at({n, c, oh * params.stride.height + w / kw,
                                         ow * params.stride.width + w % kw});
            const bool  same = out_nan ? std::isnan(val) : val == out;
            if (w == uint64_t(idx) && !same) {
              is_test_successful = false;
            }
            if (w < uint64_t(idx) && same) {
              is_test_successful = false;
            }
            if (!out_nan && (std::isnan(val) || val > out)) {
              is_test_successful = false;
            }
          }
          if (!is_test_successful) {
            log_error("window max check failed at [", n, ", ", c, ", ", oh,
                      ", ", ow, "]");
            return;
          }
        }
      }
    }
  }
}

void Parser::operator()(const int &argc, char *argv[], int &seed,
                        uint32_t &tests) {
  for (int i=1; i<argc; ++i) {
    std::string arg = argv[i];
    if (arg.rfind("--",0)==0 && arg.find("gtest")==std::string::npos && i+1<argc) {
      std::string key = arg.substr(2);
      umap[key] = argv[++i];
    }
  }
  read_from_umap("seed", seed);
  read_from_umap("test", tests);
  return;
}

void Parser::read_from_umap(const std::string &key, int &num) {
  if (umap.count(key)) {
    std::string val = umap.at(key);
    if (isInteger(val)) {
      try {
        num = stoi(val);
      }
      catch (const std::out_of_range &e) {
        log_info("Out-of-range argument for ", key,
                 ", so using default value i.e. timestamp.");
      }
    }
    else {
      log_info("Invalid argument for ", key,
               ", so using default value i.e. timestamp.");
    }
  }
  else {
    log_info("No argument for ", key, ", so using default value i.e. timestamp.");
  }
}

void Parser::read_from_umap(const std::string &key, uint32_t &num) {
  if (umap.count(key)) {
    std::string val = umap.at(key);
    if (isInteger(val) && val[0] != '-') {
      try {
        num = static_cast<uint32_t>(stoul(val));
      }
      catch (const std::out_of_range &e) {
        log_info("Out-of-range argument for ", key,
                 ", so using default value i.e. 100.");
      }
    }
    else {
      log_info("Invalid argument for ", key, ", so using default value i.e. 100.");
    }
  }
  else {
    log_info("No argument for ", key, ", so using default value i.e. 100.");
  }
}

bool Parser::isInteger(const std::string &s) {
  if (s.empty()) {
    return false;
  }
  size_t i = 0;
  if (s[0] == '+' || s[0] == '-') {
    i = 1;
  }
  for (; i < s.size(); ++i) {
    if (!isdigit(s[i])) {
      return false;
    }
  }
  return i > 0 && !(i == 1 && (s[0] == '+' || s[0] == '-'));
}
