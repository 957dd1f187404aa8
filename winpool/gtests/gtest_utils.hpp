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
#ifndef _GTEST_UTILS_HPP_
#define _GTEST_UTILS_HPP_
#include <string>
#include <random>
#include <algorithm>
#include <unordered_map>
#include <omp.h>
#include "memory/tensor4d.hpp"
#include "common/winpool_global.hpp"
#include "pooling/max_pooling.hpp"

#define POOL_BATCH_END    4
#define POOL_CHANNEL_END  8
#define POOL_SIZE_END     40
#define POOL_KERNEL_END   5
#define POOL_STRIDE_END   4
#define POOL_PAD_END      2

using namespace winpool::memory;
using namespace winpool::error_handling;
using namespace winpool::common;
using namespace winpool::pooling;

/** @brief Max pooling Parameters Structure
 *
 *  Random parameters that always describe a valid call: input extents are at
 *  least the kernel size, and explicit padding stays below half the input.
 */
struct PoolType {
  uint64_t            batch;
  uint64_t            channels;
  uint64_t            in_height;
  uint64_t            in_width;
  pool_kernel_t       kernel;
  pool_stride_t       stride;
  pool_padding_mode_t mode;
  pool_pad_hw_t       explicit_pad;
  bool                reflect;
  data_type_t         dtype;
  uint32_t            num_threads;
  PoolType();
};

extern int seed;
extern uint32_t test_num;
extern std::vector<PoolType> pool_test;

//To generate random tensor
class tensor_factory_t {
 public:
  /** @brief Index type */
  using index_type = tensor4d_t::index_type;
  using data_type  = data_type_t;

  /** @brief zero tensor */
  tensor4d_t zero_tensor(const std::vector<index_type> size_, data_type dtype_);

  /** @brief uniformly distributed tensor */
  tensor4d_t uniform_dist_tensor(const std::vector<index_type> size_,
                                 data_type dtype_, float range_);

  /** @brief tensor of small integers, so that windows hold ties */
  tensor4d_t coarse_tensor(const std::vector<index_type> size_,
                           data_type dtype_, int levels_);

  /** @brief tensor holding the given values in row-major order */
  tensor4d_t value_tensor(const std::vector<index_type> size_,
                          data_type dtype_, std::vector<float> val_);
};

/**
 * @class Parser
 * @brief Command Line Parser Utility for gtest
 *
 * Reads --seed and --test from the command line.
 */
class Parser {
  /** @brief Map to store command line arguments as {key,val} pair */
  std::unordered_map<std::string, std::string> umap {};
  /** @brief check if string is numeric or not */
  bool isInteger(const std::string &s);
  /** @brief read from key if valid or invalid key is given */
  void read_from_umap(const std::string &key, int &num);
  void read_from_umap(const std::string &key, uint32_t &num);
 public:
  /** @brief to make object callable */
  void operator()(const int &argc, char *argv[], int &seed,
                  uint32_t &test_num);
};

/** @fn pool_params_from
 *  @brief Parameter block of a random test case, padding computed.
 */
status_t pool_params_from(const PoolType &pool, pool_params &params);

/** @fn max_pool_kernel_test
 *  @brief Max pooling of a random test case with a given kernel.
 */
status_t max_pool_kernel_test(const tensor4d_t &input, const PoolType &pool,
                              pooling_algo_t algo, bool want_indices,
                              pool_output_t &output);

/** @fn tensor_bitwise_equal
 *  @brief Compare size, data type and every byte of two tensors.
 */
bool tensor_bitwise_equal(const tensor4d_t &lhs, const tensor4d_t &rhs);

/** @fn check_window_max
 *  @brief Check output and index map against the windows of the padded
 *  input.
 *
 *  For every cell the window element at the recorded offset must equal the
 *  output, no window element may exceed it, and no earlier element may equal
 *  it (NaN counts as equal to NaN and greater than any number).
 */
void check_window_max(const tensor4d_t &padded, const tensor4d_t &output,
                      const tensor4d_t &indices, const pool_params &params,
                      bool &is_test_successful);

#endif
