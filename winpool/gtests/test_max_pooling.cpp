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
#include <gtest/gtest.h>
#include <cmath>
#include <cstring>
#include <limits>
#include "gtest_utils.hpp"


/** @brief TestMaxPooling is a test class to handle parameters */
class TestMaxPooling : public ::testing::TestWithParam<PoolType> {
 protected:
  /** @brief SetUp is to initialize test parameters
   *
   *  This method is a standard and is used in googletests to initialize parameters
   *  for each test and also acts as fixutres i.e. handling the common part of
   *  each test.
   *
   * */
  virtual void SetUp() {
    pool = GetParam();
    log_info("batch: ", pool.batch, " channels: ", pool.channels,
             " in: ", pool.in_height, "x", pool.in_width,
             " kernel: ", pool.kernel.height, "x", pool.kernel.width,
             " stride: ", pool.stride.height, "x", pool.stride.width,
             " mode: ", pool.mode == pool_padding_mode_t::same ? "same" : "explicit",
             " reflect: ", pool.reflect, " dtype: ", dtype_info(pool.dtype));
  }

  /** @brief TearDown is used to free resource used in test */
  virtual void TearDown() {}
  PoolType pool;
  tensor_factory_t tensor_factory{};
};

/** @fn TEST_P
 *  @param TestMaxPooling parameterized test class to initialize parameters
 *  @param ReferenceVsBatched user-defined name of test
 *  @brief Test to validate that batched and reference kernels give bitwise
 *  equal outputs and index maps
 */
TEST_P(TestMaxPooling, ReferenceVsBatched) {
  auto input = tensor_factory.uniform_dist_tensor({pool.batch, pool.channels,
               pool.in_height, pool.in_width}, pool.dtype, 2.0f);

  pool_output_t ref_output, batched_output;
  status_t ref_status = max_pool_kernel_test(input, pool,
                        pooling_algo_t::reference, true, ref_output);
  status_t status     = max_pool_kernel_test(input, pool,
                        pooling_algo_t::batched, true, batched_output);

  bool is_test_successful =
    (status == status_t::success && ref_status == status_t::success);
  if (is_test_successful) {
    is_test_successful =
      tensor_bitwise_equal(ref_output.output, batched_output.output) &&
      tensor_bitwise_equal(*ref_output.indices, *batched_output.indices);
  }

  EXPECT_TRUE(is_test_successful);
}

/** @fn TEST_P
 *  @param TestMaxPooling parameterized test class to initialize parameters
 *  @param TiesReferenceVsBatched user-defined name of test
 *  @brief Test to validate kernel equivalence on inputs full of ties
 */
TEST_P(TestMaxPooling, TiesReferenceVsBatched) {
  auto input = tensor_factory.coarse_tensor({pool.batch, pool.channels,
               pool.in_height, pool.in_width}, pool.dtype, 3);

  pool_output_t ref_output, batched_output;
  status_t ref_status = max_pool_kernel_test(input, pool,
                        pooling_algo_t::reference, true, ref_output);
  status_t status     = max_pool_kernel_test(input, pool,
                        pooling_algo_t::batched, true, batched_output);

  bool is_test_successful =
    (status == status_t::success && ref_status == status_t::success);
  if (is_test_successful) {
    is_test_successful =
      tensor_bitwise_equal(ref_output.output, batched_output.output) &&
      tensor_bitwise_equal(*ref_output.indices, *batched_output.indices);
  }

  EXPECT_TRUE(is_test_successful);
}

/** @fn TEST_P
 *  @param TestMaxPooling parameterized test class to initialize parameters
 *  @param IndexMapPointsAtFirstMax user-defined name of test
 *  @brief Test to validate output and index map against every window
 */
TEST_P(TestMaxPooling, IndexMapPointsAtFirstMax) {
  auto input = tensor_factory.coarse_tensor({pool.batch, pool.channels,
               pool.in_height, pool.in_width}, pool.dtype, 5);

  pool_params params;
  ASSERT_EQ(pool_params_from(pool, params), status_t::success);
  params.want_indices = true;

  pool_output_t output;
  ASSERT_EQ(max_pooling_direct(input, output, params), status_t::success);
  ASSERT_TRUE(output.indices.has_value());

  tensor4d_t padded;
  ASSERT_EQ(pad_tensor(input, params.padding, params.reflect, padded),
            status_t::success);

  bool is_test_successful = true;
  check_window_max(padded, output.output, *output.indices, params,
                   is_test_successful);
  EXPECT_TRUE(is_test_successful);
}

/** @fn TEST_P
 *  @param TestMaxPooling parameterized test class to initialize parameters
 *  @param Idempotent user-defined name of test
 *  @brief Test to validate that repeated calls give bitwise equal outputs and
 *  leave the input untouched
 */
TEST_P(TestMaxPooling, Idempotent) {
  auto input = tensor_factory.uniform_dist_tensor({pool.batch, pool.channels,
               pool.in_height, pool.in_width}, pool.dtype, 1.0f);
  auto input_copy = tensor_factory.zero_tensor(input.get_size(), pool.dtype);
  std::memcpy(input_copy.get_raw_handle_unsafe(), input.get_raw_handle_const(),
              input.get_buffer_sz_bytes());

  pool_output_t first, second;
  EXPECT_EQ(max_pool_kernel_test(input, pool, pooling_algo_t::none, false,
                                 first), status_t::success);
  EXPECT_EQ(max_pool_kernel_test(input, pool, pooling_algo_t::none, false,
                                 second), status_t::success);

  EXPECT_FALSE(first.indices.has_value());
  EXPECT_TRUE(tensor_bitwise_equal(first.output, second.output));
  EXPECT_TRUE(tensor_bitwise_equal(input, input_copy));
}

/** @fn TEST_P
 *  @param TestMaxPooling parameterized test class to initialize parameters
 *  @param OutputShape user-defined name of test
 *  @brief Test to validate output extents and data type
 */
TEST_P(TestMaxPooling, OutputShape) {
  auto input = tensor_factory.uniform_dist_tensor({pool.batch, pool.channels,
               pool.in_height, pool.in_width}, pool.dtype, 1.0f);

  pool_params params;
  ASSERT_EQ(pool_params_from(pool, params), status_t::success);
  params.want_indices = true;

  pool_output_t output;
  ASSERT_EQ(max_pooling_direct(input, output, params), status_t::success);

  uint64_t out_h = (pool.in_height + params.padding.top + params.padding.bottom
                    - pool.kernel.height) / pool.stride.height + 1;
  uint64_t out_w = (pool.in_width + params.padding.left + params.padding.right
                    - pool.kernel.width) / pool.stride.width + 1;
  std::vector<uint64_t> out_size = {pool.batch, pool.channels, out_h, out_w};

  EXPECT_EQ(output.output.get_size(), out_size);
  EXPECT_EQ(output.output.get_data_type(), pool.dtype);
  EXPECT_EQ(output.indices->get_size(), out_size);
  EXPECT_EQ(output.indices->get_data_type(), data_type_t::s32);
  if (pool.mode == pool_padding_mode_t::same) {
    EXPECT_EQ(out_h, (pool.in_height + pool.stride.height - 1) /
              pool.stride.height);
    EXPECT_EQ(out_w, (pool.in_width + pool.stride.width - 1) /
              pool.stride.width);
  }
}

/** @fn INSTANTIATE_TEST_SUITE_P
 *  @brief Triggers Max Pooling parameterized test suite
 */
INSTANTIATE_TEST_SUITE_P(MaxPooling, TestMaxPooling,
                         ::testing::ValuesIn(pool_test));

/** @brief Directed max pooling tests on hand built inputs */
class TestMaxPoolingDirected : public ::testing::TestWithParam<pooling_algo_t> {
 protected:
  tensor_factory_t tensor_factory{};

  status_t run(const tensor4d_t &input, pool_params &params,
               pool_output_t &output) {
    params.algo = GetParam();
    return max_pooling_direct(input, output, params);
  }
};

TEST_P(TestMaxPoolingDirected, BlockReduce) {
  std::vector<float> val(16);
  for (size_t i = 0; i < val.size(); ++i) {
    val[i] = float((i * 7) % 16);
  }
  auto input = tensor_factory.value_tensor({1, 1, 4, 4}, data_type_t::f32, val);

  pool_params params;
  params.kernel       = {2, 2};
  params.stride       = {2, 2};
  params.want_indices = true;

  pool_output_t output;
  ASSERT_EQ(run(input, params, output), status_t::success);
  ASSERT_EQ(output.output.get_size(), std::vector<uint64_t>({1, 1, 2, 2}));

  for (uint64_t oh = 0; oh < 2; ++oh) {
    for (uint64_t ow = 0; ow < 2; ++ow) {
      float expected = -1;
      for (uint64_t h = 2 * oh; h < 2 * oh + 2; ++h) {
        for (uint64_t w = 2 * ow; w < 2 * ow + 2; ++w) {
          expected = std::max(expected, val[h * 4 + w]);
        }
      }
      EXPECT_EQ(output.output.at({0, 0, oh, ow}), expected);
    }
  }
}

TEST_P(TestMaxPoolingDirected, SameBoundaryExtent) {
  auto input = tensor_factory.uniform_dist_tensor({2, 3, 5, 5},
               data_type_t::f32, 1.0f);

  pool_params params;
  params.kernel = {3, 3};
  params.stride = {2, 2};
  ASSERT_EQ(compute_padding(5, 5, params.kernel, params.stride,
                            pool_padding_mode_t::same, 0, params.padding),
            status_t::success);
  EXPECT_EQ(params.padding.top, 1);
  EXPECT_EQ(params.padding.bottom, 1);

  pool_output_t output;
  ASSERT_EQ(run(input, params, output), status_t::success);
  EXPECT_EQ(params.dims.padded_height, 7u);
  EXPECT_EQ(output.output.get_size(), std::vector<uint64_t>({2, 3, 3, 3}));
}

TEST_P(TestMaxPoolingDirected, TieBreakFirstInScanOrder) {
  auto input = tensor_factory.value_tensor({1, 1, 2, 3}, data_type_t::f32,
               {1, 7, 3,
                7, 2, 7});

  pool_params params;
  params.kernel       = {2, 3};
  params.stride       = {1, 1};
  params.want_indices = true;

  pool_output_t output;
  ASSERT_EQ(run(input, params, output), status_t::success);
  EXPECT_EQ(output.output.at({0, 0, 0, 0}), 7.0f);
  EXPECT_EQ(output.indices->at({0, 0, 0, 0}), 1.0f);
}

TEST_P(TestMaxPoolingDirected, NaNPropagates) {
  const float nan = std::numeric_limits<float>::quiet_NaN();
  auto input = tensor_factory.value_tensor({1, 1, 2, 4}, data_type_t::f32,
               {1, 5, nan, 2,
                9, 3, 4, 8});

  pool_params params;
  params.kernel       = {2, 2};
  params.stride       = {2, 2};
  params.want_indices = true;

  pool_output_t output;
  ASSERT_EQ(run(input, params, output), status_t::success);
  EXPECT_EQ(output.output.at({0, 0, 0, 0}), 9.0f);
  EXPECT_EQ(output.indices->at({0, 0, 0, 0}), 2.0f);
  EXPECT_TRUE(std::isnan(output.output.at({0, 0, 0, 1})));
  EXPECT_EQ(output.indices->at({0, 0, 0, 1}), 0.0f);
}

TEST_P(TestMaxPoolingDirected, OverlappingAndSkippingWindows) {
  auto input = tensor_factory.value_tensor({1, 1, 1, 7}, data_type_t::f32,
               {4, 1, 6, 2, 0, 3, 5});

  pool_params params;
  params.kernel = {1, 3};
  params.stride = {1, 1};

  pool_output_t overlapping;
  ASSERT_EQ(run(input, params, overlapping), status_t::success);
  std::vector<float> expected = {6, 6, 6, 3, 5};
  ASSERT_EQ(overlapping.output.get_size(3), expected.size());
  for (uint64_t i = 0; i < expected.size(); ++i) {
    EXPECT_EQ(overlapping.output.at({0, 0, 0, i}), expected[i]);
  }

  params.kernel = {1, 1};
  params.stride = {1, 3};
  pool_output_t skipping;
  ASSERT_EQ(run(input, params, skipping), status_t::success);
  ASSERT_EQ(skipping.output.get_size(3), 3u);
  EXPECT_EQ(skipping.output.at({0, 0, 0, 0}), 4.0f);
  EXPECT_EQ(skipping.output.at({0, 0, 0, 1}), 2.0f);
  EXPECT_EQ(skipping.output.at({0, 0, 0, 2}), 5.0f);
}

TEST_P(TestMaxPoolingDirected, ReflectPaddingMirrorsInterior) {
  // reflect padded row is 7 | 3 7 1 | 7, the border never repeats the edge
  auto input = tensor_factory.value_tensor({1, 1, 1, 3}, data_type_t::f32,
               {3, 7, 1});

  pool_params params;
  params.kernel       = {1, 2};
  params.stride       = {1, 1};
  params.padding.left  = 1;
  params.padding.right = 1;
  params.want_indices = true;

  pool_output_t output;
  ASSERT_EQ(run(input, params, output), status_t::success);
  ASSERT_EQ(output.output.get_size(3), 4u);
  EXPECT_EQ(output.output.at({0, 0, 0, 0}), 7.0f);
  EXPECT_EQ(output.indices->at({0, 0, 0, 0}), 0.0f);
  EXPECT_EQ(output.output.at({0, 0, 0, 3}), 7.0f);
  EXPECT_EQ(output.indices->at({0, 0, 0, 3}), 1.0f);
}

TEST_P(TestMaxPoolingDirected, NegativeInfinityFillWithoutReflect) {
  auto input = tensor_factory.value_tensor({1, 1, 1, 3}, data_type_t::f32,
               {-3, -7, -1});

  pool_params params;
  params.kernel        = {1, 2};
  params.stride        = {1, 1};
  params.padding.left  = 1;
  params.padding.right = 1;
  params.reflect       = false;
  params.want_indices  = true;

  pool_output_t output;
  ASSERT_EQ(run(input, params, output), status_t::success);
  EXPECT_EQ(output.output.at({0, 0, 0, 0}), -3.0f);
  EXPECT_EQ(output.indices->at({0, 0, 0, 0}), 1.0f);
  EXPECT_EQ(output.output.at({0, 0, 0, 3}), -1.0f);
  EXPECT_EQ(output.indices->at({0, 0, 0, 3}), 0.0f);

  // windows of padding only
  params.kernel        = {1, 2};
  params.padding.left  = 2;
  params.padding.right = 0;
  pool_output_t border;
  ASSERT_EQ(run(input, params, border), status_t::success);
  EXPECT_EQ(border.output.at({0, 0, 0, 0}),
            -std::numeric_limits<float>::infinity());
  EXPECT_EQ(border.indices->at({0, 0, 0, 0}), 0.0f);
}

TEST_P(TestMaxPoolingDirected, Bf16CopiesSelectedBits) {
  std::vector<bfloat16_t> buffer = {
    bfloat16_t::from_bits(0x3f81), bfloat16_t::from_bits(0xc000),
    bfloat16_t::from_bits(0x3f80), bfloat16_t::from_bits(0x4049)
  };
  auto input = tensor4d_t()
               .set_name("bf16 borrowed")
               .set_size({1, 1, 2, 2})
               .set_data_type(data_type_t::bf16)
               .set_storage(buffer.data(), buffer.size() * sizeof(bfloat16_t))
               .create();
  ASSERT_TRUE(input.is_valid());
  EXPECT_EQ(input.get_raw_handle_const(), buffer.data());

  pool_params params;
  params.kernel = {2, 2};
  params.stride = {1, 1};

  pool_output_t output;
  ASSERT_EQ(run(input, params, output), status_t::success);
  EXPECT_EQ(output.output.get_data_type(), data_type_t::bf16);
  EXPECT_EQ(output.output.data<bfloat16_t>()[0].raw_bits(), 0x4049);
}

TEST_P(TestMaxPoolingDirected, PaddingTooLarge) {
  auto input = tensor_factory.uniform_dist_tensor({1, 1, 2, 2},
               data_type_t::f32, 1.0f);

  pool_params params;
  params.kernel = {3, 3};
  params.stride = {1, 1};
  ASSERT_EQ(compute_padding(2, 2, params.kernel, params.stride,
                            pool_padding_mode_t::same, 0, params.padding),
            status_t::success);

  pool_output_t output;
  EXPECT_EQ(run(input, params, output), status_t::pool_padding_too_large);

  params.padding = {2, 2, 0, 0};
  EXPECT_EQ(run(input, params, output), status_t::pool_padding_too_large);

  params.padding = {0, 0, 0, 0};
  EXPECT_EQ(run(input, params, output), status_t::pool_invalid_dimension);
}

TEST_P(TestMaxPoolingDirected, ShapeMismatch) {
  auto input = tensor_factory.uniform_dist_tensor({2, 4, 4},
               data_type_t::f32, 1.0f);

  pool_params params;
  params.kernel = {2, 2};
  params.stride = {2, 2};

  pool_output_t output;
  EXPECT_EQ(run(input, params, output), status_t::pool_shape_mismatch);
  EXPECT_EQ(run(tensor4d_t(), params, output), status_t::pool_shape_mismatch);
}

TEST_P(TestMaxPoolingDirected, InvalidDimension) {
  auto input = tensor_factory.uniform_dist_tensor({1, 1, 4, 4},
               data_type_t::f32, 1.0f);
  pool_output_t output;

  pool_params params;
  params.kernel = {0, 2};
  EXPECT_EQ(run(input, params, output), status_t::pool_invalid_dimension);

  params.kernel = {2, 2};
  params.stride = {1, -1};
  EXPECT_EQ(run(input, params, output), status_t::pool_invalid_dimension);

  params.stride  = {1, 1};
  params.padding = {-1, 0, 0, 0};
  EXPECT_EQ(run(input, params, output), status_t::pool_invalid_dimension);

  params.padding = {0, 0, 0, 0};
  params.kernel  = {5, 1};
  EXPECT_EQ(run(input, params, output), status_t::pool_invalid_dimension);
}

TEST_P(TestMaxPoolingDirected, UnsupportedDataType) {
  auto input = tensor_factory.zero_tensor({1, 1, 4, 4}, data_type_t::s32);

  pool_params params;
  params.kernel = {2, 2};
  params.stride = {2, 2};

  pool_output_t output;
  EXPECT_EQ(run(input, params, output), status_t::pool_unsupported_dtype);
}

TEST_P(TestMaxPoolingDirected, PaddedSizeOverflow) {
  auto input = tensor_factory.value_tensor({1, 1, 1, 1}, data_type_t::f32,
               {1});
  pool_output_t output;

  pool_params params;
  params.kernel  = {1, 1};
  params.stride  = {1, int64_t(1) << 62};
  params.reflect = false;

  // the padded extent fits in int64, its byte size does not
  params.padding = {int64_t(1) << 61, int64_t(1) << 61, 0, 0};
  EXPECT_EQ(run(input, params, output), status_t::pool_invalid_dimension);

  // the padded extent itself overflows
  params.padding = {0, 0, std::numeric_limits<int64_t>::max(), 1};
  params.stride  = {1, 1};
  EXPECT_EQ(run(input, params, output), status_t::pool_invalid_dimension);
  EXPECT_FALSE(output.output.is_valid());
}

TEST_P(TestMaxPoolingDirected, EmptyInputExtent) {
  for (auto size : std::vector<std::vector<uint64_t>>{
         {1, 1, 0, 4}, {1, 1, 4, 0}, {0, 1, 4, 4}, {1, 0, 4, 4}}) {
    auto input = tensor_factory.zero_tensor(size, data_type_t::f32);
    ASSERT_TRUE(input.is_valid());
    EXPECT_EQ(input.get_nelem(), 0u);

    pool_params params;
    params.kernel = {1, 1};
    params.stride = {1, 1};

    pool_output_t output;
    EXPECT_EQ(run(input, params, output), status_t::pool_invalid_dimension);
  }

  auto input = tensor_factory.zero_tensor({1, 1, 0, 4}, data_type_t::f32);
  pool_output_t output;
  EXPECT_EQ(max_pooling(input, {1, 1}, {1, 1}, pool_padding_mode_t::same,
                        {0, 0}, false, output, GetParam()),
            status_t::pool_invalid_dimension);
}

TEST_P(TestMaxPoolingDirected, ThreadCountAboveIntMax) {
  auto input = tensor_factory.uniform_dist_tensor({1, 1, 4, 4},
               data_type_t::f32, 1.0f);

  pool_params params;
  params.kernel      = {2, 2};
  params.stride      = {2, 2};
  params.num_threads = std::numeric_limits<uint32_t>::max();

  pool_output_t output;
  EXPECT_EQ(run(input, params, output), status_t::pool_invalid_dimension);

  params.num_threads = 2;
  EXPECT_EQ(run(input, params, output), status_t::success);
}

INSTANTIATE_TEST_SUITE_P(MaxPoolingKernels, TestMaxPoolingDirected,
                         ::testing::Values(pooling_algo_t::reference,
                                           pooling_algo_t::batched));

TEST(MaxPoolingKernelFactory, MakesRequestedKernel) {
  EXPECT_EQ(make_max_pool_kernel(pooling_algo_t::reference)->name(),
            "reference");
  EXPECT_EQ(make_max_pool_kernel(pooling_algo_t::batched)->name(), "batched");
  EXPECT_THROW(make_max_pool_kernel(pooling_algo_t::none), exception_t);
}

TEST(MaxPoolingPolicy, ConvenienceCallUsesSamePadding) {
  tensor_factory_t tensor_factory;
  auto input = tensor_factory.uniform_dist_tensor({1, 2, 9, 6},
               data_type_t::f32, 1.0f);

  pool_output_t output;
  ASSERT_EQ(max_pooling(input, {3, 2}, {2, 2}, pool_padding_mode_t::same,
                        {0, 0}, true, output), status_t::success);
  EXPECT_EQ(output.output.get_size(), std::vector<uint64_t>({1, 2, 5, 3}));
  EXPECT_TRUE(output.indices.has_value());
}
