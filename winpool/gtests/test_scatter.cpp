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
#include "gtest_utils.hpp"

/** @brief TestIndexScatter is a test class to handle parameters */
class TestIndexScatter : public ::testing::TestWithParam<PoolType> {
 protected:
  virtual void SetUp() {
    pool = GetParam();
  }

  virtual void TearDown() {}
  PoolType pool;
  tensor_factory_t tensor_factory{};
};

/** @fn TEST_P
 *  @param TestIndexScatter parameterized test class to initialize parameters
 *  @param GradientIsConserved user-defined name of test
 *  @brief Test to validate that every output gradient lands once on the input
 */
TEST_P(TestIndexScatter, GradientIsConserved) {
  auto input = tensor_factory.uniform_dist_tensor({pool.batch, pool.channels,
               pool.in_height, pool.in_width}, data_type_t::f32, 1.0f);

  pool_params params;
  ASSERT_EQ(pool_params_from(pool, params), status_t::success);
  // dropped gradients only occur without reflect
  params.reflect      = true;
  params.want_indices = true;

  pool_output_t output;
  ASSERT_EQ(max_pooling_direct(input, output, params), status_t::success);

  auto grad_output = tensor_factory.coarse_tensor(output.output.get_size(),
                     data_type_t::f32, 4);
  tensor4d_t grad_input;
  ASSERT_EQ(max_pooling_backward_direct(grad_output, *output.indices,
                                        grad_input, params), status_t::success);
  ASSERT_EQ(grad_input.get_size(), input.get_size());
  ASSERT_EQ(grad_input.get_data_type(), data_type_t::f32);

  // small integers sum exactly in f32
  double out_sum = 0, in_sum = 0;
  for (uint64_t i = 0; i < grad_output.get_nelem(); ++i) {
    out_sum += grad_output.data<float>()[i];
  }
  for (uint64_t i = 0; i < grad_input.get_nelem(); ++i) {
    in_sum += grad_input.data<float>()[i];
  }
  EXPECT_EQ(in_sum, out_sum);
}

/** @fn INSTANTIATE_TEST_SUITE_P
 *  @brief Triggers Index Scatter parameterized test suite
 */
INSTANTIATE_TEST_SUITE_P(IndexScatter, TestIndexScatter,
                         ::testing::ValuesIn(pool_test));

TEST(IndexScatter, LandsOnSelectedElement) {
  tensor_factory_t tensor_factory;
  auto input = tensor_factory.value_tensor({1, 1, 2, 4}, data_type_t::f32,
               {1, 8, 3, 2,
                4, 0, 5, 9});

  pool_params params;
  params.kernel       = {2, 2};
  params.stride       = {2, 2};
  params.want_indices = true;

  pool_output_t output;
  ASSERT_EQ(max_pooling_direct(input, output, params), status_t::success);

  auto grad_output = tensor_factory.value_tensor({1, 1, 1, 2},
                     data_type_t::f32, {0.5f, 2.0f});
  tensor4d_t grad_input;
  ASSERT_EQ(max_pooling_backward_direct(grad_output, *output.indices,
                                        grad_input, params), status_t::success);

  std::vector<float> expected = {0, 0.5f, 0, 0,
                                 0, 0,    0, 2.0f};
  for (uint64_t h = 0; h < 2; ++h) {
    for (uint64_t w = 0; w < 4; ++w) {
      EXPECT_EQ(grad_input.at({0, 0, h, w}), expected[h * 4 + w]);
    }
  }
}

TEST(IndexScatter, ReflectedMaxMapsBackToInterior) {
  tensor_factory_t tensor_factory;
  // reflect padded row is 9 | 1 9 2 | 9
  auto input = tensor_factory.value_tensor({1, 1, 1, 3}, data_type_t::f32,
               {1, 9, 2});

  pool_params params;
  params.kernel        = {1, 1};
  params.stride        = {1, 1};
  params.padding.left  = 1;
  params.padding.right = 1;
  params.want_indices  = true;

  pool_output_t output;
  ASSERT_EQ(max_pooling_direct(input, output, params), status_t::success);
  ASSERT_EQ(output.output.get_size(3), 5u);

  auto grad_output = tensor_factory.value_tensor({1, 1, 1, 5},
                     data_type_t::f32, {1, 1, 1, 1, 1});
  tensor4d_t grad_input;
  ASSERT_EQ(max_pooling_backward_direct(grad_output, *output.indices,
                                        grad_input, params), status_t::success);
  EXPECT_EQ(grad_input.at({0, 0, 0, 0}), 1.0f);
  EXPECT_EQ(grad_input.at({0, 0, 0, 1}), 3.0f);
  EXPECT_EQ(grad_input.at({0, 0, 0, 2}), 1.0f);

  // without reflect the border gradients are dropped
  params.reflect = false;
  ASSERT_EQ(max_pooling_direct(input, output, params), status_t::success);
  ASSERT_EQ(max_pooling_backward_direct(grad_output, *output.indices,
                                        grad_input, params), status_t::success);
  EXPECT_EQ(grad_input.at({0, 0, 0, 1}), 1.0f);
}

TEST(IndexScatter, ReusesCallerStorage) {
  tensor_factory_t tensor_factory;
  auto input = tensor_factory.uniform_dist_tensor({1, 2, 4, 4},
               data_type_t::f32, 1.0f);

  pool_params params;
  params.kernel       = {2, 2};
  params.stride       = {2, 2};
  params.want_indices = true;

  pool_output_t output;
  ASSERT_EQ(max_pooling_direct(input, output, params), status_t::success);

  std::vector<float> buffer(32, 42.0f);
  auto grad_input = tensor4d_t()
                    .set_name("caller grad")
                    .set_size({1, 2, 4, 4})
                    .set_data_type(data_type_t::f32)
                    .set_storage(buffer.data(), buffer.size() * sizeof(float))
                    .create();
  auto grad_output = tensor_factory.coarse_tensor({1, 2, 2, 2},
                     data_type_t::f32, 3);

  ASSERT_EQ(max_pooling_backward_direct(grad_output, *output.indices,
                                        grad_input, params), status_t::success);
  EXPECT_EQ(grad_input.get_raw_handle_const(), buffer.data());

  float total = 0, expected = 0;
  for (float val : buffer) {
    total += val;
  }
  for (uint64_t i = 0; i < grad_output.get_nelem(); ++i) {
    expected += grad_output.data<float>()[i];
  }
  EXPECT_EQ(total, expected);
}

TEST(IndexScatter, RejectsMismatchedInputs) {
  tensor_factory_t tensor_factory;
  auto input = tensor_factory.uniform_dist_tensor({1, 1, 4, 4},
               data_type_t::f32, 1.0f);

  pool_params params;
  params.kernel       = {2, 2};
  params.stride       = {2, 2};
  params.want_indices = true;

  pool_output_t output;
  ASSERT_EQ(max_pooling_direct(input, output, params), status_t::success);

  tensor4d_t grad_input;
  auto wrong_shape = tensor_factory.zero_tensor({1, 1, 2, 3}, data_type_t::f32);
  EXPECT_EQ(max_pooling_backward_direct(wrong_shape, *output.indices,
                                        grad_input, params),
            status_t::pool_shape_mismatch);

  auto grad_output = tensor_factory.zero_tensor({1, 1, 2, 2}, data_type_t::f32);
  auto bad_indices = tensor_factory.zero_tensor({1, 1, 2, 2}, data_type_t::s32);
  bad_indices.data<int32_t>()[3] = 4;
  EXPECT_EQ(max_pooling_backward_direct(grad_output, bad_indices, grad_input,
                                        params),
            status_t::pool_invalid_dimension);

  pool_params empty;
  EXPECT_EQ(max_pooling_backward_direct(grad_output, *output.indices,
                                        grad_input, empty),
            status_t::pool_invalid_dimension);
}
