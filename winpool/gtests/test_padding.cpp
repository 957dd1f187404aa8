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
#include <climits>
#include <limits>
#include "gtest_utils.hpp"
#include "pooling/pooling_padding.hpp"

TEST(PaddingCalculator, SameGivesCeilOutput) {
  for (int64_t in = 1; in <= 24; ++in) {
    for (int64_t kernel = 1; kernel <= 6; ++kernel) {
      for (int64_t stride = 1; stride <= 5; ++stride) {
        pool_padding_t padding;
        ASSERT_EQ(compute_padding(in, in, {kernel, kernel}, {stride, stride},
                                  pool_padding_mode_t::same, 0, padding),
                  status_t::success);
        EXPECT_GE(padding.left, 0);
        EXPECT_GE(padding.top, 0);
        EXPECT_LE(padding.top, padding.bottom);
        EXPECT_LE(padding.bottom - padding.top, 1);

        int64_t out = pooled_size(in, padding.top, padding.bottom, kernel,
                                  stride);
        EXPECT_EQ(out, (in + stride - 1) / stride)
            << "in " << in << " kernel " << kernel << " stride " << stride;
      }
    }
  }
}

TEST(PaddingCalculator, SameAxesAreIndependent) {
  pool_padding_t padding;
  ASSERT_EQ(compute_padding(5, 8, {3, 4}, {2, 2}, pool_padding_mode_t::same,
                            0, padding), status_t::success);
  // height: 5 % 2 = 1, needed 3 - 1 = 2
  EXPECT_EQ(padding.top, 1);
  EXPECT_EQ(padding.bottom, 1);
  // width: 8 % 2 = 0, needed 4 - 2 = 2
  EXPECT_EQ(padding.left, 1);
  EXPECT_EQ(padding.right, 1);

  ASSERT_EQ(compute_padding(7, 7, {4, 2}, {1, 3}, pool_padding_mode_t::same,
                            0, padding), status_t::success);
  EXPECT_EQ(padding.top, 1);
  EXPECT_EQ(padding.bottom, 2);
  EXPECT_EQ(padding.left, 0);
  EXPECT_EQ(padding.right, 1);
}

TEST(PaddingCalculator, ExplicitIgnoresInputSize) {
  pool_padding_t padding;
  ASSERT_EQ(compute_padding(100, 3, {2, 2}, {2, 2},
                            pool_padding_mode_t::explicit_padding,
                            pool_pad_hw_t{3, 1}, padding), status_t::success);
  EXPECT_EQ(padding.left, 1);
  EXPECT_EQ(padding.right, 1);
  EXPECT_EQ(padding.top, 3);
  EXPECT_EQ(padding.bottom, 3);

  ASSERT_EQ(compute_padding(4, 4, {2, 2}, {2, 2},
                            pool_padding_mode_t::explicit_padding, 2, padding),
            status_t::success);
  EXPECT_EQ(padding.left, 2);
  EXPECT_EQ(padding.top, 2);
}

TEST(PaddingCalculator, RejectsNonPositiveArguments) {
  pool_padding_t padding{7, 7, 7, 7};
  EXPECT_EQ(compute_padding(0, 4, {2, 2}, {1, 1}, pool_padding_mode_t::same,
                            0, padding), status_t::pool_invalid_dimension);
  EXPECT_EQ(compute_padding(4, 4, {2, 0}, {1, 1}, pool_padding_mode_t::same,
                            0, padding), status_t::pool_invalid_dimension);
  EXPECT_EQ(compute_padding(4, 4, {2, 2}, {0, 1},
                            pool_padding_mode_t::explicit_padding, 0, padding),
            status_t::pool_invalid_dimension);
  EXPECT_EQ(compute_padding(4, 4, {2, 2}, {1, 1},
                            pool_padding_mode_t::explicit_padding, -1, padding),
            status_t::pool_invalid_dimension);
  // untouched on failure
  EXPECT_EQ(padding.left, 7);
  EXPECT_EQ(padding.bottom, 7);
}

TEST(ReflectPadder, MirrorsExcludingBorder) {
  tensor_factory_t tensor_factory;
  auto input = tensor_factory.value_tensor({1, 1, 3, 3}, data_type_t::f32,
               {1, 2, 3,
                4, 5, 6,
                7, 8, 9});

  tensor4d_t padded;
  ASSERT_EQ(pad_tensor(input, {2, 0, 1, 1}, true, padded), status_t::success);
  ASSERT_EQ(padded.get_size(), std::vector<uint64_t>({1, 1, 5, 5}));

  std::vector<float> expected = {
    6, 5, 4, 5, 6,
    3, 2, 1, 2, 3,
    6, 5, 4, 5, 6,
    9, 8, 7, 8, 9,
    6, 5, 4, 5, 6
  };
  for (uint64_t h = 0; h < 5; ++h) {
    for (uint64_t w = 0; w < 5; ++w) {
      EXPECT_EQ(padded.at({0, 0, h, w}), expected[h * 5 + w])
          << "at " << h << ", " << w;
    }
  }
}

TEST(ReflectPadder, NegativeInfinityFill) {
  tensor_factory_t tensor_factory;
  auto input = tensor_factory.value_tensor({1, 1, 1, 2}, data_type_t::bf16,
               {1, 2});

  tensor4d_t padded;
  ASSERT_EQ(pad_tensor(input, {1, 0, 1, 1}, false, padded), status_t::success);
  ASSERT_EQ(padded.get_size(), std::vector<uint64_t>({1, 1, 3, 3}));

  const float inf = std::numeric_limits<float>::infinity();
  EXPECT_EQ(padded.at({0, 0, 0, 1}), -inf);
  EXPECT_EQ(padded.at({0, 0, 1, 0}), -inf);
  EXPECT_EQ(padded.at({0, 0, 1, 1}), 1.0f);
  EXPECT_EQ(padded.at({0, 0, 1, 2}), 2.0f);
  EXPECT_EQ(padded.at({0, 0, 2, 2}), -inf);
}

TEST(ReflectPadder, RejectsPaddingBeyondData) {
  EXPECT_EQ(check_reflect_padding(3, 3, {2, 0, 0, 0}), status_t::success);
  EXPECT_EQ(check_reflect_padding(3, 3, {3, 0, 0, 0}),
            status_t::pool_padding_too_large);
  EXPECT_EQ(check_reflect_padding(3, 3, {0, 0, 2, 1}),
            status_t::pool_padding_too_large);
  EXPECT_EQ(check_reflect_padding(1, 1, {0, 0, 0, 0}), status_t::success);
}

TEST(PaddingCalculator, PooledSizeOverflowIsEmpty) {
  const int64_t big = std::numeric_limits<int64_t>::max();
  EXPECT_EQ(pooled_size(1, big, 1, 1, 1), 0);
  EXPECT_EQ(pooled_size(big, 0, 0, big, 1), 1);
  EXPECT_EQ(pooled_size(4, -1, 0, 2, 1), 0);
}

TEST(ReflectPadder, RejectsOversizedPadding) {
  tensor_factory_t tensor_factory;
  auto input = tensor_factory.value_tensor({1, 1, 1, 1}, data_type_t::f32,
               {1});

  tensor4d_t padded;
  const int64_t huge = int64_t(1) << 61;
  EXPECT_EQ(pad_tensor(input, {huge, huge, 0, 0}, false, padded),
            status_t::pool_invalid_dimension);
  EXPECT_FALSE(padded.is_valid());
  EXPECT_EQ(pad_tensor(input, {0, 0, std::numeric_limits<int64_t>::max(), 1},
                       false, padded),
            status_t::pool_invalid_dimension);

  pooling_dims_t dims;
  dims.batch     = 2;
  dims.channels  = 3;
  dims.in_height = 4;
  dims.in_width  = 5;
  ASSERT_EQ(get_padded_dims(dims, {1, 2, 3, 4}, data_type_t::bf16),
            status_t::success);
  EXPECT_EQ(dims.padded_height, 11u);
  EXPECT_EQ(dims.padded_width, 8u);
}

TEST(ReflectPadder, ThreadCountIsClamped) {
  EXPECT_EQ(pool_thread_count(0), omp_get_max_threads());
  EXPECT_EQ(pool_thread_count(3), 3);
  EXPECT_EQ(pool_thread_count(std::numeric_limits<uint32_t>::max()), INT_MAX);
}
