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
#include "max_pooling_example.hpp"

using namespace winpool::interface;
using namespace winpool::examples;

int main() {
  int failures = 0;

  /** Max pooling functionality examples.
   *  Demonstrates explicit and same padding, bf16 inputs on caller storage,
   *  kernel equivalence and the index map driven backward pass.
   */
  failures += max_pooling_block_reduce_f32_example();
  failures += max_pooling_same_padding_f32_example();
  failures += max_pooling_bf16_example();
  failures += max_pooling_compare_kernels_example();
  failures += max_pooling_backward_example();
  failures += max_pooling_padding_too_large_example();

  return failures ? NOT_OK : OK;
}
