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
#include "max_pool_kernel.hpp"
#include "pooling/batched_kernel.hpp"
#include "pooling/pooling_config.hpp"
#include "pooling/reference_kernel.hpp"

namespace winpool {
namespace pooling {

std::unique_ptr<max_pool_kernel_t> make_max_pool_kernel(pooling_algo_t algo) {
  switch (algo) {
  case pooling_algo_t::reference:
    return std::make_unique<max_pool_ref_kernel_t>();
  case pooling_algo_t::batched:
    return std::make_unique<max_pool_batched_kernel_t>();
  default:
    break;
  }

  EXCEPTION_WITH_LOC("no max pooling kernel for algo " +
                     pooling_config_t::pooling_algo_to_str(algo));
}

} // namespace pooling
} // namespace winpool
