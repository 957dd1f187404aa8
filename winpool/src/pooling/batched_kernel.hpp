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
#ifndef _WINPOOL_POOLING_BATCHED_KERNEL_HPP_
#define _WINPOOL_POOLING_BATCHED_KERNEL_HPP_

#include "pooling/max_pool_kernel.hpp"

namespace winpool {
namespace pooling {

/** @class max_pool_batched_kernel_t
 *  @brief Batched max pooling.
 *
 *  Treats the padded tensor as KH*KW strided views, one per window offset,
 *  and folds them element wise into the output. Offsets are folded in
 *  row-major order, so values and indices match the reference kernel.
 */
class max_pool_batched_kernel_t final : public max_pool_kernel_t {
 public:
  status_t execute(const tensor4d_t &padded,
                   const pool_params &params,
                   tensor4d_t &output,
                   tensor4d_t *indices) override;

  std::string name() const override;
};

} // namespace pooling
} // namespace winpool

#endif // _WINPOOL_POOLING_BATCHED_KERNEL_HPP_
