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
#ifndef _WINPOOL_MAX_POOL_KERNEL_HPP_
#define _WINPOOL_MAX_POOL_KERNEL_HPP_

#include <memory>
#include <string>

#include "common/winpool_global.hpp"
#include "pooling/pooling_common.hpp"

namespace winpool {
namespace pooling {

using namespace winpool::error_handling;

/** @class max_pool_kernel_t
 *  @brief Interface of a max pooling kernel.
 *
 *  A kernel reduces every window of an already padded tensor. All kernels
 *  must agree bit for bit, in values and in indices:
 *  - windows are scanned in row-major order,
 *  - a candidate replaces the running maximum iff it compares greater, or it
 *    is NaN and the running maximum is not,
 *  - the selected element is copied, never converted.
 */
class max_pool_kernel_t {
 public:
  virtual ~max_pool_kernel_t() = default;

  /** @brief Reduce all windows.
   *
   * @param padded  Padded input [N, C, HP, WP]
   * @param params  Validated parameters, dims filled
   * @param output  Created output [N, C, H_out, W_out], same data type
   * @param indices Created s32 index map of output shape, or nullptr to skip
   *                index tracking
   * @return success or pool_unsupported_dtype.
   */
  virtual status_t execute(const tensor4d_t &padded,
                           const pool_params &params,
                           tensor4d_t &output,
                           tensor4d_t *indices) = 0;

  /** @brief Kernel name, used in logs */
  virtual std::string name() const = 0;
};

/** @brief Create the kernel implementing an algo.
 *
 *  @param algo reference or batched; none is not resolved here.
 *  @return The kernel. Throws exception_t for any other algo.
 */
std::unique_ptr<max_pool_kernel_t> make_max_pool_kernel(pooling_algo_t algo);

/** @brief Running maximum update rule shared by all kernels. */
template<typename T>
inline bool replaces_max(const T &candidate_, const T &current_) {
  const float candidate = float(candidate_);
  const float current   = float(current_);
  return (candidate > current) ||
         (candidate != candidate && current == current);
}

} // namespace pooling

namespace interface {
using max_pool_kernel_t = winpool::pooling::max_pool_kernel_t;
using winpool::pooling::make_max_pool_kernel;
} //export

} // namespace winpool

#endif
