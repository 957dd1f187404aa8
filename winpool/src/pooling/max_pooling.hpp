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
#ifndef _WINPOOL_MAX_POOLING_HPP_
#define _WINPOOL_MAX_POOLING_HPP_

#include "common/winpool_global.hpp"
#include "common/profiler.hpp"
#include "pooling/pooling_common.hpp"
#include "pooling/pooling_config.hpp"
#include "pooling/pooling_padding.hpp"
#include "pooling/pooling_utils.hpp"
#include "pooling/max_pool_kernel.hpp"

namespace winpool {
namespace pooling {

using namespace winpool::error_handling;

/**
 * @brief Max pooling over an NCHW tensor.
 *
 * Validates the call, pads the input (reflect or -infinity fill), and reduces
 * every window with the kernel selected by @c params.algo, or the configured
 * default kernel when it is @c pooling_algo_t::none.
 *
 * @param input  Input tensor [N, C, H, W], f32 or bf16
 * @param output Receives the pooled tensor [N, C, H_out, W_out] and, if
 *               @c params.want_indices, the s32 index map
 * @param params Kernel, stride, padding and execution parameters. The
 *               @c dims member is filled by this call.
 *
 * @return success, pool_shape_mismatch, pool_invalid_dimension,
 *         pool_padding_too_large or pool_unsupported_dtype.
 */
status_t max_pooling_direct(const tensor4d_t &input,
                            pool_output_t &output,
                            pool_params &params);

/**
 * @brief Max pooling with padding computed from a padding policy.
 *
 * Runs compute_padding() on the input extents, then max_pooling_direct()
 * with reflect fill.
 */
status_t max_pooling(const tensor4d_t &input,
                     const pool_kernel_t &kernel,
                     const pool_stride_t &stride,
                     pool_padding_mode_t mode,
                     const pool_pad_hw_t &explicit_pad,
                     bool want_indices,
                     pool_output_t &output,
                     pooling_algo_t algo = pooling_algo_t::none);

/**
 * @brief Route output gradients back to the input through the index map.
 *
 * Every grad_output cell is added to the input element its window maximum
 * came from. Positions in the padding map back through the reflect mapping;
 * without reflect they are dropped.
 *
 * @param grad_output Gradient of the pooled output, f32 or bf16
 * @param indices     Index map returned by max_pooling_direct()
 * @param grad_input  Created by this call, f32 [N, C, H, W]. A valid f32
 *                    tensor of that shape is reused, so caller storage can
 *                    be passed in.
 * @param params      Parameter block of the forward call, dims filled
 *
 * @return success, pool_shape_mismatch, pool_invalid_dimension or
 *         pool_unsupported_dtype.
 */
status_t max_pooling_backward_direct(const tensor4d_t &grad_output,
                                     const tensor4d_t &indices,
                                     tensor4d_t &grad_input,
                                     const pool_params &params);

} // namespace pooling

namespace interface {
using winpool::pooling::compute_padding;
using winpool::pooling::pooled_size;
using winpool::pooling::max_pooling_direct;
using winpool::pooling::max_pooling;
using winpool::pooling::max_pooling_backward_direct;
using pooling_config_t = winpool::pooling::pooling_config_t;
} //export

} // namespace winpool

#endif // _WINPOOL_MAX_POOLING_HPP_
