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

namespace winpool {
namespace examples {

int max_pooling_block_reduce_f32_example() {
  try {
    tensor_factory_t   tensor_factory;
    tensor_functions_t tensor_functions;

    auto input = tensor_factory.iota_tensor({1, 1, 4, 4}, data_type_t::f32,
                                            "block_input");

    pool_output_t output;
    status_t status = max_pooling(input, {2, 2}, {2, 2},
                                  pool_padding_mode_t::explicit_padding,
                                  {0, 0}, false, output);
    if (status != status_t::success) {
      log_error("block reduce max pooling failed: ", status_to_str(status));
      return NOT_OK;
    }

    // top left window holds 0, 1, 4, 5 and bottom right 10, 11, 14, 15
    if (output.output.at({0, 0, 0, 0}) != 5.0f ||
        output.output.at({0, 0, 1, 1}) != 15.0f) {
      log_error("block reduce max pooling gave wrong values");
      return NOT_OK;
    }
    tensor_functions.tensor_pretty_print(output.output);
  }
  catch (const exception_t &ex) {
    log_error("Exception: ", ex.what());
    return NOT_OK;
  }

  return OK;
}

int max_pooling_same_padding_f32_example() {
  try {
    tensor_factory_t tensor_factory;

    auto input = tensor_factory.uniform_dist_tensor({2, 3, 5, 5},
                                                    data_type_t::f32, 2.0,
                                                    "same_input");

    pool_params params;
    params.kernel       = {3, 3};
    params.stride       = {2, 2};
    params.want_indices = true;

    status_t status = compute_padding(5, 5, params.kernel, params.stride,
                                      pool_padding_mode_t::same, 0,
                                      params.padding);
    if (status != status_t::success) {
      log_error("same padding failed: ", status_to_str(status));
      return NOT_OK;
    }

    pool_output_t output;
    status = max_pooling_direct(input, output, params);
    if (status != status_t::success) {
      log_error("same padding max pooling failed: ", status_to_str(status));
      return NOT_OK;
    }

    log_info("same padding pooled ", input.tensor_info(), " to ",
             output.output.tensor_info(), " with index map ",
             output.indices->tensor_info());
  }
  catch (const exception_t &ex) {
    log_error("Exception: ", ex.what());
    return NOT_OK;
  }

  return OK;
}

int max_pooling_bf16_example() {
  try {
    constexpr uint64_t N = 1, C = 2, H = 6, W = 6;
    std::vector<bfloat16_t> buffer(N * C * H * W);
    for (size_t i = 0; i < buffer.size(); ++i) {
      buffer[i] = bfloat16_t(float(i % 7) - 3.0f);
    }

    auto input = tensor4d_t()
                 .set_name("bf16_input")
                 .set_size({N, C, H, W})
                 .set_data_type(data_type_t::bf16)
                 .set_storage(buffer.data(), buffer.size() * sizeof(bfloat16_t))
                 .create();
    if (! input.is_valid()) {
      log_error("bf16 input creation failed");
      return NOT_OK;
    }

    pool_output_t output;
    status_t status = max_pooling(input, {2, 2}, {2, 2},
                                  pool_padding_mode_t::same, {0, 0}, false,
                                  output);
    if (status != status_t::success) {
      log_error("bf16 max pooling failed: ", status_to_str(status));
      return NOT_OK;
    }
    log_info("bf16 max pooling output ", output.output.tensor_info());
  }
  catch (const exception_t &ex) {
    log_error("Exception: ", ex.what());
    return NOT_OK;
  }

  return OK;
}

int max_pooling_compare_kernels_example() {
  try {
    tensor_factory_t   tensor_factory;
    tensor_functions_t tensor_functions;

    auto input = tensor_factory.uniform_dist_tensor({4, 8, 17, 13},
                                                    data_type_t::f32, 1.0,
                                                    "compare_input");

    pool_params params;
    params.kernel       = {3, 2};
    params.stride       = {2, 1};
    params.want_indices = true;
    status_t status = compute_padding(17, 13, params.kernel, params.stride,
                                      pool_padding_mode_t::same, 0,
                                      params.padding);
    if (status != status_t::success) {
      return NOT_OK;
    }

    pool_output_t ref_output;
    params.algo = pooling_algo_t::reference;
    status = max_pooling_direct(input, ref_output, params);
    if (status != status_t::success) {
      log_error("reference kernel failed: ", status_to_str(status));
      return NOT_OK;
    }

    pool_output_t batched_output;
    params.algo = pooling_algo_t::batched;
    status = max_pooling_direct(input, batched_output, params);
    if (status != status_t::success) {
      log_error("batched kernel failed: ", status_to_str(status));
      return NOT_OK;
    }

    if (! tensor_functions.tensor_bitwise_equal(ref_output.output,
        batched_output.output) ||
        ! tensor_functions.tensor_bitwise_equal(*ref_output.indices,
            *batched_output.indices)) {
      log_error("reference and batched kernels differ");
      return NOT_OK;
    }
    log_info("reference and batched kernels agree on ",
             ref_output.output.tensor_info());
  }
  catch (const exception_t &ex) {
    log_error("Exception: ", ex.what());
    return NOT_OK;
  }

  return OK;
}

int max_pooling_backward_example() {
  try {
    tensor_factory_t tensor_factory;

    auto input = tensor_factory.uniform_dist_tensor({1, 2, 6, 6},
                                                    data_type_t::f32, 1.0,
                                                    "backward_input");

    pool_params params;
    params.kernel       = {3, 3};
    params.stride       = {2, 2};
    params.want_indices = true;
    status_t status = compute_padding(6, 6, params.kernel, params.stride,
                                      pool_padding_mode_t::same, 0,
                                      params.padding);
    if (status != status_t::success) {
      return NOT_OK;
    }

    pool_output_t output;
    status = max_pooling_direct(input, output, params);
    if (status != status_t::success) {
      log_error("forward max pooling failed: ", status_to_str(status));
      return NOT_OK;
    }

    auto grad_output = tensor4d_t()
                       .set_name("grad_output")
                       .set_size(output.output.get_size())
                       .set_data_type(data_type_t::f32)
                       .create();
    std::fill(grad_output.data<float>(),
              grad_output.data<float>() + grad_output.get_nelem(), 1.0f);

    tensor4d_t grad_input;
    status = max_pooling_backward_direct(grad_output, *output.indices,
                                         grad_input, params);
    if (status != status_t::success) {
      log_error("max pooling backward failed: ", status_to_str(status));
      return NOT_OK;
    }

    const float *grad = grad_input.data<const float>();
    float total = 0;
    for (uint64_t i = 0; i < grad_input.get_nelem(); ++i) {
      total += grad[i];
    }
    if (total != float(grad_output.get_nelem())) {
      log_error("scattered gradient sums to ", total, ", expected ",
                grad_output.get_nelem());
      return NOT_OK;
    }
  }
  catch (const exception_t &ex) {
    log_error("Exception: ", ex.what());
    return NOT_OK;
  }

  return OK;
}

int max_pooling_padding_too_large_example() {
  try {
    tensor_factory_t tensor_factory;

    auto input = tensor_factory.iota_tensor({1, 1, 2, 2}, data_type_t::f32,
                                            "small_input");

    pool_output_t output;
    status_t status = max_pooling(input, {3, 3}, {1, 1},
                                  pool_padding_mode_t::same, {0, 0}, false,
                                  output);
    if (status != status_t::pool_padding_too_large) {
      log_error("expected padding too large, got ", status_to_str(status));
      return NOT_OK;
    }
    log_info("2x2 input with 3x3 same pooling: ", status_to_str(status));
  }
  catch (const exception_t &ex) {
    log_error("Exception: ", ex.what());
    return NOT_OK;
  }

  return OK;
}

} //examples
} //winpool
