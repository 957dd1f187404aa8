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
#include "error_status.hpp"

namespace winpool {
namespace error_handling {

std::string status_to_str(status_t status_) {
  switch (status_) {
  case status_t::success:
    return "success";
  case status_t::failure:
    return "failure";
  case status_t::unimplemented:
    return "unimplemented";
  case status_t::pool_invalid_dimension:
    return "invalid_dimension";
  case status_t::pool_padding_too_large:
    return "padding_too_large";
  case status_t::pool_shape_mismatch:
    return "shape_mismatch";
  case status_t::pool_unsupported_dtype:
    return "unsupported_dtype";
  case status_t::pool_bad_kernel:
    return "bad_kernel";
  case status_t::memory_bad_size:
    return "memory_bad_size";
  case status_t::memory_bad_index:
    return "memory_bad_index";
  case status_t::config_bad_json_file:
    return "config_bad_json_file";
  }

  return "unknown";
}

} //error_handling
} //winpool
