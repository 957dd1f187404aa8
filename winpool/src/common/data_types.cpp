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
#include <string>
#include "data_types.hpp"

namespace winpool {
namespace common {

uint32_t size_of(data_type_t data_type) {
  switch(data_type) {
  case data_type_t::f32 :
    return sizeof(prec_traits<data_type_t::f32>::type);
  case data_type_t::bf16 :
    return sizeof(prec_traits<data_type_t::bf16>::type);
  case data_type_t::s32 :
    return sizeof(prec_traits<data_type_t::s32>::type);
  }

  return 0;
}

std::string dtype_info(data_type_t data_type) {
  switch(data_type) {
  case data_type_t::f32 :
    return "f32";
  case data_type_t::bf16 :
    return "bf16";
  case data_type_t::s32 :
    return "s32";
  }

  return "unknown";
}

} //common
} //winpool
