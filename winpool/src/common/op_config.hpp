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
#ifndef _WINPOOL_OP_CONFIG_HPP_
#define _WINPOOL_OP_CONFIG_HPP_

#include "nlohmann/json.hpp"
#include "common/error_status.hpp"

namespace winpool {
namespace common {

using json = nlohmann::json;
using namespace winpool::error_handling;

/** @class op_config_t
 *  @brief A base class for operator config.
 *
 *  An operator has runtime parameters that are set from defaults, from the
 *  JSON config file, or from environment variables, in that order of
 *  preference.
 */
class op_config_t {
 public:
  /** @brief Set default runtime variables. */
  virtual void set_default_config() = 0;

  /** @brief Set runtime variables from json. */
  virtual status_t set_user_config(const json &config_json) = 0;

  /** @brief Set runtime variables from environment. */
  virtual void set_env_config() = 0;

  virtual ~op_config_t() = default;
};

} // namespace common
} // namespace winpool

#endif
