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
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include "pooling_config.hpp"

namespace winpool {
namespace pooling {

void pooling_config_t::set_default_config() {
  set_algo(pooling_algo_t::batched);
}

status_t pooling_config_t::set_user_config(const json &config_json) {
  auto runtime_variables_json = config_json.find("runtime_variables");
  if (runtime_variables_json == config_json.end() ||
      !runtime_variables_json->is_object()) {
    return status_t::failure;
  }

  auto pooling_json = runtime_variables_json->find("pooling");
  if (pooling_json == runtime_variables_json->end() ||
      !pooling_json->is_object()) {
    return status_t::failure;
  }

  auto kernel_json = pooling_json->find("kernel");
  if (kernel_json != pooling_json->end() && kernel_json->is_string()) {
    auto algo = str_to_pooling_algo(kernel_json->get<std::string>());
    if (algo != pooling_algo_t::algo_count) {
      set_algo(algo);
    }
  }

  return status_t::success;
}

void pooling_config_t::set_env_config() {
  char *algo_env = std::getenv("WINPOOL_POOL_ALGO");
  if (algo_env) {
    auto algo = str_to_pooling_algo(algo_env);
    if (algo != pooling_algo_t::algo_count) {
      set_algo(algo);
    }
  }
}

void pooling_config_t::set_algo(pooling_algo_t algo) {
  pooling_algo = algo;
}

pooling_algo_t pooling_config_t::get_algo() const {
  return pooling_algo;
}

pooling_config_t &pooling_config_t::instance() {
  static pooling_config_t instance;
  return instance;
}

pooling_algo_t pooling_config_t::str_to_pooling_algo(std::string algo) {
  std::transform(algo.begin(), algo.end(), algo.begin(), [](unsigned char c) {
    return std::tolower(c);
  });

  if (algo == "reference" || algo == "1") {
    return pooling_algo_t::reference;
  }
  else if (algo == "batched" || algo == "2") {
    return pooling_algo_t::batched;
  }

  return pooling_algo_t::algo_count;
}

std::string pooling_config_t::pooling_algo_to_str(pooling_algo_t algo) {
  switch (algo) {
  case pooling_algo_t::none:
    return "none";
  case pooling_algo_t::reference:
    return "reference";
  case pooling_algo_t::batched:
    return "batched";
  default:
    return "unknown";
  }
}

} // namespace pooling
} // namespace winpool
