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
#ifndef _WINPOOL_POOLING_CONFIG_HPP_
#define _WINPOOL_POOLING_CONFIG_HPP_

#include <string>

#include "common/op_config.hpp"
#include "pooling/pooling_common.hpp"

namespace winpool {
namespace pooling {

using namespace winpool::common;

/**
* @class pooling_config_t
* @brief Runtime configuration of max pooling.
*
* Holds the kernel used when a call leaves @c pool_params::algo at
* @c pooling_algo_t::none. It is set from
* - defaults : @c pooling_algo_t::batched,
* - JSON     : "runtime_variables" : { "pooling" : { "kernel" : "reference" } },
* - env      : WINPOOL_POOL_ALGO=reference|batched|1|2.
*
* Unrecognized values leave the default in place.
*/
class pooling_config_t final : public op_config_t {
 public:
  void set_default_config() override;
  status_t set_user_config(const json &config_json) override;
  void set_env_config() override;

  /** @brief Set default pooling algo */
  void set_algo(pooling_algo_t algo);

  /** @brief Get default pooling algo */
  pooling_algo_t get_algo() const;

  /** @brief Returns the singleton instance */
  static pooling_config_t &instance();

  /** @brief Convert from string ("reference", "batched" or their numeric
   *  values) to pooling algo.
   *
   *  @return pooling algo, pooling_algo_t::algo_count if not recognized.
   */
  static pooling_algo_t str_to_pooling_algo(std::string algo);

  /** @brief Name of a pooling algo */
  static std::string pooling_algo_to_str(pooling_algo_t algo);

 private:
  pooling_config_t() = default;

  pooling_algo_t pooling_algo = pooling_algo_t::batched; /**< Default kernel */
};

} // namespace pooling
} // namespace winpool

#endif
