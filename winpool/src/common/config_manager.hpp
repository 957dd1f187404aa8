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
#ifndef _WINPOOL_CONFIG_MANAGER_HPP_
#define _WINPOOL_CONFIG_MANAGER_HPP_

#include <string>
#include "nlohmann/json.hpp"
#include "common/error_status.hpp"
#include "common/config_params.hpp"

namespace winpool {
namespace common {

using namespace winpool::error_handling;
using json = nlohmann::json;

/** @class config_manager_t
 *  @brief Receives runtime configurable parameters and sets them.
 *
 *  Configuration manager is owned by @c winpool_global_block_t.
 *
 *  User parameters are resolved as follows. Defaults are set first. If
 *  WINPOOL_CONFIG_FILE points to a readable JSON file, parameters are read
 *  from it. Otherwise parameters are read from environment variables:
 *
 *  - WINPOOL_COMMON_LOG_LEVEL, WINPOOL_API_LOG_LEVEL, WINPOOL_TEST_LOG_LEVEL,
 *    WINPOOL_PROFILE_LOG_LEVEL, WINPOOL_DEBUG_LOG_LEVEL : 0 (disabled) to
 *    4 (verbose).
 *  - WINPOOL_ENABLE_PROFILER : 1 enables profiling.
 *  - WINPOOL_POOL_ALGO : pooling kernel, see @c pooling_config_t.
 *
 *  A JSON config file looks like
 *  @code
 *  {
 *    "log_levels"        : { "common" : "warning", "api" : "info" },
 *    "profiler"          : { "enable_profiler" : true },
 *    "runtime_variables" : { "pooling" : { "kernel" : "reference" } }
 *  }
 *  @endcode
 */
class config_manager_t final {
public:
  /** @brief Configure winpool from defaults, config file or environment. */
  void                        config();

  /** @brief Configure winpool from a JSON file.
   *
   *  Falls back to defaults if the file cannot be read.
   *  @param file_name_ : JSON file.
   *  @return success, or config_bad_json_file.
   */
  status_t                    config(const std::string &file_name_);

  /** @brief Get logger configuration */
  const config_logger_t&      get_logger_config() const;

  /** @brief Get profiler configuration */
  const config_profiler_t&    get_profiler_config() const;

private:
  status_t          parse(const std::string &file_name_);

  void              set_default_config();
  void              set_user_config();
  void              set_env_config();

  status_t          set_default_logger_config();
  status_t          set_user_logger_config();
  status_t          set_env_logger_config();

  status_t          set_default_profiler_config();
  status_t          set_user_profiler_config();
  status_t          set_env_profiler_config();

  json              config_json;     /**< JSON object read from config file */
  config_logger_t   config_logger;   /**< Logger config */
  config_profiler_t config_profiler; /**< Profiler config */
};

} //common
} //winpool

#endif
