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
#ifndef  _WINPOOL_GLOBAL_BLOCK_HPP_
#define  _WINPOOL_GLOBAL_BLOCK_HPP_

#include <cstdint>
#include <mutex>
#include "common/error_status.hpp"
#include "common/winpool_exceptions.hpp"
#include "common/logging.hpp"
#include "common/config_manager.hpp"

namespace winpool {
namespace common {

using namespace winpool::error_handling;

/** @class winpool_global_block_t
 *  @brief A singleton class for all winpool persistent data structures.
 *
 *  Once initialized this singleton remains persistent across all the calls to
 *  the library. It owns
 *  - Configuration manager, configured once at creation from the config file
 *    or environment variables.
 *  - Logger, a threadsafe logger configured by the configuration manager.
 *
 *  None of this state takes part in pooling arithmetic.
 */
class winpool_global_block_t {
public:
  /** @brief Get pointer to the singleton
   *
   * Creates the object if it is not already created. This call is thread-safe.
   *
   * @return A pointer to the singleton object.
   **/
  static winpool_global_block_t* get();

  /** @brief Get logger */
  logger_t&                 get_logger();

  /** @brief Get configuration manager */
  config_manager_t&         get_config_manager();

  /** @brief Re-read configuration from a JSON file and apply it.
   *  @param file_name_ : JSON config file.
   *  @return status of reading the file.
   */
  status_t                  reconfigure(const std::string &file_name_);

private:
  winpool_global_block_t();
  winpool_global_block_t(const winpool_global_block_t&) = delete;
  winpool_global_block_t& operator=(const winpool_global_block_t&) = delete;

  static std::mutex              instance_mutex; /*!< mutex for thread safety */
  static winpool_global_block_t* instance;       /*!< singleton instance pointer */

  config_manager_t               config_manager; /*!< config manager */
  logger_t                       logger;         /*!< logger */
};

}//common
}//winpool

#endif
