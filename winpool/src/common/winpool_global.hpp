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
#ifndef  _WINPOOL_GLOBAL_HPP_
#define  _WINPOOL_GLOBAL_HPP_

#include <cstring>
#include "common/bfloat16.hpp"
#include "common/data_types.hpp"
#include "common/winpool_global_block.hpp"

/** @def LOG_DEBUG_INFO(...)
 *
 * Print the debug information about the file and function call. Used to
 * trace which functions are called in debug builds.
 */
#ifndef NDEBUG
#define LOG_DEBUG_INFO(...)                                                  \
  do                                                                         \
    debuglog_verbose("[",winpool::common::get_relative_path(__FILE__),"], [",\
                     __PRETTY_FUNCTION__,"]: ", __VA_ARGS__);                \
  while(0)
#else
#define LOG_DEBUG_INFO(...)
#endif

/** @def LOGGER_MACRO(LOG_MODULE, LOG_LEVEL)
 *
 * Used to expand various logger functions for different log modules and
 * log levels.
 */
#define LOGGER_MACRO(LOG_MODULE, LOG_LEVEL)                                  \
  template<typename... Ts>                                                   \
  static inline void LOG_MODULE##log##_##LOG_LEVEL(Ts...vargs) {             \
  winpool::common::winpool_global_block()                                    \
  .get_logger()                                                              \
  .log_msg(winpool::error_handling::log_module_t::LOG_MODULE,                \
           winpool::error_handling::log_level_t::LOG_LEVEL, vargs...);       \
  }

/** @def COMMON_LOGGER_MACRO(LOG_LEVEL)
 *
 * Used to expand logger functions for common log. These functions do not
 * have log module name prefixed.
 */
#define COMMON_LOGGER_MACRO(LOG_LEVEL)                                      \
  template<typename... Ts>                                                  \
  static inline void log##_##LOG_LEVEL(Ts...vargs) {                        \
  winpool::common::winpool_global_block()                                   \
    .get_logger()                                                           \
    .log_msg(winpool::error_handling::log_module_t::common,                 \
             winpool::error_handling::log_level_t::LOG_LEVEL, vargs...);    \
  }

namespace winpool {
namespace common {

/** @fn winpool_global_block()
 * @brief Get a reference to winpool global block singleton
 */
static inline winpool_global_block_t& winpool_global_block() {
  return (*(winpool_global_block_t::get()));
}

/** @fn get_relative_path()
 * @brief Strip the checkout prefix from a source file path.
 */
static inline const char *get_relative_path(const char *abs_path_) {
  const char *rel = std::strstr(abs_path_, "winpool/src/");
  return (rel? rel : abs_path_);
}

/** @fn is_profile_enabled()
 * @brief Check if per call profiling is enabled by configuration.
 */
static inline bool is_profile_enabled() {
  return winpool_global_block().get_config_manager()
         .get_profiler_config().enable_profiler;
}

/** @fn apilog_info_enabled()
 * @brief Check if API log records info messages, used to skip building
 * parameter strings nobody reads.
 */
static inline bool apilog_info_enabled() {
  return winpool_global_block().get_logger()
         .is_enabled(error_handling::log_module_t::api,
                     error_handling::log_level_t::info);
}

}//common

namespace error_handling {

using namespace winpool::common;

//logger functions
COMMON_LOGGER_MACRO(error)
COMMON_LOGGER_MACRO(warning)
COMMON_LOGGER_MACRO(info)
COMMON_LOGGER_MACRO(verbose)

LOGGER_MACRO(api, error)
LOGGER_MACRO(api, warning)
LOGGER_MACRO(api, info)
LOGGER_MACRO(api, verbose)

LOGGER_MACRO(test, error)
LOGGER_MACRO(test, warning)
LOGGER_MACRO(test, info)
LOGGER_MACRO(test, verbose)

LOGGER_MACRO(profile, info)
LOGGER_MACRO(profile, verbose)

LOGGER_MACRO(debug, info)
LOGGER_MACRO(debug, verbose)

}//error_handling

namespace interface {
COMMON_LOGGER_MACRO(error)
COMMON_LOGGER_MACRO(warning)
COMMON_LOGGER_MACRO(info)
COMMON_LOGGER_MACRO(verbose)

LOGGER_MACRO(test, error)
LOGGER_MACRO(test, warning)
LOGGER_MACRO(test, info)
LOGGER_MACRO(test, verbose)
}//interface

}//winpool
#endif
