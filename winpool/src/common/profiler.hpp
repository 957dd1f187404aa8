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
#ifndef _WINPOOL_PROFILER_HPP_
#define _WINPOOL_PROFILER_HPP_

#include <chrono>
#include <string>

#include "common/error_status.hpp"

namespace winpool {
namespace profile {
using namespace winpool::error_handling;

/**
 * @enum time_res_t
 * @brief Supported time resolution.
 */
enum class time_res_t : uint32_t {
  milliseconds,
  microseconds,
  seconds
};

/** @class profiler_t
 *  @brief A utility class for measuring wall clock time.
 *
 * Start and stop calls must alternate; a second start or a stop without a
 * start fails and leaves the recorded time unchanged.
 */
class profiler_t {
 public:
  /** @brief default constructor, resolution is milliseconds */
  profiler_t();

  /** @brief Set the time resolution
   *  @param res The time resolution to use.
   */
  void tbp_set_default_res(time_res_t res);

  /** @brief Start the timer */
  status_t tbp_start();

  /** @brief Stop the timer and compute elapsed time */
  status_t tbp_stop();

  /** @brief Get the elapsed time
   *
   * @return The elapsed time between the last tbp_start() and tbp_stop()
   *         in the configured time unit.
   */
  double tbp_elapsedtime() const;

  /** @brief Get resolution string ("ms", "us" or "sec") */
  std::string get_res_str() const;

 private:
  void calculate_elapsed();

  using clock_type = std::chrono::steady_clock;

  bool                    timer_started; /*!< Set to true after tbp_start() */
  std::string             res_str;       /*!< Resolution string */
  time_res_t              resolution;    /*!< Time resolution */
  clock_type::time_point  start_time;    /*!< Time point of tbp_start() */
  clock_type::time_point  stop_time;     /*!< Time point of tbp_stop() */
  double                  elapsed_time;  /*!< Computed elapsed time */
};

} // profile
} // winpool

#endif
