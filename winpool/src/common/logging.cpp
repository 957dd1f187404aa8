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
#include "logging.hpp"

namespace winpool {
namespace error_handling {
using namespace winpool::common;

namespace cn = std::chrono;

logger_t::logger_t()
  :log_file{}, log_ofstream{}, log_start_time{cn::steady_clock::now()},
   log_cout_flag{true} {
  log_level_map[log_module_t::common]  = log_level_t::warning;
  log_level_map[log_module_t::api]     = log_level_t::warning;
  log_level_map[log_module_t::test]    = log_level_t::warning;
  log_level_map[log_module_t::profile] = log_level_t::warning;
  log_level_map[log_module_t::debug]   = log_level_t::warning;
}

logger_t &logger_t::set_log_level(log_module_t module_, log_level_t level_) {
  std::lock_guard<std::mutex> lk{log_mutex};
  log_level_map[module_] = level_;
  return *this;
}

log_level_t logger_t::get_log_level(log_module_t module_) const {
  auto it = log_level_map.find(module_);
  return (it != log_level_map.end()) ? it->second : log_level_t::disabled;
}

bool logger_t::is_enabled(log_module_t module_, log_level_t level_) const {
  return (level_ != log_level_t::disabled) &&
         (get_log_level(module_) >= level_);
}

logger_t &logger_t::set_log_file(std::string log_file_) {
  std::lock_guard<std::mutex> lk{log_mutex};

  //reopening with another name is an error
  if (log_ofstream.is_open()) {
    std::string message = "trying to reopen < " + log_file + " >";
    message += " with new name < " + log_file_ + " >.";
    EXCEPTION_WITH_LOC(message);
  }

  log_ofstream.open(log_file_);
  if (!log_ofstream.is_open()) {
    std::string message = "unable to open log file < " + log_file_ + " >.";
    EXCEPTION_WITH_LOC(message);
  }

  log_file      = log_file_;
  log_cout_flag = false;

  return *this;
}

std::string logger_t::get_log_file() const {
  return log_file;
}

logger_t &logger_t::set_config(const config_logger_t &config_logger_) {
  std::lock_guard<std::mutex> lk{log_mutex};

  for (auto& [key, value] : config_logger_.log_level_map) {
    log_level_map[key] = value;
  }

  return *this;
}

void logger_t::write_msg(log_module_t log_module_, log_level_t log_level_,
                         const std::string &message_) {
  auto lapsed_time = cn::steady_clock::now() - log_start_time;
  auto us          = cn::duration_cast<cn::microseconds>(lapsed_time).count();

  std::ostringstream time_stream;
  time_stream << std::fixed << std::setprecision(6) << (double(us)/1000000.0);

  std::string hdr = "[" + logger_support_t::log_module_to_str(log_module_) + "]"
                    + "[" + logger_support_t::log_level_to_str(log_level_) + "]"
                    + "[" + time_stream.str() + "]:";

  std::lock_guard<std::mutex> lk{log_mutex};
  if (!log_cout_flag) {
    log_ofstream << hdr << "\n" << message_ << "\n";
    return;
  }

  //continuation lines are indented under the header
  std::string empty_hdr(hdr.length(), ' ');
  std::size_t start  = 0;
  std::size_t nl_pos = message_.find('\n');
  std::cout << hdr << message_.substr(0, nl_pos) << "\n";
  while (nl_pos != std::string::npos) {
    start  = nl_pos + 1;
    nl_pos = message_.find('\n', start);
    std::cout << empty_hdr << message_.substr(start, nl_pos - start) << "\n";
  }
}

}//error_handling
}//winpool
