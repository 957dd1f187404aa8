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
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include "config_manager.hpp"
#include "pooling/pooling_config.hpp"

namespace winpool {
namespace common {

using namespace winpool::error_handling;
using json = nlohmann::json;

namespace {
/** @brief Read a log level from an environment variable, if valid */
void env_log_level(const char *env_name_, log_module_t module_,
                   config_logger_t &config_logger_) {
  char *log_level_str = std::getenv(env_name_);
  if (!log_level_str) {
    return;
  }

  try {
    uint32_t log_level = std::stoul(log_level_str);
    if (log_level < uint32_t(log_level_t::log_level_count)) {
      config_logger_.log_level_map[module_] = log_level_t(log_level);
    }
  }
  catch (const std::invalid_argument &) {
    config_logger_.log_level_map[module_] =
      logger_support_t::str_to_log_level(log_level_str);
  }
  catch (const std::out_of_range &) {
  }
}
}

void config_manager_t::config() {
  set_default_config();

  //if config file is given set config as per config file
  char *config_file_str = std::getenv("WINPOOL_CONFIG_FILE");
  if (config_file_str) {
    if (parse(config_file_str) == status_t::success) {
      set_user_config();
      return;
    }
  }

  //if config file is unavailable setup config as per env variables
  set_env_config();
}

status_t config_manager_t::config(const std::string &file_name_) {
  set_default_config();

  status_t status = parse(file_name_);
  if (status == status_t::success) {
    set_user_config();
  }

  return status;
}

const config_logger_t &config_manager_t::get_logger_config() const {
  return config_logger;
}

const config_profiler_t &config_manager_t::get_profiler_config() const {
  return config_profiler;
}

status_t config_manager_t::parse(const std::string &file_name_) {
  std::ifstream json_file(file_name_);
  if (! json_file.is_open()) {
    return status_t::config_bad_json_file;
  }

  config_json = json::parse(json_file, nullptr, false);
  if (config_json.is_discarded() || !config_json.is_object()) {
    config_json = json::object();
    return status_t::config_bad_json_file;
  }

  return status_t::success;
}

void config_manager_t::set_default_config() {
  set_default_logger_config();
  set_default_profiler_config();

  pooling::pooling_config_t::instance().set_default_config();
}

void config_manager_t::set_user_config() {
  set_user_logger_config();
  set_user_profiler_config();

  pooling::pooling_config_t::instance().set_user_config(config_json);
}

void config_manager_t::set_env_config() {
  set_env_logger_config();
  set_env_profiler_config();

  pooling::pooling_config_t::instance().set_env_config();
}

status_t config_manager_t::set_default_logger_config() {
  config_logger.log_level_map.clear();
  uint32_t module_count = uint32_t(log_module_t::log_module_count);
  for (uint32_t i = 0; i < module_count; ++i) {
    config_logger.log_level_map[log_module_t(i)] = log_level_t::warning;
  }

  return status_t::success;
}

status_t config_manager_t::set_user_logger_config() {
  auto logger_json = config_json.find("log_levels");
  if (logger_json == config_json.end() || !logger_json->is_object()) {
    return status_t::failure;
  }

  for (auto& [key, value] : logger_json->items()) {
    auto log_module = logger_support_t::str_to_log_module(key);
    if (log_module == log_module_t::log_module_count || !value.is_string()) {
      continue;
    }
    auto log_level_str = value.template get<std::string>();
    if (! log_level_str.empty()) {
      config_logger.log_level_map[log_module]
        = logger_support_t::str_to_log_level(log_level_str);
    }
  }

  return status_t::success;
}

status_t config_manager_t::set_env_logger_config() {
  env_log_level("WINPOOL_COMMON_LOG_LEVEL",  log_module_t::common,  config_logger);
  env_log_level("WINPOOL_API_LOG_LEVEL",     log_module_t::api,     config_logger);
  env_log_level("WINPOOL_TEST_LOG_LEVEL",    log_module_t::test,    config_logger);
  env_log_level("WINPOOL_PROFILE_LOG_LEVEL", log_module_t::profile, config_logger);
  env_log_level("WINPOOL_DEBUG_LOG_LEVEL",   log_module_t::debug,   config_logger);

  return status_t::success;
}

status_t config_manager_t::set_default_profiler_config() {
  config_profiler.enable_profiler = false;

  return status_t::success;
}

status_t config_manager_t::set_user_profiler_config() {
  auto profiler_json = config_json.find("profiler");
  if (profiler_json == config_json.end() || !profiler_json->is_object()) {
    return status_t::failure;
  }

  auto enable_profiler_json = profiler_json->find("enable_profiler");
  if (enable_profiler_json != profiler_json->end() &&
      enable_profiler_json->is_boolean()) {
    config_profiler.enable_profiler = enable_profiler_json->get<bool>();
  }

  return status_t::success;
}

status_t config_manager_t::set_env_profiler_config() {
  char *enable_profiler_str = std::getenv("WINPOOL_ENABLE_PROFILER");
  if (enable_profiler_str) {
    config_profiler.enable_profiler = (std::string(enable_profiler_str) == "1");
  }

  return status_t::success;
}

} //common
} //winpool
