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
#include "winpool_global_block.hpp"

namespace winpool {
namespace common {

using namespace winpool::error_handling;

std::mutex              winpool_global_block_t::instance_mutex;
winpool_global_block_t* winpool_global_block_t::instance = nullptr;

winpool_global_block_t::winpool_global_block_t()
  :config_manager{}, logger{} {
  config_manager.config();
  logger.set_config(config_manager.get_logger_config());
}

winpool_global_block_t* winpool_global_block_t::get() {
  std::lock_guard<std::mutex> lock(instance_mutex);
  if (instance == nullptr) {
    instance = new winpool_global_block_t();
  }

  return instance;
}

logger_t& winpool_global_block_t::get_logger() {
  return logger;
}

config_manager_t& winpool_global_block_t::get_config_manager() {
  return config_manager;
}

status_t winpool_global_block_t::reconfigure(const std::string &file_name_) {
  status_t status = config_manager.config(file_name_);
  logger.set_config(config_manager.get_logger_config());

  return status;
}

}//common
}//winpool
