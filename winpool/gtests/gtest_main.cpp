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
#include <ctime>
#include <gtest/gtest.h>
#include "gtest_utils.hpp"

using namespace std;

//number of testcases and random seed
uint32_t test_num      = 100;
int seed               = time(NULL);

/** @brief pool_test Data Structure(vector of structures) to hold random Max Pooling Parameters */
std::vector<PoolType> pool_test{};

int main(int argc, char **argv) {
  // Command line argument parser
  Parser parse;
  parse(argc, argv, seed, test_num);
  srand(seed);
  std::cout<<"Value "<<seed<<" is used as seed. \n";

  // Creating Random parameters for Max Pooling
  pool_test.resize(test_num);
  for (uint32_t i = 0; i < test_num; ++i) {
    pool_test[i] = PoolType();
  }

  ::testing :: InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
