/*
  Copyright (c) DataStax, Inc.

  Licensed under the Apache License, Version 2.0 (the "License");
  you may not use this file except in compliance with the License.
  You may obtain a copy of the License at

  http://www.apache.org/licenses/LICENSE-2.0

  Unless required by applicable law or agreed to in writing, software
  distributed under the License is distributed on an "AS IS" BASIS,
  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
  See the License for the specific language governing permissions and
  limitations under the License.
*/

#include <gtest/gtest.h>

#include "global_uuid_gen.hpp"
#include "timeuuid.h"

using namespace timeuuid::internal::core;

// Built into its own executable; nothing in this process calls
// timeuuid_global_init() before these run.

TEST(GlobalUuidGenUninitializedUnitTest, NotInitialized) {
  ASSERT_FALSE(GlobalUuidGen::is_initialized());

  TimeUuid uuid;
  EXPECT_EQ(TIMEUUID_ERROR_LIB_INVALID_STATE, timeuuid_global_next(&uuid));
  EXPECT_EQ(TIMEUUID_ERROR_LIB_INVALID_STATE, timeuuid_global_next_lock_free(&uuid));
}

TEST(GlobalUuidGenUninitializedUnitTest, BadParamsBeforeInit) {
  EXPECT_EQ(TIMEUUID_ERROR_LIB_BAD_PARAMS, timeuuid_global_next(NULL));
  EXPECT_EQ(TIMEUUID_ERROR_LIB_BAD_PARAMS, timeuuid_global_next_lock_free(NULL));
  EXPECT_FALSE(GlobalUuidGen::is_initialized());
}
