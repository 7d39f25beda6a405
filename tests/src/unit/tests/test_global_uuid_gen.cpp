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

#include "get_time.hpp"
#include "global_uuid_gen.hpp"
#include "timeuuid.h"

#include <set>
#include <string.h>

using namespace timeuuid::internal;
using namespace timeuuid::internal::core;

TEST(GlobalUuidGenUnitTest, Init) {
  EXPECT_EQ(TIMEUUID_OK, timeuuid_global_init());
  EXPECT_TRUE(GlobalUuidGen::is_initialized());

  // Initializing again is harmless
  EXPECT_EQ(TIMEUUID_OK, timeuuid_global_init());
}

TEST(GlobalUuidGenUnitTest, BadParams) {
  ASSERT_EQ(TIMEUUID_OK, timeuuid_global_init());
  EXPECT_EQ(TIMEUUID_ERROR_LIB_BAD_PARAMS, timeuuid_global_next(NULL));
  EXPECT_EQ(TIMEUUID_ERROR_LIB_BAD_PARAMS, timeuuid_global_next_lock_free(NULL));
}

TEST(GlobalUuidGenUnitTest, Next) {
  ASSERT_EQ(TIMEUUID_OK, timeuuid_global_init());

  std::set<Uuid> uuids;
  for (int i = 0; i < 1000; ++i) {
    TimeUuid uuid;
    uint64_t curr_ts = get_time_since_epoch_ms();
    ASSERT_EQ(TIMEUUID_OK, timeuuid_global_next(&uuid));
    timeuuid_uint64_t ts = timeuuid_timestamp(uuid);

    EXPECT_EQ(1u, timeuuid_version(uuid));
    EXPECT_TRUE(ts == curr_ts || ts - 1 == curr_ts);
    uuids.insert(Uuid(uuid));
  }
  EXPECT_EQ(1000u, uuids.size());
}

TEST(GlobalUuidGenUnitTest, NextLockFree) {
  ASSERT_EQ(TIMEUUID_OK, timeuuid_global_init());

  std::set<Uuid> uuids;
  for (int i = 0; i < 1000; ++i) {
    TimeUuid uuid;
    ASSERT_EQ(TIMEUUID_OK, timeuuid_global_next_lock_free(&uuid));
    EXPECT_EQ(1u, timeuuid_version(uuid));
    EXPECT_EQ(0x80, uuid.bytes[8] & 0xC0);
    uuids.insert(Uuid(uuid));
  }
  EXPECT_EQ(1000u, uuids.size());
}
