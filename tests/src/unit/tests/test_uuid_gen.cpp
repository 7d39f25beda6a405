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

#include "unit.hpp"

#include "get_time.hpp"
#include "uuids.hpp"

#include <algorithm>
#include <set>
#include <string.h>

using namespace timeuuid::internal;
using namespace timeuuid::internal::core;

#define NUM_THREADS 8
#define NUM_UUIDS_PER_THREAD 1000

typedef std::vector<Uuid> UuidVec;

struct ConsumerData {
  UuidGen* uuid_gen;
  UuidVec uuids;
};

static void on_consume(void* arg) {
  ConsumerData* data = static_cast<ConsumerData*>(arg);
  for (int i = 0; i < NUM_UUIDS_PER_THREAD; ++i) {
    data->uuids.push_back(data->uuid_gen->next());
  }
}

class UuidGenUnitTest : public Unit {
public:
  UuidGen::Ptr create(TimeUuidGenStrategy strategy, size_t queue_size = 0) {
    config_.set_strategy(strategy);
    config_.set_queue_size(queue_size);
    UuidGen::Ptr uuid_gen;
    EXPECT_EQ(TIMEUUID_OK, UuidGen::create(config_, &uuid_gen));
    return uuid_gen;
  }

  /**
   * Run concurrent consumers against a generator and verify that every
   * UUID they received is distinct.
   */
  void run_consumers(const UuidGen::Ptr& uuid_gen) {
    ConsumerData data[NUM_THREADS];
    uv_thread_t threads[NUM_THREADS];
    for (int i = 0; i < NUM_THREADS; ++i) {
      data[i].uuid_gen = uuid_gen.get();
      ASSERT_EQ(0, uv_thread_create(&threads[i], on_consume, &data[i]));
    }

    std::set<Uuid> uuids;
    for (int i = 0; i < NUM_THREADS; ++i) {
      uv_thread_join(&threads[i]);
      for (UuidVec::const_iterator it = data[i].uuids.begin(), end = data[i].uuids.end();
           it != end; ++it) {
        EXPECT_EQ(1u, it->version());
        EXPECT_EQ(2u, it->variant());
        uuids.insert(*it);
      }
      EXPECT_EQ(static_cast<size_t>(NUM_UUIDS_PER_THREAD), data[i].uuids.size());
    }
    EXPECT_EQ(static_cast<size_t>(NUM_THREADS * NUM_UUIDS_PER_THREAD), uuids.size());
  }

  /**
   * With a single consumer the UUIDs arrive in the order they were produced,
   * so the fake clock's timestamps come back one after another.
   */
  void verify_production_order(const UuidGen::Ptr& uuid_gen) {
    for (uint64_t i = 0; i < 1000; ++i) {
      Uuid uuid = uuid_gen->next();
      EXPECT_EQ(FAKE_CLOCK_START + i, uuid.timestamp());
    }
  }
};

TEST_F(UuidGenUnitTest, Mutex) {
  UuidGen::Ptr uuid_gen(create(TIMEUUID_GEN_STRATEGY_MUTEX));
  ASSERT_TRUE(uuid_gen);
  EXPECT_EQ(UuidGen::MUTEX, uuid_gen->type());

  Uuid prev = uuid_gen->next();
  for (int i = 0; i < 100; ++i) {
    Uuid uuid = uuid_gen->next();
    EXPECT_GT(uuid.timestamp(), prev.timestamp());
    EXPECT_EQ(prev.clock_seq(), uuid.clock_seq());
    prev = uuid;
  }
}

TEST_F(UuidGenUnitTest, MutexSameTimestamp) {
  clock_->push(FAKE_CLOCK_START);
  clock_->push(FAKE_CLOCK_START);

  UuidGen::Ptr uuid_gen(create(TIMEUUID_GEN_STRATEGY_MUTEX));
  ASSERT_TRUE(uuid_gen);

  Uuid first = uuid_gen->next();
  Uuid second = uuid_gen->next();
  EXPECT_EQ(first.timestamp(), second.timestamp());
  EXPECT_EQ((first.clock_seq() + 1) & 0x3FFF, second.clock_seq());
}

TEST_F(UuidGenUnitTest, MutexConcurrent) {
  // Force most callers onto the same timestamp
  for (int i = 0; i < NUM_THREADS * NUM_UUIDS_PER_THREAD / 2; ++i) {
    clock_->push(FAKE_CLOCK_START);
  }

  UuidGen::Ptr uuid_gen(create(TIMEUUID_GEN_STRATEGY_MUTEX));
  ASSERT_TRUE(uuid_gen);
  run_consumers(uuid_gen);
}

TEST_F(UuidGenUnitTest, QueueSynchronous) {
  UuidGen::Ptr uuid_gen(create(TIMEUUID_GEN_STRATEGY_QUEUE, 0));
  ASSERT_TRUE(uuid_gen);
  EXPECT_EQ(UuidGen::QUEUE, uuid_gen->type());
  EXPECT_EQ(0u, static_cast<QueueUuidGen*>(uuid_gen.get())->queue_size());

  verify_production_order(uuid_gen);
}

TEST_F(UuidGenUnitTest, QueueSynchronousFresh) {
  UuidGen::Ptr uuid_gen(create(TIMEUUID_GEN_STRATEGY_QUEUE, 0));
  ASSERT_TRUE(uuid_gen);

  Uuid first = uuid_gen->next();
  EXPECT_EQ(FAKE_CLOCK_START, first.timestamp());

  // Nothing is minted until the next caller arrives
  msleep(100);
  clock_->push(FAKE_CLOCK_START + 1000000);

  Uuid second = uuid_gen->next();
  EXPECT_EQ(FAKE_CLOCK_START + 1000000, second.timestamp());
  EXPECT_EQ(first.clock_seq(), second.clock_seq());
}

TEST_F(UuidGenUnitTest, QueueBuffered) {
  UuidGen::Ptr uuid_gen(create(TIMEUUID_GEN_STRATEGY_QUEUE, 16));
  ASSERT_TRUE(uuid_gen);
  EXPECT_EQ(16u, static_cast<QueueUuidGen*>(uuid_gen.get())->queue_size());

  verify_production_order(uuid_gen);
}

TEST_F(UuidGenUnitTest, QueueConcurrent) {
  for (int i = 0; i < NUM_THREADS * NUM_UUIDS_PER_THREAD / 2; ++i) {
    clock_->push(FAKE_CLOCK_START);
  }

  UuidGen::Ptr uuid_gen(create(TIMEUUID_GEN_STRATEGY_QUEUE, 0));
  ASSERT_TRUE(uuid_gen);
  run_consumers(uuid_gen);

  uuid_gen = create(TIMEUUID_GEN_STRATEGY_QUEUE, 10);
  ASSERT_TRUE(uuid_gen);
  run_consumers(uuid_gen);
}

TEST_F(UuidGenUnitTest, QueueReleaseWithBlockedProducer) {
  UuidGen::Ptr uuid_gen(create(TIMEUUID_GEN_STRATEGY_QUEUE, 4));
  ASSERT_TRUE(uuid_gen);
  uuid_gen->next(); // The producer is running and will fill the queue

  uint64_t start = uv_hrtime();
  uuid_gen.reset();
  uint64_t elapsed_ms = (uv_hrtime() - start) / (1000 * 1000);
  EXPECT_LT(elapsed_ms, 1000u);
}

TEST_F(UuidGenUnitTest, IsolatedState) {
  FakeClock::Ptr other_clock(new FakeClock());
  other_clock->push(FAKE_CLOCK_START);
  other_clock->push(FAKE_CLOCK_START);

  UuidGen::Ptr uuid_gen(create(TIMEUUID_GEN_STRATEGY_MUTEX));
  ASSERT_TRUE(uuid_gen);

  config_.set_clock(other_clock);
  UuidGen::Ptr other(create(TIMEUUID_GEN_STRATEGY_MUTEX));
  ASSERT_TRUE(other);

  Uuid first = uuid_gen->next();
  other->next();
  other->next(); // Bumps only this generator's clock sequence
  Uuid second = uuid_gen->next();

  EXPECT_EQ(first.clock_seq(), second.clock_seq());
  EXPECT_EQ(first.timestamp() + 1, second.timestamp());
}

TEST_F(UuidGenUnitTest, RandomFailure) {
  random_->set_failing(true);

  UuidGen::Ptr uuid_gen;
  config_.set_strategy(TIMEUUID_GEN_STRATEGY_MUTEX);
  EXPECT_EQ(TIMEUUID_ERROR_LIB_UNABLE_TO_INIT, UuidGen::create(config_, &uuid_gen));
  EXPECT_FALSE(uuid_gen);

  config_.set_strategy(TIMEUUID_GEN_STRATEGY_QUEUE);
  EXPECT_EQ(TIMEUUID_ERROR_LIB_UNABLE_TO_INIT, UuidGen::create(config_, &uuid_gen));
  EXPECT_FALSE(uuid_gen);
}

TEST(UuidGenCApiUnitTest, Mutex) {
  TimeUuidGen* uuid_gen = timeuuid_gen_mutex_new();
  ASSERT_TRUE(uuid_gen != NULL);

  TimeUuid prev_uuid;
  timeuuid_gen_next(uuid_gen, &prev_uuid);
  EXPECT_EQ(1u, timeuuid_version(prev_uuid));

  for (int i = 0; i < 1000; ++i) {
    TimeUuid uuid;
    uint64_t curr_ts = get_time_since_epoch_ms();
    timeuuid_gen_next(uuid_gen, &uuid);
    timeuuid_uint64_t ts = timeuuid_timestamp(uuid);

    EXPECT_EQ(1u, timeuuid_version(uuid));
    EXPECT_TRUE(ts == curr_ts || ts - 1 == curr_ts);
    EXPECT_NE(0, memcmp(prev_uuid.bytes, uuid.bytes, sizeof(uuid.bytes)));
    prev_uuid = uuid;
  }

  timeuuid_gen_free(uuid_gen);
}

TEST(UuidGenCApiUnitTest, Queue) {
  TimeUuidGen* uuid_gen = timeuuid_gen_queue_new(0);
  ASSERT_TRUE(uuid_gen != NULL);

  TimeUuid prev_uuid;
  timeuuid_gen_next(uuid_gen, &prev_uuid);
  for (int i = 0; i < 1000; ++i) {
    TimeUuid uuid;
    timeuuid_gen_next(uuid_gen, &uuid);
    EXPECT_EQ(1u, timeuuid_version(uuid));
    EXPECT_NE(0, memcmp(prev_uuid.bytes, uuid.bytes, sizeof(uuid.bytes)));
    prev_uuid = uuid;
  }

  timeuuid_gen_free(uuid_gen);
}

TEST(UuidGenCApiUnitTest, WithConfig) {
  TimeUuidConfig* config = timeuuid_config_new();
  ASSERT_EQ(TIMEUUID_OK, timeuuid_config_set_strategy(config, TIMEUUID_GEN_STRATEGY_QUEUE));
  ASSERT_EQ(TIMEUUID_OK, timeuuid_config_set_queue_size(config, 2));
  ASSERT_EQ(TIMEUUID_OK, timeuuid_config_set_node(config, 0x0000112233445566LL));

  TimeUuidGen* uuid_gen = NULL;
  ASSERT_EQ(TIMEUUID_OK, timeuuid_gen_new_with_config(config, &uuid_gen));
  timeuuid_config_free(config); // The generator doesn't hold on to the config

  TimeUuid uuid;
  timeuuid_gen_next(uuid_gen, &uuid);

  char str[TIMEUUID_STRING_LENGTH];
  timeuuid_string(uuid, str);
  EXPECT_TRUE(strstr(str, "-112233445566") != NULL);

  timeuuid_gen_free(uuid_gen);
}

TEST(UuidGenCApiUnitTest, WithConfigBadParams) {
  TimeUuidGen* uuid_gen = NULL;
  EXPECT_EQ(TIMEUUID_ERROR_LIB_BAD_PARAMS, timeuuid_gen_new_with_config(NULL, &uuid_gen));
  EXPECT_TRUE(uuid_gen == NULL);

  TimeUuidConfig* config = timeuuid_config_new();
  EXPECT_EQ(TIMEUUID_ERROR_LIB_BAD_PARAMS, timeuuid_gen_new_with_config(config, NULL));
  timeuuid_config_free(config);
}
