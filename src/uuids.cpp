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

#include "uuids.hpp"

#include "logger.hpp"
#include "scoped_lock.hpp"

using namespace timeuuid::internal;
using namespace timeuuid::internal::core;

static TimeUuidGen* uuid_gen_new(const Config& config) {
  UuidGen::Ptr uuid_gen;
  if (UuidGen::create(config, &uuid_gen) != TIMEUUID_OK) {
    return NULL;
  }
  uuid_gen->inc_ref();
  return TimeUuidGen::to(uuid_gen.get());
}

extern "C" {

TimeUuidGen* timeuuid_gen_mutex_new() { return uuid_gen_new(Config()); }

TimeUuidGen* timeuuid_gen_queue_new(size_t queue_size) {
  Config config;
  config.set_strategy(TIMEUUID_GEN_STRATEGY_QUEUE);
  config.set_queue_size(queue_size);
  return uuid_gen_new(config);
}

TimeUuidError timeuuid_gen_new_with_config(const TimeUuidConfig* config, TimeUuidGen** output) {
  if (config == NULL || output == NULL) {
    return TIMEUUID_ERROR_LIB_BAD_PARAMS;
  }

  UuidGen::Ptr uuid_gen;
  TimeUuidError rc = UuidGen::create(*config->from(), &uuid_gen);
  if (rc != TIMEUUID_OK) {
    return rc;
  }
  uuid_gen->inc_ref();
  *output = TimeUuidGen::to(uuid_gen.get());
  return TIMEUUID_OK;
}

void timeuuid_gen_free(TimeUuidGen* uuid_gen) { uuid_gen->dec_ref(); }

void timeuuid_gen_next(TimeUuidGen* uuid_gen, TimeUuid* output) { uuid_gen->next().to(output); }

} // extern "C"

TimeUuidError UuidGen::create(const Config& config, Ptr* output) {
  Ptr uuid_gen;
  switch (config.strategy()) {
    case TIMEUUID_GEN_STRATEGY_MUTEX:
      uuid_gen.reset(new MutexUuidGen(config.clock()));
      break;
    case TIMEUUID_GEN_STRATEGY_QUEUE:
      uuid_gen.reset(new QueueUuidGen(config.clock(), config.queue_size()));
      break;
    default:
      return TIMEUUID_ERROR_LIB_BAD_PARAMS;
  }

  TimeUuidError rc = uuid_gen->init(config);
  if (rc != TIMEUUID_OK) {
    return rc;
  }
  *output = uuid_gen;
  return TIMEUUID_OK;
}

MutexUuidGen::MutexUuidGen(const Clock::Ptr& clock)
    : UuidGen(MUTEX, clock) {
  uv_mutex_init(&mutex_);
}

MutexUuidGen::~MutexUuidGen() { uv_mutex_destroy(&mutex_); }

TimeUuidError MutexUuidGen::init(const Config& config) {
  ScopedMutex lock(&mutex_);
  return state_.init(config);
}

Uuid MutexUuidGen::next() {
  ScopedMutex lock(&mutex_);
  return state_.next(clock_->now());
}

QueueUuidGen::QueueUuidGen(const Clock::Ptr& clock, size_t queue_size)
    : UuidGen(QUEUE, clock)
    , queue_(queue_size)
    , is_joinable_(false) {}

QueueUuidGen::~QueueUuidGen() { close_and_join(); }

TimeUuidError QueueUuidGen::init(const Config& config) {
  TimeUuidError rc = state_.init(config);
  if (rc != TIMEUUID_OK) return rc;

  // The state is handed over to the producer thread from here on
  int uv_rc = uv_thread_create(&thread_, on_run, this);
  if (uv_rc != 0) {
    LOG_ERROR("Unable to start the UUID producer thread: %s", uv_strerror(uv_rc));
    return TIMEUUID_ERROR_LIB_UNABLE_TO_INIT;
  }
  is_joinable_ = true;
  return TIMEUUID_OK;
}

Uuid QueueUuidGen::next() {
  Uuid uuid;
  if (!queue_.dequeue(uuid)) {
    LOG_ERROR("Attempted to generate a UUID using a generator that has been closed");
  }
  return uuid;
}

void QueueUuidGen::on_run(void* data) {
  QueueUuidGen* uuid_gen = static_cast<QueueUuidGen*>(data);
  uuid_gen->produce();
}

void QueueUuidGen::produce() {
  // Read the clock only once a slot is free so a synchronous hand-off
  // delivers a timestamp taken after the consumer arrived
  while (queue_.wait_for_room()) {
    if (!queue_.enqueue(state_.next(clock_->now()))) break;
  }
  LOG_DEBUG("UUID producer thread is exiting");
}

void QueueUuidGen::close_and_join() {
  queue_.close();
  if (is_joinable_) {
    is_joinable_ = false;
    int rc = uv_thread_join(&thread_);
    if (rc != 0) {
      LOG_ERROR("Unable to join the UUID producer thread: %s", uv_strerror(rc));
    }
  }
}
