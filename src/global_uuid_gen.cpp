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

#include "global_uuid_gen.hpp"

#include "atomic.hpp"
#include "config.hpp"
#include "logger.hpp"
#include "uuids.hpp"

using namespace timeuuid::internal;
using namespace timeuuid::internal::core;

static Atomic<bool> global_is_initialized(false);

extern "C" {

TimeUuidError timeuuid_global_init() { return GlobalUuidGen::init(); }

TimeUuidError timeuuid_global_next(TimeUuid* output) {
  if (output == NULL) {
    return TIMEUUID_ERROR_LIB_BAD_PARAMS;
  }
  if (!GlobalUuidGen::is_initialized()) {
    return TIMEUUID_ERROR_LIB_INVALID_STATE;
  }
  GlobalUuidGen::next().to(output);
  return TIMEUUID_OK;
}

TimeUuidError timeuuid_global_next_lock_free(TimeUuid* output) {
  if (output == NULL) {
    return TIMEUUID_ERROR_LIB_BAD_PARAMS;
  }
  if (!GlobalUuidGen::is_initialized()) {
    return TIMEUUID_ERROR_LIB_INVALID_STATE;
  }
  GlobalUuidGen::next_lock_free().to(output);
  return TIMEUUID_OK;
}

} // extern "C"

uv_once_t GlobalUuidGen::init_guard_ = UV_ONCE_INIT;
TimeUuidError GlobalUuidGen::init_error_ = TIMEUUID_OK;
UuidGen* GlobalUuidGen::mutex_gen_ = NULL;
UuidGen* GlobalUuidGen::lock_free_gen_ = NULL;

TimeUuidError GlobalUuidGen::init() {
  uv_once(&init_guard_, init_once);
  return init_error_;
}

bool GlobalUuidGen::is_initialized() {
  return global_is_initialized.load(MEMORY_ORDER_ACQUIRE);
}

Uuid GlobalUuidGen::next() { return mutex_gen_->next(); }

Uuid GlobalUuidGen::next_lock_free() { return lock_free_gen_->next(); }

void GlobalUuidGen::init_once() {
  UuidGen::Ptr mutex_gen;
  UuidGen::Ptr lock_free_gen;

  Config config;
  init_error_ = UuidGen::create(config, &mutex_gen);
  if (init_error_ != TIMEUUID_OK) {
    LOG_CRITICAL("Unable to initialize the global UUID generator: %s",
                 timeuuid_error_desc(init_error_));
    return;
  }

  config.set_strategy(TIMEUUID_GEN_STRATEGY_QUEUE);
  config.set_queue_size(GLOBAL_LOCK_FREE_QUEUE_SIZE);
  init_error_ = UuidGen::create(config, &lock_free_gen);
  if (init_error_ != TIMEUUID_OK) {
    LOG_CRITICAL("Unable to initialize the global lock-free UUID generator: %s",
                 timeuuid_error_desc(init_error_));
    return;
  }

  // Never released; both generators live for the lifetime of the process
  mutex_gen->inc_ref();
  mutex_gen_ = mutex_gen.get();
  lock_free_gen->inc_ref();
  lock_free_gen_ = lock_free_gen.get();

  global_is_initialized.store(true, MEMORY_ORDER_RELEASE);
}
