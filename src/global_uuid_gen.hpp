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

#ifndef TIMEUUID_INTERNAL_GLOBAL_UUID_GEN_HPP
#define TIMEUUID_INTERNAL_GLOBAL_UUID_GEN_HPP

#include "timeuuid.h"
#include "uuid.hpp"

#include <uv.h>

#define GLOBAL_LOCK_FREE_QUEUE_SIZE 10

namespace timeuuid { namespace internal { namespace core {

class UuidGen;

/**
 * The process-wide generators. They are created once by an explicit call
 * to init() and live until the process exits.
 */
class GlobalUuidGen {
public:
  static TimeUuidError init();

  static bool is_initialized();

  // Both require a successful init()
  static Uuid next();
  static Uuid next_lock_free();

private:
  static void init_once();

  static uv_once_t init_guard_;
  static TimeUuidError init_error_;
  static UuidGen* mutex_gen_;
  static UuidGen* lock_free_gen_;

  GlobalUuidGen(); // Keep this object from being created
};

}}} // namespace timeuuid::internal::core

#endif
