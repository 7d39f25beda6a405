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

#include "clock.hpp"

#include "get_time.hpp"

using namespace timeuuid::internal;
using namespace timeuuid::internal::core;

uint64_t SystemClock::now() {
  return TIME_OFFSET_BETWEEN_UTC_AND_EPOCH + get_time_since_epoch_ns() / 100;
}
