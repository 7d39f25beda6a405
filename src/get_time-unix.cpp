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

#include "get_time.hpp"

#include <unistd.h>

#if _POSIX_TIMERS > 0
#include <time.h>
#else
#include <sys/time.h>
#endif

namespace timeuuid { namespace internal {

#if _POSIX_TIMERS > 0

uint64_t get_time_since_epoch_ns() {
  struct timespec ts;
  clock_gettime(CLOCK_REALTIME, &ts);
  return static_cast<uint64_t>(ts.tv_sec) * NANOSECONDS_PER_SECOND +
         static_cast<uint64_t>(ts.tv_nsec);
}

#else

uint64_t get_time_since_epoch_ns() {
  struct timeval tv;
  gettimeofday(&tv, NULL);
  return static_cast<uint64_t>(tv.tv_sec) * NANOSECONDS_PER_SECOND +
         static_cast<uint64_t>(tv.tv_usec) * NANOSECONDS_PER_MICROSECOND;
}

#endif

}} // namespace timeuuid::internal
