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

#ifndef TIMEUUID_INTERNAL_CLOCK_HPP
#define TIMEUUID_INTERNAL_CLOCK_HPP

#include "macros.hpp"
#include "ref_counted.hpp"

#include <stdint.h>

// 100 nanosecond intervals between the UUID epoch (1582-10-15) and the Unix epoch
#define TIME_OFFSET_BETWEEN_UTC_AND_EPOCH 0x01B21DD213814000LL

namespace timeuuid { namespace internal { namespace core {

/**
 * A source of UUID timestamps: 100 nanosecond intervals since
 * 00:00:00.00, 15 October 1582.
 */
class Clock : public RefCounted<Clock> {
public:
  typedef SharedRefPtr<Clock> Ptr;

  Clock() {}
  virtual ~Clock() {}

  virtual uint64_t now() = 0;

private:
  DISALLOW_COPY_AND_ASSIGN(Clock);
};

class SystemClock : public Clock {
public:
  virtual uint64_t now();
};

}}} // namespace timeuuid::internal::core

#endif
