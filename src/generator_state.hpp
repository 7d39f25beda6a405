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

#ifndef TIMEUUID_INTERNAL_GENERATOR_STATE_HPP
#define TIMEUUID_INTERNAL_GENERATOR_STATE_HPP

#include "config.hpp"
#include "hardware_address.hpp"
#include "macros.hpp"
#include "random.hpp"
#include "timeuuid.h"
#include "uuid.hpp"

#include <stdint.h>

namespace timeuuid { namespace internal { namespace core {

/**
 * Initialize a clock sequence from two secure random bytes (big-endian).
 *
 * @return TIMEUUID_ERROR_LIB_UNABLE_TO_INIT if the random source is unavailable.
 */
TimeUuidError initialize_clock_seq(RandomSource* random, uint16_t* output);

/**
 * Initialize a node from the first interface with a real hardware address.
 * When none is found the node is random with the multicast bit set.
 *
 * @param output A 6 byte buffer.
 * @return TIMEUUID_ERROR_LIB_UNABLE_TO_INIT if the random source is needed and
 * unavailable.
 */
TimeUuidError initialize_node(RandomSource* random, HardwareAddressSource* source,
                              uint8_t* output);

/**
 * The mutable state behind a generator. It is not synchronized; the owning
 * generator either holds a lock or is the only thread that touches it.
 */
class GeneratorState {
public:
  GeneratorState();

  TimeUuidError init(const Config& config);

  /**
   * Advance the state to a new timestamp and encode a UUID. The clock
   * sequence is bumped when the timestamp does not move forward.
   */
  Uuid next(uint64_t timestamp);

  uint16_t clock_seq() const { return clock_seq_; }
  uint64_t last_timestamp() const { return last_timestamp_; }
  const uint8_t* node() const { return node_; }

private:
  uint16_t clock_seq_;
  uint64_t last_timestamp_;
  uint8_t node_[NODE_LENGTH];

private:
  DISALLOW_COPY_AND_ASSIGN(GeneratorState);
};

}}} // namespace timeuuid::internal::core

#endif
