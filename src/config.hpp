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

#ifndef TIMEUUID_INTERNAL_CONFIG_HPP
#define TIMEUUID_INTERNAL_CONFIG_HPP

#include "clock.hpp"
#include "external.hpp"
#include "hardware_address.hpp"
#include "random.hpp"
#include "timeuuid.h"

namespace timeuuid { namespace internal { namespace core {

class Config {
public:
  Config()
      : strategy_(TIMEUUID_GEN_STRATEGY_MUTEX)
      , queue_size_(0)
      , has_node_(false)
      , node_(0)
      , clock_(new SystemClock())
      , random_(new SecureRandomSource())
      , hardware_address_source_(new SystemHardwareAddressSource()) {}

  TimeUuidGenStrategy strategy() const { return strategy_; }

  void set_strategy(TimeUuidGenStrategy strategy) { strategy_ = strategy; }

  size_t queue_size() const { return queue_size_; }

  void set_queue_size(size_t queue_size) { queue_size_ = queue_size; }

  bool has_node() const { return has_node_; }

  uint64_t node() const { return node_; }

  void set_node(uint64_t node) {
    has_node_ = true;
    node_ = node & 0x0000FFFFFFFFFFFFLL;
  }

  const Clock::Ptr& clock() const { return clock_; }

  void set_clock(const Clock::Ptr& clock) { clock_ = clock; }

  const RandomSource::Ptr& random() const { return random_; }

  void set_random(const RandomSource::Ptr& random) { random_ = random; }

  const HardwareAddressSource::Ptr& hardware_address_source() const {
    return hardware_address_source_;
  }

  void set_hardware_address_source(const HardwareAddressSource::Ptr& source) {
    hardware_address_source_ = source;
  }

private:
  TimeUuidGenStrategy strategy_;
  size_t queue_size_;
  bool has_node_;
  uint64_t node_;
  Clock::Ptr clock_;
  RandomSource::Ptr random_;
  HardwareAddressSource::Ptr hardware_address_source_;
};

}}} // namespace timeuuid::internal::core

EXTERNAL_TYPE(timeuuid::internal::core::Config, TimeUuidConfig)

#endif
