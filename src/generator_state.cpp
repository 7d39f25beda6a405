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

#include "generator_state.hpp"

#include "logger.hpp"

#include <string.h>
#include <uv.h>

using namespace timeuuid::internal;
using namespace timeuuid::internal::core;

static bool is_hardware_address(const std::vector<uint8_t>& address) {
  if (address.size() < NODE_LENGTH) return false;
  // Loopback and tunnel interfaces report an all zero address
  for (size_t i = 0; i < NODE_LENGTH; ++i) {
    if (address[i] != 0) return true;
  }
  return false;
}

TimeUuidError timeuuid::internal::core::initialize_clock_seq(RandomSource* random,
                                                             uint16_t* output) {
  uint8_t buf[2];
  if (!random->fill(buf, sizeof(buf))) {
    LOG_CRITICAL("Unable to initialize the clock sequence");
    return TIMEUUID_ERROR_LIB_UNABLE_TO_INIT;
  }
  *output = static_cast<uint16_t>((buf[0] << 8) | buf[1]);
  return TIMEUUID_OK;
}

TimeUuidError timeuuid::internal::core::initialize_node(RandomSource* random,
                                                        HardwareAddressSource* source,
                                                        uint8_t* output) {
  NetworkInterfaceVec interfaces;
  int rc = source->interfaces(&interfaces);
  if (rc != 0) {
    LOG_WARN("Unable to enumerate network interfaces: %s", uv_strerror(rc));
  } else {
    for (NetworkInterfaceVec::const_iterator it = interfaces.begin(), end = interfaces.end();
         it != end; ++it) {
      if (is_hardware_address(it->hardware_address)) {
        memcpy(output, &it->hardware_address[0], NODE_LENGTH);
        LOG_DEBUG("Using the hardware address of interface '%s' as the node", it->name.c_str());
        return TIMEUUID_OK;
      }
    }
  }

  LOG_INFO("Unable to find a hardware address for this node. Generating a random node value.");
  if (!random->fill(output, NODE_LENGTH)) {
    LOG_CRITICAL("Unable to generate a random node value");
    return TIMEUUID_ERROR_LIB_UNABLE_TO_INIT;
  }
  output[0] |= 0x01; // Multicast bit

  return TIMEUUID_OK;
}

GeneratorState::GeneratorState()
    : clock_seq_(0)
    , last_timestamp_(0) {
  memset(node_, 0, sizeof(node_));
}

TimeUuidError GeneratorState::init(const Config& config) {
  TimeUuidError rc = initialize_clock_seq(config.random().get(), &clock_seq_);
  if (rc != TIMEUUID_OK) return rc;

  if (config.has_node()) {
    uint64_t node = config.node();
    for (int i = 0; i < NODE_LENGTH; ++i) {
      node_[i] = static_cast<uint8_t>(node >> ((NODE_LENGTH - 1 - i) * 8));
    }
    return TIMEUUID_OK;
  }

  return initialize_node(config.random().get(), config.hardware_address_source().get(), node_);
}

Uuid GeneratorState::next(uint64_t timestamp) {
  if (timestamp <= last_timestamp_) {
    if (timestamp < last_timestamp_) {
      LOG_WARN("Clock regression detected. The current time (%llu) is %llu "
               "intervals behind the last generated timestamp (%llu). "
               "The clock sequence will be incremented to keep UUIDs unique.",
               static_cast<unsigned long long>(timestamp),
               static_cast<unsigned long long>(last_timestamp_ - timestamp),
               static_cast<unsigned long long>(last_timestamp_));
    }
    ++clock_seq_;
  }
  last_timestamp_ = timestamp;

  return Uuid::encode(timestamp, clock_seq_, node_);
}
