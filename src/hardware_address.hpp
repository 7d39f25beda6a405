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

#ifndef TIMEUUID_INTERNAL_HARDWARE_ADDRESS_HPP
#define TIMEUUID_INTERNAL_HARDWARE_ADDRESS_HPP

#include "macros.hpp"
#include "ref_counted.hpp"

#include <stdint.h>
#include <string>
#include <vector>

namespace timeuuid { namespace internal {

struct NetworkInterface {
  NetworkInterface() {}
  NetworkInterface(const std::string& name, const uint8_t* address, size_t length)
      : name(name)
      , hardware_address(address, address + length) {}

  std::string name;
  std::vector<uint8_t> hardware_address;
};

typedef std::vector<NetworkInterface> NetworkInterfaceVec;

/**
 * Enumerates the network interfaces of the machine.
 */
class HardwareAddressSource : public RefCounted<HardwareAddressSource> {
public:
  typedef SharedRefPtr<HardwareAddressSource> Ptr;

  HardwareAddressSource() {}
  virtual ~HardwareAddressSource() {}

  /**
   * @param output Receives the interfaces in the order reported by the platform.
   * @return 0 on success, otherwise a libuv error code.
   */
  virtual int interfaces(NetworkInterfaceVec* output) = 0;

private:
  DISALLOW_COPY_AND_ASSIGN(HardwareAddressSource);
};

class SystemHardwareAddressSource : public HardwareAddressSource {
public:
  virtual int interfaces(NetworkInterfaceVec* output);
};

}} // namespace timeuuid::internal

#endif
