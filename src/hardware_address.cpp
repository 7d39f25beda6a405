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

#include "hardware_address.hpp"

#include <uv.h>

using namespace timeuuid::internal;

int SystemHardwareAddressSource::interfaces(NetworkInterfaceVec* output) {
  uv_interface_address_t* addresses;
  int address_count;

  int rc = uv_interface_addresses(&addresses, &address_count);
  if (rc != 0) return rc;

  // libuv reports one entry per assigned address so an interface can repeat
  for (int i = 0; i < address_count; ++i) {
    const uv_interface_address_t& address = addresses[i];
    output->push_back(NetworkInterface(address.name,
                                       reinterpret_cast<const uint8_t*>(address.phys_addr),
                                       sizeof(address.phys_addr)));
  }
  uv_free_interface_addresses(addresses, address_count);

  return 0;
}
