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

#ifndef TIMEUUID_INTERNAL_SERIALIZATION_HPP
#define TIMEUUID_INTERNAL_SERIALIZATION_HPP

#include <stdint.h>

namespace timeuuid { namespace internal {

// Big-endian (network byte order) helpers

inline uint8_t* encode_uint16(uint8_t* output, uint16_t value) {
  output[0] = static_cast<uint8_t>(value >> 8);
  output[1] = static_cast<uint8_t>(value >> 0);
  return output + sizeof(uint16_t);
}

inline const uint8_t* decode_uint16(const uint8_t* input, uint16_t& output) {
  output = static_cast<uint16_t>((static_cast<uint16_t>(input[1]) << 0) |
                                 (static_cast<uint16_t>(input[0]) << 8));
  return input + sizeof(uint16_t);
}

inline uint8_t* encode_uint32(uint8_t* output, uint32_t value) {
  output[0] = static_cast<uint8_t>(value >> 24);
  output[1] = static_cast<uint8_t>(value >> 16);
  output[2] = static_cast<uint8_t>(value >> 8);
  output[3] = static_cast<uint8_t>(value >> 0);
  return output + sizeof(uint32_t);
}

inline const uint8_t* decode_uint32(const uint8_t* input, uint32_t& output) {
  output = (static_cast<uint32_t>(input[3]) << 0) | (static_cast<uint32_t>(input[2]) << 8) |
           (static_cast<uint32_t>(input[1]) << 16) | (static_cast<uint32_t>(input[0]) << 24);
  return input + sizeof(uint32_t);
}

}} // namespace timeuuid::internal

#endif
