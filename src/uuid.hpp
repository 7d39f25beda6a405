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

#ifndef TIMEUUID_INTERNAL_UUID_HPP
#define TIMEUUID_INTERNAL_UUID_HPP

#include "timeuuid.h"

#include <stdint.h>
#include <string.h>
#include <string>

#define UUID_VERSION_TIME_BASED 1
#define NODE_LENGTH 6

namespace timeuuid { namespace internal { namespace core {

/**
 * A 16 byte RFC 4122 UUID in network byte order.
 */
class Uuid {
public:
  Uuid() { memset(bytes_, 0, sizeof(bytes_)); }

  explicit Uuid(const TimeUuid& uuid) { memcpy(bytes_, uuid.bytes, sizeof(bytes_)); }

  /**
   * Lay out a version 1 UUID.
   *
   * @param timestamp 100 nanosecond intervals since the UUID epoch.
   * @param clock_seq The clock sequence. The top two bits are replaced by
   * the variant.
   * @param node A 6 byte node.
   */
  static Uuid encode(uint64_t timestamp, uint16_t clock_seq, const uint8_t* node);

  void set_version(uint8_t version) {
    bytes_[6] = static_cast<uint8_t>((bytes_[6] & 0x0F) | (version << 4));
  }

  // RFC 4122 variant: 10xx xxxx
  void set_variant() { bytes_[8] = static_cast<uint8_t>((bytes_[8] & 0xBF) | 0x80); }

  uint8_t version() const { return static_cast<uint8_t>(bytes_[6] >> 4); }
  uint8_t variant() const { return static_cast<uint8_t>(bytes_[8] >> 6); }

  // 60 bit timestamp with the version removed
  uint64_t timestamp() const;

  // 14 bit clock sequence with the variant removed
  uint16_t clock_seq() const {
    return static_cast<uint16_t>(((bytes_[8] & 0x3F) << 8) | bytes_[9]);
  }

  const uint8_t* node() const { return bytes_ + 10; }
  const uint8_t* data() const { return bytes_; }

  bool is_nil() const;

  /**
   * Format as xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx (lowercase).
   *
   * @param output A buffer of at least TIMEUUID_STRING_LENGTH bytes.
   */
  void to_string(char* output) const;
  std::string to_string() const;

  void to(TimeUuid* output) const { memcpy(output->bytes, bytes_, sizeof(bytes_)); }

  bool operator==(const Uuid& other) const {
    return memcmp(bytes_, other.bytes_, sizeof(bytes_)) == 0;
  }
  bool operator!=(const Uuid& other) const { return !(*this == other); }
  bool operator<(const Uuid& other) const {
    return memcmp(bytes_, other.bytes_, sizeof(bytes_)) < 0;
  }

private:
  uint8_t bytes_[TIMEUUID_LENGTH];
};

}}} // namespace timeuuid::internal::core

#endif
