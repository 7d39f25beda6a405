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

#include "uuid.hpp"

#include "clock.hpp"
#include "serialization.hpp"

using namespace timeuuid::internal;
using namespace timeuuid::internal::core;

static uint64_t to_milliseconds(uint64_t timestamp) { return timestamp / 10000L; }

extern "C" {

void timeuuid_set_version(TimeUuid* uuid, timeuuid_uint8_t version) {
  Uuid temp(*uuid);
  temp.set_version(version);
  temp.to(uuid);
}

void timeuuid_set_variant(TimeUuid* uuid) {
  Uuid temp(*uuid);
  temp.set_variant();
  temp.to(uuid);
}

timeuuid_uint8_t timeuuid_version(TimeUuid uuid) { return Uuid(uuid).version(); }

timeuuid_uint64_t timeuuid_timestamp(TimeUuid uuid) {
  return to_milliseconds(Uuid(uuid).timestamp() - TIME_OFFSET_BETWEEN_UTC_AND_EPOCH);
}

timeuuid_uint16_t timeuuid_clock_seq(TimeUuid uuid) { return Uuid(uuid).clock_seq(); }

void timeuuid_string(TimeUuid uuid, char* output) { Uuid(uuid).to_string(output); }

} // extern "C"

Uuid Uuid::encode(uint64_t timestamp, uint16_t clock_seq, const uint8_t* node) {
  Uuid uuid;
  uint8_t* pos = uuid.bytes_;
  pos = encode_uint32(pos, static_cast<uint32_t>(timestamp));
  pos = encode_uint16(pos, static_cast<uint16_t>(timestamp >> 32));
  pos = encode_uint16(pos, static_cast<uint16_t>(timestamp >> 48));
  pos = encode_uint16(pos, clock_seq);
  memcpy(pos, node, NODE_LENGTH);

  uuid.set_version(UUID_VERSION_TIME_BASED);
  uuid.set_variant();
  return uuid;
}

uint64_t Uuid::timestamp() const {
  uint32_t time_low;
  uint16_t time_mid;
  uint16_t time_hi_and_version;

  const uint8_t* pos = bytes_;
  pos = decode_uint32(pos, time_low);
  pos = decode_uint16(pos, time_mid);
  decode_uint16(pos, time_hi_and_version);

  return (static_cast<uint64_t>(time_hi_and_version & 0x0FFF) << 48) |
         (static_cast<uint64_t>(time_mid) << 32) | static_cast<uint64_t>(time_low);
}

bool Uuid::is_nil() const {
  for (size_t i = 0; i < sizeof(bytes_); ++i) {
    if (bytes_[i] != 0) return false;
  }
  return true;
}

void Uuid::to_string(char* output) const {
  static const char half_byte_to_hex[] = { '0', '1', '2', '3', '4', '5', '6', '7',
                                           '8', '9', 'a', 'b', 'c', 'd', 'e', 'f' };
  size_t pos = 0;
  for (size_t i = 0; i < sizeof(bytes_); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      output[pos++] = '-';
    }
    uint8_t byte = bytes_[i];
    output[pos++] = half_byte_to_hex[(byte >> 4) & 0x0F];
    output[pos++] = half_byte_to_hex[byte & 0x0F];
  }
  output[pos] = '\0';
}

std::string Uuid::to_string() const {
  char buf[TIMEUUID_STRING_LENGTH];
  to_string(buf);
  return std::string(buf);
}
