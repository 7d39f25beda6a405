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

#ifndef TIMEUUID_INTERNAL_RANDOM_HPP
#define TIMEUUID_INTERNAL_RANDOM_HPP

#include "macros.hpp"
#include "ref_counted.hpp"

#include <stddef.h>
#include <stdint.h>

namespace timeuuid { namespace internal {

/**
 * A source of cryptographically secure random bytes.
 */
class RandomSource : public RefCounted<RandomSource> {
public:
  typedef SharedRefPtr<RandomSource> Ptr;

  RandomSource() {}
  virtual ~RandomSource() {}

  /**
   * Fill a buffer with random bytes.
   *
   * @param data The buffer to fill.
   * @param size The number of bytes to write.
   * @return true if the whole buffer was filled, false if the source is
   * unavailable. The buffer contents are unspecified on failure.
   */
  virtual bool fill(uint8_t* data, size_t size) = 0;

private:
  DISALLOW_COPY_AND_ASSIGN(RandomSource);
};

/**
 * Random bytes from OpenSSL's CSPRNG.
 */
class SecureRandomSource : public RandomSource {
public:
  virtual bool fill(uint8_t* data, size_t size);
};

}} // namespace timeuuid::internal

#endif
