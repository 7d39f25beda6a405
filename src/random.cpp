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

#include "random.hpp"

#include "logger.hpp"

#include <limits.h>
#include <openssl/err.h>
#include <openssl/rand.h>

using namespace timeuuid::internal;

static void random_log_errors(const char* context) {
  const char* data;
  int flags;
  unsigned long err;
  while ((err =
#if (OPENSSL_VERSION_NUMBER >= 0x30000000L)
              ERR_get_error_all(NULL, NULL, NULL, &data, &flags)
#else
              ERR_get_error_line_data(NULL, NULL, &data, &flags)
#endif
              ) != 0) {
    char buf[256];
    ERR_error_string_n(err, buf, sizeof(buf));
    LOG_CRITICAL("%s: %s:%s", context, buf, (flags & ERR_TXT_STRING) ? data : "");
  }
}

bool SecureRandomSource::fill(uint8_t* data, size_t size) {
  if (size > static_cast<size_t>(INT_MAX)) {
    LOG_CRITICAL("Unable to generate %u random bytes in a single request",
                 static_cast<unsigned int>(size));
    return false;
  }

  if (RAND_bytes(data, static_cast<int>(size)) != 1) {
    LOG_CRITICAL("Secure random source is unavailable");
    random_log_errors("Unable to generate random data");
    return false;
  }
  return true;
}
