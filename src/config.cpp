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

#include "config.hpp"

using namespace timeuuid::internal::core;

extern "C" {

TimeUuidConfig* timeuuid_config_new() { return TimeUuidConfig::to(new Config()); }

void timeuuid_config_free(TimeUuidConfig* config) { delete config->from(); }

TimeUuidError timeuuid_config_set_strategy(TimeUuidConfig* config,
                                           TimeUuidGenStrategy strategy) {
  if (config == NULL) {
    return TIMEUUID_ERROR_LIB_BAD_PARAMS;
  }

  switch (strategy) {
    case TIMEUUID_GEN_STRATEGY_MUTEX:
    case TIMEUUID_GEN_STRATEGY_QUEUE:
      config->set_strategy(strategy);
      return TIMEUUID_OK;
    default:
      return TIMEUUID_ERROR_LIB_BAD_PARAMS;
  }
}

TimeUuidError timeuuid_config_set_queue_size(TimeUuidConfig* config, size_t queue_size) {
  if (config == NULL) {
    return TIMEUUID_ERROR_LIB_BAD_PARAMS;
  }
  config->set_queue_size(queue_size);
  return TIMEUUID_OK;
}

TimeUuidError timeuuid_config_set_node(TimeUuidConfig* config, timeuuid_uint64_t node) {
  if (config == NULL) {
    return TIMEUUID_ERROR_LIB_BAD_PARAMS;
  }
  config->set_node(node);
  return TIMEUUID_OK;
}

} // extern "C"
