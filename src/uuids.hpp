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

#ifndef TIMEUUID_INTERNAL_UUIDS_HPP
#define TIMEUUID_INTERNAL_UUIDS_HPP

#include "blocking_queue.hpp"
#include "clock.hpp"
#include "config.hpp"
#include "external.hpp"
#include "generator_state.hpp"
#include "macros.hpp"
#include "ref_counted.hpp"
#include "timeuuid.h"
#include "uuid.hpp"

#include <uv.h>

namespace timeuuid { namespace internal { namespace core {

class UuidGen : public RefCounted<UuidGen> {
public:
  typedef SharedRefPtr<UuidGen> Ptr;

  enum Type { MUTEX, QUEUE };

  /**
   * Create and initialize a generator for the configured strategy.
   *
   * @param config
   * @param output The generator. Only set on success.
   * @return TIMEUUID_OK if successful, otherwise initialization failed and
   * no generator was created.
   */
  static TimeUuidError create(const Config& config, Ptr* output);

  virtual ~UuidGen() {}

  Type type() const { return type_; }

  virtual Uuid next() = 0;

protected:
  UuidGen(Type type, const Clock::Ptr& clock)
      : type_(type)
      , clock_(clock) {}

  virtual TimeUuidError init(const Config& config) = 0;

  Type type_;
  Clock::Ptr clock_;

private:
  DISALLOW_COPY_AND_ASSIGN(UuidGen);
};

/**
 * Every caller computes its own UUID while holding the lock on the state.
 */
class MutexUuidGen : public UuidGen {
public:
  MutexUuidGen(const Clock::Ptr& clock);
  ~MutexUuidGen();

  virtual Uuid next();

protected:
  virtual TimeUuidError init(const Config& config);

private:
  uv_mutex_t mutex_;
  GeneratorState state_;
};

/**
 * A dedicated producer thread owns the state without a lock and hands
 * UUIDs to callers through a blocking queue. Releasing the generator
 * closes the queue and joins the producer.
 */
class QueueUuidGen : public UuidGen {
public:
  QueueUuidGen(const Clock::Ptr& clock, size_t queue_size);
  ~QueueUuidGen();

  virtual Uuid next();

  size_t queue_size() const { return queue_.capacity(); }

protected:
  virtual TimeUuidError init(const Config& config);

private:
  static void on_run(void* data);
  void produce();
  void close_and_join();

private:
  BlockingQueue<Uuid> queue_;
  GeneratorState state_;
  uv_thread_t thread_;
  bool is_joinable_;
};

}}} // namespace timeuuid::internal::core

EXTERNAL_TYPE(timeuuid::internal::core::UuidGen, TimeUuidGen)

#endif
