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

#ifndef TIMEUUID_INTERNAL_BLOCKING_QUEUE_HPP
#define TIMEUUID_INTERNAL_BLOCKING_QUEUE_HPP

#include "macros.hpp"
#include "scoped_lock.hpp"

#include <deque>
#include <stddef.h>
#include <uv.h>

namespace timeuuid { namespace internal {

/**
 * A FIFO queue that blocks producers while it's full and consumers while
 * it's empty.
 *
 * A waiting consumer counts as room for one entry, so a capacity of 0 is a
 * rendezvous: the producer blocks until a consumer is ready to take the
 * entry directly.
 */
template <typename T>
class BlockingQueue {
public:
  typedef T EntryType;

  explicit BlockingQueue(size_t capacity)
      : capacity_(capacity)
      , waiting_(0)
      , is_closed_(false) {
    uv_mutex_init(&mutex_);
    uv_cond_init(&not_empty_);
    uv_cond_init(&not_full_);
  }

  ~BlockingQueue() {
    uv_cond_destroy(&not_full_);
    uv_cond_destroy(&not_empty_);
    uv_mutex_destroy(&mutex_);
  }

  size_t capacity() const { return capacity_; }

  /**
   * Blocks until an entry would be accepted without waiting. With a single
   * producer the room stays available until that producer enqueues.
   *
   * @return false if the queue was closed.
   */
  bool wait_for_room() {
    ScopedMutex lock(&mutex_);
    while (!is_closed_ && entries_.size() >= capacity_ + waiting_) {
      uv_cond_wait(&not_full_, lock.get());
    }
    return !is_closed_;
  }

  /**
   * Blocks until there's room for the entry.
   *
   * @return false if the queue was closed; the entry is dropped.
   */
  bool enqueue(const T& data) {
    ScopedMutex lock(&mutex_);
    while (!is_closed_ && entries_.size() >= capacity_ + waiting_) {
      uv_cond_wait(&not_full_, lock.get());
    }
    if (is_closed_) return false;
    entries_.push_back(data);
    uv_cond_signal(&not_empty_);
    return true;
  }

  /**
   * Blocks until an entry is available.
   *
   * @return false if the queue was closed and has been drained.
   */
  bool dequeue(T& data) {
    ScopedMutex lock(&mutex_);
    waiting_++;
    uv_cond_signal(&not_full_);
    while (!is_closed_ && entries_.empty()) {
      uv_cond_wait(&not_empty_, lock.get());
    }
    waiting_--;
    if (entries_.empty()) return false;
    data = entries_.front();
    entries_.pop_front();
    uv_cond_signal(&not_full_);
    return true;
  }

  /**
   * Wakes all blocked producers and consumers. Entries already in the
   * queue can still be dequeued.
   */
  void close() {
    ScopedMutex lock(&mutex_);
    is_closed_ = true;
    uv_cond_broadcast(&not_full_);
    uv_cond_broadcast(&not_empty_);
  }

  bool is_closed() {
    ScopedMutex lock(&mutex_);
    return is_closed_;
  }

  size_t size() {
    ScopedMutex lock(&mutex_);
    return entries_.size();
  }

private:
  uv_mutex_t mutex_;
  uv_cond_t not_empty_;
  uv_cond_t not_full_;
  std::deque<T> entries_;
  const size_t capacity_;
  size_t waiting_;
  bool is_closed_;

private:
  DISALLOW_COPY_AND_ASSIGN(BlockingQueue);
};

}} // namespace timeuuid::internal

#endif
