/*
 * threads/work_queue.h
 * -------------------------------------------------------------------------
 * Queue of request functions shared by the workers of a pool.
 * -------------------------------------------------------------------------
 *
 * Copyright (c) 2012, Tarick Bedeir.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#ifndef S3STREAM_THREADS_WORK_QUEUE_H
#define S3STREAM_THREADS_WORK_QUEUE_H

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>

namespace s3stream {
namespace base {
class Request;
}

namespace threads {
class WorkQueue {
 public:
  using Function = std::function<int(base::Request *)>;
  using Callback = std::function<void(int)>;

  struct Item {
    Function function;
    Callback callback;
  };

  WorkQueue() = default;

  WorkQueue(const WorkQueue &) = delete;
  WorkQueue &operator=(const WorkQueue &) = delete;

  // Ignored once the queue is closed.
  void Post(Function function, Callback callback);

  // Blocks until an item is available and moves it into |item|. Returns false
  // once the queue is closed.
  bool Take(Item *item);

  // Wakes every worker blocked in Take(). Items not yet taken are dropped
  // without their callbacks running; returns how many there were.
  size_t Close();

  // Runs |item| with |req| and passes the result to its callback. A
  // base::TransportError becomes its error code, and any other exception
  // becomes -EIO.
  static void Run(const Item &item, base::Request *req);

 private:
  std::mutex mutex_;
  std::condition_variable condition_;
  std::deque<Item> items_;
  bool closed_ = false;
};
}  // namespace threads
}  // namespace s3stream

#endif
