/*
 * threads/work_queue.cc
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

#include "threads/work_queue.h"

#include <errno.h>

#include <stdexcept>

#include "base/logger.h"
#include "base/transport.h"

namespace s3stream {
namespace threads {

void WorkQueue::Post(Function function, Callback callback) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (closed_) return;

  items_.push_back({std::move(function), std::move(callback)});
  condition_.notify_one();
}

bool WorkQueue::Take(Item *item) {
  std::unique_lock<std::mutex> lock(mutex_);

  condition_.wait(lock, [this]() { return closed_ || !items_.empty(); });
  if (closed_) return false;

  *item = std::move(items_.front());
  items_.pop_front();
  return true;
}

size_t WorkQueue::Close() {
  std::lock_guard<std::mutex> lock(mutex_);
  const size_t dropped = items_.size();

  closed_ = true;
  items_.clear();
  condition_.notify_all();

  return dropped;
}

void WorkQueue::Run(const Item &item, base::Request *req) {
  int r;

  try {
    r = item.function(req);
  } catch (const base::TransportError &e) {
    S3STREAM_LOG(LOG_DEBUG, "WorkQueue::Run", "transport error: %s\n",
                 e.what());
    r = e.error_code();
  } catch (const std::exception &e) {
    S3STREAM_LOG(LOG_WARNING, "WorkQueue::Run", "caught exception: %s\n",
                 e.what());
    r = -EIO;
  }

  if (item.callback) item.callback(r);
}

}  // namespace threads
}  // namespace s3stream
