/*
 * threads/pool.cc
 * -------------------------------------------------------------------------
 * Implements a pool of worker threads.
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

#include "threads/pool.h"

#include <future>
#include <stdexcept>

#include "base/logger.h"
#include "threads/request_worker.h"

namespace s3stream {
namespace threads {

Pool::Pool(const std::string &id, int num_workers,
           const base::RequestFactory *factory)
    : id_(id) {
  if (num_workers < 1)
    throw std::runtime_error("a pool needs at least one worker.");

  try {
    for (int i = 0; i < num_workers; i++)
      workers_.push_back(RequestWorker::Create(&queue_, factory));
  } catch (...) {
    // workers already running have to be stopped before they're destroyed
    queue_.Close();
    workers_.clear();
    throw;
  }

  S3STREAM_LOG(LOG_DEBUG, "Pool::Pool", "[%s] started %i workers.\n",
               id_.c_str(), num_workers);
}

Pool::~Pool() {
  const size_t dropped = queue_.Close();
  workers_.clear();

  if (dropped)
    S3STREAM_LOG(LOG_DEBUG, "Pool::~Pool", "[%s] dropped %zu queued items.\n",
                 id_.c_str(), dropped);
}

void Pool::Post(WorkQueue::Function function, WorkQueue::Callback callback) {
  queue_.Post(std::move(function), std::move(callback));
}

int Pool::Call(WorkQueue::Function function) {
  // shared, since the worker may still be inside set_value() when get()
  // returns here
  auto result = std::make_shared<std::promise<int>>();
  std::future<int> done = result->get_future();

  Post(std::move(function), [result](int r) { result->set_value(r); });
  return done.get();
}

}  // namespace threads
}  // namespace s3stream
