/*
 * threads/pool.h
 * -------------------------------------------------------------------------
 * Pool of request worker threads.
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

#ifndef S3STREAM_THREADS_POOL_H
#define S3STREAM_THREADS_POOL_H

#include <list>
#include <memory>
#include <string>

#include "threads/work_queue.h"

namespace s3stream {
namespace base {
class RequestFactory;
}

namespace threads {
class RequestWorker;

// A fixed set of request workers sharing one queue. Each transfer owns its
// own pool, sized to its concurrency. Destroying the pool drops any items
// still queued (their callbacks never run) and joins the workers, so owners
// must wait for outstanding items first.
class Pool {
 public:
  Pool(const std::string &id, int num_workers,
       const base::RequestFactory *factory);
  ~Pool();

  inline const std::string &id() const { return id_; }

  // |callback| runs on the worker, after |function|.
  void Post(WorkQueue::Function function, WorkQueue::Callback callback);

  // Runs |function| on a worker and waits for its result.
  int Call(WorkQueue::Function function);

 private:
  std::string id_;
  WorkQueue queue_;
  std::list<std::unique_ptr<RequestWorker>> workers_;
};
}  // namespace threads
}  // namespace s3stream

#endif
