/*
 * threads/request_worker.h
 * -------------------------------------------------------------------------
 * Worker thread that owns a request object.
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

#ifndef S3STREAM_THREADS_REQUEST_WORKER_H
#define S3STREAM_THREADS_REQUEST_WORKER_H

#include <memory>
#include <thread>

namespace s3stream {
namespace base {
class Request;
class RequestFactory;
}  // namespace base

namespace threads {
class WorkQueue;

// A thread that runs work items from a queue, handing each one the same
// request object (and so the same connection).
class RequestWorker {
 public:
  static std::unique_ptr<RequestWorker> Create(
      WorkQueue *queue, const base::RequestFactory *factory);

  ~RequestWorker();

 private:
  RequestWorker(WorkQueue *queue, std::unique_ptr<base::Request> request);

  void Work();

  std::unique_ptr<base::Request> request_;
  WorkQueue *queue_ = nullptr;
  std::thread thread_;
};
}  // namespace threads
}  // namespace s3stream

#endif
