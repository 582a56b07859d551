/*
 * threads/parallel_work_queue.h
 * -------------------------------------------------------------------------
 * Processes parts of a transfer in parallel, with retries and a bound on
 * parts in progress.
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

#ifndef S3STREAM_THREADS_PARALLEL_WORK_QUEUE_H
#define S3STREAM_THREADS_PARALLEL_WORK_QUEUE_H

#include <errno.h>

#include <algorithm>
#include <condition_variable>
#include <functional>
#include <mutex>

#include "base/logger.h"
#include "threads/pool.h"

namespace s3stream {
namespace base {
class Request;
}

namespace threads {
inline bool IsRetryableError(int r) { return r == -EAGAIN || r == -ETIMEDOUT; }

// Runs a single request on |pool|, repeating it while it fails with a
// retryable error, at most |max_retries| times.
inline int CallWithRetries(Pool *pool, const WorkQueue::Function &fn,
                           int max_retries) {
  int r = pool->Call(fn);

  for (int retry = 0; IsRetryableError(r) && retry < max_retries; retry++) {
    S3STREAM_LOG(LOG_DEBUG, "CallWithRetries",
                 "[%s] retry %i after status %i.\n", pool->id().c_str(),
                 retry + 1, r);
    r = pool->Call(fn);
  }

  return r;
}

// Feeds parts to a pool, keeping at most |max_parts_in_progress| of them
// holding a slot at once. A part whose processing fails with -EAGAIN or
// -ETIMEDOUT is retried (with |on_retry_part|) up to |max_retries| times; any
// other failure, or running out of retries, stores the error and stops the
// queue from accepting new parts. Only the first error is kept.
//
// With SlotRelease::ON_COMPLETION a part gives up its slot as soon as it
// finishes. With SlotRelease::EXPLICIT a successful part keeps its slot until
// Release() is called, which lets a consumer count parts that are done but not
// yet consumed against the same limit.
//
// |on_part_done| runs on a worker thread once per posted part, after its last
// attempt, with the part's final status. It must not call back into the queue.
template <class Part>
class ParallelWorkQueue {
 public:
  using ProcessPartCallback = std::function<int(base::Request *, Part *)>;
  using RetryPartCallback = std::function<int(base::Request *, Part *)>;
  using PartDoneCallback = std::function<void(Part *, int)>;

  enum class SlotRelease { ON_COMPLETION, EXPLICIT };

  inline ParallelWorkQueue(Pool *pool,
                           const ProcessPartCallback &on_process_part,
                           const RetryPartCallback &on_retry_part,
                           const PartDoneCallback &on_part_done,
                           int max_retries, size_t max_parts_in_progress,
                           SlotRelease slot_release)
      : pool_(pool),
        on_process_part_(on_process_part),
        on_retry_part_(on_retry_part),
        on_part_done_(on_part_done),
        max_retries_(max_retries),
        max_parts_in_progress_(std::max<size_t>(max_parts_in_progress, 1)),
        slot_release_(slot_release) {}

  inline ~ParallelWorkQueue() {
    Abort(-ECANCELED);
    Wait();
  }

  ParallelWorkQueue(const ParallelWorkQueue &) = delete;
  ParallelWorkQueue &operator=(const ParallelWorkQueue &) = delete;

  // Blocks until a slot is free. Returns 0 once |part| has been handed to the
  // pool, or the stored error if the queue failed or was aborted (in which
  // case |part| is not processed and |on_part_done| is not called).
  int Post(Part *part) {
    std::unique_lock<std::mutex> lock(mutex_);

    while (error_ == 0 && slots_in_use_ >= max_parts_in_progress_)
      condition_.wait(lock);

    if (error_) return error_;

    slots_in_use_++;
    parts_running_++;
    max_observed_in_progress_ =
        std::max(max_observed_in_progress_, slots_in_use_);

    PostAttempt(part, 0);
    return 0;
  }

  // Frees the slot held by a completed part (SlotRelease::EXPLICIT only).
  void Release() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (slots_in_use_ > 0) slots_in_use_--;
    condition_.notify_all();
  }

  // Stores |r| unless an error was already stored, and stops accepting parts.
  void Abort(int r) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (error_ == 0) error_ = r;
    condition_.notify_all();
  }

  // Waits until no part is being processed, and returns the stored error.
  int Wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (parts_running_ > 0) condition_.wait(lock);
    return error_;
  }

  int error() {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_;
  }

  size_t max_observed_in_progress() {
    std::lock_guard<std::mutex> lock(mutex_);
    return max_observed_in_progress_;
  }

  int retries() {
    std::lock_guard<std::mutex> lock(mutex_);
    return retries_;
  }

 private:
  // Must be called with mutex_ held.
  void PostAttempt(Part *part, int retry_count) {
    const ProcessPartCallback &fn =
        (retry_count == 0) ? on_process_part_ : on_retry_part_;

    pool_->Post(
        [this, part, &fn](base::Request *req) {
          // don't bother sending anything once the transfer has failed
          if (error()) return -ECANCELED;
          return fn(req, part);
        },
        [this, part, retry_count](int r) {
          OnAttemptDone(part, retry_count, r);
        });
  }

  void OnAttemptDone(Part *part, int retry_count, int r) {
    if (IsRetryableError(r)) {
      std::lock_guard<std::mutex> lock(mutex_);

      if (error_ == 0 && retry_count < max_retries_) {
        S3STREAM_LOG(LOG_DEBUG, "ParallelWorkQueue::OnAttemptDone",
                     "[%s] retrying part after status %i (retry %i of %i).\n",
                     pool_->id().c_str(), r, retry_count + 1, max_retries_);
        retries_++;
        PostAttempt(part, retry_count + 1);
        return;
      }
    }

    if (r) {
      std::lock_guard<std::mutex> lock(mutex_);

      if (error_ == 0) {
        S3STREAM_LOG(LOG_WARNING, "ParallelWorkQueue::OnAttemptDone",
                     "[%s] part failed with status %i.\n", pool_->id().c_str(),
                     r);
        error_ = r;
      } else if (r != -ECANCELED) {
        S3STREAM_LOG(LOG_DEBUG, "ParallelWorkQueue::OnAttemptDone",
                     "[%s] discarding status %i, already failed with %i.\n",
                     pool_->id().c_str(), r, error_);
      }

      condition_.notify_all();
    }

    if (on_part_done_) on_part_done_(part, r);

    std::lock_guard<std::mutex> lock(mutex_);
    parts_running_--;
    if (r || slot_release_ == SlotRelease::ON_COMPLETION) slots_in_use_--;
    condition_.notify_all();
  }

  Pool *const pool_;

  const ProcessPartCallback on_process_part_;
  const RetryPartCallback on_retry_part_;
  const PartDoneCallback on_part_done_;

  const int max_retries_;
  const size_t max_parts_in_progress_;
  const SlotRelease slot_release_;

  std::mutex mutex_;
  std::condition_variable condition_;

  size_t slots_in_use_ = 0;
  size_t parts_running_ = 0;
  size_t max_observed_in_progress_ = 0;
  int retries_ = 0;
  int error_ = 0;
};
}  // namespace threads
}  // namespace s3stream

#endif
