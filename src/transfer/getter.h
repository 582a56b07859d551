/*
 * transfer/getter.h
 * -------------------------------------------------------------------------
 * Parallel, ordered download of one object.
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

#ifndef S3STREAM_TRANSFER_GETTER_H
#define S3STREAM_TRANSFER_GETTER_H

#include <sys/types.h>

#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "base/request.h"
#include "base/request_hook.h"
#include "crypto/md5.h"
#include "threads/parallel_work_queue.h"
#include "transfer/transfer_config.h"

namespace s3stream {
namespace base {
class HttpClient;
}

namespace threads {
class Pool;
}

namespace transfer {
// Downloads an object with many concurrent ranged GETs and hands the result
// back as one ordered stream. At most |concurrency| parts are either in flight
// or downloaded but not yet read.
class Getter {
 public:
  // Sends a HEAD for |url|, returns its response headers in |headers| (if
  // non-null), and starts fetching the first parts. |digest_url| locates the
  // stored MD5 of the object. Returns 0, -ENOENT if there is no such object,
  // or another negative error.
  static int Open(const std::string &url, const std::string &digest_url,
                  std::unique_ptr<base::RequestHook> hook,
                  const TransferConfig &config, std::unique_ptr<Getter> *getter,
                  base::HeaderMap *headers);

  ~Getter();

  Getter(const Getter &) = delete;
  Getter &operator=(const Getter &) = delete;

  // Copies up to |size| bytes into |buffer|, blocking until at least one byte
  // is available. Returns the number of bytes copied, 0 at the end of the
  // object (once its checksum has been verified), or a negative error.
  ssize_t Read(char *buffer, size_t size);

  // Stops all outstanding requests. Safe to call from another thread while a
  // Read() is blocked, and more than once. Returns 0 if the whole object was
  // read and verified, -ECANCELED if it was closed early, or the error that
  // ended the transfer.
  int Close();

  // Number of |part_size| parts needed to cover |length| bytes.
  static size_t GetPartCount(int64_t length, int64_t part_size);

  inline int64_t content_length() const { return content_length_; }

  uint64_t bytes_read();

  // Hex MD5 of the bytes read so far.
  std::string md5();

 private:
  struct Part {
    size_t index = 0;
    int64_t offset = 0;
    size_t size = 0;
    bool done = false;
    size_t read_offset = 0;
    std::vector<char> data;
  };

  using Queue = threads::ParallelWorkQueue<Part>;

  Getter(const std::string &url, const std::string &digest_url,
         std::unique_ptr<base::RequestHook> hook, const TransferConfig &config);

  int Init(base::HeaderMap *headers);
  int FetchHeaders(base::Request *req, base::HeaderMap *headers);

  // Must be called with mutex_ held.
  int PostNextPart();

  int DownloadPart(base::Request *req, Part *part);
  void OnPartDone(Part *part, int r);

  int Finish();
  int VerifyDigest();

  const std::string url_, digest_url_;
  const TransferConfig config_;

  std::unique_ptr<base::RequestHook> hook_;
  std::unique_ptr<base::HttpClient> owned_client_;
  std::unique_ptr<base::RequestFactory> factory_;
  std::unique_ptr<threads::Pool> pool_;

  int64_t content_length_ = 0;
  size_t part_count_ = 0;

  std::mutex mutex_;
  std::condition_variable condition_;

  // reorder buffer, keyed by part index
  std::map<size_t, std::unique_ptr<Part>> parts_;
  size_t next_post_ = 0, next_read_ = 0;
  uint64_t bytes_read_ = 0;
  crypto::Md5Stream md5_;

  bool verifying_ = false, finished_ = false, closed_ = false;
  int final_status_ = 0, close_status_ = 0;

  std::unique_ptr<Queue> queue_;
};
}  // namespace transfer
}  // namespace s3stream

#endif
