/*
 * transfer/putter.h
 * -------------------------------------------------------------------------
 * Parallel multipart upload of one object.
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

#ifndef S3STREAM_TRANSFER_PUTTER_H
#define S3STREAM_TRANSFER_PUTTER_H

#include <sys/types.h>

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "base/request.h"
#include "base/request_hook.h"
#include "crypto/hex.h"
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
// Uploads a stream as a multipart upload, sending up to |concurrency| parts at
// once. Nothing becomes visible at the destination unless Close() succeeds.
class Putter {
 public:
  static constexpr int64_t MAX_PART_SIZE = 5LL * 1024 * 1024 * 1024;

  // Starts a multipart upload to |url|, sending |headers| (content type,
  // metadata) with the request that creates it. |digest_url| is where the MD5
  // of the object is stored once the upload completes.
  static int Open(const std::string &url, const std::string &digest_url,
                  const base::HeaderMap &headers,
                  std::unique_ptr<base::RequestHook> hook,
                  const TransferConfig &config,
                  std::unique_ptr<Putter> *putter);

  // Abandons the upload if Close() was never called.
  ~Putter();

  Putter(const Putter &) = delete;
  Putter &operator=(const Putter &) = delete;

  // Accepts all of |data|, blocking while |concurrency| parts are in flight.
  // Returns |size|, or the error that ended the transfer.
  ssize_t Write(const char *data, size_t size);

  // Sends the last part, waits for every part, and completes the upload (or
  // aborts it if anything failed). A second call returns -EBADF.
  int Close();

  // Size of the part at |index|: |initial_size| doubled once for every
  // |growth_interval| parts before it, capped at MAX_PART_SIZE.
  static int64_t GetPartSize(int64_t initial_size, int growth_interval,
                             size_t index);

  inline const std::string &upload_id() const { return upload_id_; }
  inline uint64_t bytes_written() const { return bytes_written_; }
  inline const std::string &etag() const { return etag_; }

  // Hex MD5 of the bytes written so far.
  inline std::string md5() const { return md5_.Finish<crypto::Hex>(); }

 private:
  struct Part {
    size_t index = 0;
    std::vector<char> data;
    crypto::Md5::Digest md5;
    std::string etag;
  };

  using Queue = threads::ParallelWorkQueue<Part>;

  Putter(const std::string &url, const std::string &digest_url,
         std::unique_ptr<base::RequestHook> hook, const TransferConfig &config);

  int Init(const base::HeaderMap &headers);
  int InitiateUpload(base::Request *req, const base::HeaderMap &headers);

  int StartPart();
  int FlushPart();

  int UploadPart(base::Request *req, Part *part);
  void OnPartDone(Part *part, int r);

  int Complete();
  int CompleteUpload(base::Request *req, const std::string &body);
  int VerifyEtag();
  void AbortUpload();
  int SendAbort(base::Request *req);

  const std::string url_, digest_url_;
  const TransferConfig config_;

  std::unique_ptr<base::RequestHook> hook_;
  std::unique_ptr<base::HttpClient> owned_client_;
  std::unique_ptr<base::RequestFactory> factory_;
  std::unique_ptr<threads::Pool> pool_;

  std::string upload_id_, etag_;
  bool closed_ = false, aborted_ = false;

  // only touched by the writing thread
  std::unique_ptr<Part> current_;
  size_t next_part_index_ = 0;
  uint64_t bytes_written_ = 0;
  crypto::Md5Stream md5_;

  // parts handed to the queue, and the entity tags of those that completed
  std::mutex mutex_;
  std::map<size_t, std::unique_ptr<Part>> parts_;
  std::map<size_t, std::string> etags_;

  std::unique_ptr<Queue> queue_;
};
}  // namespace transfer
}  // namespace s3stream

#endif
