/*
 * transfer/getter.cc
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

#include "transfer/getter.h"

#include <errno.h>
#include <inttypes.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include <algorithm>
#include <atomic>
#include <functional>
#include <stdexcept>

#include "base/curl_http_client.h"
#include "base/logger.h"
#include "base/request_hook.h"
#include "base/statistics.h"
#include "crypto/hex.h"
#include "services/utils.h"
#include "threads/pool.h"
#include "transfer/digest.h"

namespace s3stream {
namespace transfer {

namespace {
std::atomic<uint64_t> s_parts(0), s_bytes(0);
std::atomic_int s_failed_parts(0), s_retries(0);
std::atomic_int s_verified(0), s_unverified(0), s_digest_mismatches(0);

void StatsWriter(std::ostream *o) {
  *o << "getter:\n"
        "  parts downloaded: "
     << s_parts
     << "\n"
        "  bytes downloaded: "
     << s_bytes
     << "\n"
        "  failed parts: "
     << s_failed_parts
     << "\n"
        "  retries: "
     << s_retries
     << "\n"
        "  verified objects: "
     << s_verified
     << "\n"
        "  objects without digest: "
     << s_unverified
     << "\n"
        "  digest mismatches: "
     << s_digest_mismatches << "\n";
}

base::Statistics::Writers::Entry s_writer(StatsWriter, 0);
}  // namespace

int Getter::Open(const std::string &url, const std::string &digest_url,
                 std::unique_ptr<base::RequestHook> hook,
                 const TransferConfig &config, std::unique_ptr<Getter> *getter,
                 base::HeaderMap *headers) {
  int r = config.Validate();
  if (r) return r;

  std::unique_ptr<Getter> g;

  try {
    g.reset(new Getter(url, digest_url, std::move(hook), config));
  } catch (const std::exception &e) {
    S3STREAM_LOG(LOG_ERR, "Getter::Open", "unable to start transfer: %s\n",
                 e.what());
    return -EIO;
  }

  r = g->Init(headers);
  if (r) return r;

  *getter = std::move(g);
  return 0;
}

size_t Getter::GetPartCount(int64_t length, int64_t part_size) {
  return static_cast<size_t>(length / part_size +
                             (length % part_size != 0 ? 1 : 0));
}

Getter::Getter(const std::string &url, const std::string &digest_url,
               std::unique_ptr<base::RequestHook> hook,
               const TransferConfig &config)
    : url_(url),
      digest_url_(digest_url),
      config_(config),
      hook_(std::move(hook)) {
  base::HttpClient *client = config_.http_client;

  if (!client) {
    owned_client_.reset(
        new base::CurlHttpClient(config_.request_timeout_in_s));
    client = owned_client_.get();
  }

  factory_.reset(new base::RequestFactory(client, hook_.get()));
  pool_.reset(
      new threads::Pool("getter", config_.concurrency, factory_.get()));
}

Getter::~Getter() {
  const int r = Close();

  if (r && r != -ECANCELED)
    S3STREAM_LOG(LOG_DEBUG, "Getter::~Getter",
                 "transfer for [%s] ended with status %i.\n", url_.c_str(), r);
}

int Getter::Init(base::HeaderMap *headers) {
  int r = threads::CallWithRetries(
      pool_.get(),
      std::bind(&Getter::FetchHeaders, this, std::placeholders::_1, headers),
      config_.max_retries);

  if (r) return r;

  part_count_ = GetPartCount(content_length_, config_.part_size);

  S3STREAM_LOG(LOG_DEBUG, "Getter::Init",
               "[%s] is %" PRId64 " bytes, fetching in %zu parts.\n",
               url_.c_str(), content_length_, part_count_);

  auto process = std::bind(&Getter::DownloadPart, this, std::placeholders::_1,
                           std::placeholders::_2);

  queue_.reset(new Queue(pool_.get(), process, process,
                         std::bind(&Getter::OnPartDone, this,
                                   std::placeholders::_1,
                                   std::placeholders::_2),
                         config_.max_retries, config_.concurrency,
                         Queue::SlotRelease::EXPLICIT));

  std::lock_guard<std::mutex> lock(mutex_);

  for (int i = 0; i < config_.concurrency && next_post_ < part_count_; i++) {
    r = PostNextPart();
    if (r) return r;
  }

  return 0;
}

int Getter::FetchHeaders(base::Request *req, base::HeaderMap *headers) {
  req->Init(base::HttpMethod::HEAD);
  req->SetUrl(url_);
  req->Run();

  const int rc = req->response_code();

  if (rc == base::HTTP_SC_NOT_FOUND) return -ENOENT;

  if (services::IsTransientResponse(*req)) return -EAGAIN;

  if (rc != base::HTTP_SC_OK) {
    S3STREAM_LOG(LOG_WARNING, "Getter::FetchHeaders",
                 "unexpected status %i for [%s].\n", rc, url_.c_str());
    return -EPROTO;
  }

  const std::string length = req->response_header("Content-Length");
  char *end = nullptr;

  errno = 0;
  content_length_ = strtoll(length.c_str(), &end, 10);

  if (length.empty() || *end != '\0' || errno != 0 || content_length_ < 0) {
    S3STREAM_LOG(LOG_WARNING, "Getter::FetchHeaders",
                 "invalid content length [%s] for [%s].\n", length.c_str(),
                 url_.c_str());
    return -EPROTO;
  }

  if (headers) *headers = req->response_headers();

  return 0;
}

int Getter::PostNextPart() {
  if (next_post_ >= part_count_) return 0;

  std::unique_ptr<Part> part(new Part());
  Part *raw_part = part.get();

  part->index = next_post_++;
  part->offset = static_cast<int64_t>(part->index) * config_.part_size;
  part->size = static_cast<size_t>(
      std::min(config_.part_size, content_length_ - part->offset));

  parts_[part->index] = std::move(part);

  // never blocks: a slot is always free when this is called
  return queue_->Post(raw_part);
}

int Getter::DownloadPart(base::Request *req, Part *part) {
  const int64_t last = part->offset + static_cast<int64_t>(part->size) - 1;

  req->Init(base::HttpMethod::GET);
  req->SetUrl(url_);
  req->SetHeader("Range", "bytes=" + std::to_string(part->offset) + "-" +
                              std::to_string(last));
  req->Run(config_.transfer_timeout_in_s);

  if (services::IsTransientResponse(*req)) return -EAGAIN;

  if (req->response_code() != base::HTTP_SC_PARTIAL_CONTENT) {
    S3STREAM_LOG(LOG_WARNING, "Getter::DownloadPart",
                 "unexpected status %i for part %zu of [%s].\n",
                 req->response_code(), part->index, url_.c_str());
    return -EPROTO;
  }

  const std::string range = req->response_header("Content-Range");
  int64_t range_first = -1, range_last = -1;

  if (sscanf(range.c_str(), "bytes %" SCNd64 "-%" SCNd64, &range_first,
             &range_last) != 2 ||
      range_first != part->offset || range_last != last) {
    S3STREAM_LOG(LOG_WARNING, "Getter::DownloadPart",
                 "expected range %" PRId64 "-%" PRId64
                 " for part %zu of [%s], got [%s].\n",
                 part->offset, last, part->index, url_.c_str(), range.c_str());
    return -EPROTO;
  }

  if (req->output_buffer().size() != part->size) {
    S3STREAM_LOG(LOG_WARNING, "Getter::DownloadPart",
                 "expected %zu bytes for part %zu of [%s], got %zu.\n",
                 part->size, part->index, url_.c_str(),
                 req->output_buffer().size());
    return -EBADMSG;
  }

  req->TakeOutputBuffer(&part->data);
  return 0;
}

void Getter::OnPartDone(Part *part, int r) {
  if (r) {
    if (r != -ECANCELED) ++s_failed_parts;
  } else {
    ++s_parts;
    s_bytes += part->size;
  }

  std::lock_guard<std::mutex> lock(mutex_);

  if (r == 0) part->done = true;
  condition_.notify_all();
}

ssize_t Getter::Read(char *buffer, size_t size) {
  if (size == 0) return 0;

  size_t copied = 0;

  {
    std::unique_lock<std::mutex> lock(mutex_);
    int r = 0;

    if (closed_) return -EBADF;

    while (copied < size && next_read_ < part_count_) {
      auto iter = parts_.find(next_read_);

      while (!closed_ && (iter == parts_.end() || !iter->second->done) &&
             (r = queue_->error()) == 0) {
        condition_.wait(lock);
        iter = parts_.find(next_read_);
      }

      if (closed_) return -ECANCELED;
      if (iter == parts_.end() || !iter->second->done) break;

      Part *part = iter->second.get();
      const size_t n = std::min(size - copied, part->size - part->read_offset);

      memcpy(buffer + copied, part->data.data() + part->read_offset, n);
      md5_.Update(buffer + copied, n);

      copied += n;
      part->read_offset += n;
      bytes_read_ += n;

      if (part->read_offset == part->size) {
        parts_.erase(iter);
        next_read_++;

        queue_->Release();
        r = PostNextPart();
      }
    }

    if (copied > 0) return static_cast<ssize_t>(copied);
    if (r) return r;
  }

  return Finish();
}

int Getter::Finish() {
  std::unique_lock<std::mutex> lock(mutex_);

  while (verifying_) condition_.wait(lock);

  if (finished_) return final_status_;
  if (closed_) return -ECANCELED;

  verifying_ = true;
  lock.unlock();

  const int r = VerifyDigest();

  lock.lock();
  verifying_ = false;
  finished_ = true;
  final_status_ = r;
  condition_.notify_all();

  return r;
}

int Getter::VerifyDigest() {
  if (!config_.verify_checksum) return 0;

  const std::string computed = md5_.Finish<crypto::Hex>();
  std::string stored;

  const int r = threads::CallWithRetries(
      pool_.get(), std::bind(&Digest::Fetch, std::placeholders::_1,
                             digest_url_, &stored),
      config_.max_retries);

  if (r == -ENOENT) {
    ++s_unverified;
    S3STREAM_LOG(LOG_INFO, "Getter::VerifyDigest",
                 "no stored digest for [%s], not verifying.\n", url_.c_str());
    return 0;
  }

  if (r) return r;

  if (!Digest::Matches(stored, computed)) {
    ++s_digest_mismatches;
    S3STREAM_LOG(LOG_WARNING, "Getter::VerifyDigest",
                 "digest mismatch for [%s]: stored [%s], computed [%s].\n",
                 url_.c_str(), stored.c_str(), computed.c_str());
    return -EBADMSG;
  }

  ++s_verified;
  return 0;
}

int Getter::Close() {
  bool read_everything = false;

  {
    std::lock_guard<std::mutex> lock(mutex_);

    if (closed_) return close_status_;
    read_everything = (queue_ && next_read_ == part_count_ && !finished_);
  }

  // the caller read every byte without waiting for the end of the stream, so
  // verify now; the outcome is kept in final_status_
  if (read_everything && Finish())
    S3STREAM_LOG(LOG_DEBUG, "Getter::Close",
                 "verification failed for [%s].\n", url_.c_str());

  int r = -ECANCELED;

  {
    std::unique_lock<std::mutex> lock(mutex_);

    if (closed_) return close_status_;

    closed_ = true;
    condition_.notify_all();

    while (verifying_) condition_.wait(lock);
  }

  if (queue_) {
    s_retries += queue_->retries();
    queue_->Abort(-ECANCELED);
    r = queue_->Wait();
  }

  queue_.reset();
  pool_.reset();

  std::lock_guard<std::mutex> lock(mutex_);

  parts_.clear();
  close_status_ = finished_ ? final_status_ : r;

  return close_status_;
}

uint64_t Getter::bytes_read() {
  std::lock_guard<std::mutex> lock(mutex_);
  return bytes_read_;
}

std::string Getter::md5() {
  std::lock_guard<std::mutex> lock(mutex_);
  return md5_.Finish<crypto::Hex>();
}

}  // namespace transfer
}  // namespace s3stream
