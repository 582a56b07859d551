/*
 * transfer/putter.cc
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

#include "transfer/putter.h"

#include <errno.h>
#include <strings.h>

#include <algorithm>
#include <atomic>
#include <functional>
#include <stdexcept>

#include "base/curl_http_client.h"
#include "base/logger.h"
#include "base/request_hook.h"
#include "base/statistics.h"
#include "base/xml.h"
#include "crypto/base64.h"
#include "crypto/hex.h"
#include "crypto/hex_with_quotes.h"
#include "services/utils.h"
#include "threads/pool.h"
#include "transfer/digest.h"

namespace s3stream {
namespace transfer {

namespace {
constexpr char INITIATE_UPLOAD_ID_XPATH[] =
    "/InitiateMultipartUploadResult/UploadId";
constexpr char COMPLETE_ETAG_XPATH[] = "/CompleteMultipartUploadResult/ETag";
constexpr char ERROR_XPATH[] = "/Error";

std::atomic<uint64_t> s_parts(0), s_bytes(0);
std::atomic_int s_failed_parts(0), s_retries(0), s_etag_mismatches(0);
std::atomic_int s_completed(0), s_aborted(0);

void StatsWriter(std::ostream *o) {
  *o << "putter:\n"
        "  parts uploaded: "
     << s_parts
     << "\n"
        "  bytes uploaded: "
     << s_bytes
     << "\n"
        "  failed parts: "
     << s_failed_parts
     << "\n"
        "  retries: "
     << s_retries
     << "\n"
        "  part etag mismatches: "
     << s_etag_mismatches
     << "\n"
        "  completed uploads: "
     << s_completed
     << "\n"
        "  aborted uploads: "
     << s_aborted << "\n";
}

base::Statistics::Writers::Entry s_writer(StatsWriter, 0);

std::string StripQuotes(const std::string &s) {
  if (s.size() >= 2 && s.front() == '"' && s.back() == '"')
    return s.substr(1, s.size() - 2);

  return s;
}
}  // namespace

constexpr int64_t Putter::MAX_PART_SIZE;

int Putter::Open(const std::string &url, const std::string &digest_url,
                 const base::HeaderMap &headers,
                 std::unique_ptr<base::RequestHook> hook,
                 const TransferConfig &config,
                 std::unique_ptr<Putter> *putter) {
  int r = config.Validate();
  if (r) return r;

  std::unique_ptr<Putter> p;

  try {
    p.reset(new Putter(url, digest_url, std::move(hook), config));
  } catch (const std::exception &e) {
    S3STREAM_LOG(LOG_ERR, "Putter::Open", "unable to start transfer: %s\n",
                 e.what());
    return -EIO;
  }

  r = p->Init(headers);
  if (r) return r;

  *putter = std::move(p);
  return 0;
}

int64_t Putter::GetPartSize(int64_t initial_size, int growth_interval,
                            size_t index) {
  int64_t size = std::min(initial_size, MAX_PART_SIZE);

  if (growth_interval <= 0) return size;

  for (size_t i = index / static_cast<size_t>(growth_interval);
       i > 0 && size < MAX_PART_SIZE; i--)
    size *= 2;

  return std::min(size, MAX_PART_SIZE);
}

Putter::Putter(const std::string &url, const std::string &digest_url,
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
      new threads::Pool("putter", config_.concurrency, factory_.get()));
}

Putter::~Putter() {
  if (closed_) return;

  closed_ = true;

  if (queue_) {
    queue_->Abort(-ECANCELED);
    queue_->Wait();
  }

  // no upload to abandon if Init() failed
  if (upload_id_.empty()) return;

  S3STREAM_LOG(LOG_WARNING, "Putter::~Putter",
               "upload to [%s] was never closed, abandoning it.\n",
               url_.c_str());
  AbortUpload();
}

int Putter::Init(const base::HeaderMap &headers) {
  const int r = threads::CallWithRetries(
      pool_.get(),
      std::bind(&Putter::InitiateUpload, this, std::placeholders::_1,
                std::cref(headers)),
      config_.max_retries);

  if (r) return r;

  S3STREAM_LOG(LOG_DEBUG, "Putter::Init", "started upload [%s] to [%s].\n",
               upload_id_.c_str(), url_.c_str());

  queue_.reset(new Queue(
      pool_.get(),
      [this](base::Request *req, Part *part) {
        part->md5 = crypto::Md5::Compute(part->data);
        return UploadPart(req, part);
      },
      std::bind(&Putter::UploadPart, this, std::placeholders::_1,
                std::placeholders::_2),
      std::bind(&Putter::OnPartDone, this, std::placeholders::_1,
                std::placeholders::_2),
      config_.max_retries, config_.concurrency,
      Queue::SlotRelease::ON_COMPLETION));

  return 0;
}

int Putter::InitiateUpload(base::Request *req,
                           const base::HeaderMap &headers) {
  req->Init(base::HttpMethod::POST);
  req->SetUrl(url_, "uploads");

  for (const auto &header : headers)
    req->SetHeader(header.first, header.second);

  req->Run();

  if (services::IsTransientResponse(*req)) return -EAGAIN;

  if (req->response_code() != base::HTTP_SC_OK) {
    S3STREAM_LOG(LOG_WARNING, "Putter::InitiateUpload",
                 "unexpected status %i for [%s].\n", req->response_code(),
                 url_.c_str());
    return -EPROTO;
  }

  auto doc = base::XmlDocument::Parse(req->GetOutputAsString());

  if (!doc || doc->Find(INITIATE_UPLOAD_ID_XPATH, &upload_id_) ||
      upload_id_.empty()) {
    S3STREAM_LOG(LOG_WARNING, "Putter::InitiateUpload",
                 "no upload id in response for [%s].\n", url_.c_str());
    return -EPROTO;
  }

  return 0;
}

ssize_t Putter::Write(const char *data, size_t size) {
  if (closed_) return -EBADF;

  int r = queue_->error();
  if (r) return r;

  size_t written = 0;

  while (written < size) {
    if (!current_) {
      r = StartPart();
      if (r) return r;
    }

    const size_t part_size = static_cast<size_t>(GetPartSize(
        config_.part_size, config_.part_growth_interval,
        current_->index));
    const size_t n =
        std::min(size - written, part_size - current_->data.size());

    current_->data.insert(current_->data.end(), data + written,
                          data + written + n);
    md5_.Update(data + written, n);

    written += n;
    bytes_written_ += n;

    if (current_->data.size() == part_size) {
      r = FlushPart();
      if (r) return r;
    }
  }

  return static_cast<ssize_t>(written);
}

int Putter::StartPart() {
  if (next_part_index_ >= static_cast<size_t>(config_.max_parts)) {
    S3STREAM_LOG(LOG_ERR, "Putter::StartPart",
                 "upload to [%s] needs more than %i parts.\n", url_.c_str(),
                 config_.max_parts);
    queue_->Abort(-EFBIG);
    return -EFBIG;
  }

  current_.reset(new Part());
  current_->index = next_part_index_++;
  current_->data.reserve(static_cast<size_t>(GetPartSize(
      config_.part_size, config_.part_growth_interval,
      current_->index)));

  return 0;
}

int Putter::FlushPart() {
  Part *part = current_.get();

  {
    std::lock_guard<std::mutex> lock(mutex_);
    parts_[part->index] = std::move(current_);
  }

  // blocks while the queue is full
  return queue_->Post(part);
}

int Putter::UploadPart(base::Request *req, Part *part) {
  req->Init(base::HttpMethod::PUT);
  req->SetUrl(url_, "partNumber=" + std::to_string(part->index + 1) +
                        "&uploadId=" + upload_id_);
  req->SetHeader("Content-MD5",
                 crypto::Md5::Encode<crypto::Base64>(part->md5));
  req->SetInputBuffer(part->data.data(), part->data.size());

  req->Run(config_.transfer_timeout_in_s);

  if (services::IsTransientResponse(*req)) return -EAGAIN;

  if (req->response_code() != base::HTTP_SC_OK) {
    S3STREAM_LOG(LOG_WARNING, "Putter::UploadPart",
                 "unexpected status %i for part %zu of [%s].\n",
                 req->response_code(), part->index, url_.c_str());
    return -EPROTO;
  }

  const std::string expected =
      crypto::Md5::Encode<crypto::HexWithQuotes>(part->md5);
  const std::string etag = req->response_header("ETag");

  if (strcasecmp(etag.c_str(), expected.c_str()) != 0) {
    ++s_etag_mismatches;
    S3STREAM_LOG(LOG_WARNING, "Putter::UploadPart",
                 "etag [%s] for part %zu of [%s] should be [%s].\n",
                 etag.c_str(), part->index, url_.c_str(), expected.c_str());
    return -EAGAIN;
  }

  part->etag = etag;
  return 0;
}

void Putter::OnPartDone(Part *part, int r) {
  if (r) {
    if (r != -ECANCELED) ++s_failed_parts;
    return;
  }

  ++s_parts;
  s_bytes += part->data.size();

  std::lock_guard<std::mutex> lock(mutex_);

  etags_[part->index] = part->etag;
  std::vector<char>().swap(part->data);
}

int Putter::Close() {
  if (closed_) return -EBADF;

  closed_ = true;

  int r = queue_->error();

  // an empty object is uploaded as a single empty part
  if (!r && (current_ || next_part_index_ == 0)) {
    if (!current_) r = StartPart();
    if (!r) r = FlushPart();
  }

  if (r) queue_->Abort(r);

  const int queue_r = queue_->Wait();
  if (!r) r = queue_r;

  s_retries += queue_->retries();

  if (r) {
    S3STREAM_LOG(LOG_WARNING, "Putter::Close",
                 "upload to [%s] failed with status %i, abandoning it.\n",
                 url_.c_str(), r);
    AbortUpload();
  } else {
    r = Complete();
  }

  queue_.reset();
  pool_.reset();

  return r;
}

int Putter::Complete() {
  std::string body = "<CompleteMultipartUpload>";
  size_t etag_count = 0;

  {
    std::lock_guard<std::mutex> lock(mutex_);

    etag_count = etags_.size();

    for (const auto &etag : etags_)
      body += "<Part><PartNumber>" + std::to_string(etag.first + 1) +
              "</PartNumber><ETag>" + etag.second + "</ETag></Part>";
  }

  body += "</CompleteMultipartUpload>";

  if (etag_count != next_part_index_) {
    S3STREAM_LOG(LOG_ERR, "Putter::Complete",
                 "have %zu etags for %zu parts of [%s].\n", etag_count,
                 next_part_index_, url_.c_str());
    AbortUpload();
    return -EIO;
  }

  int r = threads::CallWithRetries(
      pool_.get(),
      std::bind(&Putter::CompleteUpload, this, std::placeholders::_1,
                std::cref(body)),
      config_.max_retries);

  if (r) {
    AbortUpload();
    return r;
  }

  ++s_completed;

  r = VerifyEtag();
  if (r) return r;

  if (!config_.verify_checksum) return 0;

  const std::string md5_hex = md5_.Finish<crypto::Hex>();

  r = threads::CallWithRetries(
      pool_.get(), std::bind(&Digest::Store, std::placeholders::_1,
                             digest_url_, std::cref(md5_hex)),
      config_.max_retries);

  if (r)
    S3STREAM_LOG(LOG_WARNING, "Putter::Complete",
                 "unable to store digest for [%s]: %i.\n", url_.c_str(), r);

  return r;
}

int Putter::CompleteUpload(base::Request *req, const std::string &body) {
  req->Init(base::HttpMethod::POST);
  req->SetUrl(url_, "uploadId=" + upload_id_);
  req->SetInputBuffer(body);

  req->Run(config_.transfer_timeout_in_s);

  if (services::IsTransientResponse(*req)) return -EAGAIN;

  if (req->response_code() != base::HTTP_SC_OK) {
    S3STREAM_LOG(LOG_WARNING, "Putter::CompleteUpload",
                 "unexpected status %i completing [%s].\n",
                 req->response_code(), url_.c_str());
    return -EPROTO;
  }

  auto doc = base::XmlDocument::Parse(req->GetOutputAsString());

  if (!doc) return -EPROTO;

  // the service can report a failure after it has already sent a 200
  if (doc->Match(ERROR_XPATH)) {
    S3STREAM_LOG(LOG_WARNING, "Putter::CompleteUpload",
                 "error completing [%s]: %s\n", url_.c_str(),
                 req->GetOutputAsString().c_str());
    return -EAGAIN;
  }

  if (doc->Find(COMPLETE_ETAG_XPATH, &etag_)) return -EPROTO;

  return 0;
}

int Putter::VerifyEtag() {
  const std::string etag = StripQuotes(etag_);

  // only multipart etags ("<hex>-<part count>") can be checked
  if (etag.find('-') == std::string::npos) {
    S3STREAM_LOG(LOG_DEBUG, "Putter::VerifyEtag",
                 "not checking etag [%s] of [%s].\n", etag_.c_str(),
                 url_.c_str());
    return 0;
  }

  std::vector<uint8_t> part_md5s;

  {
    std::lock_guard<std::mutex> lock(mutex_);

    for (const auto &part : parts_)
      part_md5s.insert(part_md5s.end(), part.second->md5.begin(),
                       part.second->md5.end());
  }

  const std::string expected =
      crypto::Md5::Compute<crypto::Hex>(part_md5s) + "-" +
      std::to_string(part_md5s.size() / crypto::Md5::HASH_LEN);

  if (strcasecmp(etag.c_str(), expected.c_str()) != 0) {
    S3STREAM_LOG(LOG_WARNING, "Putter::VerifyEtag",
                 "etag [%s] of [%s] should be [%s].\n", etag_.c_str(),
                 url_.c_str(), expected.c_str());
    return -EBADMSG;
  }

  return 0;
}

void Putter::AbortUpload() {
  if (upload_id_.empty() || aborted_) return;

  aborted_ = true;
  ++s_aborted;

  const int r = threads::CallWithRetries(
      pool_.get(),
      std::bind(&Putter::SendAbort, this, std::placeholders::_1),
      config_.max_retries);

  if (r)
    S3STREAM_LOG(LOG_WARNING, "Putter::AbortUpload",
                 "unable to abort upload [%s] to [%s]: %i. its parts may "
                 "still be stored.\n",
                 upload_id_.c_str(), url_.c_str(), r);
}

int Putter::SendAbort(base::Request *req) {
  req->Init(base::HttpMethod::DELETE);
  req->SetUrl(url_, "uploadId=" + upload_id_);
  req->Run();

  const int rc = req->response_code();

  if (rc == base::HTTP_SC_NO_CONTENT || rc == base::HTTP_SC_OK ||
      rc == base::HTTP_SC_NOT_FOUND)
    return 0;

  return services::IsTransientResponse(*req) ? -EAGAIN : -EPROTO;
}

}  // namespace transfer
}  // namespace s3stream
