/*
 * base/curl_http_client.cc
 * -------------------------------------------------------------------------
 * HTTP client implemented with libcurl (implementation).
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

#include "base/curl_http_client.h"

#include <curl/curl.h>
#include <errno.h>
#include <string.h>
#include <time.h>

#include <algorithm>
#include <mutex>
#include <stdexcept>

#include "base/config.h"
#include "base/logger.h"
#include "base/request.h"

#define TEST_OK(x)                                                           \
  do {                                                                       \
    if ((x) != CURLE_OK) throw std::runtime_error("call to " #x " failed."); \
  } while (0)

namespace s3stream {
namespace base {

namespace {
constexpr char USER_AGENT[] = PACKAGE_NAME " " PACKAGE_VERSION;

class CurlSListWrapper {
 public:
  CurlSListWrapper() = default;
  ~CurlSListWrapper() {
    if (list_) curl_slist_free_all(list_);
  }

  inline void Append(const std::string &item) {
    list_ = curl_slist_append(list_, item.c_str());
  }

  inline const curl_slist *get() const { return list_; }

 private:
  curl_slist *list_ = nullptr;
};

class CurlTransport : public Transport {
 public:
  explicit CurlTransport(int connect_timeout_in_s) {
    AddGlobalReference();

    try {
      Setup(connect_timeout_in_s);
    } catch (...) {
      if (curl_) curl_easy_cleanup(curl_);
      ReleaseGlobalReference();
      throw;
    }
  }

  ~CurlTransport() override {
    curl_easy_cleanup(curl_);
    ReleaseGlobalReference();
  }

  void Perform(const Request &req, int timeout_in_s,
               Response *response) override {
    TEST_OK(curl_easy_setopt(curl_, CURLOPT_CUSTOMREQUEST, nullptr));
    TEST_OK(curl_easy_setopt(curl_, CURLOPT_UPLOAD, 0L));
    TEST_OK(curl_easy_setopt(curl_, CURLOPT_NOBODY, 0L));
    TEST_OK(curl_easy_setopt(curl_, CURLOPT_POST, 0L));
    TEST_OK(curl_easy_setopt(curl_, CURLOPT_HTTPGET, 1L));

    switch (req.method()) {
      case HttpMethod::DELETE:
        TEST_OK(curl_easy_setopt(curl_, CURLOPT_CUSTOMREQUEST, "DELETE"));
        TEST_OK(curl_easy_setopt(curl_, CURLOPT_NOBODY, 1L));
        break;
      case HttpMethod::HEAD:
        TEST_OK(curl_easy_setopt(curl_, CURLOPT_NOBODY, 1L));
        break;
      case HttpMethod::POST:
        TEST_OK(curl_easy_setopt(curl_, CURLOPT_POST, 1L));
        TEST_OK(curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE_LARGE,
                                 static_cast<curl_off_t>(req.input_size())));
        break;
      case HttpMethod::PUT:
        TEST_OK(curl_easy_setopt(curl_, CURLOPT_UPLOAD, 1L));
        TEST_OK(curl_easy_setopt(curl_, CURLOPT_INFILESIZE_LARGE,
                                 static_cast<curl_off_t>(req.input_size())));
        break;
      case HttpMethod::GET:
        break;
      case HttpMethod::INVALID:
        throw std::runtime_error("invalid HTTP method.");
    }

    TEST_OK(curl_easy_setopt(curl_, CURLOPT_URL, req.url().c_str()));

    CurlSListWrapper headers;
    for (const auto &pair : req.headers())
      headers.Append(pair.first + ": " + pair.second);
    // curl adds these on its own unless told otherwise
    headers.Append("Expect:");
    if (req.headers().find("Content-Type") == req.headers().end())
      headers.Append("Content-Type:");
    TEST_OK(curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers.get()));

    input_ = &req;
    input_pos_ = req.input_data();
    input_remaining_ = req.input_size();
    response_ = response;
    error_[0] = '\0';
    deadline_ = time(nullptr) + timeout_in_s;

    const CURLcode r = curl_easy_perform(curl_);

    input_ = nullptr;
    response_ = nullptr;

    switch (r) {
      case CURLE_OK:
        break;

      case CURLE_COULDNT_RESOLVE_PROXY:
      case CURLE_COULDNT_RESOLVE_HOST:
      case CURLE_COULDNT_CONNECT:
      case CURLE_PARTIAL_FILE:
      case CURLE_UPLOAD_FAILED:
      case CURLE_SSL_CONNECT_ERROR:
      case CURLE_GOT_NOTHING:
      case CURLE_SEND_ERROR:
      case CURLE_RECV_ERROR:
      case CURLE_BAD_CONTENT_ENCODING:
        throw TransportError(-EAGAIN,
                             std::string("recoverable error: ") + error_);

      case CURLE_OPERATION_TIMEDOUT:
      case CURLE_ABORTED_BY_CALLBACK:
        throw TransportError(-ETIMEDOUT, "timed out");

      default:
        throw TransportError(-EIO, std::string("unrecoverable error (") +
                                       curl_easy_strerror(r) + "): " + error_);
    }

    long code = 0;
    TEST_OK(curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &code));

    response->code = static_cast<int>(code);
  }

 private:
  static void AddGlobalReference() {
    std::lock_guard<std::mutex> lock(s_mutex);

    if (s_refcount == 0) {
      TEST_OK(curl_global_init(CURL_GLOBAL_ALL));

      auto *ver = curl_version_info(CURLVERSION_NOW);
      const char *error = nullptr;

      if (!ver)
        error = "curl_version_info() failed.";
      else if (!ver->ssl_version)
        error = "curl does not report an SSL library. cannot continue.";

      if (error) {
        curl_global_cleanup();
        throw std::runtime_error(error);
      }

      S3STREAM_LOG(LOG_DEBUG, "CurlTransport::AddGlobalReference",
                   "ssl version: %s\n", ver->ssl_version);
    }

    ++s_refcount;
  }

  static void ReleaseGlobalReference() {
    std::lock_guard<std::mutex> lock(s_mutex);
    if (--s_refcount == 0) curl_global_cleanup();
  }

  void Setup(int connect_timeout_in_s) {
    curl_ = curl_easy_init();
    if (!curl_) throw std::runtime_error("curl_easy_init() failed.");

    // stuff that's set here isn't touched by Perform()
    TEST_OK(curl_easy_setopt(curl_, CURLOPT_VERBOSE,
                             Config::verbose_requests() ? 1L : 0L));
    TEST_OK(curl_easy_setopt(curl_, CURLOPT_NOPROGRESS, 0L));
    TEST_OK(curl_easy_setopt(curl_, CURLOPT_FOLLOWLOCATION, 1L));
    TEST_OK(curl_easy_setopt(curl_, CURLOPT_ERRORBUFFER, error_));
    static_assert(sizeof(error_) >= CURL_ERROR_SIZE,
                  "error buffer is too small.");
    TEST_OK(curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L));
    TEST_OK(curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT,
                             static_cast<long>(connect_timeout_in_s)));
    TEST_OK(curl_easy_setopt(curl_, CURLOPT_HEADERFUNCTION,
                             &CurlTransport::ProcessHeaderWrapper));
    TEST_OK(curl_easy_setopt(curl_, CURLOPT_HEADERDATA, this));
    TEST_OK(curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION,
                             &CurlTransport::WriteOutputWrapper));
    TEST_OK(curl_easy_setopt(curl_, CURLOPT_WRITEDATA, this));
    TEST_OK(curl_easy_setopt(curl_, CURLOPT_READFUNCTION,
                             &CurlTransport::ReadInputWrapper));
    TEST_OK(curl_easy_setopt(curl_, CURLOPT_READDATA, this));
    TEST_OK(curl_easy_setopt(curl_, CURLOPT_SEEKFUNCTION,
                             &CurlTransport::SeekInputWrapper));
    TEST_OK(curl_easy_setopt(curl_, CURLOPT_SEEKDATA, this));
    TEST_OK(curl_easy_setopt(curl_, CURLOPT_XFERINFOFUNCTION,
                             &CurlTransport::ProgressWrapper));
    TEST_OK(curl_easy_setopt(curl_, CURLOPT_XFERINFODATA, this));
    TEST_OK(curl_easy_setopt(curl_, CURLOPT_USERAGENT, USER_AGENT));
  }

  static size_t ProcessHeaderWrapper(char *data, size_t size, size_t items,
                                     void *context) {
    return static_cast<CurlTransport *>(context)->ProcessHeader(data, size,
                                                                items);
  }

  static size_t WriteOutputWrapper(char *data, size_t size, size_t items,
                                   void *context) {
    return static_cast<CurlTransport *>(context)->WriteOutput(data, size,
                                                              items);
  }

  static size_t ReadInputWrapper(char *data, size_t size, size_t items,
                                 void *context) {
    return static_cast<CurlTransport *>(context)->ReadInput(data, size, items);
  }

  static int SeekInputWrapper(void *context, curl_off_t offset, int origin) {
    return static_cast<CurlTransport *>(context)->SeekInput(offset, origin);
  }

  static int ProgressWrapper(void *context, curl_off_t, curl_off_t, curl_off_t,
                             curl_off_t) {
    return static_cast<CurlTransport *>(context)->Progress();
  }

  size_t ProcessHeader(char *data, size_t size, size_t items) {
    size *= items;

    const char *end = data + size;
    const char *p1 = std::find(static_cast<const char *>(data), end, ':');
    if (p1 == end) return size;  // status line, or the blank line at the end

    std::string name(static_cast<const char *>(data), p1 - data);
    p1++;
    while (p1 < end && *p1 == ' ') p1++;

    // header values end with "\r\n"
    const char *p2 = p1;
    while (p2 < end && *p2 != '\r' && *p2 != '\n') p2++;

    response_->headers[name] = std::string(p1, p2 - p1);
    return size;
  }

  size_t WriteOutput(char *data, size_t size, size_t items) {
    size *= items;
    response_->body.insert(response_->body.end(), data, data + size);
    return size;
  }

  size_t ReadInput(char *data, size_t size, size_t items) {
    size *= items;

    const size_t remaining = std::min(input_remaining_, size);
    if (remaining) memcpy(data, input_pos_, remaining);
    input_pos_ += remaining;
    input_remaining_ -= remaining;

    return remaining;
  }

  int SeekInput(curl_off_t offset, int origin) {
    if (origin != SEEK_SET || offset != 0) return CURL_SEEKFUNC_FAIL;

    // rewind, e.g. after a redirect
    input_pos_ = input_->input_data();
    input_remaining_ = input_->input_size();
    return CURL_SEEKFUNC_OK;
  }

  int Progress() {
    if (time(nullptr) > deadline_) {
      S3STREAM_LOG(LOG_DEBUG, "CurlTransport::Progress", "time out for [%s]\n",
                   input_ ? input_->url().c_str() : "");
      return 1;
    }

    return 0;
  }

  static std::mutex s_mutex;
  static int s_refcount;

  CURL *curl_ = nullptr;
  char error_[CURL_ERROR_SIZE];

  const Request *input_ = nullptr;
  const char *input_pos_ = nullptr;
  size_t input_remaining_ = 0;
  Response *response_ = nullptr;
  time_t deadline_ = 0;
};

std::mutex CurlTransport::s_mutex;
int CurlTransport::s_refcount = 0;
}  // namespace

CurlHttpClient::CurlHttpClient(int timeout_in_s)
    : timeout_in_s_(timeout_in_s) {}

std::unique_ptr<Transport> CurlHttpClient::CreateTransport() {
  return std::unique_ptr<Transport>(new CurlTransport(timeout_in_s_));
}

int CurlHttpClient::timeout_in_s() const { return timeout_in_s_; }

}  // namespace base
}  // namespace s3stream
