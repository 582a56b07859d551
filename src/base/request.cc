/*
 * base/request.cc
 * -------------------------------------------------------------------------
 * HTTP request (implementation).
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

#include "base/request.h"

#include <errno.h>
#include <string.h>

#include <atomic>
#include <iomanip>
#include <mutex>
#include <stdexcept>

#include "base/logger.h"
#include "base/request_hook.h"
#include "base/statistics.h"
#include "base/timer.h"
#include "base/transport.h"

namespace s3stream {
namespace base {

namespace {
uint64_t s_run_count = 0;
uint64_t s_total_bytes = 0;
double s_run_time = 0.0;

std::atomic_int s_transport_failures(0), s_request_failures(0);
std::atomic_int s_timeouts(0);
std::mutex s_stats_mutex;

class HttpMethodCounters {
 public:
  HttpMethodCounters() = default;

  void Increment(HttpMethod method) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++counters_[method];
  }

  void Write(std::ostream *o) {
    std::lock_guard<std::mutex> lock(mutex_);

    *o << "http request methods:\n";
    for (const auto &kv : counters_) {
      *o << "  " << HttpMethodToString(kv.first) << ": " << kv.second << "\n";
    }
  }

 private:
  std::map<HttpMethod, int> counters_;
  std::mutex mutex_;
};

HttpMethodCounters *GetHttpMethodCounters() {
  static auto *counters = new HttpMethodCounters();
  return counters;
}

void StatsWriter(std::ostream *o) {
  std::lock_guard<std::mutex> lock(s_stats_mutex);
  o->setf(std::ostream::fixed);

  *o << "http requests:\n"
        "  count: "
     << s_run_count
     << "\n"
        "  total time: "
     << std::setprecision(2) << s_run_time
     << " s\n"
        "  avg time per request: "
     << std::setprecision(3)
     << (s_run_count ? s_run_time / static_cast<double>(s_run_count) * 1.0e3
                     : 0.0)
     << " ms\n"
        "  bytes: "
     << s_total_bytes
     << "\n"
        "  throughput: "
     << (s_run_time > 0.0
             ? static_cast<double>(s_total_bytes) / s_run_time * 1.0e-3
             : 0.0)
     << " kB/s\n"
        "  transport failures: "
     << s_transport_failures
     << "\n"
        "  request failures: "
     << s_request_failures
     << "\n"
        "  timeouts: "
     << s_timeouts << "\n";

  GetHttpMethodCounters()->Write(o);
}

Statistics::Writers::Entry s_writer(StatsWriter, 0);
}  // namespace

const char *HttpMethodToString(HttpMethod method) {
  switch (method) {
    case HttpMethod::INVALID:
      return "INVALID";
    case HttpMethod::DELETE:
      return "DELETE";
    case HttpMethod::GET:
      return "GET";
    case HttpMethod::HEAD:
      return "HEAD";
    case HttpMethod::POST:
      return "POST";
    case HttpMethod::PUT:
      return "PUT";
  }
  throw std::runtime_error("invalid HTTP method.");
}

RequestFactory::RequestFactory(HttpClient *client, RequestHook *hook)
    : client_(client), hook_(hook) {
  if (!client_) throw std::runtime_error("request factory needs a client.");
}

std::unique_ptr<Request> RequestFactory::New() const {
  return std::unique_ptr<Request>(
      new Request(client_->CreateTransport(), hook_, client_->timeout_in_s()));
}

Request::Request(std::unique_ptr<Transport> transport, RequestHook *hook,
                 int default_timeout_in_s)
    : transport_(std::move(transport)),
      hook_(hook),
      default_timeout_in_s_(default_timeout_in_s) {
  if (!transport_) throw std::runtime_error("client returned no transport.");
}

Request::~Request() {
  if (total_bytes_transferred_ > 0) {
    std::lock_guard<std::mutex> lock(s_stats_mutex);

    s_run_count += run_count_;
    s_run_time += total_run_time_;
    s_total_bytes += total_bytes_transferred_;
  }
}

void Request::Init(HttpMethod method) {
  url_.clear();
  headers_.clear();
  input_buffer_.clear();
  input_data_ = nullptr;
  input_size_ = 0;
  response_code_ = 0;
  response_headers_.clear();
  output_buffer_.clear();

  method_ = method;
}

std::string Request::GetOutputAsString() const {
  // output_buffer_ has no trailing null
  return std::string(output_buffer_.data(), output_buffer_.size());
}

void Request::TakeOutputBuffer(std::vector<char> *buffer) {
  buffer->clear();
  buffer->swap(output_buffer_);
}

void Request::SetUrl(const std::string &url, const std::string &query_string) {
  url_ = url;
  if (!query_string.empty()) {
    url_ += ((url_.find('?') == std::string::npos) ? "?" : "&");
    url_ += query_string;
  }
}

void Request::SetHeader(const std::string &name, const std::string &value) {
  headers_[name] = value;
}

void Request::SetInputBuffer(std::vector<char> &&buffer) {
  input_buffer_ = std::move(buffer);
  input_data_ = input_buffer_.data();
  input_size_ = input_buffer_.size();
}

void Request::SetInputBuffer(const std::string &str) {
  input_buffer_.assign(str.begin(), str.end());
  input_data_ = input_buffer_.data();
  input_size_ = input_buffer_.size();
}

void Request::SetInputBuffer(const char *data, size_t size) {
  input_buffer_.clear();
  input_data_ = data;
  input_size_ = size;
}

void Request::ResetCurrentRunTime() { current_run_time_ = 0.0; }

void Request::Run(int timeout_in_s) {
  // sanity
  if (method_ == HttpMethod::INVALID)
    throw std::runtime_error("call Init() first!");
  if (url_.empty()) throw std::runtime_error("call SetUrl() first!");
  if (input_size_ > 0 && method_ != HttpMethod::PUT &&
      method_ != HttpMethod::POST)
    throw std::runtime_error(
        "can't set input data for non-POST/non-PUT request.");

  if (timeout_in_s == DEFAULT_REQUEST_TIMEOUT)
    timeout_in_s = default_timeout_in_s_;

  if (hook_) hook_->PreRun(this);

  GetHttpMethodCounters()->Increment(method_);

  Response response;
  const double start_time = Timer::GetMonotonicTime();

  try {
    transport_->Perform(*this, timeout_in_s, &response);
  } catch (const TransportError &e) {
    if (e.error_code() == -ETIMEDOUT)
      ++s_timeouts;
    else
      ++s_transport_failures;

    S3STREAM_LOG(LOG_DEBUG, "Request::Run", "%s [%s] failed: %s\n",
                 HttpMethodToString(method_), url_.c_str(), e.what());
    throw;
  }

  const double elapsed_time = Timer::GetMonotonicTime() - start_time;

  response_code_ = response.code;
  response_headers_ = std::move(response.headers);
  output_buffer_ = std::move(response.body);

  // don't save the time for the first request since it's likely to be
  // disproportionately large
  if (run_count_ > 0) {
    total_run_time_ += elapsed_time;
    total_bytes_transferred_ += input_size_ + output_buffer_.size();
  }

  // but save it in current_run_time_ since it's compared to overall function
  // time (i.e., it's relative)
  current_run_time_ += elapsed_time;
  run_count_++;

  if (response_code_ >= HTTP_SC_BAD_REQUEST &&
      response_code_ != HTTP_SC_NOT_FOUND) {
    ++s_request_failures;
    S3STREAM_LOG(LOG_WARNING, "Request::Run",
                 "request for [%s] [%s] failed with code %i and response: %s\n",
                 HttpMethodToString(method_), url_.c_str(), response_code_,
                 GetOutputAsString().c_str());
  }
}

}  // namespace base
}  // namespace s3stream
