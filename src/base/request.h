/*
 * base/request.h
 * -------------------------------------------------------------------------
 * HTTP request.
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

#ifndef S3STREAM_BASE_REQUEST_H
#define S3STREAM_BASE_REQUEST_H

#include <strings.h>

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace s3stream {
namespace base {
enum class HttpMethod { INVALID, DELETE, GET, HEAD, POST, PUT };

enum HttpStatusCode {
  HTTP_SC_OK = 200,
  HTTP_SC_NO_CONTENT = 204,
  HTTP_SC_PARTIAL_CONTENT = 206,
  HTTP_SC_BAD_REQUEST = 400,
  HTTP_SC_NOT_FOUND = 404,
  HTTP_SC_INTERNAL_SERVER_ERROR = 500,
  HTTP_SC_SERVICE_UNAVAILABLE = 503
};

const char *HttpMethodToString(HttpMethod method);

// HTTP header names compare case-insensitively.
struct HeaderNameLess {
  inline bool operator()(const std::string &a, const std::string &b) const {
    return strcasecmp(a.c_str(), b.c_str()) < 0;
  }
};

using HeaderMap = std::map<std::string, std::string, HeaderNameLess>;

class HttpClient;
class Request;
class RequestHook;
class Transport;

// Produces requests bound to one HTTP client and signed by one hook. Each
// request owns its own transport, so a request may only be run by one thread
// at a time.
class RequestFactory {
 public:
  RequestFactory(HttpClient *client, RequestHook *hook);

  std::unique_ptr<Request> New() const;

 private:
  HttpClient *const client_;
  RequestHook *const hook_;
};

class Request {
 public:
  static constexpr int DEFAULT_REQUEST_TIMEOUT = -1;

  ~Request();

  void Init(HttpMethod method);

  inline HttpMethod method() const { return method_; }
  inline const std::string &url() const { return url_; }
  inline const HeaderMap &headers() const { return headers_; }
  inline const char *input_data() const { return input_data_; }
  inline size_t input_size() const { return input_size_; }

  inline int response_code() const { return response_code_; }
  inline std::string response_header(const std::string &key) const {
    auto iter = response_headers_.find(key);
    return (iter == response_headers_.end()) ? "" : iter->second;
  }
  inline const HeaderMap &response_headers() const { return response_headers_; }
  inline const std::vector<char> &output_buffer() const {
    return output_buffer_;
  }
  inline double current_run_time() const { return current_run_time_; }

  std::string GetOutputAsString() const;

  // Moves the response body into |buffer|, leaving the request's empty.
  void TakeOutputBuffer(std::vector<char> *buffer);

  void SetUrl(const std::string &url, const std::string &query_string = "");
  void SetHeader(const std::string &name, const std::string &value);
  void SetInputBuffer(std::vector<char> &&buffer);
  void SetInputBuffer(const std::string &str);

  // Does not copy |data|, which must remain valid until Run() returns.
  void SetInputBuffer(const char *data, size_t size);

  void ResetCurrentRunTime();

  // Throws base::TransportError if no response could be obtained. A response
  // with any status code is not an error as far as Run() is concerned.
  void Run(int timeout_in_s = DEFAULT_REQUEST_TIMEOUT);

 private:
  friend class RequestFactory;  // for ctor.

  Request(std::unique_ptr<Transport> transport, RequestHook *hook,
          int default_timeout_in_s);

  // not reset by Init()
  const std::unique_ptr<Transport> transport_;
  RequestHook *const hook_ = nullptr;
  const int default_timeout_in_s_;

  double current_run_time_ = 0.0, total_run_time_ = 0.0;
  uint64_t run_count_ = 0;
  uint64_t total_bytes_transferred_ = 0;

  // should be reset by Init()
  HttpMethod method_ = HttpMethod::INVALID;
  std::string url_;
  HeaderMap headers_;

  std::vector<char> input_buffer_;
  const char *input_data_ = nullptr;
  size_t input_size_ = 0;

  int response_code_ = 0;
  HeaderMap response_headers_;
  std::vector<char> output_buffer_;
};
}  // namespace base
}  // namespace s3stream

#endif
