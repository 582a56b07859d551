/*
 * base/transport.h
 * -------------------------------------------------------------------------
 * Interface between requests and the HTTP implementation that carries
 * them.
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

#ifndef S3STREAM_BASE_TRANSPORT_H
#define S3STREAM_BASE_TRANSPORT_H

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "base/request.h"

namespace s3stream {
namespace base {
struct Response {
  int code = 0;
  HeaderMap headers;
  std::vector<char> body;
};

// Raised when a request produced no HTTP response at all. error_code() is
// -EAGAIN for failures worth retrying (connection reset, resolver hiccup),
// -ETIMEDOUT when the deadline passed, and -EIO otherwise.
class TransportError : public std::runtime_error {
 public:
  inline TransportError(int error_code, const std::string &what)
      : std::runtime_error(what), error_code_(error_code) {}

  inline int error_code() const { return error_code_; }

 private:
  int error_code_;
};

class Transport {
 public:
  virtual ~Transport() = default;

  virtual void Perform(const Request &req, int timeout_in_s,
                       Response *response) = 0;
};

// Hands out transports that share whatever the client shares (connection
// settings, a mock service in tests). Must be safe to call from any thread.
class HttpClient {
 public:
  virtual ~HttpClient() = default;

  virtual std::unique_ptr<Transport> CreateTransport() = 0;

  // Default per-request timeout.
  virtual int timeout_in_s() const = 0;
};
}  // namespace base
}  // namespace s3stream

#endif
