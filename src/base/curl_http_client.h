/*
 * base/curl_http_client.h
 * -------------------------------------------------------------------------
 * HTTP client implemented with libcurl.
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

#ifndef S3STREAM_BASE_CURL_HTTP_CLIENT_H
#define S3STREAM_BASE_CURL_HTTP_CLIENT_H

#include <memory>

#include "base/transport.h"

namespace s3stream {
namespace base {
// An HttpClient backed by libcurl. Every transport owns one curl easy handle,
// so connections are reused by whichever worker holds the transport.
class CurlHttpClient : public HttpClient {
 public:
  explicit CurlHttpClient(int timeout_in_s);
  ~CurlHttpClient() override = default;

  std::unique_ptr<Transport> CreateTransport() override;
  int timeout_in_s() const override;

 private:
  const int timeout_in_s_;
};
}  // namespace base
}  // namespace s3stream

#endif
