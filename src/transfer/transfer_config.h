/*
 * transfer/transfer_config.h
 * -------------------------------------------------------------------------
 * Per-transfer settings.
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

#ifndef S3STREAM_TRANSFER_TRANSFER_CONFIG_H
#define S3STREAM_TRANSFER_TRANSFER_CONFIG_H

#include <cstdint>
#include <string>

namespace s3stream {
namespace base {
class HttpClient;
}

namespace transfer {
// Settings for one transfer. Each Getter and Putter keeps its own copy, taken
// when the transfer starts.
struct TransferConfig {
  // Not owned, and shared by every transfer that uses it. If null, each
  // transfer creates its own curl-based client.
  base::HttpClient *http_client = nullptr;

  int concurrency = 10;
  int64_t part_size = 20 * 1024 * 1024;
  int max_retries = 10;
  bool verify_checksum = true;
  std::string scheme = "https";

  // Upload parts double in size every |part_growth_interval| parts, and an
  // upload may have at most |max_parts| parts.
  int part_growth_interval = 1000;
  int max_parts = 10000;

  // Requests carrying part data get |transfer_timeout_in_s|; all others get
  // |request_timeout_in_s|.
  int request_timeout_in_s = 30;
  int transfer_timeout_in_s = 300;

  static const TransferConfig &Defaults();

  // Takes the values currently held by base::Config.
  static TransferConfig FromConfig();

  // Returns 0, or -EINVAL if any setting is out of range.
  int Validate() const;
};
}  // namespace transfer
}  // namespace s3stream

#endif
