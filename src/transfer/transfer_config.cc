/*
 * transfer/transfer_config.cc
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

#include "transfer/transfer_config.h"

#include <errno.h>

#include "base/config.h"
#include "base/logger.h"

namespace s3stream {
namespace transfer {

const TransferConfig &TransferConfig::Defaults() {
  static const TransferConfig s_defaults;
  return s_defaults;
}

TransferConfig TransferConfig::FromConfig() {
  TransferConfig config;

  config.concurrency = base::Config::concurrency();
  config.part_size = base::Config::part_size();
  config.max_retries = base::Config::max_retries();
  config.verify_checksum = base::Config::verify_checksum();
  config.scheme = base::Config::url_scheme();
  config.part_growth_interval = base::Config::part_growth_interval();
  config.max_parts = base::Config::max_parts();
  config.request_timeout_in_s = base::Config::request_timeout_in_s();
  config.transfer_timeout_in_s = base::Config::transfer_timeout_in_s();

  return config;
}

int TransferConfig::Validate() const {
  if (concurrency < 1) {
    S3STREAM_LOG(LOG_ERR, "TransferConfig::Validate",
                 "concurrency must be at least 1, got %i.\n", concurrency);
    return -EINVAL;
  }

  if (part_size < base::Config::min_part_size()) {
    S3STREAM_LOG(LOG_ERR, "TransferConfig::Validate",
                 "part size %" PRId64 " is below the minimum of %" PRId64
                 ".\n",
                 part_size, base::Config::min_part_size());
    return -EINVAL;
  }

  if (max_retries < 0) {
    S3STREAM_LOG(LOG_ERR, "TransferConfig::Validate",
                 "max_retries cannot be negative, got %i.\n", max_retries);
    return -EINVAL;
  }

  if (part_growth_interval < 1 || max_parts < 1) {
    S3STREAM_LOG(LOG_ERR, "TransferConfig::Validate",
                 "part_growth_interval (%i) and max_parts (%i) must be "
                 "positive.\n",
                 part_growth_interval, max_parts);
    return -EINVAL;
  }

  if (request_timeout_in_s < 1 || transfer_timeout_in_s < 1) {
    S3STREAM_LOG(LOG_ERR, "TransferConfig::Validate",
                 "timeouts must be positive, got %i and %i.\n",
                 request_timeout_in_s, transfer_timeout_in_s);
    return -EINVAL;
  }

  if (scheme != "http" && scheme != "https") {
    S3STREAM_LOG(LOG_ERR, "TransferConfig::Validate",
                 "unsupported URL scheme [%s].\n", scheme.c_str());
    return -EINVAL;
  }

  return 0;
}

}  // namespace transfer
}  // namespace s3stream
