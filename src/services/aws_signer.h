/*
 * services/aws_signer.h
 * -------------------------------------------------------------------------
 * Signs requests with AWS signature version 2.
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

#ifndef S3STREAM_SERVICES_AWS_SIGNER_H
#define S3STREAM_SERVICES_AWS_SIGNER_H

#include <string>

#include "base/request_hook.h"

namespace s3stream {
namespace base {
class Request;
}

namespace services {
// Signs requests against one bucket with AWS signature version 2. Stateless
// once constructed, so one signer serves every worker of a transfer.
class AwsSigner : public base::RequestHook {
 public:
  AwsSigner(const std::string &access_key, const std::string &secret_key,
            const std::string &bucket);

  void PreRun(base::Request *req) override;

  // Builds the string the signature is computed over, for |req| sent at
  // |date|.
  std::string BuildStringToSign(const base::Request &req,
                                const std::string &date) const;

  // "/<bucket>/<key>" followed by any sub-resources in |url|'s query.
  std::string BuildCanonicalResource(const std::string &url) const;

  static std::string ComputeSignature(const std::string &secret_key,
                                      const std::string &to_sign);

 private:
  std::string access_key_, secret_key_, bucket_;
};
}  // namespace services
}  // namespace s3stream

#endif
