/*
 * client/s3.h
 * -------------------------------------------------------------------------
 * An account on a storage service.
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

#ifndef S3STREAM_CLIENT_S3_H
#define S3STREAM_CLIENT_S3_H

#include <string>

#include "client/bucket.h"
#include "client/keys.h"

namespace s3stream {
namespace client {
// An account on one storage service.
class S3 {
 public:
  // An empty |domain| means base::Config::default_domain().
  S3(const std::string &domain, const Keys &keys);

  inline const std::string &domain() const { return domain_; }
  inline const Keys &keys() const { return keys_; }

  // The returned bucket refers to this account, and must not outlive it.
  Bucket GetBucket(const std::string &name) const;

 private:
  std::string domain_;
  Keys keys_;
};
}  // namespace client
}  // namespace s3stream

#endif
