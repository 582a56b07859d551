/*
 * client/s3.cc
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

#include "client/s3.h"

#include "base/config.h"

namespace s3stream {
namespace client {

S3::S3(const std::string &domain, const Keys &keys)
    : domain_(domain.empty() ? base::Config::default_domain() : domain),
      keys_(keys) {}

Bucket S3::GetBucket(const std::string &name) const {
  return Bucket(*this, name);
}

}  // namespace client
}  // namespace s3stream
