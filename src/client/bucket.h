/*
 * client/bucket.h
 * -------------------------------------------------------------------------
 * A bucket, and the entry points for streaming objects in and out of it.
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

#ifndef S3STREAM_CLIENT_BUCKET_H
#define S3STREAM_CLIENT_BUCKET_H

#include <memory>
#include <string>

#include "base/request.h"
#include "transfer/getter.h"
#include "transfer/putter.h"
#include "transfer/transfer_config.h"

namespace s3stream {
namespace client {
class Keys;
class S3;

class Bucket {
 public:
  Bucket(const S3 &account, const std::string &name);

  inline const std::string &name() const { return name_; }
  const std::string &domain() const;
  const Keys &keys() const;

  // "<scheme>://<bucket>.<domain>/<key>", with the key URL-encoded. A
  // leading slash in |path| is ignored.
  std::string Url(const std::string &path,
                  const transfer::TransferConfig &config) const;

  // Opens |path| for reading. A null |config| means
  // transfer::TransferConfig::FromConfig(). Response headers of the object go
  // in |headers| if it is non-null.
  int GetReader(const std::string &path,
                const transfer::TransferConfig *config,
                std::unique_ptr<transfer::Getter> *reader,
                base::HeaderMap *headers) const;

  // Opens |path| for writing, sending |headers| when the upload starts. A
  // null |config| is handled as in GetReader().
  int PutWriter(const std::string &path, const base::HeaderMap &headers,
                const transfer::TransferConfig *config,
                std::unique_ptr<transfer::Putter> *writer) const;

 private:
  std::unique_ptr<base::RequestHook> NewSigner() const;

  const S3 &account_;
  std::string name_;
};
}  // namespace client
}  // namespace s3stream

#endif
