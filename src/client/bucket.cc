/*
 * client/bucket.cc
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

#include "client/bucket.h"

#include "base/request_hook.h"
#include "base/url.h"
#include "client/s3.h"
#include "services/aws_signer.h"
#include "transfer/digest.h"

namespace s3stream {
namespace client {

namespace {
std::string StripLeadingSlash(const std::string &path) {
  return (!path.empty() && path[0] == '/') ? path.substr(1) : path;
}
}  // namespace

Bucket::Bucket(const S3 &account, const std::string &name)
    : account_(account), name_(name) {}

const std::string &Bucket::domain() const { return account_.domain(); }

const Keys &Bucket::keys() const { return account_.keys(); }

std::string Bucket::Url(const std::string &path,
                        const transfer::TransferConfig &config) const {
  return config.scheme + "://" + name_ + "." + domain() + "/" +
         base::Url::Encode(StripLeadingSlash(path));
}

int Bucket::GetReader(const std::string &path,
                      const transfer::TransferConfig *config,
                      std::unique_ptr<transfer::Getter> *reader,
                      base::HeaderMap *headers) const {
  const transfer::TransferConfig c =
      config ? *config : transfer::TransferConfig::FromConfig();
  const std::string key = StripLeadingSlash(path);

  return transfer::Getter::Open(Url(key, c),
                                Url(transfer::Digest::GetKey(key), c),
                                NewSigner(), c, reader, headers);
}

int Bucket::PutWriter(const std::string &path, const base::HeaderMap &headers,
                      const transfer::TransferConfig *config,
                      std::unique_ptr<transfer::Putter> *writer) const {
  const transfer::TransferConfig c =
      config ? *config : transfer::TransferConfig::FromConfig();
  const std::string key = StripLeadingSlash(path);

  return transfer::Putter::Open(Url(key, c),
                                Url(transfer::Digest::GetKey(key), c),
                                headers, NewSigner(), c, writer);
}

std::unique_ptr<base::RequestHook> Bucket::NewSigner() const {
  return std::unique_ptr<base::RequestHook>(new services::AwsSigner(
      keys().access_key(), keys().secret_key(), name_));
}

}  // namespace client
}  // namespace s3stream
