/*
 * transfer/digest.cc
 * -------------------------------------------------------------------------
 * Side objects holding the MD5 of uploaded objects.
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

#include "transfer/digest.h"

#include <ctype.h>
#include <errno.h>
#include <strings.h>

#include "base/logger.h"
#include "base/request.h"
#include "services/utils.h"

namespace s3stream {
namespace transfer {

namespace {
const std::string DIGEST_PREFIX = ".md5/";
const std::string DIGEST_SUFFIX = ".md5";

std::string Trim(const std::string &s) {
  size_t first = 0, last = s.size();

  while (first < last && isspace(static_cast<unsigned char>(s[first])))
    first++;
  while (last > first && isspace(static_cast<unsigned char>(s[last - 1])))
    last--;

  return s.substr(first, last - first);
}
}  // namespace

std::string Digest::GetKey(const std::string &key) {
  return DIGEST_PREFIX + key + DIGEST_SUFFIX;
}

int Digest::Fetch(base::Request *req, const std::string &url,
                  std::string *md5_hex) {
  req->Init(base::HttpMethod::GET);
  req->SetUrl(url);
  req->Run();

  if (req->response_code() == base::HTTP_SC_NOT_FOUND) return -ENOENT;

  if (services::IsTransientResponse(*req)) return -EAGAIN;

  if (req->response_code() != base::HTTP_SC_OK) {
    S3STREAM_LOG(LOG_WARNING, "Digest::Fetch",
                 "unexpected status %i for digest at [%s].\n",
                 req->response_code(), url.c_str());
    return -EPROTO;
  }

  *md5_hex = Trim(req->GetOutputAsString());
  return 0;
}

int Digest::Store(base::Request *req, const std::string &url,
                  const std::string &md5_hex) {
  req->Init(base::HttpMethod::PUT);
  req->SetUrl(url);
  req->SetHeader("Content-Type", "text/plain");
  req->SetInputBuffer(md5_hex);
  req->Run();

  if (services::IsTransientResponse(*req)) return -EAGAIN;

  if (req->response_code() != base::HTTP_SC_OK) {
    S3STREAM_LOG(LOG_WARNING, "Digest::Store",
                 "unexpected status %i storing digest at [%s].\n",
                 req->response_code(), url.c_str());
    return -EPROTO;
  }

  return 0;
}

bool Digest::Matches(const std::string &stored, const std::string &computed) {
  const std::string trimmed = Trim(stored);

  return trimmed.size() == computed.size() &&
         strcasecmp(trimmed.c_str(), computed.c_str()) == 0;
}

}  // namespace transfer
}  // namespace s3stream
