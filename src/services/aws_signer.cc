/*
 * services/aws_signer.cc
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

#include "services/aws_signer.h"

#include <ctype.h>

#include <map>
#include <sstream>

#include "base/request.h"
#include "base/timer.h"
#include "base/url.h"
#include "crypto/base64.h"
#include "crypto/hmac_sha1.h"
#include "services/utils.h"

namespace s3stream {
namespace services {

namespace {
const std::string HEADER_PREFIX = "x-amz-";

// Query parameters that name a sub-resource, and so are part of what gets
// signed.
const char *SUB_RESOURCES[] = {"partNumber", "uploadId", "uploads"};

bool IsSubResource(const std::string &name) {
  for (const char *sub : SUB_RESOURCES)
    if (name == sub) return true;

  return false;
}

std::string ToLower(std::string s) {
  for (auto &c : s)
    c = static_cast<char>(tolower(static_cast<unsigned char>(c)));
  return s;
}
}  // namespace

AwsSigner::AwsSigner(const std::string &access_key,
                     const std::string &secret_key, const std::string &bucket)
    : access_key_(access_key), secret_key_(secret_key), bucket_(bucket) {}

void AwsSigner::PreRun(base::Request *req) {
  const std::string date = base::Timer::GetHttpTime();
  req->SetHeader("Date", date);

  req->SetHeader("Authorization",
                 std::string("AWS ") + access_key_ + ":" +
                     ComputeSignature(secret_key_,
                                      BuildStringToSign(*req, date)));
}

std::string AwsSigner::BuildStringToSign(const base::Request &req,
                                         const std::string &date) const {
  const auto &headers = req.headers();
  std::string to_sign = std::string(base::HttpMethodToString(req.method())) +
                        "\n" + FindOrDefault(headers, "Content-MD5") + "\n" +
                        FindOrDefault(headers, "Content-Type") + "\n" + date +
                        "\n";

  // HeaderMap is already ordered case-insensitively
  for (const auto &header : headers) {
    const std::string name = ToLower(header.first);

    if (!header.second.empty() &&
        name.compare(0, HEADER_PREFIX.size(), HEADER_PREFIX) == 0)
      to_sign += name + ":" + header.second + "\n";
  }

  to_sign += BuildCanonicalResource(req.url());
  return to_sign;
}

std::string AwsSigner::BuildCanonicalResource(const std::string &url) const {
  std::string path, query;
  base::Url::Split(url, &path, &query);

  std::map<std::string, std::string> sub_resources;
  std::istringstream query_stream(query);
  std::string param;

  while (std::getline(query_stream, param, '&')) {
    const size_t eq = param.find('=');
    const std::string name = param.substr(0, eq);

    if (IsSubResource(name))
      sub_resources[name] =
          (eq == std::string::npos) ? std::string() : param.substr(eq);
  }

  std::string resource = "/" + bucket_ + path;
  char separator = '?';

  for (const auto &sub : sub_resources) {
    resource += separator + sub.first + sub.second;
    separator = '&';
  }

  return resource;
}

std::string AwsSigner::ComputeSignature(const std::string &secret_key,
                                        const std::string &to_sign) {
  return crypto::HmacSha1::Sign<crypto::Base64>(secret_key, to_sign);
}

}  // namespace services
}  // namespace s3stream
