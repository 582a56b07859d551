/*
 * base/url.cc
 * -------------------------------------------------------------------------
 * URL helpers (implementation).
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

#include "base/url.h"

#include <ctype.h>

#include <cstdint>
#include <string>

namespace s3stream {
namespace base {

std::string Url::Encode(const std::string &url) {
  constexpr char HEX[] = "0123456789ABCDEF";

  std::string ret;
  ret.reserve(url.length());

  for (size_t i = 0; i < url.length(); i++) {
    if (url[i] == '/' || url[i] == '.' || url[i] == '-' || url[i] == '~' ||
        url[i] == '_' || isalnum(static_cast<unsigned char>(url[i]))) {
      ret += url[i];
    } else {
      ret += '%';
      ret += HEX[static_cast<uint8_t>(url[i]) / 16];
      ret += HEX[static_cast<uint8_t>(url[i]) % 16];
    }
  }

  return ret;
}

void Url::Split(const std::string &url, std::string *path,
                std::string *query) {
  size_t start = url.find("://");
  start = (start == std::string::npos) ? 0 : url.find('/', start + 3);

  if (start == std::string::npos) {
    *path = "/";
    query->clear();
    return;
  }

  const size_t q = url.find('?', start);
  if (q == std::string::npos) {
    *path = url.substr(start);
    query->clear();
  } else {
    *path = url.substr(start, q - start);
    *query = url.substr(q + 1);
  }
}

}  // namespace base
}  // namespace s3stream
