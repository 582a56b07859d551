/*
 * crypto/base64.cc
 * -------------------------------------------------------------------------
 * Base64 encoding, for Content-MD5 headers and signatures.
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

#include "crypto/base64.h"

#include <openssl/evp.h>

#include <limits>
#include <stdexcept>
#include <vector>

namespace s3stream {
namespace crypto {

std::string Base64::Encode(const uint8_t *input, size_t size) {
  if (size == 0) return std::string();

  if (size > static_cast<size_t>(std::numeric_limits<int>::max() / 4 * 3))
    throw std::runtime_error("input is too large to encode as base64.");

  // four characters for every three bytes, plus the terminator
  std::vector<unsigned char> out((size + 2) / 3 * 4 + 1);
  const int len = EVP_EncodeBlock(out.data(), input, static_cast<int>(size));

  if (len < 0) throw std::runtime_error("failed while encoding base64.");

  return std::string(reinterpret_cast<const char *>(out.data()),
                     static_cast<size_t>(len));
}

}  // namespace crypto
}  // namespace s3stream
