/*
 * crypto/hmac_sha1.cc
 * -------------------------------------------------------------------------
 * HMAC-SHA1 signatures for request authentication.
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

#include "crypto/hmac_sha1.h"

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <stdexcept>

namespace s3stream {
namespace crypto {

HmacSha1::Mac HmacSha1::Sign(const std::string &key,
                             const std::string &data) {
  Mac mac;
  unsigned int len = 0;

  if (!HMAC(EVP_sha1(), key.data(), static_cast<int>(key.size()),
            reinterpret_cast<const unsigned char *>(data.data()), data.size(),
            mac.data(), &len) ||
      len != MAC_LEN)
    throw std::runtime_error("HMAC() failed for sha1.");

  return mac;
}

}  // namespace crypto
}  // namespace s3stream
