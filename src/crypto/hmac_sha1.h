/*
 * crypto/hmac_sha1.h
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

#ifndef S3STREAM_CRYPTO_HMAC_SHA1_H
#define S3STREAM_CRYPTO_HMAC_SHA1_H

#include <array>
#include <cstdint>
#include <string>

namespace s3stream {
namespace crypto {
class HmacSha1 {
 public:
  static constexpr size_t MAC_LEN = 160 / 8;

  using Mac = std::array<uint8_t, MAC_LEN>;

  static Mac Sign(const std::string &key, const std::string &data);

  // MAC of |data| under |key|, encoded with |EncoderType|.
  template <class EncoderType>
  inline static std::string Sign(const std::string &key,
                                 const std::string &data) {
    const Mac mac = Sign(key, data);
    return EncoderType::Encode(mac.data(), mac.size());
  }
};
}  // namespace crypto
}  // namespace s3stream

#endif
