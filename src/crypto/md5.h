/*
 * crypto/md5.h
 * -------------------------------------------------------------------------
 * MD5 digests of whole buffers and of streamed data.
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

#ifndef S3STREAM_CRYPTO_MD5_H
#define S3STREAM_CRYPTO_MD5_H

#include <array>
#include <cstdint>
#include <string>
#include <vector>

struct evp_md_ctx_st;

namespace s3stream {
namespace crypto {
class Md5 {
 public:
  static constexpr size_t HASH_LEN = 128 / 8;

  using Digest = std::array<uint8_t, HASH_LEN>;

  static Digest Compute(const void *data, size_t size);

  inline static Digest Compute(const std::string &data) {
    return Compute(data.data(), data.size());
  }

  inline static Digest Compute(const std::vector<char> &data) {
    return Compute(data.data(), data.size());
  }

  inline static Digest Compute(const std::vector<uint8_t> &data) {
    return Compute(data.data(), data.size());
  }

  // Digest of |data|, encoded with |EncoderType| (Hex, Base64, ...).
  template <class EncoderType, class Input>
  inline static std::string Compute(const Input &data) {
    return Encode<EncoderType>(Compute(data));
  }

  template <class EncoderType>
  inline static std::string Encode(const Digest &digest) {
    return EncoderType::Encode(digest.data(), digest.size());
  }
};

// Running MD5 over data that arrives in pieces. Not thread-safe.
class Md5Stream {
 public:
  Md5Stream();
  ~Md5Stream();

  Md5Stream(const Md5Stream &) = delete;
  Md5Stream &operator=(const Md5Stream &) = delete;

  void Update(const char *data, size_t size);

  // Digest of everything passed to Update() so far. Update() may be called
  // again afterwards.
  Md5::Digest Finish() const;

  template <class EncoderType>
  inline std::string Finish() const {
    return Md5::Encode<EncoderType>(Finish());
  }

 private:
  evp_md_ctx_st *context_ = nullptr;
};
}  // namespace crypto
}  // namespace s3stream

#endif
