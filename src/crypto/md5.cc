/*
 * crypto/md5.cc
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

#include "crypto/md5.h"

#include <openssl/evp.h>

#include <memory>
#include <stdexcept>

namespace s3stream {
namespace crypto {

namespace {
using ContextPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
}

Md5::Digest Md5::Compute(const void *data, size_t size) {
  Digest digest;

  if (!EVP_Digest(data, size, digest.data(), nullptr, EVP_md5(), nullptr))
    throw std::runtime_error("EVP_Digest() failed for md5.");

  return digest;
}

Md5Stream::Md5Stream() {
  ContextPtr context(EVP_MD_CTX_new(), &EVP_MD_CTX_free);

  if (!context) throw std::runtime_error("failed to allocate md5 context.");

  if (!EVP_DigestInit_ex(context.get(), EVP_md5(), nullptr))
    throw std::runtime_error("failed to initialize md5 context.");

  context_ = context.release();
}

Md5Stream::~Md5Stream() { EVP_MD_CTX_free(context_); }

void Md5Stream::Update(const char *data, size_t size) {
  if (size && !EVP_DigestUpdate(context_, data, size))
    throw std::runtime_error("EVP_DigestUpdate() failed for md5.");
}

Md5::Digest Md5Stream::Finish() const {
  // finalize a copy so that the running context stays usable
  ContextPtr copy(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  Md5::Digest digest;

  if (!copy) throw std::runtime_error("failed to allocate md5 context.");

  if (!EVP_MD_CTX_copy_ex(copy.get(), context_) ||
      !EVP_DigestFinal_ex(copy.get(), digest.data(), nullptr))
    throw std::runtime_error("failed to finalize md5.");

  return digest;
}

}  // namespace crypto
}  // namespace s3stream
