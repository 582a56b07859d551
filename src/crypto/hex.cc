/*
 * crypto/hex.cc
 * -------------------------------------------------------------------------
 * Lowercase hexadecimal encoding.
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

#include "crypto/hex.h"

namespace s3stream {
namespace crypto {

std::string Hex::Encode(const uint8_t *input, size_t size) {
  static const char DIGITS[] = "0123456789abcdef";
  std::string out;

  out.reserve(size * 2);

  for (const uint8_t *end = input + size; input != end; ++input) {
    out += DIGITS[*input >> 4];
    out += DIGITS[*input & 0x0f];
  }

  return out;
}

}  // namespace crypto
}  // namespace s3stream
