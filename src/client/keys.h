/*
 * client/keys.h
 * -------------------------------------------------------------------------
 * Access credentials for an account.
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

#ifndef S3STREAM_CLIENT_KEYS_H
#define S3STREAM_CLIENT_KEYS_H

#include <string>

namespace s3stream {
namespace client {
class Keys {
 public:
  inline Keys(const std::string &access_key, const std::string &secret_key)
      : access_key_(access_key), secret_key_(secret_key) {}

  inline const std::string &access_key() const { return access_key_; }
  inline const std::string &secret_key() const { return secret_key_; }

 private:
  std::string access_key_, secret_key_;
};
}  // namespace client
}  // namespace s3stream

#endif
