/*
 * transfer/digest.h
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

#ifndef S3STREAM_TRANSFER_DIGEST_H
#define S3STREAM_TRANSFER_DIGEST_H

#include <string>

namespace s3stream {
namespace base {
class Request;
}

namespace transfer {
// The MD5 of each uploaded object is kept, as lower-case hex, in a separate
// object in the same bucket.
class Digest {
 public:
  // Key of the object holding the digest for |key|.
  static std::string GetKey(const std::string &key);

  // Fetches the digest stored at |url|. Returns 0, -ENOENT if there is none,
  // -EAGAIN on a transient failure, or -EPROTO.
  static int Fetch(base::Request *req, const std::string &url,
                   std::string *md5_hex);

  // Stores |md5_hex| at |url|. Returns 0, -EAGAIN or -EPROTO.
  static int Store(base::Request *req, const std::string &url,
                   const std::string &md5_hex);

  // Case-insensitive comparison, ignoring surrounding whitespace.
  static bool Matches(const std::string &stored, const std::string &computed);
};
}  // namespace transfer
}  // namespace s3stream

#endif
