/*
 * services/utils.h
 * -------------------------------------------------------------------------
 * Helpers shared by service request code.
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

#ifndef S3STREAM_SERVICES_UTILS_H
#define S3STREAM_SERVICES_UTILS_H

#include <string>

namespace s3stream {
namespace base {
class Request;
}

namespace services {
template <class MapType>
const typename MapType::mapped_type &FindOrDefault(
    const MapType &map, const typename MapType::key_type &key) {
  static const auto DEFAULT = typename MapType::mapped_type();
  const auto iter = map.find(key);
  return (iter == map.end()) ? DEFAULT : iter->second;
}

// True if |r| got a response that is worth sending the request again for: a
// server-side error, or a 400 carrying a RequestTimeout error code.
bool IsTransientResponse(const base::Request &r);

}  // namespace services
}  // namespace s3stream

#endif
