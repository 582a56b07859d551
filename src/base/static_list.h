/*
 * base/static_list.h
 * -------------------------------------------------------------------------
 * Static initializer-populated list.
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

#ifndef S3STREAM_BASE_STATIC_LIST_H
#define S3STREAM_BASE_STATIC_LIST_H

#include <map>

namespace s3stream {
namespace base {
// A list populated by static initializers, ordered by priority (lowest
// first).
template <class T>
class StaticList {
 private:
  using PriorityMap = std::multimap<int, T>;

 public:
  using ConstIterator = typename PriorityMap::const_iterator;

  class Entry {
   public:
    inline Entry(const T &t, int priority) { Add(t, priority); }
  };

  inline static ConstIterator begin() { return GetList()->begin(); }
  inline static ConstIterator end() { return GetList()->end(); }

 private:
  inline static PriorityMap *GetList() {
    static auto *list = new PriorityMap();
    return list;
  }

  inline static void Add(const T &t, int priority) {
    GetList()->insert(std::make_pair(priority, t));
  }
};
}  // namespace base
}  // namespace s3stream

#endif
