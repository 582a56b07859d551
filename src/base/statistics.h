/*
 * base/statistics.h
 * -------------------------------------------------------------------------
 * Collects transfer statistics from registered writers.
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

#ifndef S3STREAM_BASE_STATISTICS_H
#define S3STREAM_BASE_STATISTICS_H

#include <functional>
#include <memory>
#include <ostream>
#include <string>

#include "base/static_list.h"

namespace s3stream {
namespace base {
// Modules register a writer (see StaticList) that reports their counters.
// Writers run in priority order, lowest first.
class Statistics {
 public:
  using WriterCallback = std::function<void(std::ostream *)>;
  using Writers = StaticList<WriterCallback>;

  // Each throws if an output is already set.
  static void Init(std::unique_ptr<std::ostream> output);
  static void Init(const std::string &file);

  // Runs every writer against the output given to Init(), then flushes it.
  // Does nothing if there is no output.
  static void Collect();

  // Runs every writer against |output|, whether or not Init() was called.
  static void Collect(std::ostream *output);

  // Drops the output so that Init() may be called again.
  static void Reset();
};
}  // namespace base
}  // namespace s3stream

#endif
