/*
 * base/statistics.cc
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

#include "base/statistics.h"

#include <fstream>
#include <mutex>
#include <stdexcept>

#include "base/logger.h"
#include "base/paths.h"

namespace s3stream {
namespace base {

namespace {
std::mutex s_mutex;
std::unique_ptr<std::ostream> s_output;

void RunWriters(std::ostream *output) {
  for (auto iter = Statistics::Writers::begin();
       iter != Statistics::Writers::end(); ++iter)
    iter->second(output);
}
}  // namespace

void Statistics::Init(std::unique_ptr<std::ostream> output) {
  std::lock_guard<std::mutex> lock(s_mutex);

  if (s_output)
    throw std::runtime_error("statistics output is already set.");

  s_output = std::move(output);
}

void Statistics::Init(const std::string &file) {
  const std::string path = Paths::Transform(file);
  std::unique_ptr<std::ofstream> f(
      new std::ofstream(path.c_str(), std::ofstream::trunc));

  if (!f->good()) {
    S3STREAM_LOG(LOG_ERR, "Statistics::Init", "cannot open [%s] for writing.\n",
                 path.c_str());
    throw std::runtime_error("cannot open statistics file.");
  }

  Init(std::unique_ptr<std::ostream>(std::move(f)));
}

void Statistics::Collect() {
  std::lock_guard<std::mutex> lock(s_mutex);

  if (!s_output) return;

  RunWriters(s_output.get());
  s_output->flush();
}

void Statistics::Collect(std::ostream *output) {
  std::lock_guard<std::mutex> lock(s_mutex);
  RunWriters(output);
}

void Statistics::Reset() {
  std::lock_guard<std::mutex> lock(s_mutex);
  s_output.reset();
}

}  // namespace base
}  // namespace s3stream
