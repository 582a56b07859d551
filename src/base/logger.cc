/*
 * base/logger.cc
 * -------------------------------------------------------------------------
 * Implements logging to stderr, syslog or an application sink.
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

#include "base/logger.h"

#include <mutex>
#include <vector>

namespace s3stream {
namespace base {

namespace {
// log warnings and worse unless instructed otherwise; this is a library, so
// the host application decides whether we get to write to syslog
int s_max_level = LOG_WARNING;
Logger::Mode s_mode = Logger::Mode::STDERR;
Logger::Sink s_sink;
std::mutex s_mutex;

std::string Format(const char *message, va_list args) {
  va_list copy;

  va_copy(copy, args);
  const int len = vsnprintf(nullptr, 0, message, copy);
  va_end(copy);

  if (len <= 0) return std::string();

  std::vector<char> buf(static_cast<size_t>(len) + 1);
  vsnprintf(buf.data(), buf.size(), message, args);
  return std::string(buf.data(), static_cast<size_t>(len));
}
}  // namespace

void Logger::Init(Mode mode, int max_level) {
  std::lock_guard<std::mutex> lock(s_mutex);
  s_max_level = max_level;
  s_mode = mode;
  if (s_mode == Mode::SYSLOG) openlog(PACKAGE_NAME, 0, 0);
}

void Logger::SetSink(Sink sink) {
  std::lock_guard<std::mutex> lock(s_mutex);
  s_sink = std::move(sink);
}

bool Logger::IsEnabled(int level) {
  std::lock_guard<std::mutex> lock(s_mutex);
  return level <= s_max_level && (s_sink || s_mode != Mode::NONE);
}

void Logger::Log(int level, const char *message, ...) {
  std::lock_guard<std::mutex> lock(s_mutex);
  va_list args;

  if (level > s_max_level) return;

  va_start(args, message);

  if (s_sink)
    s_sink(level, Format(message, args));
  else if (s_mode == Mode::SYSLOG)
    vsyslog(level, message, args);
  else if (s_mode == Mode::STDERR)
    vfprintf(stderr, message, args);

  va_end(args);
}

}  // namespace base
}  // namespace s3stream
