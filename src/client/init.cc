/*
 * client/init.cc
 * -------------------------------------------------------------------------
 * Library initialization.
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

#include "client/init.h"

#include "base/config.h"
#include "base/statistics.h"
#include "base/xml.h"

namespace s3stream {
namespace client {

namespace {
bool s_stats_enabled = false;
}

void Init::Base(int flags, int verbosity, const std::string &config_file) {
  base::Logger::Init((flags & IB_LOG_TO_SYSLOG) ? base::Logger::Mode::SYSLOG
                                                : base::Logger::Mode::STDERR,
                     verbosity);

  if (flags & IB_LOAD_CONFIG) base::Config::Init(config_file);

  base::XmlDocument::Init();

  if ((flags & IB_WITH_STATS) && !base::Config::stats_file().empty()) {
    base::Statistics::Init(base::Config::stats_file());
    s_stats_enabled = true;
  }
}

void Init::Cleanup() {
  if (!s_stats_enabled) return;

  base::Statistics::Collect();
  base::Statistics::Reset();
  s_stats_enabled = false;
}

}  // namespace client
}  // namespace s3stream
