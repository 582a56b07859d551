/*
 * client/init.h
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

#ifndef S3STREAM_CLIENT_INIT_H
#define S3STREAM_CLIENT_INIT_H

#include <string>

#include "base/logger.h"

namespace s3stream {
namespace client {
class Init {
 public:
  enum BaseFlags {
    IB_NONE = 0x0,
    IB_LOAD_CONFIG = 0x1,
    IB_WITH_STATS = 0x2,
    IB_LOG_TO_SYSLOG = 0x4,
  };

  // Sets up logging (to stderr unless IB_LOG_TO_SYSLOG is given), reads the
  // configuration file (the default locations if |config_file| is empty) and
  // prepares the XML parser. Throws if the configuration cannot be loaded.
  static void Base(int flags = IB_LOAD_CONFIG, int verbosity = LOG_WARNING,
                   const std::string &config_file = "");

  // Writes out statistics, if they were enabled.
  static void Cleanup();
};
}  // namespace client
}  // namespace s3stream

#endif
