/*
 * base/config.cc
 * -------------------------------------------------------------------------
 * Parses the configuration file and applies the constraints in config.inc.
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

#include "base/config.h"

#include <strings.h>

#include <boost/lexical_cast.hpp>
#include <fstream>
#include <stdexcept>

#include "base/logger.h"
#include "base/paths.h"

namespace s3stream {
namespace base {

namespace {
const std::string DEFAULT_CONFIG_FILES[] = {"~/." PACKAGE_NAME
                                            "/" PACKAGE_NAME ".conf",
                                            SYSCONFDIR "/" PACKAGE_NAME
                                            ".conf"};

template <typename T>
class OptionParserWorker {
 public:
  static void Parse(const std::string &str, T *out) {
    *out = boost::lexical_cast<T>(str);
  }
};

template <>
class OptionParserWorker<std::string> {
 public:
  static void Parse(const std::string &str, std::string *out) { *out = str; }
};

template <>
class OptionParserWorker<bool> {
 public:
  static void Parse(const std::string &in, bool *out) {
    const char *str = in.c_str();

    if (!strcasecmp(str, "yes") || !strcasecmp(str, "true") ||
        !strcasecmp(str, "1") || !strcasecmp(str, "on")) {
      *out = true;
      return;
    }

    if (!strcasecmp(str, "no") || !strcasecmp(str, "false") ||
        !strcasecmp(str, "0") || !strcasecmp(str, "off")) {
      *out = false;
      return;
    }

    throw std::runtime_error("cannot parse.");
  }
};

template <typename T>
class OptionParser {
 public:
  static void Parse(int line_number, const char *key, const char *type,
                    const std::string &str, T *out) {
    try {
      OptionParserWorker<T>::Parse(str, out);
    } catch (const std::exception &) {
      S3STREAM_LOG(
          LOG_ERR, "Config::Init",
          "error at line %i: cannot parse [%s] for key [%s] of type %s.\n",
          line_number, str.c_str(), key, type);
      throw std::runtime_error("malformed config file");
    }
  }
};

std::string Trim(const std::string &in) {
  const char *WHITESPACE = " \t\r\n";
  const size_t first = in.find_first_not_of(WHITESPACE);
  if (first == std::string::npos) return "";
  const size_t last = in.find_last_not_of(WHITESPACE);
  return in.substr(first, last - first + 1);
}
}  // namespace

#define CONFIG(type, name, def, desc) type Config::s_##name = (def);
#define CONFIG_CONSTRAINT(x, y)
#define CONFIG_KEY(x)
#define CONFIG_SECTION(x)

#include "base/config.inc"

#undef CONFIG
#undef CONFIG_CONSTRAINT
#undef CONFIG_KEY
#undef CONFIG_SECTION

void Config::Init(const std::string &file) {
  std::ifstream ifs;
  int line_number = 0;

  if (file.empty()) {
    for (const auto &f : DEFAULT_CONFIG_FILES) {
      ifs.open(Paths::Transform(f).c_str());
      if (ifs.good()) break;
      ifs.clear();
    }

    if (!ifs.is_open()) {
      for (const auto &f : DEFAULT_CONFIG_FILES)
        S3STREAM_LOG(LOG_ERR, "Config::Init",
                     "unable to open configuration in [%s]\n", f.c_str());

      throw std::runtime_error("cannot open any default config files");
    }
  } else {
    ifs.open(Paths::Transform(file).c_str());

    if (ifs.fail()) {
      S3STREAM_LOG(LOG_ERR, "Config::Init", "cannot open file [%s].\n",
                   file.c_str());
      throw std::runtime_error("cannot open specified config file");
    }
  }

  int keys_found = 0;

  while (ifs.good()) {
    std::string line;

    std::getline(ifs, line);
    line_number++;

    size_t pos = line.find('#');
    if (pos != std::string::npos) line = line.substr(0, pos);

    line = Trim(line);
    if (line.empty()) continue;

    pos = line.find('=');

    if (pos == std::string::npos) {
      S3STREAM_LOG(LOG_ERR, "Config::Init", "error at line %i: missing '='.\n",
                   line_number);
      throw std::runtime_error("malformed config file");
    }

    const std::string key = Trim(line.substr(0, pos));
    const std::string value = Trim(line.substr(pos + 1));

#define CONFIG(type, name, def, desc)                                    \
  if (key == #name) {                                                    \
    OptionParser<type>::Parse(line_number, #name, #type, value, &s_##name); \
    keys_found++;                                                        \
    continue;                                                            \
  }

#define CONFIG_CONSTRAINT(x, y)
#define CONFIG_KEY(x)
#define CONFIG_SECTION(x)

#include "base/config.inc"

#undef CONFIG
#undef CONFIG_CONSTRAINT
#undef CONFIG_KEY
#undef CONFIG_SECTION

    S3STREAM_LOG(LOG_ERR, "Config::Init",
                 "error at line %i: unknown directive '%s'\n", line_number,
                 key.c_str());
    throw std::runtime_error("malformed config file");
  }

  if (keys_found == 0) {
    S3STREAM_LOG(LOG_ERR, "Config::Init", "no configuration keys found.\n");
    throw std::runtime_error("empty config file");
  }

#define CONFIG(type, name, def, desc)

#define CONFIG_CONSTRAINT(test, message)                           \
  if (!(test)) {                                                   \
    S3STREAM_LOG(LOG_ERR, "Config::Init", "%s\n", message);        \
    throw std::runtime_error("malformed config file");             \
  }

#define CONFIG_KEY(key) s_##key
#define CONFIG_SECTION(x)

#include "base/config.inc"

#undef CONFIG
#undef CONFIG_CONSTRAINT
#undef CONFIG_KEY
#undef CONFIG_SECTION
}

}  // namespace base
}  // namespace s3stream
