/*
 * base/timer.h
 * -------------------------------------------------------------------------
 * Timing and HTTP date helpers.
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

#ifndef S3STREAM_BASE_TIMER_H
#define S3STREAM_BASE_TIMER_H

#include <errno.h>
#include <stdio.h>
#include <time.h>

#include <string>

namespace s3stream {
namespace base {
class Timer {
 public:
  // Seconds since an arbitrary point. Only differences mean anything.
  inline static double GetMonotonicTime() {
    timespec t;
    clock_gettime(CLOCK_MONOTONIC, &t);
    return static_cast<double>(t.tv_sec) +
           static_cast<double>(t.tv_nsec) / 1.0e9;
  }

  // |t| in the fixed-format GMT form that HTTP uses, independent of locale.
  inline static std::string GetHttpTime(time_t t) {
    static const char *const DAYS[] = {"Sun", "Mon", "Tue", "Wed",
                                       "Thu", "Fri", "Sat"};
    static const char *const MONTHS[] = {"Jan", "Feb", "Mar", "Apr",
                                         "May", "Jun", "Jul", "Aug",
                                         "Sep", "Oct", "Nov", "Dec"};
    tm gm;
    char buf[64];

    gmtime_r(&t, &gm);
    snprintf(buf, sizeof(buf), "%s, %02d %s %04d %02d:%02d:%02d GMT",
             DAYS[gm.tm_wday], gm.tm_mday, MONTHS[gm.tm_mon],
             gm.tm_year + 1900, gm.tm_hour, gm.tm_min, gm.tm_sec);

    return buf;
  }

  inline static std::string GetHttpTime() { return GetHttpTime(time(nullptr)); }

  inline static void SleepMs(int ms) {
    timespec ts = {ms / 1000, (ms % 1000) * 1000000L};
    while (nanosleep(&ts, &ts) == -1 && errno == EINTR) {
    }
  }
};
}  // namespace base
}  // namespace s3stream

#endif
