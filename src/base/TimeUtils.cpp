// +-------------------------------------------------------------------------
// | Copyright (C) 2017 Yunify, Inc.
// +-------------------------------------------------------------------------
// | Licensed under the Apache License, Version 2.0 (the "License");
// | You may not use this work except in compliance with the License.
// | You may obtain a copy of the License in the LICENSE file, or at:
// |
// | http://www.apache.org/licenses/LICENSE-2.0
// |
// | Unless required by applicable law or agreed to in writing, software
// | distributed under the License is distributed on an "AS IS" BASIS,
// | WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// | See the License for the specific language governing permissions and
// | limitations under the License.
// +-------------------------------------------------------------------------

#include "base/TimeUtils.h"

#include <ctype.h>   // for isdigit
#include <string.h>  // for memset
#include <time.h>    // for strftime

#include <string>

#include "base/Exception.h"

namespace XF {

namespace TimeUtils {

using XF::Exception::XFException;
using std::string;

static const char *formatGMT = "%a, %d %b %Y %H:%M:%S GMT";
static const char *formatISO8601 = "%Y-%m-%dT%H:%M:%S";

namespace {

// Parse the part following the seconds of an ISO 8601 date, return the
// offset to UTC in seconds
bool IsDigit(char c) { return isdigit(static_cast<unsigned char>(c)) != 0; }

// Parse the part following the seconds of an ISO 8601 date, return the
// offset to UTC in seconds
bool ParseISO8601Suffix(const char *rest, long *offset) {  // NOLINT
  *offset = 0;
  if (*rest == '.') {
    ++rest;
    if (!IsDigit(*rest)) return false;
    while (IsDigit(*rest)) ++rest;
  }

  if (*rest == 'Z' || *rest == 'z') {
    ++rest;
  } else if (*rest == '+' || *rest == '-') {
    // exactly "+hh:mm", each check stops at the terminating NUL
    if (!IsDigit(rest[1]) || !IsDigit(rest[2]) || rest[3] != ':' ||
        !IsDigit(rest[4]) || !IsDigit(rest[5])) {
      return false;
    }
    int sign = (*rest == '-') ? -1 : 1;
    int hours = (rest[1] - '0') * 10 + (rest[2] - '0');
    int minutes = (rest[4] - '0') * 10 + (rest[5] - '0');
    *offset = sign * (hours * 3600L + minutes * 60L);
    rest += 6;
  }
  return *rest == '\0';
}

}  // namespace

// --------------------------------------------------------------------------
time_t RFC822GMTToSeconds(const string &date) {
  struct tm res;
  memset(&res, 0, sizeof(struct tm));

  // date example: Tue, 15 Nov 1994 08:12:31 GMT
  const char *end = strptime(date.c_str(), formatGMT, &res);
  if (end == NULL || *end != '\0') {
    throw XFException("Invalid rfc822 date " + date);
  }
  return timegm(&res);  // GMT
}

// --------------------------------------------------------------------------
string SecondsToRFC822GMT(time_t time) {
  char date[100];
  memset(date, 0, sizeof(date));

  struct tm res;
  strftime(date, sizeof(date), formatGMT, gmtime_r(&time, &res));
  return date;
}

// --------------------------------------------------------------------------
time_t ISO8601ToSeconds(const string &date) {
  struct tm res;
  memset(&res, 0, sizeof(struct tm));

  // date example: 2014-02-27T04:20:38.000Z
  const char *rest = strptime(date.c_str(), formatISO8601, &res);
  long offset = 0;  // NOLINT
  if (rest == NULL || !ParseISO8601Suffix(rest, &offset)) {
    throw XFException("Invalid ISO 8601 date " + date);
  }
  return timegm(&res) - offset;
}

// --------------------------------------------------------------------------
string SecondsToISO8601(time_t time) {
  char date[64];
  memset(date, 0, sizeof(date));

  struct tm res;
  strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%SZ", gmtime_r(&time, &res));
  return date;
}

// --------------------------------------------------------------------------
time_t ParseLastModified(const string &date) {
  if (!date.empty() && IsDigit(date[0])) {
    return ISO8601ToSeconds(date);
  }
  return RFC822GMTToSeconds(date);
}

}  // namespace TimeUtils
}  // namespace XF
