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

#include "base/SizeUtils.h"

#include <math.h>   // for floor
#include <stdio.h>  // for snprintf

#include <limits>
#include <map>
#include <string>

#include "boost/exception/to_string.hpp"
#include "boost/lexical_cast.hpp"

#include "base/Exception.h"
#include "base/Size.h"
#include "base/StringUtils.h"

namespace XF {

namespace SizeUtils {

using boost::to_string;
using XF::Exception::InvalidSizeError;
using std::map;
using std::string;

namespace {

const char *const humanizeSuffixes[] = {"KiB", "MiB", "GiB",
                                        "TiB", "PiB", "EiB"};
const size_t humanizeSuffixCount =
    sizeof(humanizeSuffixes) / sizeof(humanizeSuffixes[0]);

typedef map<string, uint64_t> SuffixToMultiplierMap;

SuffixToMultiplierMap BuildSizeSuffixes() {
  SuffixToMultiplierMap suffixes;
  suffixes["kb"] = XF::Size::KB1;
  suffixes["mb"] = XF::Size::MB1;
  suffixes["gb"] = XF::Size::GB1;
  suffixes["tb"] = XF::Size::TB1;
  suffixes["kib"] = XF::Size::KB1;
  suffixes["mib"] = XF::Size::MB1;
  suffixes["gib"] = XF::Size::GB1;
  suffixes["tib"] = XF::Size::TB1;
  return suffixes;
}

const SuffixToMultiplierMap &GetSizeSuffixes() {
  static const SuffixToMultiplierMap suffixes = BuildSizeSuffixes();
  return suffixes;
}

// Round half away from zero
double Round(double value) { return floor(value + 0.5); }

uint64_t ParseUnsigned(const string &digits, const string &original) {
  if (digits.empty() || digits[0] == '-' || digits[0] == '+') {
    throw InvalidSizeError("Invalid size value: " + original);
  }
  try {
    return boost::lexical_cast<uint64_t>(digits);
  } catch (const boost::bad_lexical_cast &) {
    throw InvalidSizeError("Invalid size value: " + original);
  }
}

}  // namespace

// --------------------------------------------------------------------------
string HumanReadableSize(uint64_t bytes) {
  static const double base = 1024.0;
  if (bytes == 1) {
    return "1 Byte";
  }
  if (bytes < XF::Size::KB1) {
    return to_string(bytes) + " Bytes";
  }

  double value = static_cast<double>(bytes);
  double unit = base;
  for (size_t i = 0; i < humanizeSuffixCount; ++i) {
    // unit is the size of the suffix following the current one
    unit *= base;
    if (Round(value / unit * base) < base || i + 1 == humanizeSuffixCount) {
      char buf[64];
      snprintf(buf, sizeof(buf), "%.1f %s", value / unit * base,
               humanizeSuffixes[i]);
      return buf;
    }
  }
  return string();  // unreachable
}

// --------------------------------------------------------------------------
uint64_t HumanReadableToBytes(const string &value) {
  string lower =
      XF::StringUtils::Trim(XF::StringUtils::ToLower(value), ' ');
  string suffix;
  if (lower.size() >= 3 && lower.compare(lower.size() - 2, 2, "ib") == 0) {
    suffix = lower.substr(lower.size() - 3);
  } else if (lower.size() >= 2) {
    suffix = lower.substr(lower.size() - 2);
  }

  const SuffixToMultiplierMap &suffixes = GetSizeSuffixes();
  SuffixToMultiplierMap::const_iterator it = suffixes.find(suffix);
  if (it == suffixes.end()) {
    return ParseUnsigned(lower, value);
  }

  string digits = lower.substr(0, lower.size() - suffix.size());
  digits = XF::StringUtils::RTrim(digits, ' ');
  uint64_t number = ParseUnsigned(digits, value);
  if (number > std::numeric_limits<uint64_t>::max() / it->second) {
    throw InvalidSizeError("Size value out of range: " + value);
  }
  return number * it->second;
}

}  // namespace SizeUtils
}  // namespace XF
