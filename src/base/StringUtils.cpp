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

#include "base/StringUtils.h"

#include <stdint.h>

#include <algorithm>
#include <cctype>
#include <ostream>
#include <string>

#include "boost/foreach.hpp"
#include "boost/lambda/lambda.hpp"

namespace XF {

namespace StringUtils {

using std::string;

namespace {

struct OutputEncoding {
  enum Value { Ascii, Latin1, Utf8 };
};

OutputEncoding::Value GetOutputEncoding(const string &encoding) {
  string name;
  BOOST_FOREACH(char ch, encoding) {
    if (ch != '-' && ch != '_') {
      name.append(1, std::tolower(ch));
    }
  }
  if (name == "utf8") {
    return OutputEncoding::Utf8;
  }
  if (name == "latin1" || name == "iso88591" || name == "l1") {
    return OutputEncoding::Latin1;
  }
  return OutputEncoding::Ascii;
}

// Decode one code point starting at pos, advance pos past it.
// Return false for a malformed sequence, pos is then advanced by one byte.
bool DecodeUtf8(const string &str, size_t *pos, uint32_t *codePoint) {
  unsigned char lead = static_cast<unsigned char>(str[*pos]);
  size_t extra = 0;
  uint32_t cp = 0;
  if (lead < 0x80) {
    cp = lead;
  } else if ((lead & 0xE0) == 0xC0) {
    extra = 1;
    cp = lead & 0x1F;
  } else if ((lead & 0xF0) == 0xE0) {
    extra = 2;
    cp = lead & 0x0F;
  } else if ((lead & 0xF8) == 0xF0) {
    extra = 3;
    cp = lead & 0x07;
  } else {
    ++(*pos);
    return false;
  }

  if (*pos + extra >= str.size()) {  // truncated sequence
    ++(*pos);
    return false;
  }
  for (size_t i = 1; i <= extra; ++i) {
    unsigned char ch = static_cast<unsigned char>(str[*pos + i]);
    if ((ch & 0xC0) != 0x80) {
      ++(*pos);
      return false;
    }
    cp = (cp << 6) | (ch & 0x3F);
  }
  *pos += extra + 1;
  *codePoint = cp;
  return true;
}

}  // namespace

// --------------------------------------------------------------------------
string ToLower(const string &str) {
  string copy(str);
  BOOST_FOREACH(char &ch, copy) { ch = std::tolower(ch); }
  return copy;
}

// --------------------------------------------------------------------------
string ToUpper(const string &str) {
  string copy(str);
  BOOST_FOREACH(char &ch, copy) { ch = std::toupper(ch); }
  return copy;
}

// --------------------------------------------------------------------------
string LTrim(const string &str, unsigned char ch) {
  using boost::lambda::_1;
  string copy(str);
  string::iterator pos = std::find_if(copy.begin(), copy.end(), ch != _1);
  copy.erase(copy.begin(), pos);
  return copy;
}

// --------------------------------------------------------------------------
string RTrim(const string &str, unsigned char ch) {
  using boost::lambda::_1;
  string copy(str);
  string::reverse_iterator rpos =
      std::find_if(copy.rbegin(), copy.rend(), ch != _1);
  copy.erase(rpos.base(), copy.end());
  return copy;
}

// --------------------------------------------------------------------------
string Trim(const string &str, unsigned char ch) {
  return LTrim(RTrim(str, ch), ch);
}

// --------------------------------------------------------------------------
string FormatPath(const string &path) { return "[path=" + path + "]"; }

// --------------------------------------------------------------------------
string FormatPath(const string &from, const string &to) {
  return "[from=" + from + " to=" + to + "]";
}

// --------------------------------------------------------------------------
string EncodeForOutput(const string &utf8, const string &encoding) {
  OutputEncoding::Value target = GetOutputEncoding(encoding);
  if (target == OutputEncoding::Utf8) {
    return utf8;
  }

  uint32_t limit = target == OutputEncoding::Latin1 ? 0x100 : 0x80;
  string encoded;
  encoded.reserve(utf8.size());
  size_t pos = 0;
  while (pos < utf8.size()) {
    uint32_t cp = 0;
    if (DecodeUtf8(utf8, &pos, &cp) && cp < limit) {
      encoded.append(1, static_cast<char>(cp));
    } else {
      encoded.append(1, '?');
    }
  }
  return encoded;
}

// --------------------------------------------------------------------------
void UniPrint(const string &utf8, std::ostream &out, const string &encoding) {
  out << EncodeForOutput(utf8, encoding);
  out.flush();
}

}  // namespace StringUtils
}  // namespace XF
