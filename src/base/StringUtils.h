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

#ifndef XFER_BASE_STRINGUTILS_H_
#define XFER_BASE_STRINGUTILS_H_

#include <ostream>
#include <string>

namespace XF {

namespace StringUtils {

std::string ToLower(const std::string &str);
std::string ToUpper(const std::string &str);

std::string LTrim(const std::string &str, unsigned char c);
std::string RTrim(const std::string &str, unsigned char c);
std::string Trim(const std::string &str, unsigned char c);

// Format path
//
// @param  : path
// @return : formatted string
std::string FormatPath(const std::string &path);
std::string FormatPath(const std::string &from, const std::string &to);

// Re-encode utf-8 text into the given output encoding
//
// @param  : utf-8 text, encoding name (e.g. "utf-8", "latin-1", "ascii")
// @return : encoded bytes
//
// Encoding names are matched ignoring case, '-' and '_'. An empty or unknown
// encoding is treated as ascii. Characters which cannot be represented,
// and malformed utf-8 sequences, are replaced with '?'.
std::string EncodeForOutput(const std::string &utf8,
                            const std::string &encoding);

// Write text to the stream in the stream's encoding, never throws on
// unrepresentable characters
//
// @param  : utf-8 text, out stream, encoding of the out stream
// @return : void
void UniPrint(const std::string &utf8, std::ostream &out,
              const std::string &encoding = std::string());

}  // namespace StringUtils
}  // namespace XF

#endif  // XFER_BASE_STRINGUTILS_H_
