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

#include "base/StdoutBytesWriter.h"

#include <string>

#include "boost/exception/to_string.hpp"

#include "base/Exception.h"

namespace XF {

namespace StringUtils {

using boost::to_string;
using XF::Exception::XFException;
using std::string;

// --------------------------------------------------------------------------
void StdoutBytesWriter::Write(const string &bytes) {
  Write(bytes.data(), bytes.size());
}

// --------------------------------------------------------------------------
void StdoutBytesWriter::Write(const char *bytes, size_t size) {
  if (size == 0) return;
  m_out.write(bytes, static_cast<std::streamsize>(size));
  if (!m_out) {
    throw XFException("Unable to write " + to_string(size) +
                      " bytes to output");
  }
}

// --------------------------------------------------------------------------
void StdoutBytesWriter::Flush() {
  m_out.flush();
  if (!m_out) {
    throw XFException("Unable to flush output");
  }
}

}  // namespace StringUtils
}  // namespace XF
