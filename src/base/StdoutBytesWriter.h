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

#ifndef XFER_BASE_STDOUTBYTESWRITER_H_
#define XFER_BASE_STDOUTBYTESWRITER_H_

#include <stddef.h>

#include <iostream>
#include <string>

#include "boost/noncopyable.hpp"

namespace XF {

namespace StringUtils {

// Write raw bytes to stdout, such as the content of a downloaded object.
// Unlike UniPrint, no encoding is applied.
class StdoutBytesWriter : private boost::noncopyable {
 public:
  explicit StdoutBytesWriter(std::ostream &out = std::cout) : m_out(out) {}

  ~StdoutBytesWriter() {}

 public:
  // Throw XFException if the stream fails
  void Write(const std::string &bytes);
  void Write(const char *bytes, size_t size);

  void Flush();

 private:
  std::ostream &m_out;
};

}  // namespace StringUtils
}  // namespace XF

#endif  // XFER_BASE_STDOUTBYTESWRITER_H_
