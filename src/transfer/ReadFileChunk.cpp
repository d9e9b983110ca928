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

#include "transfer/ReadFileChunk.h"

#include <errno.h>
#include <fcntl.h>
#include <string.h>  // for strerror
#include <unistd.h>

#include <sys/types.h>

#include <algorithm>
#include <string>
#include <vector>

#include "boost/scope_exit.hpp"

#include "base/Exception.h"
#include "base/FileUtils.h"
#include "base/LogMacros.h"
#include "base/StringUtils.h"

namespace XF {

namespace Transfer {

using XF::Exception::OSError;
using XF::FileUtils::FileStat;
using XF::FileUtils::GetFileStat;
using XF::StringUtils::FormatPath;
using std::min;
using std::string;
using std::vector;

// --------------------------------------------------------------------------
ReadFileChunk::ReadFileChunk(const string &path, uint64_t startByte,
                             uint64_t size)
    : m_path(path), m_startByte(startByte), m_length(0), m_offset(0) {
  FileStat stat = GetFileStat(path);
  if (startByte < stat.size) {
    m_length = min(size, stat.size - startByte);
  }
}

// --------------------------------------------------------------------------
string ReadFileChunk::Read(uint64_t amount) {
  size_t toRead = static_cast<size_t>(min(amount, GetRemaining()));
  if (toRead == 0) {
    return string();
  }
  vector<char> buffer(toRead);
  size_t readSize = Read(&buffer[0], toRead);
  return string(buffer.begin(), buffer.begin() + readSize);
}

// --------------------------------------------------------------------------
string ReadFileChunk::Read() { return Read(GetRemaining()); }

// --------------------------------------------------------------------------
size_t ReadFileChunk::Read(char *buffer, size_t amount) {
  size_t toRead = static_cast<size_t>(min<uint64_t>(amount, GetRemaining()));
  if (toRead == 0) {
    return 0;
  }

  int fd = open(m_path.c_str(), O_RDONLY);
  if (fd == -1) {
    int errorCode = errno;
    throw OSError(errorCode, string("Unable to open file: ") +
                                 strerror(errorCode) + " " +
                                 FormatPath(m_path));
  }
  BOOST_SCOPE_EXIT((fd)) { close(fd); }
  BOOST_SCOPE_EXIT_END

  size_t total = 0;
  while (total < toRead) {
    off_t pos = static_cast<off_t>(m_startByte + m_offset + total);
    ssize_t n = pread(fd, buffer + total, toRead - total, pos);
    if (n == -1) {
      if (errno == EINTR) continue;
      int errorCode = errno;
      throw OSError(errorCode, string("Unable to read file: ") +
                                   strerror(errorCode) + " " +
                                   FormatPath(m_path));
    }
    if (n == 0) {
      DebugWarning("File shrank while reading " << FormatPath(m_path));
      break;
    }
    total += static_cast<size_t>(n);
  }

  m_offset += total;
  return total;
}

// --------------------------------------------------------------------------
void ReadFileChunk::Seek(uint64_t offset) {
  m_offset = min(offset, m_length);
}

}  // namespace Transfer
}  // namespace XF
