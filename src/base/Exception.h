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

#ifndef XFER_BASE_EXCEPTION_H_
#define XFER_BASE_EXCEPTION_H_

#include <stdexcept>
#include <string>

namespace XF {

namespace Exception {

struct XFException : public std::runtime_error {
  explicit XFException(const std::string& msg) : std::runtime_error(msg) {}
  explicit XFException(const char* msg)
      : std::runtime_error(std::string(msg)) {}

  std::string get() const { return this->what(); }
};

// Size out of the range the service accepts, or a malformed size string
struct InvalidSizeError : public XFException {
  explicit InvalidSizeError(const std::string& msg) : XFException(msg) {}
};

// Stat of a local file failed, message carries the path
struct FileStatError : public XFException {
  explicit FileStatError(const std::string& msg) : XFException(msg) {}
};

// A failed system call, keeping the original errno
struct OSError : public XFException {
  OSError(int errorCode, const std::string& msg)
      : XFException(msg), m_errorCode(errorCode) {}

  int GetErrorCode() const { return m_errorCode; }

 private:
  int m_errorCode;
};

// Modification time of a file could not be set for lack of permission
struct SetFileUtimeError : public XFException {
  explicit SetFileUtimeError(const std::string& msg) : XFException(msg) {}
};

struct CreateDirectoryError : public XFException {
  explicit CreateDirectoryError(const std::string& msg) : XFException(msg) {}
};

struct QueueFullError : public XFException {
  explicit QueueFullError(const std::string& msg) : XFException(msg) {}
};

}  // namespace Exception
}  // namespace XF


#endif  // XFER_BASE_EXCEPTION_H_
