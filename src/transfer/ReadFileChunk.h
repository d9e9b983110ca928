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

#ifndef XFER_TRANSFER_READFILECHUNK_H_
#define XFER_TRANSFER_READFILECHUNK_H_

#include <stddef.h>
#include <stdint.h>

#include <string>

#include "boost/noncopyable.hpp"

namespace XF {

namespace Transfer {

//
// ReadFileChunk
//
// A read-only view of [startByte, startByte + size) of a local file, one view
// per part of a multipart upload. No descriptor is held between reads, every
// read opens the file, reads at the view offset and closes it again.
//
class ReadFileChunk : private boost::noncopyable {
 public:
  // Throw FileStatError if the file cannot be stat'ed.
  ReadFileChunk(const std::string &path, uint64_t startByte, uint64_t size);

  ~ReadFileChunk() {}

 public:
  // Read up to amount bytes from current offset
  //
  // @param  : amount of bytes
  // @return : bytes read, empty if the view is exhausted
  //
  // Throw OSError if the file cannot be opened or read.
  std::string Read(uint64_t amount);

  // Read the rest of the view
  std::string Read();

  // Read into a caller buffer, return the count of bytes read
  size_t Read(char *buffer, size_t amount);

  // Move the offset relative to the view start, clamped to the length
  void Seek(uint64_t offset);

  uint64_t Tell() const { return m_offset; }
  uint64_t GetLength() const { return m_length; }
  uint64_t GetRemaining() const { return m_length - m_offset; }
  uint64_t GetStartByte() const { return m_startByte; }
  const std::string &GetPath() const { return m_path; }

 private:
  std::string m_path;
  uint64_t m_startByte;
  uint64_t m_length;  // fixed at construction
  uint64_t m_offset;  // relative to start byte, in [0, m_length]
};

}  // namespace Transfer
}  // namespace XF

#endif  // XFER_TRANSFER_READFILECHUNK_H_
