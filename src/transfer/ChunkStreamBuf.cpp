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

#include "transfer/ChunkStreamBuf.h"

#include <stdint.h>

#include "boost/exception/to_string.hpp"

#include "base/Exception.h"
#include "base/LogMacros.h"

namespace XF {

namespace Transfer {

using boost::to_string;
using XF::Exception::XFException;

ChunkStreamBuf::ChunkStreamBuf(ReadFileChunkPtr chunk, size_t bufSize)
    : m_chunk(chunk), m_buffer(bufSize > 0 ? bufSize : 1) {
  if (!m_chunk) {
    throw XFException("Try to initialize streambuf with null file chunk");
  }
  setg(begin(), begin(), begin());
}

ChunkStreamBuf::int_type ChunkStreamBuf::underflow() {
  if (gptr() < egptr()) {
    return traits_type::to_int_type(*gptr());
  }
  size_t n = m_chunk->Read(begin(), m_buffer.size());
  if (n == 0) {
    return traits_type::eof();
  }
  setg(begin(), begin(), begin() + n);
  return traits_type::to_int_type(*gptr());
}

std::streamsize ChunkStreamBuf::showmanyc() {
  uint64_t remaining = m_chunk->GetRemaining();
  return remaining == 0 ? -1 : static_cast<std::streamsize>(remaining);
}

ChunkStreamBuf::pos_type ChunkStreamBuf::seekoff(
    off_type off, std::ios_base::seekdir dir, std::ios_base::openmode which) {
  // bytes already pulled from the chunk but not consumed by the stream
  off_type buffered = egptr() - gptr();
  off_type current = static_cast<off_type>(m_chunk->Tell()) - buffered;
  off_type length = static_cast<off_type>(m_chunk->GetLength());

  if (dir == std::ios_base::beg) {
    return seekpos(off, which);
  } else if (dir == std::ios_base::end) {
    return seekpos(length + off, which);
  } else if (dir == std::ios_base::cur) {
    if (off == 0) {
      return pos_type(current);
    }
    return seekpos(current + off, which);
  }
  return pos_type(off_type(-1));
}

ChunkStreamBuf::pos_type ChunkStreamBuf::seekpos(
    pos_type pos, std::ios_base::openmode which) {
  off_type offset = static_cast<off_type>(pos);
  if (!(which & std::ios_base::in) || offset < 0) {
    return pos_type(off_type(-1));
  }
  DebugWarningIf(static_cast<uint64_t>(offset) > m_chunk->GetLength(),
                 "Seek to " + to_string(offset) + " beyond chunk length " +
                     to_string(m_chunk->GetLength()) + ", clamped");

  m_chunk->Seek(static_cast<uint64_t>(offset));
  setg(begin(), begin(), begin());
  return pos_type(static_cast<off_type>(m_chunk->Tell()));
}

}  // namespace Transfer
}  // namespace XF
