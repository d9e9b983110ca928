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

#ifndef XFER_TRANSFER_CHUNKSTREAMBUF_H_
#define XFER_TRANSFER_CHUNKSTREAMBUF_H_

#include <stddef.h>  // for size_t

#include <streambuf>  // NOLINT
#include <vector>

#include "boost/noncopyable.hpp"
#include "boost/shared_ptr.hpp"

#include "transfer/ReadFileChunk.h"

namespace XF {

namespace Transfer {

typedef boost::shared_ptr<ReadFileChunk> ReadFileChunkPtr;

/**
 * A read-only stream buf to use a ReadFileChunk with std::istream
 */
class ChunkStreamBuf : public std::streambuf, private boost::noncopyable {
 public:
  explicit ChunkStreamBuf(ReadFileChunkPtr chunk, size_t bufSize = 64 * 1024);

  ~ChunkStreamBuf() {}

  const ReadFileChunkPtr &GetChunk() const { return m_chunk; }

 protected:
  int_type underflow();
  std::streamsize showmanyc();
  pos_type seekoff(off_type off, std::ios_base::seekdir dir,
                   std::ios_base::openmode which = std::ios_base::in);
  pos_type seekpos(pos_type pos,
                   std::ios_base::openmode which = std::ios_base::in);

 private:
  char *begin() { return &m_buffer[0]; }

  ReadFileChunkPtr m_chunk;
  std::vector<char> m_buffer;
};

}  // namespace Transfer
}  // namespace XF

#endif  // XFER_TRANSFER_CHUNKSTREAMBUF_H_
