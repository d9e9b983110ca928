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

#ifndef XFER_TRANSFER_CHUNKISTREAM_H_
#define XFER_TRANSFER_CHUNKISTREAM_H_

#include <stddef.h>

#include <istream>
#include <string>  // for std::char_traits

#include "boost/noncopyable.hpp"

#include "transfer/ChunkStreamBuf.h"

namespace XF {

namespace Transfer {

/**
 * An istream to use ChunkStreamBuf under the hood.
 */
class ChunkIStream : public std::basic_istream<char, std::char_traits<char> >,
                     private boost::noncopyable {
  typedef std::basic_istream<char, std::char_traits<char> > Base;

 public:
  explicit ChunkIStream(ReadFileChunkPtr chunk);
  ChunkIStream(ReadFileChunkPtr chunk, size_t bufSize);

  ~ChunkIStream();
};

}  // namespace Transfer
}  // namespace XF

#endif  // XFER_TRANSFER_CHUNKISTREAM_H_
