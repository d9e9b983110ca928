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

#ifndef XFER_TRANSFER_NONSEEKABLESTREAM_H_
#define XFER_TRANSFER_NONSEEKABLESTREAM_H_

#include <stddef.h>

#include <istream>
#include <streambuf>
#include <string>

#include "boost/noncopyable.hpp"

namespace XF {

namespace Transfer {

/**
 * A read-only stream buf which forwards reads to another stream buf and
 * refuses any seek. The source stream buf is not owned.
 */
class NonSeekableStreamBuf : public std::streambuf, private boost::noncopyable {
 public:
  explicit NonSeekableStreamBuf(std::streambuf *source);

  ~NonSeekableStreamBuf() {}

 protected:
  int_type underflow();
  int_type uflow();
  std::streamsize xsgetn(char_type *s, std::streamsize n);
  std::streamsize showmanyc();
  pos_type seekoff(off_type off, std::ios_base::seekdir dir,
                   std::ios_base::openmode which = std::ios_base::in);
  pos_type seekpos(pos_type pos,
                   std::ios_base::openmode which = std::ios_base::in);

 private:
  std::streambuf *m_source;
};

/**
 * An istream over another istream which hides its ability to seek, for
 * engines which take a different path for non-seekable uploads.
 * The source stream must outlive this one.
 */
class NonSeekableStream
    : public std::basic_istream<char, std::char_traits<char> >,
      private boost::noncopyable {
  typedef std::basic_istream<char, std::char_traits<char> > Base;

 public:
  explicit NonSeekableStream(std::istream &source);

  ~NonSeekableStream();

  // Read all remaining bytes
  std::string Read();

  // Read at most amount bytes
  std::string Read(size_t amount);
};

// Check if seeking the stream works, the stream state is kept
bool IsSeekable(std::istream &stream);

}  // namespace Transfer
}  // namespace XF

#endif  // XFER_TRANSFER_NONSEEKABLESTREAM_H_
