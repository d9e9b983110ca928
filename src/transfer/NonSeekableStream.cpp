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

#include "transfer/NonSeekableStream.h"

#include <iterator>
#include <string>

#include "base/Exception.h"

namespace XF {

namespace Transfer {

using XF::Exception::XFException;
using std::string;

NonSeekableStreamBuf::NonSeekableStreamBuf(std::streambuf *source)
    : m_source(source) {
  if (m_source == NULL) {
    throw XFException("Try to initialize streambuf with null source");
  }
}

NonSeekableStreamBuf::int_type NonSeekableStreamBuf::underflow() {
  return m_source->sgetc();
}

NonSeekableStreamBuf::int_type NonSeekableStreamBuf::uflow() {
  return m_source->sbumpc();
}

std::streamsize NonSeekableStreamBuf::xsgetn(char_type *s, std::streamsize n) {
  return m_source->sgetn(s, n);
}

std::streamsize NonSeekableStreamBuf::showmanyc() {
  return m_source->in_avail();
}

NonSeekableStreamBuf::pos_type NonSeekableStreamBuf::seekoff(
    off_type off, std::ios_base::seekdir dir, std::ios_base::openmode which) {
  return pos_type(off_type(-1));
}

NonSeekableStreamBuf::pos_type NonSeekableStreamBuf::seekpos(
    pos_type pos, std::ios_base::openmode which) {
  return pos_type(off_type(-1));
}

// --------------------------------------------------------------------------
NonSeekableStream::NonSeekableStream(std::istream &source)
    : Base(new NonSeekableStreamBuf(source.rdbuf())) {}

NonSeekableStream::~NonSeekableStream() {
  if (rdbuf()) {
    delete (rdbuf());
  }
}

string NonSeekableStream::Read() {
  return string(std::istreambuf_iterator<char>(*this),
                std::istreambuf_iterator<char>());
}

string NonSeekableStream::Read(size_t amount) {
  string buf(amount, '\0');
  if (amount > 0) {
    read(&buf[0], static_cast<std::streamsize>(amount));
    buf.resize(static_cast<size_t>(gcount()));
  }
  return buf;
}

// --------------------------------------------------------------------------
bool IsSeekable(std::istream &stream) {
  std::streambuf *buf = stream.rdbuf();
  if (buf == NULL) {
    return false;
  }
  // a zero move from the current position changes nothing
  return buf->pubseekoff(0, std::ios_base::cur, std::ios_base::in) !=
         std::streambuf::pos_type(std::streambuf::off_type(-1));
}

}  // namespace Transfer
}  // namespace XF
