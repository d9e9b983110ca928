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

#ifndef XFER_CONFIGURE_PARSER_H_
#define XFER_CONFIGURE_PARSER_H_

#include <string>

namespace XF {

namespace Configure {

namespace Parser {

// Parse options into Options
//
// @param  : comma separated options, e.g.
//           "loglevel=INFO,debug,multipart_chunksize=16MB,sse=AES256"
// @return : void
//
// Only options present are changed. Keys:
//   logdir=<dir>                 loglevel=<INFO|WARN|ERROR|FATAL>
//   debug                        console
//   multipart_chunksize=<size>   multipart_threshold=<size>
//   max_queue_size=<n>           max_priority=<n>
//   page_size=<n>                mime_file=<file>
//   sse=<AES256|aws:kms>         sse_kms_key_id=<id>
//   sse_c=<AES256>               sse_c_key=<key>
//   sse_c_copy_source=<AES256>   sse_c_copy_source_key=<key>
//
// Throw XFException for an unknown key or a value not allowed for the key,
// InvalidSizeError for a malformed size. A zero or negative count falls
// back to its default with a warning on stderr.
void Parse(const std::string &options);

}  // namespace Parser
}  // namespace Configure
}  // namespace XF

#endif  // XFER_CONFIGURE_PARSER_H_
