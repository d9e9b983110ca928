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

#ifndef XFER_TRANSFER_OBJECTPATH_H_
#define XFER_TRANSFER_OBJECTPATH_H_

#include <string>
#include <utility>

namespace XF {

namespace Transfer {

// Split a remote path into bucket and key
//
// @param  : path, e.g. "bucket/dir/obj"
// @return : pair of bucket and key, e.g. ("bucket", "dir/obj"),
//           key is empty if path has no delimiter
std::pair<std::string, std::string> FindBucketKey(const std::string &path);

// Same as FindBucketKey, but strip a leading "s3://" first
std::pair<std::string, std::string> SplitS3BucketKey(const std::string &path);

// Get path of a file relative to start
//
// @param  : file path, start directory, relative ones are taken from the
//           current directory
// @return : relative dir of the file joined with its name, e.g.
//           "./bar" for ("/tmp/foo/bar", "/tmp/foo"),
//           "bar/baz" for ("/tmp/foo/bar/baz", "/tmp/foo"),
//           "../foo" for ("/tmp/foo", "/tmp/foo")
//
// Throw OSError if the current directory is needed but unavailable.
std::string RelativePath(const std::string &path,
                         const std::string &start = ".");

}  // namespace Transfer
}  // namespace XF

#endif  // XFER_TRANSFER_OBJECTPATH_H_
