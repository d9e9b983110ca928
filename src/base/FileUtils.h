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

#ifndef XFER_BASE_FILEUTILS_H_
#define XFER_BASE_FILEUTILS_H_

#include <stdint.h>
#include <time.h>

#include <string>

#include "boost/optional.hpp"

namespace XF {

namespace FileUtils {

struct FileStat {
  FileStat() : size(0) {}

  uint64_t size;
  // Modification time, none if it cannot be converted to local time
  boost::optional<time_t> modified;
};

// Get size and modification time of a local file
//
// @param  : file path
// @return : file stat
//
// Throw FileStatError with the path in its message if stat fails.
FileStat GetFileStat(const std::string &path);

// Check a modification time can be converted to local time
//
// @param  : time in seconds since epoch
// @return : the time, or none if localtime rejects it
boost::optional<time_t> ToLocalModifiedTime(time_t seconds);

// Set access and modification time of a local file
//
// @param  : file path, time in seconds since epoch
// @return : void
//
// Throw SetFileUtimeError if the caller is not permitted to change the time
// (EPERM), OSError with the original errno for any other failure.
void SetFileUtime(const std::string &path, time_t seconds);

}  // namespace FileUtils
}  // namespace XF

#endif  // XFER_BASE_FILEUTILS_H_
