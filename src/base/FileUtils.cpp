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

#include "base/FileUtils.h"

#include <errno.h>
#include <string.h>  // for strerror
#include <time.h>

#include <sys/stat.h>
#include <sys/types.h>
#include <utime.h>

#include <string>

#include "base/Exception.h"
#include "base/LogMacros.h"
#include "base/StringUtils.h"

namespace XF {

namespace FileUtils {

using XF::Exception::FileStatError;
using XF::Exception::OSError;
using XF::Exception::SetFileUtimeError;
using XF::StringUtils::FormatPath;
using std::string;

// --------------------------------------------------------------------------
FileStat GetFileStat(const string &path) {
  struct stat st;
  if (stat(path.c_str(), &st) != 0) {
    throw FileStatError("Could not retrieve file stat of \"" + path +
                        "\": " + strerror(errno));
  }

  FileStat fileStat;
  fileStat.size = static_cast<uint64_t>(st.st_size);

  fileStat.modified = ToLocalModifiedTime(st.st_mtime);
  DebugWarningIf(!fileStat.modified,
                 "Modification time out of range " << FormatPath(path));
  return fileStat;
}

// --------------------------------------------------------------------------
boost::optional<time_t> ToLocalModifiedTime(time_t seconds) {
  struct tm local;
  if (localtime_r(&seconds, &local) == NULL) {
    return boost::none;
  }
  return seconds;
}

// --------------------------------------------------------------------------
void SetFileUtime(const string &path, time_t seconds) {
  struct utimbuf times;
  times.actime = seconds;
  times.modtime = seconds;
  if (utime(path.c_str(), &times) == 0) {
    return;
  }

  int errorCode = errno;
  if (errorCode == EPERM) {
    throw SetFileUtimeError(
        "The file was downloaded, but attempting to modify the utime of the "
        "file failed. Is the file owned by another user? " +
        FormatPath(path));
  }
  throw OSError(errorCode, string("Unable to set utime: ") +
                               strerror(errorCode) + " " + FormatPath(path));
}

}  // namespace FileUtils
}  // namespace XF
