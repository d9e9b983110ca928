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

#include "configure/Default.h"

#include <sys/stat.h>
#include <sys/types.h>

#include <string>
#include <vector>

#include "base/Size.h"

namespace XF {

namespace Configure {

namespace Default {

using std::string;
using std::vector;

static const char* const PROGRAM_NAME = "xfer";
static const char* const XFER_DEFAULT_LOG_DIR = "/tmp/xfer_log/";
static const char* const XFER_DEFAULT_LOGLEVEL_NAME = "WARN";
static const char* const MIME_FILE_DEFAULT = "/etc/mime.types";
static const char* const MIME_FILE_LOCAL = "/usr/local/etc/mime.types";

const char* GetProgramName() { return PROGRAM_NAME; }

string GetDefaultLogDirectory() { return XFER_DEFAULT_LOG_DIR; }
string GetDefaultLogLevelName() { return XFER_DEFAULT_LOGLEVEL_NAME; }
int32_t GetMaxLogSizeInMB() { return 50; }

vector<string> GetMimeFiles() {
  vector<string> mimes;
  mimes.push_back(MIME_FILE_DEFAULT);
  mimes.push_back(MIME_FILE_LOCAL);
  return mimes;
}

mode_t GetDefineDirMode() {
  return (S_IRWXU | S_IRGRP | S_IXGRP | S_IROTH | S_IXOTH);
}

uint64_t GetDefaultMultipartChunkSize() { return XF::Size::MB8; }

uint64_t GetDefaultMultipartThreshold() { return XF::Size::MB8; }

size_t GetDefaultMaxQueueSize() { return XF::Size::K1; }

int64_t GetDefaultMaxPriority() { return 20; }

uint16_t GetDefaultListPageSize() {
  // max keys the service returns for one list objects request
  return 1000;
}

}  // namespace Default
}  // namespace Configure
}  // namespace XF
