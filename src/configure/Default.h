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

#ifndef XFER_CONFIGURE_DEFAULT_H_
#define XFER_CONFIGURE_DEFAULT_H_

#include <stddef.h>
#include <stdint.h>  // for fixed width integer types

#include <sys/types.h>  // for mode_t

#include <string>
#include <vector>

namespace XF {

namespace Configure {

namespace Default {

const char* GetProgramName();

std::string GetDefaultLogDirectory();
std::string GetDefaultLogLevelName();
int32_t GetMaxLogSizeInMB();
std::vector<std::string> GetMimeFiles();

mode_t GetDefineDirMode();

uint64_t GetDefaultMultipartChunkSize();
uint64_t GetDefaultMultipartThreshold();

size_t GetDefaultMaxQueueSize();  // 0 for unbounded
int64_t GetDefaultMaxPriority();
uint16_t GetDefaultListPageSize();

}  // namespace Default
}  // namespace Configure
}  // namespace XF

#endif  // XFER_CONFIGURE_DEFAULT_H_
