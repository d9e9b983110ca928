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

#ifndef XFER_BASE_SIZEUTILS_H_
#define XFER_BASE_SIZEUTILS_H_

#include <stdint.h>

#include <string>

namespace XF {

namespace SizeUtils {

// Convert a byte count to a human readable string
//
// @param  : bytes
// @return : e.g. "1 Byte", "10 Bytes", "1.0 KiB", "3.5 GiB"
//
// Values below 1024 are printed as whole bytes. Otherwise the value is
// printed with one decimal in the smallest binary unit in which it rounds
// to less than 1024, so 1024**2 - 1 gives "1.0 MiB".
std::string HumanReadableSize(uint64_t bytes);

// Convert a human readable size to a byte count
//
// @param  : e.g. "1024", "8MB", "8mib", "1TiB"
// @return : bytes
//
// Suffixes KB, MB, GB, TB and their KiB forms are case insensitive and all
// binary. Throw InvalidSizeError if the value cannot be parsed.
uint64_t HumanReadableToBytes(const std::string &value);

}  // namespace SizeUtils
}  // namespace XF

#endif  // XFER_BASE_SIZEUTILS_H_
