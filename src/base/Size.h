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

#ifndef XFER_BASE_SIZE_H_
#define XFER_BASE_SIZE_H_

#include <stddef.h>  // for size_t
#include <stdint.h>  // for unit64_t

namespace XF {

namespace Size {

// All units are binary, 1 KB == 1 KiB == 1024 bytes
static const uint64_t KB1 = 1024ULL;
static const uint64_t MB1 = 1024ULL * KB1;
static const uint64_t MB5 = 5 * MB1;
static const uint64_t MB7 = 7 * MB1;
static const uint64_t MB8 = 8 * MB1;
static const uint64_t MB10 = 10 * MB1;
static const uint64_t GB1 = 1024ULL * MB1;
static const uint64_t GB5 = 5 * GB1;
static const uint64_t TB1 = 1024ULL * GB1;
static const uint64_t TB5 = 5 * TB1;
static const uint64_t PB1 = 1024ULL * TB1;
static const uint64_t EB1 = 1024ULL * PB1;

static const size_t K1 = 1 * 1000;
static const size_t K10 = 10 * 1000;

}  // namespace Size
}  // namespace XF


#endif  // XFER_BASE_SIZE_H_
