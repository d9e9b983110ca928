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

#ifndef XFER_TRANSFER_CONSTANTS_H_
#define XFER_TRANSFER_CONSTANTS_H_

#include <stdint.h>  // for uint64_t

#include "base/Size.h"

namespace XF {

namespace Transfer {

namespace Constants {

// Limits of the object storage service for multipart uploads
static const uint64_t MaxParts = 10000;
static const uint64_t MaxSingleUploadSize = XF::Size::GB5;  // per part
static const uint64_t MinUploadChunkSize = XF::Size::MB5;
static const uint64_t MaxUploadSize = XF::Size::TB5;  // whole object

// Separator between bucket and key in a remote path
static const char BucketKeyDelim = '/';

}  // namespace Constants
}  // namespace Transfer
}  // namespace XF


#endif  // XFER_TRANSFER_CONSTANTS_H_
