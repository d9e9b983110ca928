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

#ifndef XFER_TRANSFER_CHUNKSIZE_H_
#define XFER_TRANSFER_CHUNKSIZE_H_

#include <stdint.h>

namespace XF {

namespace Transfer {

// Find the part size for a multipart upload
//
// @param  : object size, requested part size
// @return : part size
//
// The requested size is raised to MinUploadChunkSize, doubled until the
// object fits in MaxParts parts, and capped at MaxSingleUploadSize.
// Throw InvalidSizeError if the object is larger than MaxUploadSize.
uint64_t FindChunkSize(uint64_t totalSize, uint64_t requestedChunkSize);

// Get count of parts of chunkSize needed for totalSize, 0 for empty object
uint64_t GetPartCount(uint64_t totalSize, uint64_t chunkSize);

// Check if a file of totalSize should be transferred in parts
bool IsMultipartTransfer(uint64_t totalSize, uint64_t threshold);

}  // namespace Transfer
}  // namespace XF

#endif  // XFER_TRANSFER_CHUNKSIZE_H_
