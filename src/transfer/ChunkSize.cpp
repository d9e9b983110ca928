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

#include "transfer/ChunkSize.h"

#include <string>

#include "base/Exception.h"
#include "base/LogMacros.h"
#include "base/SizeUtils.h"
#include "transfer/Constants.h"

namespace XF {

namespace Transfer {

using XF::Exception::InvalidSizeError;
using XF::SizeUtils::HumanReadableSize;
using XF::Transfer::Constants::MaxParts;
using XF::Transfer::Constants::MaxSingleUploadSize;
using XF::Transfer::Constants::MaxUploadSize;
using XF::Transfer::Constants::MinUploadChunkSize;

// --------------------------------------------------------------------------
uint64_t FindChunkSize(uint64_t totalSize, uint64_t requestedChunkSize) {
  if (totalSize > MaxUploadSize) {
    throw InvalidSizeError("File size too large: " +
                           HumanReadableSize(totalSize) +
                           ", max file size is " +
                           HumanReadableSize(MaxUploadSize));
  }

  uint64_t chunkSize = requestedChunkSize;
  if (chunkSize < MinUploadChunkSize) {
    chunkSize = MinUploadChunkSize;
  }

  while (GetPartCount(totalSize, chunkSize) > MaxParts) {
    chunkSize *= 2;
  }

  if (chunkSize > MaxSingleUploadSize) {
    chunkSize = MaxSingleUploadSize;
  }

  DebugInfoIf(chunkSize != requestedChunkSize,
              "Adjust chunk size from " << requestedChunkSize << " to "
                                        << chunkSize << " for file size "
                                        << totalSize);
  return chunkSize;
}

// --------------------------------------------------------------------------
uint64_t GetPartCount(uint64_t totalSize, uint64_t chunkSize) {
  if (chunkSize == 0) {
    throw InvalidSizeError("Chunk size must be positive");
  }
  return totalSize / chunkSize + (totalSize % chunkSize == 0 ? 0 : 1);
}

// --------------------------------------------------------------------------
bool IsMultipartTransfer(uint64_t totalSize, uint64_t threshold) {
  return totalSize >= threshold;
}

}  // namespace Transfer
}  // namespace XF
