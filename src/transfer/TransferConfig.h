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

#ifndef XFER_TRANSFER_TRANSFERCONFIG_H_
#define XFER_TRANSFER_TRANSFERCONFIG_H_

#include <stddef.h>
#include <stdint.h>

#include "boost/make_shared.hpp"
#include "boost/shared_ptr.hpp"

#include "base/StablePriorityQueue.hpp"
#include "configure/Options.h"

namespace XF {

namespace Transfer {

//
// Settings of transfers, taken from Options when constructed
//
struct TransferConfig {
  TransferConfig();

  // Part size of a multipart transfer of a file of totalSize, adjusted from
  // the configured chunk size.
  // Throw InvalidSizeError if the file is too large.
  uint64_t ChunkSizeFor(uint64_t totalSize) const;

  // Check if a file of totalSize reaches the multipart threshold
  bool IsMultipart(uint64_t totalSize) const;

  uint64_t multipartChunkSize;
  uint64_t multipartThreshold;
  size_t maxQueueSize;  // 0 for unbounded
  int64_t maxPriority;
  uint16_t listPageSize;
  XF::Configure::CliParams encryptionParams;
};

// Create a work queue bounded by the configured size and priority
template <typename T>
boost::shared_ptr<XF::Threading::StablePriorityQueue<T> > MakeWorkQueue(
    const TransferConfig &config) {
  return boost::make_shared<XF::Threading::StablePriorityQueue<T> >(
      config.maxQueueSize, config.maxPriority);
}

}  // namespace Transfer
}  // namespace XF

#endif  // XFER_TRANSFER_TRANSFERCONFIG_H_
