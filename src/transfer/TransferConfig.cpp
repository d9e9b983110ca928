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

#include "transfer/TransferConfig.h"

#include "configure/Options.h"
#include "transfer/ChunkSize.h"

namespace XF {

namespace Transfer {

using XF::Configure::Options;

// --------------------------------------------------------------------------
TransferConfig::TransferConfig() {
  const Options &options = Options::Instance();
  multipartChunkSize = options.GetMultipartChunkSize();
  multipartThreshold = options.GetMultipartThreshold();
  maxQueueSize = options.GetMaxQueueSize();
  maxPriority = options.GetMaxPriority();
  listPageSize = options.GetListPageSize();
  encryptionParams = options.GetEncryptionParams();
}

// --------------------------------------------------------------------------
uint64_t TransferConfig::ChunkSizeFor(uint64_t totalSize) const {
  return FindChunkSize(totalSize, multipartChunkSize);
}

// --------------------------------------------------------------------------
bool TransferConfig::IsMultipart(uint64_t totalSize) const {
  return IsMultipartTransfer(totalSize, multipartThreshold);
}

}  // namespace Transfer
}  // namespace XF
