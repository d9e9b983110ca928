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

#ifndef XFER_TRANSFER_RESULTS_H_
#define XFER_TRANSFER_RESULTS_H_

#include <string>

#include "boost/shared_ptr.hpp"

#include "base/BlockingQueue.hpp"

namespace XF {

namespace Transfer {

// A non fatal problem reported to the user once the command finishes
struct WarningResult {
  explicit WarningResult(const std::string &message_ = std::string())
      : message(message_), error(false), warning(true) {}

  std::string message;
  bool error;
  bool warning;
};

typedef XF::Threading::BlockingQueue<WarningResult> ResultQueue;
typedef boost::shared_ptr<ResultQueue> ResultQueuePtr;

// Create a warning for the result queue
//
// @param  : path the warning is about, message, if the file is skipped
// @return : "warning: Skipping file <path>. <message>" if skipFile,
//           "warning: <message>" otherwise
WarningResult CreateWarning(const std::string &path,
                            const std::string &message, bool skipFile = true);

}  // namespace Transfer
}  // namespace XF

#endif  // XFER_TRANSFER_RESULTS_H_
