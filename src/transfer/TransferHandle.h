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

#ifndef XFER_TRANSFER_TRANSFERHANDLE_H_
#define XFER_TRANSFER_TRANSFERHANDLE_H_

#include <stdint.h>  // for uint64_t

#include <map>
#include <string>

#include "boost/exception_ptr.hpp"
#include "boost/noncopyable.hpp"
#include "boost/optional.hpp"
#include "boost/shared_ptr.hpp"
#include "boost/thread/condition_variable.hpp"
#include "boost/thread/locks.hpp"
#include "boost/thread/mutex.hpp"

namespace XF {

namespace Transfer {

class SubscriberDispatcher;

typedef std::map<std::string, std::string> ExtraArgs;

struct CopySource {
  CopySource(const std::string &bucket_ = std::string(),
             const std::string &key_ = std::string())
      : bucket(bucket_), key(key_) {}

  std::string bucket;
  std::string key;
};

struct TransferStatus {
  enum Value {
    NotStarted,  // created, not submitted yet
    Queued,      // submitted to the engine
    Cancelled,   // cancelled before it is done
    Failed,      // done with an exception
    Completed    // done successfully
  };
};

std::string GetTransferStatusName(TransferStatus::Value status);

//
// TransferHandle
//
// One transfer unit (upload, download or copy of a single object) as seen by
// the subscribers. Shared between the engine and the hooks, all mutable state
// is guarded.
//
class TransferHandle : private boost::noncopyable {
 public:
  TransferHandle(const std::string &bucket, const std::string &objKey,
                 const std::string &filePath = std::string());
  TransferHandle(const std::string &bucket, const std::string &objKey,
                 const std::string &filePath, const CopySource &copySource);

  ~TransferHandle() {}

 public:
  const std::string &GetBucket() const { return m_bucket; }
  const std::string &GetObjectKey() const { return m_objectKey; }
  const std::string &GetFilePath() const { return m_filePath; }
  const boost::optional<CopySource> &GetCopySource() const {
    return m_copySource;
  }

  // Extra arguments passed along with the remote request, e.g. ContentType
  ExtraArgs GetExtraArgs() const;
  boost::optional<std::string> GetExtraArg(const std::string &name) const;
  void SetExtraArg(const std::string &name, const std::string &value);

  // Size in bytes of the data to transfer, none until it is provided
  boost::optional<uint64_t> GetTotalSize() const;
  void SetTotalSize(uint64_t size);

  TransferStatus::Value GetStatus() const;
  boost::exception_ptr GetException() const;
  bool IsFinished() const;

 public:
  void SetQueued() { UpdateStatus(TransferStatus::Queued); }
  void Cancel() { UpdateStatus(TransferStatus::Cancelled); }

  // Record the failure of the unit, the first exception is kept
  void SetException(const boost::exception_ptr &exception);

  // Mark the unit done, Failed if an exception was set, Completed otherwise
  void Done();

  void WaitUntilFinished() const;

 private:
  void UpdateStatus(TransferStatus::Value status);

  // Return true only for the first call, hooks use them to fire once
  bool TryMarkQueuedNotified();
  bool TryMarkDoneNotified();

  bool Predicate() const;

 private:
  std::string m_bucket;
  std::string m_objectKey;
  std::string m_filePath;  // local file, empty for a copy
  boost::optional<CopySource> m_copySource;

  mutable boost::mutex m_extraArgsLock;
  ExtraArgs m_extraArgs;

  mutable boost::mutex m_totalSizeLock;
  boost::optional<uint64_t> m_totalSize;

  mutable boost::mutex m_statusLock;
  TransferStatus::Value m_status;
  boost::exception_ptr m_exception;
  mutable boost::condition_variable m_waitUntilFinishSignal;

  boost::mutex m_notifiedLock;
  bool m_queuedNotified;
  bool m_doneNotified;

  friend class SubscriberDispatcher;
};

typedef boost::shared_ptr<TransferHandle> TransferHandlePtr;

}  // namespace Transfer
}  // namespace XF

#endif  // XFER_TRANSFER_TRANSFERHANDLE_H_
