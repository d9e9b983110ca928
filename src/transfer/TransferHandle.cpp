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

#include "transfer/TransferHandle.h"

#include <string>

#include "boost/bind.hpp"

#include "base/LogMacros.h"

namespace XF {

namespace Transfer {

using boost::bind;
using boost::exception_ptr;
using boost::lock_guard;
using boost::mutex;
using boost::optional;
using boost::unique_lock;
using std::string;

namespace {

bool IsFinishedStatus(TransferStatus::Value status) {
  return status == TransferStatus::Cancelled ||
         status == TransferStatus::Failed ||
         status == TransferStatus::Completed;
}

// a finished unit never changes its status again
bool AllowTransition(TransferStatus::Value current,
                     TransferStatus::Value next) {
  return !IsFinishedStatus(current) && current != next;
}

}  // namespace

// --------------------------------------------------------------------------
string GetTransferStatusName(TransferStatus::Value status) {
  switch (status) {
    case TransferStatus::NotStarted:
      return "NotStarted";
    case TransferStatus::Queued:
      return "Queued";
    case TransferStatus::Cancelled:
      return "Cancelled";
    case TransferStatus::Failed:
      return "Failed";
    case TransferStatus::Completed:
      return "Completed";
    default:
      return "Unknown";
  }
}

// --------------------------------------------------------------------------
TransferHandle::TransferHandle(const string &bucket, const string &objKey,
                               const string &filePath)
    : m_bucket(bucket),
      m_objectKey(objKey),
      m_filePath(filePath),
      m_status(TransferStatus::NotStarted),
      m_queuedNotified(false),
      m_doneNotified(false) {}

// --------------------------------------------------------------------------
TransferHandle::TransferHandle(const string &bucket, const string &objKey,
                               const string &filePath,
                               const CopySource &copySource)
    : m_bucket(bucket),
      m_objectKey(objKey),
      m_filePath(filePath),
      m_copySource(copySource),
      m_status(TransferStatus::NotStarted),
      m_queuedNotified(false),
      m_doneNotified(false) {}

// --------------------------------------------------------------------------
ExtraArgs TransferHandle::GetExtraArgs() const {
  lock_guard<mutex> lock(m_extraArgsLock);
  return m_extraArgs;
}

// --------------------------------------------------------------------------
optional<string> TransferHandle::GetExtraArg(const string &name) const {
  lock_guard<mutex> lock(m_extraArgsLock);
  ExtraArgs::const_iterator it = m_extraArgs.find(name);
  if (it == m_extraArgs.end()) {
    return optional<string>();
  }
  return it->second;
}

// --------------------------------------------------------------------------
void TransferHandle::SetExtraArg(const string &name, const string &value) {
  lock_guard<mutex> lock(m_extraArgsLock);
  m_extraArgs[name] = value;
}

// --------------------------------------------------------------------------
optional<uint64_t> TransferHandle::GetTotalSize() const {
  lock_guard<mutex> lock(m_totalSizeLock);
  return m_totalSize;
}

// --------------------------------------------------------------------------
void TransferHandle::SetTotalSize(uint64_t size) {
  lock_guard<mutex> lock(m_totalSizeLock);
  m_totalSize = size;
}

// --------------------------------------------------------------------------
TransferStatus::Value TransferHandle::GetStatus() const {
  lock_guard<mutex> lock(m_statusLock);
  return m_status;
}

// --------------------------------------------------------------------------
exception_ptr TransferHandle::GetException() const {
  lock_guard<mutex> lock(m_statusLock);
  return m_exception;
}

// --------------------------------------------------------------------------
bool TransferHandle::IsFinished() const {
  lock_guard<mutex> lock(m_statusLock);
  return IsFinishedStatus(m_status);
}

// --------------------------------------------------------------------------
void TransferHandle::SetException(const exception_ptr &exception) {
  lock_guard<mutex> lock(m_statusLock);
  if (!m_exception) {
    m_exception = exception;
  }
}

// --------------------------------------------------------------------------
void TransferHandle::Done() {
  TransferStatus::Value status = TransferStatus::Completed;
  {
    lock_guard<mutex> lock(m_statusLock);
    if (m_exception) {
      status = TransferStatus::Failed;
    }
  }
  UpdateStatus(status);
}

// --------------------------------------------------------------------------
void TransferHandle::WaitUntilFinished() const {
  unique_lock<mutex> lock(m_statusLock);
  m_waitUntilFinishSignal.wait(
      lock, bind(boost::type<bool>(), &TransferHandle::Predicate, this));
}

// --------------------------------------------------------------------------
void TransferHandle::UpdateStatus(TransferStatus::Value newStatus) {
  unique_lock<mutex> lock(m_statusLock);
  if (!AllowTransition(m_status, newStatus)) {
    DebugInfo("Ignore status change from " << GetTransferStatusName(m_status)
              << " to " << GetTransferStatusName(newStatus) << " of "
              << m_bucket << "/" << m_objectKey);
    return;
  }
  m_status = newStatus;
  if (IsFinishedStatus(newStatus)) {
    lock.unlock();
    m_waitUntilFinishSignal.notify_all();
  }
}

// --------------------------------------------------------------------------
bool TransferHandle::TryMarkQueuedNotified() {
  lock_guard<mutex> lock(m_notifiedLock);
  if (m_queuedNotified) {
    return false;
  }
  m_queuedNotified = true;
  return true;
}

// --------------------------------------------------------------------------
bool TransferHandle::TryMarkDoneNotified() {
  lock_guard<mutex> lock(m_notifiedLock);
  if (m_doneNotified) {
    return false;
  }
  m_doneNotified = true;
  return true;
}

// --------------------------------------------------------------------------
bool TransferHandle::Predicate() const { return IsFinishedStatus(m_status); }

}  // namespace Transfer
}  // namespace XF
