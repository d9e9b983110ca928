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

#include "transfer/Subscribers.h"

#include <errno.h>
#include <string.h>  // for strerror

#include <exception>
#include <string>
#include <vector>

#include "boost/exception/diagnostic_information.hpp"
#include "boost/exception_ptr.hpp"
#include "boost/foreach.hpp"
#include "boost/throw_exception.hpp"

#include "base/Exception.h"
#include "base/FileUtils.h"
#include "base/LogMacros.h"
#include "base/Utils.h"
#include "configure/Default.h"
#include "transfer/MimeTypes.h"

namespace XF {

namespace Transfer {

using boost::exception_ptr;
using boost::optional;
using XF::Configure::Default::GetDefineDirMode;
using XF::Exception::CreateDirectoryError;
using XF::FileUtils::SetFileUtime;
using XF::Utils::GetDirName;
using XF::Utils::MakeDirectories;
using std::string;
using std::vector;

// --------------------------------------------------------------------------
void SubscriberDispatcher::Add(const SubscriberPtr &subscriber) {
  if (subscriber) {
    m_subscribers.push_back(subscriber);
  }
}

// --------------------------------------------------------------------------
void SubscriberDispatcher::NotifyQueued(const TransferHandlePtr &handle) const {
  if (!handle || !handle->TryMarkQueuedNotified()) {
    return;
  }

  exception_ptr firstException;
  BOOST_FOREACH(const SubscriberPtr &subscriber, m_subscribers) {
    OnQueuedSubscriber *hook =
        dynamic_cast<OnQueuedSubscriber *>(subscriber.get());
    if (hook == NULL) continue;
    try {
      hook->OnQueued(handle);
    } catch (...) {
      if (!firstException) {
        firstException = boost::current_exception();
      }
    }
  }

  if (firstException) {
    // the unit is aborted
    handle->SetException(firstException);
    handle->Done();
    boost::rethrow_exception(firstException);
  }
  handle->SetQueued();
}

// --------------------------------------------------------------------------
size_t SubscriberDispatcher::NotifyDone(const TransferHandlePtr &handle) const {
  if (!handle || !handle->TryMarkDoneNotified()) {
    return 0;
  }

  size_t failures = 0;
  BOOST_FOREACH(const SubscriberPtr &subscriber, m_subscribers) {
    OnDoneSubscriber *hook = dynamic_cast<OnDoneSubscriber *>(subscriber.get());
    if (hook == NULL) continue;
    try {
      hook->OnDone(handle);
    } catch (const std::exception &err) {
      ++failures;
      Error("Exception in on done hook of " << handle->GetBucket() << "/"
            << handle->GetObjectKey() << ": " << err.what());
    } catch (...) {
      ++failures;
      Error("Exception in on done hook of "
            << handle->GetBucket() << "/" << handle->GetObjectKey() << ": "
            << boost::current_exception_diagnostic_information());
    }
  }
  return failures;
}

// --------------------------------------------------------------------------
void ProvideSizeSubscriber::OnQueued(const TransferHandlePtr &handle) {
  handle->SetTotalSize(m_size);
}

// --------------------------------------------------------------------------
ProvideContentTypeSubscriber::ProvideContentTypeSubscriber(
    ContentTypeGuesser guesser)
    : m_guesser(guesser) {
  if (!m_guesser) {
    m_guesser = GuessContentType;
  }
}

// --------------------------------------------------------------------------
void ProvideContentTypeSubscriber::OnQueued(const TransferHandlePtr &handle) {
  string name = GetFileName(handle);
  string contentType;
  try {
    contentType = m_guesser(name);
  } catch (const std::exception &err) {
    DebugWarning("Unable to guess content type of " << name << ": "
                 << err.what());
    return;
  }
  if (!contentType.empty()) {
    handle->SetExtraArg("ContentType", contentType);
  }
}

// --------------------------------------------------------------------------
ProvideUploadContentTypeSubscriber::ProvideUploadContentTypeSubscriber()
    : ProvideContentTypeSubscriber(GuessContentType) {}

// --------------------------------------------------------------------------
string ProvideUploadContentTypeSubscriber::GetFileName(
    const TransferHandlePtr &handle) const {
  return handle->GetFilePath();
}

// --------------------------------------------------------------------------
ProvideCopyContentTypeSubscriber::ProvideCopyContentTypeSubscriber()
    : ProvideContentTypeSubscriber(GuessContentType) {}

// --------------------------------------------------------------------------
string ProvideCopyContentTypeSubscriber::GetFileName(
    const TransferHandlePtr &handle) const {
  const optional<CopySource> &source = handle->GetCopySource();
  return source ? source->key : string();
}

// --------------------------------------------------------------------------
void DirectoryCreatorSubscriber::OnQueued(const TransferHandlePtr &handle) {
  string dir = GetDirName(handle->GetFilePath());
  if (dir.empty()) {
    return;
  }
  int errorCode = MakeDirectories(dir, GetDefineDirMode());
  if (errorCode != 0 && errorCode != EEXIST) {
    // thrown through boost to keep its type across exception_ptr
    boost::throw_exception(CreateDirectoryError(
        "Could not create directory " + dir + ": " + strerror(errorCode)));
  }
}

// --------------------------------------------------------------------------
void OnDoneFilteredSubscriber::OnDone(const TransferHandlePtr &handle) {
  exception_ptr exception = handle->GetException();
  if (exception) {
    OnFailure(handle, exception);
  } else {
    OnSuccess(handle);
  }
}

// --------------------------------------------------------------------------
void ProvideLastModifiedTimeSubscriber::OnSuccess(
    const TransferHandlePtr &handle) {
  const string &path = handle->GetFilePath();
  string reason;
  if (!m_lastModified) {
    reason = "No last modified time provided.";
  } else {
    try {
      SetFileUtime(path, *m_lastModified);
      return;
    } catch (const std::exception &err) {
      reason = err.what();
    }
  }

  string message = "Successfully Downloaded " + path +
                   " but was unable to update the last modified time. " +
                   reason;
  Warning(message);
  if (m_resultQueue) {
    m_resultQueue->Put(CreateWarning(path, message, false));
  }
}

}  // namespace Transfer
}  // namespace XF
