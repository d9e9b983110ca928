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

#ifndef XFER_TRANSFER_SUBSCRIBERS_H_
#define XFER_TRANSFER_SUBSCRIBERS_H_

#include <stddef.h>  // for size_t
#include <stdint.h>  // for uint64_t
#include <time.h>

#include <string>
#include <vector>

#include "boost/exception_ptr.hpp"
#include "boost/function.hpp"
#include "boost/noncopyable.hpp"
#include "boost/optional.hpp"
#include "boost/shared_ptr.hpp"

#include "transfer/Results.h"
#include "transfer/TransferHandle.h"

namespace XF {

namespace Transfer {

//
// Subscribers are lifecycle hooks attached to a transfer unit. A subscriber
// takes part in a hook only by implementing its capability interface.
//
class Subscriber : private boost::noncopyable {
 public:
  virtual ~Subscriber() {}
};

class OnQueuedSubscriber : public virtual Subscriber {
 public:
  // Called once when the unit is submitted. Throwing aborts the unit.
  virtual void OnQueued(const TransferHandlePtr &handle) = 0;
};

class OnDoneSubscriber : public virtual Subscriber {
 public:
  // Called once when the unit is done, successfully or not
  virtual void OnDone(const TransferHandlePtr &handle) = 0;
};

typedef boost::shared_ptr<Subscriber> SubscriberPtr;

//
// SubscriberDispatcher
//
// Holds the subscribers of a unit and fires the hooks each implements.
//
class SubscriberDispatcher {
 public:
  SubscriberDispatcher() {}
  explicit SubscriberDispatcher(const std::vector<SubscriberPtr> &subscribers)
      : m_subscribers(subscribers) {}

  ~SubscriberDispatcher() {}

 public:
  void Add(const SubscriberPtr &subscriber);
  size_t Size() const { return m_subscribers.size(); }

  // Fire OnQueued of every subscriber, only on the first call for a unit.
  // All subscribers run even if one throws. On failure the first exception
  // is recorded in the handle, the handle is finished as Failed and the
  // exception is rethrown.
  void NotifyQueued(const TransferHandlePtr &handle) const;

  // Fire OnDone of every subscriber, only on the first call for a unit.
  // A failing subscriber is logged and does not stop the others.
  //
  // @return : count of failed subscribers
  size_t NotifyDone(const TransferHandlePtr &handle) const;

 private:
  std::vector<SubscriberPtr> m_subscribers;
};

// Set the total size of the unit, overriding any earlier value
class ProvideSizeSubscriber : public OnQueuedSubscriber {
 public:
  explicit ProvideSizeSubscriber(uint64_t size) : m_size(size) {}

  void OnQueued(const TransferHandlePtr &handle);

 private:
  uint64_t m_size;
};

// Guess content type from a file name or key, empty when unknown
typedef boost::function<std::string(const std::string &)> ContentTypeGuesser;

//
// Set "ContentType" in extra args when it can be guessed. A guess which
// fails or finds nothing leaves the extra args untouched.
//
class ProvideContentTypeSubscriber : public OnQueuedSubscriber {
 public:
  explicit ProvideContentTypeSubscriber(ContentTypeGuesser guesser);
  virtual ~ProvideContentTypeSubscriber() {}

  void OnQueued(const TransferHandlePtr &handle);

 protected:
  // name the guess is made from
  virtual std::string GetFileName(const TransferHandlePtr &handle) const = 0;

 private:
  ContentTypeGuesser m_guesser;
};

// Guess from the local file of an upload
class ProvideUploadContentTypeSubscriber
    : public ProvideContentTypeSubscriber {
 public:
  ProvideUploadContentTypeSubscriber();
  explicit ProvideUploadContentTypeSubscriber(ContentTypeGuesser guesser)
      : ProvideContentTypeSubscriber(guesser) {}

 protected:
  std::string GetFileName(const TransferHandlePtr &handle) const;
};

// Guess from the source key of a copy
class ProvideCopyContentTypeSubscriber : public ProvideContentTypeSubscriber {
 public:
  ProvideCopyContentTypeSubscriber();
  explicit ProvideCopyContentTypeSubscriber(ContentTypeGuesser guesser)
      : ProvideContentTypeSubscriber(guesser) {}

 protected:
  std::string GetFileName(const TransferHandlePtr &handle) const;
};

// Create the parent directories of the file a download writes to.
// Throw CreateDirectoryError for any failure but an existing directory.
class DirectoryCreatorSubscriber : public OnQueuedSubscriber {
 public:
  void OnQueued(const TransferHandlePtr &handle);
};

//
// Base of the hooks which care about the outcome, exactly one of OnSuccess
// and OnFailure fires for a done unit.
//
class OnDoneFilteredSubscriber : public OnDoneSubscriber {
 public:
  virtual ~OnDoneFilteredSubscriber() {}

  void OnDone(const TransferHandlePtr &handle);

 protected:
  virtual void OnSuccess(const TransferHandlePtr &handle) {}
  virtual void OnFailure(const TransferHandlePtr &handle,
                         const boost::exception_ptr &exception) {}
};

//
// Set the modification time of a downloaded file. Never throws, a missing
// time or a failure puts a warning on the result queue.
//
class ProvideLastModifiedTimeSubscriber : public OnDoneFilteredSubscriber {
 public:
  ProvideLastModifiedTimeSubscriber(const boost::optional<time_t> &lastModified,
                                    ResultQueuePtr resultQueue)
      : m_lastModified(lastModified), m_resultQueue(resultQueue) {}

 protected:
  void OnSuccess(const TransferHandlePtr &handle);

 private:
  boost::optional<time_t> m_lastModified;
  ResultQueuePtr m_resultQueue;
};

}  // namespace Transfer
}  // namespace XF

#endif  // XFER_TRANSFER_SUBSCRIBERS_H_
