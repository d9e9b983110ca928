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

#include <errno.h>
#include <time.h>

#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "boost/exception_ptr.hpp"
#include "boost/make_shared.hpp"
#include "boost/optional.hpp"
#include "boost/shared_ptr.hpp"
#include "gtest/gtest.h"

#include "base/Exception.h"
#include "base/FileUtils.h"
#include "base/Utils.h"
#include "transfer/Results.h"
#include "transfer/Subscribers.h"
#include "transfer/TransferHandle.h"

namespace XF {

namespace Transfer {

using boost::make_shared;
using boost::optional;
using boost::shared_ptr;
using XF::Exception::CreateDirectoryError;
using XF::FileUtils::GetFileStat;
using std::string;
using std::vector;

static const char *const testDir = "/tmp/xfer.test.subscribers/";
static const time_t desiredTime = 1453100400;  // 2016-01-18 07:00:00 UTC

namespace {

string GuessTextPlain(const string &name) {
  return name == "myfile.txt" ? "text/plain" : string();
}

string GuessThrows(const string &name) {
  throw std::runtime_error("cannot decode " + name);
}

class RecordingSubscriber : public OnQueuedSubscriber, public OnDoneSubscriber {
 public:
  explicit RecordingSubscriber(bool fail = false)
      : queuedCalls(0), doneCalls(0), m_fail(fail) {}

  void OnQueued(const TransferHandlePtr &handle) {
    ++queuedCalls;
    if (m_fail) throw std::runtime_error("queued failure");
  }

  void OnDone(const TransferHandlePtr &handle) {
    ++doneCalls;
    if (m_fail) throw std::runtime_error("done failure");
  }

  int queuedCalls;
  int doneCalls;

 private:
  bool m_fail;
};

class NonStdThrowingSubscriber : public OnDoneSubscriber {
 public:
  void OnDone(const TransferHandlePtr &handle) { throw 42; }
};

class OnlyDoneSubscriber : public OnDoneSubscriber {
 public:
  OnlyDoneSubscriber() : doneCalls(0) {}
  void OnDone(const TransferHandlePtr &handle) { ++doneCalls; }
  int doneCalls;
};

class OnDoneFilteredRecordingSubscriber : public OnDoneFilteredSubscriber {
 public:
  vector<TransferHandlePtr> successCalls;
  vector<TransferHandlePtr> failureCalls;
  vector<string> failureMessages;

 protected:
  void OnSuccess(const TransferHandlePtr &handle) {
    successCalls.push_back(handle);
  }

  void OnFailure(const TransferHandlePtr &handle,
                 const boost::exception_ptr &exception) {
    failureCalls.push_back(handle);
    try {
      boost::rethrow_exception(exception);
    } catch (const std::exception &err) {
      failureMessages.push_back(err.what());
    }
  }
};

boost::exception_ptr MakeException(const string &msg) {
  try {
    throw std::runtime_error(msg);
  } catch (const std::exception &) {
    return boost::current_exception();
  }
}

}  // namespace

class SubscribersTest : public ::testing::Test {
 protected:
  void SetUp() {
    XF::Utils::DeleteFilesInDirectory(testDir, true);
    ASSERT_TRUE(XF::Utils::CreateDirectoryIfNotExists(testDir));
  }

  void TearDown() { XF::Utils::DeleteFilesInDirectory(testDir, true); }

  string MakeFile(const string &name) {
    string path = string(testDir) + name;
    std::ofstream file(path.c_str());
    file << "my contents";
    return path;
  }
};

TEST_F(SubscribersTest, CreateWarning) {
  WarningResult warning = CreateWarning("/foo/", "There was an error");
  EXPECT_EQ(string("warning: Skipping file /foo/. There was an error"),
            warning.message);
  EXPECT_FALSE(warning.error);
  EXPECT_TRUE(warning.warning);

  EXPECT_EQ(string("warning: There was an error"),
            CreateWarning("/foo/", "There was an error", false).message);
}

TEST_F(SubscribersTest, HandleStatus) {
  TransferHandlePtr handle = make_shared<TransferHandle>("bucket", "key");
  EXPECT_EQ(TransferStatus::NotStarted, handle->GetStatus());
  EXPECT_FALSE(handle->IsFinished());
  handle->SetQueued();
  EXPECT_EQ(TransferStatus::Queued, handle->GetStatus());
  handle->Done();
  handle->WaitUntilFinished();
  EXPECT_EQ(TransferStatus::Completed, handle->GetStatus());
  EXPECT_TRUE(handle->IsFinished());
  EXPECT_EQ(string("Completed"), GetTransferStatusName(handle->GetStatus()));
  // finished is final
  handle->Cancel();
  EXPECT_EQ(TransferStatus::Completed, handle->GetStatus());

  TransferHandlePtr failed = make_shared<TransferHandle>("bucket", "key");
  failed->SetException(MakeException("first"));
  failed->SetException(MakeException("second"));
  failed->Done();
  EXPECT_EQ(TransferStatus::Failed, failed->GetStatus());
  try {
    boost::rethrow_exception(failed->GetException());
  } catch (const std::exception &err) {
    EXPECT_EQ(string("first"), string(err.what()));
  }
}

TEST_F(SubscribersTest, ProvideSize) {
  TransferHandlePtr handle = make_shared<TransferHandle>("bucket", "key");
  EXPECT_FALSE(handle->GetTotalSize().is_initialized());
  handle->SetTotalSize(5);
  ProvideSizeSubscriber subscriber(10);
  subscriber.OnQueued(handle);
  EXPECT_EQ(10u, *handle->GetTotalSize());
}

TEST_F(SubscribersTest, OnDoneFilteredSuccess) {
  OnDoneFilteredRecordingSubscriber subscriber;
  TransferHandlePtr handle = make_shared<TransferHandle>("bucket", "key");
  handle->Done();
  subscriber.OnDone(handle);
  ASSERT_EQ(1u, subscriber.successCalls.size());
  EXPECT_EQ(handle, subscriber.successCalls[0]);
  EXPECT_TRUE(subscriber.failureCalls.empty());
}

TEST_F(SubscribersTest, OnDoneFilteredFailure) {
  OnDoneFilteredRecordingSubscriber subscriber;
  TransferHandlePtr handle = make_shared<TransferHandle>("bucket", "key");
  handle->SetException(MakeException("my exception"));
  handle->Done();
  subscriber.OnDone(handle);
  ASSERT_EQ(1u, subscriber.failureCalls.size());
  EXPECT_EQ(handle, subscriber.failureCalls[0]);
  EXPECT_EQ(string("my exception"), subscriber.failureMessages[0]);
  EXPECT_TRUE(subscriber.successCalls.empty());
}

TEST_F(SubscribersTest, UploadContentType) {
  TransferHandlePtr handle =
      make_shared<TransferHandle>("bucket", "key", "myfile.txt");
  ProvideUploadContentTypeSubscriber subscriber;
  subscriber.OnQueued(handle);
  EXPECT_EQ(string("text/plain"), *handle->GetExtraArg("ContentType"));
}

TEST_F(SubscribersTest, UploadContentTypeUnknown) {
  TransferHandlePtr handle =
      make_shared<TransferHandle>("bucket", "key", "file-with-no-extension");
  ProvideUploadContentTypeSubscriber subscriber;
  subscriber.OnQueued(handle);
  EXPECT_TRUE(handle->GetExtraArgs().empty());
}

TEST_F(SubscribersTest, UploadContentTypeGuessFails) {
  TransferHandlePtr handle =
      make_shared<TransferHandle>("bucket", "key", "myfile.txt");
  ProvideUploadContentTypeSubscriber subscriber(GuessThrows);
  EXPECT_NO_THROW(subscriber.OnQueued(handle));
  EXPECT_TRUE(handle->GetExtraArgs().empty());
}

TEST_F(SubscribersTest, CopyContentType) {
  TransferHandlePtr handle = make_shared<TransferHandle>(
      "bucket", "key", "", CopySource("mybucket", "myfile.txt"));
  ProvideCopyContentTypeSubscriber subscriber(GuessTextPlain);
  subscriber.OnQueued(handle);
  EXPECT_EQ(string("text/plain"), *handle->GetExtraArg("ContentType"));

  TransferHandlePtr noExt = make_shared<TransferHandle>(
      "bucket", "key", "", CopySource("mybucket", "file-with-no-extension"));
  ProvideCopyContentTypeSubscriber().OnQueued(noExt);
  EXPECT_FALSE(noExt->GetExtraArg("ContentType").is_initialized());
}

TEST_F(SubscribersTest, DirectoryCreator) {
  string dir = string(testDir) + "new-directory";
  TransferHandlePtr handle =
      boost::make_shared<TransferHandle>("bucket", "key", dir + "/myfile");
  DirectoryCreatorSubscriber subscriber;
  subscriber.OnQueued(handle);
  EXPECT_TRUE(XF::Utils::IsDirectory(dir).first);
  // existing directory is fine
  EXPECT_NO_THROW(subscriber.OnQueued(handle));
  EXPECT_TRUE(XF::Utils::IsDirectory(dir).first);
}

TEST_F(SubscribersTest, DirectoryCreatorFailure) {
  string file = MakeFile("regular");
  TransferHandlePtr handle =
      boost::make_shared<TransferHandle>("bucket", "key", file + "/sub/myfile");
  DirectoryCreatorSubscriber subscriber;
  EXPECT_THROW(subscriber.OnQueued(handle), CreateDirectoryError);
}

TEST_F(SubscribersTest, LastModifiedTime) {
  string file = MakeFile("myfile");
  ResultQueuePtr results = make_shared<ResultQueue>();
  ProvideLastModifiedTimeSubscriber subscriber(desiredTime, results);
  TransferHandlePtr handle = boost::make_shared<TransferHandle>("bucket", "key", file);
  handle->Done();
  subscriber.OnDone(handle);
  EXPECT_EQ(desiredTime, *GetFileStat(file).modified);
  EXPECT_TRUE(results->Empty());
}

TEST_F(SubscribersTest, LastModifiedTimeMissing) {
  string file = MakeFile("myfile");
  ResultQueuePtr results = make_shared<ResultQueue>();
  ProvideLastModifiedTimeSubscriber subscriber(optional<time_t>(), results);
  TransferHandlePtr handle = boost::make_shared<TransferHandle>("bucket", "key", file);
  handle->Done();
  EXPECT_NO_THROW(subscriber.OnDone(handle));

  WarningResult warning;
  ASSERT_TRUE(results->TryGet(&warning));
  EXPECT_EQ(0u, warning.message.find("warning: Successfully Downloaded " +
                                     file +
                                     " but was unable to update the last "
                                     "modified time."));
  EXPECT_TRUE(warning.warning);
  EXPECT_TRUE(results->Empty());
}

TEST_F(SubscribersTest, LastModifiedTimeFailure) {
  string file = string(testDir) + "not_real_file";
  ResultQueuePtr results = make_shared<ResultQueue>();
  ProvideLastModifiedTimeSubscriber subscriber(optional<time_t>(time(NULL)),
                                               results);
  TransferHandlePtr handle = boost::make_shared<TransferHandle>("bucket", "key", file);
  handle->Done();
  EXPECT_NO_THROW(subscriber.OnDone(handle));
  EXPECT_EQ(1u, results->Size());
}

TEST_F(SubscribersTest, LastModifiedTimeSkippedOnFailure) {
  string file = MakeFile("myfile");
  ResultQueuePtr results = make_shared<ResultQueue>();
  ProvideLastModifiedTimeSubscriber subscriber(desiredTime, results);
  TransferHandlePtr handle = boost::make_shared<TransferHandle>("bucket", "key", file);
  handle->SetException(MakeException("download failed"));
  handle->Done();
  subscriber.OnDone(handle);
  EXPECT_NE(desiredTime, *GetFileStat(file).modified);
  EXPECT_TRUE(results->Empty());
}

TEST_F(SubscribersTest, DispatcherFiresOnce) {
  shared_ptr<RecordingSubscriber> recorder =
      make_shared<RecordingSubscriber>();
  shared_ptr<OnlyDoneSubscriber> onlyDone = make_shared<OnlyDoneSubscriber>();
  SubscriberDispatcher dispatcher;
  dispatcher.Add(recorder);
  dispatcher.Add(onlyDone);
  EXPECT_EQ(2u, dispatcher.Size());

  TransferHandlePtr handle = make_shared<TransferHandle>("bucket", "key");
  dispatcher.NotifyQueued(handle);
  dispatcher.NotifyQueued(handle);
  EXPECT_EQ(TransferStatus::Queued, handle->GetStatus());
  handle->Done();
  EXPECT_EQ(0u, dispatcher.NotifyDone(handle));
  EXPECT_EQ(0u, dispatcher.NotifyDone(handle));

  EXPECT_EQ(1, recorder->queuedCalls);
  EXPECT_EQ(1, recorder->doneCalls);
  EXPECT_EQ(1, onlyDone->doneCalls);
}

TEST_F(SubscribersTest, DispatcherQueuedFailure) {
  shared_ptr<RecordingSubscriber> failing =
      make_shared<RecordingSubscriber>(true);
  shared_ptr<RecordingSubscriber> after = make_shared<RecordingSubscriber>();
  SubscriberDispatcher dispatcher;
  dispatcher.Add(failing);
  dispatcher.Add(after);

  TransferHandlePtr handle = make_shared<TransferHandle>("bucket", "key");
  EXPECT_THROW(dispatcher.NotifyQueued(handle), std::runtime_error);
  EXPECT_EQ(1, failing->queuedCalls);
  EXPECT_EQ(1, after->queuedCalls);

  // the handle records the abort
  EXPECT_EQ(TransferStatus::Failed, handle->GetStatus());
  ASSERT_TRUE(static_cast<bool>(handle->GetException()));
  try {
    boost::rethrow_exception(handle->GetException());
  } catch (const std::exception &err) {
    EXPECT_EQ(string("queued failure"), string(err.what()));
  }
}

TEST_F(SubscribersTest, DispatcherKeepsErrorType) {
  string file = MakeFile("regular");
  SubscriberDispatcher dispatcher;
  dispatcher.Add(make_shared<DirectoryCreatorSubscriber>());
  TransferHandlePtr handle =
      boost::make_shared<TransferHandle>("bucket", "key", file + "/sub/myfile");
  EXPECT_THROW(dispatcher.NotifyQueued(handle), CreateDirectoryError);
}

TEST_F(SubscribersTest, DispatcherDoneFailure) {
  shared_ptr<RecordingSubscriber> failing =
      make_shared<RecordingSubscriber>(true);
  shared_ptr<RecordingSubscriber> after = make_shared<RecordingSubscriber>();
  SubscriberDispatcher dispatcher;
  dispatcher.Add(failing);
  dispatcher.Add(after);

  TransferHandlePtr handle = make_shared<TransferHandle>("bucket", "key");
  handle->Done();
  EXPECT_EQ(1u, dispatcher.NotifyDone(handle));
  EXPECT_EQ(1, after->doneCalls);
}

TEST_F(SubscribersTest, DispatcherDoneNonStdFailure) {
  shared_ptr<RecordingSubscriber> after = make_shared<RecordingSubscriber>();
  SubscriberDispatcher dispatcher;
  dispatcher.Add(make_shared<NonStdThrowingSubscriber>());
  dispatcher.Add(after);

  TransferHandlePtr handle = make_shared<TransferHandle>("bucket", "key");
  handle->Done();
  size_t failures = 0;
  EXPECT_NO_THROW(failures = dispatcher.NotifyDone(handle));
  EXPECT_EQ(1u, failures);
  EXPECT_EQ(1, after->doneCalls);
}

TEST_F(SubscribersTest, DispatcherDoneWithoutQueued) {
  shared_ptr<RecordingSubscriber> recorder =
      make_shared<RecordingSubscriber>();
  SubscriberDispatcher dispatcher;
  dispatcher.Add(recorder);

  TransferHandlePtr handle = make_shared<TransferHandle>("bucket", "key");
  handle->Cancel();
  EXPECT_EQ(0u, dispatcher.NotifyDone(handle));
  EXPECT_EQ(0, recorder->queuedCalls);
  EXPECT_EQ(1, recorder->doneCalls);
}

}  // namespace Transfer
}  // namespace XF

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
