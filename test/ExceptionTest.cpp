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

#include <string>

#include "gtest/gtest.h"

#include "base/Exception.h"

namespace {

using XF::Exception::CreateDirectoryError;
using XF::Exception::OSError;
using XF::Exception::QueueFullError;
using XF::Exception::XFException;
using std::string;

static const char *const testMsg = "test XFException";

void ThrowException() { throw XFException(testMsg); }

string GetExceptionMsg() {
  try {
    ThrowException();
  } catch (const XFException &err) {
    return err.get();
  }
  return string();
}

}  // namespace

TEST(XFExceptionTest, DefaultTest) {
  EXPECT_EQ(GetExceptionMsg(), string(testMsg));
}

TEST(XFExceptionTest, OSErrorKeepsErrorCode) {
  try {
    throw OSError(ENOENT, "no such file");
  } catch (const XFException &err) {
    const OSError *osError = dynamic_cast<const OSError *>(&err);
    ASSERT_TRUE(osError != NULL);
    EXPECT_EQ(ENOENT, osError->GetErrorCode());
    EXPECT_EQ(string("no such file"), string(err.what()));
  }
}

TEST(XFExceptionTest, CatchAsBase) {
  EXPECT_THROW(throw QueueFullError("full"), XFException);
  EXPECT_THROW(throw CreateDirectoryError("dir"), std::runtime_error);
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  int code = RUN_ALL_TESTS();
  return code;
}
