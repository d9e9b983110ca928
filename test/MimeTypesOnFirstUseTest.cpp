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

#include <fstream>
#include <string>

#include "gtest/gtest.h"

#include "base/Utils.h"
#include "configure/Parser.h"
#include "transfer/MimeTypes.h"

namespace {

using XF::Transfer::GuessContentType;
using XF::Transfer::MimeTypes;
using std::string;

static const char *const testDir = "/tmp/xfer.test.mimetypes.firstuse/";

}  // namespace

// Nothing initializes mime types in this process before the first guess.
TEST(MimeTypesOnFirstUseTest, UsesConfiguredMimeFile) {
  ASSERT_TRUE(XF::Utils::CreateDirectoryIfNotExists(testDir));
  string path = string(testDir) + "mime.types";
  {
    std::ofstream file(path.c_str());
    file << "application/x-custom\txcu\n";
  }
  XF::Configure::Parser::Parse("mime_file=" + path);
  EXPECT_EQ(path, XF::Transfer::FindMimeFile());

  EXPECT_EQ(string("application/x-custom"), GuessContentType("a.xcu"));
  EXPECT_EQ(1u, MimeTypes::Instance().Size());

  // already loaded
  XF::Transfer::InitializeMimeTypes(string());
  EXPECT_EQ(string(), GuessContentType("a.txt"));

  XF::Utils::DeleteFilesInDirectory(testDir, true);
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
