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
#include "transfer/MimeTypes.h"

namespace XF {

namespace Transfer {

using std::string;

static const char *const testDir = "/tmp/xfer.test.mimetypes/";

// Mime types can be initialized only once per process, so the file is
// loaded by the fixture of the whole test case.
class MimeTypesTest : public ::testing::Test {
 public:
  static void SetUpTestCase() {
    XF::Utils::CreateDirectoryIfNotExists(testDir);
    string path = string(testDir) + "mime.types";
    {
      std::ofstream file(path.c_str());
      file << "# comment line\n"
           << "\n"
           << "text/plain\t\ttxt text conf\n"
           << "image/jpeg   jpeg jpg jpe\n"
           << "application/x-custom\txcu\n";
    }
    InitializeMimeTypes(path);
    // later calls take no effect
    InitializeMimeTypes(string());
  }

  static void TearDownTestCase() {
    XF::Utils::DeleteFilesInDirectory(testDir, true);
  }
};

TEST_F(MimeTypesTest, LoadedFromFile) {
  EXPECT_EQ(7u, MimeTypes::Instance().Size());
  EXPECT_EQ(string("application/x-custom"), MimeTypes::Instance().Find("xcu"));
  // not in the file, so not in the table
  EXPECT_EQ(string(), MimeTypes::Instance().Find("html"));
}

TEST_F(MimeTypesTest, CaseInsensitive) {
  EXPECT_EQ(string("image/jpeg"), MimeTypes::Instance().Find("JPG"));
  EXPECT_EQ(string("text/plain"), MimeTypes::Instance().Find("Txt"));
}

TEST_F(MimeTypesTest, GuessContentType) {
  EXPECT_EQ(string("text/plain"), GuessContentType("foo.txt"));
  EXPECT_EQ(string("text/plain"), GuessContentType("/tmp/dir.d/foo.TXT"));
  EXPECT_EQ(string("image/jpeg"), GuessContentType("photos/a.b.jpeg"));
}

TEST_F(MimeTypesTest, GuessContentTypeNoMatch) {
  EXPECT_EQ(string(), GuessContentType("no-extension"));
  EXPECT_EQ(string(), GuessContentType("dir.d/no-extension"));
  EXPECT_EQ(string(), GuessContentType(".txt"));
  EXPECT_EQ(string(), GuessContentType("trailing."));
  EXPECT_EQ(string(), GuessContentType("unknown.zzz"));
}

}  // namespace Transfer
}  // namespace XF

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
