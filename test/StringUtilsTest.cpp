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

#include <sstream>
#include <string>

#include "gtest/gtest.h"

#include "base/Exception.h"
#include "base/StdoutBytesWriter.h"
#include "base/StringUtils.h"

using std::string;

namespace {

// "SomeChars" CHECK MARK HEAVY CHECK MARK "OtherChars"
const char *const checkMarks = "SomeChars\xe2\x9c\x93\xe2\x9c\x94OtherChars";

}  // namespace

TEST(StringUtilsTest, ChangeCase) {
  string lowercase = "lowercase";
  EXPECT_EQ(lowercase, XF::StringUtils::ToLower("LOWerCase"));

  string uppercase = "UPPERCASE";
  EXPECT_EQ(uppercase, XF::StringUtils::ToUpper("UpperCase"));
}

TEST(StringUtilsTest, Trim) {
  string raw = "    hello world    ";
  string notrailing = "    hello world";
  string noleading = "hello world    ";
  string noboth = "hello world";
  char ch = ' ';

  EXPECT_EQ(notrailing, XF::StringUtils::RTrim(raw, ch));
  EXPECT_EQ(noleading, XF::StringUtils::LTrim(raw, ch));
  EXPECT_EQ(noboth, XF::StringUtils::Trim(raw, ch));
  EXPECT_EQ(string(), XF::StringUtils::Trim("    ", ch));
}

TEST(StringUtilsTest, FormatPath) {
  EXPECT_EQ(string("[path=/tmp/a]"), XF::StringUtils::FormatPath("/tmp/a"));
  EXPECT_EQ(string("[from=/a to=/b]"),
            XF::StringUtils::FormatPath("/a", "/b"));
}

TEST(StringUtilsTest, EncodeUtf8PassThrough) {
  using XF::StringUtils::EncodeForOutput;
  EXPECT_EQ(string(checkMarks), EncodeForOutput(checkMarks, "utf-8"));
  EXPECT_EQ(string(checkMarks), EncodeForOutput(checkMarks, "UTF8"));
}

TEST(StringUtilsTest, EncodeAsciiReplacesCharacters) {
  using XF::StringUtils::EncodeForOutput;
  EXPECT_EQ(string("SomeChars??OtherChars"),
            EncodeForOutput(checkMarks, "ascii"));
  // no encoding declared, e.g. output piped
  EXPECT_EQ(string("SomeChars??OtherChars"), EncodeForOutput(checkMarks, ""));
  EXPECT_EQ(string("caf?"), EncodeForOutput("caf\xc3\xa9", "ascii"));
}

TEST(StringUtilsTest, EncodeLatin1) {
  using XF::StringUtils::EncodeForOutput;
  EXPECT_EQ(string("caf\xe9"), EncodeForOutput("caf\xc3\xa9", "latin-1"));
  EXPECT_EQ(string("SomeChars??OtherChars"),
            EncodeForOutput(checkMarks, "ISO-8859-1"));
}

TEST(StringUtilsTest, EncodeMalformedUtf8) {
  using XF::StringUtils::EncodeForOutput;
  // truncated sequence, each byte left is replaced
  EXPECT_EQ(string("ab??"), EncodeForOutput("ab\xe2\x9c", "ascii"));
  // lone continuation byte
  EXPECT_EQ(string("a?b"), EncodeForOutput("a\x80" "b", "latin-1"));
}

TEST(StringUtilsTest, UniPrint) {
  std::ostringstream utf8Out;
  XF::StringUtils::UniPrint("\xe2\x9c\x93", utf8Out, "utf-8");
  EXPECT_EQ(string("\xe2\x9c\x93"), utf8Out.str());

  std::ostringstream asciiOut;
  XF::StringUtils::UniPrint(checkMarks, asciiOut);
  EXPECT_EQ(string("SomeChars??OtherChars"), asciiOut.str());
}

TEST(StringUtilsTest, BytesWriterPassesBytesThrough) {
  std::ostringstream out;
  XF::StringUtils::StdoutBytesWriter writer(out);
  writer.Write("foo");
  // bytes which UniPrint would replace are kept as they are
  writer.Write(checkMarks);
  writer.Write(string("\0\xff", 2));
  writer.Write(string());
  writer.Flush();
  EXPECT_EQ(string("foo") + checkMarks + string("\0\xff", 2), out.str());
}

TEST(StringUtilsTest, BytesWriterFailure) {
  std::ostringstream out;
  out.setstate(std::ios_base::badbit);
  XF::StringUtils::StdoutBytesWriter writer(out);
  EXPECT_THROW(writer.Write("foo"), XF::Exception::XFException);
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  int code = RUN_ALL_TESTS();
  return code;
}
