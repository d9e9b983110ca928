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

#include <stdint.h>

#include <string>

#include "gtest/gtest.h"

#include "base/Exception.h"
#include "base/Size.h"
#include "base/SizeUtils.h"

using XF::Exception::InvalidSizeError;
using XF::SizeUtils::HumanReadableSize;
using XF::SizeUtils::HumanReadableToBytes;
using std::string;

TEST(SizeUtilsTest, HumanReadableBytes) {
  EXPECT_EQ(string("0 Bytes"), HumanReadableSize(0));
  EXPECT_EQ(string("1 Byte"), HumanReadableSize(1));
  EXPECT_EQ(string("10 Bytes"), HumanReadableSize(10));
  EXPECT_EQ(string("1000 Bytes"), HumanReadableSize(1000));
}

TEST(SizeUtilsTest, HumanReadableUnits) {
  EXPECT_EQ(string("1.0 KiB"), HumanReadableSize(XF::Size::KB1));
  EXPECT_EQ(string("1000.0 KiB"), HumanReadableSize(1000 * XF::Size::KB1));
  EXPECT_EQ(string("1.0 MiB"), HumanReadableSize(XF::Size::MB1));
  EXPECT_EQ(string("1.0 GiB"), HumanReadableSize(XF::Size::GB1));
  EXPECT_EQ(string("1.0 TiB"), HumanReadableSize(XF::Size::TB1));
  EXPECT_EQ(string("1.0 PiB"), HumanReadableSize(XF::Size::PB1));
  EXPECT_EQ(string("1.0 EiB"), HumanReadableSize(XF::Size::EB1));
  EXPECT_EQ(string("5.0 TiB"), HumanReadableSize(XF::Size::TB5));
}

TEST(SizeUtilsTest, HumanReadableRoundsToNextUnit) {
  EXPECT_EQ(string("1.0 MiB"), HumanReadableSize(XF::Size::MB1 - 1));
  EXPECT_EQ(string("1.0 GiB"), HumanReadableSize(XF::Size::GB1 - 1));
  EXPECT_EQ(string("1.5 KiB"), HumanReadableSize(1536));
}

TEST(SizeUtilsTest, ToBytes) {
  EXPECT_EQ(1024u, HumanReadableToBytes("1024"));
  EXPECT_EQ(XF::Size::KB1, HumanReadableToBytes("1KB"));
  EXPECT_EQ(8 * XF::Size::MB1, HumanReadableToBytes("8MB"));
  EXPECT_EQ(8 * XF::Size::MB1, HumanReadableToBytes("8mib"));
  EXPECT_EQ(XF::Size::GB1, HumanReadableToBytes("1 GiB"));
  EXPECT_EQ(XF::Size::TB5, HumanReadableToBytes(" 5tb "));
}

TEST(SizeUtilsTest, ToBytesInvalid) {
  EXPECT_THROW(HumanReadableToBytes(""), InvalidSizeError);
  EXPECT_THROW(HumanReadableToBytes("MB"), InvalidSizeError);
  EXPECT_THROW(HumanReadableToBytes("-1"), InvalidSizeError);
  EXPECT_THROW(HumanReadableToBytes("1.5MB"), InvalidSizeError);
  EXPECT_THROW(HumanReadableToBytes("10XB"), InvalidSizeError);
  EXPECT_THROW(HumanReadableToBytes("99999999999999999999TB"),
               InvalidSizeError);
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
