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

#include <string>

#include "boost/bind.hpp"
#include "boost/thread/thread.hpp"
#include "gtest/gtest.h"

#include "base/BlockingQueue.hpp"

namespace {

using XF::Threading::BlockingQueue;
using std::string;

void PutNumbers(BlockingQueue<int> *queue, int count) {
  for (int i = 0; i < count; ++i) {
    queue->Put(i);
  }
}

}  // namespace

TEST(BlockingQueueTest, FifoOrder) {
  BlockingQueue<string> queue;
  EXPECT_TRUE(queue.Empty());
  queue.Put("a");
  queue.Put("b");
  EXPECT_EQ(2u, queue.Size());
  EXPECT_EQ(string("a"), queue.Get());
  EXPECT_EQ(string("b"), queue.Get());
  EXPECT_TRUE(queue.Empty());
}

TEST(BlockingQueueTest, TryGetEmpty) {
  BlockingQueue<string> queue;
  string value = "unchanged";
  EXPECT_FALSE(queue.TryGet(&value));
  EXPECT_EQ(string("unchanged"), value);
}

TEST(BlockingQueueTest, GetBlocksUntilPut) {
  BlockingQueue<int> queue;
  boost::thread producer(boost::bind(PutNumbers, &queue, 100));
  for (int i = 0; i < 100; ++i) {
    EXPECT_EQ(i, queue.Get());
  }
  producer.join();
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
