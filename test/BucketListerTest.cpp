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

#include <time.h>

#include <string>
#include <vector>

#include "boost/make_shared.hpp"
#include "boost/shared_ptr.hpp"
#include "gtest/gtest.h"

#include "base/Exception.h"
#include "transfer/BucketLister.h"

namespace XF {

namespace Transfer {

using boost::make_shared;
using boost::shared_ptr;
using XF::Exception::XFException;
using std::string;
using std::vector;

namespace {

ObjectRecord MakeRecord(const string &key, uint64_t size) {
  ObjectRecord record;
  record.key = key;
  record.size = size;
  record.lastModified = "2014-02-27T04:20:38.000Z";
  return record;
}

class FakePaginator : public ListObjectsPaginator {
 public:
  explicit FakePaginator(const vector<ListObjectsPage> &pages)
      : m_pages(pages), m_next(0) {}

  bool NextPage(ListObjectsPage *page) {
    if (m_next >= m_pages.size()) {
      return false;
    }
    *page = m_pages[m_next++];
    return true;
  }

  size_t GetPagesFetched() const { return m_next; }

 private:
  vector<ListObjectsPage> m_pages;
  size_t m_next;
};

class FakeClient : public ListObjectsClient {
 public:
  ListObjectsPaginatorPtr Paginate(const ListObjectsRequest &request) {
    requests.push_back(request);
    lastPaginator = boost::make_shared<FakePaginator>(pages);
    return lastPaginator;
  }

  vector<ListObjectsPage> pages;
  vector<ListObjectsRequest> requests;
  shared_ptr<FakePaginator> lastPaginator;
};

time_t FixedDate(const string &date) { return 42; }

time_t FailingDate(const string &date) {
  throw XFException("Invalid date " + date);
}

}  // namespace

class BucketListerTest : public ::testing::Test {
 protected:
  void SetUp() {
    m_client = make_shared<FakeClient>();
    ListObjectsPage first;
    first.contents.push_back(MakeRecord("a", 1));
    first.contents.push_back(MakeRecord("b", 2));
    ListObjectsPage second;
    second.contents.push_back(MakeRecord("c", 3));
    m_client->pages.push_back(first);
    m_client->pages.push_back(second);
  }

  shared_ptr<FakeClient> m_client;
};

TEST_F(BucketListerTest, ListObjects) {
  BucketLister lister(m_client, FixedDate);
  ObjectCursor cursor = lister.ListObjects("foo");

  vector<ListedObject> objects;
  ListedObject object;
  while (cursor.Next(&object)) {
    objects.push_back(object);
  }

  ASSERT_EQ(3u, objects.size());
  EXPECT_EQ(string("foo/a"), objects[0].path);
  EXPECT_EQ(string("foo/b"), objects[1].path);
  EXPECT_EQ(string("foo/c"), objects[2].path);
  EXPECT_EQ(1u, objects[0].record.size);
  EXPECT_EQ(3u, objects[2].record.size);
  for (size_t i = 0; i < objects.size(); ++i) {
    EXPECT_EQ(42, objects[i].record.lastModifiedTime);
    EXPECT_EQ(string("2014-02-27T04:20:38.000Z"),
              objects[i].record.lastModified);
  }
  EXPECT_FALSE(cursor.Next(&object));
}

TEST_F(BucketListerTest, RequestParameters) {
  BucketLister lister(m_client, FixedDate);
  ObjectCursor cursor = lister.ListObjects("foo", "dir/", 2);
  ASSERT_EQ(1u, m_client->requests.size());
  EXPECT_EQ(string("foo"), m_client->requests[0].bucket);
  EXPECT_EQ(string("dir/"), m_client->requests[0].prefix);
  EXPECT_EQ(2u, m_client->requests[0].pageSize);
}

TEST_F(BucketListerTest, PagesPulledLazily) {
  BucketLister lister(m_client, FixedDate);
  ObjectCursor cursor = lister.ListObjects("foo");
  EXPECT_EQ(0u, m_client->lastPaginator->GetPagesFetched());

  ListedObject object;
  ASSERT_TRUE(cursor.Next(&object));
  ASSERT_TRUE(cursor.Next(&object));
  EXPECT_EQ(1u, m_client->lastPaginator->GetPagesFetched());
  ASSERT_TRUE(cursor.Next(&object));
  EXPECT_EQ(2u, m_client->lastPaginator->GetPagesFetched());
}

TEST_F(BucketListerTest, FreshPaginationPerCall) {
  BucketLister lister(m_client, FixedDate);
  ListedObject object;
  ObjectCursor first = lister.ListObjects("foo");
  ASSERT_TRUE(first.Next(&object));
  ObjectCursor second = lister.ListObjects("foo");
  ASSERT_TRUE(second.Next(&object));
  EXPECT_EQ(string("foo/a"), object.path);
  EXPECT_EQ(2u, m_client->requests.size());
}

TEST_F(BucketListerTest, EmptyPagesSkipped) {
  m_client->pages.insert(m_client->pages.begin(), ListObjectsPage());
  BucketLister lister(m_client, FixedDate);
  ObjectCursor cursor = lister.ListObjects("foo");
  ListedObject object;
  ASSERT_TRUE(cursor.Next(&object));
  EXPECT_EQ(string("foo/a"), object.path);
}

TEST_F(BucketListerTest, EmptyBucketName) {
  BucketLister lister(m_client, FixedDate);
  ObjectCursor cursor = lister.ListObjects("");
  ListedObject object;
  ASSERT_TRUE(cursor.Next(&object));
  EXPECT_EQ(string("/a"), object.path);
}

TEST_F(BucketListerTest, DefaultDateParser) {
  BucketLister lister(m_client);
  ObjectCursor cursor = lister.ListObjects("foo");
  ListedObject object;
  ASSERT_TRUE(cursor.Next(&object));
  EXPECT_EQ(1393474838, object.record.lastModifiedTime);
}

TEST_F(BucketListerTest, DateParserFailurePropagates) {
  BucketLister lister(m_client, FailingDate);
  ObjectCursor cursor = lister.ListObjects("foo");
  ListedObject object;
  EXPECT_THROW(cursor.Next(&object), XFException);
}

}  // namespace Transfer
}  // namespace XF

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
