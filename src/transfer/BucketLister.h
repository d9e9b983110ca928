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

#ifndef XFER_TRANSFER_BUCKETLISTER_H_
#define XFER_TRANSFER_BUCKETLISTER_H_

#include <stddef.h>  // for size_t
#include <stdint.h>  // for uint64_t
#include <time.h>

#include <string>
#include <vector>

#include "boost/function.hpp"
#include "boost/shared_ptr.hpp"

namespace XF {

namespace Transfer {

// One object of a list objects response
struct ObjectRecord {
  ObjectRecord() : size(0), lastModifiedTime(0) {}

  std::string key;
  uint64_t size;
  std::string eTag;
  std::string storageClass;
  std::string lastModified;  // as received, e.g. "2014-02-27T04:20:38.000Z"
  time_t lastModifiedTime;   // set by the cursor from lastModified
};

struct ListObjectsPage {
  std::vector<ObjectRecord> contents;
  std::vector<std::string> commonPrefixes;
};

struct ListObjectsRequest {
  ListObjectsRequest(const std::string &bucket_ = std::string(),
                     const std::string &prefix_ = std::string(),
                     size_t pageSize_ = 1000)
      : bucket(bucket_), prefix(prefix_), pageSize(pageSize_) {}

  std::string bucket;
  std::string prefix;
  size_t pageSize;  // max keys per page
};

//
// Remote side of listing, implemented by the client of the service
//
class ListObjectsPaginator {
 public:
  virtual ~ListObjectsPaginator() {}

  // Fetch the next page
  //
  // @param  : page to fill
  // @return : false if there is no more page
  virtual bool NextPage(ListObjectsPage *page) = 0;
};

typedef boost::shared_ptr<ListObjectsPaginator> ListObjectsPaginatorPtr;

class ListObjectsClient {
 public:
  virtual ~ListObjectsClient() {}

  // Start a fresh pagination for the request
  virtual ListObjectsPaginatorPtr Paginate(
      const ListObjectsRequest &request) = 0;
};

typedef boost::shared_ptr<ListObjectsClient> ListObjectsClientPtr;

// Convert the last modified string of a record to seconds since epoch
typedef boost::function<time_t(const std::string &)> DateParser;

struct ListedObject {
  std::string path;  // bucket/key
  ObjectRecord record;
};

//
// ObjectCursor
//
// Yield the objects of a listing one by one, pulling pages lazily.
//
class ObjectCursor {
 public:
  ObjectCursor(const std::string &bucket, ListObjectsPaginatorPtr paginator,
               DateParser dateParser);

  ~ObjectCursor() {}

 public:
  // Get next object
  //
  // @param  : object to fill
  // @return : false if the listing is exhausted
  //
  // Exceptions of the paginator or the date parser propagate.
  bool Next(ListedObject *object);

 private:
  bool FetchPage();
  void NormalizePage(ListObjectsPage *page) const;

  std::string m_bucket;
  ListObjectsPaginatorPtr m_paginator;
  DateParser m_dateParser;
  ListObjectsPage m_page;
  size_t m_index;  // next record of m_page.contents
  bool m_exhausted;
};

//
// BucketLister
//
// List all objects of a bucket under a prefix.
//
class BucketLister {
 public:
  // An empty date parser means ParseLastModified
  explicit BucketLister(ListObjectsClientPtr client,
                        DateParser dateParser = DateParser());

  ~BucketLister() {}

 public:
  // Each call issues a fresh pagination, the page size is the one of
  // Options (page_size)
  ObjectCursor ListObjects(const std::string &bucket,
                           const std::string &prefix = std::string()) const;
  ObjectCursor ListObjects(const std::string &bucket, const std::string &prefix,
                           size_t pageSize) const;

 private:
  ListObjectsClientPtr m_client;
  DateParser m_dateParser;
};

}  // namespace Transfer
}  // namespace XF

#endif  // XFER_TRANSFER_BUCKETLISTER_H_
