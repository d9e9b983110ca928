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

#include "transfer/BucketLister.h"

#include <string>
#include <vector>

#include "boost/foreach.hpp"

#include "base/Exception.h"
#include "base/LogMacros.h"
#include "base/TimeUtils.h"
#include "configure/Options.h"

namespace XF {

namespace Transfer {

using XF::Exception::XFException;
using XF::TimeUtils::ParseLastModified;
using std::string;

// --------------------------------------------------------------------------
ObjectCursor::ObjectCursor(const string &bucket,
                           ListObjectsPaginatorPtr paginator,
                           DateParser dateParser)
    : m_bucket(bucket),
      m_paginator(paginator),
      m_dateParser(dateParser),
      m_index(0),
      m_exhausted(!paginator) {}

// --------------------------------------------------------------------------
bool ObjectCursor::Next(ListedObject *object) {
  while (m_index >= m_page.contents.size()) {
    if (!FetchPage()) {
      return false;
    }
  }

  const ObjectRecord &record = m_page.contents[m_index++];
  if (object != NULL) {
    object->path = m_bucket.empty() ? "/" + record.key
                                    : m_bucket + "/" + record.key;
    object->record = record;
  }
  return true;
}

// --------------------------------------------------------------------------
bool ObjectCursor::FetchPage() {
  if (m_exhausted) {
    return false;
  }
  ListObjectsPage page;
  if (!m_paginator->NextPage(&page)) {
    m_exhausted = true;
    m_page = ListObjectsPage();
    m_index = 0;
    return false;
  }
  NormalizePage(&page);
  DebugInfo("Listed " << page.contents.size() << " objects in bucket "
            << m_bucket);
  m_page = page;
  m_index = 0;
  return true;
}

// --------------------------------------------------------------------------
void ObjectCursor::NormalizePage(ListObjectsPage *page) const {
  BOOST_FOREACH(ObjectRecord &record, page->contents) {
    record.lastModifiedTime = m_dateParser(record.lastModified);
  }
}

// --------------------------------------------------------------------------
BucketLister::BucketLister(ListObjectsClientPtr client, DateParser dateParser)
    : m_client(client), m_dateParser(dateParser) {
  if (!m_client) {
    throw XFException("Bucket lister requires a list objects client");
  }
  if (!m_dateParser) {
    m_dateParser = ParseLastModified;
  }
}

// --------------------------------------------------------------------------
ObjectCursor BucketLister::ListObjects(const string &bucket,
                                       const string &prefix) const {
  return ListObjects(bucket, prefix,
                     XF::Configure::Options::Instance().GetListPageSize());
}

// --------------------------------------------------------------------------
ObjectCursor BucketLister::ListObjects(const string &bucket,
                                       const string &prefix,
                                       size_t pageSize) const {
  ListObjectsRequest request(bucket, prefix, pageSize);
  return ObjectCursor(bucket, m_client->Paginate(request), m_dateParser);
}

}  // namespace Transfer
}  // namespace XF
