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

#ifndef XFER_BASE_STABLEPRIORITYQUEUE_HPP_
#define XFER_BASE_STABLEPRIORITYQUEUE_HPP_

#include <stddef.h>  // for size_t
#include <stdint.h>

#include <queue>
#include <vector>

#include "boost/bind.hpp"
#include "boost/date_time/posix_time/posix_time_types.hpp"
#include "boost/noncopyable.hpp"
#include "boost/shared_ptr.hpp"
#include "boost/static_assert.hpp"
#include "boost/thread/condition_variable.hpp"
#include "boost/thread/locks.hpp"
#include "boost/thread/mutex.hpp"
#include "boost/type_traits/is_polymorphic.hpp"

#include "base/Exception.h"

namespace XF {

namespace Threading {

//
// Capability of an item to tell its scheduling priority, a lower value is
// served first.
//
class HasPriority {
 public:
  virtual ~HasPriority() {}
  virtual int64_t GetPriority() const = 0;
};

/**
 * Bounded priority queue with FIFO order among equal priorities.
 *
 * Items are ordered by (priority, insertion sequence). The priority is read
 * from HasPriority when the item implements it, and is capped to
 * [0, maxPriority]. Items without it are served last, as maxPriority.
 * The insertion sequence is global, so FIFO holds across all producers.
 *
 * Put blocks while the queue is full and Get blocks while it is empty.
 * A max size of 0 means unbounded.
 */
template <typename T>
class StablePriorityQueue : private boost::noncopyable {
  BOOST_STATIC_ASSERT(boost::is_polymorphic<T>::value);

 public:
  typedef boost::shared_ptr<T> ItemPtr;

  StablePriorityQueue(size_t maxSize, int64_t maxPriority)
      : m_maxSize(maxSize),
        m_maxPriority(maxPriority < 0 ? 0 : maxPriority),
        m_sequence(0) {}

  ~StablePriorityQueue() {}

 public:
  size_t GetMaxSize() const { return m_maxSize; }
  int64_t GetMaxPriority() const { return m_maxPriority; }

  size_t Size() const {
    boost::lock_guard<boost::mutex> lock(m_lock);
    return m_queue.size();
  }

  bool Empty() const {
    boost::lock_guard<boost::mutex> lock(m_lock);
    return m_queue.empty();
  }

  // Put item, block until there is room for it
  void Put(const ItemPtr &item) {
    boost::unique_lock<boost::mutex> lock(m_lock);
    m_notFull.wait(lock, boost::bind(boost::type<bool>(),
                                     &StablePriorityQueue::HasRoom, this));
    DoPut(item, lock);
  }

  // Put item if there is room for it
  //
  // @param  : item
  // @return : false if the queue is full
  bool TryPut(const ItemPtr &item) {
    boost::unique_lock<boost::mutex> lock(m_lock);
    if (!HasRoom()) {
      return false;
    }
    DoPut(item, lock);
    return true;
  }

  // Put item, wait at most timeout for room
  //
  // Throw QueueFullError if the queue is still full after timeout.
  void TimedPut(const ItemPtr &item,
                const boost::posix_time::time_duration &timeout) {
    boost::unique_lock<boost::mutex> lock(m_lock);
    if (!m_notFull.timed_wait(
            lock, timeout,
            boost::bind(boost::type<bool>(), &StablePriorityQueue::HasRoom,
                        this))) {
      throw XF::Exception::QueueFullError("Priority queue is full");
    }
    DoPut(item, lock);
  }

  // Get the item of highest precedence, block until there is one
  ItemPtr Get() {
    boost::unique_lock<boost::mutex> lock(m_lock);
    m_notEmpty.wait(lock, boost::bind(boost::type<bool>(),
                                      &StablePriorityQueue::HasItems, this));
    return DoGet(lock);
  }

  // Get the item of highest precedence if there is one
  bool TryGet(ItemPtr *item) {
    boost::unique_lock<boost::mutex> lock(m_lock);
    if (m_queue.empty()) {
      return false;
    }
    *item = DoGet(lock);
    return true;
  }

  // Get the item of highest precedence, wait at most timeout for one
  bool TimedGet(ItemPtr *item,
                const boost::posix_time::time_duration &timeout) {
    boost::unique_lock<boost::mutex> lock(m_lock);
    if (!m_notEmpty.timed_wait(
            lock, timeout,
            boost::bind(boost::type<bool>(), &StablePriorityQueue::HasItems,
                        this))) {
      return false;
    }
    *item = DoGet(lock);
    return true;
  }

  // Effective priority the queue assigns to item
  int64_t GetEffectivePriority(const ItemPtr &item) const {
    const HasPriority *prioritized = dynamic_cast<const HasPriority *>(
        static_cast<const T *>(item.get()));
    if (prioritized == NULL) {
      return m_maxPriority;
    }
    int64_t priority = prioritized->GetPriority();
    if (priority < 0) {
      return 0;
    }
    return priority > m_maxPriority ? m_maxPriority : priority;
  }

 private:
  struct Entry {
    Entry(int64_t p, uint64_t s, const ItemPtr &i)
        : priority(p), sequence(s), item(i) {}

    int64_t priority;
    uint64_t sequence;
    ItemPtr item;
  };

  struct Greater {
    bool operator()(const Entry &left, const Entry &right) const {
      if (left.priority != right.priority) {
        return left.priority > right.priority;
      }
      return left.sequence > right.sequence;
    }
  };

  typedef std::priority_queue<Entry, std::vector<Entry>, Greater> EntryQueue;

  bool HasRoom() const { return m_maxSize == 0 || m_queue.size() < m_maxSize; }
  bool HasItems() const { return !m_queue.empty(); }

  void DoPut(const ItemPtr &item, boost::unique_lock<boost::mutex> &lock) {
    m_queue.push(Entry(GetEffectivePriority(item), m_sequence++, item));
    lock.unlock();
    m_notEmpty.notify_one();
  }

  ItemPtr DoGet(boost::unique_lock<boost::mutex> &lock) {
    ItemPtr item = m_queue.top().item;
    m_queue.pop();
    lock.unlock();
    m_notFull.notify_one();
    return item;
  }

 private:
  size_t m_maxSize;
  int64_t m_maxPriority;
  uint64_t m_sequence;  // insertion order of next item
  EntryQueue m_queue;
  mutable boost::mutex m_lock;
  boost::condition_variable m_notEmpty;
  boost::condition_variable m_notFull;
};

}  // namespace Threading
}  // namespace XF

#endif  // XFER_BASE_STABLEPRIORITYQUEUE_HPP_
