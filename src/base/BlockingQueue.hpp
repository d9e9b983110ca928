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

#ifndef XFER_BASE_BLOCKINGQUEUE_HPP_
#define XFER_BASE_BLOCKINGQUEUE_HPP_

#include <stddef.h>  // for size_t

#include <deque>

#include "boost/bind.hpp"
#include "boost/noncopyable.hpp"
#include "boost/thread/condition_variable.hpp"
#include "boost/thread/locks.hpp"
#include "boost/thread/mutex.hpp"

namespace XF {

namespace Threading {

//
// Unbounded FIFO shared between producers and consumers
//
template <typename T>
class BlockingQueue : private boost::noncopyable {
 public:
  BlockingQueue() {}
  ~BlockingQueue() {}

 public:
  void Put(const T &value) {
    {
      boost::lock_guard<boost::mutex> lock(m_lock);
      m_values.push_back(value);
    }
    m_notEmpty.notify_one();
  }

  // Block until a value is available
  T Get() {
    boost::unique_lock<boost::mutex> lock(m_lock);
    m_notEmpty.wait(lock, boost::bind(boost::type<bool>(),
                                      &BlockingQueue::HasValues, this));
    T value = m_values.front();
    m_values.pop_front();
    return value;
  }

  bool TryGet(T *value) {
    boost::lock_guard<boost::mutex> lock(m_lock);
    if (m_values.empty()) {
      return false;
    }
    *value = m_values.front();
    m_values.pop_front();
    return true;
  }

  size_t Size() const {
    boost::lock_guard<boost::mutex> lock(m_lock);
    return m_values.size();
  }

  bool Empty() const {
    boost::lock_guard<boost::mutex> lock(m_lock);
    return m_values.empty();
  }

 private:
  bool HasValues() const { return !m_values.empty(); }

  std::deque<T> m_values;
  mutable boost::mutex m_lock;
  boost::condition_variable m_notEmpty;
};

}  // namespace Threading
}  // namespace XF

#endif  // XFER_BASE_BLOCKINGQUEUE_HPP_
