#ifndef CLOUDBURST_PRIORITYQUEUELOCKSEMANTICS_HPP
#define CLOUDBURST_PRIORITYQUEUELOCKSEMANTICS_HPP

#include <algorithm>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>

namespace cloudburst {
/** @brief Deque kept sorted by priority, with an accessible mutex.
 *
 * Entries of equal priority keep their insertion order.
 */
template<typename T, class C = std::less<T>>
class PriorityQueueLockSemantics
{
  public:
  PriorityQueueLockSemantics(C compare = C())
    : m_compare(compare)
  {}
  ~PriorityQueueLockSemantics() {}

  void pushNoLock(T obj)
  {
    m_queue.push_back(std::move(obj));
    std::stable_sort(m_queue.begin(), m_queue.end(), m_compare);
  }

  T popNoLock()
  {
    auto result = std::move(m_queue.front());
    m_queue.pop_front();
    return result;
  }

  inline bool empty() const { return m_queue.empty(); }

  inline int64_t size() const { return m_queue.size(); }

  inline std::mutex& getMutex() { return m_mutex; }

  private:
  std::deque<T> m_queue;
  std::mutex m_mutex;
  C m_compare;
};

template<typename T>
struct unique_ptr_less
{
  inline bool operator()(const std::unique_ptr<T>& l,
                         const std::unique_ptr<T>& r) const
  {
    if(!l || !r)
      return false;
    return *l < *r;
  }
};

template<typename T>
using PriorityQueueLockSemanticsUniquePtr =
  PriorityQueueLockSemantics<std::unique_ptr<T>, unique_ptr_less<T>>;
}

#endif
