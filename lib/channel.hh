#ifndef CWMIX_CHANNEL_HH
#define CWMIX_CHANNEL_HH

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>


/** Bounded and ordered queue between threads. A producer either waits while the queue is
 * full (@c push) or gives up immediately (@c tryPush). Not for use from an audio callback. */
template <class T>
class Channel
{
public:
  explicit Channel(size_t capacity)
    : _capacity(capacity), _mutex(), _notEmpty(), _notFull(), _queue(), _closed(false)
  {
    // pass...
  }

  /** Returns @c false if the channel was closed. */
  bool push(const T &item) {
    std::unique_lock<std::mutex> lock(_mutex);
    while ((_queue.size() >= _capacity) && (! _closed))
      _notFull.wait(lock);
    if (_closed)
      return false;
    _queue.push_back(item);
    _notEmpty.notify_one();
    return true;
  }

  /** Returns @c false if the channel is full or closed. */
  bool tryPush(const T &item) {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_closed || (_queue.size() >= _capacity))
      return false;
    _queue.push_back(item);
    _notEmpty.notify_one();
    return true;
  }

  bool tryPop(T &item) {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_queue.empty())
      return false;
    item = _queue.front();
    _queue.pop_front();
    _notFull.notify_one();
    return true;
  }

  /** Waits at most @c timeout for an item. */
  template <class Rep, class Period>
  bool popFor(T &item, const std::chrono::duration<Rep, Period> &timeout) {
    std::unique_lock<std::mutex> lock(_mutex);
    if (_queue.empty() && (! _closed))
      _notEmpty.wait_for(lock, timeout);
    if (_queue.empty())
      return false;
    item = _queue.front();
    _queue.pop_front();
    _notFull.notify_one();
    return true;
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _queue.size();
  }

  bool isClosed() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _closed;
  }

  /** Wakes all waiting threads, later pushes fail. */
  void close() {
    std::lock_guard<std::mutex> lock(_mutex);
    _closed = true;
    _notEmpty.notify_all();
    _notFull.notify_all();
  }

protected:
  size_t _capacity;
  mutable std::mutex _mutex;
  std::condition_variable _notEmpty;
  std::condition_variable _notFull;
  std::deque<T> _queue;
  bool _closed;
};

#endif // CWMIX_CHANNEL_HH
