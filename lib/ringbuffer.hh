#ifndef CWMIX_RINGBUFFER_HH
#define CWMIX_RINGBUFFER_HH

#include <atomic>
#include <cstddef>
#include <vector>


/** Lock-free single-producer/single-consumer sample FIFO. Storage is allocated once. */
template <class T>
class RingBuffer
{
public:
  explicit RingBuffer(size_t capacity)
    : _buffer(capacity+1), _head(0), _tail(0)
  {
    // pass...
  }

  size_t capacity() const {
    return _buffer.size()-1;
  }

  size_t available() const {
    size_t head = _head.load(std::memory_order_acquire);
    size_t tail = _tail.load(std::memory_order_acquire);
    return (head + _buffer.size() - tail) % _buffer.size();
  }

  /** Producer side. Returns the number of elements stored, the rest is dropped. */
  size_t write(const T *data, size_t n) {
    size_t head = _head.load(std::memory_order_relaxed);
    size_t tail = _tail.load(std::memory_order_acquire);
    size_t free = (tail + _buffer.size() - head - 1) % _buffer.size();
    if (n > free)
      n = free;
    for (size_t i=0; i<n; i++) {
      _buffer[head] = data[i];
      head = (head+1) % _buffer.size();
    }
    _head.store(head, std::memory_order_release);
    return n;
  }

  /** Consumer side. Returns the number of elements read. */
  size_t read(T *data, size_t n) {
    size_t tail = _tail.load(std::memory_order_relaxed);
    size_t head = _head.load(std::memory_order_acquire);
    size_t used = (head + _buffer.size() - tail) % _buffer.size();
    if (n > used)
      n = used;
    for (size_t i=0; i<n; i++) {
      data[i] = _buffer[tail];
      tail = (tail+1) % _buffer.size();
    }
    _tail.store(tail, std::memory_order_release);
    return n;
  }

  /** Only valid while neither side is active. */
  void clear() {
    _head.store(0, std::memory_order_relaxed);
    _tail.store(0, std::memory_order_relaxed);
  }

protected:
  std::vector<T> _buffer;
  std::atomic<size_t> _head;
  std::atomic<size_t> _tail;
};

#endif // CWMIX_RINGBUFFER_HH
