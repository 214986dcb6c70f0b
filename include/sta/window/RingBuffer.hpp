#pragma once
#include <cstddef>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

namespace sta::window {

// Fixed-capacity window over the most recent samples, oldest first.
// Pushing into a full buffer overwrites (and returns) the oldest element.
template <typename T>
class RingBuffer {
public:
  class const_iterator {
  public:
    using iterator_category = std::forward_iterator_tag;
    using value_type        = T;
    using difference_type   = std::ptrdiff_t;
    using pointer           = const T*;
    using reference         = const T&;

    const_iterator() = default;
    const_iterator(const RingBuffer* rb, size_t i) : rb_(rb), i_(i) {}

    reference operator*() const { return (*rb_)[i_]; }
    pointer operator->() const { return &(*rb_)[i_]; }
    const_iterator& operator++() { ++i_; return *this; }
    const_iterator operator++(int) { auto tmp = *this; ++i_; return tmp; }
    bool operator==(const const_iterator& o) const { return rb_ == o.rb_ && i_ == o.i_; }
    bool operator!=(const const_iterator& o) const { return !(*this == o); }

  private:
    const RingBuffer* rb_ = nullptr;
    size_t i_ = 0;
  };

  explicit RingBuffer(size_t capacity)
  : cap_(capacity), buf_(capacity) {
    if (capacity == 0)
      throw std::invalid_argument("RingBuffer: capacity must be > 0");
  }

  // Append; returns the evicted oldest element when the buffer was full.
  std::optional<T> push(T v) {
    const size_t slot = (head_ + size_) % cap_;
    if (size_ < cap_) {
      buf_[slot] = std::move(v);
      ++size_;
      return std::nullopt;
    }
    std::optional<T> evicted(std::move(buf_[head_]));
    buf_[head_] = std::move(v);
    head_ = (head_ + 1) % cap_;
    return evicted;
  }

  // i-th oldest element, i < size().
  const T& operator[](size_t i) const { return buf_[(head_ + i) % cap_]; }

  const T& front() const { return (*this)[0]; }
  const T& back() const { return (*this)[size_ - 1]; }

  size_t size() const { return size_; }
  size_t capacity() const { return cap_; }
  bool empty() const { return size_ == 0; }
  bool full() const { return size_ == cap_; }

  const_iterator begin() const { return const_iterator(this, 0); }
  const_iterator end() const { return const_iterator(this, size_); }

  void reset() {
    head_ = 0;
    size_ = 0;
  }

private:
  size_t cap_;
  std::vector<T> buf_;
  size_t head_ = 0;
  size_t size_ = 0;
};

} // namespace sta::window
