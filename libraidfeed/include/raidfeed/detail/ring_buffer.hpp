//    raidfeed                  Live raid boss
//                              aggregation
//
// SPDX-FileCopyrightText: (c) 2026 The raidfeed Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <cstddef>
#include <utility>
#include <vector>

namespace raidfeed::detail {

/// A container with a fixed capacity that overwrites its oldest element when
/// pushing into a full buffer.
///
/// The buffer reserves its storage once on construction and never reallocates
/// afterwards. A capacity of zero is valid; such a buffer discards every
/// element pushed into it.
/// @tparam T The element type.
template <class T>
class ring_buffer {
public:
  using value_type = T;
  using size_type = size_t;
  using const_iterator = typename std::vector<T>::const_iterator;

  /// Constructs an empty buffer.
  /// @param capacity The maximum number of elements.
  explicit ring_buffer(size_type capacity) : capacity_{capacity} {
    xs_.reserve(capacity_);
  }

  /// Stores an element, evicting the oldest one if the buffer is full.
  void push(T x) {
    if (capacity_ == 0)
      return;
    if (xs_.size() < capacity_) {
      xs_.push_back(std::move(x));
      return;
    }
    xs_[next_] = std::move(x);
    next_ = (next_ + 1) % capacity_;
  }

  /// Copies all stored elements in unspecified order.
  /// @note Callers that need chronological order must sort the result.
  [[nodiscard]] std::vector<T> snapshot() const {
    return xs_;
  }

  [[nodiscard]] size_type size() const noexcept {
    return xs_.size();
  }

  [[nodiscard]] size_type capacity() const noexcept {
    return capacity_;
  }

  [[nodiscard]] bool empty() const noexcept {
    return xs_.empty();
  }

  // Iteration happens in slot order, just like `snapshot()`.

  const_iterator begin() const noexcept {
    return xs_.begin();
  }

  const_iterator end() const noexcept {
    return xs_.end();
  }

private:
  size_type capacity_;
  size_type next_ = 0; // the oldest slot once the buffer is full
  std::vector<T> xs_;
};

} // namespace raidfeed::detail
