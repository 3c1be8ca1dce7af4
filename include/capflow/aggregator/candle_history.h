/*
 * Capflow Engine
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#pragma once

#include "capflow/aggregator/candle.h"

#include <cstddef>
#include <iterator>
#include <vector>

namespace capflow
{

/// Fixed-capacity ring of closed candles ordered oldest to newest.
/// Pushing into a full ring evicts the oldest entry.
class CandleHistory
{
 public:
  explicit CandleHistory(size_t capacity) : _data(capacity > 0 ? capacity : 1) {}

  void push(const Candle& candle) noexcept
  {
    const size_t cap = _data.size();
    _data[(_head + _size) % cap] = candle;
    if (_size < cap)
    {
      ++_size;
    }
    else
    {
      _head = (_head + 1) % cap;
    }
  }

  const Candle& operator[](size_t idx) const noexcept
  {
    return _data[(_head + idx) % _data.size()];
  }

  const Candle* at(size_t idx) const noexcept
  {
    if (idx >= _size)
    {
      return nullptr;
    }
    return &(*this)[idx];
  }

  size_t size() const noexcept { return _size; }
  size_t capacity() const noexcept { return _data.size(); }
  bool empty() const noexcept { return _size == 0; }
  bool full() const noexcept { return _size == _data.size(); }

  void clear() noexcept
  {
    _head = 0;
    _size = 0;
  }

  const Candle& front() const noexcept { return _data[_head]; }
  const Candle& back() const noexcept { return (*this)[_size - 1]; }

  std::vector<Candle> toVector() const
  {
    std::vector<Candle> out;
    out.reserve(_size);
    for (size_t i = 0; i < _size; ++i)
    {
      out.push_back((*this)[i]);
    }
    return out;
  }

  class Iterator
  {
   public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = Candle;
    using difference_type = std::ptrdiff_t;
    using pointer = const Candle*;
    using reference = const Candle&;

    Iterator(const CandleHistory* history, size_t idx) : _history(history), _idx(idx) {}

    reference operator*() const { return (*_history)[_idx]; }
    pointer operator->() const { return &(*_history)[_idx]; }

    Iterator& operator++()
    {
      ++_idx;
      return *this;
    }

    Iterator operator++(int)
    {
      Iterator tmp = *this;
      ++_idx;
      return tmp;
    }

    bool operator==(const Iterator& other) const { return _idx == other._idx; }
    bool operator!=(const Iterator& other) const { return _idx != other._idx; }

   private:
    const CandleHistory* _history;
    size_t _idx;
  };

  Iterator begin() const { return Iterator(this, 0); }
  Iterator end() const { return Iterator(this, _size); }

 private:
  std::vector<Candle> _data;
  size_t _head = 0;
  size_t _size = 0;
};

}  // namespace capflow
