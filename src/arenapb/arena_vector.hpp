/* Arena-PB: Zero-Copy Protobuf Wire Codec
 * Copyright (c) 2023 Akamai Technologies, Inc.; and other contributors.
 * Each commit is copyright by its respective author or author's employer.
 *
 * Licensed under the MIT License:
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE. */

/// @file
#pragma once

#include "arenapb/arena.hpp"
#include <algorithm>
#include <memory>
#include <cstring>

namespace arenapb
{

// Types.

/**
 * Immutable, non-owning view of `size()` contiguous `T`s: the view-side type of every repeated field, and (as
 * #Bytes) of `bytes` fields.  Typically the memory belongs to an Arena, having been produced by
 * Arena_vector::freeze(); the Slice is then valid exactly as long as that memory (see Arena on reset()).
 *
 * Trivially copyable; pass by value.
 *
 * @tparam T
 *         Element type.
 */
template<typename T>
class Slice
{
public:
  // Types.

  /// Element type.
  using value_type = T;

  /// Iterator (there is only the `const` kind).
  using const_iterator = const T*;

  /// Same as #const_iterator.
  using iterator = const_iterator;

  // Constructors/destructor.

  /// Empty slice.
  constexpr Slice() noexcept :
    m_data(nullptr),
    m_size(0)
  {
    // Yay.
  }

  /**
   * Slice of `[data, data + size)`.
   *
   * @param data
   *        First element (may be null if `size == 0`).
   * @param size
   *        Element count.
   */
  constexpr Slice(const T* data, size_t size) noexcept :
    m_data(data),
    m_size(size)
  {
    // Yay.
  }

  /**
   * Slice of the contents of the given vector, which must outlive the Slice and not reallocate meanwhile.
   * Mostly for handing user-owned data to builder setters, which copy it into the arena.
   *
   * @param src
   *        Source container.
   */
  Slice(const std::vector<T>& src) noexcept : // Intentionally implicit.
    m_data(src.data()),
    m_size(src.size())
  {
    // Yay.
  }

  // Methods.

  /**
   * First element or null.
   * @return See above.
   */
  constexpr const T* data() const noexcept
  {
    return m_data;
  }

  /**
   * Element count.
   * @return See above.
   */
  constexpr size_t size() const noexcept
  {
    return m_size;
  }

  /**
   * `size() == 0`.
   * @return See above.
   */
  constexpr bool empty() const noexcept
  {
    return m_size == 0;
  }

  /**
   * Start of the range.
   * @return See above.
   */
  constexpr const_iterator begin() const noexcept
  {
    return m_data;
  }

  /**
   * One past the end of the range.
   * @return See above.
   */
  constexpr const_iterator end() const noexcept
  {
    return m_data + m_size;
  }

  /**
   * Element at the given index, which must be in range.
   *
   * @param idx
   *        Index.
   * @return See above.
   */
  constexpr const T& operator[](size_t idx) const
  {
    assert(idx < m_size);
    return m_data[idx];
  }

  /**
   * First element; slice must not be empty.
   * @return See above.
   */
  constexpr const T& front() const
  {
    return (*this)[0];
  }

  /**
   * Last element; slice must not be empty.
   * @return See above.
   */
  constexpr const T& back() const
  {
    return (*this)[m_size - 1];
  }

private:
  // Data.

  /// See data().
  const T* m_data;

  /// See size().
  size_t m_size;
}; // class Slice

/**
 * Growable sequence of `T` whose storage comes from an Arena: the builder-side type of repeated fields during
 * decode accumulation.  freeze() yields a Slice over the very same memory; no element is copied.
 *
 * Growth doubles the capacity.  If the vector's buffer is the arena's most recent allocation it is extended in
 * place (see Arena::try_grow_in_place()), which is the common case while a single repeated field is being
 * accumulated; otherwise a new buffer is allocated and the elements copied over, the old buffer simply becoming
 * idle until Arena::reset().
 *
 * Copying an Arena_vector copies the handle, not the elements: both copies then refer to one buffer, and only one
 * of them should be mutated afterwards.  Builders never copy theirs.
 *
 * @tparam T
 *         Element type.  Must be trivially destructible (the arena never runs destructors) and copy-constructible.
 */
template<typename T>
class Arena_vector
{
public:
  // Types.

  /// Element type.
  using value_type = T;

  /// Mutable iterator.
  using iterator = T*;

  /// Immutable iterator.
  using const_iterator = const T*;

  static_assert(std::is_trivially_destructible_v<T>,
                "Arena never runs destructors; only trivially destructible types may live in it.");

  // Constructors/destructor.

  /**
   * Empty vector that will allocate from the given arena on first insertion.
   *
   * @param arena
   *        Backing arena.  Must outlive `*this` and everything frozen from it.
   */
  explicit Arena_vector(Arena* arena) :
    m_arena(arena),
    m_data(nullptr),
    m_size(0),
    m_capacity(0)
  {
    assert(m_arena);
  }

  /**
   * Empty vector with room for `capacity` elements.
   *
   * @param arena
   *        See other ctor.
   * @param capacity
   *        Initial capacity.
   */
  explicit Arena_vector(Arena* arena, size_t capacity) :
    Arena_vector(arena)
  {
    reserve(capacity);
  }

  // Methods.

  /**
   * Appends a copy of `val`.
   *
   * @param val
   *        Value to append.
   */
  void push_back(const T& val)
  {
    if (m_size == m_capacity)
    {
      grow(m_size + 1);
    }
    new (m_data + m_size) T(val);
    ++m_size;
  }

  /**
   * Ensures `capacity() >= n`.
   *
   * @param n
   *        Desired capacity.
   */
  void reserve(size_t n)
  {
    if (n > m_capacity)
    {
      grow(n);
    }
  }

  /**
   * Appends copies of all elements of `src`.
   *
   * @param src
   *        Elements to append.  Must not point into `*this`.
   */
  void extend(Slice<T> src)
  {
    reserve(m_size + src.size());
    std::uninitialized_copy(src.begin(), src.end(), m_data + m_size);
    m_size += src.size();
  }

  /**
   * Grows the size by `n` and returns a pointer to the `n` new elements, which are left uninitialized: the
   * caller must write every one of them before reading any.  This is how wire bytes are copied into the arena
   * exactly once.
   *
   * @param n
   *        Element count.
   * @return See above.
   */
  T* extend_uninitialized(size_t n)
  {
    static_assert(std::is_trivially_copyable_v<T>, "Uninitialized elements only make sense for trivial types.");
    reserve(m_size + n);
    T* const result = m_data + m_size;
    m_size += n;
    return result;
  }

  /**
   * Truncates to `n` elements, which must not exceed size().
   *
   * @param n
   *        New size.
   */
  void truncate(size_t n)
  {
    assert(n <= m_size);
    m_size = n;
  }

  /// Makes size() zero, keeping capacity.
  void clear()
  {
    m_size = 0;
  }

  /**
   * Sorts the elements by `operator<`.  Not stable.
   */
  void sort()
  {
    std::sort(begin(), end());
  }

  /**
   * Sorts the elements by the given comparator, preserving the relative order of equivalent elements.
   *
   * @tparam Compare
   *         Strict weak ordering over `T`.
   * @param compare
   *        Comparator.
   */
  template<typename Compare>
  void stable_sort(Compare compare)
  {
    std::stable_sort(begin(), end(), compare);
  }

  /**
   * Returns an immutable Slice over the current elements: same memory, no copy.  Further mutation of `*this`
   * may or may not be visible through the slice (growth may move the buffer); builders do not mutate after
   * freezing.
   *
   * @return See above.
   */
  Slice<T> freeze() const
  {
    return Slice<T>(m_data, m_size);
  }

  /**
   * Element count.
   * @return See above.
   */
  size_t size() const
  {
    return m_size;
  }

  /**
   * Elements that fit before the next growth.
   * @return See above.
   */
  size_t capacity() const
  {
    return m_capacity;
  }

  /**
   * `size() == 0`.
   * @return See above.
   */
  bool empty() const
  {
    return m_size == 0;
  }

  /**
   * First element or null.
   * @return See above.
   */
  T* data()
  {
    return m_data;
  }

  /**
   * First element or null.
   * @return See above.
   */
  const T* data() const
  {
    return m_data;
  }

  /**
   * Start of range.
   * @return See above.
   */
  iterator begin()
  {
    return m_data;
  }

  /**
   * End of range.
   * @return See above.
   */
  iterator end()
  {
    return m_data + m_size;
  }

  /**
   * Start of range.
   * @return See above.
   */
  const_iterator begin() const
  {
    return m_data;
  }

  /**
   * End of range.
   * @return See above.
   */
  const_iterator end() const
  {
    return m_data + m_size;
  }

  /**
   * Element at the given index, which must be in range.
   *
   * @param idx
   *        Index.
   * @return See above.
   */
  T& operator[](size_t idx)
  {
    assert(idx < m_size);
    return m_data[idx];
  }

  /**
   * Element at the given index, which must be in range.
   *
   * @param idx
   *        Index.
   * @return See above.
   */
  const T& operator[](size_t idx) const
  {
    assert(idx < m_size);
    return m_data[idx];
  }

  /**
   * Last element; must not be empty.
   * @return See above.
   */
  T& back()
  {
    return (*this)[m_size - 1];
  }

  /**
   * Backing arena.
   * @return See above.
   */
  Arena* arena() const
  {
    return m_arena;
  }

private:
  // Methods.

  /**
   * Raises capacity to at least `min_capacity` (and at least double the current one).
   *
   * @param min_capacity
   *        See above.
   */
  void grow(size_t min_capacity)
  {
    constexpr size_t MIN_CAPACITY = 4;
    const size_t new_capacity = std::max({ min_capacity, 2 * m_capacity, MIN_CAPACITY });

    if (m_data
        && m_arena->try_grow_in_place(m_data, m_capacity * sizeof(T), new_capacity * sizeof(T)))
    {
      m_capacity = new_capacity;
      return;
    }
    // else

    T* const new_data = m_arena->allocate_array<T>(new_capacity);
    std::uninitialized_copy(m_data, m_data + m_size, new_data);
    m_data = new_data;
    m_capacity = new_capacity;
  } // grow()

  // Data.

  /// See arena().
  Arena* m_arena;

  /// Element storage in #m_arena, or null while capacity is 0.
  T* m_data;

  /// See size().
  size_t m_size;

  /// See capacity().
  size_t m_capacity;
}; // class Arena_vector

// Free functions.

/**
 * Returns `true` if and only if the two slices have equal size and pairwise-equal elements.
 *
 * @relatesalso Slice
 *
 * @param val1
 *        Slice to compare.
 * @param val2
 *        Slice to compare.
 * @return See above.
 */
template<typename T>
bool operator==(Slice<T> val1, Slice<T> val2)
{
  return (val1.size() == val2.size()) && std::equal(val1.begin(), val1.end(), val2.begin());
}

/**
 * Negation of the other `operator==()`.
 *
 * @relatesalso Slice
 *
 * @param val1
 *        Slice to compare.
 * @param val2
 *        Slice to compare.
 * @return See above.
 */
template<typename T>
bool operator!=(Slice<T> val1, Slice<T> val2)
{
  return !(val1 == val2);
}

/**
 * Returns the given #Bytes as a boost.asio-style immutable buffer.
 *
 * @param bytes
 *        Bytes.
 * @return See above.
 */
inline util::Blob_const to_blob(Bytes bytes)
{
  return util::Blob_const(bytes.data(), bytes.size());
}

/**
 * Returns the given string as a boost.asio-style immutable buffer (no NUL terminator).
 *
 * @param str
 *        String.
 * @return See above.
 */
inline util::Blob_const to_blob(util::String_view str)
{
  return util::Blob_const(str.data(), str.size());
}

// Template implementations.

template<typename T>
Arena_vector<T> Arena::new_vector()
{
  return Arena_vector<T>(this);
}

template<typename T>
Arena_vector<T> Arena::new_vector(size_t capacity)
{
  return Arena_vector<T>(this, capacity);
}

} // namespace arenapb
