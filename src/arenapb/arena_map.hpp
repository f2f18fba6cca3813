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

#include "arenapb/arena_vector.hpp"

namespace arenapb
{

// Types.

/**
 * One key/value pair of an Arena_map.  A plain aggregate (rather than `std::pair`) so that it stays trivially
 * copyable when `Key` and `Mapped` are.
 *
 * @tparam Key
 *         Key type: an integer, `bool` or `util::String_view`.
 * @tparam Mapped
 *         Value type.
 */
template<typename Key, typename Mapped>
struct Map_entry
{
  /// The key.
  Key m_key;
  /// The value.
  Mapped m_value;
};

/**
 * Immutable arena-backed associative array: the view-side type of a protocol-buffers `map<K, V>` field.
 * Entries are stored in one contiguous arena array sorted ascending by key; get() is a binary search, and
 * iteration visits keys in ascending order (string keys compare bytewise).
 *
 * Keys are unique.  The wire format permits a key to appear more than once; build() resolves that the way
 * protocol buffers does: the entry decoded last wins and the earlier ones are dropped.
 *
 * Trivially copyable; pass by value.  Valid as long as the arena memory it refers to.
 *
 * @tparam Key
 *         See Map_entry.
 * @tparam Mapped
 *         See Map_entry.
 */
template<typename Key, typename Mapped>
class Arena_map
{
public:
  // Types.

  /// Short-hand for the entry type.
  using Entry = Map_entry<Key, Mapped>;

  /// Iterator over entries in ascending key order.
  using const_iterator = typename Slice<Entry>::const_iterator;

  /// Same as #const_iterator.
  using iterator = const_iterator;

  // Constructors/destructor.

  /// Empty map.
  Arena_map() = default;

  // Methods.

  /**
   * Sorts the given accumulated entries by key in place, removes all but the last-inserted entry for each
   * key, and returns a map over the result.  The vector's buffer becomes the map's storage: no element is copied
   * beyond what the sort itself moves.  `*entries` must not be mutated afterwards.
   *
   * @param entries
   *        Entries in decode (insertion) order.
   * @return See above.
   */
  static Arena_map build(Arena_vector<Entry>* entries)
  {
    auto& vec = *entries;
    vec.stable_sort([](const Entry& val1, const Entry& val2) { return val1.m_key < val2.m_key; });

    // Equal keys are now adjacent, in insertion order; keep the last of each run.
    size_t n_kept = 0;
    for (size_t idx = 0; idx != vec.size(); ++idx)
    {
      if ((n_kept != 0) && !(vec[n_kept - 1].m_key < vec[idx].m_key))
      {
        vec[n_kept - 1] = vec[idx];
      }
      else
      {
        vec[n_kept++] = vec[idx];
      }
    }
    vec.truncate(n_kept);

    Arena_map map;
    map.m_entries = vec.freeze();
    return map;
  } // build()

  /**
   * Returns pointer to the value mapped from `key`, or null if there is no such entry.  O(log size()).
   *
   * @param key
   *        Key to look up.
   * @return See above.
   */
  const Mapped* get(const Key& key) const
  {
    const auto it = std::lower_bound(m_entries.begin(), m_entries.end(), key,
                                     [](const Entry& entry, const Key& k) { return entry.m_key < k; });
    return ((it == m_entries.end()) || (key < it->m_key)) ? nullptr : &it->m_value;
  }

  /**
   * `get(key) != nullptr`.
   *
   * @param key
   *        Key to look up.
   * @return See above.
   */
  bool contains(const Key& key) const
  {
    return get(key) != nullptr;
  }

  /**
   * Entry count.
   * @return See above.
   */
  size_t size() const
  {
    return m_entries.size();
  }

  /**
   * `size() == 0`.
   * @return See above.
   */
  bool empty() const
  {
    return m_entries.empty();
  }

  /**
   * First entry (smallest key).
   * @return See above.
   */
  const_iterator begin() const
  {
    return m_entries.begin();
  }

  /**
   * One past the last entry.
   * @return See above.
   */
  const_iterator end() const
  {
    return m_entries.end();
  }

  /**
   * The sorted entries as a slice.
   * @return See above.
   */
  Slice<Entry> entries() const
  {
    return m_entries;
  }

private:
  // Data.

  /// Entries sorted strictly ascending by key.
  Slice<Entry> m_entries;
}; // class Arena_map

} // namespace arenapb
