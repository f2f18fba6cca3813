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

#include "arenapb/arenapb_fwd.hpp"
#include <boost/move/unique_ptr.hpp>
#include <type_traits>
#include <vector>
#include <new>
#include <cstddef>

namespace arenapb
{

// Types.

/**
 * Bump-pointer memory region owning every byte of every decoded view: strings, bytes, repeated elements, nested
 * messages, map entries.  Nothing allocated from an Arena is ever individually released; reset() reclaims
 * everything at once, and so does the destructor.
 *
 * ### Memory layout ###
 * Backing storage is a list of *chunks*, each a `flow::util::Blob` (which, unlike `std::vector<uint8_t>`,
 * does not zero-fill; decode writes over every byte it hands out).  The first chunk is allocated at construction
 * (`initial_chunk_sz` bytes); when the current chunk cannot satisfy a request the next chunk is used, and if
 * there is none a new one is requested from the heap, sized `max(request + alignment, 2 * last chunk size)`.
 * So capacity grows geometrically and the number of chunks stays logarithmic in the peak footprint.
 *
 * reset() rewinds to the start of the first chunk but keeps all chunks, which are then reused in order.
 * Hence the intended loop pattern:
 *
 *   ~~~
 *   Arena arena(get_logger());
 *   while (read_frame(...))
 *   {
 *     const auto req = decode<Request>(frame, &arena);
 *     // ...use req...
 *     arena.reset(); // Every view/slice/string_view obtained above is now invalid.
 *   }
 *   ~~~
 *
 * reaches a steady state with no heap activity at all.
 *
 * ### Invalidation hazard ###
 * reset() and destruction invalidate every pointer, `String_view`, Slice, Arena_map and view obtained from
 * `*this` before that point.  Nothing can detect a stray read through such a reference; however generation()
 * is bumped on every reset(), and Message_builder uses it to refuse merging into a builder whose storage has
 * been reset away (error::Code::S_MERGE_AFTER_ARENA_RESET).
 *
 * ### Failure ###
 * There is no recoverable allocation-failure path: if the heap cannot supply a chunk, `std::bad_alloc`
 * propagates, and the caller is expected to let it.
 *
 * ### Thread safety ###
 * One mutator at a time.  Frozen views may be read concurrently from any number of threads as long as nobody
 * concurrently resets or destroys `*this`.
 *
 * Not copyable or movable: views hold raw pointers into the chunks, and the chunk list holds pointers to us
 * (via Arena_vector).
 */
class Arena :
  public flow::log::Log_context
{
public:
  // Types.

  /**
   * Knobs for Arena construction: aggregate, cheaply copyable, reusable across many Arena instances.
   */
  struct Config
  {
    /// Logger to use for logging subsequently (may be null).
    flow::log::Logger* m_logger_ptr;

    /// Size of the first chunk, allocated at construction; later chunks double from there.  Must be non-zero.
    size_t m_initial_chunk_sz;
  };

  // Constants.

  /// Default for `Config::m_initial_chunk_sz`.
  static constexpr size_t S_DEFAULT_INITIAL_CHUNK_SZ = 4 * 1024;

  /// Alignment applied by allocate() when none is given: suitable for any scalar type.
  static constexpr size_t S_DEFAULT_ALIGNMENT = alignof(std::max_align_t);

  // Constructors/destructor.

  /**
   * Constructs the arena and allocates its first chunk.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently (may be null).
   * @param initial_chunk_sz
   *        See Config::m_initial_chunk_sz.
   */
  explicit Arena(flow::log::Logger* logger_ptr = nullptr, size_t initial_chunk_sz = S_DEFAULT_INITIAL_CHUNK_SZ);

  /**
   * Constructs the arena from a Config.
   *
   * @param config
   *        See Config.
   */
  explicit Arena(const Config& config);

  /// Forbid copying.
  Arena(const Arena&) = delete;

  /// Releases all chunks.  Every reference into `*this` becomes invalid.
  ~Arena();

  // Methods.

  /// Forbid copying.
  Arena& operator=(const Arena&) = delete;

  /**
   * Returns a pointer to `n` contiguous uninitialized bytes aligned to `alignment`, valid until the next reset()
   * or destruction.  `n == 0` yields a non-null pointer that must not be dereferenced and consumes nothing.
   *
   * @param n
   *        Byte count.
   * @param alignment
   *        Power of 2.
   * @return See above.  Never null.
   */
  void* allocate(size_t n, size_t alignment = S_DEFAULT_ALIGNMENT);

  /**
   * Returns uninitialized, suitably aligned storage for `n` objects of type `T`.
   *
   * @tparam T
   *         Element type; must be trivially destructible, since the arena never runs destructors.
   * @param n
   *        Element count.
   * @return See above.
   */
  template<typename T>
  T* allocate_array(size_t n);

  /**
   * Constructs a `T` in arena storage and returns a pointer to it.
   *
   * @tparam T
   *         Must be trivially destructible.
   * @tparam Ctor_args
   *         See `ctor_args`.
   * @param ctor_args
   *        Forwarded to `T` constructor.
   * @return See above.
   */
  template<typename T, typename... Ctor_args>
  T* construct(Ctor_args&&... ctor_args);

  /**
   * Copies the given string into the arena and returns a view of the copy.
   *
   * @param src
   *        Source characters (need not be NUL-terminated; no NUL is added).
   * @return See above.
   */
  util::String_view allocate_str(util::String_view src);

  /**
   * Copies the given bytes into the arena and returns a slice of the copy.
   *
   * @param src
   *        Source bytes.
   * @return See above.
   */
  Bytes allocate_bytes(util::Blob_const src);

  /**
   * Returns an empty growable vector backed by `*this`.  Defined in arena_vector.hpp.
   *
   * @tparam T
   *         See Arena_vector.
   * @return See above.
   */
  template<typename T>
  Arena_vector<T> new_vector();

  /**
   * Returns an empty growable vector backed by `*this` with room for `capacity` elements before it must grow.
   * Defined in arena_vector.hpp.
   *
   * @tparam T
   *         See Arena_vector.
   * @param capacity
   *        Initial capacity.
   * @return See above.
   */
  template<typename T>
  Arena_vector<T> new_vector(size_t capacity);

  /**
   * If `ptr` is the most recent allocation, of `old_n` bytes, and the current chunk has room, extends it to
   * `new_n` bytes in place and returns `true`; else changes nothing and returns `false`.  Arena_vector uses this
   * to grow without copying.
   *
   * @param ptr
   *        Start of a prior allocation.
   * @param old_n
   *        Its size in bytes.
   * @param new_n
   *        Desired size in bytes; `>= old_n`.
   * @return See above.
   */
  bool try_grow_in_place(void* ptr, size_t old_n, size_t new_n);

  /**
   * Rewinds to the start of the first chunk, keeping every chunk for reuse, and increments generation().
   * All earlier allocations are invalidated.
   */
  void reset();

  /**
   * Bytes handed out (including alignment padding) since construction or the last reset().  0 right after reset().
   * @return See above.
   */
  size_t allocated_bytes() const;

  /**
   * Total bytes of backing storage held (sum of chunk sizes).  Unchanged by reset().
   * @return See above.
   */
  size_t capacity_bytes() const;

  /**
   * Number of backing chunks held.
   * @return See above.
   */
  size_t n_chunks() const;

  /**
   * Number of reset() calls so far.
   * @return See above.
   */
  uint64_t generation() const;

private:
  // Types.

  /// Short-hand for a backing chunk handle.
  using Chunk_ptr = boost::movelib::unique_ptr<flow::util::Blob>;

  // Methods.

  /**
   * allocate() for when the current chunk cannot fit the request: moves to the next chunk that can, appending a
   * new one if needed.
   *
   * @param n
   *        See allocate().
   * @param alignment
   *        See allocate().
   * @return See allocate().
   */
  void* allocate_slow(size_t n, size_t alignment);

  /**
   * Makes chunk `idx` current: allocation continues from its start.
   *
   * @param idx
   *        Index into #m_chunks.
   */
  void use_chunk(size_t idx);

  /**
   * Returns `m_pos` rounded up to `alignment`.
   *
   * @param alignment
   *        Power of 2.
   * @return See above.
   */
  uint8_t* aligned_pos(size_t alignment) const;

  // Data.

  /// Backing chunks in allocation order; never shrinks until destruction.
  std::vector<Chunk_ptr> m_chunks;

  /// Index into #m_chunks of the chunk from which allocation proceeds.
  size_t m_chunk_idx;

  /// Next free byte in the current chunk.
  uint8_t* m_pos;

  /// One past the last byte of the current chunk.
  uint8_t* m_end;

  /// Start of the most recent allocation (for try_grow_in_place()); null if none since the last reset().
  uint8_t* m_last_alloc;

  /// See allocated_bytes().
  size_t m_allocated_bytes;

  /// See capacity_bytes().
  size_t m_capacity_bytes;

  /// See generation().
  uint64_t m_generation;
}; // class Arena

// Free functions.

/**
 * Prints string representation of the given `Arena` to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Arena& val);

// Template implementations.

template<typename T>
T* Arena::allocate_array(size_t n)
{
  static_assert(std::is_trivially_destructible_v<T>,
                "Arena never runs destructors; only trivially destructible types may live in it.");
  return static_cast<T*>(allocate(n * sizeof(T), alignof(T)));
}

template<typename T, typename... Ctor_args>
T* Arena::construct(Ctor_args&&... ctor_args)
{
  return new (allocate_array<T>(1)) T(std::forward<Ctor_args>(ctor_args)...);
}

} // namespace arenapb
