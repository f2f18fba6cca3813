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
#include "arenapb/arena.hpp"
#include "arenapb/arena_vector.hpp"
#include <cstring>

namespace arenapb
{

// Implementations.

Arena::Arena(flow::log::Logger* logger_ptr, size_t initial_chunk_sz) :
  Arena(Config{ logger_ptr, initial_chunk_sz })
{
  // Yay.
}

Arena::Arena(const Config& config) :
  flow::log::Log_context(config.m_logger_ptr, Log_component::S_ARENA),
  m_chunk_idx(0),
  m_pos(nullptr),
  m_end(nullptr),
  m_last_alloc(nullptr),
  m_allocated_bytes(0),
  m_capacity_bytes(config.m_initial_chunk_sz),
  m_generation(0)
{
  using flow::util::Blob;

  assert((config.m_initial_chunk_sz != 0) && "Initial chunk size must be positive.");

  /* 1 is by far the most common steady state; but reserving a few avoids moving the (shallow) `unique_ptr`s
   * around for the first few doublings. */
  constexpr size_t N_CHUNKS_GUESS = 4;
  m_chunks.reserve(N_CHUNKS_GUESS);

  m_chunks.emplace_back(new Blob(get_logger(), config.m_initial_chunk_sz));
  use_chunk(0);

  FLOW_LOG_TRACE("Arena [" << *this << "]: Started: first chunk @[" << static_cast<const void*>(m_pos) << "] "
                 "sized [" << config.m_initial_chunk_sz << "].");
}

Arena::~Arena()
{
  FLOW_LOG_TRACE("Arena [" << *this << "]: Being destroyed: releasing [" << m_chunks.size() << "] chunks "
                 "totaling [" << m_capacity_bytes << "] bytes; [" << m_allocated_bytes << "] in use; "
                 "generation [" << m_generation << "].");
}

void* Arena::allocate(size_t n, size_t alignment)
{
  assert(((alignment & (alignment - 1)) == 0) && "Alignment must be a power of 2.");

  if (n == 0)
  {
    // A valid non-null address; nobody may dereference it.
    return m_chunks.front()->begin();
  }
  // else

  uint8_t* const start = aligned_pos(alignment);
  if ((start <= m_end) && (size_t(m_end - start) >= n))
  {
    m_allocated_bytes += (start + n) - m_pos;
    m_pos = start + n;
    m_last_alloc = start;
    return start;
  }
  // else
  return allocate_slow(n, alignment);
} // Arena::allocate()

void* Arena::allocate_slow(size_t n, size_t alignment)
{
  using flow::util::Blob;
  using std::max;

  // Chunks beyond the current one exist only after reset(); try them first (the skipped tail is simply idle).
  while (m_chunk_idx + 1 != m_chunks.size())
  {
    use_chunk(m_chunk_idx + 1);
    uint8_t* const start = aligned_pos(alignment);
    if ((start <= m_end) && (size_t(m_end - start) >= n))
    {
      m_allocated_bytes += (start + n) - m_pos;
      m_pos = start + n;
      m_last_alloc = start;
      return start;
    }
  }

  // Need a new chunk; + alignment guarantees the aligned start still leaves n bytes.
  const size_t chunk_sz = max(n + alignment, 2 * m_chunks.back()->size());
  m_chunks.emplace_back(new Blob(get_logger(), chunk_sz)); // Throws bad_alloc if the heap is out.
  m_capacity_bytes += chunk_sz;
  use_chunk(m_chunks.size() - 1);

  FLOW_LOG_TRACE("Arena [" << *this << "]: Request for [" << n << "] bytes (alignment [" << alignment << "]) "
                 "did not fit; added chunk [" << m_chunk_idx << "] (0-based) @[" << static_cast<const void*>(m_pos)
                 << "] sized [" << chunk_sz << "]; capacity now [" << m_capacity_bytes << "].");

  uint8_t* const start = aligned_pos(alignment);
  assert(size_t(m_end - start) >= n);
  m_allocated_bytes += (start + n) - m_pos;
  m_pos = start + n;
  m_last_alloc = start;
  return start;
} // Arena::allocate_slow()

void Arena::use_chunk(size_t idx)
{
  auto& chunk = *(m_chunks[idx]);
  m_chunk_idx = idx;
  m_pos = chunk.begin();
  m_end = chunk.end();
  m_last_alloc = nullptr;
}

uint8_t* Arena::aligned_pos(size_t alignment) const
{
  const auto addr = reinterpret_cast<uintptr_t>(m_pos);
  return m_pos + (((addr + alignment - 1) & ~(uintptr_t(alignment) - 1)) - addr);
}

util::String_view Arena::allocate_str(util::String_view src)
{
  if (src.empty())
  {
    return util::String_view();
  }
  // else
  const auto dst = static_cast<char*>(allocate(src.size(), 1));
  std::memcpy(dst, src.data(), src.size());
  return util::String_view(dst, src.size());
}

Bytes Arena::allocate_bytes(util::Blob_const src)
{
  if (src.size() == 0)
  {
    return Bytes();
  }
  // else
  const auto dst = static_cast<uint8_t*>(allocate(src.size(), 1));
  std::memcpy(dst, src.data(), src.size());
  return Bytes(dst, src.size());
}

bool Arena::try_grow_in_place(void* ptr, size_t old_n, size_t new_n)
{
  assert(new_n >= old_n);

  const auto start = static_cast<uint8_t*>(ptr);
  if ((start != m_last_alloc) || (start + old_n != m_pos) || (size_t(m_end - start) < new_n))
  {
    return false;
  }
  // else
  m_pos = start + new_n;
  m_allocated_bytes += new_n - old_n;
  return true;
}

void Arena::reset()
{
  FLOW_LOG_TRACE("Arena [" << *this << "]: Reset: reclaiming [" << m_allocated_bytes << "] bytes; keeping "
                 "[" << m_chunks.size() << "] chunks totaling [" << m_capacity_bytes << "] bytes; "
                 "generation [" << m_generation << "] => [" << (m_generation + 1) << "].");

  use_chunk(0);
  m_allocated_bytes = 0;
  ++m_generation;
}

size_t Arena::allocated_bytes() const
{
  return m_allocated_bytes;
}

size_t Arena::capacity_bytes() const
{
  return m_capacity_bytes;
}

size_t Arena::n_chunks() const
{
  return m_chunks.size();
}

uint64_t Arena::generation() const
{
  return m_generation;
}

std::ostream& operator<<(std::ostream& os, const Arena& val)
{
  return os << '@' << &val;
}

} // namespace arenapb
