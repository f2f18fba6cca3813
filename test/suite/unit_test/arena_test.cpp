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
#include "arenapb/arena_map.hpp"
#include <gtest/gtest.h>
#include <cstring>
#include <string>

namespace arenapb::test
{

TEST(Arena_test, Allocation)
{
  Arena arena(nullptr, 256);
  EXPECT_EQ(arena.allocated_bytes(), 0u);
  EXPECT_EQ(arena.capacity_bytes(), 256u);
  EXPECT_EQ(arena.n_chunks(), 1u);
  EXPECT_EQ(arena.generation(), 0u);

  const auto byte = static_cast<uint8_t*>(arena.allocate(1, 1));
  const auto word = arena.allocate_array<uint64_t>(3);
  ASSERT_NE(byte, nullptr);
  ASSERT_NE(word, nullptr);
  EXPECT_EQ(reinterpret_cast<uintptr_t>(word) % alignof(uint64_t), 0u);
  EXPECT_GE(reinterpret_cast<const uint8_t*>(word), byte + 1);
  // Padding counts.
  EXPECT_GE(arena.allocated_bytes(), 1 + 3 * sizeof(uint64_t));

  word[0] = 1;
  word[2] = 3;
  EXPECT_EQ(word[0] + word[2], 4u);

  const auto before = arena.allocated_bytes();
  EXPECT_NE(arena.allocate(0), nullptr);
  EXPECT_EQ(arena.allocated_bytes(), before);
}

TEST(Arena_test, Growth)
{
  Arena arena(nullptr, 64);
  arena.allocate(48, 1);
  EXPECT_EQ(arena.n_chunks(), 1u);

  // Does not fit the rest of the first chunk: a second, larger chunk appears.
  const auto big = static_cast<uint8_t*>(arena.allocate(100, 1));
  std::memset(big, 'x', 100);
  EXPECT_EQ(arena.n_chunks(), 2u);
  EXPECT_GE(arena.capacity_bytes(), 64u + 100u);
  EXPECT_EQ(arena.allocated_bytes(), 148u);

  // Next chunk is max(request + alignment, 2 * last chunk) = max(193, 256).
  arena.allocate(192, 1);
  EXPECT_EQ(arena.n_chunks(), 3u);
  EXPECT_EQ(arena.capacity_bytes(), 64u + 128u + 256u);
}

TEST(Arena_test, Reset)
{
  Arena arena(nullptr, 64);
  for (int idx = 0; idx != 20; ++idx)
  {
    arena.allocate(32, 8);
  }
  const auto n_chunks = arena.n_chunks();
  const auto capacity = arena.capacity_bytes();
  EXPECT_GT(n_chunks, 1u);

  arena.reset();
  EXPECT_EQ(arena.allocated_bytes(), 0u);
  EXPECT_EQ(arena.capacity_bytes(), capacity);
  EXPECT_EQ(arena.n_chunks(), n_chunks);
  EXPECT_EQ(arena.generation(), 1u);

  // The same workload again reuses the retained chunks: no new heap allocation.
  for (int idx = 0; idx != 20; ++idx)
  {
    arena.allocate(32, 8);
  }
  EXPECT_EQ(arena.n_chunks(), n_chunks);
  EXPECT_EQ(arena.capacity_bytes(), capacity);

  arena.reset();
  EXPECT_EQ(arena.generation(), 2u);
}

TEST(Arena_test, Strings)
{
  Arena arena;
  std::string src = "hello";
  const auto copy = arena.allocate_str(src);
  src[0] = 'j';
  EXPECT_EQ(copy, util::String_view("hello"));
  EXPECT_NE(copy.data(), src.data());

  EXPECT_TRUE(arena.allocate_str(util::String_view()).empty());

  const uint8_t raw[] = { 0, 1, 2, 0xFF };
  const auto bytes = arena.allocate_bytes(util::Blob_const(raw, sizeof(raw)));
  ASSERT_EQ(bytes.size(), 4u);
  EXPECT_NE(bytes.data(), raw);
  EXPECT_EQ(bytes[3], 0xFF);
  EXPECT_EQ(to_blob(bytes).size(), 4u);
}

TEST(Arena_test, Vector)
{
  Arena arena(nullptr, 64);
  auto vec = arena.new_vector<int32_t>();
  EXPECT_TRUE(vec.empty());
  for (int32_t val = 0; val != 1000; ++val)
  {
    vec.push_back(val);
  }
  ASSERT_EQ(vec.size(), 1000u);
  EXPECT_GE(vec.capacity(), 1000u);
  EXPECT_EQ(vec[999], 999);
  EXPECT_EQ(vec.back(), 999);

  const auto slice = vec.freeze();
  ASSERT_EQ(slice.size(), 1000u);
  EXPECT_EQ(slice.data(), vec.data());
  int64_t sum = 0;
  for (const auto val : slice)
  {
    sum += val;
  }
  EXPECT_EQ(sum, 999 * 1000 / 2);

  vec.truncate(10);
  EXPECT_EQ(vec.size(), 10u);
  vec.clear();
  EXPECT_TRUE(vec.empty());

  auto sorted = arena.new_vector<int32_t>(4);
  EXPECT_GE(sorted.capacity(), 4u);
  sorted.extend(Slice<int32_t>(std::vector<int32_t>{ 3, 1, 2 }));
  sorted.sort();
  EXPECT_EQ(sorted.freeze(), Slice<int32_t>(std::vector<int32_t>{ 1, 2, 3 }));

  auto raw = arena.new_vector<uint8_t>();
  const auto dst = raw.extend_uninitialized(3);
  dst[0] = 'a';
  dst[1] = 'b';
  dst[2] = 'c';
  EXPECT_EQ(raw.size(), 3u);
  EXPECT_EQ(raw[1], 'b');
}

TEST(Arena_test, Grow_in_place)
{
  Arena arena(nullptr, 1024);
  const auto ptr = arena.allocate(16, 8);
  EXPECT_TRUE(arena.try_grow_in_place(ptr, 16, 64));
  EXPECT_EQ(arena.allocated_bytes(), 64u);

  arena.allocate(8, 8);
  // No longer the latest allocation.
  EXPECT_FALSE(arena.try_grow_in_place(ptr, 64, 128));
  // Would not fit the chunk.
  const auto last = arena.allocate(8, 8);
  EXPECT_FALSE(arena.try_grow_in_place(last, 8, 4096));
}

TEST(Arena_test, Map)
{
  Arena arena;
  auto entries = arena.new_vector<Map_entry<util::String_view, int32_t>>();
  entries.push_back({ "b", 1 });
  entries.push_back({ "a", 2 });
  entries.push_back({ "c", 3 });
  entries.push_back({ "b", 4 });

  const auto map = Arena_map<util::String_view, int32_t>::build(&entries);
  ASSERT_EQ(map.size(), 3u);
  EXPECT_FALSE(map.empty());

  auto it = map.begin();
  EXPECT_EQ(it->m_key, util::String_view("a"));
  EXPECT_EQ((++it)->m_key, util::String_view("b"));
  EXPECT_EQ((++it)->m_key, util::String_view("c"));

  ASSERT_NE(map.get("b"), nullptr);
  EXPECT_EQ(*map.get("b"), 4); // Last one wins.
  EXPECT_EQ(map.get("zzz"), nullptr);
  EXPECT_EQ(map.get(""), nullptr);
  EXPECT_TRUE(map.contains("a"));
  EXPECT_FALSE(map.contains("d"));

  const Arena_map<int32_t, int32_t> empty;
  EXPECT_TRUE(empty.empty());
  EXPECT_EQ(empty.get(0), nullptr);
}

} // namespace arenapb::test
