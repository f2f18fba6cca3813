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
#include "test_messages.hpp"
#include <gtest/gtest.h>
#include <vector>

namespace arenapb::test
{

namespace
{

using Bytes_vec = std::vector<uint8_t>;

util::Blob_const as_blob(const Bytes_vec& bytes)
{
  return util::Blob_const(bytes.data(), bytes.size());
}

Bytes_vec encode_to_vec(const User_profile_view& msg)
{
  Bytes_vec buf(msg.encoded_len());
  encode(nullptr, msg, util::Blob_mutable(buf.data(), buf.size()));
  return buf;
}

} // namespace (anon)

TEST(Map_test, Round_trip)
{
  Arena arena;
  auto address_builder = Address_builder::new_in(&arena);
  address_builder.set_city("Oslo");
  const auto oslo = address_builder.freeze();

  auto builder = User_profile_builder::new_in(&arena);
  builder.put_attribute("theme", "dark");
  builder.put_attribute("lang", "en");
  builder.put_name_by_id(42, "answer");
  builder.put_name_by_id(-1, "minus");
  builder.put_address("home", oslo);
  const auto profile = builder.freeze();

  // Sorted by key regardless of insertion order.
  ASSERT_EQ(profile.m_attributes.size(), 2u);
  EXPECT_EQ(profile.m_attributes.begin()->m_key, util::String_view("lang"));
  EXPECT_EQ(profile.m_names_by_id.begin()->m_key, -1);

  Arena decode_arena;
  const auto decoded = decode<User_profile_view>(as_blob(encode_to_vec(profile)), &decode_arena);
  ASSERT_NE(decoded.m_attributes.get("theme"), nullptr);
  EXPECT_EQ(*decoded.m_attributes.get("theme"), util::String_view("dark"));
  EXPECT_EQ(*decoded.m_attributes.get("lang"), util::String_view("en"));
  EXPECT_EQ(decoded.m_attributes.get("missing"), nullptr);
  ASSERT_NE(decoded.m_names_by_id.get(42), nullptr);
  EXPECT_EQ(*decoded.m_names_by_id.get(42), util::String_view("answer"));
  EXPECT_EQ(*decoded.m_names_by_id.get(-1), util::String_view("minus"));
  EXPECT_EQ(decoded.m_names_by_id.get(0), nullptr);
  ASSERT_TRUE(decoded.m_addresses.contains("home"));
  EXPECT_EQ((*decoded.m_addresses.get("home"))->m_city, util::String_view("Oslo"));

  // Iteration is in key order.
  std::vector<int32_t> keys;
  for (const auto& entry : decoded.m_names_by_id)
  {
    keys.push_back(entry.m_key);
  }
  EXPECT_EQ(keys, std::vector<int32_t>({ -1, 42 }));
}

TEST(Map_test, Wire_format)
{
  Arena arena;
  auto builder = User_profile_builder::new_in(&arena);
  builder.put_attribute("k", "v");
  EXPECT_EQ(encode_to_vec(builder.freeze()), Bytes_vec({ 0x0A, 0x06, 0x0A, 0x01, 'k', 0x12, 0x01, 'v' }));

  // Default key and value are omitted inside the entry...
  auto defaults_builder = User_profile_builder::new_in(&arena);
  defaults_builder.put_name_by_id(0, "");
  EXPECT_EQ(encode_to_vec(defaults_builder.freeze()), Bytes_vec({ 0x12, 0x00 }));

  // ...except a message value, which is always written.
  auto message_builder = User_profile_builder::new_in(&arena);
  message_builder.put_address("", Address_view());
  EXPECT_EQ(encode_to_vec(message_builder.freeze()), Bytes_vec({ 0x1A, 0x02, 0x12, 0x00 }));
}

TEST(Map_test, Decode_edge_cases)
{
  Arena arena;

  // Duplicate key: last entry wins.
  const Bytes_vec duplicate{ 0x0A, 0x06, 0x0A, 0x01, 'k', 0x12, 0x01, '1',
                             0x0A, 0x06, 0x0A, 0x01, 'k', 0x12, 0x01, '2' };
  const auto dup = decode<User_profile_view>(as_blob(duplicate), &arena);
  ASSERT_EQ(dup.m_attributes.size(), 1u);
  EXPECT_EQ(*dup.m_attributes.get("k"), util::String_view("2"));

  // Missing key and value: both default.
  const Bytes_vec empty_entry{ 0x12, 0x00 };
  const auto empty = decode<User_profile_view>(as_blob(empty_entry), &arena);
  ASSERT_NE(empty.m_names_by_id.get(0), nullptr);
  EXPECT_TRUE(empty.m_names_by_id.get(0)->empty());

  // Missing message value: an empty message, not null.
  const Bytes_vec keyless_address{ 0x1A, 0x03, 0x0A, 0x01, 'h' };
  const auto address = decode<User_profile_view>(as_blob(keyless_address), &arena);
  ASSERT_NE(address.m_addresses.get("h"), nullptr);
  ASSERT_NE(*address.m_addresses.get("h"), nullptr);
  EXPECT_TRUE((*address.m_addresses.get("h"))->m_city.empty());

  // Value before key, and an unknown field 3 inside the entry: both fine.
  const Bytes_vec reordered{ 0x0A, 0x08, 0x12, 0x01, 'v', 0x18, 0x01, 0x0A, 0x01, 'k' };
  const auto odd = decode<User_profile_view>(as_blob(reordered), &arena);
  EXPECT_EQ(*odd.m_attributes.get("k"), util::String_view("v"));

  // Entry whose value overruns the entry length.
  Error_code err_code;
  std::string path;
  const Bytes_vec overrun{ 0x0A, 0x03, 0x12, 0x02, 'v', 'w' };
  decode<User_profile_view>(as_blob(overrun), &arena, &err_code, &path);
  EXPECT_EQ(err_code, error::Code::S_DECODE_DELIMITED_LENGTH_EXCEEDED);
  EXPECT_EQ(path, "User_profile.attributes");
}

} // namespace arenapb::test
