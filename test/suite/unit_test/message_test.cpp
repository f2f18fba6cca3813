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
#include <algorithm>
#include <vector>

namespace arenapb::test
{

namespace
{

using Bytes_vec = std::vector<uint8_t>;

const Bytes_vec S_ALICE_BYTES{ 0x0A, 0x05, 'A', 'l', 'i', 'c', 'e', 0x10, 0x1E };

util::Blob_const as_blob(const Bytes_vec& bytes)
{
  return util::Blob_const(bytes.data(), bytes.size());
}

Person_view make_alice(Arena* arena)
{
  auto builder = Person_builder::new_in(arena);
  builder.set_name("Alice");
  builder.set_age(30);
  return builder.freeze();
}

Bytes_vec encode_to_vec(const Person_view& person)
{
  Bytes_vec buf(person.encoded_len());
  EXPECT_EQ(encode(nullptr, person, util::Blob_mutable(buf.data(), buf.size())), buf.size());
  return buf;
}

} // namespace (anon)

TEST(Message_test, Encode_exact_bytes)
{
  Arena arena;
  const auto alice = make_alice(&arena);
  EXPECT_EQ(alice.encoded_len(), S_ALICE_BYTES.size());
  EXPECT_EQ(encode_to_vec(alice), S_ALICE_BYTES);

  // The empty message encodes to nothing.
  EXPECT_EQ(Person_view().encoded_len(), 0u);
}

TEST(Message_test, Decode)
{
  Arena arena;
  const auto person = decode<Person_view>(as_blob(S_ALICE_BYTES), &arena);
  EXPECT_EQ(person.m_name, util::String_view("Alice"));
  EXPECT_EQ(person.m_age, 30);
  EXPECT_FALSE(person.m_lucky_number);
  EXPECT_TRUE(person.m_emails.empty());
  EXPECT_EQ(person.m_address, nullptr);
  EXPECT_TRUE(person.m_avatar.empty());
  EXPECT_FALSE(person.m_verified);

  // Empty input is the empty message.
  Error_code err_code;
  const auto empty = decode<Person_view>(util::Blob_const(), &arena, &err_code);
  EXPECT_FALSE(err_code);
  EXPECT_TRUE(empty.m_name.empty());
}

TEST(Message_test, Round_trip_all_fields)
{
  Arena arena;

  auto address_builder = Address_builder::new_in(&arena);
  address_builder.set_city("Paris");
  address_builder.set_zip(75001);

  const uint8_t avatar[] = { 0x89, 'P', 'N', 'G', 0x00 };
  auto builder = Person_builder::new_in(&arena);
  builder.set_name("Bob");
  builder.set_age(-7);
  builder.set_lucky_number(0);
  builder.push_emails("a@x.org");
  builder.push_emails("b@y.org");
  builder.set_address(address_builder.freeze());
  builder.push_scores(1);
  builder.push_scores(300);
  builder.push_deltas(-5);
  builder.push_deltas(7);
  builder.set_avatar(util::Blob_const(avatar, sizeof(avatar)));
  builder.set_balance(2.5);
  builder.set_verified(true);
  builder.set_checksum(0xDEADBEEF);
  builder.set_status(Status::S_SUSPENDED);
  const auto original = builder.freeze();

  flow::util::Blob blob;
  encode_to_blob(original, &blob);
  EXPECT_EQ(blob.size(), original.encoded_len());

  Arena decode_arena;
  const auto person = decode<Person_view>(blob.const_buffer(), &decode_arena);
  EXPECT_EQ(person.m_name, util::String_view("Bob"));
  EXPECT_EQ(person.m_age, -7);
  ASSERT_TRUE(person.m_lucky_number);
  EXPECT_EQ(*person.m_lucky_number, 0);
  ASSERT_EQ(person.m_emails.size(), 2u);
  EXPECT_EQ(person.m_emails[0], util::String_view("a@x.org"));
  EXPECT_EQ(person.m_emails[1], util::String_view("b@y.org"));
  ASSERT_NE(person.m_address, nullptr);
  EXPECT_EQ(person.m_address->m_city, util::String_view("Paris"));
  EXPECT_EQ(person.m_address->m_zip, 75001u);
  EXPECT_EQ(person.m_scores, Slice<int32_t>(std::vector<int32_t>{ 1, 300 }));
  EXPECT_EQ(person.m_deltas, Slice<int64_t>(std::vector<int64_t>{ -5, 7 }));
  EXPECT_EQ(person.m_avatar, Bytes(avatar, sizeof(avatar)));
  EXPECT_EQ(person.m_balance, 2.5);
  EXPECT_TRUE(person.m_verified);
  EXPECT_EQ(person.m_checksum, 0xDEADBEEFu);
  EXPECT_EQ(to_known_enum<Status>(person.m_status), Status::S_SUSPENDED);

  // Decoded data lives in the decode arena, not in the input blob.
  const auto blob_begin = static_cast<const void*>(blob.begin());
  const auto blob_end = static_cast<const void*>(blob.end());
  EXPECT_FALSE((static_cast<const void*>(person.m_name.data()) >= blob_begin)
               && (static_cast<const void*>(person.m_name.data()) < blob_end));

  // Re-encoding reproduces the bytes exactly.
  const auto bytes = arena_encode(person, &decode_arena);
  ASSERT_EQ(bytes.size(), blob.size());
  EXPECT_EQ(to_blob(bytes).size(), blob.size());
  EXPECT_TRUE(std::equal(bytes.begin(), bytes.end(), blob.begin()));
}

TEST(Message_test, Unknown_fields)
{
  Arena arena;
  auto builder = Person_builder::new_in(&arena);
  builder.set_name("Carol");
  builder.set_age(41);
  builder.push_emails("c@z.org");
  builder.set_balance(1.25);
  builder.set_checksum(9);
  builder.push_deltas(3);
  const auto person = builder.freeze();
  const auto bytes = encode_to_vec(person);

  // The lite message knows only fields 1 and 2; the rest (varint, fixed32, fixed64, length-delimited) is skipped.
  const auto lite = decode<Person_lite_view>(as_blob(bytes), &arena);
  EXPECT_EQ(lite.m_name, util::String_view("Carol"));
  EXPECT_EQ(lite.m_age, 41);

  // Unknown group field 20, then known field 2.
  const Bytes_vec with_group{ 0xA3, 0x01, 0x08, 0x01, 0xA4, 0x01, 0x10, 0x05 };
  const auto lite2 = decode<Person_lite_view>(as_blob(with_group), &arena);
  EXPECT_EQ(lite2.m_age, 5);
}

TEST(Message_test, Merge_semantics)
{
  Arena arena;

  auto first_builder = Person_builder::new_in(&arena);
  first_builder.set_name("First");
  first_builder.set_age(1);
  first_builder.push_emails("one@x.org");
  first_builder.push_scores(1);
  const auto first = encode_to_vec(first_builder.freeze());

  auto second_builder = Person_builder::new_in(&arena);
  second_builder.set_age(2);
  second_builder.push_emails("two@x.org");
  second_builder.push_scores(2);
  const auto second = encode_to_vec(second_builder.freeze());

  auto builder = Person_builder::new_in(&arena);
  builder.merge(as_blob(first));
  builder.merge(as_blob(second));
  // Merged state is readable before freezing.
  EXPECT_EQ(builder.get_name(), util::String_view("First"));
  EXPECT_EQ(builder.get_age(), 2);
  EXPECT_FALSE(builder.get_lucky_number());
  EXPECT_EQ(builder.get_emails().size(), 2u);
  EXPECT_EQ(builder.get_scores(), Slice<int32_t>(std::vector<int32_t>{ 1, 2 }));
  EXPECT_EQ(builder.get_address(), nullptr);
  EXPECT_EQ(builder.get_status(), 0);
  const auto merged = builder.freeze();
  // Singular: last value on the wire wins; absent in `second` means untouched.
  EXPECT_EQ(merged.m_name, util::String_view("First"));
  EXPECT_EQ(merged.m_age, 2);
  // Repeated: concatenated.
  ASSERT_EQ(merged.m_emails.size(), 2u);
  EXPECT_EQ(merged.m_emails[1], util::String_view("two@x.org"));
  EXPECT_EQ(merged.m_scores, Slice<int32_t>(std::vector<int32_t>{ 1, 2 }));

  // Concatenated serializations decode the same as sequential merges.
  Bytes_vec concatenated = first;
  concatenated.insert(concatenated.end(), second.begin(), second.end());
  const auto decoded = decode<Person_view>(as_blob(concatenated), &arena);
  EXPECT_EQ(decoded.m_age, 2);
  EXPECT_EQ(decoded.m_emails.size(), 2u);

  // Embedded message occurring twice: the later occurrence replaces the earlier wholesale.
  const Bytes_vec two_addresses{ 0x2A, 0x03, 0x0A, 0x01, 'A', 0x2A, 0x02, 0x10, 0x07 };
  const auto replaced = decode<Person_view>(as_blob(two_addresses), &arena);
  ASSERT_NE(replaced.m_address, nullptr);
  EXPECT_TRUE(replaced.m_address->m_city.empty());
  EXPECT_EQ(replaced.m_address->m_zip, 7u);
}

TEST(Message_test, Decode_errors)
{
  Arena arena;
  Error_code err_code;
  std::string path;

  // Truncated string.
  const Bytes_vec truncated{ 0x0A, 0x05, 'A', 'l' };
  decode<Person_view>(as_blob(truncated), &arena, &err_code, &path);
  EXPECT_EQ(err_code, error::Code::S_DECODE_BUFFER_UNDERFLOW);
  EXPECT_EQ(path, "Person.name");

  // Null err_code: throws.
  EXPECT_THROW(decode<Person_view>(as_blob(truncated), &arena), flow::error::Runtime_error);

  // Invalid UTF-8 in a nested message: the path leads to it.
  const Bytes_vec bad_city{ 0x2A, 0x04, 0x0A, 0x02, 0xC3, 0x28 };
  decode<Person_view>(as_blob(bad_city), &arena, &err_code, &path);
  EXPECT_EQ(err_code, error::Code::S_DECODE_INVALID_UTF8);
  EXPECT_EQ(path, "Person.address.city");

  // A nested field runs past its enclosing message's declared length.
  const Bytes_vec overrun{ 0x2A, 0x02, 0x0A, 0x05, 'A', 'B', 'C', 'D', 'E' };
  decode<Person_view>(as_blob(overrun), &arena, &err_code, &path);
  EXPECT_EQ(err_code, error::Code::S_DECODE_DELIMITED_LENGTH_EXCEEDED);
  EXPECT_EQ(path, "Person.address");

  // Known field with the wrong wire type.
  const Bytes_vec wrong_type{ 0x15, 0x01, 0x02, 0x03, 0x04 };
  decode<Person_view>(as_blob(wrong_type), &arena, &err_code, &path);
  EXPECT_EQ(err_code, error::Code::S_DECODE_INVALID_WIRE_TYPE);
  EXPECT_EQ(path, "Person.age");

  // Bare end-group at top level, in an unknown field.
  const Bytes_vec end_group{ 0xA4, 0x01 };
  decode<Person_view>(as_blob(end_group), &arena, &err_code, &path);
  EXPECT_EQ(err_code, error::Code::S_DECODE_UNEXPECTED_END_GROUP_TAG);
  EXPECT_EQ(path, "Person.20");

  // Bad key.
  const Bytes_vec zero_key{ 0x00, 0x01 };
  decode<Person_view>(as_blob(zero_key), &arena, &err_code, &path);
  EXPECT_EQ(err_code, error::Code::S_DECODE_INVALID_KEY);
  EXPECT_EQ(path, "Person");

  // Success clears both.
  decode<Person_view>(as_blob(S_ALICE_BYTES), &arena, &err_code, &path);
  EXPECT_FALSE(err_code);
  EXPECT_TRUE(path.empty());
}

TEST(Message_test, Frozen_and_reset)
{
  Arena arena;
  auto builder = Person_builder::new_in(&arena);
  EXPECT_FALSE(builder.frozen());
  EXPECT_EQ(builder.arena(), &arena);
  builder.set_age(5);
  const auto view1 = builder.freeze();
  EXPECT_TRUE(builder.frozen());
  const auto view2 = builder.freeze();
  EXPECT_EQ(view1.m_age, view2.m_age);

  Error_code err_code;
  builder.merge(as_blob(S_ALICE_BYTES), &err_code);
  EXPECT_EQ(err_code, error::Code::S_MERGE_INTO_FROZEN_VIEW);
  EXPECT_THROW(builder.set_age(6), flow::error::Runtime_error);
  EXPECT_EQ(builder.freeze().m_age, 5);

  auto stale = Person_builder::new_in(&arena);
  arena.reset();
  stale.merge(as_blob(S_ALICE_BYTES), &err_code);
  EXPECT_EQ(err_code, error::Code::S_MERGE_AFTER_ARENA_RESET);

  // A builder made after the reset is fine.
  auto fresh = Person_builder::new_in(&arena);
  fresh.merge(as_blob(S_ALICE_BYTES), &err_code);
  EXPECT_FALSE(err_code);
}

TEST(Message_test, Encode_capacity)
{
  Arena arena;
  const auto alice = make_alice(&arena);

  Bytes_vec small(4, 0xAA);
  Error_code err_code;
  EXPECT_EQ(encode(nullptr, alice, util::Blob_mutable(small.data(), small.size()), &err_code), 9u);
  EXPECT_EQ(err_code, error::Code::S_ENCODE_CAPACITY_EXCEEDED);
  EXPECT_EQ(small, Bytes_vec(4, 0xAA));

  EXPECT_THROW(encode(nullptr, alice, util::Blob_mutable(small.data(), small.size())), flow::error::Runtime_error);

  // Larger than needed is fine; only the prefix is written.
  Bytes_vec big(32, 0xAA);
  EXPECT_EQ(encode(nullptr, alice, util::Blob_mutable(big.data(), big.size()), &err_code), 9u);
  EXPECT_FALSE(err_code);
  EXPECT_EQ(Bytes_vec(big.begin(), big.begin() + 9), S_ALICE_BYTES);
  EXPECT_EQ(big[9], 0xAA);
}

TEST(Message_test, Length_delimited)
{
  Arena arena;
  const auto alice = make_alice(&arena);

  Bytes_vec stream(2 * (1 + alice.encoded_len()));
  size_t pos = 0;
  for (int idx = 0; idx != 2; ++idx)
  {
    pos += encode_length_delimited(nullptr, alice,
                                   util::Blob_mutable(stream.data() + pos, stream.size() - pos));
  }
  EXPECT_EQ(pos, stream.size());
  EXPECT_EQ(stream[0], 0x09);

  size_t n_consumed = 0;
  const auto first = decode_length_delimited<Person_view>(as_blob(stream), &arena, nullptr, nullptr, &n_consumed);
  EXPECT_EQ(n_consumed, 10u);
  EXPECT_EQ(first.m_name, util::String_view("Alice"));
  const auto second = decode_length_delimited<Person_view>(util::Blob_const(stream.data() + n_consumed,
                                                                            stream.size() - n_consumed),
                                                           &arena);
  EXPECT_EQ(second.m_age, 30);

  // Prefix claims more than is there.
  Error_code err_code;
  const Bytes_vec short_frame{ 0x09, 0x0A };
  decode_length_delimited<Person_view>(as_blob(short_frame), &arena, &err_code);
  EXPECT_EQ(err_code, error::Code::S_DECODE_BUFFER_UNDERFLOW);
}

TEST(Message_test, Group)
{
  Arena arena;
  const Bytes_vec bytes{ 0x0B, 0x10, 0x05, 0x0C, 0x1A, 0x01, 'x' };
  const auto legacy = decode<Legacy_view>(as_blob(bytes), &arena);
  ASSERT_NE(legacy.m_header, nullptr);
  EXPECT_EQ(legacy.m_header->m_id, 5);
  EXPECT_EQ(legacy.m_note, util::String_view("x"));

  Bytes_vec out(legacy.encoded_len());
  encode(nullptr, legacy, util::Blob_mutable(out.data(), out.size()));
  EXPECT_EQ(out, bytes);

  Error_code err_code;
  std::string path;
  // Closed by the wrong field number.
  const Bytes_vec mismatched{ 0x0B, 0x10, 0x05, 0x14 };
  decode<Legacy_view>(as_blob(mismatched), &arena, &err_code, &path);
  EXPECT_EQ(err_code, error::Code::S_DECODE_UNEXPECTED_END_GROUP_TAG);
  EXPECT_EQ(path, "Legacy.header");

  // Never closed.
  const Bytes_vec unterminated{ 0x0B, 0x10, 0x05 };
  decode<Legacy_view>(as_blob(unterminated), &arena, &err_code);
  EXPECT_EQ(err_code, error::Code::S_DECODE_BUFFER_UNDERFLOW);
}

TEST(Message_test, Names)
{
  EXPECT_EQ(full_name<Person_view>(), "example.v1.Person");
  EXPECT_EQ(type_url<Person_view>(), "type.googleapis.com/example.v1.Person");
  EXPECT_EQ(full_name<Header_view>(), "example.v1.Legacy.Header");
}

TEST(Message_test, Encode_to_blob)
{
  Arena arena;
  const auto alice = make_alice(&arena);

  flow::util::Blob blob;
  encode_to_blob(alice, &blob);
  EXPECT_EQ(Bytes_vec(blob.begin(), blob.end()), S_ALICE_BYTES);

  // Reuse: shrinks to fit the smaller message.
  encode_to_blob(Person_view(), &blob);
  EXPECT_EQ(blob.size(), 0u);
  encode_to_blob(alice, &blob);
  EXPECT_EQ(decode<Person_view>(blob.const_buffer(), &arena).m_name, "Alice");
}

} // namespace arenapb::test
