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

#include "arenapb/decode_context.hpp"
#include <boost/endian/conversion.hpp>
#include <cstring>
#include <string>

/**
 * Error convention in this namespace (and in arenapb::codec, which builds on it): every decoding function takes
 * a non-null `Error_code* err_code` whose pointee must be falsy on entry.  On failure the function sets
 * `*err_code` and returns a meaningless value; on success it does not touch `*err_code`.  Callers check
 * `*err_code` after each call and bail out at once on truthiness.  This is the internal form of the Flow
 * convention; the public entry points (decode(), Message_builder::merge() and friends) translate it into the
 * usual null-means-throw form.
 *
 * Encoding functions cannot fail: the caller sizes the Wire_writer target from the `*_len()` functions first.
 */
namespace arenapb::wire
{

// Types.

/// The 3-bit wire type carried in every field key; tells the decoder how to find the end of the value.
enum class Wire_type
{
  /// Varint-encoded integer, bool or enum.
  S_VARINT = 0,
  /// 8 little-endian bytes: `fixed64`, `sfixed64`, `double`.
  S_FIXED64 = 1,
  /// Varint length, then that many bytes: strings, bytes, messages, packed repeated, map entries.
  S_LENGTH_DELIMITED = 2,
  /// Legacy group start; the group runs until the matching S_END_GROUP key.
  S_START_GROUP = 3,
  /// Legacy group end.
  S_END_GROUP = 4,
  /// 4 little-endian bytes: `fixed32`, `sfixed32`, `float`.
  S_FIXED32 = 5
}; // enum class Wire_type

/**
 * Read cursor over an immutable byte range.  Besides the cursor itself it carries the dotted field path of a
 * failed decode, built up innermost-first as the error propagates out of nested merges.
 */
class Wire_reader
{
public:
  // Constructors/destructor.

  /**
   * Reader positioned at the start of `bytes`, which must remain valid while `*this` is used.
   *
   * @param bytes
   *        Input.
   */
  explicit Wire_reader(util::Blob_const bytes) :
    m_pos(static_cast<const uint8_t*>(bytes.data())),
    m_end(m_pos + bytes.size())
  {
    // Yay.
  }

  // Methods.

  /**
   * Bytes not yet consumed.
   * @return See above.
   */
  size_t remaining() const
  {
    return m_end - m_pos;
  }

  /**
   * `remaining() == 0`.
   * @return See above.
   */
  bool empty() const
  {
    return m_pos == m_end;
  }

  /**
   * Next unconsumed byte (not dereferenceable if empty()).
   * @return See above.
   */
  const uint8_t* pos() const
  {
    return m_pos;
  }

  /**
   * Consumes `n <= remaining()` bytes.
   *
   * @param n
   *        Byte count.
   */
  void advance(size_t n)
  {
    assert(n <= remaining());
    m_pos += n;
  }

  /**
   * Consumes and returns one byte; must not be empty().
   * @return See above.
   */
  uint8_t get_u8()
  {
    assert(!empty());
    return *m_pos++;
  }

  /**
   * Prepends `field_name` to the failed-field path.  Called on the way out of each nesting level of a failed
   * decode, so that the path reads outermost-first.
   *
   * @param field_name
   *        Name of the field whose merge failed.
   */
  void push_failed_field(util::String_view field_name)
  {
    std::string path(field_name);
    if (!m_failed_field_path.empty())
    {
      path += '.';
      path += m_failed_field_path;
    }
    m_failed_field_path = std::move(path);
  }

  /**
   * Dotted path of the failed field (e.g., `address.city`), or empty if no field-level failure has occurred.
   * @return See above.
   */
  const std::string& failed_field_path() const
  {
    return m_failed_field_path;
  }

private:
  // Data.

  /// Next unconsumed byte.
  const uint8_t* m_pos;

  /// One past the last byte.
  const uint8_t* m_end;

  /// See failed_field_path().
  std::string m_failed_field_path;
}; // class Wire_reader

/**
 * Write cursor over a mutable byte range already known (via the `*_len()` functions) to be large enough for
 * everything that will be written; overflow is a bug, caught by assertion.
 */
class Wire_writer
{
public:
  // Constructors/destructor.

  /**
   * Writer positioned at the start of `target`.
   *
   * @param target
   *        Output area.
   */
  explicit Wire_writer(util::Blob_mutable target) :
    m_begin(static_cast<uint8_t*>(target.data())),
    m_pos(m_begin),
    m_end(m_begin + target.size())
  {
    // Yay.
  }

  // Methods.

  /**
   * Reserves the next `n` bytes for the caller to fill in and returns their start.
   *
   * @param n
   *        Byte count; `<= remaining()`.
   * @return See above.
   */
  uint8_t* claim(size_t n)
  {
    assert((n <= remaining()) && "Writer target was not sized by encoded_len().");
    uint8_t* const start = m_pos;
    m_pos += n;
    return start;
  }

  /**
   * Appends one byte.
   *
   * @param byte
   *        The byte.
   */
  void put_u8(uint8_t byte)
  {
    *claim(1) = byte;
  }

  /**
   * Appends `n` bytes copied from `src`.
   *
   * @param src
   *        Source.
   * @param n
   *        Byte count.
   */
  void put(const void* src, size_t n)
  {
    if (n != 0)
    {
      std::memcpy(claim(n), src, n);
    }
  }

  /**
   * Bytes written so far.
   * @return See above.
   */
  size_t written() const
  {
    return m_pos - m_begin;
  }

  /**
   * Bytes of room left.
   * @return See above.
   */
  size_t remaining() const
  {
    return m_end - m_pos;
  }

private:
  // Data.

  /// Start of target.
  uint8_t* const m_begin;

  /// Next byte to write.
  uint8_t* m_pos;

  /// One past the end of target.
  uint8_t* const m_end;
}; // class Wire_writer

// Constants.

/// Smallest valid field number.
constexpr uint32_t S_MIN_FIELD_NUMBER = 1;

/// Largest valid field number: 2^29 - 1.
constexpr uint32_t S_MAX_FIELD_NUMBER = (uint32_t(1) << 29) - 1;

/// Longest varint encoding of a 64-bit value.
constexpr size_t S_MAX_VARINT_LEN = 10;

// Free functions.

/**
 * Writes `value` as a base-128 varint (1 to 10 bytes).
 *
 * @param value
 *        Value.
 * @param out
 *        Writer.
 */
void encode_varint(uint64_t value, Wire_writer* out);

/**
 * Reads a base-128 varint.  Fails with error::Code::S_DECODE_BUFFER_UNDERFLOW if input ends first, and with
 * error::Code::S_DECODE_INVALID_VARINT if it is longer than 10 bytes or its 10th byte carries bits beyond 64.
 *
 * @param in
 *        Reader.
 * @param err_code
 *        See namespace doc header.
 * @return Decoded value.
 */
uint64_t decode_varint(Wire_reader* in, Error_code* err_code);

/**
 * Number of bytes encode_varint() writes for `value`.
 *
 * @param value
 *        Value.
 * @return 1 to 10.
 */
constexpr size_t encoded_len_varint(uint64_t value)
{
  size_t len = 1;
  while (value >= 0x80)
  {
    value >>= 7;
    ++len;
  }
  return len;
}

/**
 * Zigzag-maps a signed 32-bit value so that small magnitudes of either sign become small unsigned values.
 *
 * @param value
 *        Value.
 * @return See above.
 */
constexpr uint32_t zigzag_encode32(int32_t value)
{
  return (static_cast<uint32_t>(value) << 1) ^ static_cast<uint32_t>(value >> 31);
}

/**
 * Inverse of zigzag_encode32().
 *
 * @param value
 *        Value.
 * @return See above.
 */
constexpr int32_t zigzag_decode32(uint32_t value)
{
  return static_cast<int32_t>((value >> 1) ^ (~(value & 1) + 1));
}

/**
 * 64-bit zigzag_encode32().
 *
 * @param value
 *        Value.
 * @return See above.
 */
constexpr uint64_t zigzag_encode64(int64_t value)
{
  return (static_cast<uint64_t>(value) << 1) ^ static_cast<uint64_t>(value >> 63);
}

/**
 * Inverse of zigzag_encode64().
 *
 * @param value
 *        Value.
 * @return See above.
 */
constexpr int64_t zigzag_decode64(uint64_t value)
{
  return static_cast<int64_t>((value >> 1) ^ (~(value & 1) + 1));
}

/**
 * Writes 4 little-endian bytes.
 *
 * @param value
 *        Value.
 * @param out
 *        Writer.
 */
inline void encode_fixed32(uint32_t value, Wire_writer* out)
{
  boost::endian::store_little_u32(out->claim(sizeof(value)), value);
}

/**
 * Writes 8 little-endian bytes.
 *
 * @param value
 *        Value.
 * @param out
 *        Writer.
 */
inline void encode_fixed64(uint64_t value, Wire_writer* out)
{
  boost::endian::store_little_u64(out->claim(sizeof(value)), value);
}

/**
 * Reads 4 little-endian bytes; error::Code::S_DECODE_BUFFER_UNDERFLOW if fewer remain.
 *
 * @param in
 *        Reader.
 * @param err_code
 *        See namespace doc header.
 * @return See above.
 */
inline uint32_t decode_fixed32(Wire_reader* in, Error_code* err_code)
{
  if (in->remaining() < sizeof(uint32_t))
  {
    *err_code = error::Code::S_DECODE_BUFFER_UNDERFLOW;
    return 0;
  }
  const auto value = boost::endian::load_little_u32(in->pos());
  in->advance(sizeof(value));
  return value;
}

/**
 * Reads 8 little-endian bytes; error::Code::S_DECODE_BUFFER_UNDERFLOW if fewer remain.
 *
 * @param in
 *        Reader.
 * @param err_code
 *        See namespace doc header.
 * @return See above.
 */
inline uint64_t decode_fixed64(Wire_reader* in, Error_code* err_code)
{
  if (in->remaining() < sizeof(uint64_t))
  {
    *err_code = error::Code::S_DECODE_BUFFER_UNDERFLOW;
    return 0;
  }
  const auto value = boost::endian::load_little_u64(in->pos());
  in->advance(sizeof(value));
  return value;
}

/**
 * Writes the key `(field_number << 3) | wire_type` as a varint.
 *
 * @param field_number
 *        In [#S_MIN_FIELD_NUMBER, #S_MAX_FIELD_NUMBER].
 * @param wire_type
 *        Wire type.
 * @param out
 *        Writer.
 */
inline void encode_key(uint32_t field_number, Wire_type wire_type, Wire_writer* out)
{
  assert((field_number >= S_MIN_FIELD_NUMBER) && (field_number <= S_MAX_FIELD_NUMBER));
  encode_varint((uint64_t(field_number) << 3) | uint64_t(wire_type), out);
}

/**
 * Reads a key.  Fails with error::Code::S_DECODE_INVALID_KEY if it exceeds 32 bits or its field number is 0,
 * and with error::Code::S_DECODE_INVALID_WIRE_TYPE if its wire type is 6 or 7 (plus decode_varint() failures).
 *
 * @param in
 *        Reader.
 * @param field_number
 *        Set to the field number on success.
 * @param wire_type
 *        Set to the wire type on success.
 * @param err_code
 *        See namespace doc header.
 */
void decode_key(Wire_reader* in, uint32_t* field_number, Wire_type* wire_type, Error_code* err_code);

/**
 * Number of bytes encode_key() writes for the given field number (any wire type).
 *
 * @param field_number
 *        Field number.
 * @return 1 to 5.
 */
constexpr size_t key_len(uint32_t field_number)
{
  return encoded_len_varint(uint64_t(field_number) << 3);
}

/**
 * Returns `true` if `actual == expected`; else sets error::Code::S_DECODE_INVALID_WIRE_TYPE and returns `false`.
 *
 * @param expected
 *        Wire type the field kind requires.
 * @param actual
 *        Wire type found in the key.
 * @param err_code
 *        See namespace doc header.
 * @return See above.
 */
inline bool check_wire_type(Wire_type expected, Wire_type actual, Error_code* err_code)
{
  if (expected != actual)
  {
    *err_code = error::Code::S_DECODE_INVALID_WIRE_TYPE;
    return false;
  }
  return true;
}

/**
 * Writes a length prefix (a varint).
 *
 * @param len
 *        Length.
 * @param out
 *        Writer.
 */
inline void encode_length_delimiter(size_t len, Wire_writer* out)
{
  encode_varint(len, out);
}

/**
 * Reads a length prefix, failing with error::Code::S_DECODE_BUFFER_UNDERFLOW if the declared length exceeds
 * the bytes remaining after it.
 *
 * @param in
 *        Reader.
 * @param err_code
 *        See namespace doc header.
 * @return The length.
 */
size_t decode_length_delimiter(Wire_reader* in, Error_code* err_code);

/**
 * Number of bytes encode_length_delimiter() writes.
 *
 * @param len
 *        Length.
 * @return See above.
 */
constexpr size_t length_delimiter_len(size_t len)
{
  return encoded_len_varint(len);
}

/**
 * Consumes the value of a field nobody recognizes, whose key has just been read, leaving `*in` exactly where it
 * would be had the field been absent.  Groups are skipped recursively, each nesting level checked against
 * `ctx`; their end key must carry the same field number as the start key.  A bare end-group key is
 * error::Code::S_DECODE_UNEXPECTED_END_GROUP_TAG.
 *
 * @param wire_type
 *        From the key.
 * @param field_number
 *        From the key.
 * @param in
 *        Reader, positioned just past the key.
 * @param ctx
 *        Recursion context of the message being merged.
 * @param err_code
 *        See namespace doc header.
 */
void skip_field(Wire_type wire_type, uint32_t field_number, Wire_reader* in, Decode_context ctx,
                Error_code* err_code);

/**
 * Prints the enumerator's name sans `S_`.
 *
 * @param os
 *        Stream.
 * @param val
 *        Value.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Wire_type val);

} // namespace arenapb::wire
