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

#include "arenapb/codec_scalar.hpp"

namespace arenapb::codec
{

// Types.

/**
 * Codec for `string` fields: length-delimited UTF-8.  Decoding copies the wire bytes once, straight into
 * uninitialized arena memory, and only then validates them (error::Code::S_DECODE_INVALID_UTF8); the field keeps
 * its previous value on failure.  The view-side value is a `util::String_view` into the arena.
 *
 * Presence and the element interface are as in codec::Scalar; the default value is the empty string.
 */
struct String
{
  // Types.

  /// C++ type of a field of this kind.
  using Value = util::String_view;

  // Constants.

  /// Wire type.
  static constexpr wire::Wire_type S_WIRE_TYPE = wire::Wire_type::S_LENGTH_DELIMITED;

  /// Strings have a zero value (empty); see codec::Map.
  static constexpr bool S_ALWAYS_ENCODE = false;

  // Methods.

  /**
   * Whether `val` is empty.
   *
   * @param val
   *        Value.
   * @return See above.
   */
  static bool is_default(Value val)
  {
    return val.empty();
  }

  /**
   * Writes key, length and bytes unconditionally.
   *
   * @param field_number
   *        Field number.
   * @param val
   *        Value.
   * @param out
   *        Writer.
   */
  static void encode(uint32_t field_number, Value val, wire::Wire_writer* out);

  /**
   * Bytes encode() writes.
   *
   * @param field_number
   *        Field number.
   * @param val
   *        Value.
   * @return See above.
   */
  static size_t encoded_len(uint32_t field_number, Value val)
  {
    return wire::key_len(field_number) + wire::length_delimiter_len(val.size()) + val.size();
  }

  /**
   * encode() unless empty.
   *
   * @param field_number
   *        Field number.
   * @param val
   *        Value.
   * @param out
   *        Writer.
   */
  static void encode_implicit(uint32_t field_number, Value val, wire::Wire_writer* out)
  {
    if (!is_default(val))
    {
      encode(field_number, val, out);
    }
  }

  /**
   * Bytes encode_implicit() writes.
   *
   * @param field_number
   *        Field number.
   * @param val
   *        Value.
   * @return See above.
   */
  static size_t encoded_len_implicit(uint32_t field_number, Value val)
  {
    return is_default(val) ? 0 : encoded_len(field_number, val);
  }

  /**
   * encode() if engaged, even if empty.
   *
   * @param field_number
   *        Field number.
   * @param val
   *        Value.
   * @param out
   *        Writer.
   */
  static void encode_explicit(uint32_t field_number, const std::optional<Value>& val, wire::Wire_writer* out)
  {
    if (val)
    {
      encode(field_number, *val, out);
    }
  }

  /**
   * Bytes encode_explicit() writes.
   *
   * @param field_number
   *        Field number.
   * @param val
   *        Value.
   * @return See above.
   */
  static size_t encoded_len_explicit(uint32_t field_number, const std::optional<Value>& val)
  {
    return val ? encoded_len(field_number, *val) : 0;
  }

  /**
   * Reads a string whose key was just read into the arena, and points `*val` at it.
   *
   * @param wire_type
   *        From the key; must be length-delimited.
   * @param val
   *        Field storage.
   * @param arena
   *        Arena receiving the bytes.
   * @param in
   *        Reader.
   * @param err_code
   *        See wire namespace doc header.
   */
  static void merge(wire::Wire_type wire_type, Value* val, Arena* arena, wire::Wire_reader* in,
                    Error_code* err_code);

  /**
   * merge() for an explicit-presence field.
   *
   * @param wire_type
   *        See merge().
   * @param val
   *        Field storage.
   * @param arena
   *        See merge().
   * @param in
   *        See merge().
   * @param err_code
   *        See merge().
   */
  static void merge_explicit(wire::Wire_type wire_type, std::optional<Value>* val, Arena* arena,
                             wire::Wire_reader* in, Error_code* err_code);

  /**
   * merge() appending to a repeated field.
   *
   * @param wire_type
   *        See merge().
   * @param vals
   *        Accumulated elements.
   * @param arena
   *        See merge().
   * @param in
   *        See merge().
   * @param err_code
   *        See merge().
   */
  static void merge_repeated(wire::Wire_type wire_type, Arena_vector<Value>* vals, Arena* arena,
                             wire::Wire_reader* in, Error_code* err_code);

  /**
   * One encode() per element.
   *
   * @param field_number
   *        Field number.
   * @param vals
   *        Elements.
   * @param out
   *        Writer.
   */
  static void encode_repeated(uint32_t field_number, Slice<Value> vals, wire::Wire_writer* out);

  /**
   * Bytes encode_repeated() writes.
   *
   * @param field_number
   *        Field number.
   * @param vals
   *        Elements.
   * @return See above.
   */
  static size_t encoded_len_repeated(uint32_t field_number, Slice<Value> vals);

  /**
   * Element interface: empty string.
   * @return See above.
   */
  static Value default_element(Arena*)
  {
    return Value();
  }

  /**
   * Element interface: merge().
   *
   * @param wire_type
   *        See merge().
   * @param val
   *        See merge().
   * @param arena
   *        See merge().
   * @param in
   *        See merge().
   * @param err_code
   *        See merge().
   */
  static void merge_element(wire::Wire_type wire_type, Value* val, Arena* arena, wire::Wire_reader* in,
                            Decode_context, Error_code* err_code)
  {
    merge(wire_type, val, arena, in, err_code);
  }

  /**
   * Element interface: encode().
   *
   * @param field_number
   *        See encode().
   * @param val
   *        See encode().
   * @param out
   *        See encode().
   */
  static void encode_element(uint32_t field_number, Value val, wire::Wire_writer* out)
  {
    encode(field_number, val, out);
  }

  /**
   * Element interface: encoded_len().
   *
   * @param field_number
   *        See encoded_len().
   * @param val
   *        See encoded_len().
   * @return See above.
   */
  static size_t encoded_len_element(uint32_t field_number, Value val)
  {
    return encoded_len(field_number, val);
  }
}; // struct String

/**
 * Codec for `bytes` fields: as codec::String minus the UTF-8 check; the view-side value is an
 * arenapb::Bytes slice into the arena.
 */
struct Bytes
{
  // Types.

  /// C++ type of a field of this kind.
  using Value = ::arenapb::Bytes;

  // Constants.

  /// Wire type.
  static constexpr wire::Wire_type S_WIRE_TYPE = wire::Wire_type::S_LENGTH_DELIMITED;

  /// Byte strings have a zero value (empty); see codec::Map.
  static constexpr bool S_ALWAYS_ENCODE = false;

  // Methods.

  /**
   * Whether `val` is empty.
   *
   * @param val
   *        Value.
   * @return See above.
   */
  static bool is_default(Value val)
  {
    return val.empty();
  }

  /**
   * See String::encode().
   *
   * @param field_number
   *        Field number.
   * @param val
   *        Value.
   * @param out
   *        Writer.
   */
  static void encode(uint32_t field_number, Value val, wire::Wire_writer* out);

  /**
   * Bytes encode() writes.
   *
   * @param field_number
   *        Field number.
   * @param val
   *        Value.
   * @return See above.
   */
  static size_t encoded_len(uint32_t field_number, Value val)
  {
    return wire::key_len(field_number) + wire::length_delimiter_len(val.size()) + val.size();
  }

  /**
   * encode() unless empty.
   *
   * @param field_number
   *        Field number.
   * @param val
   *        Value.
   * @param out
   *        Writer.
   */
  static void encode_implicit(uint32_t field_number, Value val, wire::Wire_writer* out)
  {
    if (!is_default(val))
    {
      encode(field_number, val, out);
    }
  }

  /**
   * Bytes encode_implicit() writes.
   *
   * @param field_number
   *        Field number.
   * @param val
   *        Value.
   * @return See above.
   */
  static size_t encoded_len_implicit(uint32_t field_number, Value val)
  {
    return is_default(val) ? 0 : encoded_len(field_number, val);
  }

  /**
   * encode() if engaged, even if empty.
   *
   * @param field_number
   *        Field number.
   * @param val
   *        Value.
   * @param out
   *        Writer.
   */
  static void encode_explicit(uint32_t field_number, const std::optional<Value>& val, wire::Wire_writer* out)
  {
    if (val)
    {
      encode(field_number, *val, out);
    }
  }

  /**
   * Bytes encode_explicit() writes.
   *
   * @param field_number
   *        Field number.
   * @param val
   *        Value.
   * @return See above.
   */
  static size_t encoded_len_explicit(uint32_t field_number, const std::optional<Value>& val)
  {
    return val ? encoded_len(field_number, *val) : 0;
  }

  /**
   * See String::merge().
   *
   * @param wire_type
   *        From the key; must be length-delimited.
   * @param val
   *        Field storage.
   * @param arena
   *        Arena receiving the bytes.
   * @param in
   *        Reader.
   * @param err_code
   *        See wire namespace doc header.
   */
  static void merge(wire::Wire_type wire_type, Value* val, Arena* arena, wire::Wire_reader* in,
                    Error_code* err_code);

  /**
   * merge() for an explicit-presence field.
   *
   * @param wire_type
   *        See merge().
   * @param val
   *        Field storage.
   * @param arena
   *        See merge().
   * @param in
   *        See merge().
   * @param err_code
   *        See merge().
   */
  static void merge_explicit(wire::Wire_type wire_type, std::optional<Value>* val, Arena* arena,
                             wire::Wire_reader* in, Error_code* err_code);

  /**
   * merge() appending to a repeated field.
   *
   * @param wire_type
   *        See merge().
   * @param vals
   *        Accumulated elements.
   * @param arena
   *        See merge().
   * @param in
   *        See merge().
   * @param err_code
   *        See merge().
   */
  static void merge_repeated(wire::Wire_type wire_type, Arena_vector<Value>* vals, Arena* arena,
                             wire::Wire_reader* in, Error_code* err_code);

  /**
   * One encode() per element.
   *
   * @param field_number
   *        Field number.
   * @param vals
   *        Elements.
   * @param out
   *        Writer.
   */
  static void encode_repeated(uint32_t field_number, Slice<Value> vals, wire::Wire_writer* out);

  /**
   * Bytes encode_repeated() writes.
   *
   * @param field_number
   *        Field number.
   * @param vals
   *        Elements.
   * @return See above.
   */
  static size_t encoded_len_repeated(uint32_t field_number, Slice<Value> vals);

  /**
   * Element interface: empty.
   * @return See above.
   */
  static Value default_element(Arena*)
  {
    return Value();
  }

  /**
   * Element interface: merge().
   *
   * @param wire_type
   *        See merge().
   * @param val
   *        See merge().
   * @param arena
   *        See merge().
   * @param in
   *        See merge().
   * @param err_code
   *        See merge().
   */
  static void merge_element(wire::Wire_type wire_type, Value* val, Arena* arena, wire::Wire_reader* in,
                            Decode_context, Error_code* err_code)
  {
    merge(wire_type, val, arena, in, err_code);
  }

  /**
   * Element interface: encode().
   *
   * @param field_number
   *        See encode().
   * @param val
   *        See encode().
   * @param out
   *        See encode().
   */
  static void encode_element(uint32_t field_number, Value val, wire::Wire_writer* out)
  {
    encode(field_number, val, out);
  }

  /**
   * Element interface: encoded_len().
   *
   * @param field_number
   *        See encoded_len().
   * @param val
   *        See encoded_len().
   * @return See above.
   */
  static size_t encoded_len_element(uint32_t field_number, Value val)
  {
    return encoded_len(field_number, val);
  }
}; // struct Bytes

} // namespace arenapb::codec
