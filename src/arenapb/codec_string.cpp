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
#include "arenapb/codec_string.hpp"
#include "arenapb/detail/utf8.hpp"

namespace arenapb::codec
{

// Static helpers.

namespace
{

/**
 * Reads the length-delimited payload whose key (with `wire_type`) was just read and copies it into the arena.
 * The copy lands directly in uninitialized arena memory: one copy, no zero-fill.
 *
 * @param wire_type
 *        From the key.
 * @param arena
 *        Destination.
 * @param in
 *        Reader.
 * @param err_code
 *        See wire namespace doc header.
 * @return The copy (meaningless on error).
 */
::arenapb::Bytes merge_raw(wire::Wire_type wire_type, Arena* arena, wire::Wire_reader* in, Error_code* err_code)
{
  if (!wire::check_wire_type(wire::Wire_type::S_LENGTH_DELIMITED, wire_type, err_code))
  {
    return {};
  }
  // else

  const size_t len = wire::decode_length_delimiter(in, err_code);
  if (*err_code)
  {
    return {};
  }
  // else

  const auto copy = arena->allocate_bytes(util::Blob_const(in->pos(), len));
  in->advance(len);
  return copy;
}

/**
 * merge_raw() plus UTF-8 validation.
 *
 * @param wire_type
 *        See merge_raw().
 * @param arena
 *        See merge_raw().
 * @param in
 *        See merge_raw().
 * @param err_code
 *        See merge_raw().
 * @return See merge_raw().
 */
util::String_view merge_utf8(wire::Wire_type wire_type, Arena* arena, wire::Wire_reader* in, Error_code* err_code)
{
  const auto raw = merge_raw(wire_type, arena, in, err_code);
  if (*err_code)
  {
    return {};
  }
  // else

  if (!detail::is_valid_utf8(raw.data(), raw.size()))
  {
    *err_code = error::Code::S_DECODE_INVALID_UTF8;
    return {};
  }
  return util::String_view(reinterpret_cast<const char*>(raw.data()), raw.size());
}

} // namespace (anonymous)

// String implementations.

void String::encode(uint32_t field_number, Value val, wire::Wire_writer* out) // Static.
{
  wire::encode_key(field_number, S_WIRE_TYPE, out);
  wire::encode_length_delimiter(val.size(), out);
  out->put(val.data(), val.size());
}

void String::merge(wire::Wire_type wire_type, Value* val, Arena* arena, wire::Wire_reader* in,
                   Error_code* err_code) // Static.
{
  const auto decoded = merge_utf8(wire_type, arena, in, err_code);
  if (!*err_code)
  {
    *val = decoded;
  }
}

void String::merge_explicit(wire::Wire_type wire_type, std::optional<Value>* val, Arena* arena,
                            wire::Wire_reader* in, Error_code* err_code) // Static.
{
  const auto decoded = merge_utf8(wire_type, arena, in, err_code);
  if (!*err_code)
  {
    *val = decoded;
  }
}

void String::merge_repeated(wire::Wire_type wire_type, Arena_vector<Value>* vals, Arena* arena,
                            wire::Wire_reader* in, Error_code* err_code) // Static.
{
  const auto decoded = merge_utf8(wire_type, arena, in, err_code);
  if (!*err_code)
  {
    vals->push_back(decoded);
  }
}

void String::encode_repeated(uint32_t field_number, Slice<Value> vals, wire::Wire_writer* out) // Static.
{
  for (const auto& val : vals)
  {
    encode(field_number, val, out);
  }
}

size_t String::encoded_len_repeated(uint32_t field_number, Slice<Value> vals) // Static.
{
  size_t len = 0;
  for (const auto& val : vals)
  {
    len += encoded_len(field_number, val);
  }
  return len;
}

// Bytes implementations.

void Bytes::encode(uint32_t field_number, Value val, wire::Wire_writer* out) // Static.
{
  wire::encode_key(field_number, S_WIRE_TYPE, out);
  wire::encode_length_delimiter(val.size(), out);
  out->put(val.data(), val.size());
}

void Bytes::merge(wire::Wire_type wire_type, Value* val, Arena* arena, wire::Wire_reader* in,
                  Error_code* err_code) // Static.
{
  const auto decoded = merge_raw(wire_type, arena, in, err_code);
  if (!*err_code)
  {
    *val = decoded;
  }
}

void Bytes::merge_explicit(wire::Wire_type wire_type, std::optional<Value>* val, Arena* arena,
                           wire::Wire_reader* in, Error_code* err_code) // Static.
{
  const auto decoded = merge_raw(wire_type, arena, in, err_code);
  if (!*err_code)
  {
    *val = decoded;
  }
}

void Bytes::merge_repeated(wire::Wire_type wire_type, Arena_vector<Value>* vals, Arena* arena,
                           wire::Wire_reader* in, Error_code* err_code) // Static.
{
  const auto decoded = merge_raw(wire_type, arena, in, err_code);
  if (!*err_code)
  {
    vals->push_back(decoded);
  }
}

void Bytes::encode_repeated(uint32_t field_number, Slice<Value> vals, wire::Wire_writer* out) // Static.
{
  for (const auto& val : vals)
  {
    encode(field_number, val, out);
  }
}

size_t Bytes::encoded_len_repeated(uint32_t field_number, Slice<Value> vals) // Static.
{
  size_t len = 0;
  for (const auto& val : vals)
  {
    len += encoded_len(field_number, val);
  }
  return len;
}

} // namespace arenapb::codec
