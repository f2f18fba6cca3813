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
#include "arenapb/wkt.hpp"

namespace arenapb::wkt
{

// Any_view implementations.

size_t Any_view::encoded_len() const
{
  return codec::String::encoded_len_implicit(1, m_type_url) + codec::Bytes::encoded_len_implicit(2, m_value);
}

void Any_view::encode_raw(wire::Wire_writer* out) const
{
  codec::String::encode_implicit(1, m_type_url, out);
  codec::Bytes::encode_implicit(2, m_value, out);
}

// Any_builder implementations.

Any_builder::Any_builder(Arena* arena) :
  Base(arena)
{
  // Yay.
}

void Any_builder::set_type_url(util::String_view type_url)
{
  ensure_mutable();
  m_type_url = arena()->allocate_str(type_url);
}

void Any_builder::set_value(util::Blob_const value)
{
  ensure_mutable();
  m_value = arena()->allocate_bytes(value);
}

bool Any_builder::merge_field(uint32_t field_number, wire::Wire_type wire_type, wire::Wire_reader* in,
                              Decode_context, Error_code* err_code)
{
  switch (field_number)
  {
  case 1:
    codec::String::merge(wire_type, &m_type_url, arena(), in, err_code);
    return true;
  case 2:
    codec::Bytes::merge(wire_type, &m_value, arena(), in, err_code);
    return true;
  default:
    return false;
  }
}

Any_view Any_builder::freeze_fields() const
{
  Any_view view;
  view.m_type_url = m_type_url;
  view.m_value = m_value;
  return view;
}

// Empty_builder implementations.

Empty_builder::Empty_builder(Arena* arena) :
  Base(arena)
{
  // Yay.
}

bool Empty_builder::merge_field(uint32_t, wire::Wire_type, wire::Wire_reader*, Decode_context, Error_code*)
{
  return false;
}

Empty_view Empty_builder::freeze_fields() const
{
  return Empty_view();
}

// Free function implementations.

bool type_url_matches(util::String_view type_url, util::String_view full_name)
{
  const auto slash_pos = type_url.rfind('/');
  const auto name = (slash_pos == util::String_view::npos) ? type_url : type_url.substr(slash_pos + 1);
  return name == full_name;
}

} // namespace arenapb::wkt
