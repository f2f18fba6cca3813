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
#include "arenapb/wire.hpp"

namespace arenapb::wire
{

// Implementations.

void encode_varint(uint64_t value, Wire_writer* out)
{
  while (value >= 0x80)
  {
    out->put_u8(uint8_t(value) | 0x80);
    value >>= 7;
  }
  out->put_u8(uint8_t(value));
}

uint64_t decode_varint(Wire_reader* in, Error_code* err_code)
{
  uint64_t value = 0;
  for (size_t idx = 0; idx != S_MAX_VARINT_LEN; ++idx)
  {
    if (in->empty())
    {
      *err_code = error::Code::S_DECODE_BUFFER_UNDERFLOW;
      return 0;
    }
    // else

    const uint8_t byte = in->get_u8();
    // 10th byte holds bit 63 only: anything more (including a continuation bit) overflows.
    if ((idx == S_MAX_VARINT_LEN - 1) && (byte > 1))
    {
      *err_code = error::Code::S_DECODE_INVALID_VARINT;
      return 0;
    }
    // else

    value |= uint64_t(byte & 0x7F) << (7 * idx);
    if (byte < 0x80)
    {
      return value;
    }
  } // for (idx in [0, S_MAX_VARINT_LEN))

  assert(false && "10th byte either ends the varint or fails above.");
  *err_code = error::Code::S_DECODE_INVALID_VARINT;
  return 0;
} // decode_varint()

void decode_key(Wire_reader* in, uint32_t* field_number, Wire_type* wire_type, Error_code* err_code)
{
  const auto key = decode_varint(in, err_code);
  if (*err_code)
  {
    return;
  }
  // else

  if (key > uint64_t(UINT32_MAX))
  {
    *err_code = error::Code::S_DECODE_INVALID_KEY;
    return;
  }
  // else

  const auto wire_type_code = unsigned(key & 0x07);
  if (wire_type_code > unsigned(Wire_type::S_FIXED32))
  {
    *err_code = error::Code::S_DECODE_INVALID_WIRE_TYPE;
    return;
  }
  // else

  const auto number = uint32_t(key >> 3);
  if (number < S_MIN_FIELD_NUMBER)
  {
    *err_code = error::Code::S_DECODE_INVALID_KEY;
    return;
  }
  // else

  *field_number = number;
  *wire_type = Wire_type(wire_type_code);
} // decode_key()

size_t decode_length_delimiter(Wire_reader* in, Error_code* err_code)
{
  const auto len = decode_varint(in, err_code);
  if (*err_code)
  {
    return 0;
  }
  // else

  if (len > in->remaining())
  {
    *err_code = error::Code::S_DECODE_BUFFER_UNDERFLOW;
    return 0;
  }
  return size_t(len);
}

void skip_field(Wire_type wire_type, uint32_t field_number, Wire_reader* in, Decode_context ctx,
                Error_code* err_code)
{
  size_t len = 0;
  switch (wire_type)
  {
  case Wire_type::S_VARINT:
    decode_varint(in, err_code);
    return;
  case Wire_type::S_FIXED32:
    len = sizeof(uint32_t);
    break;
  case Wire_type::S_FIXED64:
    len = sizeof(uint64_t);
    break;
  case Wire_type::S_LENGTH_DELIMITED:
    len = decode_length_delimiter(in, err_code);
    if (*err_code)
    {
      return;
    }
    break;
  case Wire_type::S_START_GROUP:
    if (ctx.limit_reached(err_code))
    {
      return;
    }
    // else

    while (true)
    {
      uint32_t inner_number;
      Wire_type inner_wire_type;
      decode_key(in, &inner_number, &inner_wire_type, err_code);
      if (*err_code)
      {
        return;
      }
      // else

      if (inner_wire_type == Wire_type::S_END_GROUP)
      {
        if (inner_number != field_number)
        {
          *err_code = error::Code::S_DECODE_UNEXPECTED_END_GROUP_TAG;
        }
        return;
      }
      // else

      skip_field(inner_wire_type, inner_number, in, ctx.enter_recursion(), err_code);
      if (*err_code)
      {
        return;
      }
    } // while (true)
  case Wire_type::S_END_GROUP:
    *err_code = error::Code::S_DECODE_UNEXPECTED_END_GROUP_TAG;
    return;
  } // switch (wire_type)

  if (len > in->remaining())
  {
    *err_code = error::Code::S_DECODE_BUFFER_UNDERFLOW;
    return;
  }
  in->advance(len);
} // skip_field()

std::ostream& operator<<(std::ostream& os, Wire_type val)
{
  switch (val)
  {
  case Wire_type::S_VARINT:
    return os << "VARINT";
  case Wire_type::S_FIXED64:
    return os << "FIXED64";
  case Wire_type::S_LENGTH_DELIMITED:
    return os << "LENGTH_DELIMITED";
  case Wire_type::S_START_GROUP:
    return os << "START_GROUP";
  case Wire_type::S_END_GROUP:
    return os << "END_GROUP";
  case Wire_type::S_FIXED32:
    return os << "FIXED32";
  }
  return os << "UNKNOWN[" << int(val) << ']';
}

} // namespace arenapb::wire
