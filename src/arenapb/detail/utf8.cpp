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
#include "arenapb/detail/utf8.hpp"

namespace arenapb::detail
{

// Implementations.

bool is_valid_utf8(const uint8_t* data, size_t size)
{
  const uint8_t* pos = data;
  const uint8_t* const end = data + size;

  while (pos != end)
  {
    const uint8_t lead = *pos;

    // ASCII: by far the common case; stay in this tight branch as long as possible.
    if (lead < 0x80)
    {
      ++pos;
      continue;
    }
    // else

    size_t n_cont;
    // Bounds for the first continuation byte exclude overlongs, surrogates and > U+10FFFF.
    uint8_t cont1_lo = 0x80;
    uint8_t cont1_hi = 0xBF;
    if ((lead >= 0xC2) && (lead <= 0xDF))
    {
      n_cont = 1;
    }
    else if ((lead >= 0xE0) && (lead <= 0xEF))
    {
      n_cont = 2;
      if (lead == 0xE0)
      {
        cont1_lo = 0xA0;
      }
      else if (lead == 0xED)
      {
        cont1_hi = 0x9F;
      }
    }
    else if ((lead >= 0xF0) && (lead <= 0xF4))
    {
      n_cont = 3;
      if (lead == 0xF0)
      {
        cont1_lo = 0x90;
      }
      else if (lead == 0xF4)
      {
        cont1_hi = 0x8F;
      }
    }
    else
    {
      return false; // Continuation byte in lead position, overlong 2-byte lead (C0, C1), or F5..FF.
    }

    if (size_t(end - pos) <= n_cont)
    {
      return false;
    }
    // else

    if ((pos[1] < cont1_lo) || (pos[1] > cont1_hi))
    {
      return false;
    }
    for (size_t idx = 2; idx <= n_cont; ++idx)
    {
      if ((pos[idx] & 0xC0) != 0x80)
      {
        return false;
      }
    }
    pos += n_cont + 1;
  } // while (pos != end)

  return true;
} // is_valid_utf8()

} // namespace arenapb::detail
