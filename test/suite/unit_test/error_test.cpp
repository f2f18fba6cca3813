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
#include "arenapb/error.hpp"
#include <gtest/gtest.h>
#include <sstream>
#include <string>

namespace arenapb::test
{

TEST(Error_test, Category)
{
  const Error_code err_code = error::Code::S_DECODE_INVALID_UTF8;
  EXPECT_TRUE(err_code);
  EXPECT_STREQ(err_code.category().name(), "arenapb");
  EXPECT_EQ(err_code.message(), "Decode: a `string` field does not contain valid UTF-8.");

  const Error_code other = error::Code::S_FRAME_TRUNCATED;
  EXPECT_NE(err_code, other);
  EXPECT_EQ(err_code.category(), other.category());

  // Every code has a message and a distinct value.
  for (int val = error::S_CODE_LOWEST_INT_VALUE; val != int(error::Code::S_END_SENTINEL); ++val)
  {
    const Error_code code = error::Code(val);
    EXPECT_EQ(code.value(), val);
    EXPECT_FALSE(code.message().empty()) << val;
  }
}

TEST(Error_test, Stream_io)
{
  std::ostringstream os;
  os << error::Code::S_MERGE_AFTER_ARENA_RESET;
  EXPECT_EQ(os.str(), "MERGE_AFTER_ARENA_RESET");

  error::Code code;
  std::istringstream is1("encode_capacity_exceeded");
  is1 >> code;
  EXPECT_EQ(code, error::Code::S_ENCODE_CAPACITY_EXCEEDED);

  std::istringstream is2(std::to_string(int(error::Code::S_ANY_TYPE_MISMATCH)));
  is2 >> code;
  EXPECT_EQ(code, error::Code::S_ANY_TYPE_MISMATCH);

  std::istringstream is3("NOT_A_CODE");
  is3 >> code;
  EXPECT_EQ(code, error::Code::S_END_SENTINEL);
}

} // namespace arenapb::test
