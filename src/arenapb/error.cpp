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

namespace arenapb::error
{

// Types.

/**
 * The boost.system category for errors returned by the Arena-PB module.  Think of it as the polymorphic
 * counterpart of error::Code, and it kicks in when, for example, someone performs
 * `Error_code e = ...; ... e.message()`.
 */
class Category :
  public boost::system::error_category
{
public:
  // Constants.

  /// The one Category.
  static const Category S_CATEGORY;

  // Methods.

  /**
   * Returns a `static` string representing this category's conceptual name.
   *
   * @return A `static` string that's a brief description of this error category.
   */
  const char* name() const noexcept override;

  /**
   * Returns a string describing the given error in this category.
   *
   * @param val
   *        Error code value; must be a `Code` cast to `int`.
   * @return String describing the error.
   */
  std::string message(int val) const override;

  /**
   * Returns a brief string, a/k/a *symbol*, representing the given error; sans `S_` prefix.
   *
   * @param code
   *        Code to check.
   * @return See above.
   */
  static util::String_view code_symbol(Code code);

private:
  // Constructors.

  /// Boring constructor.
  explicit Category();
}; // class Category

// Static initializations.

const Category Category::S_CATEGORY;

// Implementations.

Error_code make_error_code(Code err_code)
{
  /* Assign Category as the category for arenapb::error::Code-cast error_codes;
   * this basically glues together Category::name()/message() with the Code enum. */
  return Error_code(static_cast<int>(err_code), Category::S_CATEGORY);
}

Category::Category() = default;

const char* Category::name() const noexcept // Virtual.
{
  return "arenapb";
}

std::string Category::message(int val) const // Virtual.
{
  // KEEP THESE STRINGS IN SYNC WITH COMMENT IN error.hpp ON THE INDIVIDUAL ENUM MEMBERS!

  switch (static_cast<Code>(val))
  {
  case Code::S_DECODE_BUFFER_UNDERFLOW:
    return "Decode: input ended mid-value, or a declared length exceeds the remaining input.";
  case Code::S_DECODE_INVALID_VARINT:
    return "Decode: varint is longer than 10 bytes or overflows 64 bits.";
  case Code::S_DECODE_INVALID_KEY:
    return "Decode: field key exceeds 32 bits or carries field number 0.";
  case Code::S_DECODE_INVALID_WIRE_TYPE:
    return "Decode: wire type code is not a defined one, or does not match the kind of the field it tags.";
  case Code::S_DECODE_INVALID_UTF8:
    return "Decode: a `string` field does not contain valid UTF-8.";
  case Code::S_DECODE_RECURSION_LIMIT_EXCEEDED:
    return "Decode: message/group nesting exceeds the recursion limit.";
  case Code::S_DECODE_UNEXPECTED_END_GROUP_TAG:
    return "Decode: end-group tag without a matching start-group tag, or with a different field number.";
  case Code::S_DECODE_DELIMITED_LENGTH_EXCEEDED:
    return "Decode: a nested value ran past the end of its enclosing length-delimited region.";
  case Code::S_DECODE_UNKNOWN_ENUM_VALUE:
    return "Decode: enum value is not among the enumerators of the closed enum it is being converted to.";
  case Code::S_MERGE_INTO_FROZEN_VIEW:
    return "Merge: builder has already been frozen into a view; it cannot be merged into or mutated.";
  case Code::S_MERGE_AFTER_ARENA_RESET:
    return "Merge: the builder's arena has been reset since the builder was created; its storage is gone.";
  case Code::S_ENCODE_CAPACITY_EXCEEDED:
    return "Encode: encoded message is larger than the target buffer.  Nothing was written.";
  case Code::S_SCHEMA_DUPLICATE_FIELD_TAG:
    return "Schema: two fields of one message share a field number.";
  case Code::S_SCHEMA_INVALID_FIELD_NUMBER:
    return "Schema: field number is outside [1, 2^29 - 1].";
  case Code::S_FRAME_TRUNCATED:
    return "Frame I/O: stream ended inside a length prefix or frame body.";
  case Code::S_FRAME_WRITE_FAILED:
    return "Frame I/O: output stream reported failure while writing a frame.";
  case Code::S_FRAME_TOO_LARGE:
    return "Frame I/O: length prefix exceeds the reader's maximum frame size.";
  case Code::S_ANY_TYPE_MISMATCH:
    return "`Any` unpack: stored type URL names a different message type than the one requested.";

  case Code::S_END_SENTINEL:
    assert(false && "SENTINEL: Not an error.  "
                    "This Code must never be issued by an error/success-emitting API; I/O use only.");
  }
  assert(false);
  return "";
} // Category::message()

util::String_view Category::code_symbol(Code code) // Static.
{
  // Note: Must satisfy istream_to_enum() requirements.

  switch (code)
  {
  case Code::S_DECODE_BUFFER_UNDERFLOW:
    return "DECODE_BUFFER_UNDERFLOW";
  case Code::S_DECODE_INVALID_VARINT:
    return "DECODE_INVALID_VARINT";
  case Code::S_DECODE_INVALID_KEY:
    return "DECODE_INVALID_KEY";
  case Code::S_DECODE_INVALID_WIRE_TYPE:
    return "DECODE_INVALID_WIRE_TYPE";
  case Code::S_DECODE_INVALID_UTF8:
    return "DECODE_INVALID_UTF8";
  case Code::S_DECODE_RECURSION_LIMIT_EXCEEDED:
    return "DECODE_RECURSION_LIMIT_EXCEEDED";
  case Code::S_DECODE_UNEXPECTED_END_GROUP_TAG:
    return "DECODE_UNEXPECTED_END_GROUP_TAG";
  case Code::S_DECODE_DELIMITED_LENGTH_EXCEEDED:
    return "DECODE_DELIMITED_LENGTH_EXCEEDED";
  case Code::S_DECODE_UNKNOWN_ENUM_VALUE:
    return "DECODE_UNKNOWN_ENUM_VALUE";
  case Code::S_MERGE_INTO_FROZEN_VIEW:
    return "MERGE_INTO_FROZEN_VIEW";
  case Code::S_MERGE_AFTER_ARENA_RESET:
    return "MERGE_AFTER_ARENA_RESET";
  case Code::S_ENCODE_CAPACITY_EXCEEDED:
    return "ENCODE_CAPACITY_EXCEEDED";
  case Code::S_SCHEMA_DUPLICATE_FIELD_TAG:
    return "SCHEMA_DUPLICATE_FIELD_TAG";
  case Code::S_SCHEMA_INVALID_FIELD_NUMBER:
    return "SCHEMA_INVALID_FIELD_NUMBER";
  case Code::S_FRAME_TRUNCATED:
    return "FRAME_TRUNCATED";
  case Code::S_FRAME_WRITE_FAILED:
    return "FRAME_WRITE_FAILED";
  case Code::S_FRAME_TOO_LARGE:
    return "FRAME_TOO_LARGE";
  case Code::S_ANY_TYPE_MISMATCH:
    return "ANY_TYPE_MISMATCH";

  case Code::S_END_SENTINEL:
    return "END_SENTINEL";
  }
  assert(false);
  return "";
}

std::ostream& operator<<(std::ostream& os, Code val)
{
  // Note: Must satisfy istream_to_enum() requirements.
  return os << Category::code_symbol(val);
}

std::istream& operator>>(std::istream& is, Code& val)
{
  /* Range [<1st Code>, END_SENTINEL); no match => END_SENTINEL;
   * allow for number instead of ostream<< string; case-insensitive. */
  val = flow::util::istream_to_enum(&is, Code::S_END_SENTINEL, Code::S_END_SENTINEL, true, false,
                                    Code(S_CODE_LOWEST_INT_VALUE));
  return is;
}

} // namespace arenapb::error
