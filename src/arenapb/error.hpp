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

#include "arenapb/common.hpp"

/**
 * Namespace containing the Arena-PB module's extension of boost.system error conventions, so that its APIs
 * can return codes/messages from within its own new set of error codes/messages.  The user need not use
 * anything here beyond comparing an `Error_code` against `error::Code` values and printing it: the rest is
 * boost.system glue.
 *
 * As is typical of Flow-style APIs, a fallible operation takes a trailing `Error_code* err_code` argument.  If it
 * is null, failure throws `flow::error::Runtime_error` carrying the code; otherwise `*err_code` is set to the
 * result (falsy on success) and nothing is thrown.
 */
namespace arenapb::error
{

// Types.

/// Numeric value of the lowest Code.
constexpr int S_CODE_LOWEST_INT_VALUE = 1;

/**
 * All possible errors returned (via `Error_code` arguments) by `arenapb` functions/methods *outside of*
 * possibly system-triggered errors.  The `S_DECODE_*` group are wire conditions: they are what malformed or
 * adversarial input produces.  The rest are usage errors or I/O conditions.
 */
enum class Code
{
  /// Decode: input ended mid-value, or a declared length exceeds the remaining input.
  S_DECODE_BUFFER_UNDERFLOW = S_CODE_LOWEST_INT_VALUE,

  /// Decode: varint is longer than 10 bytes or overflows 64 bits.
  S_DECODE_INVALID_VARINT,

  /// Decode: field key exceeds 32 bits or carries field number 0.
  S_DECODE_INVALID_KEY,

  /// Decode: wire type code is not a defined one, or does not match the kind of the field it tags.
  S_DECODE_INVALID_WIRE_TYPE,

  /// Decode: a `string` field does not contain valid UTF-8.
  S_DECODE_INVALID_UTF8,

  /// Decode: message/group nesting exceeds the recursion limit (see Decode_context).
  S_DECODE_RECURSION_LIMIT_EXCEEDED,

  /// Decode: end-group tag without a matching start-group tag, or with a different field number.
  S_DECODE_UNEXPECTED_END_GROUP_TAG,

  /// Decode: a nested value ran past the end of its enclosing length-delimited region.
  S_DECODE_DELIMITED_LENGTH_EXCEEDED,

  /// Decode: enum value is not among the enumerators of the closed enum it is being converted to.
  S_DECODE_UNKNOWN_ENUM_VALUE,

  /// Merge: builder has already been frozen into a view; it cannot be merged into or mutated.
  S_MERGE_INTO_FROZEN_VIEW,

  /// Merge: the builder's arena has been reset since the builder was created; its storage is gone.
  S_MERGE_AFTER_ARENA_RESET,

  /// Encode: encoded message is larger than the target buffer.  Nothing was written.
  S_ENCODE_CAPACITY_EXCEEDED,

  /// Schema: two fields of one message share a field number.
  S_SCHEMA_DUPLICATE_FIELD_TAG,

  /// Schema: field number is outside [1, 2^29 - 1].
  S_SCHEMA_INVALID_FIELD_NUMBER,

  /// Frame I/O: stream ended inside a length prefix or frame body.
  S_FRAME_TRUNCATED,

  /// Frame I/O: output stream reported failure while writing a frame.
  S_FRAME_WRITE_FAILED,

  /// Frame I/O: length prefix exceeds the reader's maximum frame size.
  S_FRAME_TOO_LARGE,

  /// `Any` unpack: stored type URL names a different message type than the one requested.
  S_ANY_TYPE_MISMATCH,

  /// SENTINEL: Not an error.  This Code must never be issued by an error/success-emitting API; I/O use only.
  S_END_SENTINEL
}; // enum class Code

// Free functions.

/**
 * Given a `Code` `enum` value, creates a matching `Error_code`, so that `Error_code e = some_code;` works.
 * boost.system finds this via ADL; do not call it directly.
 *
 * @param err_code
 *        Value to convert.
 * @return See above.
 */
Error_code make_error_code(Code err_code);

/**
 * Deserializes a `Code` from a standard input stream.  Reads up to but not including the next
 * non-alphanumeric-or-underscore character; the resulting string is then mapped to a `Code`.  If none is
 * recognized, `Code::S_END_SENTINEL` is the result.  The recognized values are the same as
 * operator<<() outputs (case-insensitive), or the numeric value.
 *
 * @param is
 *        Stream from which to deserialize.
 * @param val
 *        Value to set.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Code& val);

/**
 * Serializes a `Code` to a standard output stream: its symbolic name sans `S_` prefix.
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Code val);

} // namespace arenapb::error

namespace boost::system
{

// Types.

/**
 * Ummm -- it specializes this `struct` to -- look -- the end result is boost.system uses this as
 * authorization to make `enum` `Code` convertible to `Error_code`.  The non-specialized
 * version of this sets `value` to `false`, so that random arbitary `enum`s can't just be used as
 * `Error_code`s.  Note that this is the offical way to accomplish that, as (confusingly but
 * formally) documented in boost.system docs.
 */
template<>
struct is_error_code_enum<::arenapb::error::Code>
{
  /// Means `Code` `enum` values can be used for `Error_code`.
  static const bool value = true;
};

} // namespace boost::system
