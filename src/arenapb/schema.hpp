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

#include "arenapb/error.hpp"
#include <array>

/**
 * Static description of message schemas: field tables that per-message views publish, and the checks run on
 * them before a message type is first decoded.
 */
namespace arenapb::schema
{

// Types.

/// One entry of a view's field table: a field number and its name as it appears in failed-field paths.
struct Field_descriptor
{
  /// Field number (tag), in [1, 2^29 - 1].
  uint32_t m_number;
  /// Field name: static storage, NUL-terminated.
  const char* m_name;
};

// Free functions.

/**
 * Checks a message type's field table: every field number must be in the valid range and none may repeat.
 * Problems are logged as WARNING (one per offending field) and reported via `err_code`.
 *
 * Message_builder runs this once per view type, before that type's first merge, and refuses to decode if it
 * fails; a schema compiler would normally have caught these mistakes earlier, but hand-written bindings have no
 * such safety net.
 *
 * @param logger_ptr
 *        Logger to use for logging subsequently (may be null).
 * @param msg_name
 *        Message name for logging.
 * @param fields
 *        Field table (any order).
 * @param n_fields
 *        Its length.
 * @param err_code
 *        See `flow::Error_code` docs for error reporting semantics.  error::Code generated:
 *        error::Code::S_SCHEMA_INVALID_FIELD_NUMBER, error::Code::S_SCHEMA_DUPLICATE_FIELD_TAG.
 */
void validate_fields(flow::log::Logger* logger_ptr, util::String_view msg_name,
                     const Field_descriptor* fields, size_t n_fields, Error_code* err_code = nullptr);

/**
 * Same as the other validate_fields() but takes a whole table.
 *
 * @tparam N
 *         Table length.
 * @param logger_ptr
 *        See other overload.
 * @param msg_name
 *        See other overload.
 * @param fields
 *        See other overload.
 * @param err_code
 *        See other overload.
 */
template<size_t N>
void validate_fields(flow::log::Logger* logger_ptr, util::String_view msg_name,
                     const std::array<Field_descriptor, N>& fields, Error_code* err_code = nullptr)
{
  validate_fields(logger_ptr, msg_name, fields.data(), N, err_code);
}

/**
 * Name of field `number` per the given table, or empty if absent.
 *
 * @param fields
 *        Field table.
 * @param n_fields
 *        Its length.
 * @param number
 *        Field number.
 * @return See above.
 */
util::String_view field_name(const Field_descriptor* fields, size_t n_fields, uint32_t number);

} // namespace arenapb::schema
