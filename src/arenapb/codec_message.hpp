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

#include "arenapb/codec_string.hpp"

namespace arenapb::codec
{

// Free functions.

/**
 * Reads a length prefix and then merges fields into `*builder` until exactly that many bytes are consumed:
 * the body of every length-delimited embedded message.  A field whose value runs past the declared end is
 * error::Code::S_DECODE_DELIMITED_LENGTH_EXCEEDED.
 *
 * @tparam Builder_t
 *         A Message_builder sub-class.
 * @param builder
 *        Target.
 * @param in
 *        Reader, positioned at the length prefix.
 * @param ctx
 *        Context for the fields of the embedded message (i.e., already entered).
 * @param err_code
 *        See wire namespace doc header.
 */
template<typename Builder_t>
void merge_loop(Builder_t* builder, wire::Wire_reader* in, Decode_context ctx, Error_code* err_code)
{
  const size_t len = wire::decode_length_delimiter(in, err_code);
  if (*err_code)
  {
    return;
  }
  // else

  const size_t limit = in->remaining() - len;
  while (in->remaining() > limit)
  {
    uint32_t field_number;
    wire::Wire_type wire_type;
    wire::decode_key(in, &field_number, &wire_type, err_code);
    if (*err_code)
    {
      return;
    }
    // else

    builder->merge_tagged_field(field_number, wire_type, in, ctx, err_code);
    if (*err_code)
    {
      return;
    }
  }

  if (in->remaining() != limit)
  {
    *err_code = error::Code::S_DECODE_DELIMITED_LENGTH_EXCEEDED;
  }
} // merge_loop()

// Types.

/**
 * Codec for embedded-message fields of view type `View_t`: length-delimited, recursively merged under a
 * decremented Decode_context.
 *
 * Messages have no zero value, so there is no implicit presence: a singular message field is a
 * `const View_t*` (null if absent) and is encoded if and only if non-null.  Each occurrence of the field on the
 * wire is decoded into a fresh builder and frozen into a fresh arena instance which replaces the previous one
 * wholesale; repeated message fields append such instances.
 *
 * @tparam View_t
 *         View type (see message.hpp for the contract).
 */
template<typename View_t>
struct Message
{
  // Types.

  /// Element-interface value type (map values): pointer to an arena-resident view; never null after decode.
  using Value = const View_t*;

  /// The builder for #View_t.
  using Builder = typename View_t::Builder;

  // Constants.

  /// Wire type.
  static constexpr wire::Wire_type S_WIRE_TYPE = wire::Wire_type::S_LENGTH_DELIMITED;

  /// Messages are always encoded in full as map values, even if empty.
  static constexpr bool S_ALWAYS_ENCODE = true;

  // Methods.

  /**
   * Writes key, length and message body.
   *
   * @param field_number
   *        Field number.
   * @param msg
   *        Value.
   * @param out
   *        Writer.
   */
  static void encode(uint32_t field_number, const View_t& msg, wire::Wire_writer* out)
  {
    wire::encode_key(field_number, S_WIRE_TYPE, out);
    wire::encode_length_delimiter(msg.encoded_len(), out);
    msg.encode_raw(out);
  }

  /**
   * Bytes encode() writes.
   *
   * @param field_number
   *        Field number.
   * @param msg
   *        Value.
   * @return See above.
   */
  static size_t encoded_len(uint32_t field_number, const View_t& msg)
  {
    const size_t len = msg.encoded_len();
    return wire::key_len(field_number) + wire::length_delimiter_len(len) + len;
  }

  /**
   * encode() if non-null.
   *
   * @param field_number
   *        Field number.
   * @param msg
   *        Value or null.
   * @param out
   *        Writer.
   */
  static void encode_optional(uint32_t field_number, const View_t* msg, wire::Wire_writer* out)
  {
    if (msg)
    {
      encode(field_number, *msg, out);
    }
  }

  /**
   * Bytes encode_optional() writes.
   *
   * @param field_number
   *        Field number.
   * @param msg
   *        Value or null.
   * @return See above.
   */
  static size_t encoded_len_optional(uint32_t field_number, const View_t* msg)
  {
    return msg ? encoded_len(field_number, *msg) : 0;
  }

  /**
   * One encode() per element.
   *
   * @param field_number
   *        Field number.
   * @param msgs
   *        Elements.
   * @param out
   *        Writer.
   */
  static void encode_repeated(uint32_t field_number, Slice<View_t> msgs, wire::Wire_writer* out)
  {
    for (const auto& msg : msgs)
    {
      encode(field_number, msg, out);
    }
  }

  /**
   * Bytes encode_repeated() writes.
   *
   * @param field_number
   *        Field number.
   * @param msgs
   *        Elements.
   * @return See above.
   */
  static size_t encoded_len_repeated(uint32_t field_number, Slice<View_t> msgs)
  {
    size_t len = 0;
    for (const auto& msg : msgs)
    {
      len += encoded_len(field_number, msg);
    }
    return len;
  }

  /**
   * Merges an embedded message, whose key (with `wire_type`) was just read, into `*builder`: checks the
   * recursion budget, then runs merge_loop() one level down.
   *
   * @param builder
   *        Target.
   * @param wire_type
   *        From the key; must be length-delimited.
   * @param in
   *        Reader.
   * @param ctx
   *        Context of the *enclosing* message.
   * @param err_code
   *        See wire namespace doc header.
   */
  static void merge_into(Builder* builder, wire::Wire_type wire_type, wire::Wire_reader* in, Decode_context ctx,
                         Error_code* err_code)
  {
    if ((!wire::check_wire_type(S_WIRE_TYPE, wire_type, err_code)) || ctx.limit_reached(err_code))
    {
      return;
    }
    merge_loop(builder, in, ctx.enter_recursion(), err_code);
  }

  /**
   * Decodes the embedded message into a fresh arena instance and points `*msg` at it, replacing any earlier
   * instance.  `*msg` is unchanged on error.
   *
   * @param wire_type
   *        See merge_into().
   * @param msg
   *        Field storage.
   * @param arena
   *        Arena.
   * @param in
   *        Reader.
   * @param ctx
   *        See merge_into().
   * @param err_code
   *        See merge_into().
   */
  static void merge_optional(wire::Wire_type wire_type, const View_t** msg, Arena* arena, wire::Wire_reader* in,
                             Decode_context ctx, Error_code* err_code)
  {
    Builder builder(arena);
    merge_into(&builder, wire_type, in, ctx, err_code);
    if (!*err_code)
    {
      *msg = arena->construct<View_t>(builder.freeze());
    }
  }

  /**
   * Decodes the embedded message and appends it to a repeated field.
   *
   * @param wire_type
   *        See merge_into().
   * @param msgs
   *        Accumulated elements.
   * @param arena
   *        Arena.
   * @param in
   *        Reader.
   * @param ctx
   *        See merge_into().
   * @param err_code
   *        See merge_into().
   */
  static void merge_repeated(wire::Wire_type wire_type, Arena_vector<View_t>* msgs, Arena* arena,
                             wire::Wire_reader* in, Decode_context ctx, Error_code* err_code)
  {
    Builder builder(arena);
    merge_into(&builder, wire_type, in, ctx, err_code);
    if (!*err_code)
    {
      msgs->push_back(builder.freeze());
    }
  }

  /**
   * Element interface: an empty message.
   *
   * @param arena
   *        Arena.
   * @return See above.
   */
  static Value default_element(Arena* arena)
  {
    return arena->construct<View_t>();
  }

  /**
   * Element interface: merge_optional().
   *
   * @param wire_type
   *        See merge_optional().
   * @param msg
   *        See merge_optional().
   * @param arena
   *        See merge_optional().
   * @param in
   *        See merge_optional().
   * @param ctx
   *        See merge_optional().
   * @param err_code
   *        See merge_optional().
   */
  static void merge_element(wire::Wire_type wire_type, Value* msg, Arena* arena, wire::Wire_reader* in,
                            Decode_context ctx, Error_code* err_code)
  {
    merge_optional(wire_type, msg, arena, in, ctx, err_code);
  }

  /**
   * Element interface: encode(); null encodes as an empty message.
   *
   * @param field_number
   *        See encode().
   * @param msg
   *        Value or null.
   * @param out
   *        See encode().
   */
  static void encode_element(uint32_t field_number, Value msg, wire::Wire_writer* out)
  {
    encode(field_number, msg ? *msg : View_t(), out);
  }

  /**
   * Element interface: encoded_len().
   *
   * @param field_number
   *        See encoded_len().
   * @param msg
   *        Value or null.
   * @return See above.
   */
  static size_t encoded_len_element(uint32_t field_number, Value msg)
  {
    return encoded_len(field_number, msg ? *msg : View_t());
  }

  /**
   * Element interface: messages are never default.
   * @return `false`.
   */
  static bool is_default(Value)
  {
    return false;
  }
}; // struct Message

/**
 * Codec for legacy group fields of view type `View_t`: the body sits between a start-group key and an end-group
 * key carrying the same field number, with no length prefix.  Otherwise as codec::Message, including the
 * recursion check and fresh-instance semantics.
 *
 * @tparam View_t
 *         View type (see message.hpp for the contract).
 */
template<typename View_t>
struct Group
{
  // Types.

  /// The builder for #View_t.
  using Builder = typename View_t::Builder;

  // Constants.

  /// Wire type of the opening key.
  static constexpr wire::Wire_type S_WIRE_TYPE = wire::Wire_type::S_START_GROUP;

  // Methods.

  /**
   * Writes start key, body, end key.
   *
   * @param field_number
   *        Field number.
   * @param msg
   *        Value.
   * @param out
   *        Writer.
   */
  static void encode(uint32_t field_number, const View_t& msg, wire::Wire_writer* out)
  {
    wire::encode_key(field_number, wire::Wire_type::S_START_GROUP, out);
    msg.encode_raw(out);
    wire::encode_key(field_number, wire::Wire_type::S_END_GROUP, out);
  }

  /**
   * Bytes encode() writes.
   *
   * @param field_number
   *        Field number.
   * @param msg
   *        Value.
   * @return See above.
   */
  static size_t encoded_len(uint32_t field_number, const View_t& msg)
  {
    return (2 * wire::key_len(field_number)) + msg.encoded_len();
  }

  /**
   * encode() if non-null.
   *
   * @param field_number
   *        Field number.
   * @param msg
   *        Value or null.
   * @param out
   *        Writer.
   */
  static void encode_optional(uint32_t field_number, const View_t* msg, wire::Wire_writer* out)
  {
    if (msg)
    {
      encode(field_number, *msg, out);
    }
  }

  /**
   * Bytes encode_optional() writes.
   *
   * @param field_number
   *        Field number.
   * @param msg
   *        Value or null.
   * @return See above.
   */
  static size_t encoded_len_optional(uint32_t field_number, const View_t* msg)
  {
    return msg ? encoded_len(field_number, *msg) : 0;
  }

  /**
   * One encode() per element.
   *
   * @param field_number
   *        Field number.
   * @param msgs
   *        Elements.
   * @param out
   *        Writer.
   */
  static void encode_repeated(uint32_t field_number, Slice<View_t> msgs, wire::Wire_writer* out)
  {
    for (const auto& msg : msgs)
    {
      encode(field_number, msg, out);
    }
  }

  /**
   * Bytes encode_repeated() writes.
   *
   * @param field_number
   *        Field number.
   * @param msgs
   *        Elements.
   * @return See above.
   */
  static size_t encoded_len_repeated(uint32_t field_number, Slice<View_t> msgs)
  {
    size_t len = 0;
    for (const auto& msg : msgs)
    {
      len += encoded_len(field_number, msg);
    }
    return len;
  }

  /**
   * Merges a group, whose start key was just read, into `*builder`, up to and including its end key.
   *
   * @param field_number
   *        From the start key; the end key must match it.
   * @param builder
   *        Target.
   * @param wire_type
   *        From the start key; must be start-group.
   * @param in
   *        Reader.
   * @param ctx
   *        Context of the *enclosing* message.
   * @param err_code
   *        See wire namespace doc header.
   */
  static void merge_into(uint32_t field_number, Builder* builder, wire::Wire_type wire_type, wire::Wire_reader* in,
                         Decode_context ctx, Error_code* err_code)
  {
    using wire::Wire_type;

    if ((!wire::check_wire_type(S_WIRE_TYPE, wire_type, err_code)) || ctx.limit_reached(err_code))
    {
      return;
    }
    // else

    while (true)
    {
      uint32_t inner_number;
      Wire_type inner_wire_type;
      wire::decode_key(in, &inner_number, &inner_wire_type, err_code);
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

      builder->merge_tagged_field(inner_number, inner_wire_type, in, ctx.enter_recursion(), err_code);
      if (*err_code)
      {
        return;
      }
    } // while (true)
  } // merge_into()

  /**
   * As Message::merge_optional() but for a group.
   *
   * @param field_number
   *        See merge_into().
   * @param wire_type
   *        See merge_into().
   * @param msg
   *        Field storage.
   * @param arena
   *        Arena.
   * @param in
   *        Reader.
   * @param ctx
   *        See merge_into().
   * @param err_code
   *        See merge_into().
   */
  static void merge_optional(uint32_t field_number, wire::Wire_type wire_type, const View_t** msg, Arena* arena,
                             wire::Wire_reader* in, Decode_context ctx, Error_code* err_code)
  {
    Builder builder(arena);
    merge_into(field_number, &builder, wire_type, in, ctx, err_code);
    if (!*err_code)
    {
      *msg = arena->construct<View_t>(builder.freeze());
    }
  }

  /**
   * As Message::merge_repeated() but for a group.
   *
   * @param field_number
   *        See merge_into().
   * @param wire_type
   *        See merge_into().
   * @param msgs
   *        Accumulated elements.
   * @param arena
   *        Arena.
   * @param in
   *        Reader.
   * @param ctx
   *        See merge_into().
   * @param err_code
   *        See merge_into().
   */
  static void merge_repeated(uint32_t field_number, wire::Wire_type wire_type, Arena_vector<View_t>* msgs,
                             Arena* arena, wire::Wire_reader* in, Decode_context ctx, Error_code* err_code)
  {
    Builder builder(arena);
    merge_into(field_number, &builder, wire_type, in, ctx, err_code);
    if (!*err_code)
    {
      msgs->push_back(builder.freeze());
    }
  }
}; // struct Group

} // namespace arenapb::codec
