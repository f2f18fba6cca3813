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

#include "arenapb/codec_message.hpp"
#include "arenapb/arena_map.hpp"

namespace arenapb::codec
{

// Types.

/**
 * Codec for `map<K, V>` fields.  On the wire a map is a repeated embedded message (the *entry*) with the key as
 * field 1 and the value as field 2, either of which may be missing (meaning its default).  Decoding appends each
 * entry to an Arena_vector; the builder's freeze() then turns that into an Arena_map via Arena_map::build(),
 * which sorts by key and lets the last duplicate win.
 *
 * An entry counts as one nesting level against the Decode_context, and a message-typed value inside it as one
 * more.
 *
 * Encoding writes entries in the map's (ascending key) order; within an entry a key or value equal to its zero
 * value is omitted unless the value codec has `S_ALWAYS_ENCODE` (embedded messages are always written).
 *
 * @tparam Key_codec
 *         Codec for the key: codec::Scalar (not floating-point) or codec::String.
 * @tparam Val_codec
 *         Codec for the value: any scalar, codec::String, codec::Bytes or codec::Message.
 */
template<typename Key_codec, typename Val_codec>
struct Map
{
  // Types.

  /// Key type.
  using Key = typename Key_codec::Value;

  /// Value type.
  using Mapped = typename Val_codec::Value;

  /// Entry type accumulated during decode.
  using Entry = Map_entry<Key, Mapped>;

  /// View-side field type.
  using Map_type = Arena_map<Key, Mapped>;

  // Constants.

  /// Entry field number of the key.
  static constexpr uint32_t S_KEY_FIELD_NUMBER = 1;

  /// Entry field number of the value.
  static constexpr uint32_t S_VALUE_FIELD_NUMBER = 2;

  // Methods.

  /**
   * Writes every entry as a length-delimited field `field_number`.
   *
   * @param field_number
   *        Field number of the map field.
   * @param map
   *        Value.
   * @param out
   *        Writer.
   */
  static void encode(uint32_t field_number, const Map_type& map, wire::Wire_writer* out)
  {
    for (const auto& entry : map)
    {
      wire::encode_key(field_number, wire::Wire_type::S_LENGTH_DELIMITED, out);
      wire::encode_length_delimiter(entry_len(entry), out);
      if (!Key_codec::is_default(entry.m_key))
      {
        Key_codec::encode_element(S_KEY_FIELD_NUMBER, entry.m_key, out);
      }
      if (Val_codec::S_ALWAYS_ENCODE || (!Val_codec::is_default(entry.m_value)))
      {
        Val_codec::encode_element(S_VALUE_FIELD_NUMBER, entry.m_value, out);
      }
    }
  }

  /**
   * Bytes encode() writes.
   *
   * @param field_number
   *        Field number of the map field.
   * @param map
   *        Value.
   * @return See above.
   */
  static size_t encoded_len(uint32_t field_number, const Map_type& map)
  {
    const size_t key_len = wire::key_len(field_number);
    size_t len = 0;
    for (const auto& entry : map)
    {
      const size_t body_len = entry_len(entry);
      len += key_len + wire::length_delimiter_len(body_len) + body_len;
    }
    return len;
  }

  /**
   * Decodes one entry, whose key (with `wire_type`) was just read, and appends it to `*entries`.  Unknown fields
   * inside the entry are skipped.
   *
   * @param wire_type
   *        From the key; must be length-delimited.
   * @param entries
   *        Accumulated entries in decode order.
   * @param arena
   *        Arena for key/value storage.
   * @param in
   *        Reader.
   * @param ctx
   *        Context of the enclosing message.
   * @param err_code
   *        See wire namespace doc header.
   */
  static void merge(wire::Wire_type wire_type, Arena_vector<Entry>* entries, Arena* arena, wire::Wire_reader* in,
                    Decode_context ctx, Error_code* err_code)
  {
    using wire::Wire_type;

    if ((!wire::check_wire_type(Wire_type::S_LENGTH_DELIMITED, wire_type, err_code)) || ctx.limit_reached(err_code))
    {
      return;
    }
    // else
    const auto entry_ctx = ctx.enter_recursion();

    const size_t len = wire::decode_length_delimiter(in, err_code);
    if (*err_code)
    {
      return;
    }
    // else

    Entry entry{ Key_codec::default_element(arena), Val_codec::default_element(arena) };
    const size_t limit = in->remaining() - len;
    while (in->remaining() > limit)
    {
      uint32_t field_number;
      Wire_type field_wire_type;
      wire::decode_key(in, &field_number, &field_wire_type, err_code);
      if (*err_code)
      {
        return;
      }
      // else

      switch (field_number)
      {
      case S_KEY_FIELD_NUMBER:
        Key_codec::merge_element(field_wire_type, &entry.m_key, arena, in, entry_ctx, err_code);
        break;
      case S_VALUE_FIELD_NUMBER:
        Val_codec::merge_element(field_wire_type, &entry.m_value, arena, in, entry_ctx, err_code);
        break;
      default:
        wire::skip_field(field_wire_type, field_number, in, entry_ctx, err_code);
      }
      if (*err_code)
      {
        return;
      }
    } // while (in->remaining() > limit)

    if (in->remaining() != limit)
    {
      *err_code = error::Code::S_DECODE_DELIMITED_LENGTH_EXCEEDED;
      return;
    }
    // else

    entries->push_back(entry);
  } // merge()

private:
  // Methods.

  /**
   * Body length of one entry as encode() writes it.
   *
   * @param entry
   *        Entry.
   * @return See above.
   */
  static size_t entry_len(const Entry& entry)
  {
    size_t len = 0;
    if (!Key_codec::is_default(entry.m_key))
    {
      len += Key_codec::encoded_len_element(S_KEY_FIELD_NUMBER, entry.m_key);
    }
    if (Val_codec::S_ALWAYS_ENCODE || (!Val_codec::is_default(entry.m_value)))
    {
      len += Val_codec::encoded_len_element(S_VALUE_FIELD_NUMBER, entry.m_value);
    }
    return len;
  }
}; // struct Map

} // namespace arenapb::codec
