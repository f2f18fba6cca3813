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

#include "arenapb/message.hpp"
#include <type_traits>

/**
 * Bindings for the commonly used `google.protobuf` well-known types: the scalar wrappers (`Int32Value` and
 * friends), which give a scalar field explicit presence in schemas that predate `optional`; `Any`, which
 * carries a serialized message of any type with its type URL; and `Empty`.
 */
namespace arenapb::wkt
{

// Types.

template<typename Tag>
class Wrapper_builder;
class Any_builder;
class Empty_builder;

/**
 * View of a `google.protobuf.*Value` wrapper message: one field, `value` (number 1), of the kind given by the
 * tag.
 *
 * @tparam Tag
 *         One of the `*_value_tag` types below: supplies `Codec` and `S_NAME`.
 */
template<typename Tag>
struct Wrapper_view
{
  // Types.

  /// See Message_builder.
  using Builder = Wrapper_builder<Tag>;

  /// Codec of the wrapped value.
  using Codec = typename Tag::Codec;

  /// Wrapped value type.
  using Value = typename Codec::Value;

  // Constants.

  /// See Message_builder.
  static constexpr const char* S_NAME = Tag::S_NAME;

  /// See Message_builder.
  static constexpr char S_PACKAGE[] = "google.protobuf";

  /// See Message_builder.
  static constexpr std::array<schema::Field_descriptor, 1> S_FIELDS{{ { 1, "value" } }};

  // Methods.

  /**
   * See Message_builder.
   * @return See above.
   */
  size_t encoded_len() const
  {
    return Codec::is_default(m_value) ? 0 : Codec::encoded_len_element(1, m_value);
  }

  /**
   * See Message_builder.
   * @param out
   *        Writer.
   */
  void encode_raw(wire::Wire_writer* out) const
  {
    if (!Codec::is_default(m_value))
    {
      Codec::encode_element(1, m_value, out);
    }
  }

  // Data.

  /// The wrapped value.
  Value m_value{};
}; // struct Wrapper_view

/**
 * Builder for Wrapper_view.
 *
 * @tparam Tag
 *         See Wrapper_view.
 */
template<typename Tag>
class Wrapper_builder :
  public Message_builder<Wrapper_builder<Tag>, Wrapper_view<Tag>>
{
public:
  // Types.

  /// Short-hand for our base.
  using Base = Message_builder<Wrapper_builder<Tag>, Wrapper_view<Tag>>;

  /// See Wrapper_view.
  using Value = typename Wrapper_view<Tag>::Value;

  // Constructors/destructor.

  /**
   * See Message_builder.
   *
   * @param arena
   *        Arena.
   */
  explicit Wrapper_builder(Arena* arena) :
    Base(arena),
    m_value(Tag::Codec::default_element(arena))
  {
    // Yay.
  }

  // Methods.

  /**
   * Sets the wrapped value.  String/bytes data is copied into the arena.
   *
   * @param val
   *        Value.
   */
  void set_value(Value val)
  {
    this->ensure_mutable();
    if constexpr (std::is_same_v<Value, util::String_view>)
    {
      m_value = this->arena()->allocate_str(val);
    }
    else if constexpr (std::is_same_v<Value, Bytes>)
    {
      m_value = this->arena()->allocate_bytes(to_blob(val));
    }
    else
    {
      m_value = val;
    }
  }

private:
  // Friends.

  /// The base calls merge_field() and freeze_fields().
  friend Base;

  // Methods.

  /**
   * See Message_builder.
   *
   * @param field_number
   *        See Message_builder.
   * @param wire_type
   *        See Message_builder.
   * @param in
   *        See Message_builder.
   * @param ctx
   *        See Message_builder.
   * @param err_code
   *        See Message_builder.
   * @return See Message_builder.
   */
  bool merge_field(uint32_t field_number, wire::Wire_type wire_type, wire::Wire_reader* in, Decode_context ctx,
                   Error_code* err_code)
  {
    if (field_number != 1)
    {
      return false;
    }
    // else
    Tag::Codec::merge_element(wire_type, &m_value, this->arena(), in, ctx, err_code);
    return true;
  }

  /**
   * See Message_builder.
   * @return See above.
   */
  Wrapper_view<Tag> freeze_fields() const
  {
    return Wrapper_view<Tag>{ m_value };
  }

  // Data.

  /// See set_value().
  Value m_value;
}; // class Wrapper_builder

/// Tag for `google.protobuf.DoubleValue`.
struct Double_value_tag { using Codec = codec::Double; static constexpr char S_NAME[] = "DoubleValue"; };
/// Tag for `google.protobuf.FloatValue`.
struct Float_value_tag { using Codec = codec::Float; static constexpr char S_NAME[] = "FloatValue"; };
/// Tag for `google.protobuf.Int64Value`.
struct Int64_value_tag { using Codec = codec::Int64; static constexpr char S_NAME[] = "Int64Value"; };
/// Tag for `google.protobuf.UInt64Value`.
struct Uint64_value_tag { using Codec = codec::Uint64; static constexpr char S_NAME[] = "UInt64Value"; };
/// Tag for `google.protobuf.Int32Value`.
struct Int32_value_tag { using Codec = codec::Int32; static constexpr char S_NAME[] = "Int32Value"; };
/// Tag for `google.protobuf.UInt32Value`.
struct Uint32_value_tag { using Codec = codec::Uint32; static constexpr char S_NAME[] = "UInt32Value"; };
/// Tag for `google.protobuf.BoolValue`.
struct Bool_value_tag { using Codec = codec::Bool; static constexpr char S_NAME[] = "BoolValue"; };
/// Tag for `google.protobuf.StringValue`.
struct String_value_tag { using Codec = codec::String; static constexpr char S_NAME[] = "StringValue"; };
/// Tag for `google.protobuf.BytesValue`.
struct Bytes_value_tag { using Codec = codec::Bytes; static constexpr char S_NAME[] = "BytesValue"; };

/// `google.protobuf.DoubleValue`.
using Double_value = Wrapper_view<Double_value_tag>;
/// `google.protobuf.FloatValue`.
using Float_value = Wrapper_view<Float_value_tag>;
/// `google.protobuf.Int64Value`.
using Int64_value = Wrapper_view<Int64_value_tag>;
/// `google.protobuf.UInt64Value`.
using Uint64_value = Wrapper_view<Uint64_value_tag>;
/// `google.protobuf.Int32Value`.
using Int32_value = Wrapper_view<Int32_value_tag>;
/// `google.protobuf.UInt32Value`.
using Uint32_value = Wrapper_view<Uint32_value_tag>;
/// `google.protobuf.BoolValue`.
using Bool_value = Wrapper_view<Bool_value_tag>;
/// `google.protobuf.StringValue`.
using String_value = Wrapper_view<String_value_tag>;
/// `google.protobuf.BytesValue`.
using Bytes_value = Wrapper_view<Bytes_value_tag>;

/**
 * View of `google.protobuf.Any`: a type URL (field 1) and the serialized message (field 2).  Build one with
 * pack(); open one with unpack().
 */
struct Any_view
{
  // Types.

  /// See Message_builder.
  using Builder = Any_builder;

  // Constants.

  /// See Message_builder.
  static constexpr char S_NAME[] = "Any";

  /// See Message_builder.
  static constexpr char S_PACKAGE[] = "google.protobuf";

  /// See Message_builder.
  static constexpr std::array<schema::Field_descriptor, 2> S_FIELDS{{ { 1, "type_url" }, { 2, "value" } }};

  // Methods.

  /**
   * See Message_builder.
   * @return See above.
   */
  size_t encoded_len() const;

  /**
   * See Message_builder.
   * @param out
   *        Writer.
   */
  void encode_raw(wire::Wire_writer* out) const;

  // Data.

  /// E.g., `type.googleapis.com/example.v1.Person`.
  util::String_view m_type_url;

  /// Serialization of the packed message.
  Bytes m_value;
}; // struct Any_view

/// Builder for Any_view.
class Any_builder :
  public Message_builder<Any_builder, Any_view>
{
public:
  // Types.

  /// Short-hand for our base.
  using Base = Message_builder<Any_builder, Any_view>;

  // Constructors/destructor.

  /**
   * See Message_builder.
   *
   * @param arena
   *        Arena.
   */
  explicit Any_builder(Arena* arena);

  // Methods.

  /**
   * Sets the type URL (copied into the arena).
   *
   * @param type_url
   *        Value.
   */
  void set_type_url(util::String_view type_url);

  /**
   * Sets the serialized payload (copied into the arena).
   *
   * @param value
   *        Value.
   */
  void set_value(util::Blob_const value);

private:
  // Friends.

  /// The base calls merge_field() and freeze_fields().
  friend Base;

  // Methods.

  /**
   * See Message_builder.
   *
   * @param field_number
   *        See Message_builder.
   * @param wire_type
   *        See Message_builder.
   * @param in
   *        See Message_builder.
   * @param ctx
   *        See Message_builder.
   * @param err_code
   *        See Message_builder.
   * @return See Message_builder.
   */
  bool merge_field(uint32_t field_number, wire::Wire_type wire_type, wire::Wire_reader* in, Decode_context ctx,
                   Error_code* err_code);

  /**
   * See Message_builder.
   * @return See above.
   */
  Any_view freeze_fields() const;

  // Data.

  /// See set_type_url().
  util::String_view m_type_url;

  /// See set_value().
  Bytes m_value;
}; // class Any_builder

/// `google.protobuf.Any`.
using Any = Any_view;

/// View of `google.protobuf.Empty`: no fields.  Anything on the wire is an unknown field and is skipped.
struct Empty_view
{
  // Types.

  /// See Message_builder.
  using Builder = Empty_builder;

  // Constants.

  /// See Message_builder.
  static constexpr char S_NAME[] = "Empty";

  /// See Message_builder.
  static constexpr char S_PACKAGE[] = "google.protobuf";

  /// See Message_builder.
  static constexpr std::array<schema::Field_descriptor, 0> S_FIELDS{};

  // Methods.

  /**
   * See Message_builder.
   * @return 0.
   */
  size_t encoded_len() const
  {
    return 0;
  }

  /**
   * See Message_builder.  Writes nothing.
   * @param out
   *        Writer.
   */
  void encode_raw(wire::Wire_writer*) const
  {
    // Yay.
  }
}; // struct Empty_view

/// Builder for Empty_view.
class Empty_builder :
  public Message_builder<Empty_builder, Empty_view>
{
public:
  // Types.

  /// Short-hand for our base.
  using Base = Message_builder<Empty_builder, Empty_view>;

  // Constructors/destructor.

  /**
   * See Message_builder.
   *
   * @param arena
   *        Arena.
   */
  explicit Empty_builder(Arena* arena);

private:
  // Friends.

  /// The base calls merge_field() and freeze_fields().
  friend Base;

  // Methods.

  /**
   * See Message_builder.  Every field is unknown.
   *
   * @return `false`.
   */
  bool merge_field(uint32_t, wire::Wire_type, wire::Wire_reader*, Decode_context, Error_code*);

  /**
   * See Message_builder.
   * @return See above.
   */
  Empty_view freeze_fields() const;
}; // class Empty_builder

/// `google.protobuf.Empty`.
using Empty = Empty_view;

// Free functions.

/**
 * Returns whether the given `Any` type URL names the given fully-qualified message name: everything after the
 * last `/` must equal it.
 *
 * @param type_url
 *        Type URL.
 * @param full_name
 *        See arenapb::full_name().
 * @return See above.
 */
bool type_url_matches(util::String_view type_url, util::String_view full_name);

/**
 * Packs `msg` into an `Any`: its type_url() and its serialization, both in `*arena`.
 *
 * @tparam View_t
 *         View type.
 * @param msg
 *        Message.
 * @param arena
 *        Arena.
 * @return See above.
 */
template<typename View_t>
Any pack(const View_t& msg, Arena* arena)
{
  Any any;
  any.m_type_url = arena->allocate_str(type_url<View_t>());
  any.m_value = arena_encode(msg, arena);
  return any;
}

/**
 * Decodes the message packed in `any` as a `View_t`, after checking that the type URL names `View_t`.
 *
 * @tparam View_t
 *         Expected view type.
 * @param any
 *        Packed message.
 * @param arena
 *        Arena to decode into.
 * @param err_code
 *        See `flow::Error_code` docs for error reporting semantics.  error::Code generated:
 *        error::Code::S_ANY_TYPE_MISMATCH; those of decode().  On failure returns the empty message.
 * @return See above.
 */
template<typename View_t>
View_t unpack(const Any& any, Arena* arena, Error_code* err_code = nullptr)
{
  using flow::error::Runtime_error;

  if (!type_url_matches(any.m_type_url, full_name<View_t>()))
  {
    if (!err_code)
    {
      throw Runtime_error(error::Code::S_ANY_TYPE_MISMATCH,
                          "arenapb::wkt::unpack(): expected [" + full_name<View_t>() + "], "
                          "got [" + std::string(any.m_type_url) + "]");
    }
    // else
    *err_code = error::Code::S_ANY_TYPE_MISMATCH;
    return View_t();
  }
  // else

  return decode<View_t>(util::Blob_const(any.m_value.data(), any.m_value.size()), arena, err_code);
}

} // namespace arenapb::wkt
