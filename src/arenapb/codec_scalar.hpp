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

#include "arenapb/wire.hpp"
#include "arenapb/arena_vector.hpp"
#include <flow/error/error.hpp>
#include <optional>

namespace arenapb::codec
{

// Types.

/* Scalar kinds.  Each describes one protocol-buffers scalar type: its C++ value type, its wire type, and the
 * bijection between the value and the unsigned integer that goes on the wire (a varint payload, or the raw bits
 * of a fixed-width value).  The Scalar template turns a kind into a codec. */

/// `bool`: varint 0 or 1; decoding accepts any nonzero varint as `true`.
struct Bool_kind
{
  /// C++ type.
  using Value = bool;
  /// Wire payload type.
  using Wire_value = uint64_t;
  /// Wire type.
  static constexpr wire::Wire_type S_WIRE_TYPE = wire::Wire_type::S_VARINT;
  /// Value to payload.
  static constexpr Wire_value to_wire(Value val) { return val ? 1 : 0; }
  /// Payload to value.
  static constexpr Value from_wire(Wire_value val) { return val != 0; }
};

/// `int32` (and open `enum`s): negative values are sign-extended to 64 bits, hence 10 bytes on the wire.
struct Int32_kind
{
  /// C++ type.
  using Value = int32_t;
  /// Wire payload type.
  using Wire_value = uint64_t;
  /// Wire type.
  static constexpr wire::Wire_type S_WIRE_TYPE = wire::Wire_type::S_VARINT;
  /// Value to payload.
  static constexpr Wire_value to_wire(Value val) { return static_cast<uint64_t>(static_cast<int64_t>(val)); }
  /// Payload to value (truncating to the low 32 bits).
  static constexpr Value from_wire(Wire_value val) { return static_cast<int32_t>(static_cast<uint32_t>(val)); }
};

/// `int64`.
struct Int64_kind
{
  /// C++ type.
  using Value = int64_t;
  /// Wire payload type.
  using Wire_value = uint64_t;
  /// Wire type.
  static constexpr wire::Wire_type S_WIRE_TYPE = wire::Wire_type::S_VARINT;
  /// Value to payload.
  static constexpr Wire_value to_wire(Value val) { return static_cast<uint64_t>(val); }
  /// Payload to value.
  static constexpr Value from_wire(Wire_value val) { return static_cast<int64_t>(val); }
};

/// `uint32`.
struct Uint32_kind
{
  /// C++ type.
  using Value = uint32_t;
  /// Wire payload type.
  using Wire_value = uint64_t;
  /// Wire type.
  static constexpr wire::Wire_type S_WIRE_TYPE = wire::Wire_type::S_VARINT;
  /// Value to payload.
  static constexpr Wire_value to_wire(Value val) { return val; }
  /// Payload to value (truncating to the low 32 bits).
  static constexpr Value from_wire(Wire_value val) { return static_cast<uint32_t>(val); }
};

/// `uint64`.
struct Uint64_kind
{
  /// C++ type.
  using Value = uint64_t;
  /// Wire payload type.
  using Wire_value = uint64_t;
  /// Wire type.
  static constexpr wire::Wire_type S_WIRE_TYPE = wire::Wire_type::S_VARINT;
  /// Value to payload.
  static constexpr Wire_value to_wire(Value val) { return val; }
  /// Payload to value.
  static constexpr Value from_wire(Wire_value val) { return val; }
};

/// `sint32`: zigzag varint.
struct Sint32_kind
{
  /// C++ type.
  using Value = int32_t;
  /// Wire payload type.
  using Wire_value = uint64_t;
  /// Wire type.
  static constexpr wire::Wire_type S_WIRE_TYPE = wire::Wire_type::S_VARINT;
  /// Value to payload.
  static constexpr Wire_value to_wire(Value val) { return wire::zigzag_encode32(val); }
  /// Payload to value.
  static constexpr Value from_wire(Wire_value val) { return wire::zigzag_decode32(static_cast<uint32_t>(val)); }
};

/// `sint64`: zigzag varint.
struct Sint64_kind
{
  /// C++ type.
  using Value = int64_t;
  /// Wire payload type.
  using Wire_value = uint64_t;
  /// Wire type.
  static constexpr wire::Wire_type S_WIRE_TYPE = wire::Wire_type::S_VARINT;
  /// Value to payload.
  static constexpr Wire_value to_wire(Value val) { return wire::zigzag_encode64(val); }
  /// Payload to value.
  static constexpr Value from_wire(Wire_value val) { return wire::zigzag_decode64(val); }
};

/// `fixed32`.
struct Fixed32_kind
{
  /// C++ type.
  using Value = uint32_t;
  /// Wire payload type.
  using Wire_value = uint32_t;
  /// Wire type.
  static constexpr wire::Wire_type S_WIRE_TYPE = wire::Wire_type::S_FIXED32;
  /// Value to payload.
  static constexpr Wire_value to_wire(Value val) { return val; }
  /// Payload to value.
  static constexpr Value from_wire(Wire_value val) { return val; }
};

/// `fixed64`.
struct Fixed64_kind
{
  /// C++ type.
  using Value = uint64_t;
  /// Wire payload type.
  using Wire_value = uint64_t;
  /// Wire type.
  static constexpr wire::Wire_type S_WIRE_TYPE = wire::Wire_type::S_FIXED64;
  /// Value to payload.
  static constexpr Wire_value to_wire(Value val) { return val; }
  /// Payload to value.
  static constexpr Value from_wire(Wire_value val) { return val; }
};

/// `sfixed32`.
struct Sfixed32_kind
{
  /// C++ type.
  using Value = int32_t;
  /// Wire payload type.
  using Wire_value = uint32_t;
  /// Wire type.
  static constexpr wire::Wire_type S_WIRE_TYPE = wire::Wire_type::S_FIXED32;
  /// Value to payload.
  static constexpr Wire_value to_wire(Value val) { return static_cast<uint32_t>(val); }
  /// Payload to value.
  static constexpr Value from_wire(Wire_value val) { return static_cast<int32_t>(val); }
};

/// `sfixed64`.
struct Sfixed64_kind
{
  /// C++ type.
  using Value = int64_t;
  /// Wire payload type.
  using Wire_value = uint64_t;
  /// Wire type.
  static constexpr wire::Wire_type S_WIRE_TYPE = wire::Wire_type::S_FIXED64;
  /// Value to payload.
  static constexpr Wire_value to_wire(Value val) { return static_cast<uint64_t>(val); }
  /// Payload to value.
  static constexpr Value from_wire(Wire_value val) { return static_cast<int64_t>(val); }
};

/// `float`: IEEE-754 bits, little-endian.
struct Float_kind
{
  static_assert(sizeof(float) == sizeof(uint32_t), "Wire format requires 32-bit IEEE-754 float.");

  /// C++ type.
  using Value = float;
  /// Wire payload type.
  using Wire_value = uint32_t;
  /// Wire type.
  static constexpr wire::Wire_type S_WIRE_TYPE = wire::Wire_type::S_FIXED32;
  /// Value to payload.
  static Wire_value to_wire(Value val)
  {
    Wire_value bits;
    std::memcpy(&bits, &val, sizeof(bits));
    return bits;
  }
  /// Payload to value.
  static Value from_wire(Wire_value bits)
  {
    Value val;
    std::memcpy(&val, &bits, sizeof(val));
    return val;
  }
};

/// `double`: IEEE-754 bits, little-endian.
struct Double_kind
{
  static_assert(sizeof(double) == sizeof(uint64_t), "Wire format requires 64-bit IEEE-754 double.");

  /// C++ type.
  using Value = double;
  /// Wire payload type.
  using Wire_value = uint64_t;
  /// Wire type.
  static constexpr wire::Wire_type S_WIRE_TYPE = wire::Wire_type::S_FIXED64;
  /// Value to payload.
  static Wire_value to_wire(Value val)
  {
    Wire_value bits;
    std::memcpy(&bits, &val, sizeof(bits));
    return bits;
  }
  /// Payload to value.
  static Value from_wire(Wire_value bits)
  {
    Value val;
    std::memcpy(&val, &bits, sizeof(val));
    return val;
  }
};

/**
 * Codec for singular, optional and repeated fields of one scalar kind.
 *
 * ### Presence ###
 * Each singular field has exactly one presence model, fixed by the field's declaration and visible in its C++
 * type:
 *   - *Implicit* presence (plain `Value` member): encode_implicit() omits the field entirely when the value is the
 *     kind's zero (is_default()), which for `float`/`double` means all-zero bits, so `-0.0` *is* encoded.
 *   - *Explicit* presence (`std::optional<Value>` member): encode_explicit() encodes whenever the optional is
 *     engaged, zero included.
 *
 * Merging overwrites the current value; so if a tag repeats on the wire the last occurrence wins.
 *
 * ### Repeated ###
 * encode_repeated() emits one key/value pair per element (unpacked); encode_packed() emits one length-delimited
 * run of bare values (packed, the convention for scalars).  merge_repeated() accepts either form regardless of
 * which the encoder chose, appending to the accumulated elements.
 *
 * ### Element interface ###
 * `S_ALWAYS_ENCODE`, default_element(), merge_element(), encode_element() and encoded_len_element() form the
 * interface shared by all codecs usable as map keys/values (see codec::Map) and wrapper payloads.
 *
 * @tparam Kind
 *         One of the `*_kind` types above.
 */
template<typename Kind>
struct Scalar
{
  // Types.

  /// C++ type of a field of this kind.
  using Value = typename Kind::Value;

  // Constants.

  /// Wire type of a singular value.
  static constexpr wire::Wire_type S_WIRE_TYPE = Kind::S_WIRE_TYPE;

  /// Scalars have a zero value, so a map may omit them when default; see codec::Map.
  static constexpr bool S_ALWAYS_ENCODE = false;

  // Methods.

  /**
   * Whether `val` is the kind's zero value, which implicit presence omits.
   *
   * @param val
   *        Value.
   * @return See above.
   */
  static bool is_default(Value val)
  {
    return Kind::to_wire(val) == 0;
  }

  /**
   * Writes `val` sans key.
   *
   * @param val
   *        Value.
   * @param out
   *        Writer.
   */
  static void encode_value(Value val, wire::Wire_writer* out)
  {
    using wire::Wire_type;

    if constexpr (S_WIRE_TYPE == Wire_type::S_VARINT)
    {
      wire::encode_varint(Kind::to_wire(val), out);
    }
    else if constexpr (S_WIRE_TYPE == Wire_type::S_FIXED32)
    {
      wire::encode_fixed32(Kind::to_wire(val), out);
    }
    else
    {
      wire::encode_fixed64(Kind::to_wire(val), out);
    }
  }

  /**
   * Bytes encode_value() writes.
   *
   * @param val
   *        Value.
   * @return See above.
   */
  static size_t encoded_len_value(Value val)
  {
    if constexpr (S_WIRE_TYPE == wire::Wire_type::S_VARINT)
    {
      return wire::encoded_len_varint(Kind::to_wire(val));
    }
    else
    {
      return sizeof(typename Kind::Wire_value);
    }
  }

  /**
   * Reads a value sans key.
   *
   * @param in
   *        Reader.
   * @param err_code
   *        See wire namespace doc header.
   * @return See above.
   */
  static Value decode_value(wire::Wire_reader* in, Error_code* err_code)
  {
    using wire::Wire_type;

    if constexpr (S_WIRE_TYPE == Wire_type::S_VARINT)
    {
      return Kind::from_wire(wire::decode_varint(in, err_code));
    }
    else if constexpr (S_WIRE_TYPE == Wire_type::S_FIXED32)
    {
      return Kind::from_wire(wire::decode_fixed32(in, err_code));
    }
    else
    {
      return Kind::from_wire(wire::decode_fixed64(in, err_code));
    }
  }

  /**
   * Writes key and value, unconditionally.
   *
   * @param field_number
   *        Field number.
   * @param val
   *        Value.
   * @param out
   *        Writer.
   */
  static void encode(uint32_t field_number, Value val, wire::Wire_writer* out)
  {
    wire::encode_key(field_number, S_WIRE_TYPE, out);
    encode_value(val, out);
  }

  /**
   * Bytes encode() writes.
   *
   * @param field_number
   *        Field number.
   * @param val
   *        Value.
   * @return See above.
   */
  static size_t encoded_len(uint32_t field_number, Value val)
  {
    return wire::key_len(field_number) + encoded_len_value(val);
  }

  /**
   * encode() unless `val` is the default.
   *
   * @param field_number
   *        Field number.
   * @param val
   *        Value.
   * @param out
   *        Writer.
   */
  static void encode_implicit(uint32_t field_number, Value val, wire::Wire_writer* out)
  {
    if (!is_default(val))
    {
      encode(field_number, val, out);
    }
  }

  /**
   * Bytes encode_implicit() writes.
   *
   * @param field_number
   *        Field number.
   * @param val
   *        Value.
   * @return See above.
   */
  static size_t encoded_len_implicit(uint32_t field_number, Value val)
  {
    return is_default(val) ? 0 : encoded_len(field_number, val);
  }

  /**
   * encode() if `val` is engaged, whatever its value.
   *
   * @param field_number
   *        Field number.
   * @param val
   *        Value.
   * @param out
   *        Writer.
   */
  static void encode_explicit(uint32_t field_number, const std::optional<Value>& val, wire::Wire_writer* out)
  {
    if (val)
    {
      encode(field_number, *val, out);
    }
  }

  /**
   * Bytes encode_explicit() writes.
   *
   * @param field_number
   *        Field number.
   * @param val
   *        Value.
   * @return See above.
   */
  static size_t encoded_len_explicit(uint32_t field_number, const std::optional<Value>& val)
  {
    return val ? encoded_len(field_number, *val) : 0;
  }

  /**
   * Reads a value whose key (with `wire_type`) was just read, and overwrites `*val` with it.
   *
   * @param wire_type
   *        From the key; must be #S_WIRE_TYPE.
   * @param val
   *        Field storage.
   * @param in
   *        Reader.
   * @param err_code
   *        See wire namespace doc header.
   */
  static void merge(wire::Wire_type wire_type, Value* val, wire::Wire_reader* in, Error_code* err_code)
  {
    if (!wire::check_wire_type(S_WIRE_TYPE, wire_type, err_code))
    {
      return;
    }
    const auto decoded = decode_value(in, err_code);
    if (!*err_code)
    {
      *val = decoded;
    }
  }

  /**
   * merge() for an explicit-presence field: engages `*val`.
   *
   * @param wire_type
   *        See merge().
   * @param val
   *        Field storage.
   * @param in
   *        Reader.
   * @param err_code
   *        See wire namespace doc header.
   */
  static void merge_explicit(wire::Wire_type wire_type, std::optional<Value>* val, wire::Wire_reader* in,
                             Error_code* err_code)
  {
    Value decoded = Value();
    merge(wire_type, &decoded, in, err_code);
    if (!*err_code)
    {
      *val = decoded;
    }
  }

  /**
   * Appends to a repeated field: a packed run if `wire_type` is length-delimited, else one unpacked element.
   *
   * @param wire_type
   *        From the key.
   * @param vals
   *        Accumulated elements.
   * @param in
   *        Reader.
   * @param err_code
   *        See wire namespace doc header.
   */
  static void merge_repeated(wire::Wire_type wire_type, Arena_vector<Value>* vals, wire::Wire_reader* in,
                             Error_code* err_code)
  {
    using wire::Wire_type;

    if (wire_type != Wire_type::S_LENGTH_DELIMITED)
    {
      Value decoded = Value();
      merge(wire_type, &decoded, in, err_code);
      if (!*err_code)
      {
        vals->push_back(decoded);
      }
      return;
    }
    // else: packed.

    const size_t len = wire::decode_length_delimiter(in, err_code);
    if (*err_code)
    {
      return;
    }
    // else

    if constexpr (S_WIRE_TYPE != Wire_type::S_VARINT)
    {
      // Element count is known exactly (if the run is well-formed).
      vals->reserve(vals->size() + len / sizeof(typename Kind::Wire_value));
    }

    const size_t limit = in->remaining() - len;
    while (in->remaining() > limit)
    {
      const auto decoded = decode_value(in, err_code);
      if (*err_code)
      {
        return;
      }
      vals->push_back(decoded);
    }

    if (in->remaining() != limit)
    {
      *err_code = error::Code::S_DECODE_DELIMITED_LENGTH_EXCEEDED;
    }
  } // merge_repeated()

  /**
   * Writes one key/value pair per element (unpacked form).
   *
   * @param field_number
   *        Field number.
   * @param vals
   *        Elements.
   * @param out
   *        Writer.
   */
  static void encode_repeated(uint32_t field_number, Slice<Value> vals, wire::Wire_writer* out)
  {
    for (const auto val : vals)
    {
      encode(field_number, val, out);
    }
  }

  /**
   * Bytes encode_repeated() writes.
   *
   * @param field_number
   *        Field number.
   * @param vals
   *        Elements.
   * @return See above.
   */
  static size_t encoded_len_repeated(uint32_t field_number, Slice<Value> vals)
  {
    return (wire::key_len(field_number) * vals.size()) + packed_data_len(vals);
  }

  /**
   * Writes all elements as one length-delimited run (packed form); nothing at all if there are none.
   *
   * @param field_number
   *        Field number.
   * @param vals
   *        Elements.
   * @param out
   *        Writer.
   */
  static void encode_packed(uint32_t field_number, Slice<Value> vals, wire::Wire_writer* out)
  {
    if (vals.empty())
    {
      return;
    }
    wire::encode_key(field_number, wire::Wire_type::S_LENGTH_DELIMITED, out);
    wire::encode_length_delimiter(packed_data_len(vals), out);
    for (const auto val : vals)
    {
      encode_value(val, out);
    }
  }

  /**
   * Bytes encode_packed() writes.
   *
   * @param field_number
   *        Field number.
   * @param vals
   *        Elements.
   * @return See above.
   */
  static size_t encoded_len_packed(uint32_t field_number, Slice<Value> vals)
  {
    if (vals.empty())
    {
      return 0;
    }
    const size_t data_len = packed_data_len(vals);
    return wire::key_len(field_number) + wire::length_delimiter_len(data_len) + data_len;
  }

  /**
   * Sum of encoded_len_value() over `vals`.
   *
   * @param vals
   *        Elements.
   * @return See above.
   */
  static size_t packed_data_len(Slice<Value> vals)
  {
    if constexpr (S_WIRE_TYPE == wire::Wire_type::S_VARINT)
    {
      size_t len = 0;
      for (const auto val : vals)
      {
        len += encoded_len_value(val);
      }
      return len;
    }
    else
    {
      return vals.size() * sizeof(typename Kind::Wire_value);
    }
  }

  /**
   * Element interface: starting value of a map key/value before its entry is merged.
   * @return Zero.
   */
  static Value default_element(Arena*)
  {
    return Value();
  }

  /**
   * Element interface: merge().
   *
   * @param wire_type
   *        See merge().
   * @param val
   *        See merge().
   * @param in
   *        See merge().
   * @param err_code
   *        See merge().
   */
  static void merge_element(wire::Wire_type wire_type, Value* val, Arena*, wire::Wire_reader* in, Decode_context,
                            Error_code* err_code)
  {
    merge(wire_type, val, in, err_code);
  }

  /**
   * Element interface: encode().
   *
   * @param field_number
   *        See encode().
   * @param val
   *        See encode().
   * @param out
   *        See encode().
   */
  static void encode_element(uint32_t field_number, Value val, wire::Wire_writer* out)
  {
    encode(field_number, val, out);
  }

  /**
   * Element interface: encoded_len().
   *
   * @param field_number
   *        See encoded_len().
   * @param val
   *        See encoded_len().
   * @return See above.
   */
  static size_t encoded_len_element(uint32_t field_number, Value val)
  {
    return encoded_len(field_number, val);
  }
}; // struct Scalar

/// Codec for `bool` fields.
using Bool = Scalar<Bool_kind>;
/// Codec for `int32` fields.
using Int32 = Scalar<Int32_kind>;
/// Codec for `int64` fields.
using Int64 = Scalar<Int64_kind>;
/// Codec for `uint32` fields.
using Uint32 = Scalar<Uint32_kind>;
/// Codec for `uint64` fields.
using Uint64 = Scalar<Uint64_kind>;
/// Codec for `sint32` fields.
using Sint32 = Scalar<Sint32_kind>;
/// Codec for `sint64` fields.
using Sint64 = Scalar<Sint64_kind>;
/// Codec for `fixed32` fields.
using Fixed32 = Scalar<Fixed32_kind>;
/// Codec for `fixed64` fields.
using Fixed64 = Scalar<Fixed64_kind>;
/// Codec for `sfixed32` fields.
using Sfixed32 = Scalar<Sfixed32_kind>;
/// Codec for `sfixed64` fields.
using Sfixed64 = Scalar<Sfixed64_kind>;
/// Codec for `float` fields.
using Float = Scalar<Float_kind>;
/// Codec for `double` fields.
using Double = Scalar<Double_kind>;
/**
 * Codec for `enum` fields.  Enums are open: any `int32` value decodes and is kept as-is, known enumerator or
 * not; see to_known_enum() for the strict conversion.
 */
using Enum = Scalar<Int32_kind>;

} // namespace arenapb::codec

namespace arenapb
{

// Free functions.

/**
 * Converts an open enum field value into a closed C++ enum whose enumerators are `0, 1, ...` up to (not
 * including) `S_END_SENTINEL`.  Fails with error::Code::S_DECODE_UNKNOWN_ENUM_VALUE, returning
 * `Enum_t::S_END_SENTINEL`, if the value is out of that range.
 *
 * @tparam Enum_t
 *         The closed enum type.
 * @param val
 *         Field value.
 * @param err_code
 *        See error namespace doc header (null means throw).
 * @return See above.
 */
template<typename Enum_t>
Enum_t to_known_enum(int32_t val, Error_code* err_code = nullptr)
{
  if ((val >= 0) && (val < static_cast<int32_t>(Enum_t::S_END_SENTINEL)))
  {
    if (err_code)
    {
      err_code->clear();
    }
    return static_cast<Enum_t>(val);
  }
  // else

  if (!err_code)
  {
    throw flow::error::Runtime_error(error::Code::S_DECODE_UNKNOWN_ENUM_VALUE,
                                     "arenapb::to_known_enum(): value [" + std::to_string(val) + "]");
  }
  *err_code = error::Code::S_DECODE_UNKNOWN_ENUM_VALUE;
  return Enum_t::S_END_SENTINEL;
}

} // namespace arenapb
