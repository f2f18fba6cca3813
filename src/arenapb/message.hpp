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

#include "arenapb/codec_map.hpp"
#include "arenapb/schema.hpp"
#include <flow/error/error.hpp>
#include <optional>
#include <string>

namespace arenapb
{

// Types.

/**
 * CRTP base of every message builder: the mutable, arena-backed accumulator that a decode merges fields into and
 * that freeze() turns into an immutable view.  It supplies the public decode entry points (merge() and
 * merge_length_delimited()), the frozen/reset checks, failed-field path bookkeeping, and one-time schema
 * validation; the sub-class supplies the per-field storage and dispatch.
 *
 * ### View contract ###
 * `View_t` is a plain `struct` of field values, trivially destructible (it may itself live in the arena), whose
 * default-constructed state is the empty message (every field at its default / absent).  It must provide:
 *   - `using Builder = ...;` naming its builder (`Builder_t`).
 *   - `static constexpr char S_NAME[]`: unqualified message name, e.g., `"Person"`.
 *   - `static constexpr char S_PACKAGE[]`: package, possibly empty, e.g., `"example.v1"`.
 *   - `static constexpr std::array<schema::Field_descriptor, N> S_FIELDS`: the field table.
 *   - `size_t encoded_len() const`: body length, sans any key or length prefix.
 *   - `void encode_raw(wire::Wire_writer* out) const`: writes the body, fields in ascending number order, by way
 *     of the arenapb::codec functions.
 *
 * ### Builder contract ###
 * `Builder_t` derives from `Message_builder<Builder_t, View_t>`, has a public `explicit Builder_t(Arena*)`
 * constructor that passes the arena up, and provides (publicly or by befriending this base):
 *   - `bool merge_field(uint32_t field_number, wire::Wire_type wire_type, wire::Wire_reader* in,
 *     Decode_context ctx, Error_code* err_code)`: if `field_number` is known, merges the value via the
 *     matching arenapb::codec function and returns `true`; else returns `false` without consuming anything (the
 *     field is then skipped).  Errors per the wire namespace convention.
 *   - `View_t freeze_fields()`: the view of the accumulated fields (repeated fields via
 *     Arena_vector::freeze(), maps via Arena_map::build()).  Called at most once.
 * Setters, if any, must call ensure_mutable() first.
 *
 * Each oneof is a single `std::variant` member (with `std::monostate` for unset) in both builder and view, so
 * setting one member clears the others automatically and the last one decoded wins.
 *
 * ### Lifetime ###
 * Builder and view borrow the Arena given at construction.  After Arena::reset() the builder may only be
 * destroyed; merge() reports error::Code::S_MERGE_AFTER_ARENA_RESET.
 *
 * @tparam Builder_t
 *         The sub-class (CRTP).
 * @tparam View_t
 *         The view type.
 */
template<typename Builder_t, typename View_t>
class Message_builder
{
public:
  // Types.

  /// The view type.
  using View = View_t;

  // Methods.

  /**
   * Returns a new empty builder in the given arena.
   *
   * @param arena
   *        Arena; must outlive the builder and the views it yields (or be reset only after they are done).
   * @return See above.
   */
  static Builder_t new_in(Arena* arena)
  {
    return Builder_t(arena);
  }

  /**
   * The arena passed to the constructor.
   * @return See above.
   */
  Arena* arena() const
  {
    return m_arena;
  }

  /**
   * Whether freeze() has been called: then no further merging or setting is allowed.
   * @return See above.
   */
  bool frozen() const
  {
    return bool(m_frozen);
  }

  /**
   * Decodes a complete serialized message (no length prefix) from `bytes` and merges it into `*this`: scalar
   * fields present on the wire overwrite, repeated fields append, map entries accumulate, unknown fields are
   * skipped.  On failure `*this` may hold a partial merge and should be discarded.
   *
   * The failure is logged (WARNING, via the arena's logger) and reported with the dotted path of the field that
   * failed, starting with the message name, e.g., `Person.address.city`; if `err_code` is null that path is in
   * the thrown exception's context string.
   *
   * @param bytes
   *        Serialization.  Not retained: every string/bytes field is copied into the arena.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  error::Code generated:
   *        any `S_DECODE_*`, error::Code::S_MERGE_INTO_FROZEN_VIEW, error::Code::S_MERGE_AFTER_ARENA_RESET,
   *        `S_SCHEMA_*` (the message type's field table is bad).
   * @param err_field_path
   *        If not null, on failure receives the failed-field path as above; on success is cleared.
   */
  void merge(util::Blob_const bytes, Error_code* err_code = nullptr, std::string* err_field_path = nullptr)
  {
    merge_impl(false, bytes, err_code, err_field_path);
  }

  /**
   * Same as merge() but `bytes` starts with a varint length prefix, and exactly that many following bytes are
   * decoded; whatever follows is ignored.
   *
   * @param bytes
   *        Length prefix and serialization.
   * @param err_code
   *        See merge().
   * @param err_field_path
   *        See merge().
   * @return Bytes consumed (prefix and body); 0 on failure.
   */
  size_t merge_length_delimited(util::Blob_const bytes, Error_code* err_code = nullptr,
                                std::string* err_field_path = nullptr)
  {
    return merge_impl(true, bytes, err_code, err_field_path);
  }

  /**
   * Finalizes the builder and returns the view.  Idempotent: later calls return the same view, and further
   * merge() or setter calls on `*this` fail.  The view is a small value; copy it freely.
   *
   * @return See above.
   */
  View_t freeze()
  {
    if (!m_frozen)
    {
      m_frozen.emplace(derived()->freeze_fields());
    }
    return *m_frozen;
  }

  /**
   * Merges one field whose key was just read: the sub-class's `merge_field()`, falling back to
   * wire::skip_field() for unknown numbers.  On failure prepends the field's name to the reader's failed-field
   * path.  Called by the decode loops; not for general use.
   *
   * @param field_number
   *        From the key.
   * @param wire_type
   *        From the key.
   * @param in
   *        Reader, positioned at the value.
   * @param ctx
   *        Recursion context of `*this` message.
   * @param err_code
   *        See wire namespace doc header.
   */
  void merge_tagged_field(uint32_t field_number, wire::Wire_type wire_type, wire::Wire_reader* in,
                          Decode_context ctx, Error_code* err_code)
  {
    if (!derived()->merge_field(field_number, wire_type, in, ctx, err_code))
    {
      wire::skip_field(wire_type, field_number, in, ctx, err_code);
    }

    if (*err_code)
    {
      const auto name = schema::field_name(View_t::S_FIELDS.data(), View_t::S_FIELDS.size(), field_number);
      if (name.empty())
      {
        in->push_failed_field(std::to_string(field_number));
      }
      else
      {
        in->push_failed_field(name);
      }
    }
  }

protected:
  // Constructors/destructor.

  /**
   * Constructs an empty builder in the given arena.
   *
   * @param arena
   *        See new_in().
   */
  explicit Message_builder(Arena* arena) :
    m_arena(arena),
    m_generation(arena->generation())
  {
    // Yay.
  }

  // Methods.

  /// Throws `flow::error::Runtime_error` (error::Code::S_MERGE_INTO_FROZEN_VIEW) if frozen(); setters call this.
  void ensure_mutable() const
  {
    if (frozen())
    {
      throw flow::error::Runtime_error(error::Code::S_MERGE_INTO_FROZEN_VIEW,
                                       std::string("arenapb::Message_builder<") + View_t::S_NAME + ">::set_*()");
    }
  }

private:
  // Methods.

  /**
   * `this` as the sub-class.
   * @return See above.
   */
  Builder_t* derived()
  {
    return static_cast<Builder_t*>(this);
  }

  /**
   * Result of schema::validate_fields() on #View_t's field table, computed once per process.
   *
   * @param logger_ptr
   *        Logger for the first call's validation warnings.
   * @return See above.
   */
  static const Error_code& schema_status(flow::log::Logger* logger_ptr)
  {
    static const Error_code s_status = [logger_ptr]() -> Error_code
    {
      Error_code err_code;
      schema::validate_fields(logger_ptr, View_t::S_NAME, View_t::S_FIELDS, &err_code);
      return err_code;
    }();
    return s_status;
  }

  /**
   * Implements merge() and merge_length_delimited().
   *
   * @param delimited
   *        Which one.
   * @param bytes
   *        See merge().
   * @param err_code
   *        See merge().
   * @param err_field_path
   *        See merge().
   * @return See merge_length_delimited().
   */
  size_t merge_impl(bool delimited, util::Blob_const bytes, Error_code* err_code, std::string* err_field_path)
  {
    using flow::error::Runtime_error;

    wire::Wire_reader in(bytes);
    Error_code our_err_code;

    if (frozen())
    {
      our_err_code = error::Code::S_MERGE_INTO_FROZEN_VIEW;
    }
    else if (m_arena->generation() != m_generation)
    {
      our_err_code = error::Code::S_MERGE_AFTER_ARENA_RESET;
    }
    else if (schema_status(m_arena->get_logger()))
    {
      our_err_code = schema_status(m_arena->get_logger());
    }
    else if (delimited)
    {
      codec::merge_loop(derived(), &in, Decode_context(), &our_err_code);
    }
    else
    {
      const Decode_context ctx;
      while ((!our_err_code) && (!in.empty()))
      {
        uint32_t field_number;
        wire::Wire_type wire_type;
        wire::decode_key(&in, &field_number, &wire_type, &our_err_code);
        if (!our_err_code)
        {
          merge_tagged_field(field_number, wire_type, &in, ctx, &our_err_code);
        }
      }
    }

    FLOW_LOG_SET_CONTEXT(m_arena->get_logger(), Log_component::S_MESSAGE);

    if (!our_err_code)
    {
      FLOW_LOG_TRACE("Message_builder [" << View_t::S_NAME << "@" << this << "]: Merged "
                     "[" << (bytes.size() - in.remaining()) << "] of [" << bytes.size() << "] bytes.");
      if (err_code)
      {
        err_code->clear();
      }
      if (err_field_path)
      {
        err_field_path->clear();
      }
      return bytes.size() - in.remaining();
    }
    // else

    std::string path(View_t::S_NAME);
    if (!in.failed_field_path().empty())
    {
      path += '.';
      path += in.failed_field_path();
    }

    FLOW_LOG_WARNING("Message_builder [" << View_t::S_NAME << "@" << this << "]: Merge of "
                     "[" << bytes.size() << "] bytes (length-delimited? = [" << delimited << "]) failed at "
                     "field [" << path << "], byte offset [" << (bytes.size() - in.remaining()) << "]: "
                     "[" << our_err_code << "] [" << our_err_code.message() << "].");

    if (err_field_path)
    {
      *err_field_path = path;
    }
    if (!err_code)
    {
      throw Runtime_error(our_err_code, "arenapb::Message_builder::merge(): field [" + path + "]");
    }
    // else
    *err_code = our_err_code;
    return 0;
  } // merge_impl()

  // Data.

  /// See arena().
  Arena* m_arena;

  /// `m_arena->generation()` at construction; a mismatch means the arena was reset under us.
  uint64_t m_generation;

  /// Cached freeze() result; engaged if and only if frozen().
  std::optional<View_t> m_frozen;
}; // class Message_builder

// Free functions.

/**
 * Decodes a complete serialized message of type `View_t` into `*arena` and returns its view.
 *
 * @tparam View_t
 *         View type.
 * @param bytes
 *        Serialization.
 * @param arena
 *        Arena to hold the decoded data.
 * @param err_code
 *        See Message_builder::merge().  On failure the returned view is the empty message.
 * @param err_field_path
 *        See Message_builder::merge().
 * @return See above.
 */
template<typename View_t>
View_t decode(util::Blob_const bytes, Arena* arena, Error_code* err_code = nullptr,
              std::string* err_field_path = nullptr)
{
  auto builder = View_t::Builder::new_in(arena);
  builder.merge(bytes, err_code, err_field_path);
  if (err_code && *err_code)
  {
    return View_t();
  }
  // else
  return builder.freeze();
}

/**
 * Same as decode() but `bytes` starts with a varint length prefix; see Message_builder::merge_length_delimited().
 *
 * @tparam View_t
 *         View type.
 * @param bytes
 *        Length prefix and serialization.
 * @param arena
 *        See decode().
 * @param err_code
 *        See decode().
 * @param err_field_path
 *        See decode().
 * @param n_consumed
 *        If not null, receives the bytes consumed.
 * @return See decode().
 */
template<typename View_t>
View_t decode_length_delimited(util::Blob_const bytes, Arena* arena, Error_code* err_code = nullptr,
                               std::string* err_field_path = nullptr, size_t* n_consumed = nullptr)
{
  auto builder = View_t::Builder::new_in(arena);
  const size_t n = builder.merge_length_delimited(bytes, err_code, err_field_path);
  if (n_consumed)
  {
    *n_consumed = n;
  }
  if (err_code && *err_code)
  {
    return View_t();
  }
  // else
  return builder.freeze();
}

/**
 * Serializes `msg` into the front of `target` and returns the byte count.  If `target` is too small nothing is
 * written, the shortfall is logged, and error::Code::S_ENCODE_CAPACITY_EXCEEDED is emitted; the return value is
 * then still the required size, so the caller may retry with a sufficient buffer.
 *
 * @tparam View_t
 *         View type.
 * @param logger_ptr
 *        Logger to use for logging subsequently (may be null).
 * @param msg
 *        Message.
 * @param target
 *        Output area.
 * @param err_code
 *        See `flow::Error_code` docs for error reporting semantics.  error::Code generated:
 *        error::Code::S_ENCODE_CAPACITY_EXCEEDED.
 * @return Bytes written (or required; see above).
 */
template<typename View_t>
size_t encode(flow::log::Logger* logger_ptr, const View_t& msg, util::Blob_mutable target,
              Error_code* err_code = nullptr)
{
  using flow::error::Runtime_error;
  using flow::util::ostream_op_string;

  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_MESSAGE);

  const size_t required = msg.encoded_len();
  if (required > target.size())
  {
    FLOW_LOG_WARNING("Encode of [" << View_t::S_NAME << "] needs [" << required << "] bytes; "
                     "target buffer has [" << target.size() << "].  Writing nothing.");
    if (!err_code)
    {
      throw Runtime_error(error::Code::S_ENCODE_CAPACITY_EXCEEDED,
                          ostream_op_string("arenapb::encode(): required [", required, "], "
                                            "remaining [", target.size(), "]"));
    }
    // else
    *err_code = error::Code::S_ENCODE_CAPACITY_EXCEEDED;
    return required;
  }
  // else

  wire::Wire_writer out(target);
  msg.encode_raw(&out);
  assert((out.written() == required) && "encoded_len() and encode_raw() disagree.");
  FLOW_LOG_TRACE("Encoded [" << View_t::S_NAME << "] into [" << required << "] bytes.");

  if (err_code)
  {
    err_code->clear();
  }
  return required;
} // encode()

/**
 * Same as encode() but preceded by a varint length prefix, so that several messages may be concatenated.
 *
 * @tparam View_t
 *         View type.
 * @param logger_ptr
 *        See encode().
 * @param msg
 *        See encode().
 * @param target
 *        See encode().
 * @param err_code
 *        See encode().
 * @return See encode(); includes the prefix.
 */
template<typename View_t>
size_t encode_length_delimited(flow::log::Logger* logger_ptr, const View_t& msg, util::Blob_mutable target,
                               Error_code* err_code = nullptr)
{
  using flow::error::Runtime_error;
  using flow::util::ostream_op_string;

  const size_t body_len = msg.encoded_len();
  const size_t required = wire::length_delimiter_len(body_len) + body_len;
  if (required > target.size())
  {
    FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_MESSAGE);
    FLOW_LOG_WARNING("Length-delimited encode of [" << View_t::S_NAME << "] needs [" << required << "] bytes; "
                     "target buffer has [" << target.size() << "].  Writing nothing.");
    if (!err_code)
    {
      throw Runtime_error(error::Code::S_ENCODE_CAPACITY_EXCEEDED,
                          ostream_op_string("arenapb::encode_length_delimited(): required [", required, "], "
                                            "remaining [", target.size(), "]"));
    }
    // else
    *err_code = error::Code::S_ENCODE_CAPACITY_EXCEEDED;
    return required;
  }
  // else

  wire::Wire_writer out(target);
  wire::encode_length_delimiter(body_len, &out);
  msg.encode_raw(&out);
  assert(out.written() == required);

  if (err_code)
  {
    err_code->clear();
  }
  return required;
} // encode_length_delimited()

/**
 * Serializes `msg` into `*target`, which is resized to fit exactly (reallocating only if its capacity is too
 * small).  Cannot fail.
 *
 * @tparam View_t
 *         View type.
 * @param msg
 *        Message.
 * @param target
 *        Output blob; prior contents are discarded.
 */
template<typename View_t>
void encode_to_blob(const View_t& msg, flow::util::Blob* target)
{
  const size_t len = msg.encoded_len();
  if (target->capacity() < len)
  {
    target->make_zero();
  }
  target->resize(len, 0);

  if (len != 0)
  {
    wire::Wire_writer out(target->mutable_buffer());
    msg.encode_raw(&out);
  }
}

/**
 * Serializes `msg` into freshly allocated storage in `*arena`.  Cannot fail.
 *
 * @tparam View_t
 *         View type.
 * @param msg
 *        Message.
 * @param arena
 *        Arena.
 * @return The serialization, valid as long as any other allocation from `*arena`.
 */
template<typename View_t>
Bytes arena_encode(const View_t& msg, Arena* arena)
{
  const size_t len = msg.encoded_len();
  const auto data = arena->allocate_array<uint8_t>(len);

  wire::Wire_writer out(util::Blob_mutable(data, len));
  msg.encode_raw(&out);
  return Bytes(data, len);
}

/**
 * Package-qualified message name, e.g., `example.v1.Person` (just `Person` if the package is empty).
 *
 * @tparam View_t
 *         View type.
 * @return See above.
 */
template<typename View_t>
std::string full_name()
{
  const util::String_view package(View_t::S_PACKAGE);
  std::string name(package);
  if (!package.empty())
  {
    name += '.';
  }
  name += View_t::S_NAME;
  return name;
}

/**
 * The type URL under which a message of this type is packed into `google.protobuf.Any`:
 * `type.googleapis.com/` followed by full_name().
 *
 * @tparam View_t
 *         View type.
 * @return See above.
 */
template<typename View_t>
std::string type_url()
{
  return "type.googleapis.com/" + full_name<View_t>();
}

} // namespace arenapb
