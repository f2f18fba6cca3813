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

#include <flow/common.hpp>
#include <flow/log/log.hpp>
#include <flow/util/util.hpp>
#include <flow/util/blob.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/unordered_map.hpp>
#include <string>

/**
 * Arena-PB: a protocol-buffers binary wire codec whose decoded messages live entirely inside an arena
 * (arenapb::Arena).  Decoding a message yields an immutable *view* (a plain `struct` of scalars, string views,
 * slices and pointers) all of whose variable-length data is borrowed from the arena; encoding goes the other way,
 * from a view into a caller-supplied buffer.
 *
 * The moving parts, leaves first:
 *   - Arena: bump-pointer region; Arena_vector, Arena_map and Slice are the collections carved out of it.
 *   - arenapb::wire: varint/zigzag/fixed-width/tag/length-delimiter primitives over Wire_reader and Wire_writer.
 *   - Decode_context: recursion budget threaded by value through nested decodes.
 *   - arenapb::codec: per-field-kind encode/merge/length functions (scalars, strings, bytes, messages, groups,
 *     maps).
 *   - Message_builder: the mutable accumulator (CRTP base for per-message builders) and its freeze() into a view;
 *     plus the top-level driver (decode(), encode() and friends).
 *
 * The per-message builder and view types themselves are not part of this library: they are produced by a schema
 * compiler (or written by hand) against the contracts documented in message.hpp.
 */
namespace arenapb
{

// Types.

/// Short-hand for Flow's `Error_code` which is very common.
using Error_code = flow::Error_code;

/// The `flow::log::Component` payload enumeration for Arena-PB log messages.
enum class Log_component
{
  /// Uncategorized.
  S_UNCAT = 0,
  /// Arena memory management.
  S_ARENA,
  /// Schema (field table) validation.
  S_SCHEMA,
  /// Top-level message decode/encode driver.
  S_MESSAGE,
  /// Length-prefixed frame I/O.
  S_FRAME,
  /// SENTINEL: Not a component.  Must be last.
  S_END_SENTINEL
}; // enum class Log_component

// Constants.

/**
 * The map generated by `flow::log` macro magic that maps each enumerated value in arenapb::Log_component to its
 * string representation as used in log output and verbosity config.  Arena-PB emitters
 * should use this map via `flow::log::Config::init_component_names()` like so:
 *
 *   ~~~
 *   config.init_component_names<arenapb::Log_component>(arenapb::S_ARENAPB_LOG_COMPONENT_NAME_MAP, false, "arenapb-");
 *   ~~~
 */
extern const boost::unordered_multimap<Log_component, std::string> S_ARENAPB_LOG_COMPONENT_NAME_MAP;

} // namespace arenapb

/**
 * Small collection of short-hands used throughout Arena-PB; mostly aliases to Flow and boost.asio types.
 */
namespace arenapb::util
{

// Types.

/// Short-hand for Flow's `String_view`.
using String_view = flow::util::String_view;

/// Short-hand for an immutable blob somewhere in memory, stored as exactly a `void const *` and a `size_t`.
using Blob_const = boost::asio::const_buffer;

/// Short-hand for a mutable blob somewhere in memory, stored as exactly a `void*` and a `size_t`.
using Blob_mutable = boost::asio::mutable_buffer;

} // namespace arenapb::util
