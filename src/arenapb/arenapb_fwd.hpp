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

namespace arenapb
{

// Types.

// Find doc headers near the bodies of these compound types.

class Arena;
template<typename T>
class Slice;
template<typename T>
class Arena_vector;
template<typename Key, typename Mapped>
struct Map_entry;
template<typename Key, typename Mapped>
class Arena_map;
class Decode_context;
template<typename Builder_t, typename View_t>
class Message_builder;

/**
 * Immutable arena-borrowed byte sequence: the view-side type of a `bytes` field (and of any other raw byte
 * range handed out by Arena).
 */
using Bytes = Slice<uint8_t>;

} // namespace arenapb

/**
 * Wire-format primitives: the exact-bit protocol-buffers binary encoding of varints, zigzag integers,
 * little-endian fixed-width values, field keys (tags) and length delimiters; and the read/write cursors they
 * operate on.  Nothing here allocates or logs.
 */
namespace arenapb::wire
{

// Types.

enum class Wire_type;
class Wire_reader;
class Wire_writer;

} // namespace arenapb::wire

/**
 * Field codecs: for each protocol-buffers field kind a `struct` of `static` functions that encode a field of that
 * kind into a wire::Wire_writer, compute its encoded length, and merge it from a wire::Wire_reader into builder
 * storage.  Generated (or hand-written) builders and views call these; users normally do not.
 */
namespace arenapb::codec
{

// Types.

template<typename Kind>
struct Scalar;
struct String;
struct Bytes;
template<typename View_t>
struct Message;
template<typename View_t>
struct Group;
template<typename Key_codec, typename Val_codec>
struct Map;

} // namespace arenapb::codec
