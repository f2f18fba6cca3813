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
#include <istream>
#include <ostream>

namespace arenapb
{

// Constants.

/// Size of the little-endian length prefix of each frame.
constexpr size_t S_FRAME_PREFIX_SZ = sizeof(uint32_t);

/// Largest frame body read_frame() accepts unless told otherwise: 64 MiB.
constexpr size_t S_DEFAULT_MAX_FRAME_SZ = size_t(64) * 1024 * 1024;

// Free functions.

/**
 * Reads one frame (4-byte little-endian length, then that many bytes) from `*is` into `*frame`, which is resized
 * to the body length (reallocating only if its capacity is too small).
 *
 * A stream that is already at its end yields `false` with no error: the peer is done.  A stream that ends inside
 * the prefix or the body is error::Code::S_FRAME_TRUNCATED.  A prefix above `max_frame_sz` is
 * error::Code::S_FRAME_TOO_LARGE, detected before anything is allocated; the body is left unread, so the stream
 * cannot be resynchronized.
 *
 * @param logger_ptr
 *        Logger to use for logging subsequently (may be null).
 * @param is
 *        Input stream (binary).
 * @param frame
 *        Receives the body.  Unspecified contents on error or end of stream.
 * @param max_frame_sz
 *        Largest acceptable body length.
 * @param err_code
 *        See `flow::Error_code` docs for error reporting semantics.  error::Code generated:
 *        error::Code::S_FRAME_TRUNCATED, error::Code::S_FRAME_TOO_LARGE.
 * @return `true` if a frame was read; `false` on clean end of stream or on error.
 */
bool read_frame(flow::log::Logger* logger_ptr, std::istream* is, flow::util::Blob* frame, size_t max_frame_sz,
                Error_code* err_code = nullptr);

/**
 * Same as the other read_frame() with `max_frame_sz` = #S_DEFAULT_MAX_FRAME_SZ.
 *
 * @param logger_ptr
 *        See other overload.
 * @param is
 *        See other overload.
 * @param frame
 *        See other overload.
 * @param err_code
 *        See other overload.
 * @return See other overload.
 */
bool read_frame(flow::log::Logger* logger_ptr, std::istream* is, flow::util::Blob* frame,
                Error_code* err_code = nullptr);

/**
 * Writes one frame (4-byte little-endian length, then `body`) to `*os` and flushes.
 *
 * @param logger_ptr
 *        Logger to use for logging subsequently (may be null).
 * @param os
 *        Output stream (binary).
 * @param body
 *        Frame body; at most 2^32 - 1 bytes.
 * @param err_code
 *        See `flow::Error_code` docs for error reporting semantics.  error::Code generated:
 *        error::Code::S_FRAME_WRITE_FAILED.
 */
void write_frame(flow::log::Logger* logger_ptr, std::ostream* os, util::Blob_const body,
                 Error_code* err_code = nullptr);

} // namespace arenapb
