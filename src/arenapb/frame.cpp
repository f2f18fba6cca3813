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
#include "arenapb/frame.hpp"
#include <flow/error/error.hpp>
#include <boost/endian/conversion.hpp>
#include <limits>

namespace arenapb
{

bool read_frame(flow::log::Logger* logger_ptr, std::istream* is, flow::util::Blob* frame, Error_code* err_code)
{
  return read_frame(logger_ptr, is, frame, S_DEFAULT_MAX_FRAME_SZ, err_code);
}

bool read_frame(flow::log::Logger* logger_ptr, std::istream* is, flow::util::Blob* frame, size_t max_frame_sz,
                Error_code* err_code)
{
  bool result;
  if (flow::error::exec_and_throw_on_error
        ([&](Error_code* actual_err_code) -> bool
           { return read_frame(logger_ptr, is, frame, max_frame_sz, actual_err_code); },
         &result, err_code, "arenapb::read_frame()"))
  {
    return result;
  }
  // If got here: err_code is not null.
  err_code->clear();

  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_FRAME);

  uint8_t prefix[S_FRAME_PREFIX_SZ];
  is->read(reinterpret_cast<char*>(prefix), sizeof(prefix));
  const auto n_prefix = size_t(is->gcount());
  if (n_prefix == 0)
  {
    FLOW_LOG_TRACE("Frame read: end of stream.");
    return false;
  }
  // else
  if (n_prefix != sizeof(prefix))
  {
    FLOW_LOG_WARNING("Frame read: stream ended after [" << n_prefix << "] of [" << sizeof(prefix) << "] "
                     "length-prefix bytes.");
    *err_code = error::Code::S_FRAME_TRUNCATED;
    return false;
  }
  // else

  const size_t len = boost::endian::load_little_u32(prefix);
  if (len > max_frame_sz)
  {
    FLOW_LOG_WARNING("Frame read: length prefix [" << len << "] exceeds maximum [" << max_frame_sz << "].");
    *err_code = error::Code::S_FRAME_TOO_LARGE;
    return false;
  }
  // else

  if (frame->capacity() < len)
  {
    frame->make_zero();
  }
  frame->resize(len, 0);

  if (len != 0)
  {
    is->read(reinterpret_cast<char*>(frame->begin()), len);
    const auto n_body = size_t(is->gcount());
    if (n_body != len)
    {
      FLOW_LOG_WARNING("Frame read: stream ended after [" << n_body << "] of [" << len << "] body bytes.");
      *err_code = error::Code::S_FRAME_TRUNCATED;
      return false;
    }
  }

  FLOW_LOG_TRACE("Frame read: [" << len << "] body bytes.");
  return true;
} // read_frame()

void write_frame(flow::log::Logger* logger_ptr, std::ostream* os, util::Blob_const body, Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { write_frame(logger_ptr, os, body, actual_err_code); },
         err_code, "arenapb::write_frame()"))
  {
    return;
  }
  // If got here: err_code is not null.
  err_code->clear();

  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_FRAME);

  assert((body.size() <= std::numeric_limits<uint32_t>::max()) && "Frame body too large for its length prefix.");

  uint8_t prefix[S_FRAME_PREFIX_SZ];
  boost::endian::store_little_u32(prefix, uint32_t(body.size()));
  os->write(reinterpret_cast<const char*>(prefix), sizeof(prefix));
  os->write(static_cast<const char*>(body.data()), body.size());
  os->flush();

  if (!*os)
  {
    FLOW_LOG_WARNING("Frame write: output stream failed writing [" << body.size() << "] body bytes.");
    *err_code = error::Code::S_FRAME_WRITE_FAILED;
    return;
  }
  // else

  FLOW_LOG_TRACE("Frame write: [" << body.size() << "] body bytes.");
} // write_frame()

} // namespace arenapb
