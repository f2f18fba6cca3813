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
#include "arenapb/schema.hpp"
#include "arenapb/wire.hpp"
#include <flow/error/error.hpp>
#include <algorithm>
#include <vector>

namespace arenapb::schema
{

void validate_fields(flow::log::Logger* logger_ptr, util::String_view msg_name,
                     const Field_descriptor* fields, size_t n_fields, Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code)
           { validate_fields(logger_ptr, msg_name, fields, n_fields, actual_err_code); },
         err_code, "arenapb::schema::validate_fields()"))
  {
    return;
  }
  // If got here: err_code is not null.
  err_code->clear();

  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_SCHEMA);

  for (size_t idx = 0; idx != n_fields; ++idx)
  {
    const auto& field = fields[idx];
    if ((field.m_number < wire::S_MIN_FIELD_NUMBER) || (field.m_number > wire::S_MAX_FIELD_NUMBER))
    {
      FLOW_LOG_WARNING("Message [" << msg_name << "] field [" << field.m_name << "] has number "
                       "[" << field.m_number << "] outside [" << wire::S_MIN_FIELD_NUMBER << ", "
                       "" << wire::S_MAX_FIELD_NUMBER << "].");
      *err_code = error::Code::S_SCHEMA_INVALID_FIELD_NUMBER;
    }
  }
  if (*err_code)
  {
    return;
  }
  // else

  std::vector<Field_descriptor> sorted(fields, fields + n_fields);
  std::sort(sorted.begin(), sorted.end(),
            [](const Field_descriptor& val1, const Field_descriptor& val2) { return val1.m_number < val2.m_number; });
  for (auto it = sorted.begin();
       (it = std::adjacent_find(it, sorted.end(),
                                [](const Field_descriptor& val1, const Field_descriptor& val2)
                                  { return val1.m_number == val2.m_number; }))
         != sorted.end();
       ++it)
  {
    FLOW_LOG_WARNING("Message [" << msg_name << "] fields [" << it->m_name << "] and [" << (it + 1)->m_name << "] "
                     "share number [" << it->m_number << "].");
    *err_code = error::Code::S_SCHEMA_DUPLICATE_FIELD_TAG;
  }
} // validate_fields()

util::String_view field_name(const Field_descriptor* fields, size_t n_fields, uint32_t number)
{
  const auto end = fields + n_fields;
  const auto it = std::find_if(fields, end,
                               [number](const Field_descriptor& field) { return field.m_number == number; });
  return (it == end) ? util::String_view() : util::String_view(it->m_name);
}

} // namespace arenapb::schema
