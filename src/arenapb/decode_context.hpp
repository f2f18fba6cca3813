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

namespace arenapb
{

// Types.

/**
 * Recursion budget threaded through a decode, bounding stack depth against adversarially deep nesting.
 *
 * A top-level decode starts with a default-constructed context (budget #S_RECURSION_LIMIT).  Every descent into
 * an embedded message, a group, or a map entry first checks limit_reached() against the current context and then
 * passes `enter_recursion()` (budget minus one) down to the nested merge, while the caller keeps its own
 * context for the sibling fields that follow.  Contexts are passed by value and never modified in place, so
 * siblings at one depth do not draw from each other's budget.
 *
 * Net effect: a message nested #S_RECURSION_LIMIT levels below the root decodes; one more level fails with
 * error::Code::S_DECODE_RECURSION_LIMIT_EXCEEDED.
 */
class Decode_context
{
public:
  // Constants.

  /// Default budget; equal to the reference protocol-buffers implementations' limit.
  static constexpr unsigned int S_RECURSION_LIMIT = 100;

  // Constructors/destructor.

  /// Context for a top-level decode: full budget.
  Decode_context() :
    m_recursion_budget(S_RECURSION_LIMIT)
  {
    // Yay.
  }

  // Methods.

  /**
   * Returns the context to use one nesting level down.  Must not be called when limit_reached().
   *
   * @return See above.
   */
  Decode_context enter_recursion() const
  {
    assert((m_recursion_budget != 0) && "Check limit_reached() before descending.");
    return Decode_context(m_recursion_budget - 1);
  }

  /**
   * Returns `true` and sets `*err_code` to error::Code::S_DECODE_RECURSION_LIMIT_EXCEEDED if the budget is
   * exhausted; else returns `false` and leaves `*err_code` alone.
   *
   * @param err_code
   *        Must not be null.
   * @return See above.
   */
  bool limit_reached(Error_code* err_code) const
  {
    if (m_recursion_budget == 0)
    {
      *err_code = error::Code::S_DECODE_RECURSION_LIMIT_EXCEEDED;
      return true;
    }
    return false;
  }

  /**
   * Remaining descents allowed.
   * @return See above.
   */
  unsigned int recursion_budget() const
  {
    return m_recursion_budget;
  }

private:
  // Constructors/destructor.

  /**
   * Context with the given budget.
   *
   * @param recursion_budget
   *        See recursion_budget().
   */
  explicit Decode_context(unsigned int recursion_budget) :
    m_recursion_budget(recursion_budget)
  {
    // Yay.
  }

  // Data.

  /// See recursion_budget().
  unsigned int m_recursion_budget;
}; // class Decode_context

} // namespace arenapb
