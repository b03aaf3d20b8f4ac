/* Sift
 * Copyright 2026 The Sift Authors
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */

/// @file
#pragma once

#include "sift/coll/coll_fwd.hpp"
#include "sift/util/util.hpp"
#include <cstddef>

namespace sift::coll
{

// Types.

/**
 * The capability common to every Sift container: it can report whether it is empty and how many (logical)
 * elements it holds, and it can be reset to empty.  A caller holding a `Set&` or `Set*` can do these things to an
 * Ordered_map, Equality_set, or Seen_set alike, regardless of their template arguments.
 *
 * Every implementation guarantees:
 *   - `empty() == (size() == 0)`;
 *   - after clear(), `empty() == true`; clear() on an already-empty object has no effect; clear() does not throw.
 *
 * There is no such thing as a null Set here: an implementing object exists or it does not; and a freshly constructed
 * one is empty (size() is 0, every query reports absence).
 */
class Set :
  public util::Null_interface
{
public:
  // Methods.

  /**
   * Returns `true` if and only if size() is zero.
   *
   * @return See above.
   */
  virtual bool empty() const = 0;

  /**
   * Returns the number of logical elements: keys for a map; members for a set.
   *
   * @return See above.
   */
  virtual size_t size() const = 0;

  /// Removes all elements, making empty() true.
  virtual void clear() = 0;
}; // class Set

} // namespace sift::coll
