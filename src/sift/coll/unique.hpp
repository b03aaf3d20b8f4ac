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
#include <cassert>
#include <functional>
#include <iterator>
#include <utility>

namespace sift::coll
{

// Template implementations.

template<typename Forward_it, typename Pred>
Forward_it unique_stable(Forward_it first, Forward_it last, Pred pred)
{
  using std::next;

  /* Invariant at the top of each iteration: [first, anchor) are the distinct first occurrences so far, in order;
   * and no element in [anchor, last) equals any of them.  So the anchor itself is a first occurrence; compact
   * everything after it that does not equal it, and shrink `last` to the compacted end. */
  for (auto anchor = first; anchor != last; ++anchor)
  {
    auto dst = next(anchor);
    for (auto src = dst; src != last; ++src)
    {
      if (pred(*anchor, *src))
      {
        continue; // Later duplicate of the anchor: drop it (it will be overwritten or end up in the tail).
      }
      // else

      if (dst != src)
      {
        *dst = std::move(*src);
      }
      ++dst;
    }

    last = dst;
  }

  return last;
} // unique_stable()

template<typename Forward_it>
Forward_it unique_stable(Forward_it first, Forward_it last)
{
  return unique_stable(first, last, std::equal_to<>());
}

template<typename Container, typename Pred>
void unique_in_place(Container* seq_ptr, Pred pred)
{
  assert(seq_ptr);
  auto& seq = *seq_ptr;

  seq.erase(unique_stable(seq.begin(), seq.end(), pred), seq.end());
}

template<typename Container>
void unique_in_place(Container* seq)
{
  unique_in_place(seq, std::equal_to<>());
}

} // namespace sift::coll
