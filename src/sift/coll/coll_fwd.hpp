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

#include <boost/functional/hash.hpp>
#include <functional>

/**
 * Sift module containing the containers proper: each keeps some invariant (sortedness of keys, uniqueness of
 * elements under a given equality) across every mutation, and each implements the coll::Set capability
 * (`empty()`, `size()`, `clear()`) so that it can be queried and reset polymorphically.
 *
 * None is safe for concurrent use; in particular concurrent mutation, or mutation concurrent with iteration,
 * yields undefined behavior.  Each optionally logs its mutations (at log::Sev::S_TRACE, component
 * Sift_log_component::S_COLL) via a log::Logger given at construction; only sizes and positions are logged,
 * never the elements themselves, which need not be `ostream`-printable.
 */
namespace sift::coll
{

// Types.

// Find doc headers near the bodies of these compound types.

class Set;

template<typename T>
struct Member_equals;

template<typename Key, typename Mapped,
         typename Less = std::less<Key>, typename Hash = boost::hash<Key>, typename Pred = std::equal_to<Key>>
class Ordered_map;
template<typename T, typename Pred = Member_equals<T>>
class Equality_set;
template<typename T, typename Hash = boost::hash<T>, typename Pred = std::equal_to<T>>
class Seen_set;

// Free functions.

/**
 * Equivalent to `val1.swap(val2)`.
 *
 * @relatesalso Ordered_map
 * @param val1
 *        Object.
 * @param val2
 *        Object.
 */
template<typename Key, typename Mapped, typename Less, typename Hash, typename Pred>
void swap(Ordered_map<Key, Mapped, Less, Hash, Pred>& val1, Ordered_map<Key, Mapped, Less, Hash, Pred>& val2);

/**
 * Equivalent to `val1.swap(val2)`.
 *
 * @relatesalso Equality_set
 * @param val1
 *        Object.
 * @param val2
 *        Object.
 */
template<typename T, typename Pred>
void swap(Equality_set<T, Pred>& val1, Equality_set<T, Pred>& val2);

/**
 * Equivalent to `val1.swap(val2)`.
 *
 * @relatesalso Seen_set
 * @param val1
 *        Object.
 * @param val2
 *        Object.
 */
template<typename T, typename Hash, typename Pred>
void swap(Seen_set<T, Hash, Pred>& val1, Seen_set<T, Hash, Pred>& val2);

/**
 * Stable duplicate removal: rearranges `[first, last)` so that `[first, R)`, where R is the returned iterator,
 * contains exactly the first occurrence of each distinct value (under `pred`) in the original range, in their
 * original relative order.  Elements in `[R, last)` are valid but of unspecified value (possibly moved-from).
 *
 * Unlike `std::unique()` this removes non-adjacent duplicates as well; and unlike a sort-then-unique approach it
 * keeps the original order and requires neither ordering nor hashing of the values: only `pred`.  The price is
 * quadratic comparison count: each surviving element serves as an anchor against which the rest of the range is
 * compacted leftward.
 *
 * The operation is idempotent: applying it to the result `[first, R)` returns `R`.
 *
 * @tparam Forward_it
 *         Forward iterator with move-assignable pointee.
 * @tparam Pred
 *         Binary predicate, an equivalence relation on the pointee type.
 * @param first
 *        Start of range.
 * @param last
 *        End of range.
 * @param pred
 *        The equality.
 * @return See above.  Equals `first` if and only if the range is empty.
 */
template<typename Forward_it, typename Pred>
Forward_it unique_stable(Forward_it first, Forward_it last, Pred pred);

/**
 * Identical to the other unique_stable() but with `std::equal_to<>` as the equality, i.e., `operator==()`.
 *
 * @tparam Forward_it
 *         See other unique_stable().
 * @param first
 *        See other unique_stable().
 * @param last
 *        See other unique_stable().
 * @return See other unique_stable().
 */
template<typename Forward_it>
Forward_it unique_stable(Forward_it first, Forward_it last);

/**
 * Applies unique_stable() to the entire `*seq` and erases the resulting unspecified tail, so that `*seq` (in its
 * original storage) ends up holding each distinct value once, in the order of first occurrence.
 * E.g., [3, 1, 3, 2, 1, 1] becomes [3, 1, 2].  An empty `*seq` remains empty.
 *
 * @tparam Container
 *         Sequence container with forward iterators and `erase(first, last)`, e.g., `std::vector`.
 * @tparam Pred
 *         See unique_stable().
 * @param seq
 *        The sequence to modify.  Must not be null.
 * @param pred
 *        The equality.
 */
template<typename Container, typename Pred>
void unique_in_place(Container* seq, Pred pred);

/**
 * Identical to the other unique_in_place() but with `std::equal_to<>` as the equality.
 *
 * @tparam Container
 *         See other unique_in_place().
 * @param seq
 *        See other unique_in_place().
 */
template<typename Container>
void unique_in_place(Container* seq);

} // namespace sift::coll
