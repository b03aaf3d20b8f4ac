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
#include "sift/coll/set.hpp"
#include "sift/coll/unique.hpp"
#include "sift/log/log.hpp"
#include <boost/unordered_set.hpp>
#include <utility>
#include <vector>

namespace sift::coll
{

// Types.

/**
 * Tracks which values have been seen: a value, once marked (via see() or set_seen()), stays marked until clear().
 * Beyond the membership query has(), it can split a sequence of values into the ones seen and the ones not seen
 * (filter_seen(), filter_not_seen()), each result in the input's order and free of duplicates.
 *
 * Copy, move (the source becomes empty) and `swap()` are supported.
 *
 * ### Thread safety ###
 * Same as for `boost::unordered_set<>`.
 *
 * @tparam T_t
 *         Value type.  Copyable; hashable by `Hash_t` consistently with `Pred_t`.
 * @tparam Hash_t
 *         Hasher type for `T_t`.
 * @tparam Pred_t
 *         Equality functor type for `T_t`.
 */
template<typename T_t, typename Hash_t, typename Pred_t>
class Seen_set :
  public log::Log_context,
  public Set
{
public:
  // Types.

  /// Convenience alias for template arg.
  using T = T_t;

  /// Convenience alias for template arg.
  using Hash = Hash_t;

  /// Convenience alias for template arg.
  using Pred = Pred_t;

  /// Expresses sizes/lengths of relevant things.
  using size_type = std::size_t;

  // Constructors/destructor.

  /**
   * Constructs empty structure: nothing has been seen.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging mutations; null to not log.
   * @param n_buckets
   *        Number of buckets for the hash table.  Use -1 to have it chosen automatically.
   * @param hasher_obj
   *        Instance of the hash function type to use.
   * @param pred
   *        Instance of the equality function type to use.
   */
  explicit Seen_set(log::Logger* logger_ptr = 0,
                    size_type n_buckets = size_type(-1),
                    const Hash& hasher_obj = Hash{},
                    const Pred& pred = Pred{});

  /**
   * Constructs object that is a deep copy of `src`.
   *
   * @param src
   *        Object to copy.
   */
  Seen_set(const Seen_set& src) = default;

  /**
   * Constructs object by making it equal to `src`, while making `src` empty.
   *
   * @param src
   *        Object to move.
   */
  Seen_set(Seen_set&& src);

  // Methods.

  /**
   * Overwrites the contents of `*this` to be a copy of `src`'s.
   *
   * @param src
   *        Object to copy.
   * @return `*this`.
   */
  Seen_set& operator=(const Seen_set& src) = default;

  /**
   * Overwrites the contents of `*this` with `src`'s, while making `src` empty.
   *
   * @param src
   *        Object to move.
   * @return `*this`.
   */
  Seen_set& operator=(Seen_set&& src);

  /**
   * Swaps the contents of this structure and `other`.
   *
   * @param other
   *        Other structure.
   */
  void swap(Seen_set& other);

  /**
   * Marks `val` as seen.
   *
   * @param val
   *        Value.
   * @return `true` if `val` was not seen until now; `false` if it already was.
   */
  bool see(const T& val);

  /**
   * Marks `val` as seen, like see(), without reporting whether it already was.
   *
   * @param val
   *        Value.
   */
  void set_seen(const T& val);

  /**
   * Returns `true` if and only if `val` has been seen.
   *
   * @param val
   *        Value.
   * @return See above.
   */
  bool has(const T& val) const;

  /**
   * Returns the values in `[first, last)` that have been seen, in their original relative order, each at most once.
   *
   * @tparam Input_it
   *         Input iterator with pointee convertible to `const T&`.
   * @param first
   *        Start of range.
   * @param last
   *        End of range.
   * @return See above.
   */
  template<typename Input_it>
  std::vector<T> filter_seen(Input_it first, Input_it last) const;

  /**
   * Identical to the other filter_seen() but over all of `vals`.
   *
   * @param vals
   *        Values to filter.
   * @return See other filter_seen().
   */
  std::vector<T> filter_seen(const std::vector<T>& vals) const;

  /**
   * Returns the values in `[first, last)` that have not been seen, in their original relative order, each at most
   * once.
   *
   * @tparam Input_it
   *         Input iterator with pointee convertible to `const T&`.
   * @param first
   *        Start of range.
   * @param last
   *        End of range.
   * @return See above.
   */
  template<typename Input_it>
  std::vector<T> filter_not_seen(Input_it first, Input_it last) const;

  /**
   * Identical to the other filter_not_seen() but over all of `vals`.
   *
   * @param vals
   *        Values to filter.
   * @return See other filter_not_seen().
   */
  std::vector<T> filter_not_seen(const std::vector<T>& vals) const;

  /**
   * Implements Set API.
   *
   * @return See Set.
   */
  bool empty() const override;

  /**
   * Implements Set API: returns the number of distinct values seen.
   *
   * @return See Set.
   */
  size_type size() const override;

  /// Implements Set API: forgets all values seen.
  void clear() override;

private:
  // Methods.

  /**
   * The meat of filter_seen() and filter_not_seen().
   *
   * @tparam Input_it
   *         See filter_seen().
   * @param first
   *        See filter_seen().
   * @param last
   *        See filter_seen().
   * @param want_seen
   *        `true` to keep the seen values; `false` to keep the others.
   * @return See filter_seen().
   */
  template<typename Input_it>
  std::vector<T> filter(Input_it first, Input_it last, bool want_seen) const;

  // Data.

  /// The values seen so far.
  boost::unordered_set<T, Hash, Pred> m_table;
}; // class Seen_set

// Free functions: in *_fwd.hpp.

// Template implementations.

template<typename T_t, typename Hash_t, typename Pred_t>
Seen_set<T_t, Hash_t, Pred_t>::Seen_set(log::Logger* logger_ptr,
                                        size_type n_buckets,
                                        const Hash& hasher_obj,
                                        const Pred& pred) :
  log::Log_context(logger_ptr, Sift_log_component::S_COLL),
  // See Ordered_map ctor regarding detail::.
  m_table((n_buckets == size_type(-1))
            ? boost::unordered::detail::default_bucket_count
            : n_buckets,
          hasher_obj, pred)
{
  // That's all.
}

template<typename T_t, typename Hash_t, typename Pred_t>
Seen_set<T_t, Hash_t, Pred_t>::Seen_set(Seen_set&& src)
{
  operator=(std::move(src));
}

template<typename T_t, typename Hash_t, typename Pred_t>
Seen_set<T_t, Hash_t, Pred_t>& Seen_set<T_t, Hash_t, Pred_t>::operator=(Seen_set&& src)
{
  if (&src != this)
  {
    clear();
    swap(src);
  }
  return *this;
}

template<typename T_t, typename Hash_t, typename Pred_t>
void Seen_set<T_t, Hash_t, Pred_t>::swap(Seen_set& other)
{
  Log_context::swap(other);
  m_table.swap(other.m_table);
}

template<typename T_t, typename Hash_t, typename Pred_t>
bool Seen_set<T_t, Hash_t, Pred_t>::see(const T& val)
{
  const bool inserted = m_table.insert(val).second;
  if (inserted)
  {
    SIFT_LOG_TRACE("Seen_set [" << this << "]: marked new value; size now [" << size() << "].");
  }
  return inserted;
}

template<typename T_t, typename Hash_t, typename Pred_t>
void Seen_set<T_t, Hash_t, Pred_t>::set_seen(const T& val)
{
  see(val);
}

template<typename T_t, typename Hash_t, typename Pred_t>
bool Seen_set<T_t, Hash_t, Pred_t>::has(const T& val) const
{
  return m_table.find(val) != m_table.end();
}

template<typename T_t, typename Hash_t, typename Pred_t>
template<typename Input_it>
std::vector<T_t> Seen_set<T_t, Hash_t, Pred_t>::filter(Input_it first, Input_it last, bool want_seen) const
{
  std::vector<T> result;
  for (; first != last; ++first)
  {
    if (has(*first) == want_seen)
    {
      result.push_back(*first);
    }
  }

  // Dedup under the same equality as the table's.
  unique_in_place(&result, m_table.key_eq());

  SIFT_LOG_TRACE("Seen_set [" << this << "]: filtered for " << (want_seen ? "seen" : "not-seen") << " values; "
                 "result size [" << result.size() << "].");
  return result;
}

template<typename T_t, typename Hash_t, typename Pred_t>
template<typename Input_it>
std::vector<T_t> Seen_set<T_t, Hash_t, Pred_t>::filter_seen(Input_it first, Input_it last) const
{
  return filter(first, last, true);
}

template<typename T_t, typename Hash_t, typename Pred_t>
std::vector<T_t> Seen_set<T_t, Hash_t, Pred_t>::filter_seen(const std::vector<T>& vals) const
{
  return filter(vals.begin(), vals.end(), true);
}

template<typename T_t, typename Hash_t, typename Pred_t>
template<typename Input_it>
std::vector<T_t> Seen_set<T_t, Hash_t, Pred_t>::filter_not_seen(Input_it first, Input_it last) const
{
  return filter(first, last, false);
}

template<typename T_t, typename Hash_t, typename Pred_t>
std::vector<T_t> Seen_set<T_t, Hash_t, Pred_t>::filter_not_seen(const std::vector<T>& vals) const
{
  return filter(vals.begin(), vals.end(), false);
}

template<typename T_t, typename Hash_t, typename Pred_t>
bool Seen_set<T_t, Hash_t, Pred_t>::empty() const // Virtual.
{
  return m_table.empty();
}

template<typename T_t, typename Hash_t, typename Pred_t>
typename Seen_set<T_t, Hash_t, Pred_t>::size_type Seen_set<T_t, Hash_t, Pred_t>::size() const // Virtual.
{
  return m_table.size();
}

template<typename T_t, typename Hash_t, typename Pred_t>
void Seen_set<T_t, Hash_t, Pred_t>::clear() // Virtual.
{
  if (m_table.empty())
  {
    return;
  }
  // else

  SIFT_LOG_TRACE("Seen_set [" << this << "]: forgetting [" << size() << "] values.");
  m_table.clear();
}

template<typename T_t, typename Hash_t, typename Pred_t>
void swap(Seen_set<T_t, Hash_t, Pred_t>& val1, Seen_set<T_t, Hash_t, Pred_t>& val2)
{
  val1.swap(val2);
}

} // namespace sift::coll
