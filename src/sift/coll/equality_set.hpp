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
#include "sift/log/log.hpp"
#include <initializer_list>
#include <utility>
#include <vector>

namespace sift::coll
{

// Types.

/**
 * The default equality for Equality_set: `T` itself knows whether it equals another `T`, via a member
 * `bool equals(const T&) const`.
 *
 * @tparam T
 *         Element type.
 */
template<typename T>
struct Member_equals
{
  /**
   * Returns `lhs.equals(rhs)`.
   *
   * @param lhs
   *        Object.
   * @param rhs
   *        Object.
   * @return See above.
   */
  bool operator()(const T& lhs, const T& rhs) const
  {
    return lhs.equals(rhs);
  }
};

/**
 * A set of elements of a type that can be compared only for equality: it need not be hashable, nor ordered.
 * Elements are kept in insertion order, and no two are equal under `Pred`.  Consequently every add() is a linear scan
 * of the existing elements; so this is meant for small sets (or types offering nothing better).
 *
 * Each insertion method reports how much it actually inserted: add() returns whether the element was inserted;
 * add_many() and unite() return the count inserted.
 *
 * Copy, move (the source becomes empty) and `swap()` are supported.
 *
 * ### Thread safety ###
 * Same as for `std::vector<>`.
 *
 * @tparam T_t
 *         Element type.  Copyable.
 * @tparam Pred_t
 *         Equality functor type for `T_t`; must be an equivalence relation.
 */
template<typename T_t, typename Pred_t>
class Equality_set :
  public log::Log_context,
  public Set
{
public:
  // Types.

  /// Convenience alias for template arg.
  using T = T_t;

  /// Convenience alias for template arg.
  using Pred = Pred_t;

  /// Type for iterator over the elements, oldest first.
  using Const_iterator = typename std::vector<T>::const_iterator;

  /// Expresses sizes/lengths of relevant things.
  using size_type = std::size_t;

  /// For container compliance (hence the irregular capitalization): #T type.
  using value_type = T;
  /// For container compliance (hence the irregular capitalization): `Const_iterator` type.
  using const_iterator = Const_iterator;
  /// For container compliance (hence the irregular capitalization): `Const_iterator` type.
  using iterator = Const_iterator;

  // Constructors/destructor.

  /**
   * Constructs empty structure.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging mutations; null to not log.
   * @param pred
   *        Instance of the equality functor type to use.
   */
  explicit Equality_set(log::Logger* logger_ptr = 0, const Pred& pred = Pred{});

  /**
   * Constructs object that is a deep copy of `src`.
   *
   * @param src
   *        Object to copy.
   */
  Equality_set(const Equality_set& src) = default;

  /**
   * Constructs object by making it equal to `src`, while making `src` empty.
   *
   * @param src
   *        Object to move.
   */
  Equality_set(Equality_set&& src);

  // Methods.

  /**
   * Overwrites the contents of `*this` to be a copy of `src`'s.
   *
   * @param src
   *        Object to copy.
   * @return `*this`.
   */
  Equality_set& operator=(const Equality_set& src) = default;

  /**
   * Overwrites the contents of `*this` with `src`'s, while making `src` empty.
   *
   * @param src
   *        Object to move.
   * @return `*this`.
   */
  Equality_set& operator=(Equality_set&& src);

  /**
   * Swaps the contents of this structure and `other`.
   *
   * @param other
   *        Other structure.
   */
  void swap(Equality_set& other);

  /**
   * Appends a copy of `elem` unless an element equal to it is already present.
   *
   * @param elem
   *        Element to insert.
   * @return `true` if and only if inserted.
   */
  bool add(const T& elem);

  /**
   * Identical to the other add() but moves `elem` in if inserting.
   *
   * @param elem
   *        See other add().
   * @return See other add().
   */
  bool add(T&& elem);

  /**
   * Performs add() for each element in `[first, last)`, in order.  Each is checked against the elements present
   * at that time, including those added earlier in this same call; so duplicates within the input are dropped too.
   *
   * @tparam Input_it
   *         Input iterator with pointee convertible to `const T&`.
   * @param first
   *        Start of range.
   * @param last
   *        End of range.
   * @return Number of elements inserted.
   */
  template<typename Input_it>
  size_type add_many(Input_it first, Input_it last);

  /**
   * Identical to the other add_many() but for the given elements.
   *
   * @param elems
   *        Elements to insert.
   * @return See other add_many().
   */
  size_type add_many(std::initializer_list<T> elems);

  /**
   * Identical to the other add_many() but for the given elements.
   *
   * @param elems
   *        Elements to insert.
   * @return See other add_many().
   */
  size_type add_many(const std::vector<T>& elems);

  /**
   * Makes `*this` the union of itself and `other`: add() for each element of `other`, in order.
   * `x.unite(x)` is a no-op returning 0; as is a repeat of any unite() with an unchanged `other`.
   *
   * @param other
   *        Set whose elements to add.
   * @return Number of elements inserted.
   */
  size_type unite(const Equality_set& other);

  /**
   * Returns `true` if and only if an element equal to `elem` is present.
   *
   * @param elem
   *        Element to look for.
   * @return See above.
   */
  bool contains(const T& elem) const;

  /**
   * Returns iterator to the oldest element, or end() if empty.
   *
   * @return See above.
   */
  Const_iterator begin() const;

  /**
   * Returns the past-the-end iterator.
   *
   * @return See above.
   */
  Const_iterator end() const;

  /**
   * Implements Set API.
   *
   * @return See Set.
   */
  bool empty() const override;

  /**
   * Implements Set API: returns the number of elements.
   *
   * @return See Set.
   */
  size_type size() const override;

  /// Implements Set API: destroys all elements.
  void clear() override;

private:
  // Data.

  /// The equality.
  Pred m_pred;

  /// The elements, oldest first; pairwise unequal under #m_pred.
  std::vector<T> m_elems;
}; // class Equality_set

// Free functions: in *_fwd.hpp.

// Template implementations.

template<typename T_t, typename Pred_t>
Equality_set<T_t, Pred_t>::Equality_set(log::Logger* logger_ptr, const Pred& pred) :
  log::Log_context(logger_ptr, Sift_log_component::S_COLL),
  m_pred(pred)
{
  // That's all.
}

template<typename T_t, typename Pred_t>
Equality_set<T_t, Pred_t>::Equality_set(Equality_set&& src)
{
  operator=(std::move(src));
}

template<typename T_t, typename Pred_t>
Equality_set<T_t, Pred_t>& Equality_set<T_t, Pred_t>::operator=(Equality_set&& src)
{
  if (&src != this)
  {
    clear();
    swap(src);
  }
  return *this;
}

template<typename T_t, typename Pred_t>
void Equality_set<T_t, Pred_t>::swap(Equality_set& other)
{
  using std::swap;

  Log_context::swap(other);
  swap(m_pred, other.m_pred);
  m_elems.swap(other.m_elems);
}

template<typename T_t, typename Pred_t>
bool Equality_set<T_t, Pred_t>::add(const T& elem)
{
  if (contains(elem))
  {
    return false;
  }
  // else

  m_elems.push_back(elem);
  SIFT_LOG_TRACE("Equality_set [" << this << "]: appended element; size now [" << size() << "].");
  return true;
}

template<typename T_t, typename Pred_t>
bool Equality_set<T_t, Pred_t>::add(T&& elem)
{
  if (contains(elem))
  {
    return false;
  }
  // else

  m_elems.push_back(std::move(elem));
  SIFT_LOG_TRACE("Equality_set [" << this << "]: appended element; size now [" << size() << "].");
  return true;
}

template<typename T_t, typename Pred_t>
template<typename Input_it>
typename Equality_set<T_t, Pred_t>::size_type Equality_set<T_t, Pred_t>::add_many(Input_it first, Input_it last)
{
  size_type n_added = 0;
  for (; first != last; ++first)
  {
    if (add(*first))
    {
      ++n_added;
    }
  }
  return n_added;
}

template<typename T_t, typename Pred_t>
typename Equality_set<T_t, Pred_t>::size_type Equality_set<T_t, Pred_t>::add_many(std::initializer_list<T> elems)
{
  return add_many(elems.begin(), elems.end());
}

template<typename T_t, typename Pred_t>
typename Equality_set<T_t, Pred_t>::size_type Equality_set<T_t, Pred_t>::add_many(const std::vector<T>& elems)
{
  return add_many(elems.begin(), elems.end());
}

template<typename T_t, typename Pred_t>
typename Equality_set<T_t, Pred_t>::size_type Equality_set<T_t, Pred_t>::unite(const Equality_set& other)
{
  if (&other == this)
  {
    return 0; // Every element is already present; and we must not iterate m_elems while appending to it.
  }
  // else

  const auto n_added = add_many(other.m_elems.begin(), other.m_elems.end());
  SIFT_LOG_TRACE("Equality_set [" << this << "]: united with [" << &other << "] of size [" << other.size() << "]; "
                 "added [" << n_added << "]; size now [" << size() << "].");
  return n_added;
}

template<typename T_t, typename Pred_t>
bool Equality_set<T_t, Pred_t>::contains(const T& elem) const
{
  for (const auto& existing_elem : m_elems)
  {
    if (m_pred(existing_elem, elem))
    {
      return true;
    }
  }
  return false;
}

template<typename T_t, typename Pred_t>
typename Equality_set<T_t, Pred_t>::Const_iterator Equality_set<T_t, Pred_t>::begin() const
{
  return m_elems.cbegin();
}

template<typename T_t, typename Pred_t>
typename Equality_set<T_t, Pred_t>::Const_iterator Equality_set<T_t, Pred_t>::end() const
{
  return m_elems.cend();
}

template<typename T_t, typename Pred_t>
bool Equality_set<T_t, Pred_t>::empty() const // Virtual.
{
  return m_elems.empty();
}

template<typename T_t, typename Pred_t>
typename Equality_set<T_t, Pred_t>::size_type Equality_set<T_t, Pred_t>::size() const // Virtual.
{
  return m_elems.size();
}

template<typename T_t, typename Pred_t>
void Equality_set<T_t, Pred_t>::clear() // Virtual.
{
  if (m_elems.empty())
  {
    return;
  }
  // else

  SIFT_LOG_TRACE("Equality_set [" << this << "]: clearing [" << size() << "] elements.");
  m_elems.clear();
}

template<typename T_t, typename Pred_t>
void swap(Equality_set<T_t, Pred_t>& val1, Equality_set<T_t, Pred_t>& val2)
{
  val1.swap(val2);
}

} // namespace sift::coll
