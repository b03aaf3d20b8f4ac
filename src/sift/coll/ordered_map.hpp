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
#include <boost/iterator/iterator_facade.hpp>
#include <boost/unordered_map.hpp>
#include <algorithm>
#include <cassert>
#include <initializer_list>
#include <utility>
#include <vector>

namespace sift::coll
{

// Types.

/**
 * A map from `Key` to `Mapped` that combines the lookup speed of an `unordered_map<>` with iteration in ascending
 * key order, as by `std::map<>`.  Internally it is exactly that: a hash table of (key, mapped-value) pairs,
 * plus a sorted, duplicate-free `vector` of the same keys.  Every mutator updates both before returning; so
 * between calls the two always hold the same key set.
 *
 * Performance expectations:
 *   - get(): hash lookup; near-constant time.
 *   - contains(): binary search over the sorted keys; logarithmic.  (It does not consult the hash table at all;
 *     so in a correct `*this` `contains(k) == get(k).second` for all `k`.)
 *   - add(), force_add(), remove(): binary search, then a `vector` insert/erase (linear, due to shifting) and
 *     a hash insert/erase.  So a map of N keys costs O(N^2) to build in the worst case; this container favors
 *     cheap ordered iteration and lookup over cheap insertion.
 *   - Iteration: walks the sorted keys; each dereference performs one hash lookup for the mapped value.
 *
 * `add()` is first-writer-wins: adding an existing key is a no-op.  force_add() is last-writer-wins.
 *
 * There is the standard complement of copy operations (deep, independent copies), plus move-construction,
 * move-assignment and `swap()`; a moved-from `*this` is empty.
 *
 * ### Iterators ###
 * Const_iterator is a forward iterator yielding #Entry, a pair of references to a key and its mapped value,
 * in strictly ascending key order.  Each begin() is a fresh traversal, and one can stop at any point (e.g.,
 * `break` out of a range-`for`) with nothing to clean up.  Any mutation of `*this` invalidates all iterators.
 *
 * ### Thread safety ###
 * Same as for `std::map<>`.
 *
 * @tparam Key_t
 *         Key type.  It must be totally ordered by `Less_t`, and hashable by `Hash_t` consistently with `Pred_t`;
 *         and `Pred_t` equality must agree with `Less_t` equivalence.  It must be copyable.
 * @tparam Mapped_t
 *         Type of the value mapped to by each key.  It must be default-constructible (for get()'s miss result) and
 *         copyable.
 * @tparam Less_t
 *         Strict weak ordering functor for `Key_t`.
 * @tparam Hash_t
 *         Hasher type for `Key_t`.
 * @tparam Pred_t
 *         Equality functor type for `Key_t`.
 */
template<typename Key_t, typename Mapped_t, typename Less_t, typename Hash_t, typename Pred_t>
class Ordered_map :
  public log::Log_context,
  public Set
{
public:
  // Types.

  /// Convenience alias for template arg.
  using Key = Key_t;

  /// Convenience alias for template arg.
  using Mapped = Mapped_t;

  /// Convenience alias for template arg.
  using Less = Less_t;

  /// Convenience alias for template arg.
  using Hash = Hash_t;

  /// Convenience alias for template arg.
  using Pred = Pred_t;

  /// Short-hand for a key/value pair as accepted by the `initializer_list` constructor.
  using Value = std::pair<Key, Mapped>;

  /// What a Const_iterator yields: references to a key and its mapped value, both owned by `*this`.
  using Entry = std::pair<const Key&, const Mapped&>;

  /// The hash table type; also the type of the snapshot returned by map().
  using Value_map = boost::unordered_map<Key, Mapped, Hash, Pred>;

  /// Expresses sizes/lengths of relevant things.
  using size_type = std::size_t;

  /// Forward iterator over the Entry items of a `*this`, in ascending key order.
  class Const_iterator :
    public boost::iterator_facade<Const_iterator, Entry, boost::forward_traversal_tag, Entry>
  {
  public:
    /// Constructs a singular iterator, usable only as an assignment target.
    Const_iterator();

  private:
    // Friends.

    /// The container makes these.
    friend class Ordered_map;
    /// The facade calls the core methods below.
    friend class boost::iterator_core_access;

    // Types.

    /// Position in the sorted key sequence.
    using Key_iter = typename std::vector<Key>::const_iterator;

    // Constructors/destructor.

    /**
     * Constructs iterator at the given position.
     *
     * @param values
     *        The container's hash table, for the mapped values.
     * @param key_it
     *        Position in the container's sorted keys.
     */
    explicit Const_iterator(const Value_map* values, Key_iter key_it);

    // Methods.

    /**
     * Implements `*it`.
     *
     * @return See above.
     */
    Entry dereference() const;

    /**
     * Implements `==` and `!=`.
     *
     * @param other
     *        Iterator into the same container.
     * @return See above.
     */
    bool equal(const Const_iterator& other) const;

    /// Implements `++`.
    void increment();

    // Data.

    /// The container's hash table; null if singular.
    const Value_map* m_values;

    /// Current position in the container's sorted keys.
    Key_iter m_key_it;
  }; // class Const_iterator

  /// For container compliance (hence the irregular capitalization): #Key type.
  using key_type = Key;
  /// For container compliance (hence the irregular capitalization): #Mapped type.
  using mapped_type = Mapped;
  /// For container compliance (hence the irregular capitalization): #Entry type.
  using value_type = Entry;
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
   * @param n_buckets
   *        Number of buckets for the hash table.  Use -1 to have it chosen automatically.
   * @param less
   *        Instance of the key ordering functor type to use.
   * @param hasher_obj
   *        Instance of the hash function type to use.
   * @param pred
   *        Instance of the equality function type to use.
   */
  explicit Ordered_map(log::Logger* logger_ptr = 0,
                       size_type n_buckets = size_type(-1),
                       const Less& less = Less{},
                       const Hash& hasher_obj = Hash{},
                       const Pred& pred = Pred{});

  /**
   * Constructs structure with the given contents, as-if by default-constructing and then calling
   * `add(value.first, value.second)` for each `value` in `values`, in order.  Hence, of two values with equivalent
   * keys, the first one wins.
   *
   * @param values
   *        Values with which to fill the structure initially.
   * @param logger_ptr
   *        See other constructor.
   * @param n_buckets
   *        See other constructor.
   * @param less
   *        See other constructor.
   * @param hasher_obj
   *        See other constructor.
   * @param pred
   *        See other constructor.
   */
  explicit Ordered_map(std::initializer_list<Value> values,
                       log::Logger* logger_ptr = 0,
                       size_type n_buckets = size_type(-1),
                       const Less& less = Less{},
                       const Hash& hasher_obj = Hash{},
                       const Pred& pred = Pred{});

  /**
   * Constructs object that is a deep copy of `src`, independent of it thereafter.
   *
   * @param src
   *        Object to copy.
   */
  Ordered_map(const Ordered_map& src) = default;

  /**
   * Constructs object by making it equal to `src`, while making `src` empty.
   *
   * @param src
   *        Object to move.
   */
  Ordered_map(Ordered_map&& src);

  // Methods.

  /**
   * Overwrites the contents of `*this` to be a copy of `src`'s.
   *
   * @param src
   *        Object to copy.
   * @return `*this`.
   */
  Ordered_map& operator=(const Ordered_map& src) = default;

  /**
   * Overwrites the contents of `*this` with `src`'s, while making `src` empty.
   *
   * @param src
   *        Object to move.
   * @return `*this`.
   */
  Ordered_map& operator=(Ordered_map&& src);

  /**
   * Swaps the contents of this structure and `other`, including the Logger and the functors.
   *
   * @param other
   *        Other structure.
   */
  void swap(Ordered_map& other);

  /**
   * Looks up `key`, returning a copy of its mapped value and `true` if present; else a default-constructed
   * #Mapped and `false`.
   *
   * @param key
   *        Key whose equal to find.
   * @return See above.
   */
  std::pair<Mapped, bool> get(const Key& key) const;

  /**
   * Returns `true` if and only if `key` is in `*this`.
   *
   * @param key
   *        Key whose equal to find.
   * @return See above.
   */
  bool contains(const Key& key) const;

  /**
   * If `key` is not in `*this`, inserts it at its sorted position, mapped to `value`; otherwise does nothing
   * (the existing mapped value is kept).
   *
   * @param key
   *        Key to insert.
   * @param value
   *        Value to map to `key`.
   * @return `true` if and only if inserted.
   */
  bool add(const Key& key, const Mapped& value);

  /**
   * Identical to the other add() but moves the given key and value into `*this` if inserting.
   *
   * @param key
   *        See other add().
   * @param value
   *        See other add().
   * @return See other add().
   */
  bool add(Key&& key, Mapped&& value);

  /**
   * Like add(), except that if `key` is already present, its mapped value is overwritten with `value`.
   * Either way, afterwards `get(key) == {value, true}`; and there is still exactly one instance of `key`.
   *
   * @param key
   *        Key to insert, if not present.
   * @param value
   *        Value to map to `key`.
   * @return `true` if and only if `key` was newly inserted.
   */
  bool force_add(const Key& key, const Mapped& value);

  /**
   * Identical to the other force_add() but moves the given key (if inserting) and value into `*this`.
   *
   * @param key
   *        See other force_add().
   * @param value
   *        See other force_add().
   * @return See other force_add().
   */
  bool force_add(Key&& key, Mapped&& value);

  /**
   * Removes `key` and its mapped value, if present; otherwise does nothing.  The remaining keys keep their order.
   *
   * @param key
   *        Key to remove.
   * @return `true` if and only if removed.
   */
  bool remove(const Key& key);

  /**
   * Returns a copy of the hash table of keys to mapped values, independent of `*this` thereafter.
   *
   * @return See above.
   */
  Value_map map() const;

  /**
   * Returns a copy of the keys, in ascending order, independent of `*this` thereafter.
   *
   * @return See above.
   */
  std::vector<Key> keys() const;

  /**
   * Returns iterator to the Entry with the smallest key, or end() if empty.
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
   * Synonym of begin().
   *
   * @return See above.
   */
  Const_iterator cbegin() const;

  /**
   * Synonym of end().
   *
   * @return See above.
   */
  Const_iterator cend() const;

  /**
   * Implements Set API: returns `true` if and only if there are no keys.
   *
   * @return See above.
   */
  bool empty() const override;

  /**
   * Implements Set API: returns the number of keys.
   *
   * @return See above.
   */
  size_type size() const override;

  /// Implements Set API: removes all keys and mapped values.
  void clear() override;

private:
  // Methods.

  /**
   * Returns position of the first key in #m_keys not less than `key`.
   *
   * @param key
   *        Key to search for.
   * @return See above.
   */
  typename std::vector<Key>::const_iterator lower_bound(const Key& key) const;

  /**
   * Given the result of lower_bound(), returns `true` if and only if it points to a key equivalent to `key`.
   *
   * @param key_it
   *        Result of `lower_bound(key)`.
   * @param key
   *        Key passed to lower_bound().
   * @return See above.
   */
  bool found(typename std::vector<Key>::const_iterator key_it, const Key& key) const;

  /**
   * The meat of add() and force_add().
   *
   * @tparam Key_arg
   *         Key reference type (perfect-forwarded).
   * @tparam Mapped_arg
   *         Mapped reference type (perfect-forwarded).
   * @param key
   *        See add().
   * @param value
   *        See add().
   * @param overwrite
   *        `true` for force_add() behavior; else add().
   * @return See add().
   */
  template<typename Key_arg, typename Mapped_arg>
  bool add_impl(Key_arg&& key, Mapped_arg&& value, bool overwrite);

  // Data.

  /// Key ordering.
  Less m_less;

  /// The hash table: each key mapped to its value.  Key set always equals that of #m_keys.
  Value_map m_values;

  /// The keys, strictly ascending under #m_less.  Key set always equals that of #m_values.
  std::vector<Key> m_keys;
}; // class Ordered_map

// Free functions: in *_fwd.hpp.

// Template implementations.

template<typename Key_t, typename Mapped_t, typename Less_t, typename Hash_t, typename Pred_t>
Ordered_map<Key_t, Mapped_t, Less_t, Hash_t, Pred_t>::Ordered_map(log::Logger* logger_ptr,
                                                                  size_type n_buckets,
                                                                  const Less& less,
                                                                  const Hash& hasher_obj,
                                                                  const Pred& pred) :
  log::Log_context(logger_ptr, Sift_log_component::S_COLL),
  m_less(less),
  // @todo Using detail:: like this is technically uncool, but it is the documented boost.unordered default.
  m_values((n_buckets == size_type(-1))
             ? boost::unordered::detail::default_bucket_count
             : n_buckets,
           hasher_obj, pred)
{
  // That's all.
}

template<typename Key_t, typename Mapped_t, typename Less_t, typename Hash_t, typename Pred_t>
Ordered_map<Key_t, Mapped_t, Less_t, Hash_t, Pred_t>::Ordered_map(std::initializer_list<Value> values,
                                                                  log::Logger* logger_ptr,
                                                                  size_type n_buckets,
                                                                  const Less& less,
                                                                  const Hash& hasher_obj,
                                                                  const Pred& pred) :
  Ordered_map(logger_ptr, n_buckets, less, hasher_obj, pred)
{
  m_keys.reserve(values.size());
  for (const auto& value : values)
  {
    add(value.first, value.second);
  }
}

template<typename Key_t, typename Mapped_t, typename Less_t, typename Hash_t, typename Pred_t>
Ordered_map<Key_t, Mapped_t, Less_t, Hash_t, Pred_t>::Ordered_map(Ordered_map&& src)
  // Empty structures are constructed here but immediately swapped with `src`'s within the {body}.
{
  operator=(std::move(src));
}

template<typename Key_t, typename Mapped_t, typename Less_t, typename Hash_t, typename Pred_t>
Ordered_map<Key_t, Mapped_t, Less_t, Hash_t, Pred_t>&
  Ordered_map<Key_t, Mapped_t, Less_t, Hash_t, Pred_t>::operator=(Ordered_map&& src)
{
  if (&src != this)
  {
    clear();
    swap(src);
  }
  return *this;
}

template<typename Key_t, typename Mapped_t, typename Less_t, typename Hash_t, typename Pred_t>
void Ordered_map<Key_t, Mapped_t, Less_t, Hash_t, Pred_t>::swap(Ordered_map& other)
{
  using std::swap;

  Log_context::swap(other);
  swap(m_less, other.m_less);
  m_values.swap(other.m_values); // Swaps hasher and equality too.
  m_keys.swap(other.m_keys);
}

template<typename Key_t, typename Mapped_t, typename Less_t, typename Hash_t, typename Pred_t>
std::pair<Mapped_t, bool> Ordered_map<Key_t, Mapped_t, Less_t, Hash_t, Pred_t>::get(const Key& key) const
{
  const auto it = m_values.find(key);
  if (it == m_values.end())
  {
    return { Mapped{}, false };
  }
  // else
  return { it->second, true };
}

template<typename Key_t, typename Mapped_t, typename Less_t, typename Hash_t, typename Pred_t>
bool Ordered_map<Key_t, Mapped_t, Less_t, Hash_t, Pred_t>::contains(const Key& key) const
{
  return std::binary_search(m_keys.begin(), m_keys.end(), key, m_less);
}

template<typename Key_t, typename Mapped_t, typename Less_t, typename Hash_t, typename Pred_t>
bool Ordered_map<Key_t, Mapped_t, Less_t, Hash_t, Pred_t>::add(const Key& key, const Mapped& value)
{
  return add_impl(key, value, false);
}

template<typename Key_t, typename Mapped_t, typename Less_t, typename Hash_t, typename Pred_t>
bool Ordered_map<Key_t, Mapped_t, Less_t, Hash_t, Pred_t>::add(Key&& key, Mapped&& value)
{
  return add_impl(std::move(key), std::move(value), false);
}

template<typename Key_t, typename Mapped_t, typename Less_t, typename Hash_t, typename Pred_t>
bool Ordered_map<Key_t, Mapped_t, Less_t, Hash_t, Pred_t>::force_add(const Key& key, const Mapped& value)
{
  return add_impl(key, value, true);
}

template<typename Key_t, typename Mapped_t, typename Less_t, typename Hash_t, typename Pred_t>
bool Ordered_map<Key_t, Mapped_t, Less_t, Hash_t, Pred_t>::force_add(Key&& key, Mapped&& value)
{
  return add_impl(std::move(key), std::move(value), true);
}

template<typename Key_t, typename Mapped_t, typename Less_t, typename Hash_t, typename Pred_t>
template<typename Key_arg, typename Mapped_arg>
bool Ordered_map<Key_t, Mapped_t, Less_t, Hash_t, Pred_t>::add_impl(Key_arg&& key, Mapped_arg&& value,
                                                                    bool overwrite)
{
  const auto key_it = lower_bound(key);
  if (found(key_it, key))
  {
    if (overwrite)
    {
      const auto value_it = m_values.find(key);
      assert(value_it != m_values.end()); // m_keys and m_values hold the same key set.
      value_it->second = std::forward<Mapped_arg>(value);

      SIFT_LOG_TRACE("Ordered_map [" << this << "]: overwrote value at key position "
                     "[" << (key_it - m_keys.begin()) << "]; size remains [" << size() << "].");
    }
    return false;
  }
  // else

  const auto pos = key_it - m_keys.begin();
  m_keys.insert(key_it, std::forward<Key_arg>(key));
  try
  {
    m_values.emplace(m_keys[pos], std::forward<Mapped_arg>(value));
  }
  catch (...)
  {
    // Restore the key set equality before letting the user's exception through.
    m_keys.erase(m_keys.begin() + pos);
    throw;
  }

  SIFT_LOG_TRACE("Ordered_map [" << this << "]: inserted key at position [" << pos << "]; "
                 "size now [" << size() << "].");
  return true;
} // Ordered_map::add_impl()

template<typename Key_t, typename Mapped_t, typename Less_t, typename Hash_t, typename Pred_t>
bool Ordered_map<Key_t, Mapped_t, Less_t, Hash_t, Pred_t>::remove(const Key& key)
{
  const auto key_it = lower_bound(key);
  if (!found(key_it, key))
  {
    return false;
  }
  // else

  const auto pos = key_it - m_keys.begin();
  m_values.erase(key);
  m_keys.erase(key_it);

  SIFT_LOG_TRACE("Ordered_map [" << this << "]: removed key at position [" << pos << "]; "
                 "size now [" << size() << "].");
  return true;
}

template<typename Key_t, typename Mapped_t, typename Less_t, typename Hash_t, typename Pred_t>
typename Ordered_map<Key_t, Mapped_t, Less_t, Hash_t, Pred_t>::Value_map
  Ordered_map<Key_t, Mapped_t, Less_t, Hash_t, Pred_t>::map() const
{
  return m_values;
}

template<typename Key_t, typename Mapped_t, typename Less_t, typename Hash_t, typename Pred_t>
std::vector<Key_t> Ordered_map<Key_t, Mapped_t, Less_t, Hash_t, Pred_t>::keys() const
{
  return m_keys;
}

template<typename Key_t, typename Mapped_t, typename Less_t, typename Hash_t, typename Pred_t>
typename Ordered_map<Key_t, Mapped_t, Less_t, Hash_t, Pred_t>::Const_iterator
  Ordered_map<Key_t, Mapped_t, Less_t, Hash_t, Pred_t>::begin() const
{
  return Const_iterator(&m_values, m_keys.cbegin());
}

template<typename Key_t, typename Mapped_t, typename Less_t, typename Hash_t, typename Pred_t>
typename Ordered_map<Key_t, Mapped_t, Less_t, Hash_t, Pred_t>::Const_iterator
  Ordered_map<Key_t, Mapped_t, Less_t, Hash_t, Pred_t>::end() const
{
  return Const_iterator(&m_values, m_keys.cend());
}

template<typename Key_t, typename Mapped_t, typename Less_t, typename Hash_t, typename Pred_t>
typename Ordered_map<Key_t, Mapped_t, Less_t, Hash_t, Pred_t>::Const_iterator
  Ordered_map<Key_t, Mapped_t, Less_t, Hash_t, Pred_t>::cbegin() const
{
  return begin();
}

template<typename Key_t, typename Mapped_t, typename Less_t, typename Hash_t, typename Pred_t>
typename Ordered_map<Key_t, Mapped_t, Less_t, Hash_t, Pred_t>::Const_iterator
  Ordered_map<Key_t, Mapped_t, Less_t, Hash_t, Pred_t>::cend() const
{
  return end();
}

template<typename Key_t, typename Mapped_t, typename Less_t, typename Hash_t, typename Pred_t>
bool Ordered_map<Key_t, Mapped_t, Less_t, Hash_t, Pred_t>::empty() const // Virtual.
{
  return m_keys.empty();
}

template<typename Key_t, typename Mapped_t, typename Less_t, typename Hash_t, typename Pred_t>
typename Ordered_map<Key_t, Mapped_t, Less_t, Hash_t, Pred_t>::size_type
  Ordered_map<Key_t, Mapped_t, Less_t, Hash_t, Pred_t>::size() const // Virtual.
{
  assert(m_keys.size() == m_values.size());
  return m_keys.size();
}

template<typename Key_t, typename Mapped_t, typename Less_t, typename Hash_t, typename Pred_t>
void Ordered_map<Key_t, Mapped_t, Less_t, Hash_t, Pred_t>::clear() // Virtual.
{
  if (m_keys.empty())
  {
    return;
  }
  // else

  SIFT_LOG_TRACE("Ordered_map [" << this << "]: clearing [" << size() << "] keys.");
  m_values.clear();
  m_keys.clear();
}

template<typename Key_t, typename Mapped_t, typename Less_t, typename Hash_t, typename Pred_t>
typename std::vector<Key_t>::const_iterator
  Ordered_map<Key_t, Mapped_t, Less_t, Hash_t, Pred_t>::lower_bound(const Key& key) const
{
  return std::lower_bound(m_keys.begin(), m_keys.end(), key, m_less);
}

template<typename Key_t, typename Mapped_t, typename Less_t, typename Hash_t, typename Pred_t>
bool Ordered_map<Key_t, Mapped_t, Less_t, Hash_t, Pred_t>::found(typename std::vector<Key>::const_iterator key_it,
                                                                 const Key& key) const
{
  // lower_bound() gave us *key_it >= key; so they are equivalent unless key < *key_it.
  return (key_it != m_keys.end()) && (!m_less(key, *key_it));
}

template<typename Key_t, typename Mapped_t, typename Less_t, typename Hash_t, typename Pred_t>
Ordered_map<Key_t, Mapped_t, Less_t, Hash_t, Pred_t>::Const_iterator::Const_iterator() :
  m_values(0)
{
  // That's all.
}

template<typename Key_t, typename Mapped_t, typename Less_t, typename Hash_t, typename Pred_t>
Ordered_map<Key_t, Mapped_t, Less_t, Hash_t, Pred_t>::Const_iterator::Const_iterator(const Value_map* values,
                                                                                     Key_iter key_it) :
  m_values(values),
  m_key_it(key_it)
{
  // That's all.
}

template<typename Key_t, typename Mapped_t, typename Less_t, typename Hash_t, typename Pred_t>
typename Ordered_map<Key_t, Mapped_t, Less_t, Hash_t, Pred_t>::Entry
  Ordered_map<Key_t, Mapped_t, Less_t, Hash_t, Pred_t>::Const_iterator::dereference() const
{
  assert(m_values);
  const auto value_it = m_values->find(*m_key_it);
  assert(value_it != m_values->end());
  return Entry(*m_key_it, value_it->second);
}

template<typename Key_t, typename Mapped_t, typename Less_t, typename Hash_t, typename Pred_t>
bool Ordered_map<Key_t, Mapped_t, Less_t, Hash_t, Pred_t>::Const_iterator::equal(const Const_iterator& other) const
{
  return m_key_it == other.m_key_it;
}

template<typename Key_t, typename Mapped_t, typename Less_t, typename Hash_t, typename Pred_t>
void Ordered_map<Key_t, Mapped_t, Less_t, Hash_t, Pred_t>::Const_iterator::increment()
{
  ++m_key_it;
}

template<typename Key_t, typename Mapped_t, typename Less_t, typename Hash_t, typename Pred_t>
void swap(Ordered_map<Key_t, Mapped_t, Less_t, Hash_t, Pred_t>& val1,
          Ordered_map<Key_t, Mapped_t, Less_t, Hash_t, Pred_t>& val2)
{
  val1.swap(val2);
}

} // namespace sift::coll
