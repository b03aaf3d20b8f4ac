/* Sift
 * Copyright 2023 Akamai Technologies, Inc.
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

#include "sift/util/util_fwd.hpp"
#include "sift/util/detail/util.hpp"
#include "sift/util/string_ostream.hpp"
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <cassert>
#include <cctype>
#include <locale>
#include <type_traits>

namespace sift::util
{

// Types.

/**
 * Base for interface classes: contributes only a pure `virtual` destructor, so the subclass hierarchy can be
 * destroyed through a base pointer without each interface spelling that out.  coll::Set and log::Logger derive
 * from it.
 */
class Null_interface
{
public:
  // Destructor.

  /// Pure, so Null_interface alone cannot be instantiated; still defined (in util.cpp), as subclass dtors call it.
  virtual ~Null_interface() = 0;
};

/**
 * RAII helper that assigns a new value to a variable for the lifetime of the Scoped_setter, putting the old value
 * back on destruction.  Nesting works as expected:
 *
 *   ~~~
 *   thread_local Sev s_level = Sev::S_INFO;
 *   {
 *     Scoped_setter<Sev> outer(&s_level, Sev::S_TRACE);
 *     {
 *       Scoped_setter<Sev> inner(&s_level, Sev::S_NONE);
 *     } // s_level == S_TRACE.
 *   } // s_level == S_INFO.
 *   ~~~
 *
 * The target must outlive the Scoped_setter.  Movable (so a factory can return one) but not copyable; a moved-from
 * Scoped_setter restores nothing.
 *
 * @tparam Value
 *         Type of the target; must be move-constructible and move-assignable.
 */
template<typename Value>
class Scoped_setter
{
public:
  // Constructors/destructor.

  /**
   * Saves `*target`, then sets it to `val_src_moved`.
   *
   * @param target
   *        Non-null pointer to the variable.
   * @param val_src_moved
   *        New value.
   */
  explicit Scoped_setter(Value* target, Value&& val_src_moved);

  /**
   * Takes over the restore duty of `src_moved`.
   *
   * @param src_moved
   *        Source; becomes inert.
   */
  Scoped_setter(Scoped_setter&& src_moved);

  /// Not copyable.
  Scoped_setter(const Scoped_setter&) = delete;

  /// Puts back the saved value, unless moved-from.
  ~Scoped_setter();

  // Methods.

  /// Not assignable.
  Scoped_setter& operator=(const Scoped_setter&) = delete;

  /// Not assignable.
  Scoped_setter& operator=(Scoped_setter&&) = delete;

private:
  // Data.

  /// The variable to restore; null if moved-from.
  Value* m_target;

  /// Value of `*m_target` before we changed it.
  Value m_saved_value;
}; // class Scoped_setter

// Template implementations.

template<typename Value>
Scoped_setter<Value>::Scoped_setter(Value* target, Value&& val_src_moved) :
  m_target(target),
  m_saved_value(std::move(*target))
{
  assert(m_target);
  *m_target = std::move(val_src_moved);
}

template<typename Value>
Scoped_setter<Value>::Scoped_setter(Scoped_setter&& src_moved) :
  m_target(src_moved.m_target),
  m_saved_value(std::move(src_moved.m_saved_value))
{
  src_moved.m_target = nullptr;
}

template<typename Value>
Scoped_setter<Value>::~Scoped_setter()
{
  if (m_target)
  {
    *m_target = std::move(m_saved_value);
  }
}

template<typename T>
void feed_args_to_ostream(std::ostream* os, const T& only_ostream_arg)
{
  *os << only_ostream_arg;
}

template<typename T1, typename ...T_rest>
void feed_args_to_ostream(std::ostream* os, const T1& ostream_arg1, const T_rest&... remaining_ostream_args)
{
  *os << ostream_arg1;
  feed_args_to_ostream(os, remaining_ostream_args...);
}

template<typename ...T>
void ostream_op_to_string(std::string* target_str, const T&... ostream_args)
{
  // Appends straight into *target_str; no intermediate ostringstream buffer.
  String_ostream os(target_str);
  feed_args_to_ostream(&os.os(), ostream_args...);
  os.os().flush();
}

template<typename ...T>
std::string ostream_op_string(const T&... ostream_args)
{
  std::string result;
  ostream_op_to_string(&result, ostream_args...);
  return result;
}

template<typename Enum>
Enum istream_to_enum(std::istream* is_ptr, Enum enum_default, Enum enum_sentinel,
                     bool accept_num_encoding, bool case_sensitive,
                     Enum enum_lowest)
{
  using boost::lexical_cast;
  using boost::bad_lexical_cast;
  using std::string;
  using Traits = std::char_traits<char>;
  using enum_t = std::underlying_type_t<Enum>;

  assert(enum_t(enum_lowest) >= 0);
  auto& is = *is_ptr;

  // Token = maximal run of [A-Za-z0-9_]; whatever stops it is left in the stream.
  string token;
  for (Traits::int_type ch = is.peek();
       (ch != Traits::eof()) && (std::isalnum(ch) || (ch == '_'));
       ch = is.peek())
  {
    token += Traits::to_char_type(is.get());
  }

  if (token.empty())
  {
    return enum_default;
  }
  // else

  if (accept_num_encoding && std::isdigit(static_cast<unsigned char>(token.front())))
  {
    enum_t num;
    try
    {
      num = lexical_cast<enum_t>(token);
    }
    catch (const bad_lexical_cast&)
    {
      return enum_default; // Too many digits for enum_t.
    }
    return ((num < enum_t(enum_lowest)) || (num >= enum_t(enum_sentinel))) ? enum_default : Enum(num);
  }
  // else

  const std::locale& loc = std::locale::classic();
  for (auto raw = enum_t(enum_lowest); raw != enum_t(enum_sentinel); ++raw)
  {
    // Compare against the operator<<() rendering of each candidate.
    const auto name = lexical_cast<string>(Enum(raw));
    if (case_sensitive ? (token == name) : boost::algorithm::iequals(token, name, loc))
    {
      return Enum(raw);
    }
  }

  return enum_default;
} // istream_to_enum()

} // namespace sift::util
