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

#include "sift/log/log_fwd.hpp"
#include "sift/util/util.hpp"
#include "sift/util/detail/util.hpp"
#include "sift/util/string_ostream.hpp"
#include <boost/noncopyable.hpp>
#include <boost/thread/thread.hpp>
#include <chrono>
#include <string>
#include <typeindex>
#include <typeinfo>

// Macros.

/**
 * @name Log call-site macros.
 *
 * Each of these logs the message formed by `ARG_stream_fragment` at the severity in its name, into
 * sift::log::Logger `*get_logger()` with sift::log::Component `get_log_component()`, provided that logger is
 * not null and its Logger::should_log() passes.  `ARG_stream_fragment` is whatever would follow `os` in
 * `os << a << b`; it is not evaluated at all when the message is filtered out.  A newline is appended by the
 * Logger, so do not end the fragment with one.
 *
 * `get_logger()` and `get_log_component()` are usually inherited from sift::log::Log_context; outside a
 * Log_context-derived class use SIFT_LOG_SET_CONTEXT().
 */
///@{
#define SIFT_LOG_FATAL(ARG_stream_fragment) \
  SIFT_LOG_WITH_CHECKING(::sift::log::Sev::S_FATAL, ARG_stream_fragment)
#define SIFT_LOG_ERROR(ARG_stream_fragment) \
  SIFT_LOG_WITH_CHECKING(::sift::log::Sev::S_ERROR, ARG_stream_fragment)
#define SIFT_LOG_WARNING(ARG_stream_fragment) \
  SIFT_LOG_WITH_CHECKING(::sift::log::Sev::S_WARNING, ARG_stream_fragment)
#define SIFT_LOG_INFO(ARG_stream_fragment) \
  SIFT_LOG_WITH_CHECKING(::sift::log::Sev::S_INFO, ARG_stream_fragment)
#define SIFT_LOG_DEBUG(ARG_stream_fragment) \
  SIFT_LOG_WITH_CHECKING(::sift::log::Sev::S_DEBUG, ARG_stream_fragment)
#define SIFT_LOG_TRACE(ARG_stream_fragment) \
  SIFT_LOG_WITH_CHECKING(::sift::log::Sev::S_TRACE, ARG_stream_fragment)
#define SIFT_LOG_DATA(ARG_stream_fragment) \
  SIFT_LOG_WITH_CHECKING(::sift::log::Sev::S_DATA, ARG_stream_fragment)
///@}

/// Like SIFT_LOG_TRACE() minus the should_log() check; for use after the caller has done that check itself.
#define SIFT_LOG_TRACE_WITHOUT_CHECKING(ARG_stream_fragment) \
  SIFT_LOG_WITHOUT_CHECKING(::sift::log::Sev::S_TRACE, ARG_stream_fragment)

/**
 * Declares, for the remainder of the enclosing block, local `get_logger()` and `get_log_component()` callables
 * returning `ARG_logger_ptr` (may be null) and `Component(ARG_component_payload)` respectively.  The `SIFT_LOG_*()`
 * macros below this point in the block then use those.  Typical use: a free function or `static` member that
 * receives a `Logger*` as an argument.
 *
 * @param ARG_logger_ptr
 *        `Logger*` to log into.
 * @param ARG_component_payload
 *        `enum` value from which to build the Component.
 */
#define SIFT_LOG_SET_CONTEXT(ARG_logger_ptr, ARG_component_payload) \
  SIFT_LOG_SET_LOGGER(ARG_logger_ptr); \
  SIFT_LOG_SET_COMPONENT(ARG_component_payload);

/// The `get_logger()` half of SIFT_LOG_SET_CONTEXT().
#define SIFT_LOG_SET_LOGGER(ARG_logger_ptr) \
  [[maybe_unused]] const auto get_logger \
    = [sift_log_logger = static_cast<::sift::log::Logger*>(ARG_logger_ptr)] \
        () -> ::sift::log::Logger* { return sift_log_logger; }

/// The `get_log_component()` half of SIFT_LOG_SET_CONTEXT().
#define SIFT_LOG_SET_COMPONENT(ARG_component_payload) \
  [[maybe_unused]] const auto get_log_component \
    = [sift_log_component = ::sift::log::Component(ARG_component_payload)] \
        () -> const ::sift::log::Component& { return sift_log_component; }

/**
 * The macro every severity-named `SIFT_LOG_*()` macro expands to: checks Logger::should_log() and, if it passes,
 * logs via SIFT_LOG_WITHOUT_CHECKING().
 *
 * @param ARG_sev
 *        log::Sev of the message.
 * @param ARG_stream_fragment
 *        See SIFT_LOG_WARNING().
 */
#define SIFT_LOG_WITH_CHECKING(ARG_sev, ARG_stream_fragment) \
  SIFT_UTIL_SEMICOLON_SAFE \
  ( \
    const ::sift::log::Logger* const sift_log_chk_logger = get_logger(); \
    if (sift_log_chk_logger && sift_log_chk_logger->should_log(ARG_sev, get_log_component())) \
    { \
      SIFT_LOG_WITHOUT_CHECKING(ARG_sev, ARG_stream_fragment); \
    } \
  )

/**
 * Fills out the call-site metadata (time stamp, file, line, function) and hands off to SIFT_LOG_DO_LOG(),
 * skipping the should_log() filter.  Does nothing if `get_logger()` is null.
 *
 * @param ARG_sev
 *        See SIFT_LOG_WITH_CHECKING().
 * @param ARG_stream_fragment
 *        See SIFT_LOG_WITH_CHECKING().
 */
#define SIFT_LOG_WITHOUT_CHECKING(ARG_sev, ARG_stream_fragment) \
  SIFT_UTIL_SEMICOLON_SAFE \
  ( \
    ::sift::log::Logger* const sift_log_logger = get_logger(); \
    if (!sift_log_logger) \
    { \
      break; \
    } \
    /* else */ \
    const auto sift_log_when = ::std::chrono::system_clock::now(); \
    /* File and function names are compile-time views into static storage. */ \
    constexpr ::sift::util::String_view sift_log_full_file(__FILE__, sizeof(__FILE__) - 1); \
    constexpr ::sift::util::String_view sift_log_file = ::sift::util::get_last_path_segment(sift_log_full_file); \
    constexpr ::sift::util::String_view sift_log_func(__FUNCTION__, sizeof(__FUNCTION__) - 1); \
    SIFT_LOG_DO_LOG(sift_log_logger, get_log_component(), ARG_sev, sift_log_file, __LINE__, sift_log_func, \
                    sift_log_when, ARG_stream_fragment); \
  )

/**
 * Lowest-level call-site macro: every piece of Msg_metadata is given explicitly.  Formats the message into a
 * util::String_ostream, then calls `ARG_logger_ptr->do_log()`.
 *
 * @param ARG_logger_ptr
 *        Non-null `Logger*`.
 * @param ARG_component
 *        Becomes Msg_metadata::m_msg_component.
 * @param ARG_sev
 *        Becomes Msg_metadata::m_msg_sev.
 * @param ARG_file_view
 *        Becomes Msg_metadata::m_msg_src_file.
 * @param ARG_line
 *        Becomes Msg_metadata::m_msg_src_line.
 * @param ARG_func_view
 *        Becomes Msg_metadata::m_msg_src_function.
 * @param ARG_time_stamp
 *        Becomes Msg_metadata::m_called_when.
 * @param ARG_stream_fragment
 *        See SIFT_LOG_WITH_CHECKING().
 */
#define SIFT_LOG_DO_LOG(ARG_logger_ptr, \
                        ARG_component, ARG_sev, ARG_file_view, ARG_line, ARG_func_view, \
                        ARG_time_stamp, ARG_stream_fragment) \
  SIFT_UTIL_SEMICOLON_SAFE \
  ( \
    ::sift::util::String_ostream sift_log_msg_os; \
    sift_log_msg_os.os() << ARG_stream_fragment << ::std::flush; \
    ::sift::log::Msg_metadata sift_log_metadata; \
    /* Parenthesized so the braced list's commas do not split macro arguments. */ \
    (sift_log_metadata = { ARG_component, ARG_sev, ARG_file_view, ARG_line, ARG_func_view, \
                           ARG_time_stamp, ::boost::this_thread::get_id() }); \
    (ARG_logger_ptr)->do_log(&sift_log_metadata, ::sift::util::String_view(sift_log_msg_os.str())); \
  )

namespace sift::log
{

// Types.

/**
 * Tags a log message with the subsystem it came from: an `enum` value plus the identity of its `enum` type.
 * Config filters on it and the Ostream_log_msg_writer prints its registered name.  An empty() Component
 * (default-constructed) is legal and means "uncategorized".
 *
 * Any `enum class X : Component::enum_raw_t` can serve as payload type; so Sift's sift::Sift_log_component and a
 * user's own component `enum` can feed the same Logger side by side.  See Config::init_component_to_union_idx_mapping().
 */
class Component
{
public:
  // Types.

  /// Required underlying type of every payload `enum`.
  using enum_raw_t = unsigned int;

  // Constructors/destructor.

  /// Constructs an empty() Component.
  Component();

  /**
   * Constructs a Component holding `payload`.  `Payload` must be an `enum` whose underlying type is #enum_raw_t;
   * this is checked at compile time.
   *
   * @tparam Payload
   *         The component `enum` type.
   * @param payload
   *        The value.
   */
  template<typename Payload>
  Component(Payload payload);

  /**
   * Copy constructor.
   * @param src
   *        Source.
   */
  Component(const Component& src);

  /**
   * Move constructor; `src_moved` is left unchanged.
   * @param src_moved
   *        Source.
   */
  Component(Component&& src_moved);

  // Methods.

  /**
   * Copy assignment.
   * @param src
   *        Source.
   * @return `*this`.
   */
  Component& operator=(const Component& src);

  /**
   * Replaces the payload; same as assigning `Component(new_payload)`.
   *
   * @tparam Payload
   *         See the 1-arg constructor.
   * @param new_payload
   *        New value.
   * @return `*this`.
   */
  template<typename Payload>
  Component& operator=(Payload new_payload);

  /**
   * Move assignment; `src_moved` is left unchanged.
   * @param src_moved
   *        Source.
   * @return `*this`.
   */
  Component& operator=(Component&& src_moved);

  /**
   * `true` if and only if no payload is held.
   * @return See above.
   */
  bool empty() const;

  /**
   * The payload, converted back to its `enum` type.  Requires `!empty()` and `Payload` matching payload_type().
   *
   * @tparam Payload
   *         The component `enum` type.
   * @return See above.
   */
  template<typename Payload>
  Payload payload() const;

  /**
   * `typeid` of the payload `enum`.  Requires `!empty()`.
   * @return See above.
   */
  const std::type_info& payload_type() const;

  /**
   * payload_type() wrapped for use as an associative-container key.
   * @return See above.
   */
  std::type_index payload_type_index() const;

  /**
   * The payload as its raw integer.  Requires `!empty()`.
   * @return See above.
   */
  enum_raw_t payload_enum_raw_value() const;

private:
  // Data.

  /// `&typeid(Payload)`; or null if and only if empty().
  const std::type_info* m_payload_type_or_null;

  /// The payload's integer value; undefined if empty().
  enum_raw_t m_payload_enum_raw_value;
}; // class Component

/**
 * Everything a log call site records about a message other than the message text: component, severity, source
 * location, time stamp and thread.  An aggregate, brace-initialized by SIFT_LOG_DO_LOG().
 */
struct Msg_metadata
{
  // Types.

  /// Time stamp type.
  using Time_stamp = std::chrono::system_clock::time_point;

  // Data.

  /// Component given by the Log_context or SIFT_LOG_SET_CONTEXT() in effect at the call site.
  Component m_msg_component;

  /// Severity; normally implied by which `SIFT_LOG_*()` macro was used.
  Sev m_msg_sev;

  /// Base name of the source file (`__FILE__` with directories stripped at compile time).
  util::String_view m_msg_src_file;

  /// `__LINE__` of the call site.
  unsigned int m_msg_src_line;

  /// `__FUNCTION__` of the call site.
  util::String_view m_msg_src_function;

  /// When the call site was reached.
  Time_stamp m_called_when;

  /// The calling thread.
  boost::thread::id m_call_thread_id;
}; // struct Msg_metadata

/**
 * Destination for log messages.  A Logger is handed by pointer to each logging object (Sift's containers, the
 * user's own Log_context subclasses), which then log into it through the `SIFT_LOG_*()` macros.  A null
 * `Logger*` disables logging for that object altogether.
 *
 * Implementations must allow concurrent calls to both should_log() and do_log() from any thread.  The Sift
 * implementations serialize do_log() with a mutex; should_log() reads Config's atomic verbosities lock-free.
 */
class Logger :
  public util::Null_interface,
  private boost::noncopyable
{
public:
  // Methods.

  /**
   * Decides whether a message of the given severity and component would be logged.  Call sites call this before
   * formatting the message, so a `false` here costs almost nothing.
   *
   * @param sev
   *        Message severity.
   * @param component
   *        Message component; may be empty().
   * @return `true` to log.
   */
  virtual bool should_log(Sev sev, const Component& component) const = 0;

  /**
   * `true` if do_log() may return before the message has been written out.  All Sift loggers return `false`.
   *
   * @return See above.
   */
  virtual bool logs_asynchronously() const = 0;

  /**
   * Writes out one message.  Does not re-check should_log().  Neither `*metadata` nor `msg` may be referenced
   * after return.
   *
   * @param metadata
   *        Call-site metadata.
   * @param msg
   *        Message text, without trailing newline.
   */
  virtual void do_log(Msg_metadata* metadata, util::String_view msg) = 0;
}; // class Logger

/**
 * Holds a `Logger*` and a Component and exposes them as get_logger() and get_log_component(), the two names the
 * `SIFT_LOG_*()` macros look up.  Derive from it (publicly or privately) to log from member functions.
 *
 * Copyable and movable; a moved-from Log_context has a null Logger and empty Component.
 */
class Log_context
{
public:
  // Constructors/destructor.

  /**
   * Stores `logger` (null allowed) with an empty Component.
   *
   * @param logger
   *        Logger to log into.
   */
  explicit Log_context(Logger* logger = 0);

  /**
   * Stores `logger` with `Component(component_payload)`.
   *
   * @tparam Component_payload
   *         Component `enum` type.
   * @param logger
   *        Logger to log into.
   * @param component_payload
   *        Component value.
   */
  template<typename Component_payload>
  explicit Log_context(Logger* logger, Component_payload component_payload);

  /**
   * Copy constructor.
   * @param src
   *        Source.
   */
  Log_context(const Log_context& src);

  /**
   * Move constructor; `src` becomes as-if default-constructed.
   * @param src
   *        Source.
   */
  Log_context(Log_context&& src);

  // Methods.

  /**
   * Copy assignment.
   * @param src
   *        Source.
   * @return `*this`.
   */
  Log_context& operator=(const Log_context& src);

  /**
   * Move assignment; `src` becomes as-if default-constructed.
   * @param src
   *        Source.
   * @return `*this`.
   */
  Log_context& operator=(Log_context&& src);

  /**
   * Exchanges contents with `other`.
   * @param other
   *        The other object.
   */
  void swap(Log_context& other);

  /**
   * The stored Logger; may be null.
   * @return See above.
   */
  Logger* get_logger() const;

  /**
   * The stored Component.
   * @return See above.
   */
  const Component& get_log_component() const;

private:
  // Data.

  /// See get_logger().
  Logger* m_logger;
  /// See get_log_component().
  Component m_component;
}; // class Log_context

// Template implementations.

template<typename Payload>
Component::Component(Payload payload)
{
  operator=(payload);
}

template<typename Payload>
Payload Component::payload() const
{
  assert(!empty());
  assert(typeid(Payload) == payload_type());

  return static_cast<Payload>(m_payload_enum_raw_value);
}

template<typename Payload>
Component& Component::operator=(Payload new_payload)
{
  static_assert(std::is_enum_v<Payload>, "Payload type must be an enum.");
  static_assert(std::is_same_v<typename std::underlying_type_t<Payload>, enum_raw_t>,
                "Payload enum underlying type must equal enum_raw_t.");

  m_payload_type_or_null = &(typeid(Payload));
  m_payload_enum_raw_value = static_cast<enum_raw_t>(new_payload);
  return *this;
}

template<typename Component_payload>
Log_context::Log_context(Logger* logger, Component_payload component_payload) :
  m_logger(logger),
  m_component(component_payload)
{
  // Nothing.
}

} // namespace sift::log
