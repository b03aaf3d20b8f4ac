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

#include "sift/test/test_config.hpp"
#include "sift/log/buffer_logger.hpp"
#include "sift/log/config.hpp"
#include "sift/common.hpp"

namespace sift::test
{

/**
 * Logger used for testing purposes: Sift's own components registered (with prefix "sift-"); output is captured
 * in memory, so tests can both exercise the log call sites and check what they printed.
 */
class Test_logger :
  public log::Logger
{
public:
  /**
   * Constructor.
   *
   * @param min_severity Lowest severity that will pass through logging filter.
   */
  Test_logger(log::Sev min_severity = Test_config::get_singleton().m_sev) :
    m_config(min_severity),
    m_logger(&m_config)
  {
    // Formally fine to do this after the Logger took the m_config ptr already.
    m_config.init_component_to_union_idx_mapping<Sift_log_component>
      (100, log::Config::standard_component_payload_enum_sparse_length<Sift_log_component>());
    m_config.init_component_names<Sift_log_component>(S_SIFT_LOG_COMPONENT_NAME_MAP, false, "sift-");
  }

  /**
   * Returns the logging configuration.
   *
   * @return See above.
   */
  log::Config& get_config()
  {
    return *m_logger.m_config;
  }

  /**
   * Returns a copy of everything logged so far.
   *
   * @return See above.
   */
  std::string output() const
  {
    return m_logger.buffer_str_copy();
  }

  /// Forwards to the real Logger.
  bool should_log(log::Sev sev, const log::Component& component) const override
  {
    return m_logger.should_log(sev, component);
  }

  /// Forwards to the real Logger.
  bool logs_asynchronously() const override
  {
    return m_logger.logs_asynchronously();
  }

  /// Forwards to the real Logger.
  void do_log(log::Msg_metadata* metadata, util::String_view msg) override
  {
    m_logger.do_log(metadata, msg);
  }

private:
  /// Logging configuration.
  log::Config m_config;

  /// The real logger.
  log::Buffer_logger m_logger;
}; // class Test_logger

} // namespace sift::test
