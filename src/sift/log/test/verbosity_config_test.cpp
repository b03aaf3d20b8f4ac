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
#include "sift/log/verbosity_config.hpp"
#include "sift/log/config.hpp"
#include "sift/log/error/error.hpp"
#include "sift/error/error.hpp"
#include "sift/util/util.hpp"
#include <gtest/gtest.h>
#include <sstream>

namespace sift::log::test
{

namespace
{
using std::string;

Verbosity_config parsed(const string& text)
{
  Verbosity_config cfg;
  std::istringstream is(text);
  EXPECT_TRUE(cfg.parse(is)) << "Parsing [" << text << "]: " << cfg.last_result_message();
  return cfg;
}

bool parses(const string& text)
{
  Verbosity_config cfg;
  std::istringstream is(text);
  return cfg.parse(is);
}

} // Anonymous namespace

TEST(Verbosity_config, Parse_and_print)
{
  EXPECT_EQ(util::ostream_op_string(Verbosity_config()), "ALL:INFO");
  EXPECT_EQ(util::ostream_op_string(parsed("WARNING")), "ALL:WARNING");
  EXPECT_EQ(util::ostream_op_string(parsed("")), "ALL:INFO");
  EXPECT_EQ(util::ostream_op_string(parsed("sift-coll:trace")), "ALL:INFO;SIFT-COLL:TRACE");
  EXPECT_EQ(util::ostream_op_string(parsed("all:debug;Sift-Coll:2;ALL:data")), "ALL:DEBUG;SIFT-COLL:ERROR;ALL:DATA");
  EXPECT_EQ(util::ostream_op_string(parsed(":none")), "ALL:NONE");

  // Reading stops at a space.
  std::istringstream is("ALL:FATAL rest");
  Verbosity_config cfg;
  EXPECT_TRUE(cfg.parse(is));
  EXPECT_EQ(util::ostream_op_string(cfg), "ALL:FATAL");
  string rest;
  is >> rest;
  EXPECT_EQ(rest, "rest");

  // Round trip through the stream operators.
  Verbosity_config cfg2;
  std::istringstream is2(util::ostream_op_string(parsed("INFO;SIFT-UTIL:WARNING")));
  is2 >> cfg2;
  EXPECT_EQ(cfg2, parsed("INFO;SIFT-UTIL:WARNING"));
  EXPECT_NE(cfg2, parsed("INFO;SIFT-UTIL:ERROR"));
} // TEST(Verbosity_config, Parse_and_print)

TEST(Verbosity_config, Malformed)
{
  EXPECT_FALSE(parses("INFO;;WARNING"));
  EXPECT_FALSE(parses("a:b:c"));
  EXPECT_FALSE(parses("ALL:WARNING,INFO"));
  EXPECT_FALSE(parses("ALL:LOUD"));
  EXPECT_FALSE(parses("SIFT-COLL:"));
  EXPECT_FALSE(parses("9"));

  // Failure leaves the prior state alone and explains itself.
  auto cfg = parsed("SIFT-COLL:TRACE");
  std::istringstream is("ALL:LOUD");
  EXPECT_FALSE(cfg.parse(is));
  EXPECT_FALSE(cfg.last_result_message().empty());
  EXPECT_EQ(util::ostream_op_string(cfg), "ALL:INFO;SIFT-COLL:TRACE");
}

TEST(Verbosity_config, Apply)
{
  Config cfg(Sev::S_DATA);
  cfg.init_component_to_union_idx_mapping<Sift_log_component>
    (0, Config::standard_component_payload_enum_sparse_length<Sift_log_component>());
  cfg.init_component_names<Sift_log_component>(S_SIFT_LOG_COMPONENT_NAME_MAP, false, "sift-");
  const Component coll(Sift_log_component::S_COLL);
  const Component util_comp(Sift_log_component::S_UTIL);

  auto v_cfg = parsed("WARNING;SIFT-COLL:TRACE");
  EXPECT_TRUE(v_cfg.apply_to_config(&cfg));
  EXPECT_TRUE(v_cfg.last_result_message().empty());
  EXPECT_TRUE(cfg.output_whether_should_log(Sev::S_TRACE, coll));
  EXPECT_FALSE(cfg.output_whether_should_log(Sev::S_INFO, util_comp));
  EXPECT_TRUE(cfg.output_whether_should_log(Sev::S_WARNING, Component()));

  // Applying again resets per-component settings made earlier.
  EXPECT_TRUE(parsed("ERROR").apply_to_config(&cfg));
  EXPECT_FALSE(cfg.output_whether_should_log(Sev::S_WARNING, coll));

  auto bad = parsed("INFO;SIFT-NOPE:TRACE");
  EXPECT_FALSE(bad.apply_to_config(&cfg));
  EXPECT_NE(bad.last_result_message().find("SIFT-NOPE"), string::npos);
} // TEST(Verbosity_config, Apply)

TEST(Verbosity_config, Parse_and_apply_error_reporting)
{
  Config cfg;
  cfg.init_component_to_union_idx_mapping<Sift_log_component>
    (0, Config::standard_component_payload_enum_sparse_length<Sift_log_component>());
  cfg.init_component_names<Sift_log_component>(S_SIFT_LOG_COMPONENT_NAME_MAP, false, "sift-");

  Verbosity_config v_cfg;
  Error_code err_code;

  EXPECT_TRUE(v_cfg.parse_and_apply("SIFT-COLL:DATA", &cfg, &err_code));
  EXPECT_FALSE(err_code);
  EXPECT_TRUE(cfg.output_whether_should_log(Sev::S_DATA, Component(Sift_log_component::S_COLL)));

  EXPECT_FALSE(v_cfg.parse_and_apply("SIFT-COLL:??", &cfg, &err_code));
  EXPECT_EQ(err_code, error::Code::S_VERBOSITY_CONFIG_MALFORMED);
  EXPECT_EQ(err_code.category().name(), string("sift_log"));
  EXPECT_FALSE(err_code.message().empty());

  EXPECT_FALSE(v_cfg.parse_and_apply("SIFT-MISSING:DATA", &cfg, &err_code));
  EXPECT_EQ(err_code, error::Code::S_VERBOSITY_CONFIG_UNKNOWN_COMPONENT);

  // Null err_code: the error is thrown instead.
  try
  {
    v_cfg.parse_and_apply("ALL:LOUD", &cfg);
    ADD_FAILURE() << "Should have thrown.";
  }
  catch (const sift::error::Runtime_error& exc)
  {
    EXPECT_EQ(exc.code(), error::Code::S_VERBOSITY_CONFIG_MALFORMED);
    EXPECT_NE(string(exc.what()).find("parse_and_apply"), string::npos) << exc.what();
  }

  EXPECT_NO_THROW(v_cfg.parse_and_apply("ALL:INFO", &cfg));
} // TEST(Verbosity_config, Parse_and_apply_error_reporting)

} // namespace sift::log::test
