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

#include <iostream>

namespace sift::log
{

// Types.

// Find doc headers near the bodies of these compound types.

class Verbosity_config;

// Free functions.

/**
 * Calls `val.parse(is)`; check `val.last_result_message()` for the outcome.
 *
 * @relatesalso Verbosity_config
 *
 * @param is
 *        Source stream.
 * @param val
 *        Value to set.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Verbosity_config& val);

/**
 * Serializes a Verbosity_config to a standard output stream.  The output is in the same format parse() accepts,
 * with the catch-all pair first, named "ALL"; e.g., "ALL:INFO;SIFT-COLL:TRACE".
 *
 * @relatesalso Verbosity_config
 *
 * @param os
 *        Target stream.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Verbosity_config& val);

/**
 * Returns `true` if and only if `val1` and `val2` would produce the same Config when applied to it.
 * Formally: `val1.component_sev_pairs() == val2.component_sev_pairs()`.
 *
 * @relatesalso Verbosity_config
 *
 * @param val1
 *        Object to compare.
 * @param val2
 *        Object to compare.
 * @return See above.
 */
bool operator==(const Verbosity_config& val1, const Verbosity_config& val2);

/**
 * Negation of `==`.
 *
 * @relatesalso Verbosity_config
 *
 * @param val1
 *        Object to compare.
 * @param val2
 *        Object to compare.
 * @return See above.
 */
bool operator!=(const Verbosity_config& val1, const Verbosity_config& val2);

} // namespace sift::log
