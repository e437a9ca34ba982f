/* Ordo
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
#include "ordo/common.hpp"

namespace ordo
{

// Static initializers.

// Keep in sync with `enum class Ordo_log_component` members.
const boost::unordered_multimap<Ordo_log_component, std::string> S_ORDO_LOG_COMPONENT_NAME_MAP
  ({ { Ordo_log_component::S_UNCAT, "UNCAT" },
     { Ordo_log_component::S_LOG, "LOG" },
     { Ordo_log_component::S_COL, "COL" },
     { Ordo_log_component::S_CFG, "CFG" } });

} // namespace ordo
