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
#include "ordo/col/col_fwd.hpp"
#include "ordo/util/util.hpp"

namespace ordo::col
{

// Implementations.

std::ostream& operator<<(std::ostream& os, Backend val)
{
  // Note: Must satisfy istream_to_enum() requirements.
  switch (val)
  {
    case Backend::S_HASH: return os << "HASH";
    case Backend::S_ARRAY: return os << "ARRAY";
    case Backend::S_LINKED_HASH: return os << "LINKED_HASH";
    case Backend::S_END_SENTINEL: return os << "UNKNOWN";
  }
  return os << "UNKNOWN";
}

std::istream& operator>>(std::istream& is, Backend& val)
{
  val = util::istream_to_enum(&is, Backend::S_END_SENTINEL, Backend::S_END_SENTINEL);
  return is;
}

} // namespace ordo::col
