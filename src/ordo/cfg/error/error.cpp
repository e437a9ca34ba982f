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
#include "ordo/cfg/error/error.hpp"
#include "ordo/util/util.hpp"
#include <cassert>

namespace ordo::cfg::error
{

// Types.

/**
 * The boost.system category for errors returned by the ordo::cfg module.  Analogous to
 * `boost::asio::error::get_ssl_category()`.
 */
class Category :
  public boost::system::error_category
{
public:
  // Constants.

  /// The one Category.
  static const Category S_CATEGORY;

  // Methods.

  /**
   * Analogous to boost.system's categories' `name()`.
   *
   * @return See above.
   */
  const char* name() const noexcept override;

  /**
   * Analogous to boost.system's categories' `message()`.
   *
   * @param val
   *        Error code value, which must be one of Code's values.
   * @return See above.
   */
  std::string message(int val) const override;

private:
  // Constructors.

  /// Boring constructor.
  explicit Category();
}; // class Category

// Static initializations.

const Category Category::S_CATEGORY;

// Implementations.

Error_code make_error_code(Code err_code)
{
  return Error_code{static_cast<int>(err_code), Category::S_CATEGORY};
}

Category::Category() = default;

const char* Category::name() const noexcept // Virtual.
{
  return "ordo/cfg";
}

std::string Category::message(int val) const // Virtual.
{
  // KEEP THESE STRINGS IN SYNC WITH COMMENT IN error.hpp ON THE INDIVIDUAL ENUM MEMBERS!
  switch (static_cast<Code>(val))
  {
  case Code::S_OPTION_PARSE_FAILED:
    return "Config text could not be parsed into options (syntax error, unknown option or malformed value).";
  case Code::S_UNKNOWN_BACKEND:
    return "Backend option does not name a known container backend.";
  case Code::S_INVALID_CAPACITY:
    return "LRU cache capacity must be at least 1.";
  case Code::S_INVALID_BUCKET_COUNT:
    return util::ostream_op_string("Initial bucket count must not exceed [", size_t(1) << 32, "].");
  }
  assert(false);
  return "";
} // Category::message()

} // namespace ordo::cfg::error
