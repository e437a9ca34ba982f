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
#pragma once

#include "ordo/util/util_fwd.hpp"
#include "ordo/util/detail/util.hpp"
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <cassert>
#include <cctype>
#include <locale>
#include <ostream>
#include <sstream>
#include <type_traits>

namespace ordo::util
{
// Types.

/**
 * An empty interface, consisting of nothing but a default `virtual` destructor, intended as a boiler-plate-reducing
 * base for any other (presumably `virtual`-method-having) class that would otherwise require a default `virtual`
 * destructor.  Publicly derive from it instead of declaring `virtual ~C() = default` by hand.
 *
 * It is particularly useful for interface classes, such as col::Map and col::Set.
 */
class Null_interface
{
public:
  // Destructor.

  /**
   * Boring `virtual` destructor.  It is pure, so Null_interface itself is abstract; any subclass still gets an
   * implicitly generated (and, because of us, `virtual`) destructor without declaring one.
   */
  virtual ~Null_interface() = 0;
};

// Template implementations.

template<typename ...T>
void ostream_op_to_string(std::string* target_str, T const &... ostream_args)
{
  std::ostringstream os;
  feed_args_to_ostream(&os, ostream_args...);
  target_str->append(os.str());
}

template<typename ...T>
std::string ostream_op_string(T const &... ostream_args)
{
  std::string result;
  ostream_op_to_string(&result, ostream_args...);
  return result;
}

template<typename T1, typename ...T_rest>
void feed_args_to_ostream(std::ostream* os, T1 const & ostream_arg1, T_rest const &... remaining_ostream_args)
{
  // Induction step for variadic template.
  feed_args_to_ostream(os, ostream_arg1);
  feed_args_to_ostream(os, remaining_ostream_args...);
}

template<typename T>
void feed_args_to_ostream(std::ostream* os, T const & only_ostream_arg)
{
  // Induction base.
  *os << only_ostream_arg;
}

template<typename Enum>
Enum istream_to_enum(std::istream* is_ptr, Enum enum_default, Enum enum_sentinel,
                     bool accept_num_encoding, bool case_sensitive,
                     Enum enum_lowest)
{
  using boost::lexical_cast;
  using boost::bad_lexical_cast;
  using boost::algorithm::equals;
  using boost::algorithm::is_iequal;
  using std::string;
  using Traits = std::char_traits<char>;
  using enum_t = std::underlying_type_t<Enum>;

  assert(enum_t(enum_lowest) >= 0); // No '-' sign handling below.
  auto& is = *is_ptr;
  const is_iequal i_equal_func(std::locale::classic());

  // Token = everything up to (not including) the first non-alphanumeric/underscore character or stream end.
  string token;
  Traits::int_type ch;
  while (((ch = is.peek()) != Traits::eof()) && (std::isalnum(ch) || (ch == '_')))
  {
    token += Traits::to_char_type(ch);
    is.get();
  }

  Enum val = enum_default;
  if (token.empty())
  {
    return val;
  }
  // else

  if (accept_num_encoding && std::isdigit(static_cast<unsigned char>(token.front())))
  {
    try
    {
      const auto num_enum = lexical_cast<enum_t>(token);
      if ((num_enum < enum_t(enum_sentinel)) && (num_enum >= enum_t(enum_lowest)))
      {
        val = Enum(num_enum);
      }
    }
    catch (const bad_lexical_cast&)
    {
      // Out of range for enum_t: stays enum_default.
    }
    return val;
  }
  // else

  for (auto idx = enum_t(enum_lowest); idx != enum_t(enum_sentinel); ++idx)
  {
    const auto candidate = Enum(idx);
    // lexical_cast<string>(candidate) is what operator<<(ostream&, Enum) prints: the symbolic encoding.
    if (case_sensitive ? equals(token, lexical_cast<string>(candidate))
                       : equals(token, lexical_cast<string>(candidate), i_equal_func))
    {
      val = candidate;
      break;
    }
  }
  return val;
} // istream_to_enum()

} // namespace ordo::util
