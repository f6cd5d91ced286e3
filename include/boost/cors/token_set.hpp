//
// Copyright (c) 2026 The boost_cors authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_CORS_TOKEN_SET_HPP
#define BOOST_CORS_TOKEN_SET_HPP

#include <boost/cors/detail/config.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/url/grammar/ci_string.hpp>
#include <cstddef>
#include <initializer_list>
#include <string>
#include <unordered_set>
#include <vector>

namespace boost {
namespace cors {

/** An ordered set of case-insensitive tokens.

    Methods and header names are looked up ignoring
    ASCII case, while iteration and @ref join yield
    the spelling first inserted, in insertion order.
*/
class token_set
{
    std::vector<std::string> items_;
    std::unordered_set<
        std::string,
        urls::grammar::ci_hash,
        urls::grammar::ci_equal> keys_;

public:
    using const_iterator =
        std::vector<std::string>::const_iterator;

    token_set() = default;

    /** Constructor

        Duplicates are dropped.
    */
    BOOST_CORS_DECL
    token_set(std::initializer_list<
        core::string_view> init);

    /** Insert a token.

        @return `true` if the token was inserted,
        `false` if an equivalent token was present.
    */
    BOOST_CORS_DECL
    bool
    insert(core::string_view s);

    /** Return true if an equivalent token is present.
    */
    BOOST_CORS_DECL
    bool
    contains(core::string_view s) const;

    /** Return the stored spelling of an equivalent token.

        @return The stored token, or an empty string
        if no equivalent token is present.
    */
    BOOST_CORS_DECL
    core::string_view
    find(core::string_view s) const;

    /** Return the tokens joined by a separator.
    */
    BOOST_CORS_DECL
    std::string
    join(core::string_view sep = ", ") const;

    bool
    empty() const noexcept
    {
        return items_.empty();
    }

    std::size_t
    size() const noexcept
    {
        return items_.size();
    }

    const_iterator
    begin() const noexcept
    {
        return items_.begin();
    }

    const_iterator
    end() const noexcept
    {
        return items_.end();
    }
};

//------------------------------------------------

/** Return true if `s` is an RFC 7230 token.

    @code
    token = 1*tchar
    tchar = "!" / "#" / "$" / "%" / "&" / "'" / "*"
          / "+" / "-" / "." / "^" / "_" / "`" / "|" / "~"
          / DIGIT / ALPHA
    @endcode
*/
BOOST_CORS_DECL
bool
is_token(core::string_view s) noexcept;

/** Split a comma-separated list.

    Each element is trimmed of surrounding spaces
    and tabs. Empty elements are dropped.

    @par Example
    @code
    split_list( " X-A ,, x-b" ); // { "X-A", "x-b" }
    @endcode
*/
BOOST_CORS_DECL
std::vector<std::string>
split_list(core::string_view s);

/** Return a Vary value with a field name merged in.

    The name is appended unless it is already listed,
    compared case-insensitively, or the value is `*`.
    Existing elements are kept in order, without
    duplicates.

    @param value The current Vary value, possibly empty.

    @param name The field name to add.
*/
BOOST_CORS_DECL
std::string
merge_vary(
    core::string_view value,
    core::string_view name);

} // cors
} // boost

#endif
