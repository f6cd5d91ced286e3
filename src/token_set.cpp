//
// Copyright (c) 2026 The boost_cors authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/cors/token_set.hpp>
#include <boost/url/grammar/alnum_chars.hpp>
#include <boost/url/grammar/charset.hpp>
#include <boost/url/grammar/ci_string.hpp>
#include <boost/url/grammar/lut_chars.hpp>
#include <algorithm>

namespace boost {
namespace cors {

namespace {

// RFC 7230 tchar
constexpr urls::grammar::lut_chars tchars =
    urls::grammar::lut_chars("!#$%&'*+-.^_`|~") +
    urls::grammar::lut_chars(urls::grammar::alnum_chars);

bool
is_ows(char c) noexcept
{
    return c == ' ' || c == '\t';
}

} // (anon)

token_set::
token_set(std::initializer_list<
    core::string_view> init)
{
    for(auto s : init)
        insert(s);
}

bool
token_set::
insert(core::string_view s)
{
    if(! keys_.emplace(s.data(), s.size()).second)
        return false;
    items_.emplace_back(s.data(), s.size());
    return true;
}

bool
token_set::
contains(core::string_view s) const
{
    return keys_.count(
        std::string(s.data(), s.size())) != 0;
}

core::string_view
token_set::
find(core::string_view s) const
{
    if(! contains(s))
        return {};
    auto it = std::find_if(
        items_.begin(), items_.end(),
        [s](std::string const& item)
        {
            return urls::grammar::ci_is_equal(item, s);
        });
    return *it;
}

std::string
token_set::
join(core::string_view sep) const
{
    std::string r;
    for(auto const& item : items_)
    {
        if(! r.empty())
            r.append(sep.data(), sep.size());
        r.append(item);
    }
    return r;
}

//------------------------------------------------

bool
is_token(core::string_view s) noexcept
{
    if(s.empty())
        return false;
    return urls::grammar::find_if_not(
        s.data(), s.data() + s.size(),
        tchars) == s.data() + s.size();
}

std::vector<std::string>
split_list(core::string_view s)
{
    std::vector<std::string> v;
    std::size_t pos = 0;
    while(pos <= s.size())
    {
        auto end = s.find(',', pos);
        if(end == core::string_view::npos)
            end = s.size();
        auto first = pos;
        auto last = end;
        while(first < last && is_ows(s[first]))
            ++first;
        while(last > first && is_ows(s[last - 1]))
            --last;
        if(first < last)
            v.emplace_back(
                s.data() + first, last - first);
        pos = end + 1;
    }
    return v;
}

std::string
merge_vary(
    core::string_view value,
    core::string_view name)
{
    token_set names;
    for(auto const& s : split_list(value))
    {
        // "*" already varies on everything
        if(s == "*")
            return "*";
        names.insert(s);
    }
    names.insert(name);
    return names.join();
}

} // cors
} // boost
