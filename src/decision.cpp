//
// Copyright (c) 2026 The boost_cors authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/cors/decision.hpp>
#include <boost/cors/token_set.hpp>
#include <string>

namespace boost {
namespace cors {

namespace {

// Collapse every Vary field into one,
// merging in the given names.
void
merge_vary_field(
    http::fields& res,
    core::string_view names)
{
    std::string value;
    auto const range = res.equal_range(
        http::field::vary);
    for(auto it = range.first; it != range.second; ++it)
    {
        if(! value.empty())
            value += ", ";
        value.append(
            it->value().data(),
            it->value().size());
    }
    for(auto const& name : split_list(names))
        value = merge_vary(value, name);
    res.set(http::field::vary, value);
}

} // (anon)

void
apply(
    cors_decision const& d,
    http::fields& res)
{
    if(! d.authorized())
        return;
    for(auto const& f : d.headers)
    {
        core::string_view const v(
            f.value().data(),
            f.value().size());
        if(f.name() == http::field::vary)
            merge_vary_field(res, v);
        else
            res.set(f.name(), v);
    }
}

} // cors
} // boost
