//
// Copyright (c) 2026 The boost_cors authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/cors/origin_matcher.hpp>

namespace boost {
namespace cors {

bool
origin_matcher::
matches(origin const& o) const
{
    switch(rule_->get_kind())
    {
    case allowed_origins::kind::any:
        return ! o.is_null() || rule_->allow_null();

    case allowed_origins::kind::exact:
        return rule_->origins().count(o) != 0;

    case allowed_origins::kind::predicate:
        return rule_->predicate()(o);
    }
    return false;
}

bool
origin_matcher::
matches(core::string_view value) const
{
    auto rv = origin::parse_allow_null(value);
    if(! rv)
        return rule_->get_kind() ==
            allowed_origins::kind::any;
    return matches(*rv);
}

} // cors
} // boost
