//
// Copyright (c) 2026 The boost_cors authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/cors/classify.hpp>
#include <boost/cors/token_set.hpp>

namespace boost {
namespace cors {

classified_request
classify(
    core::string_view method,
    http::fields const& fields)
{
    classified_request cr;

    auto const it = fields.find(
        http::field::origin);
    if(it == fields.end())
        return cr;
    cr.origin.assign(
        it->value().data(),
        it->value().size());

    auto const rm = fields.find(
        http::field::access_control_request_method);
    if( method != "OPTIONS" ||
        rm == fields.end())
    {
        cr.kind = request_kind::actual;
        return cr;
    }

    cr.kind = request_kind::preflight;
    cr.requested_method.assign(
        rm->value().data(),
        rm->value().size());

    token_set seen;
    auto const range = fields.equal_range(
        http::field::access_control_request_headers);
    for(auto i = range.first; i != range.second; ++i)
    {
        for(auto& s : split_list(
            core::string_view(
                i->value().data(),
                i->value().size())))
        {
            if(seen.insert(s))
                cr.requested_headers.push_back(
                    std::move(s));
        }
    }
    return cr;
}

classified_request
classify(
    http::request_header<> const& req)
{
    auto const m = req.method_string();
    return classify(
        core::string_view(m.data(), m.size()),
        req);
}

} // cors
} // boost
