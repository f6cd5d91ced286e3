//
// Copyright (c) 2026 The boost_cors authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/cors/origin.hpp>
#include <boost/cors/error.hpp>
#include <boost/container_hash/hash.hpp>
#include <boost/url/grammar/ci_string.hpp>
#include <boost/url/parse.hpp>
#include <boost/url/scheme.hpp>
#include <boost/url/url_view.hpp>

namespace boost {
namespace cors {

namespace {

std::string
to_lower(core::string_view s)
{
    std::string r(s.data(), s.size());
    for(auto& c : r)
        c = urls::grammar::to_lower(c);
    return r;
}

// A port of all zeros is the only
// valid port which reads as zero.
bool
is_zero_port(core::string_view s) noexcept
{
    for(char c : s)
        if(c != '0')
            return false;
    return true;
}

} // (anon)

system::result<origin>
origin::
parse(core::string_view s)
{
    auto rv = urls::parse_uri(s);
    if(! rv)
        return error::invalid_origin;
    urls::url_view const& u = *rv;

    if( ! u.has_authority() ||
        u.host_type() == urls::host_type::none ||
        u.encoded_host().empty())
        return error::missing_host;

    std::uint16_t port = 0;
    if( u.has_port() && ! u.port().empty())
    {
        port = u.port_number();
        if( port == 0 && ! is_zero_port(u.port()))
            return error::invalid_port;
    }
    else
    {
        port = urls::default_port(u.scheme_id());
        if(port == 0)
            return error::unsupported_scheme;
    }

    origin o;
    o.scheme_ = to_lower(u.scheme());
    o.host_ = to_lower(u.encoded_host());
    o.port_ = port;
    o.null_ = false;
    return o;
}

system::result<origin>
origin::
parse_allow_null(core::string_view s)
{
    if(s == "null")
        return origin();
    return parse(s);
}

std::string
origin::
serialize() const
{
    if(null_)
        return "null";
    std::string s;
    s.reserve(scheme_.size() + host_.size() + 9);
    s.append(scheme_);
    s.append("://");
    s.append(host_);
    if(port_ != urls::default_port(
        urls::string_to_scheme(scheme_)))
    {
        s.push_back(':');
        s.append(std::to_string(port_));
    }
    return s;
}

std::size_t
hash_value(origin const& o) noexcept
{
    if(o.null_)
        return 0;
    std::size_t seed = 0;
    boost::hash_combine(seed, o.scheme_);
    boost::hash_combine(seed, o.host_);
    boost::hash_combine(seed, o.port_);
    return seed;
}

} // cors
} // boost
