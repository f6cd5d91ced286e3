//
// Copyright (c) 2026 The boost_cors authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/cors/policy.hpp>
#include <boost/cors/error.hpp>
#include <boost/cors/detail/except.hpp>
#include <boost/url/grammar/ci_string.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <utility>

namespace boost {
namespace cors {

allowed_origins
allowed_origins::
any(
    any_origin_mode mode,
    bool allow_null)
{
    allowed_origins r;
    r.kind_ = kind::any;
    r.mode_ = mode;
    r.allow_null_ = allow_null;
    return r;
}

allowed_origins
allowed_origins::
exact(std::initializer_list<
    core::string_view> origins)
{
    std::vector<origin> v;
    v.reserve(origins.size());
    for(auto s : origins)
    {
        auto rv = origin::parse_allow_null(s);
        if(! rv)
            detail::throw_system_error(rv.error());
        v.push_back(std::move(*rv));
    }
    return exact(std::move(v));
}

allowed_origins
allowed_origins::
exact(std::vector<std::string> const& origins)
{
    std::vector<origin> v;
    v.reserve(origins.size());
    for(auto const& s : origins)
    {
        auto rv = origin::parse_allow_null(s);
        if(! rv)
            detail::throw_system_error(rv.error());
        v.push_back(std::move(*rv));
    }
    return exact(std::move(v));
}

allowed_origins
allowed_origins::
exact(std::vector<origin> origins)
{
    allowed_origins r;
    r.kind_ = kind::exact;
    r.allow_null_ = false;
    for(auto& o : origins)
    {
        if(o.is_null())
            r.allow_null_ = true;
        r.set_.insert(std::move(o));
    }
    return r;
}

allowed_origins
allowed_origins::
matching(predicate_type pred)
{
    if(! pred)
        detail::throw_invalid_argument();
    allowed_origins r;
    r.kind_ = kind::predicate;
    r.pred_ = std::move(pred);
    return r;
}

//------------------------------------------------

namespace {

std::string
to_upper(core::string_view s)
{
    std::string r(s.data(), s.size());
    for(auto& c : r)
        c = urls::grammar::to_upper(c);
    return r;
}

void
check_header_names(
    std::vector<std::string> const& v)
{
    for(auto const& s : v)
    {
        if(! is_token(s))
            detail::throw_system_error(
                error::invalid_header_name);
    }
}

bool
has_wildcard(
    std::vector<std::string> const& v)
{
    return std::find(v.begin(), v.end(), "*") != v.end();
}

} // (anon)

policy::
policy(cors_options opts)
    : origins_(std::move(opts.origins))
    , max_age_(opts.max_age)
    , preflight_status_(opts.preflight_status)
    , rejection_status_(opts.rejection_status)
    , any_header_(opts.allow_any_header)
    , credentials_(opts.credentials)
{
    for(auto const& m : opts.methods)
    {
        if(! is_token(m))
            detail::throw_system_error(
                error::invalid_method);
        methods_.insert(to_upper(m));
    }

    check_header_names(opts.headers);
    check_header_names(opts.exposed_headers);

    if(max_age_.count() < 0)
        detail::throw_system_error(
            error::invalid_max_age);

    // credentials forbid every literal "*"
    wildcard_header_ = has_wildcard(opts.headers);
    if(credentials_ && (
        wildcard_header_ ||
        has_wildcard(opts.exposed_headers) ||
        ( origins_.get_kind() == allowed_origins::kind::any &&
          origins_.mode() == any_origin_mode::wildcard)))
        detail::throw_system_error(
            error::credentials_with_wildcard);

    for(auto const& h : opts.headers)
        headers_.insert(h);
    for(auto const& h : opts.exposed_headers)
        exposed_.insert(h);

    methods_value_ = methods_.join();
    headers_value_ = wildcard_header_ ?
        std::string("*") : headers_.join();
    exposed_value_ = exposed_.join();

    SPDLOG_DEBUG(
        "cors policy: methods '{}', headers '{}', exposed '{}', credentials {}, max-age {}",
        methods_value_, headers_value_, exposed_value_,
        credentials_, max_age_.count());
}

cors_options
policy::
permissive()
{
    cors_options opts;
    opts.origins = allowed_origins::any();
    opts.methods = {
        "OPTIONS", "GET", "POST", "PUT", "DELETE",
        "HEAD", "TRACE", "CONNECT", "PATCH" };
    opts.allow_any_header = true;
    opts.max_age = std::chrono::hours(1);
    opts.credentials = false;
    return opts;
}

bool
policy::
echoes_origin() const noexcept
{
    if(origins_.get_kind() != allowed_origins::kind::any)
        return true;
    switch(origins_.mode())
    {
    case any_origin_mode::wildcard:
        return false;
    case any_origin_mode::reflect:
        return true;
    case any_origin_mode::automatic:
    default:
        return credentials_;
    }
}

std::shared_ptr<policy const>
make_policy(cors_options opts)
{
    return std::make_shared<
        policy const>(std::move(opts));
}

} // cors
} // boost
