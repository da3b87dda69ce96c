//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#include <boost/dispatch/server/endpoint.hpp>
#include <boost/dispatch/error.hpp>
#include <boost/dispatch/detail/except.hpp>
#include <boost/dispatch/detail/write_json.hpp>
#include <boost/system/errc.hpp>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace boost {
namespace dispatch {

endpoint::
~endpoint() = default;

std::optional<content_type>
endpoint::
request_content_type() const
{
    return get_content_type(*req_);
}

void
endpoint::
add_header(
    core::string_view name,
    core::string_view value,
    std::initializer_list<std::pair<
        core::string_view, core::string_view>> params)
{
    std::string v(value);
    for(auto const& p : params)
    {
        v.append("; ");
        v.append(p.first);
        v.push_back('=');
        v.append(p.second);
    }
    res_.headers().append(name, v);
}

void
endpoint::
add_content_type(content_type const& ct)
{
    res_.headers().set("Content-Type", ct.to_string());
}

void
endpoint::
begin_response()
{
    if(responded_)
        detail::throw_system_error(
            BOOST_DISPATCH_ERR(error::double_response));
    responded_ = true;
}

void
endpoint::
send_only_status(unsigned status)
{
    begin_response();
    res_.set_status(status);
}

void
endpoint::
send_body(
    std::string body,
    std::optional<content_type> ct,
    unsigned status)
{
    begin_response();
    res_.set_status(status);
    if(ct)
        add_content_type(*ct);
    res_.headers().set("Content-Length",
        std::to_string(body.size()));
    res_.append_body(std::move(body));
}

void
endpoint::
send_chunks(
    std::vector<std::string> chunks,
    std::optional<content_type> ct,
    unsigned status)
{
    begin_response();
    res_.set_status(status);
    if(ct)
        add_content_type(*ct);
    std::size_t n = 0;
    for(auto const& c : chunks)
        n += c.size();
    res_.headers().set("Content-Length",
        std::to_string(n));
    for(auto& c : chunks)
        res_.append_body(std::move(c));
}

void
endpoint::
send_file(
    core::string_view path,
    std::optional<std::string> fname,
    std::optional<content_type> ct,
    unsigned status)
{
    std::error_code ec;
    std::filesystem::path p(path.begin(), path.end());
    auto const st = std::filesystem::status(p, ec);
    if(ec)
        detail::throw_system_error(
            system::error_code(ec), "send_file");
    if(! std::filesystem::is_regular_file(st))
        detail::throw_system_error(
            system::errc::make_error_code(
                system::errc::no_such_file_or_directory),
            "send_file");

    std::ifstream f(p, std::ios::binary);
    if(! f)
        detail::throw_system_error(
            system::errc::make_error_code(
                system::errc::permission_denied),
            "send_file");

    std::vector<std::string> chunks;
    constexpr std::size_t chunk_size = 64 * 1024;
    for(;;)
    {
        std::string buf(chunk_size, '\0');
        f.read(buf.data(), buf.size());
        auto const n = static_cast<std::size_t>(f.gcount());
        if(n > 0)
        {
            buf.resize(n);
            chunks.push_back(std::move(buf));
        }
        if(f.eof())
            break;
        if(! f)
            detail::throw_system_error(
                system::errc::make_error_code(
                    system::errc::io_error),
                "send_file");
    }

    send_chunks(std::move(chunks), std::move(ct), status);
    if(fname)
        add_header("Content-Disposition", "attachment",
            {{ "filename", *fname }});
}

void
endpoint::
send_json(
    json::value const& jv,
    unsigned status)
{
    send_body(detail::write_json(jv),
        content_type{ std::string(media_types::json), "UTF-8", {} },
        status);
}

void
endpoint::
send_err(error_info const& e)
{
    begin_response();
    // headers added for a successful answer do not apply
    res_ = e.to_response();
}

content_type
endpoint::
plain_text()
{
    return { std::string(media_types::plain), "UTF-8", {} };
}

} // dispatch
} // boost
