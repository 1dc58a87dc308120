#pragma once

#include <string>
#include <utility>

#include <bisect/http/http-types.hxx>

namespace bisect
{
  template <typename S>
  class basic_http_request
  {
  public:
    using string_type  = S;
    using headers_type = basic_http_headers<string_type>;

    http_method  method = http_method::get;
    string_type  url;
    http_version version;
    headers_type headers;

    basic_http_request () = default;

    basic_http_request (http_method m,
                        string_type u,
                        http_version v = http_version (1, 1))
      : method (m), url (std::move (u)), version (v) {}

    // Path and query part of the URL.
    //
    string_type
    target () const;

    // Host part of the URL, without the port.
    //
    string_type
    host () const;

    void
    set_header (string_type name, string_type value)
    {
      headers.set (std::move (name), std::move (value));
    }

    bool
    has_header (const string_type& name) const
    {
      return headers.contains (name);
    }

    // Fill in the headers every request must carry.
    //
    void
    normalize ();
  };

  using http_request = basic_http_request<std::string>;
}

#include <bisect/http/http-request.ixx>
