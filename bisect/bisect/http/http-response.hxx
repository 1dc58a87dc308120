#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

#include <bisect/http/http-types.hxx>

namespace bisect
{
  template <typename S>
  class basic_http_response
  {
  public:
    using string_type  = S;
    using headers_type = basic_http_headers<string_type>;

    http_status                status = http_status::ok;
    http_version               version;
    string_type                reason;
    headers_type               headers;
    std::optional<string_type> body;

    basic_http_response () = default;

    explicit
    basic_http_response (http_status s)
      : status (s) {}

    std::uint16_t
    status_code () const noexcept
    {
      return static_cast<std::uint16_t> (status);
    }

    bool
    is_success () const noexcept
    {
      return status_code () >= 200 && status_code () < 300;
    }

    bool
    is_redirection () const noexcept
    {
      return status_code () >= 300 && status_code () < 400;
    }

    bool
    is_error () const noexcept
    {
      return status_code () >= 400;
    }

    std::optional<string_type>
    location () const
    {
      return headers.get (string_type ("Location"));
    }

    std::optional<std::uint64_t>
    content_length () const;
  };

  using http_response = basic_http_response<std::string>;
}

#include <bisect/http/http-response.ixx>
