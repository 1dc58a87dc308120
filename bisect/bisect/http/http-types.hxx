#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace bisect
{
  // We only ever read from the update service, so the verbs are limited to
  // what a read-only client needs.
  //
  enum class http_method
  {
    get,
    head
  };

  std::string
  to_string (http_method);

  inline std::ostream&
  operator<< (std::ostream& o, http_method m)
  {
    return o << to_string (m);
  }

  // Status codes we act upon. Anything else is carried through as its
  // numeric value.
  //
  enum class http_status: std::uint16_t
  {
    ok                    = 200,
    partial_content       = 206,
    moved_permanently     = 301,
    found                 = 302,
    see_other             = 303,
    temporary_redirect    = 307,
    permanent_redirect    = 308,
    bad_request           = 400,
    forbidden             = 403,
    not_found             = 404,
    too_many_requests     = 429,
    internal_server_error = 500,
    service_unavailable   = 503
  };

  inline std::ostream&
  operator<< (std::ostream& o, http_status s)
  {
    return o << static_cast<std::uint16_t> (s);
  }

  // Header field.
  //
  template <typename S>
  struct basic_http_field
  {
    using string_type = S;

    string_type name;
    string_type value;

    basic_http_field () = default;

    basic_http_field (string_type n, string_type v)
      : name (std::move (n)), value (std::move (v)) {}
  };

  // Header collection with case-insensitive lookup.
  //
  template <typename S>
  struct basic_http_headers
  {
    using string_type = S;
    using field_type  = basic_http_field<string_type>;
    using fields_type = std::vector<field_type>;

    fields_type fields;

    // Replace any existing field with the same name.
    //
    void
    set (string_type name, string_type value);

    // Append, allowing duplicates.
    //
    void
    add (string_type name, string_type value);

    // First value of the named field, if any.
    //
    std::optional<string_type>
    get (const string_type& name) const;

    bool
    contains (const string_type& name) const
    {
      return get (name).has_value ();
    }

    void
    remove (const string_type& name);

    bool
    empty () const noexcept
    {
      return fields.empty ();
    }

    using const_iterator = typename fields_type::const_iterator;

    const_iterator begin () const noexcept { return fields.begin (); }
    const_iterator end ()   const noexcept { return fields.end (); }
  };

  using http_field   = basic_http_field<std::string>;
  using http_headers = basic_http_headers<std::string>;

  struct http_version
  {
    std::uint8_t major;
    std::uint8_t minor;

    http_version (std::uint8_t maj = 1, std::uint8_t min = 1)
      : major (maj), minor (min) {}

    std::string
    string () const;
  };

  inline std::ostream&
  operator<< (std::ostream& o, const http_version& v)
  {
    return o << v.string ();
  }
}

#include <bisect/http/http-types.ixx>
