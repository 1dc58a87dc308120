#include <bisect/version.hxx>

namespace bisect
{
  template <typename S>
  inline typename basic_http_request<S>::string_type basic_http_request<S>::
  target () const
  {
    std::size_t p (url.find ("://"));
    p = (p == string_type::npos) ? 0 : p + 3;

    std::size_t b (url.find ('/', p));
    return b == string_type::npos ? string_type ("/") : url.substr (b);
  }

  template <typename S>
  inline typename basic_http_request<S>::string_type basic_http_request<S>::
  host () const
  {
    std::size_t p (url.find ("://"));
    p = (p == string_type::npos) ? 0 : p + 3;

    std::size_t e (url.find_first_of ("/:", p));
    if (e == string_type::npos)
      e = url.size ();

    return url.substr (p, e - p);
  }

  template <typename S>
  inline void basic_http_request<S>::
  normalize ()
  {
    if (!has_header (string_type ("Host")))
    {
      string_type h (host ());
      if (!h.empty ())
        set_header (string_type ("Host"), std::move (h));
    }

    if (!has_header (string_type ("User-Agent")))
      set_header (string_type ("User-Agent"),
                  string_type ("vscode-bisect/") + BISECT_VERSION_STR);
  }
}
