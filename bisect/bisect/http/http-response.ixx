#include <charconv>

namespace bisect
{
  template <typename S>
  inline std::optional<std::uint64_t> basic_http_response<S>::
  content_length () const
  {
    auto v (headers.get (string_type ("Content-Length")));

    if (!v)
      return std::nullopt;

    std::uint64_t n (0);
    auto r (std::from_chars (v->data (), v->data () + v->size (), n));

    if (r.ec != std::errc ())
      return std::nullopt;

    return n;
  }
}
