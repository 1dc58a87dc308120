#include <bisect/http/http-types.hxx>

using namespace std;

namespace bisect
{
  string
  to_string (http_method m)
  {
    switch (m)
    {
      case http_method::get:  return "GET";
      case http_method::head: return "HEAD";
    }
    return "GET";
  }

  string http_version::
  string () const
  {
    return "HTTP/" + std::to_string (major) + '.' + std::to_string (minor);
  }
}
