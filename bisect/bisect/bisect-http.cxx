#include <bisect/bisect-http.hxx>

#include <sstream>
#include <stdexcept>

using namespace std;

namespace bisect
{
  namespace json = boost::json;

  json::value
  parse_json (const string& s)
  {
    boost::system::error_code e;
    json::value v (json::parse (s, e));

    if (e)
      throw runtime_error ("unable to parse JSON: " + e.message ());

    return v;
  }

  string
  format_http_error (const http_response& r)
  {
    ostringstream o;
    o << "HTTP " << r.status_code ();

    if (!r.reason.empty ())
      o << ' ' << r.reason;

    // A 404 page can be a lot of HTML so only keep the start of the body.
    //
    if (r.body && !r.body->empty ())
    {
      const string& b (*r.body);
      const size_t m (200);

      o << ": " << (b.size () <= m ? b : b.substr (0, m) + "...");
    }

    return o.str ();
  }

  http_coordinator::
  http_coordinator (asio::io_context& i)
    : client_ (make_unique<client_type> (i))
  {
  }

  http_coordinator::
  http_coordinator (asio::io_context& i, const http_client_traits<>& t)
    : client_ (make_unique<client_type> (i, t))
  {
  }

  asio::awaitable<string> http_coordinator::
  get (const string& u)
  {
    response_type r (co_await client_->get (u));

    if (r.is_error ())
      throw runtime_error (format_http_error (r));

    co_return r.body ? *r.body : string ();
  }

  asio::awaitable<http_coordinator::response_type> http_coordinator::
  get_response (const string& u)
  {
    co_return co_await client_->get (u);
  }

  asio::awaitable<uint64_t> http_coordinator::
  download_file (const string& u, const fs::path& t, progress_callback cb)
  {
    if (t.has_parent_path ())
    {
      error_code e;
      fs::create_directories (t.parent_path (), e);

      if (e)
        throw runtime_error ("unable to create " +
                             t.parent_path ().string () + ": " +
                             e.message ());
    }

    co_return co_await client_->download (u, t.string (), move (cb));
  }
}
