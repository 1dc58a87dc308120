#include <chrono>
#include <fstream>
#include <limits>
#include <stdexcept>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

namespace bisect
{
  namespace http = beast::http;
  using tcp = asio::ip::tcp;

  struct url_parts
  {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target;
  };

  // Split scheme://host[:port][/target]. This covers every URL the update
  // service and its CDN hand out; IPv6 literals and user info are not
  // supported.
  //
  inline url_parts
  parse_url (const std::string& url)
  {
    url_parts r;
    std::size_t p (url.find ("://"));

    if (p != std::string::npos)
    {
      r.scheme = url.substr (0, p);
      p += 3;
    }
    else
    {
      r.scheme = "http";
      p = 0;
    }

    std::size_t e (url.find ('/', p));
    if (e == std::string::npos)
      e = url.size ();

    std::string a (url.substr (p, e - p));
    std::size_t c (a.find (':'));

    if (c != std::string::npos)
    {
      r.host = a.substr (0, c);
      r.port = a.substr (c + 1);
    }
    else
    {
      r.host = a;
      r.port = r.scheme == "https" ? "443" : "80";
    }

    r.target = e < url.size () ? url.substr (e) : std::string ("/");
    return r;
  }

  // Resolve a possibly relative Location header against the URL that
  // produced it.
  //
  inline std::string
  resolve_location (const std::string& base, const std::string& loc)
  {
    if (loc.find ("://") != std::string::npos)
      return loc;

    url_parts b (parse_url (base));
    std::string origin (b.scheme + "://" + b.host);

    if ((b.scheme == "https" && b.port != "443") ||
        (b.scheme == "http" && b.port != "80"))
      origin += ':' + b.port;

    return loc.empty () || loc[0] != '/' ? origin + '/' + loc : origin + loc;
  }

  // Open a TLS stream to the host: resolve, connect, SNI, and handshake.
  //
  template <typename T>
  asio::awaitable<void>
  open_ssl_stream (basic_http_session<T>& ss,
                   beast::ssl_stream<beast::tcp_stream>& s,
                   const url_parts& u)
  {
    tcp::resolver rs (ss.io_context ());
    auto eps (co_await rs.async_resolve (u.host, u.port, asio::use_awaitable));

    // Beast does not wrap SNI so we go through the OpenSSL handle. Without
    // it CDNs tend to present the wrong certificate or drop the handshake.
    //
    if (!SSL_set_tlsext_host_name (s.native_handle (), u.host.c_str ()))
    {
      beast::error_code ec (static_cast<int> (::ERR_get_error ()),
                            asio::error::get_ssl_category ());
      throw beast::system_error (ec, "unable to set SNI hostname");
    }

    if (ss.traits ().verify_ssl)
      s.set_verify_callback (ssl::host_name_verification (u.host));

    auto& l (beast::get_lowest_layer (s));
    l.expires_after (std::chrono::milliseconds (ss.traits ().connect_timeout));

    co_await l.async_connect (eps, asio::use_awaitable);
    co_await s.async_handshake (ssl::stream_base::client, asio::use_awaitable);
  }

  template <typename T>
  asio::awaitable<void>
  open_tcp_stream (basic_http_session<T>& ss,
                   beast::tcp_stream& s,
                   const url_parts& u)
  {
    tcp::resolver rs (ss.io_context ());
    auto eps (co_await rs.async_resolve (u.host, u.port, asio::use_awaitable));

    s.expires_after (std::chrono::milliseconds (ss.traits ().connect_timeout));
    co_await s.async_connect (eps, asio::use_awaitable);
  }

  // Close the socket without a TLS close_notify exchange. Plenty of servers
  // never answer it and the wait would run into the timeout.
  //
  template <typename Stream>
  inline void
  close_stream (Stream& s)
  {
    beast::error_code ec;
    beast::get_lowest_layer (s).socket ().shutdown (tcp::socket::shutdown_both,
                                                   ec);
  }

  template <typename T>
  template <typename Stream>
  asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  exchange (Stream& s, const request_type& req)
  {
    const auto& tr (session_->traits ());

    http::request<http::empty_body> br;
    br.method (req.method == http_method::head ? http::verb::head
                                               : http::verb::get);
    br.target (req.target ());
    br.version (req.version.major * 10 + req.version.minor);

    for (const auto& h: req.headers)
      br.set (h.name, h.value);

    auto& l (beast::get_lowest_layer (s));
    l.expires_after (std::chrono::milliseconds (tr.io_timeout));

    co_await http::async_write (s, br, asio::use_awaitable);

    beast::flat_buffer b;
    http::response<http::string_body> bres;
    co_await http::async_read (s, b, bres, asio::use_awaitable);

    response_type r;
    r.status = static_cast<http_status> (bres.result_int ());
    r.version = http_version (bres.version () / 10, bres.version () % 10);
    r.reason = string_type (bres.reason ());

    for (const auto& h: bres)
      r.headers.add (string_type (h.name_string ()), string_type (h.value ()));

    if (!bres.body ().empty ())
      r.body = std::move (bres.body ());

    co_return r;
  }

  template <typename T>
  asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  request_impl (request_type req, std::uint8_t redirects)
  {
    const auto& tr (session_->traits ());

    if (redirects >= tr.max_redirects)
      throw std::runtime_error ("maximum redirects exceeded for " + req.url);

    url_parts u (parse_url (req.url));
    response_type r;

    if (u.scheme == "https")
    {
      beast::ssl_stream<beast::tcp_stream> s (session_->io_context (),
                                              session_->ssl_context ());
      co_await open_ssl_stream (*session_, s, u);
      r = co_await exchange (s, req);
      close_stream (s);
    }
    else
    {
      beast::tcp_stream s (session_->io_context ());
      co_await open_tcp_stream (*session_, s, u);
      r = co_await exchange (s, req);
      close_stream (s);
    }

    if (tr.follow_redirects && r.is_redirection ())
    {
      if (auto loc = r.location ())
      {
        // The copied headers still name the old host, so it has to be
        // rewritten for the new location.
        //
        request_type next (req.method, resolve_location (req.url, *loc));
        next.headers = req.headers;
        next.headers.remove ("Host");
        next.normalize ();

        co_return co_await request_impl (std::move (next), redirects + 1);
      }
    }

    co_return r;
  }

  // Unlike request_impl() the body is never held in memory: it is streamed
  // to the file chunk by chunk, reporting progress as it goes.
  //
  template <typename T>
  asio::awaitable<std::uint64_t>
  basic_http_client<T>::
  download_impl (const string_type& url,
                 const string_type& path,
                 progress_callback progress,
                 std::uint8_t redirects)
  {
    using namespace std::chrono;
    using parser_type = http::response_parser<http::buffer_body>;

    const auto& tr (session_->traits ());

    if (redirects >= tr.max_redirects)
      throw std::runtime_error ("maximum redirects exceeded for " + url);

    request_type req (http_method::get, url);
    req.normalize ();

    url_parts u (parse_url (url));

    // Set by transfer() when the server points us elsewhere.
    //
    std::optional<string_type> moved;

    auto transfer = [&] (auto& s) -> asio::awaitable<std::uint64_t>
    {
      auto& l (beast::get_lowest_layer (s));

      http::request<http::empty_body> br;
      br.method (http::verb::get);
      br.target (u.target);
      br.version (11);

      for (const auto& h: req.headers)
        br.set (h.name, h.value);

      l.expires_after (milliseconds (tr.io_timeout));
      co_await http::async_write (s, br, asio::use_awaitable);

      beast::flat_buffer b;
      parser_type p;
      p.body_limit (std::numeric_limits<std::uint64_t>::max ());

      co_await http::async_read_header (s, b, p, asio::use_awaitable);

      // The body may take as long as it takes.
      //
      l.expires_never ();

      unsigned st (p.get ().result_int ());

      if (tr.follow_redirects && st >= 300 && st < 400)
      {
        auto loc (p.get ()[http::field::location]);
        if (!loc.empty ())
        {
          moved = resolve_location (url, std::string (loc));
          co_return 0;
        }
      }

      if (st != 200)
        throw std::runtime_error ("download of " + url +
                                  " failed with HTTP status " +
                                  std::to_string (st));

      std::uint64_t tot (p.content_length () ? *p.content_length () : 0);
      std::uint64_t off (0);

      // Only open (and so truncate) the file once we know there is a body
      // to write.
      //
      std::ofstream ofs (path, std::ios::binary | std::ios::trunc);
      if (!ofs)
        throw std::runtime_error ("unable to open " + path + " for writing");

      char buf[8192];

      while (!p.is_done ())
      {
        p.get ().body ().data = buf;
        p.get ().body ().size = sizeof (buf);

        beast::error_code ec;
        co_await http::async_read (s, b, p,
                                   asio::redirect_error (asio::use_awaitable,
                                                         ec));

        // need_buffer only means our chunk buffer is full.
        //
        if (ec && ec != http::error::need_buffer)
          throw beast::system_error (ec, "download of " + url + " failed");

        std::size_t n (sizeof (buf) - p.get ().body ().size);

        if (n != 0)
        {
          ofs.write (buf, static_cast<std::streamsize> (n));

          if (!ofs)
            throw std::runtime_error ("unable to write to " + path);

          off += n;

          if (progress)
            progress (off, tot);
        }
      }

      ofs.close ();

      if (!ofs)
        throw std::runtime_error ("unable to write to " + path);

      co_return off;
    };

    std::uint64_t r (0);

    if (u.scheme == "https")
    {
      beast::ssl_stream<beast::tcp_stream> s (session_->io_context (),
                                              session_->ssl_context ());
      co_await open_ssl_stream (*session_, s, u);
      r = co_await transfer (s);
      close_stream (s);
    }
    else
    {
      beast::tcp_stream s (session_->io_context ());
      co_await open_tcp_stream (*session_, s, u);
      r = co_await transfer (s);
      close_stream (s);
    }

    if (moved)
      co_return co_await download_impl (*moved,
                                        path,
                                        std::move (progress),
                                        redirects + 1);

    co_return r;
  }
}
