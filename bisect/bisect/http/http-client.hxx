#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>

#include <bisect/http/http-types.hxx>
#include <bisect/http/http-request.hxx>
#include <bisect/http/http-response.hxx>

namespace bisect
{
  namespace asio  = boost::asio;
  namespace beast = boost::beast;
  namespace ssl   = boost::asio::ssl;

  template <typename S = std::string>
  struct http_client_traits
  {
    using string_type   = S;
    using request_type  = basic_http_request<string_type>;
    using response_type = basic_http_response<string_type>;

    // Connect timeout in milliseconds.
    //
    std::uint32_t connect_timeout = 30000;

    // Timeout in milliseconds for sending a request and receiving the
    // response headers. A download body streams without a deadline.
    //
    std::uint32_t io_timeout = 60000;

    std::uint8_t max_redirects = 10;

    // The update service redirects downloads to a CDN, so this is on by
    // default.
    //
    bool follow_redirects = true;

    bool verify_ssl = true;
  };

  // Per-client state shared by every connection: the I/O context and the
  // TLS context.
  //
  template <typename T = http_client_traits<>>
  class basic_http_session
  {
  public:
    using traits_type = T;

    basic_http_session (asio::io_context& ioc, const traits_type& traits)
      : ioc_ (ioc), traits_ (traits), ssl_ctx_ (ssl::context::tlsv12_client)
    {
      configure_ssl ();
    }

    basic_http_session (const basic_http_session&) = delete;
    basic_http_session& operator= (const basic_http_session&) = delete;

    asio::io_context&
    io_context () noexcept
    {
      return ioc_;
    }

    const traits_type&
    traits () const noexcept
    {
      return traits_;
    }

    ssl::context&
    ssl_context () noexcept
    {
      return ssl_ctx_;
    }

  private:
    void
    configure_ssl ();

  private:
    asio::io_context& ioc_;
    traits_type traits_;
    ssl::context ssl_ctx_;
  };

  // Coroutine HTTP(S) client on top of Boost.Beast.
  //
  template <typename T = http_client_traits<>>
  class basic_http_client
  {
  public:
    using traits_type   = T;
    using string_type   = typename traits_type::string_type;
    using request_type  = typename traits_type::request_type;
    using response_type = typename traits_type::response_type;
    using session_type  = basic_http_session<traits_type>;

    // Called with (bytes received so far, total bytes or 0 if unknown).
    //
    using progress_callback =
      std::function<void (std::uint64_t, std::uint64_t)>;

    explicit
    basic_http_client (asio::io_context& ioc,
                       const traits_type& traits = traits_type ())
      : session_ (std::make_unique<session_type> (ioc, traits)) {}

    basic_http_client (const basic_http_client&) = delete;
    basic_http_client& operator= (const basic_http_client&) = delete;

    // Buffer the whole response body in memory. Redirects are followed.
    //
    asio::awaitable<response_type>
    get (const string_type& url);

    // Stream the response body of url into the file at path, truncating it
    // first. Throw if the final status is not 200.
    //
    // Return the number of bytes written.
    //
    asio::awaitable<std::uint64_t>
    download (const string_type& url,
              const string_type& path,
              progress_callback progress = nullptr);

  private:
    asio::awaitable<response_type>
    request_impl (request_type req, std::uint8_t redirects);

    template <typename Stream>
    asio::awaitable<response_type>
    exchange (Stream& s, const request_type& req);

    asio::awaitable<std::uint64_t>
    download_impl (const string_type& url,
                   const string_type& path,
                   progress_callback progress,
                   std::uint8_t redirects);

  private:
    std::unique_ptr<session_type> session_;
  };

  using http_session = basic_http_session<>;
  using http_client  = basic_http_client<>;
}

#include <bisect/http/http-client.ixx>
#include <bisect/http/http-client.txx>
