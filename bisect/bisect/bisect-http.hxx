#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

#include <boost/asio.hpp>
#include <boost/json.hpp>

#include <bisect/http/http.hxx>

namespace bisect
{
  namespace fs = std::filesystem;
  namespace asio = boost::asio;

  class http_coordinator
  {
  public:
    using client_type = http_client;
    using response_type = http_response;

    using progress_callback =
      std::function<void (std::uint64_t bytes_transferred,
                          std::uint64_t total_bytes)>;

    explicit
    http_coordinator (asio::io_context& ioc);

    http_coordinator (asio::io_context& ioc,
                      const http_client_traits<>& traits);

    http_coordinator (const http_coordinator&) = delete;
    http_coordinator& operator= (const http_coordinator&) = delete;

    // GET returning the body. Throws on a 4xx/5xx status or a network
    // failure.
    //
    asio::awaitable<std::string>
    get (const std::string& url);

    // GET returning the full response whatever its status, for callers that
    // need to tell statuses apart. Network failures still throw.
    //
    asio::awaitable<response_type>
    get_response (const std::string& url);

    // Stream url into target, creating its parent directories.
    //
    // Returns the number of bytes written.
    //
    asio::awaitable<std::uint64_t>
    download_file (const std::string& url,
                   const fs::path& target,
                   progress_callback progress = nullptr);

  private:
    std::unique_ptr<client_type> client_;
  };

  // Parse a JSON document, throwing runtime_error on malformed input.
  //
  boost::json::value
  parse_json (const std::string& body);

  // "HTTP <code> <reason>: <start of body>".
  //
  std::string
  format_http_error (const http_response& response);
}
