#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>

#include <boost/asio.hpp>

#include <bisect/bisect-http.hxx>

namespace bisect
{
  namespace fs = std::filesystem;
  namespace asio = boost::asio;

  // Where build artifacts come from.
  //
  class artifact_source
  {
  public:
    using progress_callback =
      std::function<void (std::uint64_t bytes_transferred,
                          std::uint64_t total_bytes)>;

    virtual
    ~artifact_source () = default;

    // Write the resource at url to target. Throws download_failed.
    //
    virtual asio::awaitable<void>
    download (const std::string& url,
              const fs::path& target,
              progress_callback) = 0;
  };

  class http_artifact_source: public artifact_source
  {
  public:
    explicit
    http_artifact_source (asio::io_context& ioc)
      : http_ (ioc)
    {
    }

    asio::awaitable<void>
    download (const std::string& url,
              const fs::path& target,
              progress_callback) override;

  private:
    http_coordinator http_;
  };
}
