#pragma once

#include <string>
#include <vector>

#include <boost/asio.hpp>

#include <bisect/bisect-config.hxx>
#include <bisect/bisect-http.hxx>
#include <bisect/catalog/catalog.hxx>

namespace bisect
{
  namespace asio = boost::asio;

  // Build catalog backed by the VS Code update service.
  //
  class catalog_coordinator: public build_catalog
  {
  public:
    catalog_coordinator (asio::io_context& ioc, const bisect_config& cfg);

    catalog_coordinator (const catalog_coordinator&) = delete;
    catalog_coordinator& operator= (const catalog_coordinator&) = delete;

    asio::awaitable<std::vector<build>>
    list_commits (const build_kind&, bool released_only) override;

    asio::awaitable<build>
    resolve_version (const build_kind&, const std::string& version) override;

    asio::awaitable<build_metadata>
    fetch_metadata (const build&) override;

  private:
    // GET url and parse the body as JSON, mapping every failure other than
    // a network error to catalog_unavailable.
    //
    asio::awaitable<boost::json::value>
    get_json (const std::string& url);

    const bisect_config& cfg_;
    http_coordinator http_;
  };

  // Version string the service expects for a major.minor on a channel, for
  // example 1.95.0-insider.
  //
  std::string
  catalog_version (const std::string& major_minor, build_quality);
}
