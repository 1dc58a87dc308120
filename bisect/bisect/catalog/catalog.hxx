#pragma once

#include <string>
#include <vector>

#include <boost/asio/awaitable.hpp>

#include <bisect/build/build-types.hxx>

namespace bisect
{
  namespace asio = boost::asio;

  // Source of truth for which builds exist. Responses are never cached:
  // every call goes to the service.
  //
  class build_catalog
  {
  public:
    virtual
    ~build_catalog () = default;

    // All builds of the kind, newest first.
    //
    virtual asio::awaitable<std::vector<build>>
    list_commits (const build_kind&, bool released_only) = 0;

    // Latest released build of a "major.minor" version. Throws
    // unknown_version if there is none.
    //
    virtual asio::awaitable<build>
    resolve_version (const build_kind&, const std::string& version) = 0;

    virtual asio::awaitable<build_metadata>
    fetch_metadata (const build&) = 0;
  };
}
