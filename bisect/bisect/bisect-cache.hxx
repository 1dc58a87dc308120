#pragma once

#include <filesystem>
#include <optional>

#include <boost/asio.hpp>

#include <bisect/bisect-config.hxx>
#include <bisect/build/build-types.hxx>
#include <bisect/cache/cache-source.hxx>
#include <bisect/catalog/catalog.hxx>

namespace bisect
{
  namespace fs = std::filesystem;
  namespace asio = boost::asio;

  // Local store of downloaded builds, one directory per build under
  // <root>/.builds.
  //
  // An entry whose archive is present is trusted as is. Anything that goes
  // wrong while filling an entry removes the whole directory so that a
  // half-written archive is never picked up later.
  //
  class cache_coordinator
  {
  public:
    cache_coordinator (const bisect_config&, build_catalog&, artifact_source&);

    cache_coordinator (const cache_coordinator&) = delete;
    cache_coordinator& operator= (const cache_coordinator&) = delete;

    // Make the build available locally and return the installer file or the
    // directory the archive was extracted to. Return nullopt for builds that
    // run inside a container and are never stored locally.
    //
    // With force, an existing entry is deleted and downloaded again.
    //
    asio::awaitable<std::optional<fs::path>>
    materialize (const build&, bool force = false);

    // Directory holding the build's entry.
    //
    fs::path
    build_directory (const build&) const;

    // Metadata recorded when the entry was downloaded, if any.
    //
    std::optional<build_metadata>
    cached_metadata (const build&) const;

  private:
    fs::path
    extraction_directory (const build&,
                          const fs::path& archive,
                          const fs::path& dir) const;

    const bisect_config& cfg_;
    build_catalog& catalog_;
    artifact_source& source_;
  };
}
