#pragma once

#include <filesystem>
#include <optional>

#include <bisect/build/build-types.hxx>

namespace bisect
{
  namespace fs = std::filesystem;

  // Metadata of a completed download, kept inside the build's cache
  // directory so that names depending on it can be resolved again without
  // asking the update service.
  //
  fs::path
  cache_record_path (const fs::path& dir);

  // Return nullopt if there is no record or it cannot be read.
  //
  std::optional<build_metadata>
  read_cache_record (const fs::path& dir);

  // Throw system_error if the record cannot be written.
  //
  void
  write_cache_record (const fs::path& dir, const build_metadata&);
}
