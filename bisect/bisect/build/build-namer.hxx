#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include <bisect/build/build-types.hxx>

namespace bisect
{
  namespace fs = std::filesystem;

  // Artifact naming.
  //
  // The update service and the archives it serves are named irregularly per
  // (runtime, OS, flavor, architecture). All of that lives in a single table
  // in build-namer.cxx; the functions below look up the matching entry and
  // expand its patterns. Each field of an entry has a strategy: a fixed
  // pattern, a pattern that needs the product version from the build
  // metadata, or the basename of the metadata download URL.
  //
  // Lookups throw unsupported_platform if no entry matches and
  // invalid_argument if the entry needs metadata that was not passed.
  //

  // Platform token used to list commits and to resolve versions.
  //
  std::string
  catalog_name (const build_kind&, const platform&);

  // Platform token used to fetch per-commit metadata.
  //
  std::string
  platform_name (const build_kind&, const platform&);

  // Return true if download_name() requires metadata for this kind.
  //
  bool
  download_name_needs_metadata (const build_kind&, const platform&);

  std::string
  download_name (const build_kind&,
                 const platform&,
                 const build_metadata* = nullptr);

  bool
  folder_name_needs_metadata (const build_kind&, const platform&);

  // Name of the directory the archive unpacks to (or, for the CLI, of the
  // binary itself).
  //
  std::string
  installed_folder_name (const build_kind&,
                         const platform&,
                         const build_metadata* = nullptr);

  // Expected executable inside the build directory.
  //
  fs::path
  executable_path (const build_kind&,
                   const platform&,
                   const fs::path& build_dir,
                   const build_metadata* = nullptr);

  // Servers before 1.65 shipped a launcher script at the top of the server
  // folder. Return its location if this kind ever had one.
  //
  std::optional<fs::path>
  legacy_executable_path (const build_kind&,
                          const platform&,
                          const fs::path& build_dir,
                          const build_metadata* = nullptr);

  // Name of the per-build cache directory.
  //
  // On Windows the commit is cut to 6 characters to stay clear of MAX_PATH.
  // Stable and exploration builds as well as non-default flavors get a
  // prefix so entries never collide.
  //
  std::string
  cache_folder_name (const std::string& commit,
                     build_quality,
                     build_flavor,
                     const platform&);
}
