#pragma once

#include <filesystem>

namespace bisect
{
  namespace fs = std::filesystem;

  // Unpack a zip archive into destination with miniz, without relying on any
  // tool being installed. Entries with absolute names or names leading out
  // of destination are rejected with extraction_failed.
  //
  void
  extract_zip_inprocess (const fs::path& archive, const fs::path& destination);

  // Unpack a zip archive into destination with the system unzip.
  //
  void
  extract_zip_system (const fs::path& archive, const fs::path& destination);

  // Unpack a gzip-compressed tarball into destination, creating it first.
  //
  void
  extract_tarball (const fs::path& archive, const fs::path& destination);

  // Pick the extractor from the archive name. Zip archives are unpacked in
  // process when inprocess_zip is set.
  //
  // Throws extraction_failed.
  //
  void
  extract_archive (const fs::path& archive,
                   const fs::path& destination,
                   bool inprocess_zip);
}
