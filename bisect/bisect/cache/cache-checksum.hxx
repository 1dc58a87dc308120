#pragma once

#include <filesystem>
#include <string>

namespace bisect
{
  namespace fs = std::filesystem;

  // Lowercase hex SHA-256 of the file contents.
  //
  // Throws runtime_error if the file cannot be read.
  //
  std::string
  sha256_file (const fs::path&);

  // Compare two hex digests ignoring case.
  //
  bool
  compare_checksums (const std::string&, const std::string&);
}
