#pragma once

#include <stdexcept>
#include <string>

namespace bisect
{
  // Base of everything this tool reports as a failed operation, as opposed
  // to a programming error.
  //
  class error: public std::runtime_error
  {
  public:
    using std::runtime_error::runtime_error;
  };

  // The update service answered with an unexpected status or shape.
  //
  class catalog_unavailable: public error
  {
  public:
    using error::error;
  };

  // No build exists for the requested major.minor version.
  //
  class unknown_version: public error
  {
  public:
    using error::error;
  };

  // A commit is malformed or not in the list of builds.
  //
  class commit_not_found: public error
  {
  public:
    using error::error;
  };

  // The bad boundary is not strictly newer than the good one.
  //
  class invalid_range: public error
  {
  public:
    using error::error;
  };

  // Downloaded bytes do not match the published checksum.
  //
  class integrity_error: public error
  {
  public:
    using error::error;
  };

  class download_failed: public error
  {
  public:
    using error::error;
  };

  class extraction_failed: public error
  {
  public:
    using error::error;
  };

  // The executable is absent after extraction, which usually means the
  // archive is corrupt or its layout changed.
  //
  class missing_executable: public error
  {
  public:
    using error::error;
  };

  // A (runtime, platform, flavor) combination with no artifact.
  //
  class unsupported_platform: public error
  {
  public:
    using error::error;
  };
}
