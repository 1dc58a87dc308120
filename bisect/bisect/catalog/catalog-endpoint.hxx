#pragma once

#include <sstream>
#include <string>

namespace bisect
{
  // Update service endpoint builder.
  //
  // All of the build catalog lives under
  // https://update.code.visualstudio.com/api/.
  //
  class catalog_endpoint
  {
  public:
    static constexpr const char* api_base =
      "https://update.code.visualstudio.com/api";

    // Commits with a build for the platform token, newest first.
    //
    static std::string
    commits (const std::string& quality,
             const std::string& catalog_name,
             bool released_only)
    {
      return build ("/commits/", quality, "/", catalog_name,
                    "?released=", released_only ? "true" : "false");
    }

    // Latest released build of a version. The version is major.minor.patch
    // with the channel suffix (-insider, -exploration) where there is one.
    //
    static std::string
    version (const std::string& version,
             const std::string& catalog_name,
             const std::string& quality)
    {
      return build ("/versions/", version, "/", catalog_name, "/", quality,
                    "?released=true");
    }

    // Metadata of the build of one commit.
    //
    static std::string
    commit (const std::string& commit,
            const std::string& platform_name,
            const std::string& quality)
    {
      return build ("/versions/commit:", commit, "/", platform_name, "/",
                    quality);
    }

  private:
    template <typename... A>
    static std::string
    build (A&&... a)
    {
      std::ostringstream os;
      os << api_base;
      (os << ... << a);
      return os.str ();
    }
  };
}
