#include <bisect/build/build-types.hxx>

#include <stdexcept>
#include <utility>

using namespace std;

namespace bisect
{
  // runtime_kind
  //
  string
  to_string (runtime_kind r)
  {
    switch (r)
    {
      case runtime_kind::desktop_local: return "desktop";
      case runtime_kind::web_local:     return "web";
      case runtime_kind::web_remote:    return "vscode.dev";
    }
    return "desktop";
  }

  runtime_kind
  to_runtime_kind (const string& s)
  {
    if (s == "desktop")    return runtime_kind::desktop_local;
    if (s == "web")        return runtime_kind::web_local;
    if (s == "vscode.dev") return runtime_kind::web_remote;

    throw invalid_argument ("unknown runtime: " + s);
  }

  // build_quality
  //
  string
  to_string (build_quality q)
  {
    switch (q)
    {
      case build_quality::stable:      return "stable";
      case build_quality::insider:     return "insider";
      case build_quality::exploration: return "exploration";
    }
    return "insider";
  }

  build_quality
  to_build_quality (const string& s)
  {
    if (s == "stable")      return build_quality::stable;
    if (s == "insider")     return build_quality::insider;
    if (s == "exploration") return build_quality::exploration;

    throw invalid_argument ("unknown quality: " + s);
  }

  // build_flavor
  //
  static const pair<build_flavor, const char*> flavor_names[] = {
    {build_flavor::default_,         "default"},
    {build_flavor::darwin_universal, "universal"},
    {build_flavor::win32_user,       "win32-user"},
    {build_flavor::win32_system,     "win32-system"},
    {build_flavor::linux_deb,        "linux-deb"},
    {build_flavor::linux_rpm,        "linux-rpm"},
    {build_flavor::linux_snap,       "linux-snap"},
    {build_flavor::cli,              "cli"},
    {build_flavor::cli_linux_amd64,  "cli-linux-amd64"},
    {build_flavor::cli_linux_arm64,  "cli-linux-arm64"},
    {build_flavor::cli_linux_armv7,  "cli-linux-armv7"},
    {build_flavor::cli_alpine_amd64, "cli-alpine-amd64"},
    {build_flavor::cli_alpine_arm64, "cli-alpine-arm64"}
  };

  string
  to_string (build_flavor f)
  {
    for (const auto& n: flavor_names)
      if (n.first == f)
        return n.second;

    return "default";
  }

  build_flavor
  to_build_flavor (const string& s)
  {
    for (const auto& n: flavor_names)
      if (s == n.second)
        return n.first;

    throw invalid_argument ("unknown flavor: " + s);
  }

  optional<container_target>
  containerized (build_flavor f)
  {
    using ca = container_arch;
    using cl = container_libc;

    switch (f)
    {
      case build_flavor::cli_linux_amd64:  return container_target {ca::amd64, cl::glibc};
      case build_flavor::cli_linux_arm64:  return container_target {ca::arm64, cl::glibc};
      case build_flavor::cli_linux_armv7:  return container_target {ca::armv7, cl::glibc};
      case build_flavor::cli_alpine_amd64: return container_target {ca::amd64, cl::musl};
      case build_flavor::cli_alpine_arm64: return container_target {ca::arm64, cl::musl};
      default:                             return nullopt;
    }
  }

  bool
  installer (build_flavor f)
  {
    switch (f)
    {
      case build_flavor::win32_user:
      case build_flavor::win32_system:
      case build_flavor::linux_deb:
      case build_flavor::linux_rpm:
      case build_flavor::linux_snap:
        return true;
      default:
        return false;
    }
  }

  // platform
  //
  string
  to_string (target_os o)
  {
    switch (o)
    {
      case target_os::darwin:  return "darwin";
      case target_os::linux_:  return "linux";
      case target_os::windows: return "win32";
    }
    return "linux";
  }

  string
  to_string (target_arch a)
  {
    return a == target_arch::arm64 ? "arm64" : "x64";
  }

  platform
  host_platform ()
  {
    platform p;

#if defined(_WIN32)
    p.os = target_os::windows;
#elif defined(__APPLE__)
    p.os = target_os::darwin;
#else
    p.os = target_os::linux_;
#endif

#if defined(__aarch64__) || defined(_M_ARM64)
    p.arch = target_arch::arm64;
#else
    p.arch = target_arch::x64;
#endif

    return p;
  }
}
