#pragma once

#include <optional>
#include <ostream>
#include <string>

namespace bisect
{
  // How a build is executed.
  //
  enum class runtime_kind
  {
    desktop_local, // Native application on this machine.
    web_local,     // Server on this machine, UI in the browser.
    web_remote     // Hosted UI, nothing to download.
  };

  std::string
  to_string (runtime_kind);

  // Parse the command line spelling ("desktop", "web", "vscode.dev").
  //
  // Throw invalid_argument naming the value if it is not recognized.
  //
  runtime_kind
  to_runtime_kind (const std::string&);

  inline std::ostream&
  operator<< (std::ostream& o, runtime_kind r)
  {
    return o << to_string (r);
  }

  // Release channel.
  //
  enum class build_quality
  {
    stable,
    insider,
    exploration
  };

  std::string
  to_string (build_quality);

  build_quality
  to_build_quality (const std::string&);

  inline std::ostream&
  operator<< (std::ostream& o, build_quality q)
  {
    return o << to_string (q);
  }

  // Packaging variant.
  //
  enum class build_flavor
  {
    default_,
    darwin_universal,
    win32_user,
    win32_system,
    linux_deb,
    linux_rpm,
    linux_snap,
    cli,
    cli_linux_amd64,
    cli_linux_arm64,
    cli_linux_armv7,
    cli_alpine_amd64,
    cli_alpine_arm64
  };

  std::string
  to_string (build_flavor);

  build_flavor
  to_build_flavor (const std::string&);

  inline std::ostream&
  operator<< (std::ostream& o, build_flavor f)
  {
    return o << to_string (f);
  }

  // The CLI flavors that are fetched and run inside a container rather than
  // on the host.
  //
  enum class container_arch
  {
    amd64,
    arm64,
    armv7
  };

  enum class container_libc
  {
    glibc,
    musl
  };

  struct container_target
  {
    container_arch arch;
    container_libc libc;
  };

  std::optional<container_target>
  containerized (build_flavor);

  // True if the artifact is an installer or OS package that is handed to the
  // system rather than extracted.
  //
  bool
  installer (build_flavor);

  // Target platform.
  //
  enum class target_os
  {
    darwin,
    linux_,
    windows
  };

  enum class target_arch
  {
    x64,
    arm64
  };

  std::string
  to_string (target_os);

  std::string
  to_string (target_arch);

  struct platform
  {
    target_os os;
    target_arch arch;
  };

  inline bool
  operator== (const platform& x, const platform& y) noexcept
  {
    return x.os == y.os && x.arch == y.arch;
  }

  // The platform this binary was compiled for.
  //
  platform
  host_platform ();

  // Immutable descriptor of what kind of thing to run.
  //
  struct build_kind
  {
    runtime_kind runtime = runtime_kind::desktop_local;
    build_quality quality = build_quality::insider;
    build_flavor flavor = build_flavor::default_;
  };

  // One concrete artifact.
  //
  struct build
  {
    build_kind kind;
    std::string commit;
  };

  inline bool
  operator== (const build& x, const build& y) noexcept
  {
    return x.commit == y.commit &&
           x.kind.runtime == y.kind.runtime &&
           x.kind.quality == y.kind.quality &&
           x.kind.flavor == y.kind.flavor;
  }

  inline bool
  operator!= (const build& x, const build& y) noexcept
  {
    return !(x == y);
  }

  // Per-build metadata served by the update service. Only lives for the
  // duration of one step.
  //
  struct build_metadata
  {
    std::string url;
    std::string version;         // Commit the service resolved to.
    std::string product_version; // E.g., 1.95.0-insider.
    std::string sha256;
  };

  // Quality-dependent naming used by several artifacts. Exploration builds
  // are named like insiders builds.
  //
  inline bool
  insiders_naming (build_quality q) noexcept
  {
    return q != build_quality::stable;
  }
}
