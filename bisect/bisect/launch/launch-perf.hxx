#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio.hpp>

namespace bisect
{
  namespace fs = std::filesystem;
  namespace asio = boost::asio;

  // Bridge to the external startup performance harness (vscode-perf). It
  // runs a build several times and reports timings; we only assemble its
  // command line and wait for it.
  //

  // Arguments to measure a desktop executable opening the source checkout.
  //
  std::vector<std::string>
  perf_desktop_args (const fs::path& executable,
                     const fs::path& checkout,
                     const fs::path& timers_file);

  // Arguments to measure a web build at url. For a local server the
  // checkout is opened through the server's remote authority.
  //
  std::vector<std::string>
  perf_web_args (const std::string& url,
                 const std::optional<std::string>& token,
                 const std::optional<fs::path>& checkout,
                 const std::optional<fs::path>& markers_file);

  // "vscode-remote://localhost:9888/<path>" for a local path.
  //
  std::string
  remote_file_uri (const fs::path&);

  // Run the harness to completion and return how long it took. Throws
  // runtime_error if it cannot be started or fails.
  //
  asio::awaitable<std::chrono::milliseconds>
  run_perf_harness (asio::io_context&,
                    const std::vector<std::string>& args,
                    bool verbose);
}
