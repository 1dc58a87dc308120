#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <boost/asio.hpp>

#include <bisect/bisect-cache.hxx>
#include <bisect/bisect-config.hxx>
#include <bisect/bisect-prompt.hxx>
#include <bisect/build/build-types.hxx>
#include <bisect/catalog/catalog.hxx>
#include <bisect/launch/launch-instance.hxx>

namespace bisect
{
  namespace fs = std::filesystem;
  namespace asio = boost::asio;

  struct launch_options
  {
    // Discard the cached artifact and download it again.
    //
    bool force = false;
  };

  // Starts builds. The engine and the sanity checker only see this.
  //
  class build_launcher
  {
  public:
    virtual
    ~build_launcher () = default;

    // Start the build and return once it is ready for a verdict. Return
    // null if there is nothing to observe (the human skipped a manual
    // install, for example).
    //
    virtual asio::awaitable<std::unique_ptr<instance>>
    launch (const build&, const launch_options&) = 0;

    // Delete the isolated user data so the next launch starts clean.
    //
    virtual void
    clear_user_data () = 0;
  };

  class launch_coordinator: public build_launcher
  {
  public:
    // Recreates the isolated data directory.
    //
    launch_coordinator (asio::io_context&,
                        const bisect_config&,
                        build_catalog&,
                        cache_coordinator&,
                        prompter&);

    launch_coordinator (const launch_coordinator&) = delete;
    launch_coordinator& operator= (const launch_coordinator&) = delete;

    asio::awaitable<std::unique_ptr<instance>>
    launch (const build&, const launch_options&) override;

    void
    clear_user_data () override;

    // Command line pieces, exposed for tests.
    //

    // Flags for a local web server or a desktop build.
    //
    std::vector<std::string>
    launch_args (const build&) const;

    // Hosted web URL for the commit.
    //
    std::string
    remote_url (const build&) const;

    // Privileged command that installs a Linux package.
    //
    std::string
    package_install_command (build_flavor, const fs::path& package) const;

    // docker run arguments for a containerized CLI.
    //
    std::vector<std::string>
    container_args (const build&) const;

  private:
    struct web_server
    {
      std::unique_ptr<process_instance> process;
      std::string url;
    };

    asio::awaitable<std::unique_ptr<instance>>
    launch_web_local (const build&, const fs::path& dir);

    // Start the server and wait until it prints its URL.
    //
    asio::awaitable<web_server>
    start_web_server (const build&, const fs::path& dir);

    asio::awaitable<std::unique_ptr<instance>>
    launch_web_remote (const build&);

    asio::awaitable<std::unique_ptr<instance>>
    launch_desktop (const build&, const fs::path& dir);

    asio::awaitable<std::unique_ptr<instance>>
    launch_cli (const build&, std::unique_ptr<process_instance>);

    asio::awaitable<std::unique_ptr<instance>>
    launch_installer (const build&, const fs::path& file);

    asio::awaitable<std::unique_ptr<instance>>
    launch_package (const build&, const fs::path& file);

    asio::awaitable<std::unique_ptr<instance>>
    run_web_performance (const build&, const fs::path* dir);

    asio::awaitable<std::unique_ptr<instance>>
    run_desktop_performance (const build&, const fs::path& dir);

    // Locate the build's executable, preferring the legacy launcher script
    // of old servers. Throws missing_executable.
    //
    asio::awaitable<fs::path>
    find_executable (const build&, const fs::path& dir);

    void
    reset_data_directory ();

    asio::io_context& ioc_;
    const bisect_config& cfg_;
    build_catalog& catalog_;
    cache_coordinator& cache_;
    prompter& prompter_;
  };
}
