#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio.hpp>
#include <boost/process.hpp>

namespace bisect
{
  namespace fs = std::filesystem;
  namespace asio = boost::asio;
  namespace bp = boost::process;

  // A running build that can be observed and stopped.
  //
  class instance
  {
  public:
    virtual
    ~instance () = default;

    // Startup time, only known for performance runs.
    //
    virtual std::optional<std::chrono::milliseconds>
    elapsed () const
    {
      return std::nullopt;
    }

    // Stop the build. Calling it more than once, or after the build exited
    // on its own, is not an error.
    //
    virtual asio::awaitable<void>
    stop () = 0;
  };

  // Nothing to stop: the build runs in the browser or was handed to the
  // performance harness.
  //
  class noop_instance: public instance
  {
  public:
    noop_instance () = default;

    explicit
    noop_instance (std::chrono::milliseconds e)
      : elapsed_ (e)
    {
    }

    std::optional<std::chrono::milliseconds>
    elapsed () const override
    {
      return elapsed_;
    }

    asio::awaitable<void>
    stop () override
    {
      co_return;
    }

  private:
    std::optional<std::chrono::milliseconds> elapsed_;
  };

  // Child process started in its own process group so that stopping it
  // also takes down everything it spawned.
  //
  // Both output streams are captured. Standard error is drained in the
  // background from the start; standard output is read line by line with
  // read_line() until the caller has seen what it waits for and calls
  // drain().
  //
  class process_instance: public instance
  {
  public:
    // Lines are echoed prefixed with tag when verbose is set.
    //
    process_instance (asio::io_context&,
                      const fs::path& executable,
                      const std::vector<std::string>& args,
                      std::string tag,
                      bool verbose);

    ~process_instance () override;

    process_instance (const process_instance&) = delete;
    process_instance& operator= (const process_instance&) = delete;

    // Next line of standard output without the line terminator, or nullopt
    // once the stream is closed.
    //
    asio::awaitable<std::optional<std::string>>
    read_line ();

    // Stop reading lines and keep consuming standard output in the
    // background so that the child never blocks on a full pipe.
    //
    void
    drain ();

    asio::awaitable<void>
    stop () override;

    bool
    running ();

    // Wait for the process to exit on its own and return its exit code.
    //
    int
    wait ();

    int
    id () const
    {
      return child_.id ();
    }

  private:
    void
    terminate () noexcept;

    std::string tag_;
    bool verbose_;

    std::shared_ptr<bp::async_pipe> out_;
    std::shared_ptr<bp::async_pipe> err_;
    std::string buf_;

    bp::group group_;
    bp::child child_;

    bool draining_ = false;
    bool stopped_ = false;
  };
}
