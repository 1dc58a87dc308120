#pragma once

#include <cstddef>
#include <optional>
#include <set>
#include <string>

#include <boost/asio.hpp>

#include <bisect/bisect-config.hxx>
#include <bisect/bisect-launcher.hxx>
#include <bisect/bisect-prompt.hxx>
#include <bisect/build/build-types.hxx>
#include <bisect/catalog/catalog.hxx>

namespace bisect
{
  namespace asio = boost::asio;

  struct bisect_request
  {
    build_kind kind;

    // Each either a full commit or a major.minor version.
    //
    std::optional<std::string> good;
    std::optional<std::string> bad;

    std::set<std::string> exclude;
    bool released_only = false;
  };

  enum class bisect_outcome
  {
    found,        // Adjacent good/bad pair.
    all_bad,
    all_good,
    insufficient, // Fewer than two builds in range.
    quit,         // The human stopped the session.
    aborted       // A build could not be launched and retrying was declined.
  };

  struct bisect_result
  {
    bisect_outcome outcome = bisect_outcome::insufficient;
    std::optional<build> good;
    std::optional<build> bad;
    std::size_t steps = 0; // Verdicts given.
  };

  // Interactive binary search over the builds between two boundaries.
  //
  class bisect_engine
  {
  public:
    bisect_engine (const bisect_config&,
                   build_catalog&,
                   build_launcher&,
                   prompter&);

    bisect_engine (const bisect_engine&) = delete;
    bisect_engine& operator= (const bisect_engine&) = delete;

    asio::awaitable<bisect_result>
    run (const bisect_request&);

    // Print the outcome. For a found pair, offer to open the list of changes
    // and show how to continue with git.
    //
    asio::awaitable<void>
    report (const bisect_result&);

    // Turn a full commit or a major.minor version into a commit. Throws
    // commit_not_found for anything else.
    //
    asio::awaitable<std::string>
    resolve_commit (const build_kind&, const std::string&);

  private:
    enum class step_result
    {
      good,
      bad,
      quit,
      aborted
    };

    // Launch the build and get a verdict for it, relaunching on request.
    //
    asio::awaitable<step_result>
    try_build (const build&);

    const bisect_config& cfg_;
    build_catalog& catalog_;
    build_launcher& launcher_;
    prompter& prompter_;
  };

  // https://github.com/microsoft/vscode/compare/<good>...<bad>
  //
  std::string
  compare_url (const std::string& good, const std::string& bad);

  // Command line continuing the search in a source checkout.
  //
  std::string
  git_bisect_command (const std::string& good, const std::string& bad);
}
