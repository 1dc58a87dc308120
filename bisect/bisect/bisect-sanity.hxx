#pragma once

#include <ostream>
#include <string>
#include <vector>

#include <boost/asio.hpp>

#include <bisect/bisect-launcher.hxx>
#include <bisect/bisect-prompt.hxx>
#include <bisect/build/build-types.hxx>

namespace bisect
{
  namespace asio = boost::asio;

  struct sanity_step
  {
    build_flavor flavor;
    std::string label;
  };

  // Flavors worth checking on the platform, in the order we walk them.
  //
  std::vector<sanity_step>
  sanity_steps (const platform&);

  // Walks every packaging flavor of one stable commit, launching each in
  // turn and asking the human to move on.
  //
  class sanity_checker
  {
  public:
    sanity_checker (const platform&, build_launcher&, prompter&);

    sanity_checker (const sanity_checker&) = delete;
    sanity_checker& operator= (const sanity_checker&) = delete;

    // Return false if the human quit before the last step.
    //
    asio::awaitable<bool>
    run (const std::string& commit);

  private:
    // Return false to stop the walk.
    //
    asio::awaitable<bool>
    try_step (const build&, const sanity_step&, bool last);

    platform target_;
    build_launcher& launcher_;
    prompter& prompter_;
  };

  void
  print_sanity_banner (std::ostream&);
}
