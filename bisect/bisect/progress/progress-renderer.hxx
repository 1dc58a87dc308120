#pragma once

#include <chrono>
#include <cstdint>
#include <ostream>
#include <string>

#include <ftxui/dom/elements.hpp>
#include <ftxui/screen/screen.hpp>

namespace bisect
{
  // Single-line download progress drawn in place with FTXUI:
  //
  // VSCode-darwin.zip                 42% [=====>   ] | 12.3 MiB/s | 80.1 MiB
  //
  class download_progress
  {
  public:
    // Minimum time between two redraws.
    //
    static constexpr std::chrono::milliseconds redraw_interval {100};

    static constexpr int bar_width = 20;

    download_progress (std::string label, std::ostream&);

    download_progress (const download_progress&) = delete;
    download_progress& operator= (const download_progress&) = delete;

    // Record a new position and redraw if enough time has passed. A zero
    // total means the size is not known.
    //
    void
    update (std::uint64_t current, std::uint64_t total);

    // Draw the final state and move past the line.
    //
    void
    finish ();

    double
    speed () const noexcept
    {
      return speed_;
    }

    // Exposed for tests.
    //
    ftxui::Element
    render () const;

  private:
    void
    draw ();

    using clock = std::chrono::steady_clock;

    std::string label_;
    std::ostream& os_;

    std::uint64_t current_ = 0;
    std::uint64_t total_ = 0;

    clock::time_point start_;
    clock::time_point last_draw_;
    std::uint64_t last_bytes_ = 0;
    double speed_ = 0.0;

    std::string reset_;
    bool drawn_ = false;
    bool finished_ = false;
  };
}
