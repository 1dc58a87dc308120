#pragma once

#include <cstddef>
#include <map>
#include <optional>

namespace bisect
{
  // Position of a binary search over a range ordered newest first.
  //
  // The chunk starts at the range length and only shrinks, halving with
  // rounding half up. A bad verdict moves the index toward older builds, a
  // good one toward newer builds, never past either end of the range. The
  // search is over once a verdict is given with a chunk of 1.
  //
  // A move that lands on an already judged build reuses its verdict, so no
  // build is tried twice.
  //
  class search_state
  {
  public:
    // Start over a range of n builds. The first try is placed as if the
    // newest build had been found bad.
    //
    explicit
    search_state (std::size_t n);

    // Index to try next, or nullopt for an empty range.
    //
    std::optional<std::size_t>
    current () const;

    // Record a verdict for current(). Return true if the search is over.
    //
    bool
    advance (bool bad);

    std::size_t
    chunk () const noexcept
    {
      return chunk_;
    }

    long
    index () const noexcept
    {
      return index_;
    }

    // Oldest build judged bad and newest build judged good so far.
    //
    std::optional<std::size_t>
    bad () const;

    std::optional<std::size_t>
    good () const;

  private:
    bool
    move (bool bad);

    std::size_t size_;
    std::size_t chunk_;
    long index_ = 0;
    std::map<std::size_t, bool> verdicts_;
  };

  // Rough number of verdicts needed for n builds.
  //
  std::size_t
  estimated_steps (std::size_t n);
}
