#include <bisect/search/search-state.hxx>

#include <cmath>

using namespace std;

namespace bisect
{
  search_state::
  search_state (size_t n)
    : size_ (n),
      chunk_ (n)
  {
    if (n != 0)
      move (true);
  }

  optional<size_t> search_state::
  current () const
  {
    if (index_ < 0 || static_cast<size_t> (index_) >= size_)
      return nullopt;

    return static_cast<size_t> (index_);
  }

  bool search_state::
  advance (bool bad)
  {
    if (optional<size_t> i = current ())
      verdicts_[*i] = bad;

    for (;;)
    {
      if (move (bad))
        return true;

      auto i (verdicts_.find (static_cast<size_t> (index_)));
      if (i == verdicts_.end ())
        return false;

      bad = i->second;
    }
  }

  bool search_state::
  move (bool bad)
  {
    if (chunk_ <= 1)
      return true;

    chunk_ = (chunk_ + 1) / 2;

    long c (static_cast<long> (chunk_));
    long last (static_cast<long> (size_) - 1);

    index_ = bad ? index_ + c : index_ - c;

    if (index_ > last)
      index_ = last;
    else if (index_ < 0)
      index_ = 0;

    return false;
  }

  optional<size_t> search_state::
  bad () const
  {
    // Indexes grow toward older builds.
    //
    optional<size_t> r;
    for (const auto& [i, b]: verdicts_)
      if (b)
        r = i;

    return r;
  }

  optional<size_t> search_state::
  good () const
  {
    for (const auto& [i, b]: verdicts_)
      if (!b)
        return i;

    return nullopt;
  }

  size_t
  estimated_steps (size_t n)
  {
    return n < 2 ? 0 : static_cast<size_t> (lround (log2 (n)));
  }
}
