#include <bisect/search/search-state.hxx>

#include <cassert>
#include <cmath>
#include <cstddef>
#include <optional>
#include <set>

using namespace std;
using namespace bisect;

namespace
{
  struct outcome
  {
    optional<size_t> bad;
    optional<size_t> good;
    size_t steps = 0;
    set<size_t> tried;
  };

  // Search n builds (newest first) where every build newer than index t is
  // bad and the rest are good.
  //
  outcome
  search (size_t n, size_t t)
  {
    outcome r;
    search_state s (n);

    while (optional<size_t> i = s.current ())
    {
      ++r.steps;

      // Never asked twice about the same build.
      //
      assert (r.tried.insert (*i).second);

      if (s.advance (*i < t))
        break;
    }

    r.bad = s.bad ();
    r.good = s.good ();
    return r;
  }
}

// Six builds: the first try lands in the middle, then the search narrows
// to a single pair.
//
static void
test_six_builds ()
{
  search_state s (6);
  assert (s.chunk () == 3);
  assert (s.current () == 3);

  assert (!s.advance (true));
  assert (s.chunk () == 2);
  assert (s.current () == 5);

  assert (!s.advance (false));
  assert (s.chunk () == 1);
  assert (s.current () == 4);

  assert (s.advance (true));
}

static void
test_bounds ()
{
  for (size_t n (2); n != 300; ++n)
  {
    size_t limit (static_cast<size_t> (ceil (log2 (n))) + 1);

    for (size_t t (0); t <= n; ++t)
    {
      outcome o (search (n, t));
      assert (o.steps <= limit);

      if (t == 0)
        assert (!o.bad);
      else if (t == n)
        assert (!o.good);
      else if (o.bad && o.good)
      {
        // Adjacent and straddling the transition.
        //
        assert (*o.bad + 1 == t);
        assert (*o.good == t);
      }
      else
      {
        // Only the newest build was never tried.
        //
        assert (t == 1 && !o.bad && o.good == 1);
      }
    }
  }
}

static void
test_rounding ()
{
  search_state s (7);
  assert (s.chunk () == 4);
  assert (s.current () == 4);

  s.advance (true);
  assert (s.chunk () == 2);
  assert (s.current () == 6);

  // Running past the oldest build stops at it.
  //
  search_state o (17);
  assert (o.current () == 9);
  o.advance (true);
  assert (o.current () == 14);
  o.advance (true);
  assert (o.chunk () == 3);
  assert (o.current () == 16);
}

// Clamping at either end can bring the index back to a build that was
// already judged. Its verdict is reused instead of asking again.
//
static void
test_judged_again ()
{
  // Three builds, all bad: 2 is judged, then the clamp lands on 2 again.
  //
  {
    search_state s (3);
    assert (s.current () == 2);
    assert (s.advance (true));
    assert (s.bad () == 2 && !s.good ());
  }

  // Five builds, transition at 4: 3 bad, 4 good, then back to 3.
  //
  {
    search_state s (5);
    assert (s.current () == 3);
    assert (!s.advance (true));
    assert (s.current () == 4);
    assert (s.advance (false));
    assert (s.bad () == 3 && s.good () == 4);
  }

  // Seventeen builds, all bad: the oldest is only asked about once.
  //
  {
    search_state s (17);
    assert (!s.advance (true)); // 9
    assert (!s.advance (true)); // 14
    assert (s.current () == 16);
    assert (s.advance (true));
    assert (s.bad () == 16);
  }
}

static void
test_degenerate ()
{
  search_state e (0);
  assert (!e.current ());

  search_state o (1);
  assert (o.current () == 0);
  assert (o.advance (true));

  assert (estimated_steps (0) == 0);
  assert (estimated_steps (1) == 0);
  assert (estimated_steps (200) == 8);
}

int
main ()
{
  test_six_builds ();
  test_bounds ();
  test_rounding ();
  test_judged_again ();
  test_degenerate ();
}
