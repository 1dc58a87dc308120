#include <bisect/search/search-range.hxx>

#include <bisect/build/build-errors.hxx>

#include <cassert>

using namespace std;
using namespace bisect;

namespace
{
  vector<build>
  make_builds (size_t n)
  {
    // c<n-1> ... c0, newest first.
    //
    vector<build> r;
    for (size_t i (n); i != 0; --i)
      r.push_back (build {build_kind {}, "c" + to_string (i - 1)});

    return r;
  }
}

static void
test_defaults ()
{
  vector<build> bs (make_builds (6));

  search_range r (slice_range (bs, nullopt, nullopt, {}));
  assert (r.builds == bs);
  assert (r.excluded == 0);

  assert (slice_range (vector<build> (), nullopt, nullopt, {}).builds.empty ());
}

static void
test_boundaries ()
{
  vector<build> bs (make_builds (6));

  search_range r (slice_range (bs, string ("c1"), string ("c4"), {}));
  assert (r.builds.size () == 4);
  assert (r.builds.front ().commit == "c4");
  assert (r.builds.back ().commit == "c1");

  search_range g (slice_range (bs, string ("c3"), nullopt, {}));
  assert (g.builds.size () == 3);
  assert (g.builds.front ().commit == "c5");

  search_range b (slice_range (bs, nullopt, string ("c2"), {}));
  assert (b.builds.size () == 3);
  assert (b.builds.back ().commit == "c0");
}

static void
test_invalid ()
{
  vector<build> bs (make_builds (6));

  // Equal boundaries.
  //
  try
  {
    slice_range (bs, string ("c3"), string ("c3"), {});
    assert (false);
  }
  catch (const invalid_range&) {}

  // Good newer than bad.
  //
  try
  {
    slice_range (bs, string ("c4"), string ("c1"), {});
    assert (false);
  }
  catch (const invalid_range&) {}

  // Good boundary is the newest build, so nothing can be newer.
  //
  try
  {
    slice_range (bs, string ("c5"), nullopt, {});
    assert (false);
  }
  catch (const invalid_range&) {}

  try
  {
    slice_range (bs, string ("nope"), nullopt, {});
    assert (false);
  }
  catch (const commit_not_found&) {}
}

static void
test_exclude ()
{
  vector<build> bs (make_builds (6));

  search_range r (slice_range (bs,
                               string ("c1"),
                               string ("c4"),
                               {"c2", "c5", "unknown"}));

  // Only excluded commits inside the range count.
  //
  assert (r.excluded == 1);
  assert (r.builds.size () == 3);

  for (const build& b: r.builds)
    assert (b.commit != "c2");
}

int
main ()
{
  test_defaults ();
  test_boundaries ();
  test_invalid ();
  test_exclude ();
}
