#include <bisect/search/search-range.hxx>

#include <bisect/build/build-errors.hxx>

using namespace std;

namespace bisect
{
  optional<size_t>
  find_commit (const vector<build>& bs, const string& c)
  {
    for (size_t i (0); i != bs.size (); ++i)
    {
      if (bs[i].commit == c)
        return i;
    }

    return nullopt;
  }

  search_range
  slice_range (const vector<build>& bs,
               const optional<string>& good,
               const optional<string>& bad,
               const set<string>& ex)
  {
    search_range r;

    if (bs.empty ())
      return r;

    size_t bi (0);
    size_t gi (bs.size () - 1);

    if (bad)
    {
      optional<size_t> i (find_commit (bs, *bad));
      if (!i)
        throw commit_not_found ("commit " + *bad + " is not a known build");

      bi = *i;
    }

    if (good)
    {
      optional<size_t> i (find_commit (bs, *good));
      if (!i)
        throw commit_not_found ("commit " + *good + " is not a known build");

      gi = *i;
    }

    if ((good || bad) && bi >= gi)
      throw invalid_range ("bad build " + bs[bi].commit + " must be newer "
                           "than good build " + bs[gi].commit);

    for (size_t i (bi); i <= gi; ++i)
    {
      if (ex.find (bs[i].commit) != ex.end ())
        ++r.excluded;
      else
        r.builds.push_back (bs[i]);
    }

    return r;
  }
}
