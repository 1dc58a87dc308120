#include <bisect/bisect-engine.hxx>

#include <exception>
#include <iostream>
#include <memory>
#include <regex>
#include <stdexcept>
#include <vector>

#include <bisect/build/build-errors.hxx>
#include <bisect/launch/launch-system.hxx>
#include <bisect/search/search-range.hxx>
#include <bisect/search/search-state.hxx>

using namespace std;

namespace bisect
{
  string
  compare_url (const string& g, const string& b)
  {
    return "https://github.com/microsoft/vscode/compare/" + g + "..." + b;
  }

  string
  git_bisect_command (const string& g, const string& b)
  {
    return "git bisect start && git bisect bad " + b +
           " && git bisect good " + g;
  }

  bisect_engine::
  bisect_engine (const bisect_config& c,
                 build_catalog& cat,
                 build_launcher& l,
                 prompter& p)
    : cfg_ (c),
      catalog_ (cat),
      launcher_ (l),
      prompter_ (p)
  {
  }

  asio::awaitable<string> bisect_engine::
  resolve_commit (const build_kind& k, const string& s)
  {
    static const regex version ("^\\d+\\.\\d+$");
    static const regex commit ("^[0-9a-fA-F]{40}$");

    if (regex_match (s, version))
    {
      build b (co_await catalog_.resolve_version (k, s));

      cout << "[build] latest " << k.quality << " build with version " << s
           << " is " << b.commit << "." << endl;

      co_return b.commit;
    }

    if (regex_match (s, commit))
      co_return s;

    throw commit_not_found ("invalid commit or version '" + s + "': expected "
                            "a full commit hash or a version in the "
                            "major.minor format");
  }

  asio::awaitable<bisect_engine::step_result> bisect_engine::
  try_build (const build& b)
  {
    bool force (false);

    for (;;)
    {
      unique_ptr<instance> i;
      string failure;

      try
      {
        i = co_await launcher_.launch (b, launch_options {force});
      }
      catch (const unsupported_platform&)
      {
        // Retrying cannot help.
        //
        throw;
      }
      catch (const runtime_error& e)
      {
        failure = e.what ();
      }

      if (!failure.empty ())
      {
        cerr << "error: " << failure << endl;

        if (co_await prompter_.confirm ("Would you like to retry?", true))
        {
          force = true;
          continue;
        }

        print_troubleshooting (cerr);
        co_return step_result::aborted;
      }

      // Whatever the answer, the build goes down before we move on.
      //
      verdict v (verdict::quit);
      exception_ptr ex;

      try
      {
        v = co_await prompter_.ask_verdict (b.commit);
      }
      catch (...)
      {
        ex = current_exception ();
      }

      if (i != nullptr)
        co_await i->stop ();

      if (ex)
        rethrow_exception (ex);

      force = false;

      switch (v)
      {
        case verdict::good:        co_return step_result::good;
        case verdict::bad:         co_return step_result::bad;
        case verdict::quit:        co_return step_result::quit;
        case verdict::retry:       break;
        case verdict::retry_fresh: launcher_.clear_user_data (); break;
      }
    }
  }

  asio::awaitable<bisect_result> bisect_engine::
  run (const bisect_request& rq)
  {
    const build_kind& k (rq.kind);

    optional<string> good;
    optional<string> bad;

    if (rq.good)
      good = co_await resolve_commit (k, *rq.good);

    if (rq.bad)
      bad = co_await resolve_commit (k, *rq.bad);

    vector<build> all (co_await catalog_.list_commits (k, rq.released_only));

    // Older builds are only listed among the released ones.
    //
    auto missing = [&all, &good, &bad] ()
    {
      return (good && !find_commit (all, *good)) ||
             (bad && !find_commit (all, *bad));
    };

    if (!rq.released_only && missing ())
    {
      cout << "[build] commit not found among all builds, trying released "
           << "builds only" << endl;

      all = co_await catalog_.list_commits (k, true);
    }

    search_range sr (slice_range (all, good, bad, rq.exclude));

    if (sr.excluded != 0)
      cout << "[build] excluded " << sr.excluded
           << " commit(s) from bisecting" << endl;

    const vector<build>& bs (sr.builds);

    cout << "[build] total " << bs.size () << " builds with roughly "
         << estimated_steps (bs.size ()) << " steps" << endl;

    bisect_result r;

    if (bs.size () < 2)
    {
      r.outcome = bisect_outcome::insufficient;
      co_return r;
    }

    search_state s (bs.size ());

    auto narrowed ([&s, &bs, &r] ()
    {
      if (optional<size_t> i = s.bad ())
        r.bad = bs[*i];

      if (optional<size_t> i = s.good ())
        r.good = bs[*i];
    });

    while (optional<size_t> i = s.current ())
    {
      const build& b (bs[*i]);

      if (cfg_.verbose)
        cout << "[build] trying build " << (*i + 1) << " of " << bs.size ()
             << " (chunk " << s.chunk () << ")" << endl;

      step_result v (co_await try_build (b));

      if (v == step_result::quit || v == step_result::aborted)
      {
        r.outcome = v == step_result::quit
          ? bisect_outcome::quit
          : bisect_outcome::aborted;

        narrowed ();
        co_return r;
      }

      ++r.steps;

      if (s.advance (v == step_result::bad))
        break;
    }

    narrowed ();

    if (r.good && r.bad)
      r.outcome = bisect_outcome::found;
    else if (r.bad)
      r.outcome = bisect_outcome::all_bad;
    else
      r.outcome = bisect_outcome::all_good;

    co_return r;
  }

  asio::awaitable<void> bisect_engine::
  report (const bisect_result& r)
  {
    switch (r.outcome)
    {
      case bisect_outcome::found:
      {
        const string& g (r.good->commit);
        const string& b (r.bad->commit);

        cout << "[build] " << b << " is the first bad commit after " << g
             << "." << endl;

        if (co_await prompter_.confirm (
              "Would you like to open GitHub for the list of changes?", true))
          open_url (compare_url (g, b));

        cout << endl
             << "Run the following commands to continue bisecting via git in "
             << "a folder where VS Code is checked out to:" << endl
             << endl
             << git_bisect_command (g, b) << endl
             << endl;
        break;
      }
      case bisect_outcome::all_bad:
      {
        cout << "[build] All builds are bad! Try running with "
             << "--released-only to support older builds." << endl;
        break;
      }
      case bisect_outcome::all_good:
      {
        cout << "[build] All builds are good! Try running with "
             << "--released-only to support older builds." << endl;
        break;
      }
      case bisect_outcome::insufficient:
      {
        cout << "[build] No builds bisected. Bisect needs at least 2 builds "
             << "from \"main\" branch to work." << endl;
        break;
      }
      case bisect_outcome::quit:
      case bisect_outcome::aborted:
        break;
    }

    co_return;
  }
}
