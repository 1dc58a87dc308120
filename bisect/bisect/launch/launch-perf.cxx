#include <bisect/launch/launch-perf.hxx>

#include <iostream>
#include <stdexcept>

#include <boost/process.hpp>

#include <bisect/launch/launch-instance.hxx>

using namespace std;

namespace bisect
{
  namespace bp = boost::process;

  vector<string>
  perf_desktop_args (const fs::path& x, const fs::path& c, const fs::path& t)
  {
    return vector<string> {
      "--build", x.string (),
      "--folder", c.string (),
      "--file", (c / "package.json").string (),
      "--prof-append-timers", t.string ()};
  }

  vector<string>
  perf_web_args (const string& u,
                 const optional<string>& tok,
                 const optional<fs::path>& c,
                 const optional<fs::path>& m)
  {
    vector<string> r {"--build", u, "--runtime", "web"};

    if (tok)
    {
      r.push_back ("--token");
      r.push_back (*tok);
    }

    if (c)
    {
      string f (c->generic_string ());
      if (f.empty () || f.front () != '/')
        f.insert (0, 1, '/');

      r.push_back ("--folder");
      r.push_back (f);
      r.push_back ("--file");
      r.push_back (remote_file_uri (*c / "package.json"));
    }

    if (m)
    {
      r.push_back ("--duration-markers-file");
      r.push_back (m->string ());
    }

    return r;
  }

  string
  remote_file_uri (const fs::path& p)
  {
    string f (p.generic_string ());
    if (f.empty () || f.front () != '/')
      f.insert (0, 1, '/');

    return "vscode-remote://localhost:9888" + f;
  }

  asio::awaitable<chrono::milliseconds>
  run_perf_harness (asio::io_context& ioc,
                    const vector<string>& as,
                    bool verbose)
  {
    auto x (bp::search_path ("vscode-perf"));
    if (x.empty ())
      throw runtime_error ("unable to find vscode-perf in PATH (install it "
                           "with 'npm install -g @vscode/vscode-perf')");

    auto s (chrono::steady_clock::now ());

    process_instance p (ioc, fs::path (x.string ()), as, "[perf]", verbose);

    // The harness prints its own results so always show them.
    //
    while (optional<string> l = co_await p.read_line ())
    {
      if (!verbose)
        cout << *l << endl;
    }

    int r (p.wait ());
    if (r != 0)
      throw runtime_error ("vscode-perf exited with code " + to_string (r));

    co_return chrono::duration_cast<chrono::milliseconds> (
      chrono::steady_clock::now () - s);
  }
}
