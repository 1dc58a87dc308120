#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include <boost/asio.hpp>

#include <bisect/bisect-cache.hxx>
#include <bisect/bisect-catalog.hxx>
#include <bisect/bisect-config.hxx>
#include <bisect/bisect-engine.hxx>
#include <bisect/bisect-launcher.hxx>
#include <bisect/bisect-options.hxx>
#include <bisect/bisect-prompt.hxx>
#include <bisect/bisect-sanity.hxx>
#include <bisect/build/build-errors.hxx>
#include <bisect/build/build-types.hxx>
#include <bisect/cache/cache-source.hxx>

#include <bisect/version.hxx>

using namespace std;
namespace fs = filesystem;
namespace asio = boost::asio;

namespace bisect
{
  // Launch one build and keep it running until the human is done with it.
  //
  static asio::awaitable<int>
  launch_single (const bisect_config& cfg,
                 build_launcher& l,
                 prompter& p,
                 const build& b)
  {
    unique_ptr<instance> i (co_await l.launch (b, launch_options ()));

    if (i == nullptr)
      co_return 0;

    if (!cfg.performance)
    {
      exception_ptr ex;

      try
      {
        co_await p.ask_text ("Press Enter to stop the build");
      }
      catch (...)
      {
        ex = current_exception ();
      }

      co_await i->stop ();

      if (ex)
        rethrow_exception (ex);
    }
    else
      co_await i->stop ();

    co_return 0;
  }

  static asio::awaitable<int>
  run_session (asio::io_context& ioc,
               const options& o,
               const bisect_config& cfg,
               const build_kind& k)
  {
    catalog_coordinator catalog (ioc, cfg);
    http_artifact_source source (ioc);
    cache_coordinator cache (cfg, catalog, source);
    console_prompter prompter (cin, cout);
    launch_coordinator launcher (ioc, cfg, catalog, cache, prompter);

    // Sanity check: every flavor of one stable build.
    //
    if (o.sanity_specified ())
    {
      print_sanity_banner (cout);

      sanity_checker c (cfg.target, launcher, prompter);
      co_await c.run (o.sanity ());
      co_return 0;
    }

    bisect_engine engine (cfg, catalog, launcher, prompter);

    // Single build.
    //
    optional<string> commit;

    if (o.version_of_specified ())
    {
      build b (co_await catalog.resolve_version (k, o.version_of ()));
      commit = b.commit;
    }
    else if (o.commit_specified ())
    {
      if (o.commit () == "latest")
      {
        vector<build> bs (
          co_await catalog.list_commits (k, o.released_only ()));

        if (bs.empty ())
          throw commit_not_found ("no " + to_string (k.quality) +
                                  " builds available");

        commit = bs.front ().commit;
      }
      else
        commit = co_await engine.resolve_commit (k, o.commit ());
    }

    if (commit)
      co_return co_await launch_single (cfg,
                                        launcher,
                                        prompter,
                                        build {k, *commit});

    // Bisect. Ask for the boundaries that were not given, an empty answer
    // meaning the newest and the oldest build respectively.
    //
    bisect_request r;
    r.kind = k;
    r.released_only = o.released_only ();
    r.exclude.insert (o.exclude ().begin (), o.exclude ().end ());

    if (o.bad_specified ())
      r.bad = o.bad ();
    else
    {
      string s (co_await prompter.ask_text (
        "Commit of a released build that reproduces the issue "
        "(leave empty to pick the latest build)"));

      if (!s.empty ())
        r.bad = move (s);
    }

    if (o.good_specified ())
      r.good = o.good ();
    else
    {
      string s (co_await prompter.ask_text (
        "Commit of a released build that does not reproduce the issue "
        "(leave empty to pick the oldest build)"));

      if (!s.empty ())
        r.good = move (s);
    }

    bisect_result res (co_await engine.run (r));
    co_await engine.report (res);

    co_return res.outcome == bisect_outcome::aborted ? 1 : 0;
  }
}

int
main (int argc, char* argv[])
{
  using namespace bisect;

  try
  {
    options opt (argc, argv);

    // Handle --version.
    //
    if (opt.version ())
    {
      cout << "vscode-bisect " << BISECT_VERSION_STR << "\n";
      return 0;
    }

    // Handle --help.
    //
    if (opt.help ())
    {
      auto& o (cout);

      o << "usage: vscode-bisect [options]" << "\n"
        << "options:"                       << "\n";

      opt.print_usage (o);

      o << "\n"
        << "If no commit is specified, the most recent builds are bisected. "
        << "Use --released-only\n"
        << "to only consider released builds and thus allow older builds to "
        << "be tested.\n";

      return 0;
    }

    bisect_config cfg;
    cfg.verbose = opt.verbose ();
    cfg.root = opt.root_specified () ? fs::path (opt.root ()) : default_root ();

    build_kind k {to_runtime_kind (opt.runtime ()),
                  to_build_quality (opt.quality ()),
                  to_build_flavor (opt.flavor ())};

    // Handle --reset.
    //
    if (opt.reset ())
    {
      cout << "[build] deleting cache directory " << cfg.root.string ()
           << endl;

      error_code ec;
      fs::remove_all (cfg.root, ec);

      if (ec)
        cerr << "warning: unable to delete " << cfg.root.string () << ": "
             << ec.message () << endl;
    }

    // Performance mode. Results are appended to the file by the harness so
    // start it empty.
    //
    if (opt.perf () || opt.perf_file_specified ())
    {
      cfg.performance = true;

      if (opt.perf_file_specified ())
      {
        cfg.performance_file = fs::absolute (opt.perf_file ());

        error_code ec;
        if (fs::exists (cfg.performance_file, ec))
          fs::resize_file (cfg.performance_file, 0);
      }

      if (opt.token_specified () && k.runtime == runtime_kind::web_remote)
        cfg.token = opt.token ();
    }

    asio::io_context ioc;
    int exit_code (0);

    asio::co_spawn (
      ioc,
      run_session (ioc, opt, cfg, k),
      [&exit_code, &ioc] (exception_ptr ex, int r)
      {
        exit_code = r;
        if (ex)
        {
          try { rethrow_exception (ex); }
          catch (const exception& e)
          {
            cerr << "error: " << e.what () << "\n";
            print_troubleshooting (cerr);
            exit_code = 1;
          }
        }
        ioc.stop ();
      });

    ioc.run ();
    return exit_code;
  }
  catch (const cli::exception& ex)
  {
    cerr << "error: " << ex.what () << "\n"
         << "info: run 'vscode-bisect --help' for more information" << endl;
    return 1;
  }
  catch (const exception& ex)
  {
    cerr << "error: " << ex.what () << "\n";
    print_troubleshooting (cerr);
    return 1;
  }
}
