#include <bisect/bisect-launcher.hxx>

#include <exception>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <system_error>

#include <boost/process.hpp>

#include <bisect/build/build-errors.hxx>
#include <bisect/build/build-namer.hxx>
#include <bisect/launch/launch-markers.hxx>
#include <bisect/launch/launch-perf.hxx>
#include <bisect/launch/launch-system.hxx>

using namespace std;

namespace bisect
{
  namespace bp = boost::process;

  namespace
  {
    string
    quote (const fs::path& p)
    {
      return '"' + p.string () + '"';
    }

    // Name of the desktop application once installed from a package.
    //
    string
    installed_command (build_quality q)
    {
      return insiders_naming (q) ? "code-insiders" : "code";
    }
  }

  launch_coordinator::
  launch_coordinator (asio::io_context& ioc,
                      const bisect_config& c,
                      build_catalog& cat,
                      cache_coordinator& cache,
                      prompter& p)
    : ioc_ (ioc),
      cfg_ (c),
      catalog_ (cat),
      cache_ (cache),
      prompter_ (p)
  {
    reset_data_directory ();
  }

  void launch_coordinator::
  reset_data_directory ()
  {
    fs::path d (cfg_.data_directory ());

    error_code ec;
    fs::remove_all (d, ec);

    if (ec && cfg_.verbose)
      cerr << "warning: unable to remove " << d.string () << ": "
           << ec.message () << endl;

    fs::create_directories (cfg_.user_data_directory ());
    fs::create_directories (cfg_.extensions_directory ());
  }

  void launch_coordinator::
  clear_user_data ()
  {
    fs::path d (cfg_.user_data_directory ());

    cout << "[build] deleting user data directory " << d.string () << endl;

    error_code ec;
    fs::remove_all (d, ec);

    if (ec)
      cerr << "warning: unable to remove " << d.string () << ": "
           << ec.message () << endl;
  }

  vector<string> launch_coordinator::
  launch_args (const build& b) const
  {
    const build_kind& k (b.kind);

    if (k.flavor == build_flavor::cli || containerized (k.flavor))
      return vector<string> {"tunnel"};

    vector<string> r {
      "--accept-server-license-terms",
      "--extensions-dir", cfg_.extensions_directory ().string (),
      "--skip-release-notes"};

    if (k.runtime == runtime_kind::desktop_local)
    {
      r.push_back ("--disable-updates");
      r.push_back ("--user-data-dir");
      r.push_back (cfg_.user_data_directory ().string ());
      r.push_back ("--disable-telemetry");
    }

    return r;
  }

  string launch_coordinator::
  remote_url (const build& b) const
  {
    string h (b.kind.quality == build_quality::insider
              ? "https://insiders.vscode.dev"
              : "https://vscode.dev");

    // Signed in we can open a repository.
    //
    if (cfg_.token)
      return h + "/github/microsoft/vscode/blob/main/package.json"
                 "?vscode-version=" + b.commit;

    return h + "/?vscode-version=" + b.commit;
  }

  string launch_coordinator::
  package_install_command (build_flavor f, const fs::path& p) const
  {
    switch (f)
    {
      case build_flavor::linux_deb:
        return "sudo dpkg -i " + quote (p);
      case build_flavor::linux_rpm:
        return "sudo rpm -Uvh --force " + quote (p);
      case build_flavor::linux_snap:
        return "sudo snap install --classic --dangerous " + quote (p);
      default:
        break;
    }

    throw invalid_argument ("not a package flavor: " + to_string (f));
  }

  vector<string> launch_coordinator::
  container_args (const build& b) const
  {
    optional<container_target> t (containerized (b.kind.flavor));
    if (!t)
      throw invalid_argument ("not a container flavor: " +
                              to_string (b.kind.flavor));

    bool musl (t->libc == container_libc::musl);

    string plat, arch;
    switch (t->arch)
    {
      case container_arch::amd64: plat = "linux/amd64"; arch = "x64";   break;
      case container_arch::arm64: plat = "linux/arm64"; arch = "arm64"; break;
      case container_arch::armv7: plat = "linux/arm/v7"; arch = "armhf"; break;
    }

    string url ("https://update.code.visualstudio.com/commit:" + b.commit +
                "/cli-" + (musl ? "alpine" : "linux") + "-" + arch + "/" +
                to_string (b.kind.quality));

    string setup (musl
                  ? "apk add --no-cache curl ca-certificates"
                  : "apt-get update && apt-get install -y curl ca-certificates");

    string script (setup + " && curl -sSL '" + url + "' | tar -xz && ./" +
                   installed_command (b.kind.quality) + " tunnel");

    return vector<string> {
      "run", "--rm", "-i",
      "--platform", plat,
      musl ? "alpine" : "ubuntu",
      "sh", "-c", script};
  }

  asio::awaitable<fs::path> launch_coordinator::
  find_executable (const build& b, const fs::path& d)
  {
    const build_kind& k (b.kind);
    const platform& p (cfg_.target);

    optional<build_metadata> m;
    if (folder_name_needs_metadata (k, p))
    {
      m = cache_.cached_metadata (b);

      if (!m)
        m = co_await catalog_.fetch_metadata (b);
    }

    const build_metadata* mp (m ? &*m : nullptr);

    if (optional<fs::path> l = legacy_executable_path (k, p, d, mp))
    {
      if (fs::exists (*l))
        co_return *l;
    }

    fs::path x (executable_path (k, p, d, mp));

    if (!fs::exists (x))
      throw missing_executable ("unable to find executable " + x.string () +
                                " on disk. Is the archive corrupt?");

    co_return x;
  }

  asio::awaitable<unique_ptr<instance>> launch_coordinator::
  launch (const build& b, const launch_options& o)
  {
    const build_kind& k (b.kind);

    if (k.runtime == runtime_kind::web_remote)
    {
      if (cfg_.performance)
        co_return co_await run_web_performance (b, nullptr);

      co_return co_await launch_web_remote (b);
    }

    if (containerized (k.flavor))
    {
      auto x (bp::search_path ("docker"));
      if (x.empty ())
        throw missing_executable ("unable to find docker in PATH");

      cout << "[build] starting CLI build " << b.commit << " in a "
           << to_string (k.flavor) << " container..." << endl;

      co_return co_await launch_cli (
        b,
        make_unique<process_instance> (ioc_,
                                       fs::path (x.string ()),
                                       container_args (b),
                                       "[cli]",
                                       cfg_.verbose));
    }

    optional<fs::path> r (co_await cache_.materialize (b, o.force));
    fs::path d (cache_.build_directory (b));

    if (k.runtime == runtime_kind::web_local)
    {
      if (cfg_.performance)
        co_return co_await run_web_performance (b, &d);

      co_return co_await launch_web_local (b, d);
    }

    switch (k.flavor)
    {
      case build_flavor::win32_user:
      case build_flavor::win32_system:
        co_return co_await launch_installer (b, *r);

      case build_flavor::linux_deb:
      case build_flavor::linux_rpm:
      case build_flavor::linux_snap:
        co_return co_await launch_package (b, *r);

      default:
        break;
    }

    if (cfg_.performance)
      co_return co_await run_desktop_performance (b, d);

    if (k.flavor == build_flavor::cli)
    {
      fs::path x (co_await find_executable (b, d));

      cout << "[build] starting CLI build " << b.commit << "..." << endl;

      co_return co_await launch_cli (
        b,
        make_unique<process_instance> (ioc_,
                                       x,
                                       launch_args (b),
                                       "[cli]",
                                       cfg_.verbose));
    }

    co_return co_await launch_desktop (b, d);
  }

  asio::awaitable<launch_coordinator::web_server> launch_coordinator::
  start_web_server (const build& b, const fs::path& d)
  {
    fs::path x (co_await find_executable (b, d));

    auto p (make_unique<process_instance> (ioc_,
                                           x,
                                           launch_args (b),
                                           "[server]",
                                           cfg_.verbose));

    while (optional<string> l = co_await p->read_line ())
    {
      if (optional<string> u = match_web_ready (*l))
      {
        p->drain ();
        co_return web_server {move (p), move (*u)};
      }
    }

    co_await p->stop ();
    throw error ("server for " + b.commit + " exited before it was ready");
  }

  asio::awaitable<unique_ptr<instance>> launch_coordinator::
  launch_web_local (const build& b, const fs::path& d)
  {
    cout << "[build] starting local web build " << b.commit << "..." << endl;

    web_server s (co_await start_web_server (b, d));

    cout << "[build] opening " << s.url << " in your browser..." << endl;
    open_url (s.url);

    co_return move (s.process);
  }

  asio::awaitable<unique_ptr<instance>> launch_coordinator::
  launch_web_remote (const build& b)
  {
    cout << "[build] opening vscode.dev " << b.commit << "..." << endl;

    open_url (remote_url (b));

    co_return make_unique<noop_instance> ();
  }

  asio::awaitable<unique_ptr<instance>> launch_coordinator::
  launch_desktop (const build& b, const fs::path& d)
  {
    fs::path x (co_await find_executable (b, d));

    cout << "[build] starting desktop build " << b.commit << "..." << endl;

    // Desktop builds are considered ready once started.
    //
    auto p (make_unique<process_instance> (ioc_,
                                           x,
                                           launch_args (b),
                                           "[electron]",
                                           cfg_.verbose));
    p->drain ();

    co_return move (p);
  }

  asio::awaitable<unique_ptr<instance>> launch_coordinator::
  launch_cli (const build& b, unique_ptr<process_instance> p)
  {
    while (optional<string> l = co_await p->read_line ())
    {
      if (optional<device_login> d = match_device_login (*l))
      {
        cout << "[build] open " << d->url << " and use code " << d->code
             << " to log in" << endl;

        copy_to_clipboard (d->code);
        open_url (d->url);
      }
      else if (optional<string> u = match_tunnel_link (*l, b.commit))
      {
        cout << "[build] opening " << *u << " in your browser..." << endl;
        open_url (*u);

        p->drain ();
        co_return move (p);
      }
    }

    co_await p->stop ();
    throw error ("CLI for " + b.commit + " exited before the tunnel was "
                 "ready");
  }

  asio::awaitable<unique_ptr<instance>> launch_coordinator::
  launch_installer (const build&, const fs::path& f)
  {
    cout << "[build] installing " << f.string () << "..." << endl;

    auto p (make_unique<process_instance> (ioc_,
                                           f,
                                           vector<string> {"/silent"},
                                           "[installer]",
                                           cfg_.verbose));
    p->drain ();

    co_return move (p);
  }

  asio::awaitable<unique_ptr<instance>> launch_coordinator::
  launch_package (const build& b, const fs::path& f)
  {
    string c (package_install_command (b.kind.flavor, f));

    cout << "[build] run the following command to install the package:"
         << endl
         << endl
         << "  " << c << endl
         << endl;

    if (copy_to_clipboard (c))
      cout << "[build] the command was copied to the clipboard" << endl;

    size_t a (co_await prompter_.choose ("Did you install the package?",
                                         {"Done", "Skip"}));
    if (a != 0)
      co_return nullptr;

    string n (installed_command (b.kind.quality));

    auto x (bp::search_path (n));
    if (x.empty ())
      throw missing_executable ("unable to find " + n + " in PATH. Did the "
                                "installation succeed?");

    cout << "[build] starting installed build " << n << "..." << endl;

    auto p (make_unique<process_instance> (ioc_,
                                           fs::path (x.string ()),
                                           launch_args (b),
                                           "[electron]",
                                           cfg_.verbose));
    p->drain ();

    co_return move (p);
  }

  asio::awaitable<unique_ptr<instance>> launch_coordinator::
  run_desktop_performance (const build& b, const fs::path& d)
  {
    fs::path x (co_await find_executable (b, d));

    fs::path t (cfg_.performance_file.empty ()
                ? cfg_.root / "startup-perf.txt"
                : cfg_.performance_file);

    if (!fs::exists (cfg_.git_directory ()))
      cerr << "warning: no source checkout in "
           << cfg_.git_directory ().string () << endl;

    cout << "[build] starting desktop build " << b.commit
         << " multiple times and measuring performance..." << endl;

    chrono::milliseconds e (
      co_await run_perf_harness (ioc_,
                                 perf_desktop_args (x,
                                                    cfg_.git_directory (),
                                                    t),
                                 cfg_.verbose));

    co_return make_unique<noop_instance> (e);
  }

  asio::awaitable<unique_ptr<instance>> launch_coordinator::
  run_web_performance (const build& b, const fs::path* d)
  {
    web_server s;
    string u;

    if (d != nullptr)
    {
      cout << "[build] starting local web build " << b.commit
           << " multiple times and measuring performance..." << endl;

      s = co_await start_web_server (b, *d);
      u = s.url;
    }
    else
    {
      cout << "[build] opening vscode.dev " << b.commit
           << " multiple times and measuring performance..." << endl;

      u = remote_url (b);
    }

    optional<fs::path> m;
    if (!cfg_.performance_file.empty ())
      m = cfg_.performance_file;

    optional<fs::path> c;
    if (d != nullptr)
      c = cfg_.git_directory ();

    // The server must go down whatever the harness does.
    //
    chrono::milliseconds e (0);
    exception_ptr ex;
    try
    {
      e = co_await run_perf_harness (ioc_,
                                     perf_web_args (u, cfg_.token, c, m),
                                     cfg_.verbose);
    }
    catch (...)
    {
      ex = current_exception ();
    }

    if (s.process)
      co_await s.process->stop ();

    if (ex)
      rethrow_exception (ex);

    co_return make_unique<noop_instance> (e);
  }
}
