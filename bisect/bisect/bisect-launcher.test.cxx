#include <bisect/bisect-launcher.hxx>

#include <cassert>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <thread>

#include <bisect/build/build-errors.hxx>

using namespace std;
using namespace bisect;

namespace
{
  const string commit_id ("3f1b6e5ac86a1a5e1d8d04b1d4d4fa3ec4b8f4e0");

  class null_catalog: public build_catalog
  {
  public:
    asio::awaitable<vector<build>>
    list_commits (const build_kind&, bool) override
    {
      throw catalog_unavailable ("offline");
      co_return vector<build> ();
    }

    asio::awaitable<build>
    resolve_version (const build_kind&, const string&) override
    {
      throw catalog_unavailable ("offline");
      co_return build ();
    }

    asio::awaitable<build_metadata>
    fetch_metadata (const build&) override
    {
      throw catalog_unavailable ("offline");
      co_return build_metadata ();
    }
  };

  class null_source: public artifact_source
  {
  public:
    asio::awaitable<void>
    download (const string& u, const fs::path&, progress_callback) override
    {
      throw download_failed ("offline: " + u);
      co_return;
    }
  };

  class null_prompter: public prompter
  {
  public:
    asio::awaitable<verdict>
    ask_verdict (const string&) override {co_return verdict::quit;}

    asio::awaitable<size_t>
    choose (const string&, const vector<string>& cs) override
    {
      co_return cs.size () - 1;
    }

    asio::awaitable<bool>
    confirm (const string&, bool) override {co_return false;}

    asio::awaitable<string>
    ask_text (const string&) override {co_return string ();}
  };

  template <typename T>
  T
  run (asio::io_context& ioc, asio::awaitable<T> a)
  {
    auto f (asio::co_spawn (ioc, move (a), asio::use_future));
    ioc.restart ();

    while (f.wait_for (chrono::milliseconds (0)) != future_status::ready)
    {
      if (ioc.run_one () == 0)
        ioc.restart ();
    }

    return f.get ();
  }

  struct fixture
  {
    asio::io_context ioc;
    bisect_config cfg;
    null_catalog catalog;
    null_source source;
    null_prompter prompter;

    fixture (const string& name, platform p)
    {
      cfg.root = fs::temp_directory_path () / ("bisect-launcher-test-" + name);
      cfg.target = p;

      fs::remove_all (cfg.root);
    }

    ~fixture ()
    {
      error_code ec;
      fs::remove_all (cfg.root, ec);
    }
  };

  // Write an executable shell script.
  //
  void
  write_script (const fs::path& p, const string& body)
  {
    fs::create_directories (p.parent_path ());
    {
      ofstream o (p);
      o << "#!/bin/sh\n" << body;
    }
    fs::permissions (p, fs::perms::owner_all, fs::perm_options::add);
  }

  const platform linux_x64 {target_os::linux_, target_arch::x64};
}

static void
test_data_directory ()
{
  fixture x ("data", linux_x64);

  fs::create_directories (x.cfg.user_data_directory ());
  {
    ofstream o (x.cfg.user_data_directory () / "stale");
  }

  cache_coordinator c (x.cfg, x.catalog, x.source);
  launch_coordinator l (x.ioc, x.cfg, x.catalog, c, x.prompter);

  assert (fs::is_directory (x.cfg.user_data_directory ()));
  assert (fs::is_directory (x.cfg.extensions_directory ()));
  assert (!fs::exists (x.cfg.user_data_directory () / "stale"));

  l.clear_user_data ();
  assert (!fs::exists (x.cfg.user_data_directory ()));
}

static void
test_arguments ()
{
  fixture x ("args", linux_x64);

  cache_coordinator c (x.cfg, x.catalog, x.source);
  launch_coordinator l (x.ioc, x.cfg, x.catalog, c, x.prompter);

  build web {build_kind {runtime_kind::web_local}, commit_id};
  vector<string> wa (l.launch_args (web));
  assert (wa.size () == 4);
  assert (wa[0] == "--accept-server-license-terms");
  assert (wa[1] == "--extensions-dir");
  assert (wa[2] == x.cfg.extensions_directory ().string ());
  assert (wa[3] == "--skip-release-notes");

  build desk {build_kind {}, commit_id};
  vector<string> da (l.launch_args (desk));
  assert (da.size () == 8);
  assert (da[4] == "--disable-updates");
  assert (da[5] == "--user-data-dir");
  assert (da[6] == x.cfg.user_data_directory ().string ());
  assert (da[7] == "--disable-telemetry");

  build cli {build_kind {runtime_kind::desktop_local,
                         build_quality::insider,
                         build_flavor::cli},
             commit_id};
  assert (l.launch_args (cli) == vector<string> {"tunnel"});
}

static void
test_remote_url ()
{
  fixture x ("remote", linux_x64);

  cache_coordinator c (x.cfg, x.catalog, x.source);
  launch_coordinator l (x.ioc, x.cfg, x.catalog, c, x.prompter);

  build_kind k {runtime_kind::web_remote};

  assert (l.remote_url (build {k, "abc"}) ==
          "https://insiders.vscode.dev/?vscode-version=abc");

  k.quality = build_quality::stable;
  assert (l.remote_url (build {k, "abc"}) ==
          "https://vscode.dev/?vscode-version=abc");

  x.cfg.token = "ghp_token";
  assert (l.remote_url (build {k, "abc"}) ==
          "https://vscode.dev/github/microsoft/vscode/blob/main/"
          "package.json?vscode-version=abc");
}

static void
test_package_commands ()
{
  fixture x ("packages", linux_x64);

  cache_coordinator c (x.cfg, x.catalog, x.source);
  launch_coordinator l (x.ioc, x.cfg, x.catalog, c, x.prompter);

  fs::path p ("/tmp/code.deb");

  assert (l.package_install_command (build_flavor::linux_deb, p) ==
          "sudo dpkg -i \"/tmp/code.deb\"");
  assert (l.package_install_command (build_flavor::linux_rpm, p) ==
          "sudo rpm -Uvh --force \"/tmp/code.deb\"");
  assert (l.package_install_command (build_flavor::linux_snap, p) ==
          "sudo snap install --classic --dangerous \"/tmp/code.deb\"");

  try
  {
    l.package_install_command (build_flavor::win32_user, p);
    assert (false);
  }
  catch (const invalid_argument&) {}
}

static void
test_container_args ()
{
  fixture x ("container", linux_x64);

  cache_coordinator c (x.cfg, x.catalog, x.source);
  launch_coordinator l (x.ioc, x.cfg, x.catalog, c, x.prompter);

  build b {build_kind {runtime_kind::desktop_local,
                       build_quality::stable,
                       build_flavor::cli_alpine_arm64},
           "abc"};

  vector<string> a (l.container_args (b));
  assert (a.size () == 9);
  assert (a[0] == "run");
  assert (a[4] == "linux/arm64");
  assert (a[5] == "alpine");
  assert (a[8].find ("https://update.code.visualstudio.com/commit:abc/"
                     "cli-alpine-arm64/stable") != string::npos);
  assert (a[8].find ("./code tunnel") != string::npos);

  b.kind.flavor = build_flavor::cli_linux_armv7;
  b.kind.quality = build_quality::insider;

  vector<string> v (l.container_args (b));
  assert (v[4] == "linux/arm/v7");
  assert (v[5] == "ubuntu");
  assert (v[8].find ("cli-linux-armhf/insider") != string::npos);
  assert (v[8].find ("./code-insiders tunnel") != string::npos);
}

// A cached server without its executable is reported as such.
//
static void
test_missing_executable ()
{
  fixture x ("missing", linux_x64);

  cache_coordinator c (x.cfg, x.catalog, x.source);
  launch_coordinator l (x.ioc, x.cfg, x.catalog, c, x.prompter);

  build b {build_kind {runtime_kind::web_local}, commit_id};

  fs::path d (c.build_directory (b));
  fs::create_directories (d);
  {
    ofstream o (d / "vscode-server-linux-x64-web.tar.gz");
  }

  try
  {
    run (x.ioc, l.launch (b, launch_options ()));
    assert (false);
  }
  catch (const missing_executable& e)
  {
    assert (string (e.what ()).find ("Is the archive corrupt?") !=
            string::npos);
  }
}

// A server that exits without printing its URL fails the launch.
//
static void
test_server_exits_early ()
{
  fixture x ("early", linux_x64);

  cache_coordinator c (x.cfg, x.catalog, x.source);
  launch_coordinator l (x.ioc, x.cfg, x.catalog, c, x.prompter);

  build b {build_kind {runtime_kind::web_local}, commit_id};

  fs::path d (c.build_directory (b));
  fs::path s (d / "vscode-server-linux-x64-web" / "bin" /
              "code-server-insiders");

  fs::create_directories (s.parent_path ());
  {
    ofstream o (d / "vscode-server-linux-x64-web.tar.gz");
  }
  {
    ofstream o (s);
    o << "#!/bin/sh\n"
      << "echo 'Extension host agent started.'\n"
      << "exit 1\n";
  }
  fs::permissions (s,
                   fs::perms::owner_all,
                   fs::perm_options::add);

  try
  {
    run (x.ioc, l.launch (b, launch_options ()));
    assert (false);
  }
  catch (const missing_executable&)
  {
    assert (false);
  }
  catch (const bisect::error& e)
  {
    assert (string (e.what ()).find ("exited before it was ready") !=
            string::npos);
  }
}

// A server that prints its URL is ready: the URL is opened and the running
// server is handed back until stopped.
//
static void
test_server_ready ()
{
  fixture x ("ready", linux_x64);

  // Stand-in for the desktop's URL opener that records what it was given.
  //
  fs::path bin (x.cfg.root / "bin");
  fs::path opened (x.cfg.root / "opened");

  write_script (bin / "xdg-open",
                "printf '%s' \"$1\" > '" + opened.string () + "'\n");

  string path (bin.string ());
  if (const char* v = getenv ("PATH"))
    path += string (":") + v;
  setenv ("PATH", path.c_str (), 1);

  cache_coordinator c (x.cfg, x.catalog, x.source);
  launch_coordinator l (x.ioc, x.cfg, x.catalog, c, x.prompter);

  build b {build_kind {runtime_kind::web_local}, commit_id};

  fs::path d (c.build_directory (b));
  fs::create_directories (d);
  {
    ofstream o (d / "vscode-server-linux-x64-web.tar.gz");
  }

  write_script (d / "vscode-server-linux-x64-web" / "bin" /
                "code-server-insiders",
                "echo 'Extension host agent started.'\n"
                "echo 'Web UI available at http://localhost:8000/?tkn=5e1d'\n"
                "exec sleep 30\n");

  unique_ptr<instance> i (run (x.ioc, l.launch (b, launch_options ())));
  assert (i != nullptr);

  process_instance* p (dynamic_cast<process_instance*> (i.get ()));
  assert (p != nullptr && p->running ());

  // The opener runs detached.
  //
  for (size_t n (0); n != 100; ++n)
  {
    error_code ec;
    uintmax_t z (fs::file_size (opened, ec));

    if (!ec && z != 0)
      break;

    this_thread::sleep_for (chrono::milliseconds (50));
  }

  {
    ifstream f (opened);
    string u ((istreambuf_iterator<char> (f)), istreambuf_iterator<char> ());
    assert (u == "http://localhost:8000/?tkn=5e1d");
  }

  run (x.ioc, i->stop ());
  assert (!p->running ());
}

int
main ()
{
  test_data_directory ();
  test_arguments ();
  test_remote_url ();
  test_package_commands ();
  test_container_args ();
  test_missing_executable ();
  test_server_exits_early ();
  test_server_ready ();
}
