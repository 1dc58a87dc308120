#include <bisect/build/build-namer.hxx>

#include <stdexcept>

#include <bisect/build/build-errors.hxx>

using namespace std;

namespace bisect
{
  namespace
  {
    // Artifacts fall into three families that share naming conventions.
    //
    enum class runtime_class
    {
      server,
      desktop,
      cli
    };

    enum class name_strategy
    {
      none,            // No such artifact for this entry.
      fixed,           // Expand the pattern.
      product_version, // Expand the pattern, {version} from metadata.
      url_basename     // Last path component of the metadata URL.
    };

    struct name_rule
    {
      name_strategy strategy;
      const char* pattern;
    };

    // Pattern placeholders:
    //
    // {arch}     x64 or arm64
    // {version}  product version from metadata
    // {insiders} "-insiders" for insider/exploration, empty for stable
    // {Insiders} " - Insiders" likewise
    // {folder}   the expanded installed folder name
    //
    struct name_entry
    {
      runtime_class rc;
      target_os os;
      optional<build_flavor> flavor; // nullopt matches any flavor.
      optional<target_arch> arch;    // nullopt matches any architecture.

      const char* catalog_token;
      const char* platform_token;
      name_rule download;
      name_rule folder;
      const char* executable;        // Relative to the build directory.
      const char* legacy_executable;
    };

    using rc = runtime_class;
    using ns = name_strategy;
    using os = target_os;
    using fl = build_flavor;
    using ar = target_arch;

    const name_rule no_rule {ns::none, nullptr};

    const name_entry entries[] = {
      // Server.
      //
      {rc::server, os::darwin, nullopt, ar::x64,
       "server-darwin-web", "server-darwin-web",
       {ns::fixed, "vscode-server-darwin-{arch}-web.zip"},
       {ns::fixed, "vscode-server-darwin-{arch}-web"},
       "{folder}/bin/code-server{insiders}", "{folder}/server.sh"},

      {rc::server, os::darwin, nullopt, ar::arm64,
       "server-darwin-web", "server-darwin-arm64-web",
       {ns::fixed, "vscode-server-darwin-{arch}-web.zip"},
       {ns::fixed, "vscode-server-darwin-{arch}-web"},
       "{folder}/bin/code-server{insiders}", "{folder}/server.sh"},

      {rc::server, os::linux_, nullopt, nullopt,
       "server-linux-{arch}-web", "server-linux-{arch}-web",
       {ns::fixed, "vscode-server-linux-{arch}-web.tar.gz"},
       {ns::fixed, "vscode-server-linux-{arch}-web"},
       "{folder}/bin/code-server{insiders}", "{folder}/server.sh"},

      // The Windows server zip has no single top-level folder so it is
      // extracted into a directory named after itself.
      //
      {rc::server, os::windows, nullopt, nullopt,
       "server-win32-{arch}-web", "server-win32-{arch}-web",
       {ns::fixed, "vscode-server-win32-{arch}-web.zip"},
       {ns::fixed, "vscode-server-win32-{arch}-web"},
       "{folder}/{folder}/bin/code-server{insiders}.cmd", "{folder}/server.cmd"},

      // Desktop, macOS.
      //
      {rc::desktop, os::darwin, fl::default_, ar::x64,
       "darwin", "darwin",
       {ns::fixed, "VSCode-darwin.zip"},
       {ns::fixed, "Visual Studio Code{Insiders}.app"},
       "{folder}/Contents/MacOS/Electron", nullptr},

      {rc::desktop, os::darwin, fl::default_, ar::arm64,
       "darwin-arm64", "darwin-arm64",
       {ns::fixed, "VSCode-darwin-arm64.zip"},
       {ns::fixed, "Visual Studio Code{Insiders}.app"},
       "{folder}/Contents/MacOS/Electron", nullptr},

      {rc::desktop, os::darwin, fl::darwin_universal, nullopt,
       "darwin-universal", "darwin-universal",
       {ns::fixed, "VSCode-darwin-universal.zip"},
       {ns::fixed, "Visual Studio Code{Insiders}.app"},
       "{folder}/Contents/MacOS/Electron", nullptr},

      // Desktop, Linux. The archive name embeds a build timestamp so we
      // can only learn it from the download URL.
      //
      {rc::desktop, os::linux_, fl::default_, nullopt,
       "linux-{arch}", "linux-{arch}",
       {ns::url_basename, nullptr},
       {ns::fixed, "VSCode-linux-{arch}"},
       "{folder}/code{insiders}", nullptr},

      {rc::desktop, os::linux_, fl::linux_deb, nullopt,
       "linux-{arch}", "linux-deb-{arch}",
       {ns::url_basename, nullptr}, no_rule, nullptr, nullptr},

      {rc::desktop, os::linux_, fl::linux_rpm, nullopt,
       "linux-{arch}", "linux-rpm-{arch}",
       {ns::url_basename, nullptr}, no_rule, nullptr, nullptr},

      {rc::desktop, os::linux_, fl::linux_snap, nullopt,
       "linux-{arch}", "linux-snap-{arch}",
       {ns::url_basename, nullptr}, no_rule, nullptr, nullptr},

      // Desktop, Windows.
      //
      {rc::desktop, os::windows, fl::default_, nullopt,
       "win32-{arch}", "win32-{arch}-archive",
       {ns::product_version, "VSCode-win32-{arch}-{version}.zip"},
       {ns::product_version, "VSCode-win32-{arch}-{version}"},
       "{folder}/Code{Insiders}.exe", nullptr},

      {rc::desktop, os::windows, fl::win32_user, nullopt,
       "win32-{arch}", "win32-{arch}-user",
       {ns::product_version, "VSCodeUserSetup-{arch}-{version}.exe"},
       no_rule, nullptr, nullptr},

      {rc::desktop, os::windows, fl::win32_system, nullopt,
       "win32-{arch}", "win32-{arch}",
       {ns::product_version, "VSCodeSetup-{arch}-{version}.exe"},
       no_rule, nullptr, nullptr},

      // CLI.
      //
      {rc::cli, os::darwin, nullopt, ar::x64,
       "darwin", "cli-darwin-{arch}",
       {ns::fixed, "vscode_cli_darwin_{arch}_cli.zip"},
       {ns::fixed, "code{insiders}"},
       "{folder}", nullptr},

      {rc::cli, os::darwin, nullopt, ar::arm64,
       "darwin-arm64", "cli-darwin-{arch}",
       {ns::fixed, "vscode_cli_darwin_{arch}_cli.zip"},
       {ns::fixed, "code{insiders}"},
       "{folder}", nullptr},

      {rc::cli, os::linux_, nullopt, nullopt,
       "linux-{arch}", "cli-linux-{arch}",
       {ns::fixed, "vscode_cli_linux_{arch}_cli.tar.gz"},
       {ns::fixed, "code{insiders}"},
       "{folder}", nullptr},

      {rc::cli, os::windows, nullopt, nullopt,
       "win32-{arch}", "cli-win32-{arch}",
       {ns::fixed, "vscode_cli_win32_{arch}_cli.zip"},
       {ns::fixed, "code{insiders}"},
       "{folder}.exe", nullptr}
    };

    runtime_class
    classify (const build_kind& k)
    {
      if (k.runtime != runtime_kind::desktop_local)
        return rc::server;

      if (k.flavor == fl::cli || containerized (k.flavor))
        return rc::cli;

      return rc::desktop;
    }

    const name_entry&
    lookup (const build_kind& k, const platform& p)
    {
      runtime_class c (classify (k));

      for (const name_entry& e: entries)
      {
        if (e.rc != c || e.os != p.os)
          continue;

        if (e.flavor && *e.flavor != k.flavor)
          continue;

        if (e.arch && *e.arch != p.arch)
          continue;

        return e;
      }

      throw unsupported_platform ("no " + to_string (k.flavor) + " " +
                                  to_string (k.runtime) + " build for " +
                                  to_string (p.os) + "-" +
                                  to_string (p.arch));
    }

    void
    replace_all (string& s, const string& from, const string& to)
    {
      for (size_t i (s.find (from));
           i != string::npos;
           i = s.find (from, i + to.size ()))
        s.replace (i, from.size (), to);
    }

    string
    expand (const char* pattern,
            const build_kind& k,
            const platform& p,
            const build_metadata* m,
            const string& folder = string ())
    {
      string r (pattern);
      bool ins (insiders_naming (k.quality));

      replace_all (r, "{arch}", to_string (p.arch));
      replace_all (r, "{insiders}", ins ? "-insiders" : "");
      replace_all (r, "{Insiders}", ins ? " - Insiders" : "");
      replace_all (r, "{folder}", folder);

      if (r.find ("{version}") != string::npos)
      {
        if (m == nullptr)
          throw invalid_argument ("build metadata required for " + r);

        replace_all (r, "{version}", m->product_version);
      }

      return r;
    }

    string
    apply (const name_rule& rule,
           const char* what,
           const build_kind& k,
           const platform& p,
           const build_metadata* m)
    {
      switch (rule.strategy)
      {
        case ns::fixed:
          return expand (rule.pattern, k, p, nullptr);

        case ns::product_version:
          return expand (rule.pattern, k, p, m);

        case ns::url_basename:
        {
          if (m == nullptr)
            throw invalid_argument (string ("build metadata required for ") +
                                    what);

          size_t i (m->url.rfind ('/'));
          return i == string::npos ? m->url : m->url.substr (i + 1);
        }

        case ns::none:
          break;
      }

      throw unsupported_platform (string ("no ") + what + " for " +
                                  to_string (k.flavor) + " builds");
    }

    // Join a '/'-separated relative pattern onto a directory.
    //
    fs::path
    join (const fs::path& d, const string& rel)
    {
      fs::path r (d);

      for (size_t b (0), e; b <= rel.size (); b = e + 1)
      {
        e = rel.find ('/', b);
        if (e == string::npos)
          e = rel.size ();

        if (e != b)
          r /= rel.substr (b, e - b);
      }

      return r;
    }
  }

  string
  catalog_name (const build_kind& k, const platform& p)
  {
    return expand (lookup (k, p).catalog_token, k, p, nullptr);
  }

  string
  platform_name (const build_kind& k, const platform& p)
  {
    return expand (lookup (k, p).platform_token, k, p, nullptr);
  }

  bool
  download_name_needs_metadata (const build_kind& k, const platform& p)
  {
    return lookup (k, p).download.strategy != ns::fixed;
  }

  string
  download_name (const build_kind& k,
                 const platform& p,
                 const build_metadata* m)
  {
    return apply (lookup (k, p).download, "download", k, p, m);
  }

  bool
  folder_name_needs_metadata (const build_kind& k, const platform& p)
  {
    return lookup (k, p).folder.strategy == ns::product_version;
  }

  string
  installed_folder_name (const build_kind& k,
                         const platform& p,
                         const build_metadata* m)
  {
    return apply (lookup (k, p).folder, "installed folder", k, p, m);
  }

  fs::path
  executable_path (const build_kind& k,
                   const platform& p,
                   const fs::path& d,
                   const build_metadata* m)
  {
    const name_entry& e (lookup (k, p));

    if (e.executable == nullptr)
      throw unsupported_platform ("no executable for " +
                                  to_string (k.flavor) + " builds");

    string f (apply (e.folder, "installed folder", k, p, m));
    return join (d, expand (e.executable, k, p, m, f));
  }

  optional<fs::path>
  legacy_executable_path (const build_kind& k,
                          const platform& p,
                          const fs::path& d,
                          const build_metadata* m)
  {
    const name_entry& e (lookup (k, p));

    if (e.legacy_executable == nullptr)
      return nullopt;

    string f (apply (e.folder, "installed folder", k, p, m));
    return join (d, expand (e.legacy_executable, k, p, m, f));
  }

  string
  cache_folder_name (const string& commit,
                     build_quality q,
                     build_flavor f,
                     const platform& p)
  {
    string r (p.os == os::windows ? commit.substr (0, 6) : commit);
    string prefix;

    if (q == build_quality::stable)
      prefix = "stable";
    else if (q == build_quality::exploration)
      prefix = "exploration";

    if (f != fl::default_)
    {
      if (!prefix.empty ())
        prefix += '-';

      prefix += to_string (f);
    }

    return prefix.empty () ? r : prefix + '-' + r;
  }
}
