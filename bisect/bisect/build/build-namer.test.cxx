#include <bisect/build/build-namer.hxx>
#include <bisect/build/build-errors.hxx>

#include <cassert>
#include <stdexcept>
#include <string>

using namespace std;
using namespace bisect;

static const platform mac_x64 {target_os::darwin, target_arch::x64};
static const platform mac_arm {target_os::darwin, target_arch::arm64};
static const platform lin_x64 {target_os::linux_, target_arch::x64};
static const platform lin_arm {target_os::linux_, target_arch::arm64};
static const platform win_x64 {target_os::windows, target_arch::x64};
static const platform win_arm {target_os::windows, target_arch::arm64};

static build_kind
kind (runtime_kind r,
      build_flavor f = build_flavor::default_,
      build_quality q = build_quality::insider)
{
  build_kind k;
  k.runtime = r;
  k.quality = q;
  k.flavor = f;
  return k;
}

static build_metadata
meta (const string& url = "", const string& pv = "")
{
  build_metadata m;
  m.url = url;
  m.product_version = pv;
  return m;
}

static void
test_catalog_names ()
{
  auto web (kind (runtime_kind::web_local));
  auto dev (kind (runtime_kind::web_remote));
  auto desk (kind (runtime_kind::desktop_local));
  auto uni (kind (runtime_kind::desktop_local, build_flavor::darwin_universal));
  auto cli (kind (runtime_kind::desktop_local, build_flavor::cli));
  auto deb (kind (runtime_kind::desktop_local, build_flavor::linux_deb));

  assert (catalog_name (web, mac_x64) == "server-darwin-web");
  assert (catalog_name (web, mac_arm) == "server-darwin-web");
  assert (catalog_name (dev, lin_arm) == "server-linux-arm64-web");
  assert (catalog_name (web, win_x64) == "server-win32-x64-web");

  assert (catalog_name (desk, mac_x64) == "darwin");
  assert (catalog_name (desk, mac_arm) == "darwin-arm64");
  assert (catalog_name (uni, mac_arm) == "darwin-universal");
  assert (catalog_name (desk, lin_x64) == "linux-x64");
  assert (catalog_name (deb, lin_x64) == "linux-x64");
  assert (catalog_name (desk, win_arm) == "win32-arm64");
  assert (catalog_name (cli, mac_arm) == "darwin-arm64");
  assert (catalog_name (cli, lin_x64) == "linux-x64");
}

// The metadata endpoint uses different tokens than the commit listing for
// some flavors.
//
static void
test_platform_names ()
{
  auto web (kind (runtime_kind::web_local));
  auto desk (kind (runtime_kind::desktop_local));

  assert (platform_name (web, mac_x64) == "server-darwin-web");
  assert (platform_name (web, mac_arm) == "server-darwin-arm64-web");
  assert (platform_name (web, lin_x64) == "server-linux-x64-web");

  assert (platform_name (desk, win_x64) == "win32-x64-archive");
  assert (platform_name (kind (runtime_kind::desktop_local,
                               build_flavor::win32_user),
                         win_x64) == "win32-x64-user");
  assert (platform_name (kind (runtime_kind::desktop_local,
                               build_flavor::win32_system),
                         win_arm) == "win32-arm64");

  assert (platform_name (desk, lin_x64) == "linux-x64");
  assert (platform_name (kind (runtime_kind::desktop_local,
                               build_flavor::linux_rpm),
                         lin_arm) == "linux-rpm-arm64");
  assert (platform_name (kind (runtime_kind::desktop_local,
                               build_flavor::linux_snap),
                         lin_x64) == "linux-snap-x64");

  auto cli (kind (runtime_kind::desktop_local, build_flavor::cli));
  assert (platform_name (cli, mac_arm) == "cli-darwin-arm64");
  assert (platform_name (cli, win_x64) == "cli-win32-x64");
}

static void
test_download_names ()
{
  auto web (kind (runtime_kind::web_local));
  auto desk (kind (runtime_kind::desktop_local));
  auto cli (kind (runtime_kind::desktop_local, build_flavor::cli));

  assert (download_name (web, mac_arm) == "vscode-server-darwin-arm64-web.zip");
  assert (download_name (web, lin_x64) ==
          "vscode-server-linux-x64-web.tar.gz");
  assert (download_name (web, win_x64) == "vscode-server-win32-x64-web.zip");

  assert (download_name (desk, mac_x64) == "VSCode-darwin.zip");
  assert (download_name (desk, mac_arm) == "VSCode-darwin-arm64.zip");
  assert (download_name (kind (runtime_kind::desktop_local,
                               build_flavor::darwin_universal),
                         mac_x64) == "VSCode-darwin-universal.zip");

  // Linux archives carry a timestamp only the download URL knows.
  //
  assert (download_name_needs_metadata (desk, lin_x64));
  build_metadata lm (
    meta ("https://az764295.vo.msecnd.net/insider/807bf5/"
          "code-insider-x64-1639979337.tar.gz"));
  assert (download_name (desk, lin_x64, &lm) ==
          "code-insider-x64-1639979337.tar.gz");

  // Windows names embed the product version.
  //
  build_metadata wm (meta ("", "1.96.0-insider"));
  assert (download_name_needs_metadata (desk, win_x64));
  assert (download_name (desk, win_x64, &wm) ==
          "VSCode-win32-x64-1.96.0-insider.zip");
  assert (download_name (kind (runtime_kind::desktop_local,
                               build_flavor::win32_user),
                         win_arm, &wm) ==
          "VSCodeUserSetup-arm64-1.96.0-insider.exe");
  assert (download_name (kind (runtime_kind::desktop_local,
                               build_flavor::win32_system),
                         win_x64, &wm) ==
          "VSCodeSetup-x64-1.96.0-insider.exe");

  assert (!download_name_needs_metadata (cli, mac_x64));
  assert (download_name (cli, mac_x64) == "vscode_cli_darwin_x64_cli.zip");
  assert (download_name (cli, lin_arm) ==
          "vscode_cli_linux_arm64_cli.tar.gz");
  assert (download_name (cli, win_arm) == "vscode_cli_win32_arm64_cli.zip");

  try
  {
    download_name (desk, win_x64);
    assert (false);
  }
  catch (const invalid_argument&) {}
}

static void
test_folder_names ()
{
  auto web (kind (runtime_kind::web_local));
  auto desk (kind (runtime_kind::desktop_local));
  auto stable (kind (runtime_kind::desktop_local,
                     build_flavor::default_,
                     build_quality::stable));
  auto expl (kind (runtime_kind::desktop_local,
                   build_flavor::default_,
                   build_quality::exploration));

  assert (installed_folder_name (web, lin_arm) == "vscode-server-linux-arm64-web");
  assert (installed_folder_name (desk, mac_x64) ==
          "Visual Studio Code - Insiders.app");
  assert (installed_folder_name (expl, mac_arm) ==
          "Visual Studio Code - Insiders.app");
  assert (installed_folder_name (stable, mac_arm) == "Visual Studio Code.app");
  assert (installed_folder_name (desk, lin_x64) == "VSCode-linux-x64");

  build_metadata wm (meta ("", "1.95.3"));
  assert (folder_name_needs_metadata (stable, win_x64));
  assert (installed_folder_name (stable, win_x64, &wm) ==
          "VSCode-win32-x64-1.95.3");

  assert (installed_folder_name (kind (runtime_kind::desktop_local,
                                       build_flavor::cli,
                                       build_quality::stable),
                                 lin_x64) == "code");
  assert (installed_folder_name (kind (runtime_kind::desktop_local,
                                       build_flavor::cli),
                                 lin_x64) == "code-insiders");
}

static void
test_executables ()
{
  const fs::path b ("builds");

  auto web (kind (runtime_kind::web_local));
  auto web_stable (kind (runtime_kind::web_local,
                         build_flavor::default_,
                         build_quality::stable));

  assert (executable_path (web, lin_x64, b) ==
          b / "vscode-server-linux-x64-web" / "bin" / "code-server-insiders");
  assert (executable_path (web_stable, mac_arm, b) ==
          b / "vscode-server-darwin-arm64-web" / "bin" / "code-server");
  assert (executable_path (web, win_x64, b) ==
          b / "vscode-server-win32-x64-web" / "vscode-server-win32-x64-web" /
          "bin" / "code-server-insiders.cmd");

  auto legacy (legacy_executable_path (web, lin_x64, b));
  assert (legacy);
  assert (*legacy == b / "vscode-server-linux-x64-web" / "server.sh");

  auto wlegacy (legacy_executable_path (web, win_arm, b));
  assert (wlegacy);
  assert (*wlegacy == b / "vscode-server-win32-arm64-web" / "server.cmd");

  auto desk (kind (runtime_kind::desktop_local));
  assert (!legacy_executable_path (desk, lin_x64, b));

  assert (executable_path (desk, mac_x64, b) ==
          b / "Visual Studio Code - Insiders.app" / "Contents" / "MacOS" /
          "Electron");
  assert (executable_path (desk, lin_arm, b) ==
          b / "VSCode-linux-arm64" / "code-insiders");

  build_metadata wm (meta ("", "1.95.3"));
  auto stable (kind (runtime_kind::desktop_local,
                     build_flavor::default_,
                     build_quality::stable));
  assert (executable_path (stable, win_x64, b, &wm) ==
          b / "VSCode-win32-x64-1.95.3" / "Code.exe");
  assert (executable_path (desk, win_x64, b, &wm) ==
          b / "VSCode-win32-x64-1.95.3" / "Code - Insiders.exe");

  auto cli (kind (runtime_kind::desktop_local, build_flavor::cli));
  assert (executable_path (cli, mac_arm, b) == b / "code-insiders");
  assert (executable_path (cli, win_x64, b) == b / "code-insiders.exe");
}

static void
test_cache_folders ()
{
  const string c ("807bf598bea406dcb272a9fced54697986e87768");

  assert (cache_folder_name (c, build_quality::insider,
                             build_flavor::default_, lin_x64) == c);
  assert (cache_folder_name (c, build_quality::stable,
                             build_flavor::default_, mac_arm) == "stable-" + c);
  assert (cache_folder_name (c, build_quality::exploration,
                             build_flavor::cli, lin_x64) ==
          "exploration-cli-" + c);
  assert (cache_folder_name (c, build_quality::insider,
                             build_flavor::linux_deb, lin_x64) ==
          "linux-deb-" + c);

  // Windows keeps paths short.
  //
  assert (cache_folder_name (c, build_quality::insider,
                             build_flavor::default_, win_x64) == "807bf5");
  assert (cache_folder_name (c, build_quality::stable,
                             build_flavor::win32_user, win_arm) ==
          "stable-win32-user-807bf5");
}

static void
test_unsupported ()
{
  auto fail ([] (build_flavor f, const platform& p)
  {
    try
    {
      catalog_name (kind (runtime_kind::desktop_local, f), p);
      assert (false);
    }
    catch (const unsupported_platform&) {}
  });

  fail (build_flavor::linux_deb, win_x64);
  fail (build_flavor::win32_user, lin_x64);
  fail (build_flavor::darwin_universal, lin_arm);
  fail (build_flavor::linux_snap, mac_x64);

  // Installers have no executable of their own.
  //
  try
  {
    build_metadata m (meta ("https://x/code_1.0_amd64.deb"));
    executable_path (kind (runtime_kind::desktop_local,
                           build_flavor::linux_deb),
                     lin_x64, "b", &m);
    assert (false);
  }
  catch (const unsupported_platform&) {}
}

int
main ()
{
  test_catalog_names ();
  test_platform_names ();
  test_download_names ();
  test_folder_names ();
  test_executables ();
  test_cache_folders ();
  test_unsupported ();
}
