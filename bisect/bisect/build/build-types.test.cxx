#include <bisect/build/build-types.hxx>

#include <cassert>
#include <stdexcept>
#include <string>

using namespace std;
using namespace bisect;

// Command line spellings must survive a round trip and unknown values must
// be rejected with the offending value in the message.
//
static void
test_runtime ()
{
  assert (to_runtime_kind ("desktop") == runtime_kind::desktop_local);
  assert (to_runtime_kind ("web") == runtime_kind::web_local);
  assert (to_runtime_kind ("vscode.dev") == runtime_kind::web_remote);

  assert (to_string (runtime_kind::web_remote) == "vscode.dev");

  try
  {
    to_runtime_kind ("electron");
    assert (false);
  }
  catch (const invalid_argument& e)
  {
    assert (string (e.what ()) == "unknown runtime: electron");
  }
}

static void
test_quality ()
{
  assert (to_build_quality ("stable") == build_quality::stable);
  assert (to_build_quality ("insider") == build_quality::insider);
  assert (to_build_quality ("exploration") == build_quality::exploration);

  try
  {
    to_build_quality ("insiders");
    assert (false);
  }
  catch (const invalid_argument&) {}

  assert (!insiders_naming (build_quality::stable));
  assert (insiders_naming (build_quality::insider));
  assert (insiders_naming (build_quality::exploration));
}

static void
test_flavor ()
{
  const char* names[] = {
    "default", "universal", "win32-user", "win32-system", "linux-deb",
    "linux-rpm", "linux-snap", "cli", "cli-linux-amd64", "cli-linux-arm64",
    "cli-linux-armv7", "cli-alpine-amd64", "cli-alpine-arm64"};

  for (const char* n: names)
    assert (to_string (to_build_flavor (n)) == n);

  try
  {
    to_build_flavor ("flatpak");
    assert (false);
  }
  catch (const invalid_argument& e)
  {
    assert (string (e.what ()) == "unknown flavor: flatpak");
  }
}

static void
test_classification ()
{
  assert (!containerized (build_flavor::cli));
  assert (!containerized (build_flavor::default_));

  auto a (containerized (build_flavor::cli_alpine_arm64));
  assert (a);
  assert (a->arch == container_arch::arm64);
  assert (a->libc == container_libc::musl);

  auto l (containerized (build_flavor::cli_linux_armv7));
  assert (l);
  assert (l->arch == container_arch::armv7);
  assert (l->libc == container_libc::glibc);

  assert (installer (build_flavor::win32_user));
  assert (installer (build_flavor::win32_system));
  assert (installer (build_flavor::linux_deb));
  assert (installer (build_flavor::linux_rpm));
  assert (installer (build_flavor::linux_snap));
  assert (!installer (build_flavor::darwin_universal));
  assert (!installer (build_flavor::cli));
}

int
main ()
{
  test_runtime ();
  test_quality ();
  test_flavor ();
  test_classification ();
}
