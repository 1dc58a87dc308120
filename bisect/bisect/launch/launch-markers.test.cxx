#include <bisect/launch/launch-markers.hxx>

#include <cassert>

using namespace std;
using namespace bisect;

static void
test_web_ready ()
{
  auto u (match_web_ready (
    "Web UI available at http://localhost:8000/?tkn=6c1d2e3f-aaaa"));
  assert (u && *u == "http://localhost:8000/?tkn=6c1d2e3f-aaaa");

  auto v (match_web_ready (
    "[main 2024] Web UI available at http://localhost:8000?tkn=abc\r"));
  assert (v && *v == "http://localhost:8000?tkn=abc");

  assert (!match_web_ready ("Extension host agent started."));
  assert (!match_web_ready ("Web UI available at http://localhost:9000/"));
}

static void
test_device_login ()
{
  auto g (match_device_login (
    "To grant access to the server, please log into "
    "https://github.com/login/device and use code 3F2A-9B1C"));
  assert (g);
  assert (g->code == "3F2A-9B1C");
  assert (g->url == "https://github.com/login/device");

  auto m (match_device_login (
    "To sign in, use a web browser to open the page "
    "https://microsoft.com/devicelogin and enter the code ABCD12345 to "
    "authenticate."));
  assert (m);
  assert (m->code == "ABCD12345");
  assert (m->url == "https://microsoft.com/devicelogin");

  // The URL alone is not enough.
  //
  assert (!match_device_login ("open https://github.com/login/device"));
  assert (!match_device_login ("use code 3F2A-9B1C"));
}

static void
test_tunnel_link ()
{
  auto u (match_tunnel_link (
    "Open this link in your browser https://vscode.dev/tunnel/host",
    "abc123"));
  assert (u && *u == "https://vscode.dev/tunnel/host?vscode-version=abc123");

  assert (!match_tunnel_link ("Open this link in your browser not-a-url",
                              "abc123"));
  assert (!match_tunnel_link ("Connected to an existing tunnel process",
                              "abc123"));
}

int
main ()
{
  test_web_ready ();
  test_device_login ();
  test_tunnel_link ();
}
