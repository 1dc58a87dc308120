#include <bisect/cache/cache-source.hxx>

#include <stdexcept>

#include <bisect/build/build-errors.hxx>

using namespace std;

namespace bisect
{
  asio::awaitable<void> http_artifact_source::
  download (const string& u, const fs::path& t, progress_callback cb)
  {
    // Both Beast and our own failures derive from runtime_error.
    //
    string e;

    try
    {
      co_await http_.download_file (u, t, move (cb));
      co_return;
    }
    catch (const runtime_error& x)
    {
      e = x.what ();
    }

    throw download_failed ("unable to download " + u + ": " + e);
  }
}
