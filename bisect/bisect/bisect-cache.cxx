#include <bisect/bisect-cache.hxx>

#include <cstdint>
#include <iostream>
#include <system_error>

#include <bisect/build/build-errors.hxx>
#include <bisect/build/build-namer.hxx>
#include <bisect/cache/cache-checksum.hxx>
#include <bisect/cache/cache-extract.hxx>
#include <bisect/cache/cache-record.hxx>
#include <bisect/progress/progress-renderer.hxx>

using namespace std;

namespace bisect
{
  cache_coordinator::
  cache_coordinator (const bisect_config& c,
                     build_catalog& cat,
                     artifact_source& src)
    : cfg_ (c),
      catalog_ (cat),
      source_ (src)
  {
  }

  fs::path cache_coordinator::
  build_directory (const build& b) const
  {
    return cfg_.builds_directory () / cache_folder_name (b.commit,
                                                         b.kind.quality,
                                                         b.kind.flavor,
                                                         cfg_.target);
  }

  optional<build_metadata> cache_coordinator::
  cached_metadata (const build& b) const
  {
    return read_cache_record (build_directory (b));
  }

  fs::path cache_coordinator::
  extraction_directory (const build& b,
                        const fs::path& a,
                        const fs::path& d) const
  {
    // Windows desktop and server zips have no single top-level folder so
    // they get a directory named after the archive.
    //
    const build_kind& k (b.kind);

    if (cfg_.target.os == target_os::windows &&
        k.flavor == build_flavor::default_ &&
        (k.runtime == runtime_kind::desktop_local ||
         k.runtime == runtime_kind::web_local))
    {
      fs::path r (a);
      r.replace_extension ();
      return r;
    }

    return d;
  }

  asio::awaitable<optional<fs::path>> cache_coordinator::
  materialize (const build& b, bool force)
  {
    const build_kind& k (b.kind);
    const platform& p (cfg_.target);

    if (containerized (k.flavor))
      co_return nullopt;

    fs::path d (build_directory (b));

    // Only go to the service up front if the name depends on it and the
    // entry does not already record it.
    //
    optional<build_metadata> m;
    if (download_name_needs_metadata (k, p))
    {
      if (!force)
        m = read_cache_record (d);

      if (!m)
        m = co_await catalog_.fetch_metadata (b);
    }

    string n (download_name (k, p, m ? &*m : nullptr));
    fs::path a (d / n);

    bool present (fs::exists (a));

    if (present && !force)
    {
      if (cfg_.verbose)
        cout << "[build] using " << a.string ()
             << " for the next build to try" << endl;

      if (installer (k.flavor))
        co_return a;

      co_return extraction_directory (b, a, d);
    }

    if (present)
    {
      cout << "[build] deleting " << d.string ()
           << " and retrying download" << endl;

      fs::remove_all (d);
    }

    try
    {
      if (!m)
        m = co_await catalog_.fetch_metadata (b);

      fs::create_directories (d);

      fs::path part (a);
      part += ".part";

      cout << "[build] downloading build from " << m->url << "..." << endl;

      download_progress pr (n, cout);
      co_await source_.download (
        m->url,
        part,
        [&pr] (uint64_t c, uint64_t t) {pr.update (c, t);});
      pr.finish ();

      string h (sha256_file (part));

      if (!compare_checksums (h, m->sha256))
        throw integrity_error ("expected SHA256 checksum (" + m->sha256 +
                               ") does not match with download (" + h + ")");

      cout << "[build] expected SHA256 checksum matches with download"
           << endl;

      fs::rename (part, a);
      write_cache_record (d, *m);

      if (installer (k.flavor))
        co_return a;

      fs::path x (extraction_directory (b, a, d));

      cout << "[build] unzipping " << a.string () << " to " << x.string ()
           << "..." << endl;

      extract_archive (a, x, p.os == target_os::windows);

      co_return x;
    }
    catch (...)
    {
      error_code ec;
      fs::remove_all (d, ec);

      if (ec)
        cerr << "warning: unable to remove " << d.string () << ": "
             << ec.message () << endl;

      throw;
    }
  }
}
