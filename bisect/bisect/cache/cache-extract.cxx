#include <bisect/cache/cache-extract.hxx>

#include <string>
#include <system_error>
#include <vector>

#include <boost/process.hpp>

#include <miniz.h>

#include <bisect/build/build-errors.hxx>

using namespace std;

namespace bisect
{
  namespace bp = boost::process;

  namespace
  {
    bool
    ends_with (const string& s, const string& x)
    {
      return s.size () >= x.size () &&
             s.compare (s.size () - x.size (), x.size (), x) == 0;
    }

    // Run a tool to completion with its output discarded and throw if it
    // fails.
    //
    void
    run_tool (const string& name, const vector<string>& args)
    {
      auto p (bp::search_path (name));
      if (p.empty ())
        throw extraction_failed ("unable to find " + name + " in PATH");

      int r;
      try
      {
        bp::child c (p,
                     bp::args (args),
                     bp::std_out > bp::null,
                     bp::std_err > bp::null);
        c.wait ();
        r = c.exit_code ();
      }
      catch (const bp::process_error& e)
      {
        throw extraction_failed ("failed to run " + name + ": " + e.what ());
      }

      if (r != 0)
        throw extraction_failed (name + " exited with code " +
                                 to_string (r));
    }
  }

  void
  extract_zip_inprocess (const fs::path& a, const fs::path& d)
  {
    mz_zip_archive z = {};
    if (!mz_zip_reader_init_file (&z, a.string ().c_str (), 0))
      throw extraction_failed ("failed to open zip archive " + a.string ());

    mz_uint n (mz_zip_reader_get_num_files (&z));

    for (mz_uint i (0); i < n; ++i)
    {
      mz_zip_archive_file_stat s;
      if (!mz_zip_reader_file_stat (&z, i, &s))
      {
        mz_zip_reader_end (&z);
        throw extraction_failed ("corrupt zip entry " + to_string (i) +
                                 " in " + a.string ());
      }

      // Entries must stay below the destination.
      //
      fs::path e (fs::path (s.m_filename).lexically_normal ());

      if (e.is_absolute () ||
          e.has_root_name () ||
          e.has_root_directory () ||
          (!e.empty () && *e.begin () == ".."))
      {
        mz_zip_reader_end (&z);
        throw extraction_failed ("zip entry " + string (s.m_filename) +
                                 " in " + a.string () +
                                 " escapes the destination");
      }

      fs::path p (d / e);

      error_code ec;
      if (mz_zip_reader_is_file_a_directory (&z, i))
      {
        fs::create_directories (p, ec);
        continue;
      }

      fs::create_directories (p.parent_path (), ec);

      if (!mz_zip_reader_extract_to_file (&z, i, p.string ().c_str (), 0))
      {
        mz_zip_reader_end (&z);
        throw extraction_failed ("failed to extract " +
                                 string (s.m_filename));
      }
    }

    mz_zip_reader_end (&z);
  }

  void
  extract_zip_system (const fs::path& a, const fs::path& d)
  {
    run_tool ("unzip", {"-q", a.string (), "-d", d.string ()});
  }

  void
  extract_tarball (const fs::path& a, const fs::path& d)
  {
    error_code ec;
    fs::create_directories (d, ec);
    if (ec)
      throw extraction_failed ("unable to create " + d.string () + ": " +
                               ec.message ());

    run_tool ("tar", {"-xzf", a.string (), "-C", d.string ()});
  }

  void
  extract_archive (const fs::path& a, const fs::path& d, bool inproc)
  {
    string n (a.filename ().string ());

    if (ends_with (n, ".zip"))
    {
      if (inproc)
        extract_zip_inprocess (a, d);
      else
        extract_zip_system (a, d);
    }
    else if (ends_with (n, ".tar.gz") || ends_with (n, ".tgz"))
      extract_tarball (a, d);
    else
      throw extraction_failed ("unsupported archive format: " + n);
  }
}
