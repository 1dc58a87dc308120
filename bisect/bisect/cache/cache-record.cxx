#include <bisect/cache/cache-record.hxx>

#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <system_error>

#include <boost/json.hpp>

#include <bisect/catalog/catalog-parser.hxx>

using namespace std;

namespace bisect
{
  namespace json = boost::json;

  fs::path
  cache_record_path (const fs::path& d)
  {
    return d / ".metadata.json";
  }

  optional<build_metadata>
  read_cache_record (const fs::path& d)
  {
    ifstream i (cache_record_path (d), ios::binary);
    if (!i)
      return nullopt;

    string s ((istreambuf_iterator<char> (i)), istreambuf_iterator<char> ());

    boost::system::error_code ec;
    json::value v (json::parse (s, ec));
    if (ec)
      return nullopt;

    // A record we cannot make sense of is as good as none.
    //
    try
    {
      return parse_build_metadata (v);
    }
    catch (const runtime_error&)
    {
      return nullopt;
    }
  }

  void
  write_cache_record (const fs::path& d, const build_metadata& m)
  {
    fs::path p (cache_record_path (d));

    ofstream o (p, ios::binary | ios::trunc);
    o << json::serialize (build_metadata_json (m));
    o.close ();

    if (!o)
      throw system_error (make_error_code (errc::io_error),
                          "unable to write " + p.string ());
  }
}
