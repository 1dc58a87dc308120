#include <bisect/catalog/catalog-parser.hxx>

#include <bisect/build/build-errors.hxx>

using namespace std;

namespace bisect
{
  namespace json = boost::json;

  vector<string>
  parse_commit_list (const json::value& v)
  {
    const json::array* a (v.if_array ());

    if (a == nullptr)
      throw catalog_unavailable ("expected array of commits from update "
                                 "service");

    vector<string> r;
    r.reserve (a->size ());

    for (const json::value& e: *a)
    {
      const json::string* s (e.if_string ());

      if (s == nullptr)
        throw catalog_unavailable ("expected commit string in update "
                                   "service response");

      r.emplace_back (s->data (), s->size ());
    }

    return r;
  }

  build_metadata
  parse_build_metadata (const json::value& v)
  {
    const json::object* o (v.if_object ());

    if (o == nullptr)
      throw catalog_unavailable ("expected build metadata object from "
                                 "update service");

    auto field ([o] (const char* n, bool required) -> string
    {
      const json::value* f (o->if_contains (n));

      if (f == nullptr || !f->is_string ())
      {
        if (required)
          throw catalog_unavailable (string ("missing '") + n +
                                     "' in build metadata");

        return string ();
      }

      const json::string& s (f->get_string ());
      return string (s.data (), s.size ());
    });

    build_metadata m;
    m.url = field ("url", true);
    m.version = field ("version", true);
    m.product_version = field ("productVersion", false);
    m.sha256 = field ("sha256hash", false);
    return m;
  }

  json::value
  build_metadata_json (const build_metadata& m)
  {
    json::object o;
    o["url"] = m.url;
    o["version"] = m.version;
    o["productVersion"] = m.product_version;
    o["sha256hash"] = m.sha256;
    return o;
  }
}
