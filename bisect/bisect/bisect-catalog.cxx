#include <bisect/bisect-catalog.hxx>

#include <iostream>

#include <bisect/build/build-errors.hxx>
#include <bisect/build/build-namer.hxx>
#include <bisect/catalog/catalog-endpoint.hxx>
#include <bisect/catalog/catalog-parser.hxx>

using namespace std;

namespace bisect
{
  namespace json = boost::json;

  string
  catalog_version (const string& mm, build_quality q)
  {
    switch (q)
    {
      case build_quality::insider:     return mm + ".0-insider";
      case build_quality::exploration: return mm + ".0-exploration";
      case build_quality::stable:      break;
    }
    return mm + ".0";
  }

  catalog_coordinator::
  catalog_coordinator (asio::io_context& ioc, const bisect_config& cfg)
    : cfg_ (cfg),
      http_ (ioc)
  {
  }

  asio::awaitable<json::value> catalog_coordinator::
  get_json (const string& u)
  {
    if (cfg_.verbose)
      cout << "[fetch] GET " << u << endl;

    http_response r (co_await http_.get_response (u));

    if (!r.is_success ())
      throw catalog_unavailable ("update service request " + u +
                                 " failed: " + format_http_error (r));

    try
    {
      co_return parse_json (r.body ? *r.body : string ());
    }
    catch (const runtime_error& e)
    {
      throw catalog_unavailable ("invalid response from " + u + ": " +
                                 e.what ());
    }
  }

  asio::awaitable<vector<build>> catalog_coordinator::
  list_commits (const build_kind& k, bool released)
  {
    string u (catalog_endpoint::commits (to_string (k.quality),
                                         catalog_name (k, cfg_.target),
                                         released));

    cout << "[build] fetching all builds from " << u << "..." << endl;

    vector<string> cs (parse_commit_list (co_await get_json (u)));

    vector<build> r;
    r.reserve (cs.size ());

    for (string& c: cs)
      r.push_back (build {k, move (c)});

    co_return r;
  }

  asio::awaitable<build> catalog_coordinator::
  resolve_version (const build_kind& k, const string& v)
  {
    string u (catalog_endpoint::version (catalog_version (v, k.quality),
                                         catalog_name (k, cfg_.target),
                                         to_string (k.quality)));

    if (cfg_.verbose)
      cout << "[fetch] GET " << u << endl;

    http_response r (co_await http_.get_response (u));

    if (r.status == http_status::not_found)
      throw unknown_version ("no " + to_string (k.quality) +
                             " build found for version " + v);

    if (!r.is_success ())
      throw catalog_unavailable ("update service request " + u +
                                 " failed: " + format_http_error (r));

    build_metadata m;
    try
    {
      m = parse_build_metadata (parse_json (r.body ? *r.body : string ()));
    }
    catch (const catalog_unavailable&)
    {
      throw;
    }
    catch (const runtime_error& e)
    {
      throw catalog_unavailable ("invalid response from " + u + ": " +
                                 e.what ());
    }

    co_return build {k, move (m.version)};
  }

  asio::awaitable<build_metadata> catalog_coordinator::
  fetch_metadata (const build& b)
  {
    string u (catalog_endpoint::commit (b.commit,
                                        platform_name (b.kind, cfg_.target),
                                        to_string (b.kind.quality)));

    co_return parse_build_metadata (co_await get_json (u));
  }
}
