#pragma once

#include <string>
#include <vector>

#include <boost/json.hpp>

#include <bisect/build/build-types.hxx>

namespace bisect
{
  // Decoding of update service responses. Anything that does not have the
  // documented shape is reported as catalog_unavailable.
  //

  // A JSON array of commit strings.
  //
  std::vector<std::string>
  parse_commit_list (const boost::json::value&);

  // {"url", "version", "productVersion", "sha256hash"}. Only url and
  // version are required; the rest default to empty.
  //
  build_metadata
  parse_build_metadata (const boost::json::value&);

  // Inverse of parse_build_metadata().
  //
  boost::json::value
  build_metadata_json (const build_metadata&);
}
