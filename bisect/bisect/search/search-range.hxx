#pragma once

#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <bisect/build/build-types.hxx>

namespace bisect
{
  // Candidate builds between the boundaries, newest first.
  //
  struct search_range
  {
    std::vector<build> builds;
    std::size_t excluded = 0; // Builds dropped by the exclusion list.
  };

  // Return the index of commit in builds or nullopt.
  //
  std::optional<std::size_t>
  find_commit (const std::vector<build>&, const std::string& commit);

  // Cut builds (newest first) down to [bad, good]. A missing bad boundary
  // means the newest build, a missing good one the oldest. Then drop the
  // excluded commits.
  //
  // Throws commit_not_found if a boundary is not in the list and
  // invalid_range unless bad is strictly newer than good.
  //
  search_range
  slice_range (const std::vector<build>&,
               const std::optional<std::string>& good,
               const std::optional<std::string>& bad,
               const std::set<std::string>& exclude);
}
