#pragma once

#include <cstdint>
#include <string>

namespace bisect
{
  // Human-readable sizes and rates in IEC units ("1.5 MiB", "300 KiB/s").
  //
  std::string
  format_bytes (std::uint64_t);

  std::string
  format_speed (double bytes_per_second);

  // "03m07s", or "1h02m03s" once past the hour.
  //
  std::string
  format_duration (int seconds);

  // Fixed-width "[=====>    ]" bar. An unknown total renders a static
  // indicator instead of a fill.
  //
  std::string
  format_bar (double ratio, bool indeterminate, int width);
}
