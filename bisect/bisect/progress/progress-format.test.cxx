#include <bisect/progress/progress-format.hxx>

#include <cassert>

using namespace std;
using namespace bisect;

static void
test_bytes ()
{
  assert (format_bytes (0) == "0 B");
  assert (format_bytes (1023) == "1023 B");
  assert (format_bytes (1536) == "1.5 KiB");
  assert (format_bytes (5 * 1024 * 1024) == "5.0 MiB");
  assert (format_bytes (3ULL * 1024 * 1024 * 1024) == "3.0 GiB");
}

static void
test_speed ()
{
  assert (format_speed (500) == "500 B/s");
  assert (format_speed (2048) == "2.0 KiB/s");
  assert (format_speed (1024.0 * 1024.0 * 12.25) == "12.2 MiB/s" ||
          format_speed (1024.0 * 1024.0 * 12.25) == "12.3 MiB/s");
}

static void
test_duration ()
{
  assert (format_duration (0) == "00m00s");
  assert (format_duration (187) == "03m07s");
  assert (format_duration (3723) == "1h02m03s");
}

static void
test_bar ()
{
  assert (format_bar (0.0, false, 4) == "[    ]");
  assert (format_bar (0.5, false, 4) == "[=>  ]");
  assert (format_bar (1.0, false, 4) == "[===>]");
  assert (format_bar (2.0, false, 4) == "[===>]");
  assert (format_bar (0.0, true, 6) == "[ <==>  ]");
}

int
main ()
{
  test_bytes ();
  test_speed ();
  test_duration ();
  test_bar ();
}
