#include <bisect/progress/progress-format.hxx>

#include <iomanip>
#include <sstream>

using namespace std;

namespace bisect
{
  string
  format_bytes (uint64_t n)
  {
    ostringstream o;

    if (n < 1024)
      o << n << " B";
    else if (n < 1024 * 1024)
      o << fixed << setprecision (1) << (n / 1024.0) << " KiB";
    else if (n < 1024 * 1024 * 1024)
      o << fixed << setprecision (1) << (n / (1024.0 * 1024.0)) << " MiB";
    else
      o << fixed << setprecision (1)
        << (n / (1024.0 * 1024.0 * 1024.0)) << " GiB";

    return o.str ();
  }

  string
  format_speed (double bps)
  {
    ostringstream o;

    if (bps < 1024)
      o << fixed << setprecision (0) << bps << " B/s";
    else if (bps < 1024 * 1024)
      o << fixed << setprecision (1) << (bps / 1024.0) << " KiB/s";
    else if (bps < 1024 * 1024 * 1024)
      o << fixed << setprecision (1) << (bps / (1024.0 * 1024.0)) << " MiB/s";
    else
      o << fixed << setprecision (1)
        << (bps / (1024.0 * 1024.0 * 1024.0)) << " GiB/s";

    return o.str ();
  }

  string
  format_duration (int s)
  {
    ostringstream o;

    int h (s / 3600);
    int m ((s % 3600) / 60);
    int sec (s % 60);

    if (h > 0)
      o << h << "h";

    o << setfill ('0') << setw (2) << m << "m" << setw (2) << sec << "s";
    return o.str ();
  }

  string
  format_bar (double p, bool ind, int w)
  {
    string r ("[");

    if (ind)
    {
      r += " <==> ";
      for (int i (5); i < w; ++i)
        r += ' ';
    }
    else
    {
      if (p < 0.0)
        p = 0.0;
      else if (p > 1.0)
        p = 1.0;

      int filled (static_cast<int> (p * w));

      for (int i (0); i < w; ++i)
      {
        if (i < filled - 1)
          r += '=';
        else if (i == filled - 1)
          r += '>';
        else
          r += ' ';
      }
    }

    r += ']';
    return r;
  }
}
