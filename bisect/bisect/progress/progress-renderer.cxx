#include <bisect/progress/progress-renderer.hxx>

#include <algorithm>
#include <iomanip>
#include <sstream>

#include <bisect/progress/progress-format.hxx>

using namespace std;

namespace bisect
{
  using namespace ftxui;

  download_progress::
  download_progress (string l, ostream& os)
    : label_ (move (l)),
      os_ (os),
      start_ (clock::now ()),
      last_draw_ (start_)
  {
  }

  void download_progress::
  update (uint64_t c, uint64_t t)
  {
    current_ = c;
    total_ = t;

    clock::time_point n (clock::now ());
    auto dt (n - last_draw_);

    if (drawn_ && dt < redraw_interval)
      return;

    // Smooth the rate so the number stays readable.
    //
    double s (chrono::duration<double> (dt).count ());
    if (s > 0.0)
    {
      double inst ((c > last_bytes_ ? c - last_bytes_ : 0) / s);
      speed_ = speed_ == 0.0 ? inst : 0.3 * inst + 0.7 * speed_;
    }

    last_bytes_ = c;
    last_draw_ = n;

    draw ();
  }

  void download_progress::
  finish ()
  {
    if (finished_)
      return;

    finished_ = true;

    if (total_ != 0)
      current_ = total_;

    draw ();
    os_ << endl;
  }

  Element download_progress::
  render () const
  {
    bool ind (total_ == 0);
    double p (ind ? 0.0 : static_cast<double> (current_) / total_);

    ostringstream r;
    r << right << setw (4) << static_cast<int> (p * 100) << "%"
      << " " << format_bar (p, ind, bar_width)
      << " | " << setw (12) << format_speed (speed_)
      << " | " << setw (10) << format_bytes (current_);

    if (!ind)
    {
      // Remaining time at the current rate.
      //
      int eta (speed_ > 0.0
               ? static_cast<int> ((total_ - min (current_, total_)) / speed_)
               : 0);

      r << " | " << setw (7) << format_duration (eta);
    }

    return hbox ({
      text (label_),
      filler (),
      text (r.str ())
    });
  }

  void download_progress::
  draw ()
  {
    Element doc (render ());

    Screen s (Screen::Create (Dimension::Full (), Dimension::Fit (doc)));
    Render (s, doc);

    os_ << reset_ << s.ToString () << flush;
    reset_ = s.ResetPosition ();
    drawn_ = true;
  }
}
