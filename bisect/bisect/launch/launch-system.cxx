#include <bisect/launch/launch-system.hxx>

#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include <boost/process.hpp>

using namespace std;

namespace bisect
{
  namespace bp = boost::process;

  void
  open_url (const string& u)
  {
#ifdef _WIN32
    string t ("cmd");
    vector<string> as {"/c", "start", "", u};
#elif defined(__APPLE__)
    string t ("open");
    vector<string> as {u};
#else
    string t ("xdg-open");
    vector<string> as {u};
#endif

    auto p (bp::search_path (t));
    if (p.empty ())
    {
      cerr << "warning: unable to find " << t << ", open " << u
           << " manually" << endl;
      return;
    }

    try
    {
      bp::child c (p,
                   bp::args (as),
                   bp::std_out > bp::null,
                   bp::std_err > bp::null);
      c.detach ();
    }
    catch (const bp::process_error& e)
    {
      cerr << "warning: unable to open " << u << ": " << e.what () << endl;
    }
  }

  bool
  copy_to_clipboard (const string& s)
  {
#ifdef _WIN32
    vector<pair<string, vector<string>>> cs {{"clip", {}}};
#elif defined(__APPLE__)
    vector<pair<string, vector<string>>> cs {{"pbcopy", {}}};
#else
    vector<pair<string, vector<string>>> cs {
      {"wl-copy", {}},
      {"xclip", {"-selection", "clipboard"}},
      {"xsel", {"--clipboard", "--input"}}};
#endif

    for (const auto& [t, as]: cs)
    {
      auto p (bp::search_path (t));
      if (p.empty ())
        continue;

      try
      {
        bp::opstream in;
        bp::child c (p,
                     bp::args (as),
                     bp::std_in < in,
                     bp::std_out > bp::null,
                     bp::std_err > bp::null);

        in << s;
        in.flush ();
        in.pipe ().close ();

        c.wait ();

        if (c.exit_code () == 0)
          return true;
      }
      catch (const bp::process_error& e)
      {
        cerr << "warning: " << t << " failed: " << e.what () << endl;
      }
    }

    cerr << "warning: unable to copy to the clipboard" << endl;
    return false;
  }
}
