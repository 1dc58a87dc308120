#include <bisect/bisect-prompt.hxx>

#include <cassert>
#include <sstream>

using namespace std;
using namespace bisect;

namespace
{
  template <typename T>
  T
  run (asio::awaitable<T> a)
  {
    asio::io_context ioc;
    auto f (asio::co_spawn (ioc, move (a), asio::use_future));
    ioc.run ();
    return f.get ();
  }
}

static void
test_parse_choice ()
{
  vector<string> cs {"Good", "Bad", "Retry", "Retry (fresh user data dir)"};

  assert (parse_choice ("", cs) == 0);
  assert (parse_choice ("2", cs) == 1);
  assert (parse_choice (" bad ", cs) == 1);
  assert (parse_choice ("G", cs) == 0);
  assert (parse_choice ("retry", cs) == 2);   // Exact wins over prefix.
  assert (parse_choice ("retry (", cs) == 3);
  assert (!parse_choice ("re", cs));          // Ambiguous.
  assert (!parse_choice ("5", cs));
  assert (!parse_choice ("0", cs));
  assert (!parse_choice ("maybe", cs));
}

static void
test_console ()
{
  {
    istringstream is ("what\n2\n");
    ostringstream os;
    console_prompter p (is, os);

    assert (run (p.ask_verdict ("abc")) == verdict::bad);
    assert (os.str ().find ("Is abc good or bad?") != string::npos);
    assert (os.str ().find ("invalid choice 'what'") != string::npos);
  }

  // Closed input means quit.
  //
  {
    istringstream is ("");
    ostringstream os;
    console_prompter p (is, os);

    assert (run (p.ask_verdict ("abc")) == verdict::quit);
    assert (!run (p.confirm ("Open?", true)));
    assert (run (p.ask_text ("Commit")).empty ());
    assert (run (p.choose ("Continue?", {"Yes", "No"})) == 1);
  }

  {
    istringstream is ("\nn\n  deadbeef \n");
    ostringstream os;
    console_prompter p (is, os);

    assert (run (p.confirm ("Open?", true)));
    assert (!run (p.confirm ("Open?", true)));
    assert (run (p.ask_text ("Commit")) == "deadbeef");
  }
}

int
main ()
{
  test_parse_choice ();
  test_console ();
}
