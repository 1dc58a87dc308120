#include <bisect/bisect-prompt.hxx>

#include <algorithm>
#include <cctype>
#include <istream>
#include <ostream>

using namespace std;

namespace bisect
{
  namespace
  {
    string
    lower (string s)
    {
      transform (s.begin (),
                 s.end (),
                 s.begin (),
                 [] (unsigned char c)
      {
        return static_cast<char> (tolower (c));
      });

      return s;
    }

    string
    trim (const string& s)
    {
      size_t b (s.find_first_not_of (" \t\r\n"));
      if (b == string::npos)
        return string ();

      size_t e (s.find_last_not_of (" \t\r\n"));
      return s.substr (b, e - b + 1);
    }

    asio::awaitable<optional<string>>
    blocking_getline (istream& is)
    {
      string l;
      if (!getline (is, l))
        co_return nullopt;

      co_return l;
    }
  }

  optional<size_t>
  parse_choice (const string& a, const vector<string>& cs)
  {
    string s (lower (trim (a)));

    if (s.empty ())
      return cs.empty () ? nullopt : optional<size_t> (0);

    if (all_of (s.begin (), s.end (), [] (unsigned char c)
                {
                  return isdigit (c) != 0;
                }))
    {
      if (s.size () > 9)
        return nullopt;

      size_t n (stoul (s));
      if (n >= 1 && n <= cs.size ())
        return n - 1;

      return nullopt;
    }

    // Unique prefix match.
    //
    optional<size_t> r;
    for (size_t i (0); i != cs.size (); ++i)
    {
      string c (lower (cs[i]));

      if (c == s)
        return i;

      if (c.compare (0, s.size (), s) == 0)
      {
        if (r)
          return nullopt;

        r = i;
      }
    }

    return r;
  }

  console_prompter::
  console_prompter (istream& is, ostream& os)
    : is_ (is),
      os_ (os),
      pool_ (1)
  {
  }

  asio::awaitable<optional<string>> console_prompter::
  read_line ()
  {
    co_return co_await asio::co_spawn (pool_,
                                       blocking_getline (is_),
                                       asio::use_awaitable);
  }

  asio::awaitable<optional<size_t>> console_prompter::
  select (const string& q, const vector<string>& cs)
  {
    for (;;)
    {
      os_ << "? " << q << endl;

      for (size_t i (0); i != cs.size (); ++i)
        os_ << "  " << (i + 1) << ") " << cs[i] << endl;

      os_ << "> " << flush;

      optional<string> l (co_await read_line ());
      if (!l)
        co_return nullopt;

      if (optional<size_t> r = parse_choice (*l, cs))
        co_return r;

      os_ << "invalid choice '" << *l << "'" << endl;
    }
  }

  asio::awaitable<verdict> console_prompter::
  ask_verdict (const string& label)
  {
    static const vector<string> cs {
      "Good", "Bad", "Retry", "Retry (fresh user data dir)", "Quit"};

    optional<size_t> r (co_await select ("Is " + label + " good or bad?", cs));

    if (!r)
      co_return verdict::quit;

    switch (*r)
    {
      case 0: co_return verdict::good;
      case 1: co_return verdict::bad;
      case 2: co_return verdict::retry;
      case 3: co_return verdict::retry_fresh;
    }

    co_return verdict::quit;
  }

  asio::awaitable<size_t> console_prompter::
  choose (const string& q, const vector<string>& cs)
  {
    optional<size_t> r (co_await select (q, cs));

    // Closed input picks the last choice, which is the way out.
    //
    co_return r ? *r : (cs.empty () ? 0 : cs.size () - 1);
  }

  asio::awaitable<bool> console_prompter::
  confirm (const string& q, bool d)
  {
    for (;;)
    {
      os_ << "? " << q << (d ? " [Y/n] " : " [y/N] ") << flush;

      optional<string> l (co_await read_line ());
      if (!l)
        co_return false;

      string a (lower (trim (*l)));

      if (a.empty ())
        co_return d;

      if (a == "y" || a == "yes")
        co_return true;

      if (a == "n" || a == "no")
        co_return false;
    }
  }

  asio::awaitable<string> console_prompter::
  ask_text (const string& q)
  {
    os_ << "? " << q << ": " << flush;

    optional<string> l (co_await read_line ());
    co_return l ? trim (*l) : string ();
  }
}
