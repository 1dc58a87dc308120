#include <bisect/bisect-sanity.hxx>

#include <exception>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <ftxui/dom/elements.hpp>
#include <ftxui/screen/screen.hpp>

#include <bisect/bisect-config.hxx>
#include <bisect/build/build-errors.hxx>

using namespace std;

namespace bisect
{
  namespace
  {
    enum class answer
    {
      next,
      retry,
      retry_fresh,
      quit
    };

    // Only plain archives have a user data directory we control.
    //
    bool
    fresh_data_supported (build_flavor f)
    {
      return f == build_flavor::default_ ||
             f == build_flavor::darwin_universal;
    }
  }

  vector<sanity_step>
  sanity_steps (const platform& p)
  {
    string a (to_string (p.arch));
    vector<sanity_step> r;

    switch (p.os)
    {
      case target_os::darwin:
      {
        r.push_back ({build_flavor::default_, "macOS (" + a + ")"});
        r.push_back ({build_flavor::darwin_universal, "macOS (universal)"});
        break;
      }
      case target_os::linux_:
      {
        r.push_back ({build_flavor::default_, "Linux (" + a + ")"});
        r.push_back ({build_flavor::linux_deb, "Linux (Debian)"});
        r.push_back ({build_flavor::linux_rpm, "Linux (RPM)"});

        if (p.arch == target_arch::x64)
          r.push_back ({build_flavor::linux_snap, "Linux (Snap)"});
        break;
      }
      case target_os::windows:
      {
        r.push_back ({build_flavor::default_, "Windows (" + a + ")"});
        r.push_back ({build_flavor::win32_user,
                      "Windows User Installer (" + a + ")"});
        r.push_back ({build_flavor::win32_system,
                      "Windows System Installer (" + a + ")"});
        break;
      }
    }

    r.push_back ({build_flavor::cli, "Server & CLI"});
    return r;
  }

  sanity_checker::
  sanity_checker (const platform& p, build_launcher& l, prompter& pr)
    : target_ (p),
      launcher_ (l),
      prompter_ (pr)
  {
  }

  asio::awaitable<bool> sanity_checker::
  run (const string& commit)
  {
    vector<sanity_step> ss (sanity_steps (target_));

    for (size_t i (0); i != ss.size (); ++i)
    {
      build b {build_kind {runtime_kind::desktop_local,
                           build_quality::stable,
                           ss[i].flavor},
               commit};

      if (!co_await try_step (b, ss[i], i + 1 == ss.size ()))
        co_return false;
    }

    co_return true;
  }

  asio::awaitable<bool> sanity_checker::
  try_step (const build& b, const sanity_step& s, bool last)
  {
    bool fresh (fresh_data_supported (b.kind.flavor));
    bool force (false);

    for (;;)
    {
      unique_ptr<instance> i;
      string failure;

      try
      {
        i = co_await launcher_.launch (b, launch_options {force});
      }
      catch (const unsupported_platform&)
      {
        // Retrying cannot help.
        //
        throw;
      }
      catch (const runtime_error& e)
      {
        failure = e.what ();
      }

      if (!failure.empty ())
      {
        cerr << "error: " << failure << endl;

        vector<answer> as {answer::retry};
        vector<string> cs {"Yes"};

        if (fresh)
        {
          as.push_back (answer::retry_fresh);
          cs.push_back ("Yes (fresh user data dir)");
        }

        as.push_back (answer::next);
        cs.push_back ("No");

        answer a (as[co_await prompter_.choose (
                       "Would you like to restart " + s.label + "?", cs)]);

        if (a == answer::next)
        {
          print_troubleshooting (cerr);
          co_return true;
        }

        if (a == answer::retry_fresh)
          launcher_.clear_user_data ();

        force = true;
        continue;
      }

      // Skipped.
      //
      if (i == nullptr)
        co_return true;

      vector<answer> as {answer::next, answer::retry};
      vector<string> cs {last ? "Done" : "Next", "Retry"};

      if (fresh)
      {
        as.push_back (answer::retry_fresh);
        cs.push_back ("Retry (fresh user data dir)");
      }

      if (!last)
      {
        as.push_back (answer::quit);
        cs.push_back ("Quit");
      }

      answer a (answer::quit);
      exception_ptr ex;

      try
      {
        a = as[co_await prompter_.choose ("Running " + s.label, cs)];
      }
      catch (...)
      {
        ex = current_exception ();
      }

      co_await i->stop ();

      if (ex)
        rethrow_exception (ex);

      switch (a)
      {
        case answer::next:        co_return true;
        case answer::quit:        co_return false;
        case answer::retry:       break;
        case answer::retry_fresh: launcher_.clear_user_data (); break;
      }

      force = false;
    }
  }

  void
  print_sanity_banner (ostream& o)
  {
    using namespace ftxui;

    Element doc (
      vbox ({
        text ("VS Code Build Sanity Checker") | bold,
        text (""),
        text ("Sanity check flavors of VS Code Stable") | dim,
        text (""),
        text ("How it works:") | dim,
        text ("- Run different program flavors step by step") | dim,
        text ("- Verify the program installs and runs as expected") | dim,
        text ("- Continue to the next step") | dim,
        text (""),
        text ("https://github.com/microsoft/vscode/wiki/Sanity-Check") | dim
      }) | border | color (Color::Green));

    Screen s (Screen::Create (Dimension::Fit (doc), Dimension::Fit (doc)));
    Render (s, doc);

    o << s.ToString () << endl;
  }
}
