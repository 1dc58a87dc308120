#pragma once

#include <cstddef>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio.hpp>

namespace bisect
{
  namespace asio = boost::asio;

  // Answer for one launched build.
  //
  enum class verdict
  {
    good,
    bad,
    quit,
    retry,       // Launch the same build again.
    retry_fresh  // Same, with a clean user data directory.
  };

  // Everything that needs a human. The engine and the launcher only see
  // this interface so that tests can script the answers.
  //
  class prompter
  {
  public:
    virtual
    ~prompter () = default;

    // Ask whether the build identified by label is good or bad.
    //
    virtual asio::awaitable<verdict>
    ask_verdict (const std::string& label) = 0;

    // Pick one of the choices and return its index. The first choice is
    // the default.
    //
    virtual asio::awaitable<std::size_t>
    choose (const std::string& question,
            const std::vector<std::string>& choices) = 0;

    virtual asio::awaitable<bool>
    confirm (const std::string& question, bool default_answer) = 0;

    // Free-form answer, empty if the human just pressed enter.
    //
    virtual asio::awaitable<std::string>
    ask_text (const std::string& question) = 0;
  };

  // Prompter on the terminal.
  //
  // Standard input is read on a worker thread so that the calling context
  // keeps draining the output of running builds while the human thinks.
  // Closing standard input answers quit, no or empty.
  //
  class console_prompter: public prompter
  {
  public:
    console_prompter (std::istream&, std::ostream&);

    console_prompter (const console_prompter&) = delete;
    console_prompter& operator= (const console_prompter&) = delete;

    asio::awaitable<verdict>
    ask_verdict (const std::string& label) override;

    asio::awaitable<std::size_t>
    choose (const std::string& question,
            const std::vector<std::string>& choices) override;

    asio::awaitable<bool>
    confirm (const std::string& question, bool default_answer) override;

    asio::awaitable<std::string>
    ask_text (const std::string& question) override;

  private:
    asio::awaitable<std::optional<std::string>>
    read_line ();

    // Choose, with nullopt if input is closed.
    //
    asio::awaitable<std::optional<std::size_t>>
    select (const std::string& question,
            const std::vector<std::string>& choices);

    std::istream& is_;
    std::ostream& os_;
    asio::thread_pool pool_;
  };

  // Parse a choice answer: a 1-based number or a case-insensitive prefix of
  // one of the choices. An empty answer selects the first one.
  //
  std::optional<std::size_t>
  parse_choice (const std::string& answer,
                const std::vector<std::string>& choices);
}
