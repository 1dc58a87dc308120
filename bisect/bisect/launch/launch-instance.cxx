#include <bisect/launch/launch-instance.hxx>

#include <iostream>
#include <system_error>

using namespace std;

namespace bisect
{
  namespace
  {
    void
    trim_line (string& l)
    {
      while (!l.empty () && (l.back () == '\n' || l.back () == '\r'))
        l.pop_back ();
    }

    // Read until the stream closes, echoing lines when verbose.
    //
    asio::awaitable<void>
    drain_pipe (shared_ptr<bp::async_pipe> p,
                string buf,
                string tag,
                bool verbose)
    {
      for (;;)
      {
        boost::system::error_code ec;
        size_t n (co_await asio::async_read_until (
                    *p,
                    asio::dynamic_buffer (buf),
                    '\n',
                    asio::redirect_error (asio::use_awaitable, ec)));

        if (ec)
        {
          if (verbose && !buf.empty ())
            cout << tag << ": " << buf << endl;

          break;
        }

        string l (buf.substr (0, n));
        buf.erase (0, n);
        trim_line (l);

        if (verbose)
          cout << tag << ": " << l << endl;
      }
    }
  }

  process_instance::
  process_instance (asio::io_context& ioc,
                    const fs::path& x,
                    const vector<string>& as,
                    string t,
                    bool v)
    : tag_ (move (t)),
      verbose_ (v),
      out_ (make_shared<bp::async_pipe> (ioc)),
      err_ (make_shared<bp::async_pipe> (ioc))
  {
    if (verbose_)
      cout << "[build] starting build via " << x.string () << "..." << endl;

    child_ = bp::child (x.string (),
                        bp::args (as),
                        bp::std_out > *out_,
                        bp::std_err > *err_,
                        group_,
                        ioc);

    asio::co_spawn (ioc,
                    drain_pipe (err_, string (), tag_, verbose_),
                    asio::detached);
  }

  process_instance::
  ~process_instance ()
  {
    if (!stopped_)
      terminate ();
  }

  asio::awaitable<optional<string>> process_instance::
  read_line ()
  {
    if (draining_)
      co_return nullopt;

    boost::system::error_code ec;
    size_t n (co_await asio::async_read_until (
                *out_,
                asio::dynamic_buffer (buf_),
                '\n',
                asio::redirect_error (asio::use_awaitable, ec)));

    if (ec)
    {
      // Last line without a terminator.
      //
      if (!buf_.empty ())
      {
        string l (move (buf_));
        buf_.clear ();
        trim_line (l);
        co_return l;
      }

      co_return nullopt;
    }

    string l (buf_.substr (0, n));
    buf_.erase (0, n);
    trim_line (l);

    if (verbose_)
      cout << tag_ << ": " << l << endl;

    co_return l;
  }

  void process_instance::
  drain ()
  {
    if (draining_)
      return;

    draining_ = true;

    asio::co_spawn (out_->get_executor (),
                    drain_pipe (out_, move (buf_), tag_, verbose_),
                    asio::detached);
  }

  bool process_instance::
  running ()
  {
    error_code ec;
    return child_.running (ec);
  }

  int process_instance::
  wait ()
  {
    stopped_ = true;
    child_.wait ();
    return child_.exit_code ();
  }

  void process_instance::
  terminate () noexcept
  {
    error_code ec;
    if (group_.valid ())
      group_.terminate (ec);

    if (child_.valid ())
      child_.wait (ec);
  }

  asio::awaitable<void> process_instance::
  stop ()
  {
    if (stopped_)
      co_return;

    stopped_ = true;

    error_code ec;
    if (group_.valid ())
      group_.terminate (ec);

    // The group may already be gone, which is what we want anyway. Only
    // complain if our child is still there. Stopping never throws.
    //
    if (ec)
    {
      error_code rc;
      if (child_.running (rc))
      {
        cerr << "warning: unable to stop process " << id () << ": "
             << ec.message () << endl;
        co_return;
      }
    }

    error_code wc;
    child_.wait (wc);

    co_return;
  }
}
