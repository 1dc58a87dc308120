#include <bisect/launch/launch-markers.hxx>

#include <regex>

using namespace std;

namespace bisect
{
  optional<string>
  match_web_ready (const string& l)
  {
    static const regex re ("Web UI available at "
                           "(http://localhost:8000/?\\?tkn=[^\\s]+)");

    smatch m;
    if (regex_search (l, m, re))
      return m[1].str ();

    return nullopt;
  }

  optional<device_login>
  match_device_login (const string& l)
  {
    static const regex gh ("code ([A-Z0-9]{4}-[A-Z0-9]{4})");
    static const regex ms ("code ([A-Z0-9]{9})");

    smatch m;

    if (l.find ("github.com/login/device") != string::npos)
    {
      if (regex_search (l, m, gh))
        return device_login {m[1].str (), "https://github.com/login/device"};
    }
    else if (l.find ("microsoft.com/devicelogin") != string::npos)
    {
      if (regex_search (l, m, ms))
        return device_login {m[1].str (), "https://microsoft.com/devicelogin"};
    }

    return nullopt;
  }

  optional<string>
  match_tunnel_link (const string& l, const string& commit)
  {
    static const regex re ("Open this link in your browser "
                           "(https?://[^\\s]+)");

    smatch m;
    if (!regex_search (l, m, re))
      return nullopt;

    return m[1].str () + "?vscode-version=" + commit;
  }
}
