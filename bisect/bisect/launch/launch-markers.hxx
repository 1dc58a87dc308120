#pragma once

#include <optional>
#include <string>

namespace bisect
{
  // Recognizers for the lines builds print while starting up.
  //

  // Local web server: "Web UI available at http://localhost:8000?tkn=..."
  // Return the URL.
  //
  std::optional<std::string>
  match_web_ready (const std::string& line);

  // Device login requested by the CLI tunnel.
  //
  struct device_login
  {
    std::string code;
    std::string url;  // Page to enter the code on.
  };

  // GitHub ("... github.com/login/device ... code ABCD-1234") or Microsoft
  // ("... microsoft.com/devicelogin ... code ABCDEFGHI").
  //
  std::optional<device_login>
  match_device_login (const std::string& line);

  // CLI tunnel ready: "Open this link in your browser <url>". Return the
  // URL pinned to the commit with ?vscode-version=<commit>.
  //
  std::optional<std::string>
  match_tunnel_link (const std::string& line, const std::string& commit);
}
