#pragma once

#include <filesystem>
#include <optional>
#include <ostream>
#include <string>

#include <bisect/build/build-types.hxx>

namespace bisect
{
  namespace fs = std::filesystem;

  // Session-wide settings derived from the command line and the host. The
  // driver builds one and hands it by reference to every coordinator.
  //
  struct bisect_config
  {
    bool verbose = false;

    // Hand builds to the external performance harness instead of waiting for
    // a verdict on an interactive instance.
    //
    bool performance = false;
    fs::path performance_file;

    // GitHub token, only used for vscode.dev performance runs.
    //
    std::optional<std::string> token;

    fs::path root;
    platform target = host_platform ();

    fs::path
    builds_directory () const
    {
      return root / ".builds";
    }

    fs::path
    data_directory () const
    {
      return root / ".data";
    }

    fs::path
    user_data_directory () const
    {
      return data_directory () / "data";
    }

    fs::path
    extensions_directory () const
    {
      return data_directory () / "extensions";
    }

    // Source checkout the performance harness opens as its workspace.
    //
    fs::path
    git_directory () const
    {
      return root / "git" / "vscode";
    }
  };

  // <temp>/vscode-bisect.
  //
  fs::path
  default_root ();

  // Print the hints we give after a fatal error.
  //
  void
  print_troubleshooting (std::ostream&);
}
