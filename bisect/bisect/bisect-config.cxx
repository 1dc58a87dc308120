#include <bisect/bisect-config.hxx>

#include <system_error>

#include <bisect/version.hxx>

using namespace std;

namespace bisect
{
  fs::path
  default_root ()
  {
    error_code ec;
    fs::path t (fs::temp_directory_path (ec));

    // No usable temp directory (TMPDIR pointing nowhere and the like).
    //
    if (ec)
      t = fs::current_path ();

    return t / "vscode-bisect";
  }

  void
  print_troubleshooting (ostream& o)
  {
    o << '\n'
      << "Error Troubleshooting Guide:\n"
      << "- run 'vscode-bisect --verbose' for more detailed output\n"
      << "- run 'vscode-bisect --reset' to delete the cache folder\n"
      << "- run 'vscode-bisect --exclude <commit>' to exclude problematic "
      << "commits from bisecting\n"
      << "- update vscode-bisect to the latest version (your version: "
      << BISECT_VERSION_STR << ")\n"
      << endl;
  }
}
