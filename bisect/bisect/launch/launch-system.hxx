#pragma once

#include <string>

namespace bisect
{
  // Open a URL in the default browser without waiting for it.
  //
  // Failures are reported as warnings: the user can always open the link by
  // hand.
  //
  void
  open_url (const std::string& url);

  // Put text on the system clipboard. Return false (after printing a
  // warning) if no clipboard utility is available.
  //
  bool
  copy_to_clipboard (const std::string& text);
}
