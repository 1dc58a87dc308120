#include <bisect/cache/cache-checksum.hxx>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

#include <openssl/evp.h>

using namespace std;

namespace bisect
{
  string
  sha256_file (const fs::path& p)
  {
    ifstream ifs (p, ios::binary);
    if (!ifs)
      throw runtime_error ("failed to open file for hashing: " + p.string ());

    unique_ptr<EVP_MD_CTX, decltype (&EVP_MD_CTX_free)> ctx (
      EVP_MD_CTX_new (), &EVP_MD_CTX_free);

    if (!ctx || EVP_DigestInit_ex (ctx.get (), EVP_sha256 (), nullptr) != 1)
      throw runtime_error ("failed to initialize sha256 digest");

    char buf[8192];
    while (ifs.read (buf, sizeof (buf)) || ifs.gcount () > 0)
    {
      if (EVP_DigestUpdate (ctx.get (),
                            buf,
                            static_cast<size_t> (ifs.gcount ())) != 1)
        throw runtime_error ("failed to update sha256 digest");
    }

    if (ifs.bad ())
      throw runtime_error ("error reading file for hashing: " + p.string ());

    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int n (0);

    if (EVP_DigestFinal_ex (ctx.get (), out, &n) != 1)
      throw runtime_error ("failed to finalize sha256 digest");

    ostringstream oss;
    for (unsigned int i (0); i < n; ++i)
      oss << hex << setw (2) << setfill ('0') << static_cast<int> (out[i]);

    return oss.str ();
  }

  bool
  compare_checksums (const string& a, const string& b)
  {
    if (a.size () != b.size ())
      return false;

    return equal (a.begin (),
                  a.end (),
                  b.begin (),
                  [] (char x, char y)
    {
      return tolower (static_cast<unsigned char> (x)) ==
             tolower (static_cast<unsigned char> (y));
    });
  }
}
