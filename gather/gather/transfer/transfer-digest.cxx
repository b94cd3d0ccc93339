#include <gather/transfer/transfer-digest.hxx>

#include <cctype>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <stdexcept>

using namespace std;

namespace gather
{
  string
  to_string (digest_algorithm a)
  {
    switch (a)
    {
    case digest_algorithm::md5:    return "MD5";
    case digest_algorithm::sha1:   return "SHA1";
    case digest_algorithm::sha256: return "SHA256";
    case digest_algorithm::sha512: return "SHA512";
    }
    return "SHA256";
  }

  static const EVP_MD*
  evp_of (digest_algorithm a)
  {
    switch (a)
    {
    case digest_algorithm::md5:    return EVP_md5 ();
    case digest_algorithm::sha1:   return EVP_sha1 ();
    case digest_algorithm::sha256: return EVP_sha256 ();
    case digest_algorithm::sha512: return EVP_sha512 ();
    }
    return EVP_sha256 ();
  }

  static string
  lower (string s)
  {
    for (char& c: s)
      c = static_cast<char> (tolower (static_cast<unsigned char> (c)));
    return s;
  }

  optional<expected_digest>
  parse_checksum (const string& type, const string& checksum)
  {
    if (checksum.empty ())
      return nullopt;

    string t (lower (type)), v (lower (checksum));

    if (t == "md5")    return expected_digest {digest_algorithm::md5, v};
    if (t == "sha1")   return expected_digest {digest_algorithm::sha1, v};
    if (t == "sha256") return expected_digest {digest_algorithm::sha256, v};
    if (t == "sha512") return expected_digest {digest_algorithm::sha512, v};

    if (t != "multihash")
      throw invalid_argument ("unsupported checksum type '" + type + '\'');

    if (v.size () < 4 || v.find_first_not_of ("0123456789abcdef") != string::npos)
      throw invalid_argument ("malformed multihash '" + checksum + '\'');

    unsigned long code (stoul (v.substr (0, 2), nullptr, 16));
    unsigned long size (stoul (v.substr (2, 2), nullptr, 16));

    digest_algorithm a;
    switch (code)
    {
    case 0x11: a = digest_algorithm::sha1;   break;
    case 0x12: a = digest_algorithm::sha256; break;
    case 0x13: a = digest_algorithm::sha512; break;
    default:
      throw invalid_argument ("unsupported multihash function code '" +
                              v.substr (0, 2) + '\'');
    }

    string d (v.substr (4));

    if (d.size () != size * 2)
      throw invalid_argument ("multihash '" + checksum +
                              "' digest length does not match its prefix");

    return expected_digest {a, move (d)};
  }

  digest::
  digest (digest_algorithm a)
    : algorithm_ (a), ctx_ (EVP_MD_CTX_new ())
  {
    if (!ctx_)
      throw runtime_error ("unable to allocate digest context");

    reset ();
  }

  void digest::
  reset ()
  {
    if (EVP_DigestInit_ex (ctx_.get (), evp_of (algorithm_), nullptr) != 1)
      throw runtime_error ("unable to initialize " + to_string (algorithm_) +
                           " digest");
  }

  void digest::
  update (const void* data, size_t size)
  {
    if (EVP_DigestUpdate (ctx_.get (), data, size) != 1)
      throw runtime_error ("unable to update " + to_string (algorithm_) +
                           " digest");
  }

  string digest::
  hex () const
  {
    // Finalize a copy so that more data can still be added.
    //
    unique_ptr<EVP_MD_CTX, deleter> c (EVP_MD_CTX_new ());

    if (!c || EVP_MD_CTX_copy_ex (c.get (), ctx_.get ()) != 1)
      throw runtime_error ("unable to copy digest context");

    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int n (0);

    if (EVP_DigestFinal_ex (c.get (), md, &n) != 1)
      throw runtime_error ("unable to finalize " + to_string (algorithm_) +
                           " digest");

    ostringstream oss;
    for (unsigned int i (0); i < n; ++i)
      oss << std::hex << setw (2) << setfill ('0') << static_cast<int> (md[i]);

    return oss.str ();
  }

  string
  file_digest (const filesystem::path& p, digest_algorithm a)
  {
    ifstream ifs (p, ios::binary);

    if (!ifs)
      throw runtime_error ("unable to open " + p.string ());

    digest d (a);
    char buf[1 << 16];

    while (ifs)
    {
      ifs.read (buf, sizeof (buf));

      if (ifs.gcount () > 0)
        d.update (buf, static_cast<size_t> (ifs.gcount ()));
    }

    if (ifs.bad ())
      throw runtime_error ("unable to read " + p.string ());

    return d.hex ();
  }
}
