#include <gather/transfer/transfer-verify.hxx>

#include <stdexcept>

#include <gather/gather-diagnostics.hxx>
#include <gather/transfer/transfer-error.hxx>

using namespace std;

namespace gather
{
  optional<expected_digest>
  expected_checksum (const file_record& f)
  {
    try
    {
      return parse_checksum (f.checksum_type, f.checksum);
    }
    catch (const invalid_argument& e)
    {
      throw checksum_mismatch_error (f.file_id + ": " + e.what ());
    }
  }

  void
  verify (partial_artifact& a, const optional<expected_digest>& e)
  {
    a.close ();

    if (a.size () != a.expected ())
    {
      size_mismatch_error x (a.expected (), a.size ());
      a.discard ();
      throw x;
    }

    if (!e)
      return;

    // Hash the file if the digest was not kept while writing.
    //
    optional<string> h (a.digest ());
    string d (h ? *h : file_digest (a.path (), e->algorithm));

    if (d != e->value)
    {
      trace () << "removing " << a.path () << ": " << to_string (e->algorithm)
               << " is " << d;

      a.discard ();
      throw checksum_mismatch_error (e->value, d);
    }
  }
}
