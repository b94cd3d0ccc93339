#include <gather/gather-diagnostics.hxx>

#include <mutex>
#include <iostream>

using namespace std;

namespace gather
{
  int verb (1);

  // Serialize the writes so that lines from concurrent transfers do not
  // interleave.
  //
  static mutex diag_mutex;

  diag_record::
  ~diag_record ()
  {
    if (!active_)
      return;

    string s (os_.str ());

    lock_guard<mutex> l (diag_mutex);
    cerr << prefix_ << s << endl;
  }

  diag_record
  error ()
  {
    return diag_record ("error: ", true);
  }

  diag_record
  warn ()
  {
    return diag_record ("warning: ", verb >= 1);
  }

  diag_record
  info ()
  {
    return diag_record ("info: ", verb >= 2);
  }

  diag_record
  trace ()
  {
    return diag_record ("trace: ", verb >= 3);
  }
}
