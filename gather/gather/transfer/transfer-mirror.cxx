#include <gather/transfer/transfer-mirror.hxx>

#include <set>

using namespace std;

namespace gather
{
  vector<string>
  candidate_sources (const file_record& f, const vector<file_record>& ms)
  {
    vector<string> r;
    set<string> seen;

    if (!f.url.empty () && seen.insert (f.url).second)
      r.push_back (f.url);

    for (const file_record& m: ms)
    {
      if (m.size != f.size || m.url.empty ())
        continue;

      if (seen.insert (m.url).second)
        r.push_back (m.url);
    }

    return r;
  }
}
