#include <gather/transfer/transfer-types.hxx>

#include <stdexcept>

using namespace std;

namespace gather
{
  string
  to_string (transfer_kind k)
  {
    switch (k)
    {
    case transfer_kind::automatic:   return "auto";
    case transfer_kind::simple:      return "simple";
    case transfer_kind::chunked:     return "chunked";
    case transfer_kind::distributed: return "distributed";
    }
    return "auto";
  }

  transfer_kind
  to_transfer_kind (const string& s)
  {
    if (s == "auto")        return transfer_kind::automatic;
    if (s == "simple")      return transfer_kind::simple;
    if (s == "chunked")     return transfer_kind::chunked;
    if (s == "distributed") return transfer_kind::distributed;

    throw invalid_argument ("invalid transfer kind '" + s + "'");
  }
}
