#include <gather/transfer/transfer-strategy.hxx>

using namespace std;

namespace gather
{
  transfer_strategy
  select_strategy (const file_record& f, const download_settings& s)
  {
    switch (s.kind)
    {
    case transfer_kind::simple:
      return whole_transfer ();
    case transfer_kind::chunked:
      return chunked_transfer {s.chunk_size};
    case transfer_kind::distributed:
      return multi_source_transfer {
        s.chunk_size,
        chrono::duration_cast<chrono::milliseconds> (s.probe_timeout)};
    case transfer_kind::automatic:
      break;
    }

    if (f.size < s.chunk_threshold)
      return whole_transfer ();

    return chunked_transfer {s.chunk_size};
  }

  const char*
  strategy_name (const transfer_strategy& s)
  {
    switch (s.index ())
    {
    case 0: return "whole";
    case 1: return "chunked";
    }
    return "multi-source";
  }
}
