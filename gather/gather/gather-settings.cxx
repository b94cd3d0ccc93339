#include <gather/gather-settings.hxx>

#include <cstdlib>
#include <stdexcept>

using namespace std;

namespace gather
{
  void settings::
  validate () const
  {
    if (paths.data.empty ())
      throw invalid_argument ("data directory is not specified");

    if (paths.tmp.empty ())
      throw invalid_argument ("temporary directory is not specified");

    if (search.max_concurrent == 0)
      throw invalid_argument ("search concurrency must be positive");

    if (search.page_limit == 0)
      throw invalid_argument ("page limit must be positive");

    if (search.http_timeout == 0)
      throw invalid_argument ("search timeout must be positive");

    // Throws if the node is unusable.
    //
    index_node (search.index_node, search.backend).url ();

    if (download.max_concurrent == 0)
      throw invalid_argument ("download concurrency must be positive");

    if (download.chunk_size == 0)
      throw invalid_argument ("chunk size must be positive");

    if (download.http_timeout == 0)
      throw invalid_argument ("download timeout must be positive");

    if (download.probe_timeout.count () <= 0)
      throw invalid_argument ("probe timeout must be positive");
  }

  fs::path
  resolve_data_root ()
  {
    if (const char* v = getenv ("XDG_DATA_HOME"))
      if (*v != '\0')
        return fs::path (v) / "gather";

    if (const char* h = getenv ("HOME"))
      if (*h != '\0')
        return fs::path (h) / ".local" / "share" / "gather";

    return fs::current_path () / ".gather";
  }

  settings
  default_settings ()
  {
    settings r;

    fs::path d (resolve_data_root ());
    r.paths.data = d / "data";
    r.paths.tmp = d / "tmp";

    return r;
  }
}
