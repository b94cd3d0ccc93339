#pragma once

#include <filesystem>

#include <gather/search/search-types.hxx>
#include <gather/transfer/transfer-types.hxx>

namespace gather
{
  namespace fs = std::filesystem;

  // Process configuration.
  //
  struct settings
  {
    struct paths_type
    {
      fs::path data; // Final files.
      fs::path tmp;  // Partial artifacts.
    };

    paths_type paths;
    search_settings search;
    download_settings download;

    // Throw std::invalid_argument on a value that cannot work (zero limits
    // and sizes, unusable index node, empty paths).
    //
    void
    validate () const;
  };

  // Default settings with the data and temporary directories under the
  // user's data root.
  //
  settings
  default_settings ();

  // Per-user data directory: $XDG_DATA_HOME/gather, ~/.local/share/gather,
  // or .gather in the current directory if neither is available.
  //
  fs::path
  resolve_data_root ();
}
