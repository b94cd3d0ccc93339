#pragma once

#include <optional>

#include <gather/search/search-records.hxx>
#include <gather/transfer/transfer-digest.hxx>
#include <gather/transfer/transfer-storage.hxx>

namespace gather
{
  // Digest the file is expected to have according to the catalog, nullopt
  // if the catalog gives no checksum. Throw checksum_mismatch_error if the
  // checksum cannot be interpreted.
  //
  std::optional<expected_digest>
  expected_checksum (const file_record&);

  // Check the acquired artifact against the catalog: byte count first, then
  // digest. On failure discard the artifact and throw size_mismatch_error or
  // checksum_mismatch_error.
  //
  void
  verify (partial_artifact&, const std::optional<expected_digest>&);
}
