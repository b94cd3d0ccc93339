#pragma once

#include <string>
#include <chrono>
#include <cstdint>
#include <cstddef>
#include <ostream>
#include <filesystem>

namespace gather
{
  namespace fs = std::filesystem;

  // Transfer task state.
  //
  enum class transfer_state
  {
    pending,     // Waiting for a slot
    starting,    // Preparing the temporary artifact
    downloading, // Acquiring bytes
    verifying,   // Checking size and checksum
    completed,   // Promoted to its final path
    failed,      // Failed with error
    cancelled    // Aborted by the caller
  };

  inline std::ostream&
  operator<< (std::ostream& os, transfer_state s)
  {
    switch (s)
    {
    case transfer_state::pending:     return os << "pending";
    case transfer_state::starting:    return os << "starting";
    case transfer_state::downloading: return os << "downloading";
    case transfer_state::verifying:   return os << "verifying";
    case transfer_state::completed:   return os << "completed";
    case transfer_state::failed:      return os << "failed";
    case transfer_state::cancelled:   return os << "cancelled";
    }
    return os;
  }

  // Byte progress of a transfer.
  //
  struct transfer_progress
  {
    std::uint64_t total_bytes {0};
    std::uint64_t acquired_bytes {0};

    double
    percent () const
    {
      return total_bytes > 0 ? (acquired_bytes * 100.0) / total_bytes : 0.0;
    }

    bool
    completed () const
    {
      return acquired_bytes >= total_bytes;
    }
  };

  inline std::ostream&
  operator<< (std::ostream& os, const transfer_progress& p)
  {
    return os << p.acquired_bytes << '/' << p.total_bytes
              << " (" << p.percent () << "%)";
  }

  // How files are acquired.
  //
  enum class transfer_kind
  {
    automatic,   // Whole below the chunk threshold, chunked otherwise
    simple,      // Always a single whole-body request
    chunked,     // Sequential byte ranges from the catalog URL
    distributed  // Byte ranges spread over all mirrors
  };

  std::string
  to_string (transfer_kind);

  // Accept auto, simple, chunked, distributed. Throw std::invalid_argument
  // otherwise.
  //
  transfer_kind
  to_transfer_kind (const std::string&);

  inline std::ostream&
  operator<< (std::ostream& os, transfer_kind k)
  {
    return os << to_string (k);
  }

  // Download engine configuration.
  //
  struct download_settings
  {
    std::uint64_t chunk_size = 1 << 26;

    // Seconds.
    //
    std::uint32_t http_timeout = 20;

    std::size_t max_concurrent = 5;

    transfer_kind kind = transfer_kind::automatic;

    // Files of at least this size are chunked in the automatic mode.
    //
    std::uint64_t chunk_threshold = 1 << 26;

    // Mirror probe timeout.
    //
    std::chrono::seconds probe_timeout {5};

    // Continue from existing temporary artifacts.
    //
    bool resume = true;
  };
}
