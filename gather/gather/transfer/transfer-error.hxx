#pragma once

#include <string>
#include <cstdint>
#include <ostream>
#include <stdexcept>

namespace gather
{
  // Per-file failure classes. None of them aborts a batch.
  //
  enum class transfer_error_kind
  {
    transport,         // Network failure or timeout
    size_mismatch,     // Byte count differs from the catalog size
    checksum_mismatch, // Digest differs from the catalog checksum
    no_viable_source,  // No mirror passed the probe
    exhausted_source,  // Every mirror gave up before all chunks arrived
    storage,           // Local filesystem failure
    cancelled
  };

  std::ostream&
  operator<< (std::ostream&, transfer_error_kind);

  class transfer_error: public std::runtime_error
  {
  public:
    transfer_error (transfer_error_kind k, const std::string& what)
      : std::runtime_error (what), kind_ (k) {}

    transfer_error_kind
    kind () const noexcept
    {
      return kind_;
    }

  private:
    transfer_error_kind kind_;
  };

  class transport_error: public transfer_error
  {
  public:
    explicit
    transport_error (const std::string& what)
      : transfer_error (transfer_error_kind::transport, what) {}
  };

  class size_mismatch_error: public transfer_error
  {
  public:
    size_mismatch_error (std::uint64_t expected, std::uint64_t actual);

    std::uint64_t
    expected () const noexcept
    {
      return expected_;
    }

    std::uint64_t
    actual () const noexcept
    {
      return actual_;
    }

  private:
    std::uint64_t expected_;
    std::uint64_t actual_;
  };

  class checksum_mismatch_error: public transfer_error
  {
  public:
    explicit
    checksum_mismatch_error (const std::string& what)
      : transfer_error (transfer_error_kind::checksum_mismatch, what) {}

    checksum_mismatch_error (const std::string& expected,
                             const std::string& actual);
  };

  class no_viable_source_error: public transfer_error
  {
  public:
    explicit
    no_viable_source_error (const std::string& what)
      : transfer_error (transfer_error_kind::no_viable_source, what) {}
  };

  class exhausted_source_error: public transfer_error
  {
  public:
    explicit
    exhausted_source_error (const std::string& what)
      : transfer_error (transfer_error_kind::exhausted_source, what) {}
  };

  class storage_error: public transfer_error
  {
  public:
    explicit
    storage_error (const std::string& what)
      : transfer_error (transfer_error_kind::storage, what) {}
  };

  class transfer_cancelled: public transfer_error
  {
  public:
    transfer_cancelled ()
      : transfer_error (transfer_error_kind::cancelled, "transfer cancelled") {}
  };
}
