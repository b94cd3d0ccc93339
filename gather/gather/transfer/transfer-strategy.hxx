#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <variant>
#include <functional>

#include <boost/asio.hpp>

#include <gather/search/search-records.hxx>
#include <gather/transfer/transfer-types.hxx>
#include <gather/transfer/transfer-mirror.hxx>
#include <gather/transfer/transfer-storage.hxx>

namespace gather
{
  // What a strategy works with.
  //
  struct transfer_context
  {
    const file_record& file;
    partial_artifact& artifact;

    // Called with the number of bytes held after every write.
    //
    std::function<void (std::uint64_t)> progress;

    // Replica records for the multi-source strategy (may be empty).
    //
    mirror_lookup lookup;

    // Filled by the strategy with the URLs it ends up using.
    //
    std::vector<std::string> sources;

    void
    write (const char* d, std::size_t n)
    {
      artifact.write (d, n);

      if (progress)
        progress (artifact.size ());
    }
  };

  // Single GET of the whole body, resumed with an open-ended range if the
  // artifact already holds a prefix. A server that ignores the range and
  // sends the whole body again makes the transfer start over.
  //
  struct whole_transfer
  {
    template <typename C>
    boost::asio::awaitable<void>
    acquire (C&, transfer_context&) const;
  };

  // Sequential ranged GETs of chunk_size bytes from the catalog URL.
  //
  struct chunked_transfer
  {
    std::uint64_t chunk_size;

    template <typename C>
    boost::asio::awaitable<void>
    acquire (C&, transfer_context&) const;
  };

  // Ranged GETs spread over every replica that passes the probe.
  //
  struct multi_source_transfer
  {
    std::uint64_t chunk_size;
    std::chrono::milliseconds probe_timeout;

    template <typename C>
    boost::asio::awaitable<void>
    acquire (C&, transfer_context&) const;
  };

  using transfer_strategy =
    std::variant<whole_transfer, chunked_transfer, multi_source_transfer>;

  // Choose how to acquire the file. Called once per task.
  //
  transfer_strategy
  select_strategy (const file_record&, const download_settings&);

  const char*
  strategy_name (const transfer_strategy&);
}

#include <gather/transfer/transfer-strategy.txx>
