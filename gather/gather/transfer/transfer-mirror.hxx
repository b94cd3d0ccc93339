#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <functional>

#include <boost/asio.hpp>

#include <gather/search/search-records.hxx>
#include <gather/transfer/transfer-chunk.hxx>

namespace gather
{
  // Other catalog records of the same file (replicas on other data nodes).
  //
  using mirror_lookup =
    std::function<boost::asio::awaitable<std::vector<file_record>> (const file_record&)>;

  // Candidate source URLs: the record's own URL followed by the mirrors'.
  // Mirrors describing a different size and repeated URLs are dropped.
  //
  std::vector<std::string>
  candidate_sources (const file_record&, const std::vector<file_record>& mirrors);

  // Probe the candidates concurrently with HEAD, each within the timeout.
  // Keep those that accept byte ranges and report the expected length, in
  // the order their probes completed.
  //
  template <typename C>
  boost::asio::awaitable<std::vector<std::string>>
  probe_sources (C&,
                 const std::vector<std::string>& urls,
                 std::uint64_t size,
                 std::chrono::milliseconds timeout);

  // Fetch the queued chunks with one worker per source. A worker pops
  // chunks until the queue is empty; on a failed or short range it puts the
  // chunk back and gives up. Chunks are handed to the assembler as they
  // arrive.
  //
  // Throw no_viable_source_error if there are no sources and
  // exhausted_source_error if some chunks were never fetched.
  //
  template <typename C>
  boost::asio::awaitable<void>
  fetch_chunks (C&,
                const std::vector<std::string>& sources,
                chunk_queue&,
                chunk_assembler&);
}

#include <gather/transfer/transfer-mirror.txx>
