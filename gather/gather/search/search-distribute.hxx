#pragma once

#include <vector>
#include <cstdint>
#include <cstddef>
#include <optional>

namespace gather
{
  // Share of a result set assigned to one bucket (query or index node):
  // skip offset matches, then take count.
  //
  struct hit_slice
  {
    std::uint64_t offset = 0;
    std::uint64_t count = 0;
  };

  inline bool
  operator== (const hit_slice& x, const hit_slice& y)
  {
    return x.offset == y.offset && x.count == y.count;
  }

  // Page of a slice: at most page_limit matches starting at offset within
  // bucket.
  //
  struct page_window
  {
    std::size_t bucket;
    std::uint64_t offset;
    std::uint64_t limit;
  };

  // Split target across the buckets in proportion to their hit counts.
  //
  // Every bucket accumulates its share (hits[i] / sum) once per round; a
  // cursor visits the buckets round-robin and shaves off the whole units its
  // accumulator has crossed. The bucket on which the running total reaches
  // the target gets exactly the remainder. The result therefore stays within
  // one unit of the ideal proportional share and sums to min(target, sum).
  //
  // Runs in O(n log sum): whole rounds are skipped by searching for the last
  // round that stays below the target.
  //
  std::vector<std::uint64_t>
  distribute (const std::vector<std::uint64_t>& hits, std::uint64_t target);

  // Build the distribution plan: first remove offset matches proportionally
  // (per-bucket starting offsets), then split the cap over what remains. No
  // cap means everything that remains.
  //
  std::vector<hit_slice>
  distribute (const std::vector<std::uint64_t>& hits,
              std::uint64_t offset,
              std::optional<std::uint64_t> cap);

  // Cut each slice into pages of at most page_limit (which must not be 0).
  //
  std::vector<page_window>
  paginate (const std::vector<hit_slice>&, std::uint64_t page_limit);

  // Number of pages each slice yields.
  //
  std::vector<std::size_t>
  page_counts (const std::vector<hit_slice>&, std::uint64_t page_limit);
}
