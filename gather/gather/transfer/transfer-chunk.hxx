#pragma once

#include <map>
#include <mutex>
#include <deque>
#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>
#include <optional>
#include <functional>

namespace gather
{
  // Inclusive byte range of a file.
  //
  struct chunk
  {
    std::size_t index;
    std::uint64_t first;
    std::uint64_t last;

    std::uint64_t
    size () const noexcept
    {
      return last - first + 1;
    }
  };

  inline bool
  operator== (const chunk& x, const chunk& y)
  {
    return x.index == y.index && x.first == y.first && x.last == y.last;
  }

  // Split [acquired, size) into chunks aligned on multiples of chunk_size:
  // chunk i covers [i * chunk_size, min (size, (i + 1) * chunk_size) - 1],
  // the first remaining one starting at acquired. Throw
  // std::invalid_argument if chunk_size is 0.
  //
  std::vector<chunk>
  plan_chunks (std::uint64_t size,
               std::uint64_t chunk_size,
               std::uint64_t acquired = 0);

  // Chunks waiting for a source. Shared by all workers of a transfer.
  //
  class chunk_queue
  {
  public:
    explicit
    chunk_queue (const std::vector<chunk>&);

    // Return the next chunk or nullopt if the queue is empty. Never
    // blocks.
    //
    std::optional<chunk>
    pop ();

    // Put back a chunk a worker failed to fetch.
    //
    void
    requeue (const chunk&);

    std::size_t
    size () const;

  private:
    mutable std::mutex m_;
    std::deque<chunk> q_;
  };

  // Write chunks to the sink in index order as they arrive in any order.
  //
  class chunk_assembler
  {
  public:
    using sink_type = std::function<void (const char*, std::size_t)>;

    // Expect chunks [first, first + count).
    //
    chunk_assembler (sink_type, std::size_t first, std::size_t count);

    void
    put (std::size_t index, std::string data);

    bool
    complete () const noexcept
    {
      return next_ == end_;
    }

    // Chunks not yet written.
    //
    std::size_t
    missing () const noexcept
    {
      return end_ - next_;
    }

    std::size_t
    buffered () const noexcept
    {
      return pending_.size ();
    }

  private:
    sink_type sink_;
    std::size_t next_;
    std::size_t end_;
    std::map<std::size_t, std::string> pending_;
  };
}
